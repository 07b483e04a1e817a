/*
 * Scan session decoder: one HTTP/1.1 request per device connection.
 *
 * Only what a scanner needs is understood: the request line, the header
 * fields, and a body framed by Content-Length or chunked transfer coding.
 * Everything else ends the session with a decode error.
 */
#include "scan_session.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cinttypes> // strtoumax used
#include <cstring>
#include <stdexcept>
#include <syslog.h>
#include <system_error>

namespace scan2dav {

namespace {
constexpr size_t max_chunk_digits{16};

/*
 * Strict decimal number, no sign and no white space.
 */
bool parse_length(const std::string &text, uintmax_t &value)
{
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }

    errno = 0;
    char *vend = nullptr;
    value = strtoumax(text.c_str(), &vend, 10);
    return *vend == 0 && errno != ERANGE;
}

bool is_token(const std::string &text)
{
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isalnum(c) || std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
    });
}
} // namespace

const char *to_string(session_state state)
{
    switch (state) {
    case session_state::request_line:
        return "request_line";
    case session_state::headers:
        return "headers";
    case session_state::body:
        return "body";
    case session_state::chunk_size:
        return "chunk_size";
    case session_state::chunk_data:
        return "chunk_data";
    case session_state::chunk_data_end:
        return "chunk_data_end";
    case session_state::trailer:
        return "trailer";
    case session_state::completed:
        return "completed";
    case session_state::aborted:
        return "aborted";
    }
    return "unknown";
}

const char *to_string(decode_error error)
{
    switch (error) {
    case decode_error::none:
        return "none";
    case decode_error::malformed_request:
        return "malformed request";
    case decode_error::header_too_large:
        return "header too large";
    case decode_error::length_required:
        return "length required";
    case decode_error::not_implemented:
        return "transfer coding not implemented";
    case decode_error::payload_too_large:
        return "payload too large";
    case decode_error::truncated:
        return "truncated transfer";
    case decode_error::bad_chunk:
        return "bad chunk";
    case decode_error::spool_failure:
        return "spool failure";
    }
    return "unknown";
}

std::string request_head::field(const std::string &name) const
{
    for (const auto &f : fields) {
        if (boost::algorithm::iequals(f.first, name)) {
            return f.second;
        }
    }
    return {};
}

scan_session::scan_session(session_options options) : options_(std::move(options)) {}

size_t scan_session::consume(const char *data, size_t length)
{
    size_t offset = 0;

    while (offset < length && !is_terminal()) {
        const char *p = data + offset;
        size_t n = length - offset;
        size_t used = 0;

        switch (state_) {
        case session_state::body:
            used = store(p, n, remaining_);
            if (!is_terminal() && remaining_ == 0) {
                complete();
            }
            break;

        case session_state::chunk_data:
            used = store(p, n, remaining_);
            if (!is_terminal() && remaining_ == 0) {
                state_ = session_state::chunk_data_end;
            }
            break;

        default: // all line oriented states
            if (take_line(p, n, used)) {
                dispatch_line();
            }
            break;
        }

        offset += used;
    }

    bytes_seen_ += offset;
    return offset;
}

/*
 * Collect one line, CRLF or a bare LF ends it.
 */
bool scan_session::take_line(const char *data, size_t length, size_t &used)
{
    const char *eol = static_cast<const char *>(std::memchr(data, '\n', length));
    size_t count = (eol != nullptr) ? static_cast<size_t>(eol - data) + 1 : length;
    used = count;

    // trailer fields count against the same limit as the header
    if (state_ == session_state::request_line || state_ == session_state::headers ||
        state_ == session_state::trailer) {
        header_bytes_ += count;
        if (header_bytes_ > options_.max_header) {
            abort(decode_error::header_too_large, "request header exceeds limit");
            return false;
        }
    } else if (line_.size() + count > options_.max_header) {
        abort(decode_error::bad_chunk, "chunk line exceeds limit");
        return false;
    }

    line_.append(data, (eol != nullptr) ? count - 1 : count);
    if (eol == nullptr) {
        return false;
    }

    if (!line_.empty() && line_.back() == '\r') {
        line_.pop_back();
    }
    return true;
}

void scan_session::dispatch_line()
{
    switch (state_) {
    case session_state::request_line:
        if (!line_.empty()) { // NOTE: leading empty lines are ignored
            on_request_line();
        }
        break;

    case session_state::headers:
        if (line_.empty()) {
            begin_body();
        } else {
            on_header_line();
        }
        break;

    case session_state::chunk_size:
        on_chunk_size_line();
        break;

    case session_state::chunk_data_end:
        if (line_.empty()) {
            state_ = session_state::chunk_size;
        } else {
            abort(decode_error::bad_chunk, "chunk data not followed by CRLF");
        }
        break;

    case session_state::trailer:
        if (line_.empty()) {
            complete(); // trailer fields are ignored
        }
        break;

    default:
        break;
    }

    line_.clear();
}

/*
 * METHOD SP request-target SP HTTP-version
 */
void scan_session::on_request_line()
{
    size_t first = line_.find(' ');
    size_t last = line_.rfind(' ');
    if (first == std::string::npos || first == last) {
        abort(decode_error::malformed_request, "invalid request line");
        return;
    }

    head_.method = line_.substr(0, first);
    head_.target = line_.substr(first + 1, last - first - 1);
    head_.version = line_.substr(last + 1);

    if (!is_token(head_.method) || head_.target.empty() || head_.target.find(' ') != std::string::npos) {
        abort(decode_error::malformed_request, "invalid request line");
        return;
    }

    if (!boost::algorithm::starts_with(head_.version, "HTTP/1.")) {
        abort(decode_error::malformed_request, "unsupported HTTP version");
        return;
    }

    // absolute-form: only the path is of interest
    size_t scheme = head_.target.find("://");
    if (head_.target[0] != '/' && scheme != std::string::npos) {
        size_t path = head_.target.find('/', scheme + 3);
        head_.target = (path == std::string::npos) ? "/" : head_.target.substr(path);
    }

    if (head_.target[0] != '/' && head_.target != "*") {
        abort(decode_error::malformed_request, "invalid request target");
        return;
    }

    syslog(LOG_INFO, "scan2dav: %s %s %s\n", head_.method.c_str(), head_.target.c_str(), head_.version.c_str());
    state_ = session_state::headers;
}

void scan_session::on_header_line()
{
    if (line_[0] == ' ' || line_[0] == '\t') {
        abort(decode_error::malformed_request, "obsolete header line folding");
        return;
    }

    size_t colon = line_.find(':');
    if (colon == std::string::npos) {
        abort(decode_error::malformed_request, "header field without colon");
        return;
    }

    std::string name = line_.substr(0, colon);
    if (!is_token(name)) {
        abort(decode_error::malformed_request, "invalid header field name");
        return;
    }

    std::string value = line_.substr(colon + 1);
    boost::algorithm::trim(value);
    head_.fields.emplace_back(name, value);
}

void scan_session::begin_body()
{
    std::string coding;
    for (const auto &f : head_.fields) {
        if (boost::algorithm::iequals(f.first, "Content-Length")) {
            uintmax_t length = 0;
            if (!parse_length(f.second, length) || (head_.has_content_length && length != head_.content_length)) {
                abort(decode_error::malformed_request, "invalid Content-Length");
                return;
            }
            head_.has_content_length = true;
            head_.content_length = length;
        } else if (boost::algorithm::iequals(f.first, "Transfer-Encoding")) {
            coding += coding.empty() ? f.second : ("," + f.second);
        }
    }

    head_.expect_continue = boost::algorithm::iequals(head_.field("Expect"), "100-continue");

    if (!coding.empty()) {
        boost::algorithm::trim(coding);
        if (!boost::algorithm::iequals(coding, "chunked")) {
            abort(decode_error::not_implemented, coding.c_str());
            return;
        }
        head_.chunked = true; // NOTE: Transfer-Encoding overrides Content-Length
        head_.has_content_length = false;
        head_.content_length = 0;
    }

    if (!is_upload()) {
        complete(); // a request body is ignored, the connection is closed anyway
        return;
    }

    if (!head_.chunked && !head_.has_content_length) {
        abort(decode_error::length_required, "upload without Content-Length");
        return;
    }

    if (head_.has_content_length && head_.content_length > options_.max_payload) {
        abort(decode_error::payload_too_large, "declared Content-Length exceeds limit");
        return;
    }

    try {
        spool_ = std::make_unique<spool>(options_.spool_dir, options_.max_payload);
    } catch (const std::system_error &e) {
        abort(decode_error::spool_failure, e.what());
        return;
    }

    if (head_.chunked) {
        state_ = session_state::chunk_size;
    } else {
        remaining_ = head_.content_length;
        state_ = session_state::body;
        if (remaining_ == 0) {
            complete();
        }
    }
}

/*
 * chunk-size [ ";" chunk-ext ]
 */
void scan_session::on_chunk_size_line()
{
    std::string digits = line_.substr(0, line_.find(';'));
    boost::algorithm::trim(digits);

    if (digits.empty() || digits.size() > max_chunk_digits ||
        !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isxdigit(c); })) {
        abort(decode_error::bad_chunk, "invalid chunk size");
        return;
    }

    uintmax_t size = strtoumax(digits.c_str(), nullptr, 16);
    if (size == 0) {
        state_ = session_state::trailer;
        return;
    }

    if (size > options_.max_payload - received_) {
        abort(decode_error::payload_too_large, "chunked payload exceeds limit");
        return;
    }

    remaining_ = size;
    state_ = session_state::chunk_data;
}

size_t scan_session::store(const char *data, size_t length, uintmax_t &remaining)
{
    size_t count = static_cast<size_t>(std::min<uintmax_t>(length, remaining));

    try {
        if (!spool_->append(data, count)) {
            abort(decode_error::payload_too_large, "payload exceeds limit");
            return count;
        }
    } catch (const std::system_error &e) {
        abort(decode_error::spool_failure, e.what());
        return count;
    }

    remaining -= count;
    received_ += count;
    return count;
}

void scan_session::complete()
{
    if (spool_) {
        try {
            spool_->finish();
        } catch (const std::system_error &e) {
            abort(decode_error::spool_failure, e.what());
            return;
        }
    }

    arrival_ = std::chrono::system_clock::now();
    state_ = session_state::completed;
    syslog(LOG_DEBUG, "%s: %s %s (%ju bytes)\n", BOOST_CURRENT_FUNCTION, head_.method.c_str(), head_.target.c_str(),
           received_);
}

void scan_session::abort(decode_error error, const char *what)
{
    error_ = error;
    state_ = session_state::aborted;
    spool_.reset(); // the partial payload is discarded here

    syslog(LOG_WARNING, "scan2dav: transfer aborted, %s: %s (%ju bytes received)\n", to_string(error), what,
           received_);
}

void scan_session::finish_input()
{
    if (is_terminal()) {
        return;
    }

    if (state_ == session_state::request_line && bytes_seen_ == 0) {
        error_ = decode_error::truncated;
        state_ = session_state::aborted;
        syslog(LOG_INFO, "scan2dav: connection closed without request\n");
        return;
    }

    if (head_.has_content_length) {
        std::string what = "connection closed after " + std::to_string(received_) + " of " +
                           std::to_string(head_.content_length) + " bytes";
        abort(decode_error::truncated, what.c_str());
    } else {
        abort(decode_error::truncated, "connection closed before end of request");
    }
}

bool scan_session::expects_continue() const
{
    return head_.expect_continue && received_ == 0 &&
           (state_ == session_state::body || state_ == session_state::chunk_size);
}

std::string scan_session::scan_filename() const
{
    std::string name = target_filename(head_.target);

    if (options_.naming == naming_policy::timestamp || name.empty()) {
        std::string ext = name.empty() ? extension_for(head_.field("Content-Type")) : extension_of(name);
        return timestamp_name(arrival_, next_sequence(), ext);
    }

    return name;
}

std::unique_ptr<incoming_scan> scan_session::take_scan()
{
    if (state_ != session_state::completed || !is_upload() || !spool_) {
        throw std::logic_error("scan_session: no completed upload");
    }

    auto scan = std::make_unique<incoming_scan>();
    scan->filename = scan_filename();
    scan->payload = std::move(spool_);
    scan->has_declared_length = head_.has_content_length;
    scan->declared_length = head_.has_content_length ? head_.content_length : received_;
    scan->content_type = head_.field("Content-Type");
    scan->arrival = arrival_;

    syslog(LOG_NOTICE, "scan2dav: received %s (%ju bytes)\n", scan->filename.c_str(), scan->payload->size());
    return scan;
}

} // namespace scan2dav
