#pragma once

/*
 * Scan session decoder.
 *
 * A scanner pushes its document with one HTTP/1.1 request:
 *
 *   PUT /scans/Image.pdf HTTP/1.1
 *   Content-Length: 12345          (or Transfer-Encoding: chunked)
 *
 * The session is fed with the raw bytes of one connection and ends either
 * completed or aborted.  It never touches a socket.
 */
#include "scan2dav/scan.hpp"

#include <boost/filesystem/path.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace scan2dav {

enum class naming_policy
{
    device,   // keep the name the device sent
    timestamp // always use arrival time and sequence number
};

struct session_options
{
    uintmax_t max_payload{default_max_scan_size};
    size_t max_header{max_header_size};
    boost::filesystem::path spool_dir{"/tmp/scan2dav"};
    naming_policy naming{naming_policy::device};
};

enum class session_state
{
    request_line,
    headers,
    body,
    chunk_size,
    chunk_data,
    chunk_data_end,
    trailer,
    completed,
    aborted
};

enum class decode_error
{
    none,
    malformed_request, // 400
    header_too_large,  // 431
    length_required,   // 411
    not_implemented,   // 501, unknown transfer coding
    payload_too_large, // 413
    truncated,         // peer closed too early
    bad_chunk,         // 400
    spool_failure      // 500
};

const char *to_string(session_state state);
const char *to_string(decode_error error);

struct request_head
{
    std::string method;
    std::string target;
    std::string version;
    std::vector<std::pair<std::string, std::string>> fields;

    bool has_content_length{false};
    uintmax_t content_length{0};
    bool chunked{false};
    bool expect_continue{false};

    /// case insensitive header lookup, empty if not present
    std::string field(const std::string &name) const;
};

class scan_session
{
public:
    explicit scan_session(session_options options);

    scan_session(const scan_session &) = delete;
    scan_session &operator=(const scan_session &) = delete;

    /// feed received bytes
    /// @return number of bytes used, less than length only once the session is terminal
    size_t consume(const char *data, size_t length);

    /// the peer closed its side of the connection
    void finish_input();

    session_state state() const { return state_; }
    decode_error error() const { return error_; }
    bool is_terminal() const { return state_ == session_state::completed || state_ == session_state::aborted; }

    const request_head &head() const { return head_; }

    /// true while the client waits for "100 Continue" before sending the body
    bool expects_continue() const;

    /// true if the request carries a scan (PUT)
    bool is_upload() const { return head_.method == "PUT"; }

    uintmax_t received() const { return received_; }
    size_t bytes_seen() const { return bytes_seen_; }

    /// hand the completed scan over, the session keeps nothing
    /// @throw std::logic_error unless a PUT request is completed
    std::unique_ptr<incoming_scan> take_scan();

private:
    bool take_line(const char *data, size_t length, size_t &used);
    void dispatch_line();
    void on_request_line();
    void on_header_line();
    void begin_body();
    void on_chunk_size_line();
    size_t store(const char *data, size_t length, uintmax_t &remaining);
    void complete();
    void abort(decode_error error, const char *what);
    std::string scan_filename() const;

    session_options options_;
    session_state state_{session_state::request_line};
    decode_error error_{decode_error::none};
    request_head head_;

    std::string line_;
    size_t header_bytes_{0};
    size_t bytes_seen_{0};
    uintmax_t remaining_{0};
    uintmax_t received_{0};

    std::unique_ptr<spool> spool_;
    std::chrono::system_clock::time_point arrival_;
};

} // namespace scan2dav
