/*
 * Filename and URL helpers.
 *
 * Device supplied names are never trusted: they are reduced to a plain
 * basename before they become part of a WebDAV URL.
 */
#include "scan2dav/scan.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <atomic>
#include <cctype>
#include <cinttypes>
#include <cstdio>
#include <ctime>
#include <syslog.h>

namespace scan2dav {

namespace {
std::atomic<uintmax_t> g_sequence{0};

int hex_value(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

struct media_type
{
    const char *m_type;
    const char *m_ext;
};

const media_type media_types[] = {{"application/pdf", ".pdf"}, {"image/jpeg", ".jpg"}, {"image/png", ".png"},
                                  {"image/tiff", ".tif"},      {"text/plain", ".txt"}, {nullptr, nullptr}};
} // namespace

const char *to_string(relay_status status)
{
    switch (status) {
    case relay_status::success:
        return "success";
    case relay_status::retryable:
        return "retryable";
    case relay_status::fatal:
        return "fatal";
    }
    return "unknown";
}

/*
 * Encode one path segment (RFC 3986), only unreserved characters pass.
 */
std::string percent_encode(const std::string &segment)
{
    static const char hex[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(segment.size());

    for (unsigned char c : segment) {
        if (std::isalnum(c) != 0 || c == '-' || c == '.' || c == '_' || c == '~') {
            result.push_back(static_cast<char>(c));
        } else {
            result.push_back('%');
            result.push_back(hex[c >> 4]);
            result.push_back(hex[c & 0x0F]);
        }
    }
    return result;
}

/*
 * Invalid escapes are kept as they are.
 */
std::string percent_decode(const std::string &text)
{
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        result.push_back(text[i]);
    }
    return result;
}

/*
 * Reduce a device supplied name to a harmless basename.
 * An empty result means the device supplied no usable name.
 */
std::string sanitize_filename(const std::string &name)
{
    std::string base = name;
    size_t slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }

    std::string result;
    result.reserve(base.size());
    for (unsigned char c : base) {
        if (c < 0x20 || c == 0x7F) {
            continue; // no control characters
        }
        if (c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>' || c == '|') {
            result.push_back('_');
            continue;
        }
        result.push_back(static_cast<char>(c));
    }

    boost::algorithm::trim(result);
    if (result == "." || result == "..") {
        syslog(LOG_WARNING, "scan2dav: Blocked illegal filename %s\n", name.c_str());
        return {};
    }

    if (result.size() > max_filename_length) {
        std::string ext = extension_of(result);
        if (ext.size() >= max_filename_length) {
            ext.clear();
        }
        result = result.substr(0, max_filename_length - ext.size()) + ext;
    }
    return result;
}

/*
 * The filename is the last segment of the request target.
 */
std::string target_filename(const std::string &target)
{
    std::string path = target.substr(0, target.find_first_of("?#"));
    size_t slash = path.find_last_of('/');
    if (slash != std::string::npos) {
        path = path.substr(slash + 1);
    }
    return sanitize_filename(percent_decode(path));
}

std::string extension_of(const std::string &filename)
{
    size_t dot = filename.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return {};
    }
    return filename.substr(dot);
}

std::string extension_for(const std::string &content_type)
{
    std::string type = content_type.substr(0, content_type.find(';'));
    boost::algorithm::trim(type);
    boost::algorithm::to_lower(type);

    for (const media_type *pm = media_types; pm->m_type != nullptr; pm++) {
        if (type == pm->m_type) {
            return pm->m_ext;
        }
    }
    return ".pdf"; // scanners send PDF unless told otherwise
}

/*
 * "doc.pdf", 2 -> "doc-2.pdf"
 */
uintmax_t next_sequence() { return ++g_sequence; }

/// "Image.pdf" -> "Image-2026-10-17T22-12-01Z-000007.pdf"
std::string unique_variant(const std::string &filename, std::chrono::system_clock::time_point arrival)
{
    std::string ext = extension_of(filename);
    std::string stem = filename.substr(0, filename.size() - ext.size());
    return stem + "-" + timestamp_name(arrival, next_sequence(), ext);
}

/*
 * RFC 3339 in UTC with ':' replaced by '-', so the name is valid everywhere,
 * followed by the sequence number against coarse clocks.
 */
std::string timestamp_name(std::chrono::system_clock::time_point arrival, uintmax_t sequence,
                           const std::string &extension)
{
    std::time_t seconds = std::chrono::system_clock::to_time_t(arrival);
    std::tm utc = {};
    (void)gmtime_r(&seconds, &utc);

    char stamp[32] = {};
    (void)std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H-%M-%SZ", &utc);

    char number[32] = {};
    (void)std::snprintf(number, sizeof(number), "%06" PRIuMAX, sequence);

    return std::string(stamp) + "-" + number + extension;
}

/*
 * Split a '/' separated path, empty and "." segments are dropped.
 */
std::vector<std::string> split_path(const std::string &path)
{
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string segment = path.substr(start, end - start);
        if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        start = end + 1;
    }
    return segments;
}

std::string join_url(const std::string &base, const std::vector<std::string> &segments)
{
    std::string url = base;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    for (const auto &segment : segments) {
        url += '/';
        url += percent_encode(segment);
    }
    return url;
}

/*
 * Remove a "user:password@" part, the result is safe to log.
 */
std::string redact_url(const std::string &url)
{
    size_t scheme = url.find("://");
    if (scheme == std::string::npos) {
        return url;
    }

    size_t authority = scheme + 3;
    size_t end = url.find_first_of("/?#", authority);
    size_t at = url.rfind('@', end == std::string::npos ? std::string::npos : end);
    if (at == std::string::npos || at < authority) {
        return url;
    }
    return url.substr(0, authority) + url.substr(at + 1);
}

} // namespace scan2dav
