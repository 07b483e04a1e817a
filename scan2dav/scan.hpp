#pragma once

/*
 * Scan relay daemon: shared data model.
 *
 * A scanner pushes a finished document with HTTP PUT, the document is spooled
 * and relayed to exactly one WebDAV target configured at startup.
 */
#include "spool.hpp"

#include <boost/current_function.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace scan2dav {

constexpr uint16_t default_port{3030};
constexpr uintmax_t default_max_scan_size{256UL * 1024 * 1024}; // 256 MiB
constexpr size_t max_header_size{8 * 1024};
constexpr size_t max_filename_length{255};

struct credentials
{
    std::string user;
    std::string password; // NOTE: never log this! CK
};

/// the WebDAV destination, immutable after startup
struct relay_target
{
    std::string base_url; // without trailing '/'
    credentials auth;
    std::vector<std::string> subdir; // path segments below base_url, may be empty
};

/// one completely received document
struct incoming_scan
{
    std::string filename;
    std::unique_ptr<spool> payload;
    uintmax_t declared_length{0};
    bool has_declared_length{false}; // false for chunked transfers
    std::string content_type;
    std::chrono::system_clock::time_point arrival;
};

enum class relay_status
{
    success,
    retryable,
    fatal
};

enum class fatal_scope
{
    none,
    scan,   // only this scan is dropped
    process // the configuration is broken, every scan will fail
};

struct upload_outcome
{
    relay_status status{relay_status::fatal};
    fatal_scope scope{fatal_scope::none};
    std::string reason;
    unsigned attempts{0};
    std::string destination; // final URL
};

const char *to_string(relay_status status);

//
// scan_utils.cpp
//
std::string percent_encode(const std::string &segment);
std::string percent_decode(const std::string &text);
std::string sanitize_filename(const std::string &name);
std::string target_filename(const std::string &target);
std::string extension_of(const std::string &filename);
std::string extension_for(const std::string &content_type);
uintmax_t next_sequence();
std::string timestamp_name(std::chrono::system_clock::time_point arrival, uintmax_t sequence,
                           const std::string &extension);
std::string unique_variant(const std::string &filename, std::chrono::system_clock::time_point arrival);
std::vector<std::string> split_path(const std::string &path);
std::string join_url(const std::string &base, const std::vector<std::string> &segments);
std::string redact_url(const std::string &url);

} // namespace scan2dav
