#pragma once

/*
 * scan2davd configuration.
 *
 * Everything is read once from the environment at startup and never changes
 * afterwards.  The relay target is shared read-only by all relay jobs.
 */
#include "async_scan_server.hpp"
#include "relay_engine.hpp"
#include "scan_session.hpp"
#include "webdav_client.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <syslog.h>

namespace scan2dav {

constexpr unsigned default_workers{4};
constexpr std::chrono::seconds default_io_timeout{30};

struct daemon_config
{
    relay_target target;
    uint16_t port{default_port};
    session_options session;
    std::chrono::seconds io_timeout{default_io_timeout};
    relay_policy relay;
    http_timeouts http;
    unsigned workers{default_workers};
    int log_level{LOG_NOTICE};
};

/// startup-fatal configuration problem, the message names every bad variable
class config_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// returns the value of a variable or nullptr if it is not set
using env_lookup = std::function<const char *(const char *)>;

/// read the configuration from the process environment
/// @throw config_error
daemon_config load_config();

/// @param lookup replaces getenv(3), used by tests
/// @throw config_error
daemon_config load_config(const env_lookup &lookup);

/// @throw config_error unless text is a port number 1..65535
uint16_t parse_port(const char *text);

/// map a LOG_LEVEL name to its syslog priority
/// @throw config_error on unknown names
int parse_log_level(const std::string &name);

} // namespace scan2dav
