#include "scan2davd.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <cerrno>
#include <cinttypes> // strtoumax used
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

namespace scan2dav {

namespace {
constexpr uintmax_t max_io_timeout{3600};      // seconds
constexpr uintmax_t max_relay_attempts{100};
constexpr uintmax_t max_backoff_ms{3600 * 1000};
constexpr uintmax_t max_connect_timeout{300};  // seconds
constexpr uintmax_t max_stall_timeout{3600};   // seconds
constexpr uintmax_t max_workers{64};

/*
 * Parse a decimal number within [min, max], nothing else may follow it.
 */
bool parse_number(const char *text, uintmax_t min, uintmax_t max, uintmax_t &value)
{
    const std::string trimmed = boost::algorithm::trim_copy(std::string(text));
    if (trimmed.empty() || trimmed[0] == '-' || trimmed[0] == '+') {
        return false;
    }

    char *end = nullptr;
    errno = 0;
    uintmax_t number = strtoumax(trimmed.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0') {
        return false;
    }
    if (number < min || number > max) {
        return false;
    }

    value = number;
    return true;
}

bool set_port(daemon_config &config, const char *value)
{
    uintmax_t port = 0;
    if (!parse_number(value, 1, std::numeric_limits<uint16_t>::max(), port)) {
        return false;
    }
    config.port = static_cast<uint16_t>(port);
    return true;
}

bool set_subdir(daemon_config &config, const char *value)
{
    std::vector<std::string> segments = split_path(value);
    for (const auto &segment : segments) {
        if (segment == "..") {
            return false; // never leave the base collection
        }
    }
    config.target.subdir = std::move(segments);
    return true;
}

bool set_max_size(daemon_config &config, const char *value)
{
    uintmax_t size = 0;
    if (!parse_number(value, 1, std::numeric_limits<uintmax_t>::max(), size)) {
        return false;
    }
    config.session.max_payload = size;
    return true;
}

bool set_spool_dir(daemon_config &config, const char *value)
{
    config.session.spool_dir = value;
    return true;
}

bool set_naming(daemon_config &config, const char *value)
{
    if (boost::algorithm::iequals(value, "device")) {
        config.session.naming = naming_policy::device;
    } else if (boost::algorithm::iequals(value, "timestamp")) {
        config.session.naming = naming_policy::timestamp;
    } else {
        return false;
    }
    return true;
}

bool set_io_timeout(daemon_config &config, const char *value)
{
    uintmax_t seconds = 0;
    if (!parse_number(value, 1, max_io_timeout, seconds)) {
        return false;
    }
    config.io_timeout = std::chrono::seconds(seconds);
    return true;
}

bool set_max_attempts(daemon_config &config, const char *value)
{
    uintmax_t attempts = 0;
    if (!parse_number(value, 1, max_relay_attempts, attempts)) {
        return false;
    }
    config.relay.max_attempts = static_cast<unsigned>(attempts);
    return true;
}

bool set_backoff(daemon_config &config, const char *value)
{
    uintmax_t ms = 0;
    if (!parse_number(value, 0, max_backoff_ms, ms)) {
        return false;
    }
    config.relay.initial_backoff = std::chrono::milliseconds(ms);
    return true;
}

bool set_max_backoff(daemon_config &config, const char *value)
{
    uintmax_t ms = 0;
    if (!parse_number(value, 0, max_backoff_ms, ms)) {
        return false;
    }
    config.relay.max_backoff = std::chrono::milliseconds(ms);
    return true;
}

bool set_connect_timeout(daemon_config &config, const char *value)
{
    uintmax_t seconds = 0;
    if (!parse_number(value, 1, max_connect_timeout, seconds)) {
        return false;
    }
    config.http.connect = std::chrono::seconds(seconds);
    return true;
}

bool set_stall_timeout(daemon_config &config, const char *value)
{
    uintmax_t seconds = 0;
    if (!parse_number(value, 1, max_stall_timeout, seconds)) {
        return false;
    }
    config.http.stall = std::chrono::seconds(seconds);
    return true;
}

bool set_workers(daemon_config &config, const char *value)
{
    uintmax_t workers = 0;
    if (!parse_number(value, 1, max_workers, workers)) {
        return false;
    }
    config.workers = static_cast<unsigned>(workers);
    return true;
}

bool set_log_level(daemon_config &config, const char *value)
{
    try {
        config.log_level = parse_log_level(value);
    } catch (const config_error &) {
        return false;
    }
    return true;
}

struct option
{
    const char *o_opt;
    bool (*o_fnc)(daemon_config &, const char *);
};

const struct option options[] = {{"WEBDAV_SUBDIR", set_subdir},
                                 {"SCAN_PORT", set_port},
                                 {"SCAN_MAX_SIZE", set_max_size},
                                 {"SCAN_SPOOL_DIR", set_spool_dir},
                                 {"SCAN_NAMING", set_naming},
                                 {"SCAN_IO_TIMEOUT", set_io_timeout},
                                 {"RELAY_MAX_ATTEMPTS", set_max_attempts},
                                 {"RELAY_BACKOFF_MS", set_backoff},
                                 {"RELAY_MAX_BACKOFF_MS", set_max_backoff},
                                 {"RELAY_CONNECT_TIMEOUT", set_connect_timeout},
                                 {"RELAY_STALL_TIMEOUT", set_stall_timeout},
                                 {"RELAY_WORKERS", set_workers},
                                 {"LOG_LEVEL", set_log_level},
                                 {nullptr, nullptr}};

struct log_level_name
{
    const char *l_name;
    int l_priority;
};

const log_level_name log_levels[] = {{"debug", LOG_DEBUG},
                                     {"info", LOG_INFO},
                                     {"notice", LOG_NOTICE},
                                     {"warning", LOG_WARNING},
                                     {"warn", LOG_WARNING},
                                     {"err", LOG_ERR},
                                     {"error", LOG_ERR},
                                     {nullptr, 0}};

const char *non_empty(const env_lookup &lookup, const char *name)
{
    const char *value = lookup(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

void append_problem(std::string &problems, const std::string &problem)
{
    if (!problems.empty()) {
        problems += "; ";
    }
    problems += problem;
}

/*
 * Accept http and https only, the trailing '/' is removed.
 */
bool valid_base_url(std::string &url)
{
    boost::algorithm::trim(url);
    std::string rest;
    if (boost::algorithm::istarts_with(url, "http://")) {
        rest = url.substr(7);
    } else if (boost::algorithm::istarts_with(url, "https://")) {
        rest = url.substr(8);
    } else {
        return false;
    }

    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return !rest.empty() && rest[0] != '/';
}
} // namespace

int parse_log_level(const std::string &name)
{
    const std::string trimmed = boost::algorithm::trim_copy(name);
    for (const log_level_name *pl = log_levels; pl->l_name != nullptr; pl++) {
        if (boost::algorithm::iequals(trimmed, pl->l_name)) {
            return pl->l_priority;
        }
    }
    throw config_error("unknown log level '" + name + "'");
}

uint16_t parse_port(const char *text)
{
    daemon_config config;
    if (text == nullptr || !set_port(config, text)) {
        throw config_error(std::string("invalid port '") + (text != nullptr ? text : "") + "'");
    }
    return config.port;
}

daemon_config load_config()
{
    return load_config([](const char *name) -> const char * { return std::getenv(name); });
}

daemon_config load_config(const env_lookup &lookup)
{
    daemon_config config;
    std::string problems;

    const char *url = non_empty(lookup, "WEBDAV_URL");
    const char *user = non_empty(lookup, "WEBDAV_USER");
    const char *pass = non_empty(lookup, "WEBDAV_PASS");

    if (url == nullptr) {
        append_problem(problems, "WEBDAV_URL is not set");
    } else {
        config.target.base_url = url;
        if (!valid_base_url(config.target.base_url)) {
            append_problem(problems, "WEBDAV_URL must be an http:// or https:// URL");
        }
    }
    if (user == nullptr) {
        append_problem(problems, "WEBDAV_USER is not set");
    } else {
        config.target.auth.user = user;
    }
    if (pass == nullptr) {
        append_problem(problems, "WEBDAV_PASS is not set");
    } else {
        config.target.auth.password = pass;
    }

    for (const struct option *po = options; po->o_opt != nullptr; po++) {
        const char *value = non_empty(lookup, po->o_opt);
        if (value == nullptr) {
            continue; // default
        }
        if (!(*po->o_fnc)(config, value)) {
            append_problem(problems, std::string(po->o_opt) + " has an invalid value '" + value + "'");
        }
    }

    if (config.relay.max_backoff < config.relay.initial_backoff) {
        append_problem(problems, "RELAY_MAX_BACKOFF_MS is below RELAY_BACKOFF_MS");
    }

    if (!problems.empty()) {
        throw config_error(problems);
    }

    syslog(LOG_DEBUG, "%s: target %s, port %u\n", BOOST_CURRENT_FUNCTION,
           redact_url(join_url(config.target.base_url, config.target.subdir)).c_str(),
           static_cast<unsigned>(config.port));
    return config;
}

} // namespace scan2dav
