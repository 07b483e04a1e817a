#pragma once

#include "scan2dav/scan.hpp"

#include <chrono>
#include <string>

namespace scan2dav {

/// result of one WebDAV request
///
/// status is the HTTP status code, or 0 if the request never got an answer
/// (DNS, connect, TLS, reset, timeout).  error describes that failure.
struct dav_reply
{
    long status{0};
    std::string error;

    bool is_network_error() const { return status == 0; }
    bool is_success() const { return status >= 200 && status < 300; }
    /// PROPFIND answered with a resource
    bool found() const { return status == 207 || is_success(); }
};

/// stateless WebDAV method set, every call carries the credentials
class dav_client
{
public:
    virtual ~dav_client() = default;

    /// upload the whole spool, with exclusive set the server must not replace an existing resource
    virtual dav_reply put(const std::string &url, spool &body, const std::string &content_type, bool exclusive) = 0;

    /// create a collection
    virtual dav_reply mkcol(const std::string &url) = 0;

    /// PROPFIND with Depth: 0
    virtual dav_reply exists(const std::string &url) = 0;
};

struct http_timeouts
{
    std::chrono::seconds connect{10};
    std::chrono::seconds stall{60}; // no progress at all for this long
};

/// dav_client implemented with libcurl, one easy handle per request
class curl_dav_client : public dav_client
{
public:
    /// @throw std::runtime_error if libcurl can't be initialized
    curl_dav_client(const relay_target &target, http_timeouts timeouts);

    dav_reply put(const std::string &url, spool &body, const std::string &content_type, bool exclusive) override;
    dav_reply mkcol(const std::string &url) override;
    dav_reply exists(const std::string &url) override;

private:
    const relay_target &target_;
    http_timeouts timeouts_;
};

} // namespace scan2dav
