//
// webdav_client.cpp
// ~~~~~~~~~~~~~~~~~
//
// PUT, MKCOL and PROPFIND with libcurl.  Every request uses its own easy
// handle and Basic authentication, nothing is kept between requests.
//

#include "webdav_client.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <syslog.h>

namespace scan2dav {

namespace {
constexpr const char *user_agent{"scan2dav/1.0"};

constexpr const char propfind_body[] = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                                       "<D:propfind xmlns:D=\"DAV:\"><D:prop><D:resourcetype/></D:prop></D:propfind>\n";

bool curl_ready()
{
    static const bool ready = [] { return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK; }();
    return ready;
}

size_t discard_body(char * /*ptr*/, size_t size, size_t nmemb, void * /*userdata*/) { return size * nmemb; }

size_t read_spool(char *buffer, size_t size, size_t nitems, void *userdata)
{
    return std::fread(buffer, size, nitems, static_cast<FILE *>(userdata));
}

class easy_request
{
public:
    easy_request(const relay_target &target, const http_timeouts &timeouts, const std::string &url)
        : handle_(curl_easy_init(), curl_easy_cleanup), headers_(nullptr, curl_slist_free_all), url_(url)
    {
        if (!handle_) {
            throw std::runtime_error("Unable to allocate curl handle");
        }

        set(CURLOPT_ERRORBUFFER, errbuf_);
        set(CURLOPT_URL, url_.c_str());
        set(CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        set(CURLOPT_USERNAME, target.auth.user.c_str());
        set(CURLOPT_PASSWORD, target.auth.password.c_str());
        set(CURLOPT_NOSIGNAL, 1L);
        set(CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeouts.connect.count()));
        // a total timeout would limit the size of a scan, so detect stalls instead
        set(CURLOPT_LOW_SPEED_LIMIT, 1L);
        set(CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeouts.stall.count()));
        set(CURLOPT_USERAGENT, user_agent);
        set(CURLOPT_WRITEFUNCTION, discard_body);
        add_header("Expect:"); // no 100-continue round trip
    }

    easy_request(const easy_request &) = delete;
    easy_request &operator=(const easy_request &) = delete;

    template <typename T> void set(CURLoption option, T value)
    {
        CURLcode rc = curl_easy_setopt(handle_.get(), option, value);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt: ") + curl_easy_strerror(rc));
        }
    }

    void add_header(const std::string &line)
    {
        curl_slist *list = curl_slist_append(headers_.get(), line.c_str());
        if (list == nullptr) {
            throw std::bad_alloc();
        }
        (void)headers_.release();
        headers_.reset(list);
    }

    dav_reply perform(const char *method)
    {
        set(CURLOPT_HTTPHEADER, headers_.get());

        dav_reply reply;
        CURLcode rc = curl_easy_perform(handle_.get());
        if (rc != CURLE_OK) {
            reply.error = (errbuf_[0] != 0) ? errbuf_ : curl_easy_strerror(rc);
            syslog(LOG_WARNING, "scan2dav: %s %s failed: %s\n", method, redact_url(url_).c_str(),
                   reply.error.c_str());
            return reply;
        }

        long status = 0;
        (void)curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &status);
        reply.status = status;
        syslog(LOG_INFO, "scan2dav: %s %s -> %ld\n", method, redact_url(url_).c_str(), status);
        return reply;
    }

private:
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle_;
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers_;
    std::string url_;
    char errbuf_[CURL_ERROR_SIZE] = {};
};

/*
 * A request that can't even be set up is reported like a network error.
 */
dav_reply setup_failure(const char *method, const std::exception &e)
{
    syslog(LOG_ERR, "scan2dav: %s request setup failed: %s\n", method, e.what());
    dav_reply reply;
    reply.error = e.what();
    return reply;
}
} // namespace

curl_dav_client::curl_dav_client(const relay_target &target, http_timeouts timeouts)
    : target_(target), timeouts_(timeouts)
{
    if (!curl_ready()) {
        throw std::runtime_error("Unable to initialize libcurl");
    }
}

dav_reply curl_dav_client::put(const std::string &url, spool &body, const std::string &content_type, bool exclusive)
{
    try {
        easy_request request(target_, timeouts_, url);
        FILE *file = body.rewind();
        request.set(CURLOPT_UPLOAD, 1L);
        request.set(CURLOPT_READFUNCTION, read_spool);
        request.set(CURLOPT_READDATA, static_cast<void *>(file));
        request.set(CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(body.size()));
        if (!content_type.empty()) {
            request.add_header("Content-Type: " + content_type);
        }
        if (exclusive) {
            request.add_header("If-None-Match: *");
        }
        return request.perform("PUT");
    } catch (const std::exception &e) {
        return setup_failure("PUT", e);
    }
}

dav_reply curl_dav_client::mkcol(const std::string &url)
{
    try {
        easy_request request(target_, timeouts_, url);
        request.set(CURLOPT_CUSTOMREQUEST, "MKCOL");
        return request.perform("MKCOL");
    } catch (const std::exception &e) {
        return setup_failure("MKCOL", e);
    }
}

dav_reply curl_dav_client::exists(const std::string &url)
{
    try {
        easy_request request(target_, timeouts_, url);
        request.set(CURLOPT_CUSTOMREQUEST, "PROPFIND");
        request.set(CURLOPT_POSTFIELDS, propfind_body);
        request.set(CURLOPT_POSTFIELDSIZE, static_cast<long>(sizeof(propfind_body) - 1));
        request.add_header("Depth: 0");
        request.add_header("Content-Type: application/xml; charset=utf-8");
        return request.perform("PROPFIND");
    } catch (const std::exception &e) {
        return setup_failure("PROPFIND", e);
    }
}

} // namespace scan2dav
