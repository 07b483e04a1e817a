#pragma once

/*
 * Relay engine: delivers one incoming scan to the WebDAV target.
 *
 *   attempt -> classify -> success
 *                       -> backoff -> attempt   (network error, 5xx)
 *                       -> rename  -> attempt   (412, name taken at the destination)
 *                       -> fatal                (auth, other 4xx, ceiling reached)
 *
 * Every state either ends the loop or consumes one of a bounded number of
 * attempts or renames, so a relay always terminates.
 */
#include "scan2dav/scan.hpp"
#include "webdav_client.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include <string>

namespace scan2dav {

struct relay_policy
{
    unsigned max_attempts{5}; // retryable failures before a scan is dropped
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{30000};
    unsigned max_renames{32};
};

/// outcome class of one WebDAV reply
struct verdict
{
    relay_status status;
    fatal_scope scope;
};

verdict classify(const dav_reply &reply);

/// delay before the attempt following the n-th retryable failure, never decreasing in n
std::chrono::milliseconds backoff_delay(const relay_policy &policy, unsigned failures);

/// destination URLs currently being relayed by this process
class name_ledger
{
public:
    bool claim(const std::string &url);
    void release(const std::string &url);
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::set<std::string> in_flight_;
};

class relay_engine
{
public:
    using sleeper = std::function<void(std::chrono::milliseconds)>;

    relay_engine(const relay_target &target, dav_client &client, relay_policy policy, sleeper sleep = nullptr);

    relay_engine(const relay_engine &) = delete;
    relay_engine &operator=(const relay_engine &) = delete;

    /// relay one scan to its terminal outcome, thread safe
    upload_outcome relay(incoming_scan &scan);

    /// true while the last auth relevant answer rejected the credentials
    bool credentials_rejected() const { return credentials_rejected_; }

    /// URL of the destination collection
    const std::string &collection_url() const { return collection_url_; }

    const relay_policy &policy() const { return policy_; }

private:
    dav_reply ensure_collection(bool &ready);
    dav_reply attempt(incoming_scan &scan, const std::string &url, bool &collection_ready, bool &uploading);
    void report_rejected_credentials(const char *stage, long status);
    void report_accepted_credentials();

    const relay_target &target_;
    dav_client &client_;
    relay_policy policy_;
    sleeper sleep_;
    std::string collection_url_;
    name_ledger ledger_;
    std::atomic<bool> credentials_rejected_{false};
};

} // namespace scan2dav
