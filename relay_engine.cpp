#include "relay_engine.hpp"

#include <algorithm>
#include <syslog.h>
#include <thread>
#include <vector>

namespace scan2dav {

namespace {
constexpr unsigned max_backoff_exponent{16};

enum class relay_step
{
    claim,
    attempt,
    classify,
    backoff,
    rename,
    done
};

/// the destination URL this relay owns until it ends
class name_claim
{
public:
    explicit name_claim(name_ledger &ledger) : ledger_(ledger) {}
    ~name_claim() { release(); }

    name_claim(const name_claim &) = delete;
    name_claim &operator=(const name_claim &) = delete;

    bool acquire(const std::string &collection, const std::string &filename)
    {
        release();
        std::string url = collection + "/" + percent_encode(filename);
        if (!ledger_.claim(url)) {
            return false;
        }
        url_ = url;
        return true;
    }

    void release()
    {
        if (!url_.empty()) {
            ledger_.release(url_);
            url_.clear();
        }
    }

    const std::string &url() const { return url_; }

private:
    name_ledger &ledger_;
    std::string url_;
};

std::string describe(const dav_reply &reply, bool uploading)
{
    std::string stage = uploading ? "PUT" : "collection";
    if (reply.is_network_error()) {
        return stage + ": " + reply.error;
    }
    return stage + ": HTTP " + std::to_string(reply.status);
}

bool collection_created(const dav_reply &reply)
{
    // 405: MKCOL on an existing collection (RFC 4918, 9.3.1)
    return reply.is_success() || reply.status == 405;
}
} // namespace

verdict classify(const dav_reply &reply)
{
    if (reply.is_network_error()) {
        return {relay_status::retryable, fatal_scope::none};
    }
    if (reply.is_success()) {
        return {relay_status::success, fatal_scope::none};
    }
    if (reply.status == 401 || reply.status == 403) {
        return {relay_status::fatal, fatal_scope::process};
    }
    if (reply.status >= 500) {
        return {relay_status::retryable, fatal_scope::none};
    }
    return {relay_status::fatal, fatal_scope::scan};
}

std::chrono::milliseconds backoff_delay(const relay_policy &policy, unsigned failures)
{
    const unsigned exponent = std::min(failures > 0 ? failures - 1 : 0, max_backoff_exponent);
    auto delay = policy.initial_backoff * static_cast<std::chrono::milliseconds::rep>(1LL << exponent);

    if (policy.max_backoff > std::chrono::milliseconds::zero() && delay > policy.max_backoff) {
        delay = policy.max_backoff;
    }
    if (delay < std::chrono::milliseconds::zero()) {
        delay = std::chrono::milliseconds::zero();
    }
    return delay;
}

bool name_ledger::claim(const std::string &url)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.insert(url).second;
}

void name_ledger::release(const std::string &url)
{
    std::lock_guard<std::mutex> lock(mutex_);
    (void)in_flight_.erase(url);
}

size_t name_ledger::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

relay_engine::relay_engine(const relay_target &target, dav_client &client, relay_policy policy, sleeper sleep)
    : target_(target), client_(client), policy_(policy), sleep_(std::move(sleep)),
      collection_url_(join_url(target.base_url, target.subdir))
{
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
    if (policy_.max_attempts == 0) {
        policy_.max_attempts = 1;
    }
}

/*
 * PROPFIND the collection, create it if it is missing.  A 409 on MKCOL means
 * a parent is missing too: walk up until a level can be created, then down again.
 */
dav_reply relay_engine::ensure_collection(bool &ready)
{
    dav_reply reply = client_.exists(collection_url_);
    if (reply.found()) {
        ready = true;
        return reply;
    }

    // 405 and 501: the server has no PROPFIND here, try MKCOL anyway
    if (reply.is_network_error() || (reply.status != 404 && reply.status != 405 && reply.status != 501)) {
        return reply;
    }

    std::vector<std::string> levels{target_.base_url};
    for (size_t i = 1; i <= target_.subdir.size(); ++i) {
        levels.push_back(join_url(target_.base_url, std::vector<std::string>(target_.subdir.begin(),
                                                                             target_.subdir.begin() + i)));
    }

    size_t level = levels.size() - 1;
    for (size_t round = 0; round < 2 * levels.size(); ++round) {
        reply = client_.mkcol(levels[level]);
        if (collection_created(reply)) {
            syslog(LOG_INFO, "scan2dav: collection %s %s\n", redact_url(levels[level]).c_str(),
                   reply.status == 405 ? "already exists" : "created");
            if (level + 1 == levels.size()) {
                ready = true;
                return reply;
            }
            ++level;
            continue;
        }

        if (reply.status == 409 && level > 0) {
            --level; // parent missing
            continue;
        }
        break;
    }

    return reply;
}

dav_reply relay_engine::attempt(incoming_scan &scan, const std::string &url, bool &collection_ready, bool &uploading)
{
    uploading = false;
    if (!collection_ready) {
        dav_reply reply = ensure_collection(collection_ready);
        if (!collection_ready) {
            return reply;
        }
    }

    uploading = true;
    return client_.put(url, *scan.payload, scan.content_type, true);
}

upload_outcome relay_engine::relay(incoming_scan &scan)
{
    upload_outcome outcome;
    if (!scan.payload) {
        outcome.scope = fatal_scope::scan;
        outcome.reason = "no payload";
        return outcome;
    }

    name_claim claim(ledger_);
    bool collection_ready = false;
    bool uploading = false;
    unsigned failures = 0;
    unsigned renames = 0;
    std::string candidate = scan.filename;
    dav_reply reply;

    relay_step step = relay_step::claim;
    while (step != relay_step::done) {
        switch (step) {
        case relay_step::claim:
            if (claim.acquire(collection_url_, candidate)) {
                outcome.destination = claim.url();
                step = relay_step::attempt;
            } else {
                step = relay_step::rename; // in flight in this process
            }
            break;

        case relay_step::attempt:
            ++outcome.attempts;
            reply = attempt(scan, claim.url(), collection_ready, uploading);
            step = relay_step::classify;
            break;

        case relay_step::classify: {
            const verdict v = classify(reply);
            if (v.status == relay_status::success) {
                outcome.status = relay_status::success;
                outcome.scope = fatal_scope::none;
                outcome.reason.clear();
                report_accepted_credentials();
                step = relay_step::done;
            } else if (uploading && reply.status == 412) {
                step = relay_step::rename;
            } else if (v.status == relay_status::retryable) {
                outcome.status = relay_status::retryable;
                outcome.reason = describe(reply, uploading);
                if (++failures >= policy_.max_attempts) {
                    outcome.status = relay_status::fatal;
                    outcome.scope = fatal_scope::scan;
                    outcome.reason = "giving up after " + std::to_string(failures) + " attempts, " + outcome.reason;
                    step = relay_step::done;
                } else {
                    step = relay_step::backoff;
                }
            } else {
                outcome.status = relay_status::fatal;
                outcome.scope = v.scope;
                outcome.reason = describe(reply, uploading);
                if (v.scope == fatal_scope::process) {
                    report_rejected_credentials(uploading ? "PUT" : "collection", reply.status);
                }
                step = relay_step::done;
            }
            break;
        }

        case relay_step::backoff: {
            const auto delay = backoff_delay(policy_, failures);
            syslog(LOG_WARNING, "scan2dav: %s: attempt %u failed (%s), retry in %lld ms\n", scan.filename.c_str(),
                   outcome.attempts, outcome.reason.c_str(), static_cast<long long>(delay.count()));
            sleep_(delay);
            step = relay_step::attempt;
            break;
        }

        case relay_step::rename:
            if (renames++ >= policy_.max_renames) {
                outcome.status = relay_status::fatal;
                outcome.scope = fatal_scope::scan;
                outcome.reason = "no free destination name";
                step = relay_step::done;
                break;
            }
            candidate = unique_variant(scan.filename, scan.arrival);
            syslog(LOG_NOTICE, "scan2dav: %s is taken in %s, relaying as %s\n", scan.filename.c_str(),
                   redact_url(collection_url_).c_str(), candidate.c_str());
            step = relay_step::claim;
            break;

        case relay_step::done:
            break;
        }
    }

    if (outcome.status == relay_status::success) {
        syslog(LOG_NOTICE, "scan2dav: relayed %s (%ju bytes) to %s, %u attempt(s)\n", scan.filename.c_str(),
               scan.payload->size(), redact_url(outcome.destination).c_str(), outcome.attempts);
    } else {
        syslog(LOG_ERR, "scan2dav: dropped %s after %u attempt(s): %s\n", scan.filename.c_str(), outcome.attempts,
               outcome.reason.c_str());
    }
    return outcome;
}

void relay_engine::report_rejected_credentials(const char *stage, long status)
{
    if (!credentials_rejected_.exchange(true)) {
        syslog(LOG_CRIT,
               "scan2dav: WebDAV server rejected the configured credentials (%s: HTTP %ld), "
               "every scan fails until the configuration is corrected!\n",
               stage, status);
    } else {
        syslog(LOG_ERR, "scan2dav: credentials still rejected (%s: HTTP %ld)\n", stage, status);
    }
}

void relay_engine::report_accepted_credentials()
{
    if (credentials_rejected_.exchange(false)) {
        syslog(LOG_NOTICE, "scan2dav: WebDAV server accepts the credentials again\n");
    }
}

} // namespace scan2dav
