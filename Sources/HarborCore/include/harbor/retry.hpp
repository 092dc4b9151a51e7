#pragma once

#include "db.hpp"
#include "log.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace harbor {

// ============================================================================
// Resilient operation executor
// ============================================================================

enum class error_class {
    transient,
    permanent
};

/// aborted and quota_exceeded are transient. Everything else, including any
/// kind added later, is permanent.
constexpr error_class classify(store_errc code) noexcept {
    switch (code) {
        case store_errc::aborted:
        case store_errc::quota_exceeded:
            return error_class::transient;
        default:
            return error_class::permanent;
    }
}

struct retry_policy {
    using sleep_fn = std::function<void(std::chrono::milliseconds)>;

    /// Wait before attempt N+2. The number of attempts is delays.size() + 1.
    std::vector<std::chrono::milliseconds> delays = {
        std::chrono::milliseconds(100),
        std::chrono::milliseconds(200),
        std::chrono::milliseconds(500),
        std::chrono::milliseconds(1000),
        std::chrono::milliseconds(2000),
    };

    sleep_fn sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };

    size_t max_attempts() const { return delays.size() + 1; }
};

/// Thrown when every attempt failed with a transient error.
/// code() is the kind of the last failure.
class retry_exhausted : public store_error {
public:
    retry_exhausted(std::string_view label, size_t attempts, store_errc last, const std::string& last_message)
        : store_error(last,
                      std::string(label) + " failed after " + std::to_string(attempts) +
                      " attempts: " + last_message)
        , attempts_(attempts) {}

    size_t attempts() const noexcept { return attempts_; }

private:
    size_t attempts_;
};

/// Runs op, retrying transient store_errors on the policy's schedule.
/// Permanent store_errors and non-store exceptions propagate after one attempt.
/// A retry_exhausted coming out of a nested call is never retried again.
template<typename Fn>
auto execute_with_retry(Fn&& op, std::string_view label, const retry_policy& policy = retry_policy{})
    -> decltype(op())
{
    const size_t max_attempts = policy.max_attempts();
    for (size_t attempt = 1;; ++attempt) {
        try {
            return op();
        } catch (const retry_exhausted&) {
            throw;
        } catch (const store_error& e) {
            if (classify(e.code()) == error_class::permanent) {
                LOG_DEBUG("retry", "%.*s failed permanently (%s): %s",
                          static_cast<int>(label.size()), label.data(), to_string(e.code()), e.what());
                throw;
            }
            if (attempt >= max_attempts) {
                LOG_ERROR("retry", "%.*s gave up after %zu attempts (%s): %s",
                          static_cast<int>(label.size()), label.data(), attempt, to_string(e.code()), e.what());
                throw retry_exhausted(label, attempt, e.code(), e.what());
            }
            auto delay = policy.delays[attempt - 1];
            LOG_WARN("retry", "%.*s attempt %zu/%zu failed (%s), retrying in %lld ms",
                     static_cast<int>(label.size()), label.data(), attempt, max_attempts,
                     to_string(e.code()), static_cast<long long>(delay.count()));
            policy.sleep(delay);
        }
    }
}

} // namespace harbor
