#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include "result.hpp"

namespace droidpilot {

/**
 * Bounded retry: up to max_attempts probes, interval apart, optionally capped
 * by an overall timeout measured from the first attempt.
 */
struct RetryPolicy {
    int max_attempts = 1;
    std::chrono::milliseconds interval{1000};
    std::optional<std::chrono::milliseconds> overall_timeout;
};

// Time source and sleeper; tests substitute a fake clock
struct RetryClock {
    std::function<std::chrono::steady_clock::time_point()> now;
    std::function<void(std::chrono::milliseconds)> sleep;

    static RetryClock system();
};

struct RetryAttempt {
    int number = 1;                                    // 1-based
    std::optional<std::chrono::milliseconds> remaining; // overall budget left
};

struct RetryReport {
    int attempts = 0;
    std::chrono::milliseconds elapsed{0};
};

// Probe returns true when satisfied, false for "not yet"
using RetryProbe = std::function<Result<bool>(const RetryAttempt&)>;

// Errors for which this returns true count as "not yet"; others end the loop
using ErrorPredicate = std::function<bool(const Error&)>;

inline bool isTransientError(const Error& e) {
    return e.is(ErrorKind::Transport) || e.is(ErrorKind::Bridge);
}

/**
 * Run probe under policy.
 * Ok(report) on the first satisfied probe. A Timeout error (detail = last
 * observed state) when attempts or time run out. A non-tolerated probe
 * error is returned unchanged.
 */
Result<RetryReport> retryBounded(const RetryPolicy& policy,
                                 const RetryProbe& probe,
                                 const ErrorPredicate& tolerated,
                                 const RetryClock& clock,
                                 const std::string& what);

} // namespace droidpilot
