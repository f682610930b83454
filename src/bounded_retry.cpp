#include "bounded_retry.hpp"
#include "droidpilot_log.hpp"

#include <algorithm>
#include <thread>

namespace droidpilot {

using std::chrono::milliseconds;

RetryClock RetryClock::system() {
    RetryClock c;
    c.now = [] { return std::chrono::steady_clock::now(); };
    c.sleep = [](milliseconds d) { std::this_thread::sleep_for(d); };
    return c;
}

Result<RetryReport> retryBounded(const RetryPolicy& policy,
                                 const RetryProbe& probe,
                                 const ErrorPredicate& tolerated,
                                 const RetryClock& clock,
                                 const std::string& what) {
    const auto start = clock.now();
    auto elapsed = [&] { return std::chrono::duration_cast<milliseconds>(clock.now() - start); };

    std::string last_state = "no attempt made";
    int attempts = 0;

    for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        RetryAttempt info;
        info.number = attempt;
        if (policy.overall_timeout) {
            auto left = *policy.overall_timeout - elapsed();
            if (left <= milliseconds{0}) break;
            info.remaining = left;
        }

        ++attempts;
        auto result = probe(info);
        if (result.is_ok() && result.value()) {
            DPLOG_DEBUG("retry", "%s satisfied on attempt %d/%d",
                        what.c_str(), attempt, policy.max_attempts);
            return Ok(RetryReport{attempts, elapsed()});
        }

        if (result.is_err()) {
            const Error& e = result.error();
            if (!tolerated || !tolerated(e)) return e;
            last_state = e.describe();
        } else {
            last_state = what + " not satisfied";
        }
        DPLOG_TRACE("retry", "%s attempt %d/%d: %s",
                    what.c_str(), attempt, policy.max_attempts, last_state.c_str());

        if (attempt == policy.max_attempts) break;

        milliseconds pause = policy.interval;
        if (policy.overall_timeout) {
            auto left = *policy.overall_timeout - elapsed();
            if (left <= milliseconds{0}) break;
            pause = std::min(pause, left);
        }
        if (pause > milliseconds{0}) clock.sleep(pause);
    }

    auto spent = elapsed();
    return Error(ErrorKind::Timeout,
                 what + " not satisfied after " + std::to_string(attempts) + " attempt(s) in " +
                 std::to_string(spent.count()) + " ms",
                 last_state);
}

} // namespace droidpilot
