// =============================================================================
// Unit tests for bounded_retry.hpp
// Tests: attempt limits, overall time cap, tolerated vs fatal errors,
//        remaining budget handed to the probe
// =============================================================================
#include <gtest/gtest.h>
#include "bounded_retry.hpp"
#include "fakes.hpp"

using namespace droidpilot;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

// Policy used while waiting for the test-server to answer pings
RetryPolicy respondingPolicy() {
    return RetryPolicy{30, milliseconds(1000), milliseconds(30000)};
}

// Policy used while waiting for the ready route
RetryPolicy readyPolicy() {
    return RetryPolicy{10, milliseconds(1000), milliseconds(10000)};
}

// Fails `failures` times with a connection error, then succeeds
RetryProbe failThenSucceed(int failures, int& calls) {
    return [failures, &calls](const RetryAttempt&) -> Result<bool> {
        ++calls;
        if (calls <= failures) return test::FakeTransport::connectionRefused();
        return true;
    };
}

} // namespace

class BoundedRetryTest : public ::testing::Test {
protected:
    test::FakeClock fake;
};

TEST_F(BoundedRetryTest, SucceedsFirstTryWithoutSleeping) {
    int calls = 0;
    auto r = retryBounded(respondingPolicy(), failThenSucceed(0, calls),
                          isTransientError, fake.clock(), "ping");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().attempts, 1);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(fake.sleeps->empty());
}

TEST_F(BoundedRetryTest, SucceedsAfterFailuresWithinBudget) {
    for (int failures : {1, 5, 29}) {
        test::FakeClock clock;
        int calls = 0;
        auto r = retryBounded(respondingPolicy(), failThenSucceed(failures, calls),
                              isTransientError, clock.clock(), "ping");
        ASSERT_TRUE(r.is_ok()) << "failures=" << failures;
        EXPECT_EQ(r.value().attempts, failures + 1);
        EXPECT_EQ(clock.elapsedSinceStart(), seconds(failures));
        EXPECT_LE(clock.elapsedSinceStart(), seconds(30));
    }
}

TEST_F(BoundedRetryTest, ExhaustedAttemptsIsTimeout) {
    int calls = 0;
    auto r = retryBounded(respondingPolicy(), failThenSucceed(30, calls),
                          isTransientError, fake.clock(), "ping");
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(ErrorKind::Timeout));
    EXPECT_EQ(calls, 30);
    EXPECT_LE(fake.elapsedSinceStart(), seconds(30));
    // last observed state is kept for diagnostics
    EXPECT_NE(r.error().detail.find("Connection refused"), std::string::npos);
}

TEST_F(BoundedRetryTest, FalseProbeCountsAsNotYet) {
    int calls = 0;
    RetryProbe never = [&calls](const RetryAttempt&) -> Result<bool> {
        ++calls;
        return false;
    };
    auto r = retryBounded(readyPolicy(), never, isTransientError, fake.clock(), "ready");
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(ErrorKind::Timeout));
    EXPECT_EQ(calls, 10);
    EXPECT_EQ(r.error().detail, "ready not satisfied");
    EXPECT_LE(fake.elapsedSinceStart(), seconds(10));
}

TEST_F(BoundedRetryTest, ReadyLoopSucceedsAfterNineFalses) {
    int calls = 0;
    RetryProbe probe = [&calls](const RetryAttempt&) -> Result<bool> {
        return ++calls == 10;
    };
    auto r = retryBounded(readyPolicy(), probe, isTransientError, fake.clock(), "ready");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().attempts, 10);
    EXPECT_EQ(fake.elapsedSinceStart(), seconds(9));
}

TEST_F(BoundedRetryTest, OverallTimeoutCapsSlowProbes) {
    int calls = 0;
    auto clock = fake;
    RetryProbe slow = [&calls, clock](const RetryAttempt&) mutable -> Result<bool> {
        ++calls;
        clock.advance(milliseconds(5000));
        return test::FakeTransport::timedOut();
    };
    auto r = retryBounded(respondingPolicy(), slow, isTransientError, fake.clock(), "ping");
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(ErrorKind::Timeout));
    EXPECT_LT(calls, 30);
    EXPECT_LE(fake.elapsedSinceStart(), seconds(30));
}

TEST_F(BoundedRetryTest, LastPauseIsShortenedToRemainingBudget) {
    auto clock = fake;
    RetryProbe slow = [clock](const RetryAttempt&) mutable -> Result<bool> {
        clock.advance(milliseconds(5000));
        return false;
    };
    RetryPolicy policy{30, milliseconds(1000), milliseconds(5500)};
    auto r = retryBounded(policy, slow, isTransientError, fake.clock(), "ping");
    ASSERT_TRUE(r.is_err());
    ASSERT_EQ(fake.sleeps->size(), 1u);
    EXPECT_EQ(fake.sleeps->front().count(), 500);
    EXPECT_EQ(fake.elapsedSinceStart(), milliseconds(5500));
}

TEST_F(BoundedRetryTest, NoPauseOnceBudgetIsSpent) {
    auto clock = fake;
    RetryProbe slow = [clock](const RetryAttempt&) mutable -> Result<bool> {
        clock.advance(milliseconds(5000));
        return false;
    };
    RetryPolicy policy{30, milliseconds(1000), milliseconds(8000)};
    auto r = retryBounded(policy, slow, isTransientError, fake.clock(), "ping");
    ASSERT_TRUE(r.is_err());
    // probe 5s, sleep 1s, probe 5s: 11s spent, nothing left to wait for
    ASSERT_EQ(fake.sleeps->size(), 1u);
    EXPECT_EQ(fake.sleeps->front().count(), 1000);
}

TEST_F(BoundedRetryTest, NonToleratedErrorPropagatesImmediately) {
    int calls = 0;
    RetryProbe probe = [&calls](const RetryAttempt&) -> Result<bool> {
        ++calls;
        return Error(ErrorKind::Parse, "bad json");
    };
    auto r = retryBounded(respondingPolicy(), probe, isTransientError, fake.clock(), "ping");
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(ErrorKind::Parse));
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(fake.sleeps->empty());
}

TEST_F(BoundedRetryTest, NullPredicateToleratesNothing) {
    int calls = 0;
    auto r = retryBounded(respondingPolicy(), failThenSucceed(1, calls),
                          ErrorPredicate(), fake.clock(), "ping");
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(r.error().is(ErrorKind::Transport));
    EXPECT_EQ(calls, 1);
}

TEST_F(BoundedRetryTest, ProbeSeesRemainingBudget) {
    std::vector<std::optional<milliseconds>> seen;
    RetryProbe probe = [&seen](const RetryAttempt& a) -> Result<bool> {
        seen.push_back(a.remaining);
        return a.number == 3;
    };
    auto r = retryBounded(readyPolicy(), probe, isTransientError, fake.clock(), "ready");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(seen.size(), 3u);
    ASSERT_TRUE(seen[0] && seen[1] && seen[2]);
    EXPECT_EQ(seen[0]->count(), 10000);
    EXPECT_EQ(seen[1]->count(), 9000);
    EXPECT_EQ(seen[2]->count(), 8000);
}

TEST_F(BoundedRetryTest, NoOverallTimeoutMeansNoRemaining) {
    RetryPolicy stop{5, milliseconds(1000), std::nullopt};
    int calls = 0;
    RetryProbe probe = [&calls](const RetryAttempt& a) -> Result<bool> {
        ++calls;
        EXPECT_FALSE(a.remaining.has_value());
        return false;
    };
    auto r = retryBounded(stop, probe, isTransientError, fake.clock(), "kill");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(calls, 5);
    EXPECT_EQ(fake.sleeps->size(), 4u);
}

TEST(TransientError, TransportAndBridgeOnly) {
    EXPECT_TRUE(isTransientError(Error(ErrorKind::Transport, "refused")));
    EXPECT_TRUE(isTransientError(Error(ErrorKind::Bridge, "adb failed")));
    EXPECT_FALSE(isTransientError(Error(ErrorKind::Protocol, "failed")));
    EXPECT_FALSE(isTransientError(Error(ErrorKind::Parse, "bad")));
}
