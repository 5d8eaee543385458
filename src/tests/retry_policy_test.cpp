#include <gtest/gtest.h>
#include <vector>
#include "client/retry_policy.hpp"

using namespace lbft::client;
using lbft::protocol::ErrorKind;
using lbft::protocol::ProtocolError;

class RetryPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy.set_sleeper([this](std::chrono::milliseconds delay) { delays.push_back(delay); });
    }

    RetryPolicy policy{3, std::chrono::milliseconds(100), 2};
    std::vector<std::chrono::milliseconds> delays;
};

TEST_F(RetryPolicyTest, TransientKinds) {
    EXPECT_TRUE(RetryPolicy::is_transient(ErrorKind::TIMEOUT));
    EXPECT_TRUE(RetryPolicy::is_transient(ErrorKind::TRUNCATED));
    EXPECT_TRUE(RetryPolicy::is_transient(ErrorKind::WRITE_ERROR));
    EXPECT_TRUE(RetryPolicy::is_transient(ErrorKind::CHECKSUM_MISMATCH));
    EXPECT_TRUE(RetryPolicy::is_transient(ErrorKind::CORRUPT_PAYLOAD));

    EXPECT_FALSE(RetryPolicy::is_transient(ErrorKind::FILE_NOT_FOUND));
    EXPECT_FALSE(RetryPolicy::is_transient(ErrorKind::INVALID_FILENAME));
    EXPECT_FALSE(RetryPolicy::is_transient(ErrorKind::VERSION_UNSUPPORTED));
    EXPECT_FALSE(RetryPolicy::is_transient(ErrorKind::PROTOCOL_VIOLATION));
}

TEST_F(RetryPolicyTest, ExponentialBackoff) {
    EXPECT_EQ(policy.backoff_for(1), std::chrono::milliseconds(100));
    EXPECT_EQ(policy.backoff_for(2), std::chrono::milliseconds(200));
    EXPECT_EQ(policy.backoff_for(3), std::chrono::milliseconds(400));
}

TEST_F(RetryPolicyTest, RetriesUntilSuccess) {
    int calls = 0;
    int result = policy.run([&]() {
        if (++calls < 3) {
            throw ProtocolError(ErrorKind::TIMEOUT, "no reply");
        }
        return 42;
    });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(delays, (std::vector<std::chrono::milliseconds>{std::chrono::milliseconds(100),
                                                              std::chrono::milliseconds(200)}));
}

TEST_F(RetryPolicyTest, GivesUpAfterMaxAttempts) {
    int calls = 0;
    try {
        policy.run([&]() {
            ++calls;
            throw ProtocolError(ErrorKind::CHECKSUM_MISMATCH, "digest differs");
        });
        FAIL() << "Expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CHECKSUM_MISMATCH);
    }
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(delays.size(), 2u);
}

TEST_F(RetryPolicyTest, PermanentErrorsAreNotRetried) {
    int calls = 0;
    EXPECT_THROW(policy.run([&]() {
        ++calls;
        throw ProtocolError(ErrorKind::FILE_NOT_FOUND, "no such file");
    }), ProtocolError);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(delays.empty());

    // Anything that is not a protocol error passes straight through
    EXPECT_THROW(policy.run([]() { throw std::runtime_error("boom"); }), std::runtime_error);
}

TEST_F(RetryPolicyTest, SingleAttemptPolicy) {
    RetryPolicy once(1);
    EXPECT_FALSE(once.should_retry(ErrorKind::TIMEOUT, 1));
    EXPECT_THROW(RetryPolicy(0), std::invalid_argument);
    EXPECT_THROW(RetryPolicy(3, std::chrono::milliseconds(10), 0), std::invalid_argument);
}
