#include <future>
#include <stdexcept>
#include <string>
#include <system_error>
#include <typeindex>

#include <gtest/gtest.h>

#include "retryable/options.h"
#include "test/test_helpers.h"

namespace retryable {

class FailureKindTest : public ::testing::Test {};

TEST_F(FailureKindTest, MatchesTypeAndDerivedTypes) {
    auto kind = FailureKind::Of<TimeoutError>("TimeoutError");

    EXPECT_EQ(kind.Name(), "TimeoutError");
    EXPECT_EQ(kind.Type(), std::type_index(typeid(TimeoutError)));
    EXPECT_TRUE(kind.Matches(TimeoutError("t")));
    EXPECT_TRUE(kind.Matches(ReadTimeoutError("r")));
    EXPECT_FALSE(kind.Matches(ConnectionError("c")));
    EXPECT_FALSE(kind.Matches(std::runtime_error("base")));
}

TEST_F(FailureKindTest, BaseKindMatchesHierarchy) {
    auto kind = FailureKind::Of<std::runtime_error>();

    EXPECT_TRUE(kind.Matches(TimeoutError("t")));
    EXPECT_TRUE(kind.Matches(std::system_error(std::make_error_code(std::errc::timed_out))));
    EXPECT_FALSE(kind.Matches(std::logic_error("l")));
}

TEST_F(FailureKindTest, EqualityByType) {
    EXPECT_EQ(FailureKind::Of<TimeoutError>("a"), FailureKind::Of<TimeoutError>("b"));
    EXPECT_NE(FailureKind::Of<TimeoutError>(), FailureKind::Of<ReadTimeoutError>());
}

TEST_F(FailureKindTest, StandardKindsRegistered) {
    for (const auto* name :
         {"std::exception",
          "std::logic_error",
          "std::invalid_argument",
          "std::out_of_range",
          "std::runtime_error",
          "std::system_error",
          "std::bad_alloc"}) {
        EXPECT_TRUE(FindFailureKind(name).has_value()) << name;
    }

    auto future_error = FindFailureKind("std::future_error");
    ASSERT_TRUE(future_error.has_value());
    EXPECT_TRUE(future_error->Matches(std::future_error(std::future_errc::broken_promise)));

    EXPECT_FALSE(FindFailureKind("TimeoutError").has_value());
}

TEST_F(FailureKindTest, RegisterCustomKind) {
    RegisterFailureKind<ConnectionError>("test.ConnectionError");

    auto kind = FindFailureKind("test.ConnectionError");
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(kind->Name(), "test.ConnectionError");
    EXPECT_TRUE(kind->Matches(ConnectionError("refused")));
}

TEST_F(FailureKindTest, ReRegisterReplaces) {
    RegisterFailureKind<TimeoutError>("test.Replaced");
    RegisterFailureKind<ConnectionError>("test.Replaced");

    auto kind = FindFailureKind("test.Replaced");
    ASSERT_TRUE(kind.has_value());
    EXPECT_TRUE(kind->Matches(ConnectionError("c")));
    EXPECT_FALSE(kind->Matches(TimeoutError("t")));
}

} // namespace retryable
