#include "retryable/error.h"

#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <variant>

#include <gtest/gtest.h>

#include "retryable/options.h"

namespace retryable {

class ErrorValueTest : public ::testing::Test {};

TEST_F(ErrorValueTest, BareSentinel) {
    EXPECT_TRUE(IsErrorValue(std::string("error")));
    EXPECT_TRUE(IsErrorValue(std::string_view("error")));
    EXPECT_FALSE(IsErrorValue(std::string("ok")));
    EXPECT_FALSE(IsErrorValue(std::string("Error")));
    EXPECT_FALSE(IsErrorValue(std::string("errors")));
}

TEST_F(ErrorValueTest, CStrings) {
    const char* sentinel = "error";
    const char* null_string = nullptr;
    EXPECT_TRUE(IsErrorValue(sentinel));
    EXPECT_FALSE(IsErrorValue(null_string));
    EXPECT_TRUE(IsErrorValue(std::make_pair(sentinel, 1)));
    EXPECT_FALSE(IsErrorValue(std::make_pair(null_string, 1)));
    EXPECT_FALSE(IsErrorValue(std::make_tuple(null_string, 2, 3)));
}

TEST_F(ErrorValueTest, TaggedValues) {
    EXPECT_TRUE(IsErrorValue(std::make_pair(std::string("error"), std::string("reason"))));
    EXPECT_FALSE(IsErrorValue(std::make_pair(std::string("ok"), 1)));

    EXPECT_TRUE(IsErrorValue(std::make_tuple(std::string("error"), std::string("fail"), std::string("extra"))));
    EXPECT_TRUE(IsErrorValue(std::make_tuple(std::string("error"))));
    EXPECT_FALSE(IsErrorValue(std::make_tuple(std::string("ok"), 42)));
    EXPECT_FALSE(IsErrorValue(std::make_tuple(1, std::string("error"))));
}

TEST_F(ErrorValueTest, NonTaggedValues) {
    EXPECT_FALSE(IsErrorValue(0));
    EXPECT_FALSE(IsErrorValue(-1));
    EXPECT_FALSE(IsErrorValue(std::map<std::string, std::string>{{"error", "x"}}));
}

TEST_F(ErrorValueTest, Variant) {
    using Value = std::variant<std::string, std::pair<std::string, std::string>, int>;

    EXPECT_TRUE(IsErrorValue(Value(std::string("error"))));
    EXPECT_TRUE(IsErrorValue(Value(std::make_pair(std::string("error"), std::string("busy")))));
    EXPECT_FALSE(IsErrorValue(Value(std::make_pair(std::string("ok"), std::string("success")))));
    EXPECT_FALSE(IsErrorValue(Value(7)));
}

TEST_F(ErrorValueTest, ErrorCode) {
    EXPECT_TRUE(IsErrorValue(std::make_error_code(std::errc::connection_refused)));
    EXPECT_FALSE(IsErrorValue(std::error_code()));
}

TEST_F(ErrorValueTest, Outcome) {
    auto ok = Outcome<int>::Ok(3);
    auto error = Outcome<int>::Error("busy");

    EXPECT_TRUE(ok.IsOk());
    EXPECT_EQ(ok.Value(), 3);
    EXPECT_THROW(ok.Reason(), std::logic_error);
    EXPECT_FALSE(IsErrorValue(ok));

    EXPECT_TRUE(error.IsError());
    EXPECT_EQ(error.Reason(), "busy");
    EXPECT_THROW(error.Value(), std::logic_error);
    EXPECT_TRUE(IsErrorValue(error));

    EXPECT_EQ(ok, Outcome<int>::Ok(3));
    EXPECT_NE(ok, error);

    // A string payload does not collide with the reason
    EXPECT_NE(Outcome<std::string>::Ok("busy"), Outcome<std::string>::Error("busy"));
    EXPECT_EQ(std::move(Outcome<std::string>::Ok("moved")).Value(), "moved");
}

TEST_F(ErrorValueTest, DefaultPredicate) {
    auto predicate = ErrorPredicate::Default();

    EXPECT_TRUE(predicate.IsDefault());
    EXPECT_TRUE(predicate.For<std::string>()("error"));
    EXPECT_FALSE(predicate.For<int>()(1));
}

TEST_F(ErrorValueTest, ExplicitPredicate) {
    auto predicate = ErrorPredicate::Of<int>([](const int& value) { return value < 0; });

    EXPECT_FALSE(predicate.IsDefault());
    EXPECT_TRUE(predicate.For<int>()(-5));
    EXPECT_FALSE(predicate.For<int>()(5));
    EXPECT_THROW(predicate.For<long>(), ConfigurationError);
    EXPECT_THROW(predicate.For<std::string>(), ConfigurationError);
}

// User result types can opt in through ErrorValueTraits
struct HttpResponse {
    int status;
};

template <>
struct ErrorValueTraits<HttpResponse> {
    static bool IsError(const HttpResponse& response) { return response.status >= 500; }
};

TEST_F(ErrorValueTest, CustomTraits) {
    EXPECT_TRUE(IsErrorValue(HttpResponse{503}));
    EXPECT_FALSE(IsErrorValue(HttpResponse{200}));
    EXPECT_TRUE(ErrorPredicate::Default().For<HttpResponse>()(HttpResponse{500}));
}

} // namespace retryable
