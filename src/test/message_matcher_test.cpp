#include <string>

#include <gtest/gtest.h>

#include "retryable/options.h"

namespace retryable {

class MessageMatcherTest : public ::testing::Test {};

TEST_F(MessageMatcherTest, Substring) {
    MessageMatcher matcher = "timeout";

    EXPECT_EQ(matcher.GetKind(), MessageMatcher::Kind::SUBSTRING);
    EXPECT_TRUE(matcher.Matches("read timeout after 3s"));
    EXPECT_TRUE(matcher.Matches("timeout"));
    EXPECT_FALSE(matcher.Matches("Timeout"));
    EXPECT_FALSE(matcher.Matches("connection refused"));
}

TEST_F(MessageMatcherTest, EmptySubstringMatchesEverything) {
    MessageMatcher matcher = MessageMatcher::Substring("");

    EXPECT_TRUE(matcher.Matches(""));
    EXPECT_TRUE(matcher.Matches("anything"));
}

TEST_F(MessageMatcherTest, Pattern) {
    MessageMatcher matcher = MessageMatcher::Pattern("^HTTP 5\\d\\d");

    EXPECT_EQ(matcher.GetKind(), MessageMatcher::Kind::PATTERN);
    EXPECT_TRUE(matcher.Matches("HTTP 503 Service Unavailable"));
    EXPECT_FALSE(matcher.Matches("HTTP 404 Not Found"));
    EXPECT_FALSE(matcher.Matches("got HTTP 503"));
}

TEST_F(MessageMatcherTest, PatternSearchesAnywhere) {
    MessageMatcher matcher = MessageMatcher::Pattern("throttl(ed|ing)");

    EXPECT_TRUE(matcher.Matches("request was throttled"));
    EXPECT_TRUE(matcher.Matches("throttling in effect"));
    EXPECT_FALSE(matcher.Matches("THROTTLED"));
}

TEST_F(MessageMatcherTest, PatternIgnoreCase) {
    MessageMatcher matcher = MessageMatcher::Pattern("throttled", true);

    EXPECT_TRUE(matcher.Matches("THROTTLED"));
}

TEST_F(MessageMatcherTest, InvalidPattern) {
    EXPECT_THROW(MessageMatcher::Pattern("(unclosed"), ConfigurationError);
    EXPECT_THROW(MessageMatcher::Parse("/[a-/"), ConfigurationError);
}

TEST_F(MessageMatcherTest, Parse) {
    auto substring = MessageMatcher::Parse("timeout");
    EXPECT_EQ(substring, MessageMatcher::Substring("timeout"));

    auto pattern = MessageMatcher::Parse("/time(d)?out/");
    EXPECT_EQ(pattern, MessageMatcher::Pattern("time(d)?out"));
    EXPECT_TRUE(pattern.Matches("timedout"));

    auto icase = MessageMatcher::Parse("/timeout/i");
    EXPECT_EQ(icase, MessageMatcher::Pattern("timeout", true));
    EXPECT_TRUE(icase.Matches("TIMEOUT"));

    // Unknown flags and lone slashes are plain substrings
    EXPECT_EQ(MessageMatcher::Parse("/timeout/x").GetKind(), MessageMatcher::Kind::SUBSTRING);
    EXPECT_EQ(MessageMatcher::Parse("/").GetKind(), MessageMatcher::Kind::SUBSTRING);
    EXPECT_EQ(MessageMatcher::Parse("path/to/file").GetKind(), MessageMatcher::Kind::SUBSTRING);
}

TEST_F(MessageMatcherTest, ToStringRoundTrips) {
    EXPECT_EQ(MessageMatcher::Substring("timeout").ToString(), "timeout");
    EXPECT_EQ(MessageMatcher::Pattern("a+b").ToString(), "/a+b/");
    EXPECT_EQ(MessageMatcher::Pattern("a+b", true).ToString(), "/a+b/i");

    auto pattern = MessageMatcher::Pattern("a+b", true);
    EXPECT_EQ(MessageMatcher::Parse(pattern.ToString()), pattern);
}

TEST_F(MessageMatcherTest, Equality) {
    EXPECT_EQ(MessageMatcher("x"), MessageMatcher::Substring("x"));
    EXPECT_NE(MessageMatcher::Substring("x"), MessageMatcher::Pattern("x"));
    EXPECT_NE(MessageMatcher::Pattern("x"), MessageMatcher::Pattern("x", true));
}

} // namespace retryable
