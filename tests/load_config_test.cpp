#include <gtest/gtest.h>

#include "LoadTestConfig.h"

TEST(TargetUrlTest, DefaultPorts) {
    TargetUrl plain = parse_target_url("http://example.com");
    EXPECT_EQ(plain.scheme, "http");
    EXPECT_EQ(plain.host, "example.com");
    EXPECT_EQ(plain.port, 80);
    EXPECT_EQ(plain.path, "/");

    TargetUrl secure = parse_target_url("https://example.com/api");
    EXPECT_EQ(secure.port, 443);
    EXPECT_EQ(secure.path, "/api");
    EXPECT_EQ(secure.origin(), "https://example.com:443");
}

TEST(TargetUrlTest, ExplicitPortQueryAndFragment) {
    TargetUrl t = parse_target_url("HTTP://127.0.0.1:8080/items?id=7&x=y#section");
    EXPECT_EQ(t.scheme, "http");
    EXPECT_EQ(t.host, "127.0.0.1");
    EXPECT_EQ(t.port, 8080);
    EXPECT_EQ(t.path, "/items?id=7&x=y");

    TargetUrl q = parse_target_url("http://localhost:3000?ping=1");
    EXPECT_EQ(q.path, "/?ping=1");
}

TEST(TargetUrlTest, BracketedIpv6Host) {
    TargetUrl t = parse_target_url("http://[::1]:9000/health");
    EXPECT_EQ(t.host, "[::1]");
    EXPECT_EQ(t.port, 9000);
    EXPECT_EQ(t.path, "/health");
}

TEST(TargetUrlTest, RejectsMalformedUrls) {
    EXPECT_THROW(parse_target_url(""), ConfigError);
    EXPECT_THROW(parse_target_url("not a url"), ConfigError);
    EXPECT_THROW(parse_target_url("example.com/path"), ConfigError);
    EXPECT_THROW(parse_target_url("ftp://example.com/file"), ConfigError);
    EXPECT_THROW(parse_target_url("http://"), ConfigError);
    EXPECT_THROW(parse_target_url("http://example.com:0/"), ConfigError);
    EXPECT_THROW(parse_target_url("http://example.com:70000/"), ConfigError);
    EXPECT_THROW(parse_target_url("http://example.com:123456789/"), ConfigError);
    EXPECT_THROW(parse_target_url("http://user@example.com/"), ConfigError);
}

TEST(HttpMethodTest, ParsesCaseInsensitively) {
    EXPECT_EQ(parse_method("GET"), HttpMethod::GET);
    EXPECT_EQ(parse_method("post"), HttpMethod::POST);
    EXPECT_EQ(parse_method("Put"), HttpMethod::PUT);
    EXPECT_EQ(parse_method("patch"), HttpMethod::PATCH);
    EXPECT_EQ(parse_method("DELETE"), HttpMethod::DELETE);
    EXPECT_THROW(parse_method("HEAD"), ConfigError);
    EXPECT_THROW(parse_method(""), ConfigError);

    EXPECT_STREQ(to_string(HttpMethod::PATCH), "PATCH");
    EXPECT_FALSE(method_accepts_body(HttpMethod::GET));
    EXPECT_TRUE(method_accepts_body(HttpMethod::POST));
    EXPECT_TRUE(method_accepts_body(HttpMethod::DELETE));
}

TEST(HeaderListTest, KeepsOrderAndDuplicates) {
    auto headers = parse_header_list("Accept: text/plain , X-Trace:1,X-Trace:2");
    ASSERT_EQ(headers.size(), 3u);
    EXPECT_EQ(headers[0].first, "Accept");
    EXPECT_EQ(headers[0].second, "text/plain");
    EXPECT_EQ(headers[1].second, "1");
    EXPECT_EQ(headers[2].first, "X-Trace");
    EXPECT_EQ(headers[2].second, "2");
}

TEST(HeaderListTest, ValueMaySplitOnFirstColonOnly) {
    auto headers = parse_header_list("Referer:http://host:8080/x");
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers[0].first, "Referer");
    EXPECT_EQ(headers[0].second, "http://host:8080/x");
}

TEST(HeaderListTest, SkipsEmptyEntries) {
    EXPECT_TRUE(parse_header_list("").empty());
    EXPECT_EQ(parse_header_list("A:1,, ,B:2").size(), 2u);
}

TEST(HeaderListTest, RejectsBadEntries) {
    EXPECT_THROW(parse_header_list("NoColonHere"), ConfigError);
    EXPECT_THROW(parse_header_list("Bad Name:value"), ConfigError);
    EXPECT_THROW(parse_header_list(":value"), ConfigError);
}

class ValidateConfigTest : public ::testing::Test {
protected:
    LoadTestConfig config;

    void SetUp() override {
        config.url = "http://localhost:8080/";
        config.requests = 10;
        config.concurrency = 2;
    }
};

TEST_F(ValidateConfigTest, AcceptsValidConfig) {
    EXPECT_NO_THROW(validate_config(config));

    config.concurrency = 500;   // more than requests is allowed
    EXPECT_NO_THROW(validate_config(config));
}

TEST_F(ValidateConfigTest, RejectsZeroCounts) {
    config.requests = 0;
    EXPECT_THROW(validate_config(config), ConfigError);

    config.requests = 10;
    config.concurrency = 0;
    EXPECT_THROW(validate_config(config), ConfigError);

    config.concurrency = -3;
    EXPECT_THROW(validate_config(config), ConfigError);
}

TEST_F(ValidateConfigTest, RejectsNonPositiveTimeout) {
    config.timeout = std::chrono::milliseconds(0);
    EXPECT_THROW(validate_config(config), ConfigError);
}

TEST_F(ValidateConfigTest, RejectsTimeoutAboveMaximum) {
    config.timeout = kMaxTimeout;
    EXPECT_NO_THROW(validate_config(config));
    config.timeout = kMaxTimeout + std::chrono::milliseconds(1);
    EXPECT_THROW(validate_config(config), ConfigError);
}

TEST_F(ValidateConfigTest, RejectsBadUrlAndHeaderName) {
    config.url = "localhost:8080";
    EXPECT_THROW(validate_config(config), ConfigError);

    config.url = "http://localhost:8080/";
    config.headers.emplace_back("X Bad", "1");
    EXPECT_THROW(validate_config(config), ConfigError);
}

TEST(ConfigErrorTest, IsAnInvalidArgument) {
    try {
        parse_method("TRACE");
        FAIL() << "expected ConfigError";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("TRACE"), std::string::npos);
    }
}
