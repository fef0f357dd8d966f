#include <string>

#include "gtest/gtest.h"
#include "wire_cpp/url.hpp"

using wire_cpp::Error;
using wire_cpp::parse_url;
using wire_cpp::UrlComponents;
using namespace wire_cpp::url_utils;

TEST(ParseUrlTest, ParsesHttpUrl) {
    auto result = parse_url("http://example.com/foo/bar?baz=1");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_EQ(url.scheme, "http");
    EXPECT_FALSE(url.https());
    EXPECT_EQ(url.host, "example.com");
    EXPECT_EQ(url.port, "80");
    EXPECT_EQ(url.path, "/foo/bar");
    EXPECT_EQ(url.query, "baz=1");
    EXPECT_EQ(url.target(), "/foo/bar?baz=1");
}

TEST(ParseUrlTest, ParsesHttpsUrlWithPort) {
    auto result = parse_url("https://example.com:8443/path");
    ASSERT_TRUE(result.has_value());
    const UrlComponents& url = result.value();
    EXPECT_TRUE(url.https());
    EXPECT_EQ(url.port, "8443");
    EXPECT_EQ(url.target(), "/path");
}

TEST(ParseUrlTest, DefaultPortAndPath) {
    auto result = parse_url("https://hostonly");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().port, "443");
    EXPECT_EQ(result.value().target(), "/");
}

TEST(ParseUrlTest, QueryWithoutPath) {
    auto result = parse_url("http://host?q=1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().target(), "/?q=1");
}

TEST(ParseUrlTest, EmptyQueryIsKept) {
    auto result = parse_url("http://host/a?");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().has_query);
    EXPECT_EQ(result.value().target(), "/a?");
}

TEST(ParseUrlTest, FragmentIsDropped) {
    auto result = parse_url("http://host/search?q=test#top");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().target(), "/search?q=test");
}

TEST(ParseUrlTest, SchemeAndHostAreLowercased) {
    auto result = parse_url("HTTP://Example.COM/Path");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().scheme, "http");
    EXPECT_EQ(result.value().host, "example.com");
    EXPECT_EQ(result.value().path, "/Path");
}

TEST(ParseUrlTest, Ipv6LiteralLosesBrackets) {
    auto result = parse_url("http://[::1]:8080/x");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().host, "::1");
    EXPECT_EQ(result.value().port, "8080");
}

TEST(ParseUrlTest, UnknownSchemeParsesWithoutDefaultPort) {
    auto result = parse_url("ftp://files.example.com/readme");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().scheme, "ftp");
    EXPECT_TRUE(result.value().port.empty());
}

TEST(ParseUrlTest, MissingScheme) {
    auto result = parse_url("example.com");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, EmptyHost) {
    auto result = parse_url("http:///foo");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, EmptyPort) {
    auto result = parse_url("http://host:");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, PortOutOfRange) {
    auto result = parse_url("http://host:70000/");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, Error::Code::InvalidUrl);
}

TEST(ParseUrlTest, UserInfoRejected) {
    auto result = parse_url("http://user:pw@host/");
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, Error::Code::InvalidUrl);
}

TEST(UrlUtilsTest, DefaultPort) {
    EXPECT_EQ(default_port("http"), "80");
    EXPECT_EQ(default_port("https"), "443");
    EXPECT_EQ(default_port("gopher"), "");
}

TEST(UrlUtilsTest, IsValidPort) {
    EXPECT_TRUE(is_valid_port("1"));
    EXPECT_TRUE(is_valid_port("65535"));
    EXPECT_FALSE(is_valid_port("65536"));
    EXPECT_FALSE(is_valid_port("8a"));
    EXPECT_FALSE(is_valid_port(""));
}
