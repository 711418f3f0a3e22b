#include "sthe/util/HttpClient.hpp"

#include <gtest/gtest.h>

using sthe::util::FetchError;
using sthe::util::HttpClient;

TEST(HttpClientTest, ParsesSchemeHostPortAndTarget) {
    auto endpoint = HttpClient::parseUrl("HTTPS://example.com:8443/a/b?x=1#frag");
    EXPECT_EQ(endpoint.scheme, "https");
    EXPECT_EQ(endpoint.host, "example.com");
    EXPECT_EQ(endpoint.port, "8443");
    EXPECT_EQ(endpoint.target, "/a/b?x=1");
}

TEST(HttpClientTest, FillsDefaultPortAndTarget) {
    auto plain = HttpClient::parseUrl("http://example.com");
    EXPECT_EQ(plain.port, "80");
    EXPECT_EQ(plain.target, "/");

    auto secure = HttpClient::parseUrl("https://example.com?q=1");
    EXPECT_EQ(secure.port, "443");
    EXPECT_EQ(secure.target, "/?q=1");
}

TEST(HttpClientTest, RejectsUnusableUrls) {
    try {
        HttpClient::parseUrl("ftp://example.com/file");
        FAIL() << "expected FetchError";
    } catch (const FetchError& ex) {
        EXPECT_EQ(ex.type(), FetchError::Type::invalid_url);
    }
    EXPECT_THROW(HttpClient::parseUrl("example.com/page"), FetchError);
    EXPECT_THROW(HttpClient::parseUrl("http:///page"), FetchError);
}

TEST(HttpClientTest, CombinesRedirectLocations) {
    auto base = HttpClient::parseUrl("http://example.com/a/b?x=1");
    EXPECT_EQ(HttpClient::combineLocation(base, "https://other.org/z"), "https://other.org/z");
    EXPECT_EQ(HttpClient::combineLocation(base, "//cdn.example.com/x"), "http://cdn.example.com/x");
    EXPECT_EQ(HttpClient::combineLocation(base, "/root"), "http://example.com/root");
    EXPECT_EQ(HttpClient::combineLocation(base, "c"), "http://example.com/a/c");
    EXPECT_EQ(HttpClient::combineLocation(base, "?y=2"), "http://example.com/a/b?y=2");
    EXPECT_EQ(HttpClient::combineLocation(base, ""), "http://example.com/a/b?x=1");
}

TEST(HttpClientTest, KeepsNonDefaultPortWhenCombining) {
    auto base = HttpClient::parseUrl("http://h:8080/a/b?x");
    EXPECT_EQ(HttpClient::combineLocation(base, "c"), "http://h:8080/a/c");
    EXPECT_EQ(HttpClient::combineLocation(base, "/d"), "http://h:8080/d");

    auto secure = HttpClient::parseUrl("https://h:443/a");
    EXPECT_EQ(HttpClient::combineLocation(secure, "b"), "https://h/b");
}
