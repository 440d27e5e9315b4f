// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splitdl/core/url.hpp>

using namespace splitdl::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://example.com/file.zip");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "https");
        CHECK(url.host() == "example.com");
        CHECK(url.path() == "/file.zip");
        CHECK(url.is_secure());
        CHECK(url.is_http());
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://example.com:8080/path");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "http");
        CHECK(url.port() == "8080");
        CHECK(!url.is_secure());
        CHECK(url.base() == "http://example.com:8080");
    }

    SECTION("URL with query and fragment") {
        auto result = Url::parse("https://example.com/file.zip?v=1#section");
        REQUIRE(result.has_value());
        CHECK(result->query() == "v=1");
        CHECK(result->fragment() == "section");
        CHECK(result->str() == "https://example.com/file.zip?v=1#section");
    }

    SECTION("IPv6 host") {
        auto result = Url::parse("http://[::1]:9000/data.bin");
        REQUIRE(result.has_value());
        CHECK(result->host() == "[::1]");
        CHECK(result->port() == "9000");
    }

    SECTION("Credentials are not part of the host") {
        auto result = Url::parse("https://user:pw@example.com/a");
        REQUIRE(result.has_value());
        CHECK(result->host() == "example.com");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    CHECK(!Url::parse("example.com/file.zip").has_value());
    CHECK(!Url::parse("").has_value());
    CHECK(!Url::parse("https:///nohost").has_value());
    CHECK(!Url::parse("http://example.com:80a/x").has_value());

    auto result = Url::parse("not a url");
    REQUIRE(!result.has_value());
    CHECK(result.error() == DownloadErrc::invalid_url);
}

TEST_CASE("Url::filename extraction", "[url]") {
    SECTION("Simple filename") {
        CHECK(Url::parse("https://example.com/myfile.zip")->filename() == "myfile.zip");
    }

    SECTION("Query is ignored") {
        CHECK(Url::parse("https://example.com/download.php?id=123")->filename() == "download.php");
    }

    SECTION("Percent-encoded name") {
        CHECK(Url::parse("https://example.com/dir/my%20file%2B1.tar.gz")->filename() == "my file+1.tar.gz");
    }

    SECTION("Directory path has no filename") {
        CHECK(Url::parse("https://example.com/folder/")->filename().empty());
        CHECK(Url::parse("https://example.com")->filename().empty());
    }
}

TEST_CASE("percent_decode", "[url]") {
    CHECK(percent_decode("a%2Fb") == "a/b");
    CHECK(percent_decode("100%") == "100%");
    CHECK(percent_decode("%zz") == "%zz");
    CHECK(percent_decode("%41%42") == "AB");
}

TEST_CASE("Url::default_port", "[url]") {
    CHECK(Url::parse("https://example.com")->default_port() == 443);
    CHECK(Url::parse("http://example.com")->default_port() == 80);
    CHECK(Url::parse("ftp://example.com")->default_port() == 0);
}
