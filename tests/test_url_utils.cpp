/**
 * @file test_url_utils.cpp
 * @brief Unit tests for URL normalization, resolution and scoping
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "core/url_utils.h"
#include <string>
#include <vector>

TEST_CASE("normalize_url is idempotent", "[url]") {
    std::vector<std::string> urls = {
        "http://Example.COM/path/",
        "https://example.com:443/a/b/?x=1#frag",
        "http://example.com:8080",
        "http://example.com/a%20b",
        "http://example.com/search?q=hello+world",
    };
    for (const auto& u : urls) {
        std::string once = normalize_url(u);
        REQUIRE(!once.empty());
        REQUIRE(normalize_url(once) == once);
    }
}

TEST_CASE("normalize_url canonical form", "[url]") {
    REQUIRE(normalize_url("http://a.com/x/") == normalize_url("http://a.com/x"));
    REQUIRE(normalize_url("http://A.com:80/") == "http://a.com/");
    REQUIRE(normalize_url("https://a.com:443/x") == "https://a.com/x");
    REQUIRE(normalize_url("http://a.com:8080/x") == "http://a.com:8080/x");
    REQUIRE(normalize_url("http://a.com/page#section") == "http://a.com/page");
    REQUIRE(normalize_url("http://a.com/page?b=2&a=1") == "http://a.com/page?b=2&a=1");
    REQUIRE(normalize_url("http://a.com") == "http://a.com/");

    SECTION("Unparseable input") {
        REQUIRE(normalize_url("").empty());
        REQUIRE(normalize_url("not a url").empty());
        REQUIRE(normalize_url("example.com/path").empty());
    }
}

TEST_CASE("resolve_url follows RFC 3986", "[url]") {
    REQUIRE(resolve_url("http://a.com/dir/page", "other") == "http://a.com/dir/other");
    REQUIRE(resolve_url("http://a.com/dir/page", "../x") == "http://a.com/x");
    REQUIRE(resolve_url("http://a.com/dir/page", "/abs") == "http://a.com/abs");
    REQUIRE(resolve_url("http://a.com/dir/page", "https://b.com/y#f") == "https://b.com/y");

    SECTION("Non-navigable references") {
        REQUIRE(resolve_url("http://a.com/", "#top").empty());
        REQUIRE(resolve_url("http://a.com/", "javascript:alert(1)").empty());
        REQUIRE(resolve_url("http://a.com/", "mailto:me@a.com").empty());
        REQUIRE(resolve_url("http://a.com/", "").empty());
    }
}

TEST_CASE("is_valid_url accepts only http and https", "[url]") {
    REQUIRE(is_valid_url("http://a.com"));
    REQUIRE(is_valid_url("https://a.com/x?y=1"));
    REQUIRE_FALSE(is_valid_url("ftp://a.com/file"));
    REQUIRE_FALSE(is_valid_url("a.com"));
    REQUIRE_FALSE(is_valid_url(""));
}

TEST_CASE("URL components", "[url]") {
    REQUIRE(origin_of("https://Shop.Example.com:8443/cart?id=1") == "https://shop.example.com:8443");
    REQUIRE(origin_of("http://a.com:80/x") == "http://a.com");
    REQUIRE(host_of("https://Shop.Example.com/x") == "shop.example.com");
    REQUIRE(scheme_of("HTTPS://a.com/") == "https");
    REQUIRE(path_of("http://a.com/dir/page.php?x=1") == "/dir/page.php");
    REQUIRE(path_of("http://a.com") == "/");
}

TEST_CASE("Registrable domain uses public suffixes", "[url][scope]") {
    REQUIRE(registrable_domain("www.example.com") == "example.com");
    REQUIRE(registrable_domain("a.b.example.com") == "example.com");
    REQUIRE(registrable_domain("www.example.co.uk") == "example.co.uk");
    REQUIRE(registrable_domain("shop.example.com.au") == "example.com.au");
    REQUIRE(registrable_domain("alice.github.io") == "alice.github.io");
    REQUIRE(registrable_domain("192.168.1.10") == "192.168.1.10");
    REQUIRE(registrable_domain("localhost") == "localhost");

    REQUIRE(same_registrable_domain("http://blog.example.com/", "https://example.com/x"));
    REQUIRE_FALSE(same_registrable_domain("http://example.com/", "http://example.org/"));
    REQUIRE_FALSE(same_registrable_domain("http://alice.github.io/", "http://bob.github.io/"));
    REQUIRE_FALSE(same_registrable_domain("http://example.com/", "not a url"));
}

TEST_CASE("Sites under deeper public suffixes stay apart", "[url][scope]") {
    REQUIRE(registrable_domain("shop.example.com.es") == "example.com.es");
    REQUIRE(registrable_domain("www.alice.gv.at") == "alice.gv.at");
    REQUIRE(registrable_domain("bucket.s3.amazonaws.com") == "bucket.s3.amazonaws.com");

    REQUIRE_FALSE(same_registrable_domain("http://shop.com.es/", "http://evil.com.es/"));
    REQUIRE_FALSE(same_registrable_domain("http://alice.gv.at/", "http://bob.gv.at/"));
    REQUIRE_FALSE(same_registrable_domain("https://foo.s3.amazonaws.com/", "https://bar.s3.amazonaws.com/"));
    REQUIRE_FALSE(same_registrable_domain("https://foo.s3-eu-west-1.amazonaws.com/",
                                          "https://bar.s3-eu-west-1.amazonaws.com/"));
    REQUIRE(same_registrable_domain("https://www.shop.com.es/a", "https://shop.com.es/b"));

    SECTION("A bare public suffix is its own scope") {
        REQUIRE(registrable_domain("com.es") == "com.es");
        REQUIRE(registrable_domain("co.uk.") == "co.uk");
    }
}

TEST_CASE("Query helpers", "[url][query]") {
    SECTION("parse_query decodes pairs in order") {
        auto params = parse_query("http://a.com/s?q=hello+world&x=%3Cb%3E&flag");
        REQUIRE(params.size() == 3);
        REQUIRE(params[0].first == "q");
        REQUIRE(params[0].second == "hello world");
        REQUIRE(params[1].second == "<b>");
        REQUIRE(params[2].first == "flag");
        REQUIRE(params[2].second.empty());
        REQUIRE(parse_query("http://a.com/s").empty());
        REQUIRE(parse_query("http://a.com/s?").empty());
    }

    SECTION("set_query_param replaces in place") {
        std::string url = set_query_param("http://a.com/s?a=1&b=2", "a", "' OR 1=1--");
        auto params = parse_query(url);
        REQUIRE(params.size() == 2);
        REQUIRE(params[0].first == "a");
        REQUIRE(params[0].second == "' OR 1=1--");
        REQUIRE(params[1].second == "2");
        REQUIRE(url.rfind("http://a.com/s?", 0) == 0);
    }

    SECTION("set_query_param appends a new parameter") {
        std::string url = set_query_param("http://a.com/s", "q", "x y");
        REQUIRE(url == "http://a.com/s?q=x%20y");
    }

    SECTION("encode_form") {
        REQUIRE(encode_form({{"user", "a b"}, {"pass", "p&w"}}) == "user=a%20b&pass=p%26w");
        REQUIRE(encode_form({}).empty());
    }

    SECTION("url_encode and url_decode") {
        REQUIRE(url_encode("a-b_c.d~e") == "a-b_c.d~e");
        REQUIRE(url_encode("<>") == "%3C%3E");
        REQUIRE(url_decode(url_encode("<script>alert('x')</script>")) == "<script>alert('x')</script>");
        REQUIRE(url_decode("100%") == "100%");
    }
}

TEST_CASE("file_from_url", "[url]") {
    REQUIRE(file_from_url("http://a.com/") == "index.html");
    REQUIRE(file_from_url("http://a.com") == "index.html");
    REQUIRE(file_from_url("http://a.com/docs/") == "index.html");
    REQUIRE(file_from_url("http://a.com/dir/page.php?x=1") == "page.php");
}
