/**
 * @file test_html_extract.cpp
 * @brief Unit tests for form, link and reflection extraction
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "core/html_extract.h"
#include <algorithm>
#include <string>

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

TEST_CASE("Forms are extracted with their named inputs", "[html][forms]") {
    std::string page = R"(
        <html><body>
        <form action="/login" method="POST">
            <input type="text" name="username" value="guest">
            <input type="PASSWORD" name="password">
            <input type="submit" value="Go">
            <input name="remember">
        </form>
        <form>
            <textarea name="comment">hello</textarea>
            <select name="color">
                <option value="red">Red</option>
                <option value="blue" selected>Blue</option>
            </select>
        </form>
        </body></html>)";

    auto forms = extract_forms(page, "http://site.test/account/page");
    REQUIRE(forms.size() == 2);

    SECTION("Action resolved and method lower-cased") {
        REQUIRE(forms[0].action == "http://site.test/login");
        REQUIRE(forms[0].method == "post");
    }

    SECTION("Nameless inputs are skipped") {
        REQUIRE(forms[0].inputs.size() == 3);
        REQUIRE(forms[0].inputs[0].name == "username");
        REQUIRE(forms[0].inputs[0].type == "text");
        REQUIRE(forms[0].inputs[0].value == "guest");
        REQUIRE(forms[0].inputs[1].type == "password");
        REQUIRE(forms[0].inputs[2].name == "remember");
        REQUIRE(forms[0].inputs[2].type == "text");
    }

    SECTION("Missing action and method default to the page and GET") {
        REQUIRE(forms[1].action == "http://site.test/account/page");
        REQUIRE(forms[1].method == "get");
        REQUIRE(forms[1].inputs.size() == 2);
        REQUIRE(forms[1].inputs[0].type == "textarea");
        REQUIRE(forms[1].inputs[0].value == "hello");
        REQUIRE(forms[1].inputs[1].type == "select");
        REQUIRE(forms[1].inputs[1].value == "blue");
    }
}

TEST_CASE("Links are resolved, normalized and de-duplicated", "[html][links]") {
    std::string page = R"html(
        <a href="/about/">About</a>
        <a href="/about">About again</a>
        <a href="#top">Top</a>
        <a href="mailto:me@site.test">Mail</a>
        <a href="javascript:void(0)">JS</a>
        <a href="https://other.test/x#frag">Other</a>
        <link rel="stylesheet" href="/css/site.css">
        <script src="/js/app.js"></script>
        <img src="logo.png">
        <a href="ftp://files.site.test/pub">FTP</a>)html";

    auto links = extract_links(page, "http://site.test/dir/");
    REQUIRE(links.size() == 5);
    REQUIRE(links[0] == "http://site.test/about");
    REQUIRE(contains(links, "https://other.test/x"));
    REQUIRE(contains(links, "http://site.test/css/site.css"));
    REQUIRE(contains(links, "http://site.test/js/app.js"));
    REQUIRE(contains(links, "http://site.test/dir/logo.png"));
}

TEST_CASE("Scripts carry src and integrity", "[html][scripts]") {
    std::string page = R"(
        <script src="//cdn.example.com/lib.js" integrity="sha384-abc"></script>
        <script src="/local.js"></script>
        <script>var inline = 1;</script>)";

    auto scripts = extract_scripts(page, "http://site.test/");
    REQUIRE(scripts.size() == 3);
    REQUIRE(scripts[0].src == "https://cdn.example.com/lib.js");
    REQUIRE(scripts[0].raw_src == "//cdn.example.com/lib.js");
    REQUIRE(scripts[0].integrity == "sha384-abc");
    REQUIRE(scripts[1].src == "http://site.test/local.js");
    REQUIRE(scripts[1].integrity.empty());
    REQUIRE(scripts[2].src.empty());
}

TEST_CASE("Stylesheets, meta names and password inputs", "[html]") {
    std::string page = R"(
        <head>
        <link rel="Stylesheet" href="/a.css">
        <link rel="icon" href="/favicon.ico">
        <meta name="Generator" content="WordPress 6.0">
        <meta charset="utf-8">
        </head>
        <body><input type="password" name="p1"><input type="Password" name="p2"></body>)";

    auto sheets = extract_stylesheets(page, "http://site.test/");
    REQUIRE(sheets.size() == 1);
    REQUIRE(sheets[0] == "http://site.test/a.css");

    auto names = meta_names(page);
    REQUIRE(names.size() == 1);
    REQUIRE(names[0] == "generator");

    REQUIRE(count_password_inputs(page) == 2);
}

TEST_CASE("Inert elements are stripped", "[html][strip]") {
    REQUIRE(strip_inert_elements("a<textarea>X</textarea>b") == "ab");
    REQUIRE(strip_inert_elements("a<PRE class='x'>X</PRE>b") == "ab");
    REQUIRE(strip_inert_elements("a<code>X</code>b<code>Y</code>c") == "abc");
    REQUIRE(strip_inert_elements("a<codex>X</codex>b") == "a<codex>X</codex>b");

    SECTION("Unclosed element runs to the end of the document") {
        REQUIRE(strip_inert_elements("before<textarea>X and more") == "before");
    }
}

TEST_CASE("Reflection contexts", "[html][reflection]") {
    const std::string marker = "xss7f3a9";

    SECTION("Absent marker") {
        REQUIRE(reflection_contexts("<p>nothing</p>", marker).empty());
    }

    SECTION("Body text") {
        auto ctx = reflection_contexts("<p>" + marker + "</p>", marker);
        REQUIRE(ctx.size() == 1);
        REQUIRE(ctx[0] == "html");
    }

    SECTION("Script body") {
        auto ctx = reflection_contexts("<script>var q = '" + marker + "';</script>", marker);
        REQUIRE(contains(ctx, "script"));
        REQUIRE(contains(ctx, "html"));
    }

    SECTION("Attribute and bare URL") {
        auto ctx = reflection_contexts("<a href=\"" + marker + "\">x</a><input value=\"" + marker + "\">",
                                       marker);
        REQUIRE(contains(ctx, "attribute:href"));
        REQUIRE(contains(ctx, "attribute:value"));
        REQUIRE(contains(ctx, "url"));
    }
}

TEST_CASE("Extraction tolerates malformed input", "[html][degradation]") {
    std::string truncated = "<html><body><form action='/x' method='post'><input name='a' type=";
    REQUIRE_NOTHROW(extract_forms(truncated, "http://site.test/"));
    REQUIRE_NOTHROW(extract_links("<a href='/unterminated", "http://site.test/"));
    REQUIRE_NOTHROW(extract_scripts(std::string("\x00\xff\xfe<script", 9), "http://site.test/"));
    REQUIRE(extract_forms("", "http://site.test/").empty());
    REQUIRE(extract_links("", "http://site.test/").empty());
}
