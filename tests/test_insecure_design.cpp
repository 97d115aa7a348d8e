/**
 * @file test_insecure_design.cpp
 * @brief Tests for CSRF token detection and the rate-limit probe
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "checks/insecure_design.h"
#include "core/findings.h"
#include "helpers/http_test_helpers.h"
#include <atomic>
#include <string>

using test_helpers::html;

namespace {

struct Fixture {
    test_helpers::FakeHttpClient client;
    ScanConfig config = test_helpers::fast_config();
    logging::NullObserver events;
    ProbeLimiter probes;
    ScanContext ctx{client, config, events, probes};
};

Form post_form(const std::string& action, std::vector<FormInput> inputs) {
    Form form;
    form.action = action;
    form.method = "post";
    form.inputs = std::move(inputs);
    return form;
}

CrawlResult page_with(std::vector<Form> forms, const std::string& body = "<html></html>") {
    CrawlResult page;
    page.url = "http://site.test/contact";
    page.status = 200;
    page.content_type = "text/html";
    page.body = body;
    page.forms = std::move(forms);
    return page;
}

size_t count_type(const std::vector<Finding>& findings, const std::string& type) {
    size_t n = 0;
    for (const auto& f : findings) {
        if (f.type == type) n++;
    }
    return n;
}

} // namespace

TEST_CASE("CSRF token detection", "[insecure_design][csrf]") {
    Form plain = post_form("http://site.test/send", {{"message", "text", ""}});

    REQUIRE_FALSE(InsecureDesignAnalyzer::has_csrf_protection(plain, page_with({})));

    Form with_token = post_form("http://site.test/send", {{"message", "text", ""}, {"csrfmiddlewaretoken", "hidden", "x"}});
    REQUIRE(InsecureDesignAnalyzer::has_csrf_protection(with_token, page_with({})));

    REQUIRE(InsecureDesignAnalyzer::has_csrf_protection(
        plain, page_with({}, "<head><meta name=\"csrf-token\" content=\"abc\"></head>")));

    REQUIRE(InsecureDesignAnalyzer::has_csrf_protection(
        plain, page_with({}, "<script>headers['X-CSRF-Token'] = t;</script>")));

    CrawlResult header_page = page_with({});
    header_page.headers.emplace_back("x-xsrf-token", "abc");
    REQUIRE(InsecureDesignAnalyzer::has_csrf_protection(plain, header_page));
}

TEST_CASE("Forms without tokens are reported", "[insecure_design][csrf]") {
    Fixture fx;
    fx.config.probe_rate_limiting = false;

    Form form = post_form("http://site.test/send", {{"message", "text", ""}});
    Form search;
    search.action = "http://site.test/search";
    search.method = "get";
    search.inputs = {{"q", "text", ""}};

    InsecureDesignAnalyzer analyzer;
    std::vector<Finding> findings;
    analyzer.check(page_with({form, search}), fx.ctx, findings);

    REQUIRE(count_type(findings, "insecure_design_csrf") == 2);
    REQUIRE(findings[0].details["form_action"] == "http://site.test/send");
    REQUIRE(findings[0].details["form_method"] == "post");
    REQUIRE(has_required_details(findings[0]));
    REQUIRE(fx.client.requests().empty());
}

TEST_CASE("Rate limit probe", "[insecure_design][rate_limit]") {
    Fixture fx;
    Form form = post_form("http://site.test/send", {{"email", "email", ""}, {"message", "textarea", ""},
                                                    {"csrf_token", "hidden", "t"}});

    SECTION("Three accepted submissions mean no rate limiting") {
        fx.client.on("POST", "http://site.test/send", html("<p>Thanks!</p>"));
        REQUIRE_FALSE(InsecureDesignAnalyzer::has_rate_limiting(form, fx.ctx));
        REQUIRE(fx.client.count_method("POST") == 3);

        InsecureDesignAnalyzer analyzer;
        std::vector<Finding> findings;
        fx.client.clear_requests();
        analyzer.check(page_with({form}), fx.ctx, findings);
        REQUIRE(count_type(findings, "insecure_design_no_rate_limiting") == 1);
        REQUIRE(count_type(findings, "insecure_design_csrf") == 0);

        SECTION("Each form is probed once per scan") {
            findings.clear();
            fx.client.clear_requests();
            analyzer.check(page_with({form}), fx.ctx, findings);
            REQUIRE(fx.client.requests().empty());
            REQUIRE(findings.empty());
        }
    }

    SECTION("429 means throttled") {
        fx.client.on("POST", "http://site.test/send", html("slow", 429));
        REQUIRE(InsecureDesignAnalyzer::has_rate_limiting(form, fx.ctx));
        REQUIRE(fx.client.count_method("POST") == 1);
    }

    SECTION("Throttling message means throttled") {
        fx.client.on("POST", "http://site.test/send", html("<p>Too many requests, try again later</p>"));
        REQUIRE(InsecureDesignAnalyzer::has_rate_limiting(form, fx.ctx));
    }

    SECTION("Rejected submissions count as protected") {
        fx.client.on("POST", "http://site.test/send", html("bad request", 400));
        REQUIRE(InsecureDesignAnalyzer::has_rate_limiting(form, fx.ctx));
    }

    SECTION("Transport failure counts as protected") {
        fx.client.fail("http://site.test/send");
        REQUIRE(InsecureDesignAnalyzer::has_rate_limiting(form, fx.ctx));
    }

    SECTION("File uploads and GET forms are not probed") {
        Form upload = post_form("http://site.test/upload", {{"doc", "file", ""}});
        REQUIRE(InsecureDesignAnalyzer::has_rate_limiting(upload, fx.ctx));
        Form get = form;
        get.method = "get";
        REQUIRE(InsecureDesignAnalyzer::has_rate_limiting(get, fx.ctx));
        REQUIRE(fx.client.requests().empty());
    }
}
