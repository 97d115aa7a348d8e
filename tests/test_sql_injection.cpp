/**
 * @file test_sql_injection.cpp
 * @brief Tests for SQL injection probing of forms and query parameters
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "core/url_utils.h"
#include "helpers/http_test_helpers.h"
#include "injection/sqli_scanner.h"
#include <string>

namespace {

struct Fixture {
    test_helpers::FakeHttpClient client;
    PayloadStore payloads;
    logging::NullObserver events;
    SqlInjectionScanner scanner{client, payloads, events, options()};

    static SqlInjectionScanner::Options options() {
        SqlInjectionScanner::Options opts;
        opts.payload_delay = 0.0;
        return opts;
    }
};

HttpResponse response(const std::string& body, double seconds = 0.01) {
    HttpResponse resp;
    resp.status = 200;
    resp.body = body;
    resp.total_time = seconds;
    return resp;
}

Form login_form() {
    Form form;
    form.action = "http://site.test/login";
    form.method = "post";
    form.inputs = {{"user", "text", ""}, {"pass", "password", ""}, {"go", "submit", "Login"}};
    return form;
}

} // namespace

TEST_CASE("Database error detection", "[sqli]") {
    const std::string payload = "' OR '1'='1";

    REQUIRE(SqlInjectionScanner::is_vulnerable_to_sql_injection(
        response("You have an error in your SQL syntax near ''1'"), payload));
    REQUIRE(SqlInjectionScanner::is_vulnerable_to_sql_injection(
        response("Warning: mysql_fetch_array() expects parameter 1"), payload));
    REQUIRE_FALSE(SqlInjectionScanner::is_vulnerable_to_sql_injection(response("<p>No results</p>"), payload));

    SECTION("An echoed payload is not an error") {
        REQUIRE_FALSE(SqlInjectionScanner::is_vulnerable_to_sql_injection(
            response("<p>No results for ' ORA-1</p>"), "' ORA-1"));
    }
}

TEST_CASE("Signal classification", "[sqli]") {
    Fixture f;
    const SqlPayload payload{"Login Bypass", "' OR '1'='1", "Welcome"};
    auto baseline = response("<p>Invalid login</p>");

    REQUIRE(f.scanner.detect(baseline, response("Unclosed quotation mark after the character string"), payload) ==
            "Error based");
    REQUIRE(f.scanner.detect(baseline, response("<p>Welcome back</p>"), payload) == "Result based");
    REQUIRE(f.scanner.detect(baseline, response(std::string(300, 'x')), payload) == "Length based");
    REQUIRE(f.scanner.detect(baseline, response("<p>Invalid login</p>", 3.5), payload) == "Time based");
    REQUIRE(f.scanner.detect(baseline, response("<p>Invalid login</p>"), payload).empty());

    SECTION("Errors and results count even when the baseline shows them") {
        auto noisy = response("<p>Welcome. Microsoft SQL Server is fine</p>");
        REQUIRE(f.scanner.detect(noisy, response("<p>Welcome. Microsoft SQL Server is ok!</p>"), payload) ==
                "Error based");
        auto greeting = response("<p>Welcome, guest</p>");
        REQUIRE(f.scanner.detect(greeting, response("<p>Welcome, admin</p>"), payload) == "Result based");
    }

    SECTION("Baseline subtraction ignores signals the baseline already has") {
        auto opts = Fixture::options();
        opts.baseline_subtraction = true;
        SqlInjectionScanner strict(f.client, f.payloads, f.events, opts);

        auto noisy = response("<p>Welcome. Microsoft SQL Server is fine</p>");
        REQUIRE(strict.detect(noisy, response("<p>Welcome. Microsoft SQL Server is ok!</p>"), payload).empty());
        REQUIRE(strict.detect(baseline, response("Unclosed quotation mark after the character string"), payload) ==
                "Error based");
        REQUIRE(strict.detect(baseline, response("<p>Welcome back</p>"), payload) == "Result based");
    }
}

TEST_CASE("Form scanning", "[sqli]") {
    SECTION("Every vulnerable field is reported once") {
        Fixture f;
        f.client.on_prefix("http://site.test/login", [](const HttpRequest& req, HttpResponse& resp) {
            bool injected = req.body.find("OR") != std::string::npos;
            test_helpers::fill_response(
                test_helpers::html(injected ? "<p>You have an error in your SQL syntax</p>" : "<p>Invalid</p>"),
                req, resp);
            return true;
        });

        auto findings = f.scanner.scan_form(login_form(), "http://site.test/");
        REQUIRE(findings.size() == 2);
        REQUIRE(findings[0].type == "sql_injection");
        REQUIRE(findings[0].url == "http://site.test/");
        REQUIRE(findings[0].details["input_field"] == "user");
        REQUIRE(findings[1].details["input_field"] == "pass");
        REQUIRE(findings[0].details["detection_method"] == "Error based");
        REQUIRE(findings[0].details["payload"] == "' OR '1'='1");
        REQUIRE(findings[0].details["form_action"] == "http://site.test/login");

        // baseline plus the first payload for each field
        REQUIRE(f.client.count_method("POST") == 3);
        auto baseline = f.client.requests().front();
        REQUIRE(baseline.body == "user=test&pass=test");
    }

    SECTION("Clean form is tried with every payload") {
        Fixture f;
        auto findings = f.scanner.scan_form(login_form(), "http://site.test/");
        REQUIRE(findings.empty());
        REQUIRE(f.client.requests().size() == 1 + 2 * f.payloads.sql_payloads().size());
    }

    SECTION("A failed baseline skips the form") {
        Fixture f;
        f.client.fail("http://site.test/login");
        REQUIRE(f.scanner.scan_form(login_form(), "http://site.test/").empty());
        REQUIRE(f.client.requests().size() == 1);
    }

    SECTION("Configured payloads replace the built-ins") {
        Fixture f;
        f.payloads.set_sql_payloads({"1;--"});
        f.scanner.scan_form(login_form(), "http://site.test/");
        REQUIRE(f.client.requests().size() == 3);
    }
}

TEST_CASE("Query parameter scanning", "[sqli]") {
    Fixture f;
    f.client.on_prefix("http://site.test/item?", [](const HttpRequest& req, HttpResponse& resp) {
        std::string id;
        for (const auto& [name, value] : parse_query(req.url)) {
            if (name == "id") id = value;
        }
        bool union_select = id.find("UNION SELECT") != std::string::npos;
        test_helpers::fill_response(
            test_helpers::html(union_select ? "<p>Item 1</p><td>2</td>" : "<p>Item 1</p>"), req, resp);
        return true;
    });

    CrawlResult page;
    page.url = "http://site.test/item?id=1";
    page.status = 200;
    page.body = "<p>Item 1</p>";

    auto findings = f.scanner.scan_url_parameters(page);
    REQUIRE(findings.size() == 1);
    REQUIRE(findings[0].details["parameter"] == "id");
    REQUIRE(findings[0].details["method"] == "get");
    REQUIRE(findings[0].details["payload_name"] == "Union Based");
    REQUIRE(findings[0].details["detection_method"] == "Result based");
    REQUIRE(f.client.requests().size() == 2);

    SECTION("Pages without a query are not probed") {
        f.client.clear_requests();
        page.url = "http://site.test/item";
        REQUIRE(f.scanner.scan_url_parameters(page).empty());
        REQUIRE(f.client.requests().empty());
    }
}
