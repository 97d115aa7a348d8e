/**
 * @file test_security_headers.cpp
 * @brief Tests for missing security header detection
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "checks/security_headers.h"
#include "core/findings.h"
#include "helpers/http_test_helpers.h"
#include <set>
#include <string>

namespace {

CrawlResult page_with(std::vector<std::pair<std::string, std::string>> headers) {
    CrawlResult page;
    page.url = "https://site.test/index.php";
    page.status = 200;
    page.content_type = "text/html";
    page.headers = std::move(headers);
    page.body = "<html><body>Hello</body></html>";
    return page;
}

} // namespace

TEST_CASE("Every tracked header missing", "[headers]") {
    test_helpers::FakeHttpClient client;
    ScanConfig config = test_helpers::fast_config();
    logging::NullObserver events;
    ProbeLimiter probes;
    ScanContext ctx{client, config, events, probes};

    SecurityHeadersAnalyzer analyzer;
    std::vector<Finding> findings;
    analyzer.check(page_with({}), ctx, findings);

    REQUIRE(findings.size() == 6);
    std::set<std::string> types;
    for (const auto& f : findings) {
        types.insert(f.type);
        REQUIRE(has_required_details(f));
        REQUIRE(f.url == "https://site.test/index.php");
        REQUIRE(f.file == "index.php");
    }
    REQUIRE(types == std::set<std::string>{
        "missing_content_security_policy",
        "missing_x_frame_options",
        "missing_x_content_type_options",
        "missing_strict_transport_security",
        "missing_referrer_policy",
        "missing_permissions_policy",
    });

    REQUIRE(findings[0].details["header_name"] == "Content-Security-Policy");
    REQUIRE(findings[0].details["severity"] == "High");
    REQUIRE(findings[4].details["severity"] == "Low");
}

TEST_CASE("Present headers are matched case-insensitively", "[headers]") {
    test_helpers::FakeHttpClient client;
    ScanConfig config = test_helpers::fast_config();
    logging::NullObserver events;
    ProbeLimiter probes;
    ScanContext ctx{client, config, events, probes};

    SecurityHeadersAnalyzer analyzer;
    std::vector<Finding> findings;
    analyzer.check(page_with({
        {"content-security-policy", "default-src 'self'"},
        {"X-FRAME-OPTIONS", "DENY"},
        {"x-content-type-options", "nosniff"},
        {"strict-transport-security", "max-age=31536000"},
        {"referrer-policy", "no-referrer"},
    }), ctx, findings);

    REQUIRE(findings.size() == 1);
    REQUIRE(findings[0].type == "missing_permissions_policy");
    REQUIRE(findings[0].details["header_description"] ==
            "Restricts which browser features the page and its frames may use");
}

TEST_CASE("Finding type naming", "[headers]") {
    REQUIRE(SecurityHeadersAnalyzer::finding_type("X-Frame-Options") == "missing_x_frame_options");
    REQUIRE(SecurityHeadersAnalyzer::tracked_headers().size() == 6);
}

TEST_CASE("Toggle", "[headers][config]") {
    SecurityHeadersAnalyzer analyzer;
    ScanConfig config;
    REQUIRE(analyzer.enabled(config));
    config.scan_headers = false;
    REQUIRE_FALSE(analyzer.enabled(config));
}
