/**
 * @file test_scan_stats.cpp
 * @brief Unit tests for findings and the statistics aggregator
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "core/findings.h"
#include "core/scan_stats.h"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace {

Finding header_finding(const std::string& url, const std::string& header) {
    json details = finding_details("Medium", "Missing " + header, "Add it", "Bad things");
    details["header_name"] = header;
    details["header_description"] = "A header";
    return make_finding("missing_" + header, url, details);
}

} // namespace

TEST_CASE("Finding construction", "[findings]") {
    Finding f = header_finding("http://site.test/dir/page.php?x=1", "csp");
    REQUIRE(f.type == "missing_csp");
    REQUIRE(f.file == "page.php");
    REQUIRE(f.timestamp.size() == 19);
    REQUIRE(f.timestamp[10] == ' ');
    REQUIRE(has_required_details(f));

    SECTION("Missing type-specific keys are detected") {
        Finding bad = make_finding("sql_injection", "http://site.test/",
                                   finding_details("High", "d", "r", "c"));
        REQUIRE_FALSE(has_required_details(bad));
        bad.details["payload"] = "'";
        bad.details["method"] = "GET";
        bad.details["detection_method"] = "error_based";
        REQUIRE(has_required_details(bad));
    }

    SECTION("Serialization carries the envelope") {
        json j = to_json(f);
        REQUIRE(j["type"] == "missing_csp");
        REQUIRE(j["file"] == "page.php");
        REQUIRE(j["details"]["severity"] == "Medium");
    }

    SECTION("Timestamp formats") {
        std::string iso = iso_timestamp();
        REQUIRE(iso.size() == 26);
        REQUIRE(iso[10] == 'T');
        REQUIRE(iso[19] == '.');
    }
}

TEST_CASE("Aggregator accumulates updates", "[stats]") {
    StatsAggregator stats;
    stats.reset("scan_1", "http://site.test/");

    stats.record_url("http://site.test/");
    stats.record_url("http://site.test/about");
    stats.record_link({"http://site.test/", "http://site.test/about", local_timestamp()});
    stats.record_form({"http://site.test/", Form{"http://site.test/login", "post", {}}, local_timestamp()});
    stats.record_error("client_error");
    stats.record_error("client_error");
    stats.record_response(200, 0.2);
    stats.record_response(404, 0.05);
    stats.record_response(200, 0.5);
    stats.flush();

    ScanStats s = stats.snapshot();
    REQUIRE(s.scan_id == "scan_1");
    REQUIRE(s.scanned_urls.size() == 2);
    REQUIRE(s.scanned_links.size() == 1);
    REQUIRE(s.scanned_forms.size() == 1);
    REQUIRE(s.errors_by_type.at("client_error") == 2);
    REQUIRE(s.total_requests == 3);
    REQUIRE(s.response_codes.at(200) == 2);
    REQUIRE(s.min_response_time == Approx(0.05));
    REQUIRE(s.max_response_time == Approx(0.5));
    REQUIRE(s.avg_response_time() == Approx(0.25));
    REQUIRE(s.end_time.empty());
}

TEST_CASE("Duplicate findings are recorded once", "[stats][findings]") {
    StatsAggregator stats;
    stats.reset("scan_2", "http://site.test/");

    std::atomic<int> notified{0};
    stats.set_finding_callback([&](const Finding&) { notified++; });

    stats.record_finding(header_finding("http://site.test/", "csp"));
    stats.record_finding(header_finding("http://site.test/", "csp"));
    stats.record_finding(header_finding("http://site.test/other", "csp"));
    stats.record_finding(header_finding("http://site.test/", "hsts"));
    stats.flush();

    ScanStats s = stats.snapshot();
    REQUIRE(s.findings.size() == 3);
    REQUIRE(s.vulnerabilities_by_type.at("missing_csp") == 2);
    REQUIRE(s.vulnerabilities_by_type.at("missing_hsts") == 1);
    REQUIRE(notified == 3);
}

TEST_CASE("Concurrent writers lose no updates", "[stats][threads]") {
    StatsAggregator stats;
    stats.reset("scan_3", "http://site.test/");

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; t++) {
        workers.emplace_back([&stats, t] {
            for (int i = 0; i < 250; i++) {
                stats.record_url("http://site.test/" + std::to_string(t) + "/" + std::to_string(i));
                stats.record_response(200, 0.01);
            }
        });
    }
    for (auto& w : workers) w.join();
    stats.flush();

    ScanStats s = stats.snapshot();
    REQUIRE(s.scanned_urls.size() == 1000);
    REQUIRE(s.total_requests == 1000);
}

TEST_CASE("Completion and summary document", "[stats][report]") {
    StatsAggregator stats;
    stats.reset("scan_4", "http://site.test/");
    stats.record_url("http://site.test/");
    stats.record_finding(header_finding("http://site.test/", "csp"));
    stats.complete();
    stats.flush();

    ScanStats s = stats.snapshot();
    REQUIRE_FALSE(s.end_time.empty());
    REQUIRE(s.duration >= 0.0);

    json summary = s.summary();
    REQUIRE(summary["scan_info"]["scan_id"] == "scan_4");
    REQUIRE(summary["scan_info"]["target_url"] == "http://site.test/");
    REQUIRE(summary["scan_info"]["total_urls_scanned"] == 1);
    REQUIRE(summary["scan_info"]["total_vulnerabilities"] == 1);
    REQUIRE(summary["vulnerabilities_by_type"]["missing_csp"] == 1);
    REQUIRE(summary["performance_metrics"]["min_response_time"] == 0.0);

    json bundle = s.bundle();
    REQUIRE(bundle["vulnerabilities"].size() == 1);
    REQUIRE(bundle["scanned_urls"][0] == "http://site.test/");
    REQUIRE(bundle["scanned_links"].is_array());
    REQUIRE(bundle["scanned_forms"].is_array());

    SECTION("Reset starts a fresh scan") {
        stats.reset("scan_5", "http://other.test/");
        ScanStats fresh = stats.snapshot();
        REQUIRE(fresh.scan_id == "scan_5");
        REQUIRE(fresh.findings.empty());
        REQUIRE(fresh.end_time.empty());

        // Keys from the previous scan no longer suppress findings
        stats.record_finding(header_finding("http://site.test/", "csp"));
        stats.flush();
        REQUIRE(stats.snapshot().findings.size() == 1);
    }
}
