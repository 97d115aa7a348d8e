/**
 * @file test_baseline_comparator.cpp
 * @brief Unit tests for BaselineComparator
 *
 * Tests baseline comparison including:
 * - Status code change detection
 * - Response length change detection
 * - Content similarity calculation
 * - New database error detection
 * - Timing anomaly detection
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "core/baseline_comparator.h"
#include "core/http_client.h"
#include <string>

namespace {

HttpResponse make_response(long status, const std::string& body, double seconds = 0.1) {
    HttpResponse resp;
    resp.status = status;
    resp.body = body;
    resp.total_time = seconds;
    return resp;
}

} // namespace

TEST_CASE("Status code change detection", "[baseline_comparator][status]") {
    BaselineComparator comparator;

    ComparisonResult result = comparator.compare(make_response(200, "Normal response"),
                                                 make_response(500, "Internal Server Error"));
    REQUIRE(result.status_changed);
    REQUIRE(result.baseline_status == 200);
    REQUIRE(result.test_status == 500);

    ComparisonResult same = comparator.compare(make_response(200, "a"), make_response(200, "a"));
    REQUIRE_FALSE(same.status_changed);
}

TEST_CASE("Response length change detection", "[baseline_comparator][length]") {
    BaselineComparator comparator;

    std::string small = "short body";
    std::string large = small + std::string(200, 'x');

    auto grown = comparator.compare(make_response(200, small), make_response(200, large));
    REQUIRE(grown.length_changed);
    REQUIRE(grown.length_difference == 200);

    auto shrunk = comparator.compare(make_response(200, large), make_response(200, small));
    REQUIRE(shrunk.length_changed);
    REQUIRE(shrunk.length_difference == -200);

    auto minor = comparator.compare(make_response(200, small), make_response(200, small + "12345"));
    REQUIRE_FALSE(minor.length_changed);

    SECTION("Custom threshold") {
        BaselineComparator::Options opts;
        opts.length_threshold = 3;
        BaselineComparator strict(opts);
        REQUIRE(strict.compare(make_response(200, small), make_response(200, small + "12345")).length_changed);
    }
}

TEST_CASE("Jaccard similarity", "[baseline_comparator][similarity]") {
    REQUIRE(BaselineComparator::calculate_jaccard_similarity("", "") == Approx(1.0));
    REQUIRE(BaselineComparator::calculate_jaccard_similarity("a b", "") == Approx(0.0));
    REQUIRE(BaselineComparator::calculate_jaccard_similarity("Hello World", "hello world") == Approx(1.0));
    REQUIRE(BaselineComparator::calculate_jaccard_similarity("a b c", "a b d") == Approx(0.5));
    REQUIRE(BaselineComparator::calculate_jaccard_similarity("a b", "c d") == Approx(0.0));

    SECTION("Disabled similarity keeps the default score") {
        BaselineComparator::Options opts;
        opts.check_similarity = false;
        BaselineComparator comparator(opts);
        REQUIRE(comparator.compare(make_response(200, "a"), make_response(200, "b")).similarity_score == Approx(1.0));
    }
}

TEST_CASE("New database errors", "[baseline_comparator][errors]") {
    BaselineComparator comparator;

    SECTION("Error only in the test response") {
        auto result = comparator.compare(make_response(200, "<p>Welcome</p>"),
                                         make_response(200, "You have an error in your SQL syntax"));
        REQUIRE(result.has_new_errors);
        REQUIRE(result.new_errors.front() == "SQL syntax");
    }

    SECTION("Error already present in the baseline") {
        auto result = comparator.compare(make_response(200, "Warning: mysql_query failed"),
                                         make_response(200, "Warning: mysql_query failed again"));
        REQUIRE_FALSE(result.has_new_errors);
    }
}

TEST_CASE("Timing anomaly detection", "[baseline_comparator][timing]") {
    BaselineComparator comparator;

    auto slow = comparator.compare(make_response(200, "x", 0.1), make_response(200, "x", 3.5));
    REQUIRE(slow.timing_anomaly);
    REQUIRE(slow.baseline_time == Approx(0.1));
    REQUIRE(slow.test_time == Approx(3.5));

    auto fast = comparator.compare(make_response(200, "x", 0.1), make_response(200, "x", 0.4));
    REQUIRE_FALSE(fast.timing_anomaly);
}
