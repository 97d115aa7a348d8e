/**
 * @file test_response_analyzer.cpp
 * @brief Unit tests for ResponseAnalyzer
 *
 * Tests response pattern analysis including:
 * - Database error banners (MySQL, PostgreSQL, SQL Server, Oracle, SQLite)
 * - Verbose error pages and directory listings
 * - Deserialization call sites
 * - Internal-service content returned to SSRF probes
 * - Plain-HTTP package registries
 * - Custom pattern files
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "core/response_analyzer.h"
#include "helpers/http_test_helpers.h"
#include <fstream>
#include <string>

TEST_CASE("ResponseAnalyzer construction", "[response_analyzer]") {
    ResponseAnalyzer analyzer;

    auto patterns = analyzer.get_patterns();
    REQUIRE(patterns.size() > 0);
}

TEST_CASE("MySQL error detection", "[response_analyzer][sql]") {
    ResponseAnalyzer analyzer;

    std::string response = "You have an error in your SQL syntax; check the manual that corresponds to "
                           "your MySQL server version for the right syntax to use near '' at line 1";

    AnalysisResult result = analyzer.analyze(response);

    REQUIRE(result.has_sql_error);
    REQUIRE(result.detected_db_type == DatabaseType::MYSQL);

    auto sql = result.matches_of(PatternType::SQL_ERROR);
    REQUIRE(sql.size() >= 2);
    REQUIRE(sql[0].pattern_name == "sql_syntax");
    REQUIRE(sql[0].evidence == "SQL syntax");
    REQUIRE(sql[0].confidence == Approx(0.9));
}

TEST_CASE("Other database banners", "[response_analyzer][sql]") {
    ResponseAnalyzer analyzer;

    SECTION("PostgreSQL") {
        auto result = analyzer.analyze("PostgreSQL query failed: ERROR:  unterminated quoted string");
        REQUIRE(result.has_sql_error);
        REQUIRE(result.detected_db_type == DatabaseType::POSTGRESQL);
    }

    SECTION("SQL Server") {
        auto result = analyzer.analyze("Unclosed quotation mark after the character string 'abc'.");
        REQUIRE(result.has_sql_error);
        REQUIRE(result.detected_db_type == DatabaseType::SQL_SERVER);
    }

    SECTION("Oracle") {
        auto result = analyzer.analyze("ORA-01756: quoted string not properly terminated");
        REQUIRE(result.has_sql_error);
        REQUIRE(result.detected_db_type == DatabaseType::ORACLE);
    }

    SECTION("SQLite") {
        auto result = analyzer.analyze("System.Data.SQLite.SQLiteException: near \"'\": syntax error");
        REQUIRE(result.has_sql_error);
        REQUIRE(result.detected_db_type == DatabaseType::SQLITE);
    }

    SECTION("Literal matching ignores case") {
        auto result = analyzer.analyze("you have an error in your sql syntax");
        REQUIRE(result.has_sql_error);
        REQUIRE(result.matches_of(PatternType::SQL_ERROR)[0].evidence == "sql syntax");
    }
}

TEST_CASE("Clean pages have no indicators", "[response_analyzer]") {
    ResponseAnalyzer analyzer;

    auto result = analyzer.analyze("<html><body><h1>Welcome</h1><p>All good here.</p></body></html>");
    REQUIRE_FALSE(result.has_indicators());
    REQUIRE(result.summary == "No vulnerability indicators detected");

    auto empty = analyzer.analyze("");
    REQUIRE_FALSE(empty.has_indicators());
}

TEST_CASE("Verbose errors and directory listings", "[response_analyzer]") {
    ResponseAnalyzer analyzer;

    auto verbose = analyzer.analyze("<b>Fatal error</b>: Uncaught Exception thrown in /var/www/index.php");
    REQUIRE(verbose.has_verbose_error);
    REQUIRE_FALSE(verbose.has_sql_error);

    auto listing = analyzer.analyze("<html><head><title>Index of /uploads</title></head>"
                                    "<body><a href=\"/\">Parent Directory</a></body></html>");
    REQUIRE(listing.has_directory_listing);
    REQUIRE(listing.matches_of(PatternType::DIRECTORY_LISTING).size() == 2);
}

TEST_CASE("Deserialization and package sources", "[response_analyzer]") {
    ResponseAnalyzer analyzer;

    auto deser = analyzer.analyze("<script>var o = JSON.parse(data);</script>");
    REQUIRE(deser.has_deserialization);

    auto pkg = analyzer.analyze("registry=http://registry.npmjs.org/\n");
    REQUIRE(pkg.has_insecure_package_source);
    REQUIRE(pkg.matches_of(PatternType::INSECURE_PACKAGE_SOURCE)[0].pattern_name == "npm_http");

    auto secure = analyzer.analyze("registry=https://registry.npmjs.org/\n");
    REQUIRE_FALSE(secure.has_insecure_package_source);
}

TEST_CASE("SSRF indicators", "[response_analyzer][ssrf]") {
    ResponseAnalyzer analyzer;

    auto meta = analyzer.analyze("ami-id\nami-launch-index\nhostname\ninstance-id", PatternType::SSRF_INDICATOR);
    REQUIRE(meta.has_ssrf_indicator);
    auto matches = meta.matches_of(PatternType::SSRF_INDICATOR);
    REQUIRE(matches[0].pattern_name == "aws_instance_metadata");
    REQUIRE(matches[0].confidence == Approx(0.95));

    SECTION("Filtering by type excludes other categories") {
        auto only_ssrf = analyzer.analyze("You have an error in your SQL syntax", PatternType::SSRF_INDICATOR);
        REQUIRE_FALSE(only_ssrf.has_sql_error);
    }
}

TEST_CASE("Summary lists every category found", "[response_analyzer]") {
    ResponseAnalyzer analyzer;
    auto result = analyzer.analyze("ORA-00933: SQL command not properly ended. Stack trace follows");
    REQUIRE(result.summary.find("SQL error (Oracle)") != std::string::npos);
    REQUIRE(result.summary.find("verbose error") != std::string::npos);
}

TEST_CASE("Custom patterns", "[response_analyzer][config]") {
    SECTION("add_pattern rejects a broken regex") {
        ResponseAnalyzer analyzer;
        size_t before = analyzer.get_patterns().size();

        PatternConfig bad;
        bad.name = "bad";
        bad.regex_pattern = "([unclosed";
        REQUIRE_FALSE(analyzer.add_pattern(bad));
        REQUIRE(analyzer.get_patterns().size() == before);

        PatternConfig good;
        good.name = "acme_error";
        good.type = PatternType::VERBOSE_ERROR;
        good.regex_pattern = "ACME-\\d{4}";
        REQUIRE(analyzer.add_pattern(good));
        REQUIRE(analyzer.analyze("failure acme-1234").has_verbose_error);
    }

    SECTION("load_patterns reads a pattern file") {
        std::string dir = test_helpers::make_temp_dir("patterns");
        std::string path = dir + "/patterns.json";
        {
            std::ofstream out(path);
            out << R"({"patterns": [
                {"name": "cockroach", "type": "sql_error", "regex": "CockroachDB", "literal": true,
                 "database_type": "postgresql", "confidence": 0.7},
                {"name": "mystery", "type": "not_a_type", "regex": "x"},
                {"name": "empty", "type": "sql_error", "regex": ""}
            ]})";
        }

        ResponseAnalyzer analyzer;
        size_t before = analyzer.get_patterns().size();
        REQUIRE(analyzer.load_patterns(path));
        REQUIRE(analyzer.get_patterns().size() == before + 1);

        auto result = analyzer.analyze("pq: cockroachdb rejected the statement");
        REQUIRE(result.has_sql_error);
        REQUIRE(result.detected_db_type == DatabaseType::POSTGRESQL);
    }

    SECTION("Missing and malformed files are reported") {
        ResponseAnalyzer analyzer;
        REQUIRE_FALSE(analyzer.load_patterns("/nonexistent/patterns.json"));

        std::string dir = test_helpers::make_temp_dir("patterns_bad");
        std::string path = dir + "/broken.json";
        {
            std::ofstream out(path);
            out << "{ not json";
        }
        REQUIRE_FALSE(analyzer.load_patterns(path));
    }
}

TEST_CASE("Large bodies are truncated before matching", "[response_analyzer]") {
    ResponseAnalyzer analyzer;
    std::string body(ResponseAnalyzer::kMaxBodyBytes, 'a');
    body += "You have an error in your SQL syntax";
    REQUIRE_FALSE(analyzer.analyze(body).has_sql_error);
}
