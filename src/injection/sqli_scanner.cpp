/**
 * @file sqli_scanner.cpp
 * @brief SQL injection probing with baseline comparison
 */

#include "sqli_scanner.h"
#include <core/findings.h>
#include <core/response_analyzer.h>
#include <core/url_utils.h>

using json = nlohmann::json;

namespace {

using Fields = std::vector<std::pair<std::string, std::string>>;

// Helper function
bool is_skipped_input(const FormInput& input) {
    return input.name.empty() || input.type == "submit" || input.type == "button" ||
           input.type == "image" || input.type == "reset";
}

Fields baseline_fields(const Form& form) {
    Fields fields;
    for (const auto& input : form.inputs) {
        if (is_skipped_input(input)) continue;
        fields.emplace_back(input.name, input.value.empty() ? "test" : input.value);
    }
    return fields;
}

json sqli_details(const SqlPayload& payload, const std::string& method, const std::string& detection) {
    auto details = finding_details("High",
                                   "SQL injection vulnerability detected",
                                   "Use parameterized queries and input validation",
                                   "Without proper input validation, attackers could inject malicious SQL "
                                   "commands that might access, modify, or delete data in your database. This "
                                   "could lead to unauthorized access, data theft, data loss, or complete system "
                                   "compromise.");
    details["payload"] = payload.payload;
    details["payload_name"] = payload.name;
    details["method"] = method;
    details["detection_method"] = detection;
    return details;
}

} // namespace

SqlInjectionScanner::SqlInjectionScanner(const HttpClient& client,
                                         const PayloadStore& payloads,
                                         logging::EventObserver& events,
                                         const Options& opts)
    : client_(client),
      payloads_(payloads),
      events_(events),
      opts_(opts),
      comparator_([&opts] {
          BaselineComparator::Options c;
          c.length_threshold = opts.length_threshold;
          c.timing_threshold = opts.time_threshold;
          c.check_similarity = false;
          return c;
      }()) {}

bool SqlInjectionScanner::is_vulnerable_to_sql_injection(const HttpResponse& resp, const std::string& payload) {
    auto result = ResponseAnalyzer::shared().analyze(resp.body, PatternType::SQL_ERROR);
    for (const auto& match : result.matches) {
        if (payload.find(match.evidence) == std::string::npos) return true;
    }
    return false;
}

std::string SqlInjectionScanner::detect(const HttpResponse& baseline, const HttpResponse& test,
                                        const SqlPayload& payload) const {
    auto cmp = comparator_.compare(baseline, test);

    bool error_signal = is_vulnerable_to_sql_injection(test, payload.payload);
    if (opts_.baseline_subtraction) error_signal = error_signal && cmp.has_new_errors;
    if (error_signal) return "Error based";

    if (!payload.expected_result.empty() && test.body.find(payload.expected_result) != std::string::npos) {
        if (!opts_.baseline_subtraction || baseline.body.find(payload.expected_result) == std::string::npos) {
            return "Result based";
        }
    }
    if (cmp.length_changed) return "Length based";
    if (cmp.timing_anomaly) return "Time based";
    return {};
}

std::vector<Finding> SqlInjectionScanner::scan_form(const Form& form, const std::string& page_url) const {
    std::vector<Finding> findings;
    Fields defaults = baseline_fields(form);
    if (defaults.empty()) return findings;

    HttpResponse baseline;
    if (!client_.send_form(form.method, form.action, defaults, baseline)) {
        events_.debug("sqli", "Error getting baseline response for " + form.action + ": " + baseline.error);
        return findings;
    }

    for (size_t i = 0; i < defaults.size(); ++i) {
        const std::string& field = defaults[i].first;
        for (const auto& payload : payloads_.sql_payloads()) {
            if (client_.cancelled()) return findings;

            Fields fields = defaults;
            fields[i].second = payload.payload;

            HttpResponse resp;
            if (!client_.send_form(form.method, form.action, fields, resp)) {
                events_.debug("sqli", "Error testing SQL injection in " + field + ": " + resp.error);
                client_.pause(opts_.payload_delay);
                continue;
            }

            std::string detection = detect(baseline, resp, payload);
            if (!detection.empty()) {
                auto details = sqli_details(payload, form.method, detection);
                details["input_field"] = field;
                details["form_action"] = form.action;
                findings.push_back(make_finding("sql_injection", page_url, std::move(details)));
                events_.debug("sqli", "SQL injection (" + detection + ") in field " + field + " of " + form.action);
                break;
            }
            client_.pause(opts_.payload_delay);
        }
    }
    return findings;
}

std::vector<Finding> SqlInjectionScanner::scan_url_parameters(const CrawlResult& page) const {
    std::vector<Finding> findings;
    auto params = parse_query(page.url);
    if (params.empty()) return findings;

    HttpResponse baseline;
    baseline.status = page.status;
    baseline.headers = page.headers;
    baseline.body = page.body;
    baseline.total_time = page.elapsed;

    for (const auto& param : params) {
        for (const auto& payload : payloads_.sql_payloads()) {
            if (client_.cancelled()) return findings;

            std::string test_url = set_query_param(page.url, param.first, payload.payload);
            HttpResponse resp;
            if (!client_.get(test_url, resp)) {
                events_.debug("sqli", "Error testing GET parameter " + param.first + ": " + resp.error);
                client_.pause(opts_.payload_delay);
                continue;
            }

            std::string detection = detect(baseline, resp, payload);
            if (!detection.empty()) {
                auto details = sqli_details(payload, "get", detection);
                details["parameter"] = param.first;
                findings.push_back(make_finding("sql_injection", page.url, std::move(details)));
                events_.debug("sqli", "SQL injection (" + detection + ") in parameter " + param.first);
                break;
            }
            client_.pause(opts_.payload_delay);
        }
    }
    return findings;
}
