/**
 * @file findings.cpp
 * @brief Finding construction, validation and serialization
 */

#include "findings.h"
#include "url_utils.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <vector>

using json = nlohmann::json;

std::string local_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.';
    ss << std::setw(6) << std::setfill('0') << us.count();
    return ss.str();
}

Finding make_finding(const std::string& type, const std::string& url, json details) {
    Finding f;
    f.type = type;
    f.url = url;
    f.timestamp = local_timestamp();
    f.file = file_from_url(url);
    f.details = details.is_object() ? std::move(details) : json::object();
    return f;
}

json finding_details(const std::string& severity,
                     const std::string& description,
                     const std::string& recommendation,
                     const std::string& consequences) {
    return json{
        {"severity", severity},
        {"description", description},
        {"recommendation", recommendation},
        {"consequences", consequences},
    };
}

/// Required detail keys per finding type, matched by exact type or prefix.
static std::vector<std::string> required_keys_for(const std::string& type) {
    static const std::map<std::string, std::vector<std::string>> exact = {
        {"crypto_failure_insecure_cookies", {"insecure_cookies"}},
        {"crypto_failure_outdated_tls", {"tls_version"}},
        {"vulnerable_component", {"library", "version", "script_url", "cve"}},
        {"broken_access_control", {"status_code", "access_granted"}},
        {"auth_failure_default_login_page", {"admin_url"}},
        {"integrity_failure_missing_sri", {"script_url"}},
        {"integrity_failure_insecure_script", {"script_url"}},
        {"integrity_failure_insecure_package_source", {"source_url"}},
        {"ssrf_url_parameter", {"parameter", "payload", "original_value"}},
        {"ssrf_form_input", {"form_action", "form_method", "input_name", "payload"}},
        {"ssrf_api_endpoint", {"endpoint", "payload", "method", "content_type"}},
        {"sql_injection", {"payload", "method", "detection_method"}},
        {"xss", {"payload", "reflection_type", "contexts"}},
        {"reflected_xss", {"payload", "reflection_type", "contexts"}},
    };
    auto it = exact.find(type);
    if (it != exact.end()) return it->second;
    if (type.rfind("missing_", 0) == 0) return {"header_name", "header_description"};
    if (type.rfind("insecure_design_", 0) == 0) return {"form_action", "form_method"};
    return {};
}

bool has_required_details(const Finding& finding) {
    if (!finding.details.is_object()) return false;
    for (const char* key : {"severity", "description", "recommendation", "consequences"}) {
        if (!finding.details.contains(key)) return false;
    }
    for (const auto& key : required_keys_for(finding.type)) {
        if (!finding.details.contains(key)) return false;
    }
    return true;
}

std::string finding_key(const Finding& finding) {
    return finding.type + "\n" + finding.url + "\n" + finding.details.dump();
}

json to_json(const Finding& finding) {
    return json{
        {"type", finding.type},
        {"url", finding.url},
        {"timestamp", finding.timestamp},
        {"details", finding.details},
        {"file", finding.file},
    };
}
