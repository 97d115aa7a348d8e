// Scan configuration loading

#include "scan_config.h"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace {

void warn_invalid(const std::string& name) {
    std::cerr << "Warning: Invalid value for " << name << "\n";
}

const char* env_value(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

bool parse_bool(std::string text, bool& out) {
    std::transform(text.begin(), text.end(), text.begin(), ::tolower);
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        out = true;
        return true;
    }
    if (text == "0" || text == "false" || text == "no" || text == "off") {
        out = false;
        return true;
    }
    return false;
}

void env_int(const char* name, int& field) {
    const char* v = env_value(name);
    if (!v) return;
    try {
        size_t used = 0;
        int parsed = std::stoi(v, &used);
        if (used != std::string(v).size()) throw std::invalid_argument(name);
        field = parsed;
    } catch (const std::exception&) {
        warn_invalid(name);
    }
}

void env_double(const char* name, double& field) {
    const char* v = env_value(name);
    if (!v) return;
    try {
        size_t used = 0;
        double parsed = std::stod(v, &used);
        if (used != std::string(v).size()) throw std::invalid_argument(name);
        field = parsed;
    } catch (const std::exception&) {
        warn_invalid(name);
    }
}

void env_bool(const char* name, bool& field) {
    const char* v = env_value(name);
    if (!v) return;
    if (!parse_bool(v, field)) warn_invalid(name);
}

void env_string(const char* name, std::string& field) {
    const char* v = env_value(name);
    if (v) field = v;
}

// Helpers that read one JSON key with a type check

void read_key(const json& j, const char* key, int& field, int& rejected) {
    if (!j.contains(key)) return;
    if (j[key].is_number_integer()) field = j[key].get<int>();
    else { warn_invalid(key); rejected++; }
}

void read_key(const json& j, const char* key, double& field, int& rejected) {
    if (!j.contains(key)) return;
    if (j[key].is_number()) field = j[key].get<double>();
    else { warn_invalid(key); rejected++; }
}

void read_key(const json& j, const char* key, bool& field, int& rejected) {
    if (!j.contains(key)) return;
    if (j[key].is_boolean()) field = j[key].get<bool>();
    else { warn_invalid(key); rejected++; }
}

void read_key(const json& j, const char* key, std::string& field, int& rejected) {
    if (!j.contains(key)) return;
    if (j[key].is_string()) field = j[key].get<std::string>();
    else { warn_invalid(key); rejected++; }
}

void read_key(const json& j, const char* key, std::vector<std::string>& field, int& rejected) {
    if (!j.contains(key)) return;
    const json& v = j[key];
    bool ok = v.is_array() && std::all_of(v.begin(), v.end(), [](const json& e) { return e.is_string(); });
    if (ok) field = v.get<std::vector<std::string>>();
    else { warn_invalid(key); rejected++; }
}

void read_key(const json& j, const char* key, std::map<std::string, std::string>& field, int& rejected) {
    if (!j.contains(key)) return;
    const json& v = j[key];
    bool ok = v.is_object();
    if (ok) {
        for (auto it = v.begin(); it != v.end(); ++it) {
            if (!it.value().is_string()) ok = false;
        }
    }
    if (ok) field = v.get<std::map<std::string, std::string>>();
    else { warn_invalid(key); rejected++; }
}

} // namespace

ScanConfig ScanConfig::load(const std::string& path) {
    ScanConfig cfg;
    cfg.apply_env();

    if (path.empty()) return cfg;

    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "Warning: Could not open config file " << path << ", using defaults\n";
        return cfg;
    }
    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            std::cerr << "Warning: Config file " << path << " is not a JSON object, using defaults\n";
            return cfg;
        }
        cfg.apply_json(j);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Could not parse config file " << path << ": " << e.what() << "\n";
    }
    return cfg;
}

void ScanConfig::apply_env() {
    env_int("SCANNER_MAX_DEPTH", max_depth);
    env_int("SCANNER_MAX_PAGES", max_pages);
    env_int("SCANNER_TIMEOUT", request_timeout);
    env_string("SCANNER_USER_AGENT", user_agent);
    env_bool("SCANNER_FOLLOW_REDIRECTS", follow_redirects);
    env_bool("SCANNER_VERIFY_SSL", verify_ssl);
    env_int("SCANNER_THREADS", threads);
    env_double("SCANNER_DELAY", scan_delay);
    env_int("SCANNER_MAX_RETRIES", max_retries);
    env_string("SCANNER_OUTPUT_DIR", output_dir);
    env_string("SCANNER_LOG_FILE", log_file);
    env_string("SCANNER_AUDIT_LOG", audit_log);
    env_bool("SCANNER_USE_PROXY", use_proxy);
    env_string("SCANNER_PROXY_URL", proxy_url);
    env_double("SCANNER_RATE_LIMIT", rate_limit);
    env_string("SCANNER_RESULTS_URL", results_store_url);
    env_string("SCANNER_RESULTS_TOKEN", results_store_token);
}

int ScanConfig::apply_json(const json& j) {
    int rejected = 0;
    read_key(j, "max_depth", max_depth, rejected);
    read_key(j, "max_pages", max_pages, rejected);
    read_key(j, "threads", threads, rejected);
    read_key(j, "max_retries", max_retries, rejected);
    read_key(j, "scan_delay", scan_delay, rejected);
    read_key(j, "rate_limit", rate_limit, rejected);
    read_key(j, "excluded_paths", excluded_paths, rejected);

    read_key(j, "request_timeout", request_timeout, rejected);
    read_key(j, "user_agent", user_agent, rejected);
    read_key(j, "follow_redirects", follow_redirects, rejected);
    read_key(j, "verify_ssl", verify_ssl, rejected);
    read_key(j, "use_proxy", use_proxy, rejected);
    read_key(j, "proxy_url", proxy_url, rejected);
    read_key(j, "custom_headers", custom_headers, rejected);

    read_key(j, "output_dir", output_dir, rejected);
    read_key(j, "log_file", log_file, rejected);
    read_key(j, "audit_log", audit_log, rejected);
    read_key(j, "results_store_url", results_store_url, rejected);
    read_key(j, "results_store_token", results_store_token, rejected);

    read_key(j, "scan_forms", scan_forms, rejected);
    read_key(j, "scan_links", scan_links, rejected);
    read_key(j, "scan_headers", scan_headers, rejected);
    read_key(j, "scan_cookies", scan_cookies, rejected);
    read_key(j, "scan_xss", scan_xss, rejected);
    read_key(j, "scan_sqli", scan_sqli, rejected);

    read_key(j, "scan_broken_access", scan_broken_access, rejected);
    read_key(j, "scan_crypto_failures", scan_crypto_failures, rejected);
    read_key(j, "scan_insecure_design", scan_insecure_design, rejected);
    read_key(j, "scan_security_misconfigurations", scan_security_misconfigurations, rejected);
    read_key(j, "scan_vulnerable_components", scan_vulnerable_components, rejected);
    read_key(j, "scan_auth_failures", scan_auth_failures, rejected);
    read_key(j, "scan_integrity_failures", scan_integrity_failures, rejected);
    read_key(j, "scan_logging_monitoring", scan_logging_monitoring, rejected);
    read_key(j, "scan_ssrf", scan_ssrf, rejected);

    read_key(j, "sql_payloads", sql_payloads, rejected);
    read_key(j, "xss_payloads", xss_payloads, rejected);
    read_key(j, "sql_payloads_file", sql_payloads_file, rejected);
    read_key(j, "xss_payloads_file", xss_payloads_file, rejected);
    read_key(j, "vulnerable_libraries_file", vulnerable_libraries_file, rejected);

    read_key(j, "sqli_length_threshold", sqli_length_threshold, rejected);
    read_key(j, "sqli_time_threshold", sqli_time_threshold, rejected);
    read_key(j, "sqli_baseline_subtraction", sqli_baseline_subtraction, rejected);
    read_key(j, "payload_delay", payload_delay, rejected);
    read_key(j, "access_control_strict", access_control_strict, rejected);

    read_key(j, "probe_rate_limiting", probe_rate_limiting, rejected);
    read_key(j, "probe_brute_force", probe_brute_force, rejected);
    read_key(j, "probe_login_monitoring", probe_login_monitoring, rejected);
    read_key(j, "probe_activity_burst", probe_activity_burst, rejected);
    read_key(j, "probe_ssrf", probe_ssrf, rejected);
    read_key(j, "probe_delay", probe_delay, rejected);
    read_key(j, "max_probe_targets", max_probe_targets, rejected);
    return rejected;
}

json ScanConfig::to_json() const {
    json j;
    j["max_depth"] = max_depth;
    j["max_pages"] = max_pages;
    j["threads"] = threads;
    j["max_retries"] = max_retries;
    j["scan_delay"] = scan_delay;
    j["rate_limit"] = rate_limit;
    j["excluded_paths"] = excluded_paths;

    j["request_timeout"] = request_timeout;
    j["user_agent"] = user_agent;
    j["follow_redirects"] = follow_redirects;
    j["verify_ssl"] = verify_ssl;
    j["use_proxy"] = use_proxy;
    j["proxy_url"] = proxy_url;
    j["custom_headers"] = custom_headers;

    j["output_dir"] = output_dir;
    j["log_file"] = log_file;
    j["audit_log"] = audit_log_path();
    j["results_store_url"] = results_store_url;
    // The token is a credential and stays out of reports

    j["scan_forms"] = scan_forms;
    j["scan_links"] = scan_links;
    j["scan_headers"] = scan_headers;
    j["scan_cookies"] = scan_cookies;
    j["scan_xss"] = scan_xss;
    j["scan_sqli"] = scan_sqli;

    j["scan_broken_access"] = scan_broken_access;
    j["scan_crypto_failures"] = scan_crypto_failures;
    j["scan_insecure_design"] = scan_insecure_design;
    j["scan_security_misconfigurations"] = scan_security_misconfigurations;
    j["scan_vulnerable_components"] = scan_vulnerable_components;
    j["scan_auth_failures"] = scan_auth_failures;
    j["scan_integrity_failures"] = scan_integrity_failures;
    j["scan_logging_monitoring"] = scan_logging_monitoring;
    j["scan_ssrf"] = scan_ssrf;

    j["sql_payloads"] = sql_payloads;
    j["xss_payloads"] = xss_payloads;
    j["sql_payloads_file"] = sql_payloads_file;
    j["xss_payloads_file"] = xss_payloads_file;
    j["vulnerable_libraries_file"] = vulnerable_libraries_file;

    j["sqli_length_threshold"] = sqli_length_threshold;
    j["sqli_time_threshold"] = sqli_time_threshold;
    j["sqli_baseline_subtraction"] = sqli_baseline_subtraction;
    j["payload_delay"] = payload_delay;
    j["access_control_strict"] = access_control_strict;

    j["probe_rate_limiting"] = probe_rate_limiting;
    j["probe_brute_force"] = probe_brute_force;
    j["probe_login_monitoring"] = probe_login_monitoring;
    j["probe_activity_burst"] = probe_activity_burst;
    j["probe_ssrf"] = probe_ssrf;
    j["probe_delay"] = probe_delay;
    j["max_probe_targets"] = max_probe_targets;
    return j;
}

HttpClient::Options ScanConfig::client_options() const {
    HttpClient::Options opts;
    opts.timeout_seconds = request_timeout > 0 ? request_timeout : 30;
    opts.connect_timeout_seconds = std::min<long>(10, opts.timeout_seconds);
    opts.follow_redirects = follow_redirects;
    opts.user_agent = user_agent;
    opts.verify_ssl = verify_ssl;
    opts.use_proxy = use_proxy;
    opts.proxy_url = proxy_url;
    opts.default_headers = custom_headers;
    return opts;
}

std::string ScanConfig::audit_log_path() const {
    return audit_log.empty() ? output_dir + "/audit_chain.jsonl" : audit_log;
}
