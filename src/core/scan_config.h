#pragma once
#include "http_client.h"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Scan configuration.
// Built-in defaults, overridden by SCANNER_* environment variables, overridden
// by an optional JSON file whose keys equal the field names. Bad values are
// reported as warnings and the previous value is kept. The config is treated
// as immutable once a scan starts.

struct ScanConfig {
    // Crawl limits
    int max_depth = 3;
    int max_pages = 100;
    int threads = 4;
    int max_retries = 3;
    double scan_delay = 1.0;        // seconds between retries and between a worker's page fetches
    double rate_limit = 0.0;        // requests per second per worker, 0 = unlimited
    std::vector<std::string> excluded_paths;

    // Transport
    int request_timeout = 30;
    std::string user_agent = "warden/1.0";
    bool follow_redirects = true;
    bool verify_ssl = true;
    bool use_proxy = false;
    std::string proxy_url;
    std::map<std::string, std::string> custom_headers;

    // Output
    std::string output_dir = "scan_results";
    std::string log_file;
    std::string audit_log;          // empty = <output_dir>/audit_chain.jsonl
    std::string results_store_url;
    std::string results_store_token;

    // Per-page toggles
    bool scan_forms = true;
    bool scan_links = true;
    bool scan_headers = true;
    bool scan_cookies = true;
    bool scan_xss = true;
    bool scan_sqli = true;

    // Per-category toggles
    bool scan_broken_access = true;
    bool scan_crypto_failures = true;
    bool scan_insecure_design = true;
    bool scan_security_misconfigurations = true;
    bool scan_vulnerable_components = true;
    bool scan_auth_failures = true;
    bool scan_integrity_failures = true;
    bool scan_logging_monitoring = true;
    bool scan_ssrf = true;

    // Payloads
    std::vector<std::string> sql_payloads;
    std::vector<std::string> xss_payloads;
    std::string sql_payloads_file = "data/sqli_payloads.json";
    std::string xss_payloads_file = "data/xss_payloads.txt";
    std::string vulnerable_libraries_file = "data/vulnerable_libraries.json";

    // Detection policy
    int sqli_length_threshold = 100;
    double sqli_time_threshold = 2.0;
    bool sqli_baseline_subtraction = false;   // error/result signals must be absent from the baseline
    double payload_delay = 0.5;
    bool access_control_strict = true;

    // Active probes
    bool probe_rate_limiting = true;
    bool probe_brute_force = true;
    bool probe_login_monitoring = true;
    bool probe_activity_burst = true;
    bool probe_ssrf = true;
    double probe_delay = 1.0;
    int max_probe_targets = 10;

    /**
     * @brief Load configuration: defaults, then environment, then file
     * @param path JSON config file, may be empty or missing
     * @return Loaded configuration (never throws)
     */
    static ScanConfig load(const std::string& path = "");

    /**
     * @brief Override fields from SCANNER_* environment variables
     */
    void apply_env();

    /**
     * @brief Override fields from a JSON object
     * @return Number of keys that were rejected
     */
    int apply_json(const nlohmann::json& j);

    /**
     * @brief Serialize to the scan_config.json document
     */
    nlohmann::json to_json() const;

    /**
     * @brief Transport options for the shared HttpClient
     */
    HttpClient::Options client_options() const;

    /**
     * @brief Resolved audit log path
     */
    std::string audit_log_path() const;
};
