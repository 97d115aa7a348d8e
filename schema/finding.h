#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @file finding.h
 * @brief Data structure representing a security finding
 *
 * A finding has a fixed envelope (type, url, timestamp, file) and a
 * type-specific `details` object. Every `details` object carries
 * `severity`, `description`, `recommendation` and `consequences`; the
 * remaining required keys depend on `type`:
 *
 *   missing_*                          header_name, header_description
 *   crypto_failure_insecure_cookies    insecure_cookies
 *   crypto_failure_outdated_tls        tls_version
 *   vulnerable_component               library, version, script_url, cve
 *   broken_access_control              status_code, access_granted
 *   insecure_design_*                  form_action, form_method
 *   auth_failure_*                     form_action (default_login_page: admin_url)
 *   integrity_failure_missing_sri      script_url
 *   integrity_failure_insecure_script  script_url
 *   integrity_failure_insecure_package_source  source_url
 *   ssrf_url_parameter                 parameter, payload, original_value
 *   ssrf_form_input                    form_action, form_method, input_name, payload
 *   ssrf_api_endpoint                  endpoint, payload, method, content_type
 *   sql_injection                      payload, method, detection_method
 *   xss, reflected_xss                 payload, reflection_type, contexts
 */

/**
 * One reported vulnerability instance. Never mutated after it is recorded.
 */
struct Finding {
    std::string type;
    std::string url;
    std::string timestamp;   // "YYYY-MM-DD HH:MM:SS", local time
    std::string file;        // basename of the URL path
    nlohmann::json details = nlohmann::json::object();
};
