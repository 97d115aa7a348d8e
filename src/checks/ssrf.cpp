/**
 * @file ssrf.cpp
 * @brief SSRF probing of URL parameters, form inputs and API endpoints
 */

#include "ssrf.h"
#include <core/findings.h>
#include <core/response_analyzer.h>
#include <core/url_utils.h>
#include <set>

using json = nlohmann::json;

namespace {

const char* kRecommendation = "Implement URL validation and whitelist of allowed domains/IPs";
const char* kConsequences =
    "SSRF vulnerabilities can allow attackers to make requests to internal services, access sensitive "
    "data, or use the server as a proxy for attacks on other systems.";

constexpr long kProbeTimeout = 5;
constexpr size_t kMaxProbeUrlLength = 2000;

// Helper function
bool send_probe(const ScanContext& ctx, const std::string& method, const std::string& url,
                const std::string& body, const std::string& content_type, HttpResponse& resp) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    req.body = body;
    if (!content_type.empty()) req.headers["Content-Type"] = content_type;
    req.follow_redirects = false;
    req.timeout_seconds = kProbeTimeout;
    return ctx.client.perform(req, resp);
}

std::string with_query(const std::string& url, const std::string& query) {
    if (query.empty()) return url;
    std::string target = url;
    size_t hash = target.find('#');
    if (hash != std::string::npos) target.erase(hash);
    return target + (target.find('?') == std::string::npos ? "?" : "&") + query;
}

bool looks_like_url(const std::string& value) {
    return value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0 || value.rfind("//", 0) == 0;
}

bool is_api_path(const std::string& path) {
    std::string lower = to_lower_copy(path);
    for (const char* marker : {"/api", "/v1", "/v2", "/rest", "/graphql"}) {
        if (lower.find(marker) != std::string::npos) return true;
    }
    return false;
}

} // namespace

const std::vector<std::string>& SsrfAnalyzer::internal_targets() {
    static const std::vector<std::string> targets = {
        "127.0.0.1", "0.0.0.0", "10.0.0.1", "172.16.0.1", "192.168.0.1", "169.254.169.254",
        "localhost", "metadata.google.internal", "metadata", "instance-data", "[::1]",
    };
    return targets;
}

const std::vector<std::string>& SsrfAnalyzer::payload_templates() {
    static const std::vector<std::string> templates = {
        "http://{target}/",
        "https://{target}/",
        "http://{target}:22/",
        "http://{target}:3306/",
        "http://{target}:5432/",
        "http://{target}:6379/",
        "http://{target}:8080/",
        "http://{target}:8443/",
        "file:///etc/passwd",
        "dict://{target}:11211/",
        "ftp://{target}/",
    };
    return templates;
}

std::string SsrfAnalyzer::make_payload(const std::string& tmpl, const std::string& target) {
    std::string out = tmpl;
    const std::string key = "{target}";
    size_t pos = out.find(key);
    if (pos != std::string::npos) out.replace(pos, key.size(), target);
    return out;
}

bool SsrfAnalyzer::is_url_parameter(const std::string& name) {
    static const char* names[] = {
        "url", "uri", "link", "src", "source", "redirect", "redirect_to", "return", "return_to",
        "callback", "endpoint", "dest", "destination", "load", "open", "fetch", "share",
        "preview", "view", "goto", "go", "next", "api", "resource", "file", "data", "path",
        "image", "img", "download", "upload", "proxy", "feed", "host", "hostname", "server",
        "target", "address", "domain",
    };
    std::string lower = to_lower_copy(name);
    for (const char* n : names) {
        if (lower.find(n) != std::string::npos) return true;
    }
    return false;
}

bool SsrfAnalyzer::is_ssrf_successful(const HttpResponse& resp) {
    if (resp.status != 200 && resp.status != 201 && resp.status != 202) return false;
    return ResponseAnalyzer::shared().analyze(resp.body, PatternType::SSRF_INDICATOR).has_ssrf_indicator;
}

bool SsrfAnalyzer::is_ssrf_successful(const HttpResponse& resp, const std::string& baseline_body) {
    if (!is_ssrf_successful(resp)) return false;

    const auto& analyzer = ResponseAnalyzer::shared();
    std::set<std::string> already_present;
    for (const auto& m : analyzer.analyze(baseline_body, PatternType::SSRF_INDICATOR).matches) {
        already_present.insert(m.pattern_name);
    }
    for (const auto& m : analyzer.analyze(resp.body, PatternType::SSRF_INDICATOR).matches) {
        if (!already_present.count(m.pattern_name)) return true;
    }
    return false;
}

void SsrfAnalyzer::check(const CrawlResult& page, const ScanContext& ctx,
                         std::vector<Finding>& findings) const {
    if (!ctx.config.probe_ssrf) return;
    ctx.events.debug("check", "Checking for SSRF vulnerabilities at " + page.url);
    check_url_parameters(page, ctx, findings);
    check_forms(page, ctx, findings);
    check_api_endpoints(page, ctx, findings);
}

void SsrfAnalyzer::check_url_parameters(const CrawlResult& page, const ScanContext& ctx,
                                        std::vector<Finding>& findings) const {
    const auto& targets = internal_targets();
    const auto& templates = payload_templates();

    for (const auto& [param, value] : parse_query(page.url)) {
        if (!is_url_parameter(param) || !looks_like_url(value)) continue;
        if (!ctx.probes.try_acquire("ssrf_parameter", origin_of(page.url) + path_of(page.url) + "?" + param)) {
            continue;
        }

        bool found = false;
        for (size_t t = 0; t < 3 && !found; ++t) {
            for (size_t p = 0; p < 3 && !found; ++p) {
                if (ctx.client.cancelled()) return;
                std::string payload = make_payload(templates[p], targets[t]);
                std::string probe_url = set_query_param(page.url, param, payload);
                if (probe_url.size() > kMaxProbeUrlLength) continue;

                ctx.events.debug("ssrf_probe", "Testing SSRF with payload: " + payload + " in parameter " + param);
                HttpResponse resp;
                if (!send_probe(ctx, "GET", probe_url, "", "", resp)) {
                    ctx.events.debug("ssrf_probe", "Error testing SSRF in parameter " + param + ": " + resp.error);
                    continue;
                }
                if (is_ssrf_successful(resp, page.body)) {
                    auto details = finding_details("High",
                                                   "SSRF vulnerability detected in URL parameter '" + param + "'",
                                                   kRecommendation, kConsequences);
                    details["parameter"] = param;
                    details["payload"] = payload;
                    details["original_value"] = value;
                    findings.push_back(make_finding("ssrf_url_parameter", page.url, std::move(details)));
                    found = true;
                    break;
                }
                ctx.client.pause(ctx.config.payload_delay);
            }
        }
    }
}

void SsrfAnalyzer::check_forms(const CrawlResult& page, const ScanContext& ctx,
                               std::vector<Finding>& findings) const {
    const auto& targets = internal_targets();
    const auto& templates = payload_templates();

    for (const auto& form : page.forms) {
        std::string action = form.action.empty() ? page.url : form.action;

        for (const auto& input : form.inputs) {
            if (input.type == "hidden" || is_button_input(input.type)) continue;
            if (!is_url_parameter(input.name)) continue;
            if (!ctx.probes.try_acquire("ssrf_form", action + "#" + input.name)) continue;

            bool found = false;
            for (size_t t = 0; t < 2 && !found; ++t) {
                for (size_t p = 0; p < 2 && !found; ++p) {
                    if (ctx.client.cancelled()) return;
                    std::string payload = make_payload(templates[p], targets[t]);

                    std::vector<std::pair<std::string, std::string>> fields;
                    for (const auto& field : form.inputs) {
                        if (field.name.empty()) continue;
                        if (field.name == input.name) fields.emplace_back(field.name, payload);
                        else if (!is_button_input(field.type)) fields.emplace_back(field.name, "test");
                    }

                    ctx.events.debug("ssrf_probe",
                                     "Testing SSRF with payload: " + payload + " in form input " + input.name);
                    HttpResponse resp;
                    bool ok = form.method == "post"
                        ? send_probe(ctx, "POST", action, encode_form(fields),
                                     "application/x-www-form-urlencoded", resp)
                        : send_probe(ctx, "GET", with_query(action, encode_form(fields)), "", "", resp);
                    if (!ok) {
                        ctx.events.debug("ssrf_probe",
                                         "Error testing SSRF in form input " + input.name + ": " + resp.error);
                        continue;
                    }
                    if (is_ssrf_successful(resp, page.body)) {
                        auto details = finding_details("High",
                                                       "SSRF vulnerability detected in form input '" + input.name + "'",
                                                       kRecommendation, kConsequences);
                        details["form_action"] = action;
                        details["form_method"] = form.method;
                        details["input_name"] = input.name;
                        details["payload"] = payload;
                        findings.push_back(make_finding("ssrf_form_input", page.url, std::move(details)));
                        found = true;
                        break;
                    }
                    ctx.client.pause(ctx.config.payload_delay);
                }
            }
        }
    }
}

void SsrfAnalyzer::check_api_endpoints(const CrawlResult& page, const ScanContext& ctx,
                                       std::vector<Finding>& findings) const {
    if (!is_api_path(path_of(page.url))) return;
    std::string base = origin_of(page.url);
    if (base.empty() || !ctx.probes.try_acquire("ssrf_api", base)) return;

    ctx.events.info("ssrf_probe", "Probing API endpoints for SSRF on " + base);

    static const char* endpoints[] = {
        "/fetch", "/proxy", "/import", "/export", "/load", "/url", "/preview", "/download",
        "/upload", "/webhook", "/callback",
    };
    const auto& targets = internal_targets();

    for (const char* endpoint : endpoints) {
        std::string endpoint_url = base + endpoint;

        HttpResponse baseline;
        if (!send_probe(ctx, "GET", endpoint_url, "", "", baseline)) baseline.body.clear();

        for (size_t t = 0; t < 2; ++t) {
            if (ctx.client.cancelled()) return;
            std::string payload = "http://" + targets[t] + "/";
            ctx.events.debug("ssrf_probe",
                             "Testing SSRF with payload: " + payload + " at API endpoint " + endpoint);

            auto report = [&](const char* method, const char* content_type) {
                auto details = finding_details("High",
                                               std::string("SSRF vulnerability detected in API endpoint '") +
                                                   endpoint + "'",
                                               kRecommendation, kConsequences);
                details["endpoint"] = endpoint;
                details["payload"] = payload;
                details["method"] = method;
                details["content_type"] = content_type;
                findings.push_back(make_finding("ssrf_api_endpoint", endpoint_url, std::move(details)));
            };

            HttpResponse get_resp;
            std::string param_url = endpoint_url + "?url=" + url_encode(payload);
            if (send_probe(ctx, "GET", param_url, "", "", get_resp) &&
                is_ssrf_successful(get_resp, baseline.body)) {
                report("GET", "");
                break;
            }

            HttpResponse post_resp;
            json body = {{"url", payload}};
            if (send_probe(ctx, "POST", endpoint_url, body.dump(), "application/json", post_resp) &&
                is_ssrf_successful(post_resp, baseline.body)) {
                report("POST", "application/json");
                break;
            }
            ctx.client.pause(ctx.config.payload_delay);
        }
    }
}
