/**
 * @file xss_scanner.cpp
 * @brief Reflected XSS detection with exact and marker payloads
 */

#include "xss_scanner.h"
#include <core/findings.h>
#include <core/html_extract.h>
#include <core/url_utils.h>
#include <algorithm>
#include <cctype>
#include <random>

using json = nlohmann::json;

namespace {

// Helper function
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool is_untested_input(const FormInput& input) {
    return input.name.empty() || input.type == "hidden" || input.type == "submit" || input.type == "button";
}

} // namespace

XssScanner::XssScanner(const HttpClient& client, const PayloadStore& payloads,
                       logging::EventObserver& events, double payload_delay)
    : client_(client), payloads_(payloads), events_(events), payload_delay_(payload_delay) {}

bool XssScanner::is_reflected(const std::string& body, const std::string& payload) {
    if (payload.empty() || body.find(payload) == std::string::npos) return false;
    return strip_inert_elements(body).find(payload) != std::string::npos;
}

bool XssScanner::check_for_waf_block(const HttpResponse& resp) {
    static const char* indicators[] = {
        "security block", "blocked for security reasons", "attack detected", "firewall", "waf",
        "mod_security", "forbidden", "suspicious activity", "malicious request",
    };
    std::string body = lower(resp.body);
    for (const char* indicator : indicators) {
        if (body.find(indicator) != std::string::npos) return true;
    }
    return resp.status == 403 || resp.status == 406 || resp.status == 429 || resp.status == 501;
}

std::string XssScanner::classify_payload(const std::string& payload) {
    std::string p = lower(payload);
    if (p.find("<script>") != std::string::npos) return "script tag";
    if (p.find("onerror") != std::string::npos || p.find("onload") != std::string::npos) return "event handler";
    if (p.find("javascript:") != std::string::npos) return "javascript URI";
    return "other";
}

std::string XssScanner::make_marker_payload(std::string& marker) {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

    marker = "xss";
    for (int i = 0; i < 8; ++i) marker += alphabet[pick(rng)];
    return "<script>alert('" + marker + "')</script>";
}

json XssScanner::reflection_details(const XssReflection& reflection) {
    bool in_script = std::find(reflection.contexts.begin(), reflection.contexts.end(), "script") !=
                     reflection.contexts.end();

    auto details = finding_details(in_script ? "Critical" : "High",
                                   in_script ? "Critical XSS vulnerability - Direct script execution possible"
                                             : "Cross-site scripting (XSS) vulnerability detected",
                                   "Implement proper output encoding and input validation",
                                   "Attackers can inject malicious JavaScript that executes in users' browsers, "
                                   "allowing them to steal cookies and session tokens, capture keystrokes, "
                                   "redirect users to fake websites, or perform actions on behalf of the victim. "
                                   "This could lead to account takeover, data theft, or spreading malware to your "
                                   "users.");
    details["payload"] = reflection.payload;
    details["reflection_type"] = reflection.reflection_type;
    details["contexts"] = reflection.contexts;
    details["xss_type"] = classify_payload(reflection.payload);
    if (reflection.waf_detected) {
        details["notes"] = "Web Application Firewall detected but not preventing the XSS attack";
    }
    return details;
}

bool XssScanner::probe(const Sender& send, const std::string& label, const std::string& baseline_body,
                       XssReflection& out) const {
    for (const auto& payload : payloads_.xss_payloads()) {
        if (client_.cancelled()) return false;
        if (baseline_body.find(payload) != std::string::npos) continue;

        HttpResponse resp;
        if (!send(payload, resp)) {
            events_.debug("xss", "Error testing XSS in " + label + ": " + resp.error);
            client_.pause(payload_delay_);
            continue;
        }
        if (is_reflected(resp.body, payload)) {
            out.payload = payload;
            out.reflection_type = "exact";
            out.contexts = reflection_contexts(strip_inert_elements(resp.body), payload);
            out.waf_detected = check_for_waf_block(resp);
            return true;
        }
        client_.pause(payload_delay_);
    }

    if (client_.cancelled()) return false;
    std::string marker;
    std::string payload = make_marker_payload(marker);
    HttpResponse resp;
    if (!send(payload, resp)) {
        events_.debug("xss", "Error testing XSS marker in " + label + ": " + resp.error);
        return false;
    }
    if (!is_reflected(resp.body, payload)) return false;

    out.payload = payload;
    out.reflection_type = "marker";
    out.contexts = reflection_contexts(strip_inert_elements(resp.body), marker);
    out.waf_detected = check_for_waf_block(resp);
    return true;
}

std::vector<Finding> XssScanner::scan_form(const Form& form, const std::string& page_url) const {
    std::vector<Finding> findings;

    Fields defaults;
    for (const auto& input : form.inputs) {
        if (input.name.empty() || input.type == "submit" || input.type == "button" || input.type == "image") {
            continue;
        }
        defaults.emplace_back(input.name, input.value.empty() ? "test" : input.value);
    }

    HttpResponse baseline;
    if (!client_.send_form(form.method, form.action, defaults, baseline)) {
        events_.debug("xss", "Error getting baseline response for " + form.action + ": " + baseline.error);
        baseline.body.clear();
    }

    for (const auto& input : form.inputs) {
        if (is_untested_input(input)) continue;

        Sender send = [&](const std::string& value, HttpResponse& resp) {
            Fields fields = defaults;
            for (auto& f : fields) {
                if (f.first == input.name) f.second = value;
            }
            return client_.send_form(form.method, form.action, fields, resp);
        };

        XssReflection reflection;
        if (!probe(send, "form input " + input.name, baseline.body, reflection)) continue;

        auto details = reflection_details(reflection);
        details["input_field"] = input.name;
        details["method"] = form.method;
        details["form_action"] = form.action;
        findings.push_back(make_finding("xss", page_url, std::move(details)));
        events_.debug("xss", "XSS (" + reflection.reflection_type + ") in field " + input.name + " of " + form.action);
    }
    return findings;
}

std::vector<Finding> XssScanner::scan_url_parameters(const CrawlResult& page) const {
    std::vector<Finding> findings;
    const std::string& url = page.url;

    for (const auto& param : parse_query(url)) {
        Sender send = [&](const std::string& value, HttpResponse& resp) {
            return client_.get(set_query_param(url, param.first, value), resp, true);
        };

        XssReflection reflection;
        if (!probe(send, "parameter " + param.first, page.body, reflection)) continue;

        auto details = reflection_details(reflection);
        details["parameter"] = param.first;
        details["method"] = "get";
        findings.push_back(make_finding("reflected_xss", url, std::move(details)));
        events_.debug("xss", "Reflected XSS (" + reflection.reflection_type + ") in parameter " + param.first);
    }
    return findings;
}
