/**
 * @file logging_monitoring.cpp
 * @brief Logging and monitoring heuristics and probes
 */

#include "logging_monitoring.h"
#include <core/findings.h>
#include <core/response_analyzer.h>
#include <core/url_utils.h>
#include <random>
#include <regex>

using json = nlohmann::json;

namespace {

// Helper function
bool any_match(const std::vector<std::regex>& patterns, const std::string& text) {
    std::string lower = to_lower_copy(text.substr(0, ResponseAnalyzer::kMaxBodyBytes));
    for (const auto& re : patterns) {
        if (std::regex_search(lower, re)) return true;
    }
    return false;
}

std::vector<std::regex> compile(std::initializer_list<const char*> sources) {
    std::vector<std::regex> out;
    for (const char* src : sources) out.emplace_back(src, std::regex::ECMAScript | std::regex::optimize);
    return out;
}

const std::vector<std::regex>& lockout_patterns() {
    static const auto patterns = compile({
        "account.*lock|lock.*account",
        "too many attempts|maximum attempts",
        "temporarily disabled|temporarily blocked",
        "try again later|wait \\d+ minute",
    });
    return patterns;
}

const std::vector<std::regex>& login_monitoring_patterns() {
    static const auto patterns = compile({
        "unusual activity|suspicious activity",
        "security alert|security notification",
        "multiple failed attempts|repeated failed",
    });
    return patterns;
}

const std::vector<std::regex>& activity_monitoring_patterns() {
    static const auto patterns = compile({
        "unusual activity|suspicious activity",
        "security alert|security warning",
        "abnormal behavior|anomalous behavior",
        "activity monitoring|behavior monitoring",
    });
    return patterns;
}

bool has_login_form(const CrawlResult& page, const Form** login) {
    for (const auto& form : page.forms) {
        for (const auto& input : form.inputs) {
            if (input.type == "password") {
                *login = &form;
                return true;
            }
        }
    }
    return false;
}

} // namespace

bool LoggingMonitoringAnalyzer::missing_audit_trail(const std::string& body) {
    static const auto patterns = compile({
        "audit log|audit trail",
        "user activity|activity log",
        "last login|previous login",
        "session history|login history",
    });
    return !any_match(patterns, body);
}

bool LoggingMonitoringAnalyzer::is_admin_page(const std::string& url, const std::string& body) {
    static const char* url_markers[] = {
        "/admin", "/administrator", "/manage", "/dashboard", "/control", "/panel", "/console",
    };
    std::string lower_url = to_lower_copy(url);
    for (const char* marker : url_markers) {
        if (lower_url.find(marker) != std::string::npos) return true;
    }

    static const auto content_patterns = compile({
        "admin dashboard|admin panel",
        "control panel|management console",
        "administrative tools|admin tools",
        "manage users|user management",
        "site administration|website admin",
    });
    return any_match(content_patterns, body);
}

bool LoggingMonitoringAnalyzer::has_proper_logging(const std::string& body) {
    static const auto patterns = compile({
        "activity log|action log",
        "audit trail|audit log",
        "logging enabled|logs enabled",
        "event tracking|event logging",
    });
    return any_match(patterns, body);
}

bool LoggingMonitoringAnalyzer::has_centralized_logging(const CrawlResult& page) {
    for (const char* header : {"x-request-id", "x-correlation-id", "x-transaction-id"}) {
        for (const auto& h : page.headers) {
            if (to_lower_copy(h.first) == header) return true;
        }
    }
    static const auto patterns = compile({
        "log aggregation|log collection",
        "centralized logging|unified logging",
        "log management|log system",
    });
    return any_match(patterns, page.body);
}

LoggingMonitoringAnalyzer::LoginProbeResult
LoggingMonitoringAnalyzer::probe_login_failures(const Form& form, const ScanContext& ctx) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pick(1000, 9999);
    std::string username = "test_user_" + std::to_string(pick(rng));
    std::string password = "test_pass_" + std::to_string(pick(rng));

    std::vector<std::pair<std::string, std::string>> fields = {
        {"username", username},
        {"email", username + "@example.com"},
        {"user", username},
        {"login", username},
        {"password", password},
        {"pass", password},
        {"pwd", password},
    };
    // Also fill the form's own credential fields.
    for (const auto& input : form.inputs) {
        if (input.name.empty() || is_button_input(input.type)) continue;
        bool known = false;
        for (const auto& f : fields) {
            if (f.first == input.name) known = true;
        }
        if (known) continue;
        if (input.type == "password") fields.emplace_back(input.name, password);
        else if (input.type == "text" || input.type == "email") fields.emplace_back(input.name, username);
        else fields.emplace_back(input.name, input.value);
    }

    LoginProbeResult result;
    for (int attempt = 0; attempt < 5; ++attempt) {
        HttpResponse resp;
        if (!ctx.client.post_form(form.action, fields, resp, true)) {
            ctx.events.debug("login_monitoring_probe", "Error testing login monitoring: " + resp.error);
            break;
        }
        result.completed = true;
        if (any_match(login_monitoring_patterns(), resp.body)) result.monitoring = true;
        if (any_match(lockout_patterns(), resp.body)) {
            result.lockout = true;
            break;
        }
        if (attempt < 4) ctx.client.pause(ctx.config.probe_delay);
    }
    return result;
}

void LoggingMonitoringAnalyzer::check(const CrawlResult& page, const ScanContext& ctx,
                                      std::vector<Finding>& findings) const {
    ctx.events.debug("check", "Checking security logging and monitoring for " + page.url);

    const Form* login = nullptr;
    if (has_login_form(page, &login) && ctx.config.probe_login_monitoring &&
        ctx.probes.try_acquire("login_monitoring", login->action)) {
        auto probe = probe_login_failures(*login, ctx);
        if (probe.completed && !probe.lockout) {
            auto details = finding_details("High",
                                           "No account lockout after multiple failed login attempts",
                                           "Implement account lockout policies after a certain number of failed "
                                           "login attempts",
                                           "Without account lockout, attackers can perform unlimited brute force "
                                           "attacks on user accounts");
            details["form_action"] = login->action;
            findings.push_back(make_finding("logging_monitoring_no_account_lockout", page.url, std::move(details)));
        }
        if (probe.completed && !probe.monitoring) {
            auto details = finding_details("Medium",
                                           "No evidence of monitoring for failed login attempts",
                                           "Implement monitoring and alerting for repeated failed login attempts",
                                           "Without monitoring for failed logins, brute force attacks may go undetected");
            details["form_action"] = login->action;
            findings.push_back(make_finding("logging_monitoring_no_login_failure_monitoring", page.url,
                                            std::move(details)));
        }
    }

    if (missing_audit_trail(page.body)) {
        findings.push_back(make_finding("logging_monitoring_no_audit_trail", page.url,
            finding_details("High",
                            "No evidence of audit logging found",
                            "Implement audit logging for all authentication and authorization events",
                            "Without proper audit trails, security incidents may go undetected and uninvestigated")));
    }

    if (is_admin_page(page.url, page.body) && !has_proper_logging(page.body)) {
        findings.push_back(make_finding("logging_monitoring_insufficient_admin_logging", page.url,
            finding_details("High",
                            "Admin interface with insufficient logging detected",
                            "Implement detailed logging for all admin actions",
                            "Admin actions could be performed without proper audit trails, making it difficult "
                            "to detect and investigate malicious activities")));
    }

    if (!has_centralized_logging(page)) {
        findings.push_back(make_finding("logging_monitoring_no_centralized_logging", page.url,
            finding_details("Medium",
                            "No evidence of centralized logging found",
                            "Implement centralized logging for all application components",
                            "Without centralized logging, security events across different components may be "
                            "difficult to correlate and analyze")));
    }
}

void LoggingMonitoringAnalyzer::sweep_site(const std::string& seed_url, const ScanContext& ctx,
                                           std::vector<Finding>& findings) const {
    if (!ctx.config.probe_activity_burst) return;
    std::string base = origin_of(seed_url);
    if (base.empty()) return;

    ctx.events.info("logging_monitoring", "Simulating suspicious activity against " + base);

    auto quick_get = [&](const std::string& url, HttpResponse& resp) {
        HttpRequest req;
        req.url = url;
        req.timeout_seconds = 2;
        return ctx.client.perform(req, resp);
    };

    HttpResponse resp;
    if (!quick_get(seed_url, resp)) {
        ctx.events.debug("logging_monitoring",
                         "Error checking suspicious activity monitoring: " + resp.error);
        return;
    }
    int failed = 0;
    for (int i = 1; i < 10 && !ctx.client.cancelled(); ++i) {
        ctx.client.pause(0.1);
        HttpResponse burst;
        if (!quick_get(seed_url, burst)) ++failed;
    }

    for (const char* endpoint : {"/admin", "/config", "/settings", "/users", "/api/users", "/api/config"}) {
        if (ctx.client.cancelled()) return;
        HttpResponse probe;
        if (!quick_get(base + endpoint, probe)) ++failed;
    }
    if (failed > 0) {
        ctx.events.debug("logging_monitoring", std::to_string(failed) + " burst requests failed");
    }

    HttpResponse last;
    if (!quick_get(seed_url, last)) {
        ctx.events.debug("logging_monitoring",
                         "Error checking suspicious activity monitoring: " + last.error);
        return;
    }
    if (any_match(activity_monitoring_patterns(), last.body)) return;

    findings.push_back(make_finding("logging_monitoring_no_suspicious_activity_monitoring", seed_url,
        finding_details("Medium",
                        "No monitoring for suspicious activity detected",
                        "Implement monitoring and alerting for suspicious activity patterns such as multiple "
                        "failed logins",
                        "Without monitoring for suspicious patterns, attacks such as brute force or account "
                        "enumeration can go undetected")));
}
