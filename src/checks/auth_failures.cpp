/**
 * @file auth_failures.cpp
 * @brief Login form weaknesses and default admin login pages
 */

#include "auth_failures.h"
#include <core/findings.h>
#include <core/html_extract.h>
#include <core/url_utils.h>
#include <random>

using json = nlohmann::json;

namespace {

// Helper function
std::string random_string(const std::string& alphabet, size_t length) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
    std::string out;
    for (size_t i = 0; i < length; ++i) out += alphabet[pick(rng)];
    return out;
}

json login_form_details(const std::string& severity, const std::string& description,
                        const std::string& recommendation, const std::string& consequences,
                        const Form& form) {
    auto details = finding_details(severity, description, recommendation, consequences);
    details["form_action"] = form.action;
    details["form_method"] = form.method;
    return details;
}

} // namespace

const std::vector<std::string>& AuthFailuresAnalyzer::admin_login_paths() {
    static const std::vector<std::string> paths = {
        "/admin", "/admin/login", "/administrator", "/administrator/login", "/login",
        "/wp-admin", "/wp-login", "/wp-login.php", "/admin.php", "/adminlogin",
        "/admin/login.php", "/admin/login.html", "/admin/index.php", "/panel", "/cpanel",
        "/dashboard", "/moderator", "/webadmin", "/adminarea", "/bb-admin", "/adminLogin",
        "/admin_area", "/panel-administracion", "/instadmin", "/memberadmin",
        "/administratorlogin", "/adm", "/account/login", "/admin/account", "/admin_login",
        "/siteadmin", "/siteadmin/login", "/admin/admin", "/moderator/admin", "/user/admin",
        "/adminpanel", "/super-admin",
    };
    return paths;
}

bool AuthFailuresAnalyzer::is_login_form(const Form& form) {
    for (const auto& input : form.inputs) {
        if (input.type == "password") return true;
    }
    return false;
}

bool AuthFailuresAnalyzer::has_captcha(const Form& form) {
    static const char* indicators[] = {"captcha", "recaptcha", "g-recaptcha", "h-captcha", "cf-turnstile"};
    for (const auto& input : form.inputs) {
        std::string name = to_lower_copy(input.name);
        for (const char* indicator : indicators) {
            if (name.find(indicator) != std::string::npos) return true;
        }
    }
    return false;
}

bool AuthFailuresAnalyzer::has_2fa_indicators(const std::string& body) {
    static const char* indicators[] = {
        "two-factor", "two factor", "2fa", "second factor", "authentication app",
        "authenticator app", "google authenticator", "authy", "verification code",
        "security code", "one-time password", "one time password", "otp", "two-step",
        "two step", "multi-factor", "multi factor", "mfa",
    };
    std::string lower = to_lower_copy(body);
    for (const char* indicator : indicators) {
        if (lower.find(indicator) != std::string::npos) return true;
    }
    return false;
}

bool AuthFailuresAnalyzer::has_weak_password_policy(const std::string& body) {
    static const char* strong_policy[] = {
        "password must contain", "password requirements", "password should include",
        "password must include", "password must be at least", "minimum of",
        "at least one uppercase", "at least one lowercase", "at least one number",
        "at least one special", "password strength", "strong password",
    };
    std::string lower = to_lower_copy(body);
    for (const char* indicator : strong_policy) {
        if (lower.find(indicator) != std::string::npos) return false;
    }
    return true;
}

bool AuthFailuresAnalyzer::has_brute_force_protection(const Form& form, const ScanContext& ctx) {
    std::string username_field;
    std::string password_field;
    for (const auto& input : form.inputs) {
        if (input.type == "text" || input.type == "email") username_field = input.name;
        else if (input.type == "password") password_field = input.name;
    }
    if (username_field.empty() || password_field.empty()) return true;

    static const char* indicators[] = {
        "too many attempts", "too many login attempts", "account locked",
        "account has been locked", "try again later", "temporary lockout", "captcha",
        "recaptcha", "too many failed", "rate limit", "wait before trying", "wait for",
        "locked for", "security measure",
    };

    std::string username = random_string("abcdefghijklmnopqrstuvwxyz", 8) + "@example.com";
    std::string password = random_string("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789", 10);

    for (int attempt = 0; attempt < 3; ++attempt) {
        std::vector<std::pair<std::string, std::string>> fields;
        for (const auto& input : form.inputs) {
            if (input.name.empty()) continue;
            if (input.name == username_field) {
                fields.emplace_back(input.name, username);
            } else if (input.name == password_field) {
                fields.emplace_back(input.name, password + std::to_string(attempt));
            } else if (!is_button_input(input.type) && input.type != "file") {
                fields.emplace_back(input.name, input.value);
            }
        }

        ctx.events.debug("brute_force_probe",
                         "Sending test login attempt " + std::to_string(attempt + 1) + " to " + form.action);
        HttpResponse resp;
        if (!ctx.client.send_form(form.method, form.action, fields, resp, true)) {
            ctx.events.debug("brute_force_probe", "Error testing brute force protection: " + resp.error);
            return true;
        }
        if (resp.status == 429) return true;

        std::string lower = to_lower_copy(resp.body);
        for (const char* indicator : indicators) {
            if (lower.find(indicator) != std::string::npos) return true;
        }
        if (attempt < 2) ctx.client.pause(ctx.config.probe_delay);
    }
    return false;
}

void AuthFailuresAnalyzer::check(const CrawlResult& page, const ScanContext& ctx,
                                 std::vector<Finding>& findings) const {
    ctx.events.debug("check", "Checking authentication failures for " + page.url);

    for (const auto& form : page.forms) {
        if (!is_login_form(form)) continue;
        if (ctx.client.cancelled()) return;

        if (!has_captcha(form)) {
            findings.push_back(make_finding("auth_failure_no_captcha", page.url,
                login_form_details("Medium",
                                   "Login form without CAPTCHA protection",
                                   "Implement CAPTCHA or other anti-automation measures to prevent brute force attacks",
                                   "Without CAPTCHA, attackers can automate brute force attacks against user accounts",
                                   form)));
        }

        if (!has_2fa_indicators(page.body)) {
            findings.push_back(make_finding("auth_failure_no_2fa", page.url,
                login_form_details("Medium",
                                   "No indication of two-factor authentication",
                                   "Implement two-factor authentication for sensitive accounts",
                                   "Without 2FA, compromised credentials can immediately lead to account takeover",
                                   form)));
        }

        if (has_weak_password_policy(page.body)) {
            findings.push_back(make_finding("auth_failure_weak_password_policy", page.url,
                login_form_details("Medium",
                                   "Weak or non-existent password policy",
                                   "Implement a strong password policy requiring a minimum length and complexity",
                                   "Weak passwords are more susceptible to brute force and dictionary attacks",
                                   form)));
        }

        if (!ctx.config.probe_brute_force) continue;
        if (!ctx.probes.try_acquire("brute_force", form.action)) continue;

        if (!has_brute_force_protection(form, ctx)) {
            findings.push_back(make_finding("auth_failure_no_brute_force_protection", page.url,
                login_form_details("High",
                                   "No brute force protection detected",
                                   "Implement account lockout or rate limiting after multiple failed login attempts",
                                   "Without brute force protection, attackers can attempt unlimited password guesses",
                                   form)));
        }
    }
}

void AuthFailuresAnalyzer::sweep_site(const std::string& seed_url, const ScanContext& ctx,
                                      std::vector<Finding>& findings) const {
    std::string base = origin_of(seed_url);
    if (base.empty()) return;

    ctx.events.info("auth_failures", "Checking for default admin login pages from " + base);

    static const char* login_indicators[] = {
        "login", "sign in", "username", "password", "admin", "administrator", "log in",
        "signin", "auth", "authentication", "credentials",
    };

    for (const auto& path : admin_login_paths()) {
        if (ctx.client.cancelled()) return;
        std::string admin_url = base + path;

        HttpRequest req;
        req.url = admin_url;
        req.follow_redirects = true;
        req.timeout_seconds = 10;
        HttpResponse resp;
        if (!ctx.client.perform(req, resp)) {
            ctx.events.debug("auth_failures", "Error checking admin login at " + admin_url + ": " + resp.error);
            continue;
        }
        if (resp.status != 200) continue;

        std::string lower = to_lower_copy(resp.body);
        bool login_page = false;
        for (const char* indicator : login_indicators) {
            if (lower.find(indicator) != std::string::npos) {
                login_page = true;
                break;
            }
        }
        if (!login_page) continue;
        if (extract_forms(resp.body, admin_url).empty() || count_password_inputs(resp.body) == 0) continue;

        auto details = finding_details("Medium",
                                       "Default admin login page found at " + path,
                                       "Change the default admin login URL to a custom path",
                                       "Default login pages are prime targets for brute force and credential "
                                       "stuffing attacks");
        details["admin_url"] = admin_url;
        findings.push_back(make_finding("auth_failure_default_login_page", admin_url, std::move(details)));
        ctx.events.debug("finding", "Found default admin login page at " + admin_url);
    }
}
