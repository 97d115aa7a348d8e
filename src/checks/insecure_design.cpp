// Insecure design checks

#include "insecure_design.h"
#include <core/findings.h>
#include <core/html_extract.h>

using json = nlohmann::json;

bool InsecureDesignAnalyzer::has_csrf_protection(const Form& form, const CrawlResult& page) {
    static const char* token_names[] = {
        "csrf", "csrf_token", "csrfmiddlewaretoken", "_csrf", "xsrf", "token", "_token",
        "authenticity_token", "csrf-token", "__requestverificationtoken",
    };
    for (const auto& input : form.inputs) {
        std::string name = to_lower_copy(input.name);
        for (const char* token : token_names) {
            if (name.find(token) != std::string::npos) return true;
        }
    }

    for (const auto& meta : meta_names(page.body)) {
        if (meta.find("csrf") != std::string::npos) return true;
    }

    for (const char* header : {"x-csrf-token", "x-xsrf-token"}) {
        if (contains_ci(page.body, header)) return true;
        if (!page_header(page, header).empty()) return true;
    }
    return false;
}

bool InsecureDesignAnalyzer::has_rate_limiting(const Form& form, const ScanContext& ctx) {
    if (form.method != "post" || form.inputs.empty()) return true;
    for (const auto& input : form.inputs) {
        if (input.type == "file") return true;
    }

    auto fields = sample_form_fields(form);
    if (fields.empty()) return true;

    static const char* indicators[] = {
        "rate limit", "too many requests", "try again later", "slow down",
        "too many attempts", "temporary block",
    };

    int accepted = 0;
    for (int attempt = 1; attempt <= 3; ++attempt) {
        ctx.events.debug("rate_limit_probe",
                         "Testing rate limiting - attempt " + std::to_string(attempt) + " for " + form.action);
        HttpResponse resp;
        if (!ctx.client.post_form(form.action, fields, resp, true)) {
            ctx.events.debug("rate_limit_probe", "Error testing rate limiting: " + resp.error);
            return true;
        }
        if (resp.status < 400) ++accepted;
        if (resp.status == 429) return true;

        std::string lower = to_lower_copy(resp.body);
        for (const char* indicator : indicators) {
            if (lower.find(indicator) != std::string::npos) return true;
        }
        if (attempt < 3) ctx.client.pause(ctx.config.probe_delay);
    }
    return accepted < 3;
}

void InsecureDesignAnalyzer::check(const CrawlResult& page, const ScanContext& ctx,
                                   std::vector<Finding>& findings) const {
    for (const auto& form : page.forms) {
        if (form.action.empty()) continue;
        if (ctx.client.cancelled()) return;

        if (!has_csrf_protection(form, page)) {
            auto details = finding_details("Medium",
                                           "Form missing CSRF protection",
                                           "Implement CSRF tokens for all state-changing forms",
                                           "Without CSRF protection, attackers can trick users into submitting "
                                           "unauthorized requests");
            details["form_action"] = form.action;
            details["form_method"] = form.method;
            findings.push_back(make_finding("insecure_design_csrf", page.url, std::move(details)));
            ctx.events.debug("finding", "Found insecure design: No CSRF protection for form at " + page.url);
        }

        if (!ctx.config.probe_rate_limiting) continue;
        if (form.method != "post") continue;
        if (!ctx.probes.try_acquire("rate_limiting", form.action)) continue;

        if (!has_rate_limiting(form, ctx)) {
            auto details = finding_details("Medium",
                                           "Form missing rate limiting protection",
                                           "Implement rate limiting for all forms to prevent abuse",
                                           "Without rate limiting, attackers can flood your application with "
                                           "requests, leading to DoS conditions or automated attacks");
            details["form_action"] = form.action;
            details["form_method"] = form.method;
            findings.push_back(make_finding("insecure_design_no_rate_limiting", page.url, std::move(details)));
            ctx.events.debug("finding", "Found insecure design: No rate limiting for form at " + page.url);
        }
    }
}
