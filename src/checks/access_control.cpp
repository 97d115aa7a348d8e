// Broken access control sweep

#include "access_control.h"
#include <core/findings.h>
#include <core/url_utils.h>

const std::vector<std::string>& AccessControlAnalyzer::restricted_paths() {
    static const std::vector<std::string> paths = {
        "/admin", "/dashboard", "/config", "/settings", "/hidden", "/administrator",
        "/admin-panel", "/backend", "/cp", "/management", "/moderator", "/webadmin",
        "/control", "/superuser", "/supervisor", "/wp-admin", "/adminpanel",
        "/admin-dashboard", "/manager", "/panel", "/admin.php", "/admin/index.php",
        "/login.php?admin=true",
    };
    return paths;
}

bool AccessControlAnalyzer::looks_like_open_admin_page(const std::string& body) {
    static const char* indicators[] = {
        "admin", "dashboard", "manage", "control panel", "settings", "configuration",
        "config", "setup", "administrator", "superuser", "moderator",
    };
    std::string lower = to_lower_copy(body);

    bool admin_content = false;
    for (const char* indicator : indicators) {
        if (lower.find(indicator) != std::string::npos) {
            admin_content = true;
            break;
        }
    }
    bool login_form = lower.find("login") != std::string::npos &&
                      (lower.find("password") != std::string::npos ||
                       lower.find("username") != std::string::npos);
    return admin_content && !login_form;
}

void AccessControlAnalyzer::sweep_site(const std::string& seed_url, const ScanContext& ctx,
                                       std::vector<Finding>& findings) const {
    std::string base = origin_of(seed_url);
    if (base.empty()) return;

    ctx.events.info("access_control", "Checking broken access control for " + base);

    for (const auto& path : restricted_paths()) {
        if (ctx.client.cancelled()) return;
        std::string target = base + path;

        HttpRequest req;
        req.url = target;
        req.follow_redirects = true;
        req.timeout_seconds = 10;
        HttpResponse resp;
        if (!ctx.client.perform(req, resp)) {
            ctx.events.debug("access_control",
                             "Error checking broken access control for " + target + ": " + resp.error);
            continue;
        }
        if (resp.status != 200) continue;

        bool granted = looks_like_open_admin_page(resp.body);
        if (!granted && !ctx.config.access_control_strict) continue;

        auto details = finding_details("High",
                                       "Unrestricted access to " + path + " endpoint",
                                       "Implement proper authentication and authorization checks for restricted areas",
                                       "Unauthorized access to admin or restricted functionality, potentially "
                                       "leading to data breach or system compromise");
        details["status_code"] = resp.status;
        details["access_granted"] = granted;
        findings.push_back(make_finding("broken_access_control", target, std::move(details)));
    }
}
