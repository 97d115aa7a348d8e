// Security misconfiguration checks

#include "misconfiguration.h"
#include <core/findings.h>
#include <core/response_analyzer.h>

bool MisconfigurationAnalyzer::has_directory_listing(long status, const std::string& body) {
    if (status != 200) return false;
    return ResponseAnalyzer::shared().analyze(body, PatternType::DIRECTORY_LISTING).has_directory_listing;
}

bool MisconfigurationAnalyzer::has_verbose_errors(long status, const std::string& body) {
    if (status < 400) return false;
    return ResponseAnalyzer::shared().analyze(body, PatternType::VERBOSE_ERROR).has_verbose_error;
}

bool MisconfigurationAnalyzer::has_default_configs(const std::string& url, const std::string& body) {
    static const char* url_indicators[] = {
        "phpinfo.php", "config.php", "config.inc.php", "setup.php", "default.config",
        "conf.default", "wp-config.php", "server-status", "server-info", ".env", ".git",
        ".svn", ".htpasswd", ".htaccess", "config.xml", "web.config", "settings.py",
        "settings.ini",
    };
    static const char* content_indicators[] = {
        "installation complete", "setup successful", "default password", "default username",
        "default admin", "password is", "username is", "configuration file", "config file",
    };

    std::string lower_url = to_lower_copy(url);
    for (const char* indicator : url_indicators) {
        if (lower_url.find(indicator) != std::string::npos) return true;
    }

    std::string lower_body = to_lower_copy(body.substr(0, ResponseAnalyzer::kMaxBodyBytes));
    for (const char* indicator : content_indicators) {
        if (lower_body.find(indicator) != std::string::npos) return true;
    }
    return false;
}

void MisconfigurationAnalyzer::check(const CrawlResult& page, const ScanContext& ctx,
                                     std::vector<Finding>& findings) const {
    ctx.events.debug("check", "Checking security misconfigurations for " + page.url);

    if (has_directory_listing(page.status, page.body)) {
        findings.push_back(make_finding("security_misconfiguration_directory_listing", page.url,
            finding_details("Medium",
                            "Directory listing is enabled",
                            "Disable directory listing in your web server configuration",
                            "Attackers can view the contents of directories, potentially exposing sensitive files")));
    }

    if (has_verbose_errors(page.status, page.body)) {
        findings.push_back(make_finding("security_misconfiguration_verbose_errors", page.url,
            finding_details("Medium",
                            "Verbose error messages or stack traces detected",
                            "Configure your application to display generic error messages in production",
                            "Detailed error messages can reveal sensitive information about your application "
                            "structure, dependencies, and potential vulnerabilities")));
    }

    if (has_default_configs(page.url, page.body)) {
        findings.push_back(make_finding("security_misconfiguration_default_configs", page.url,
            finding_details("High",
                            "Default configuration files or credentials detected",
                            "Remove default configuration files and change default credentials",
                            "Default configurations often contain vulnerabilities or credentials that are "
                            "widely known to attackers")));
    }
}
