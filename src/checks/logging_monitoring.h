#pragma once
#include "analyzer.h"

// Security logging and monitoring failures.
// Passive page heuristics (audit trail, admin logging, centralized logging),
// a failed-login probe against login forms and a one-off burst of requests
// against the seed to see whether anything notices.

class LoggingMonitoringAnalyzer : public Analyzer {
public:
    const char* name() const override { return "logging_monitoring"; }

    bool enabled(const ScanConfig& config) const override { return config.scan_logging_monitoring; }

    void check(const CrawlResult& page, const ScanContext& ctx,
               std::vector<Finding>& findings) const override;

    /**
     * @brief Rapid requests plus sensitive endpoints, then look for a reaction
     *
     * Runs only when probe_activity_burst is set.
     */
    void sweep_site(const std::string& seed_url, const ScanContext& ctx,
                    std::vector<Finding>& findings) const override;

    /// No audit-log, activity-log or login-history wording on the page.
    static bool missing_audit_trail(const std::string& body);

    /**
     * @brief Admin-looking URL path or admin-looking page content
     */
    static bool is_admin_page(const std::string& url, const std::string& body);

    static bool has_proper_logging(const std::string& body);

    /**
     * @brief Request-id style headers or logging-infrastructure wording
     */
    static bool has_centralized_logging(const CrawlResult& page);

    struct LoginProbeResult {
        bool completed = false;     // at least one attempt got a response
        bool lockout = false;
        bool monitoring = false;
    };

    /**
     * @brief Post five failed logins to a login form
     */
    static LoginProbeResult probe_login_failures(const Form& form, const ScanContext& ctx);
};
