#pragma once
#include "analyzer.h"

// Identification and authentication failures.
// Per page: login forms (forms with a password input) without CAPTCHA,
// without any sign of 2FA, without a stated password policy, or accepting
// repeated bad logins. Per scan: well-known admin login pages.

class AuthFailuresAnalyzer : public Analyzer {
public:
    const char* name() const override { return "auth_failures"; }

    bool enabled(const ScanConfig& config) const override { return config.scan_auth_failures; }

    void check(const CrawlResult& page, const ScanContext& ctx,
               std::vector<Finding>& findings) const override;

    /**
     * @brief Look for default admin login pages on the seed's origin
     */
    void sweep_site(const std::string& seed_url, const ScanContext& ctx,
                    std::vector<Finding>& findings) const override;

    static const std::vector<std::string>& admin_login_paths();

    static bool is_login_form(const Form& form);

    static bool has_captcha(const Form& form);

    static bool has_2fa_indicators(const std::string& body);

    /**
     * @return true when the page states no password requirements
     */
    static bool has_weak_password_policy(const std::string& body);

    /**
     * @brief Send three logins with random credentials
     *
     * Forms without both a username (text or email) and a password field
     * are not probed and count as protected, as do transport failures.
     *
     * @return true on a 429 or a lockout / CAPTCHA / rate-limit message
     */
    static bool has_brute_force_protection(const Form& form, const ScanContext& ctx);
};
