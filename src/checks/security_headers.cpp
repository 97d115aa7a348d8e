// Missing security header detection

#include "security_headers.h"
#include <core/findings.h>

const std::vector<SecurityHeaderInfo>& SecurityHeadersAnalyzer::tracked_headers() {
    static const std::vector<SecurityHeaderInfo> headers = {
        {"Content-Security-Policy", "High",
         "Controls resources the browser is allowed to load",
         "Without this header, your site could load resources from any source, making it vulnerable "
         "to script injection attacks that could compromise user data or take control of page behavior."},
        {"X-Frame-Options", "Medium",
         "Protects against clickjacking attacks",
         "Without this header, attackers could embed your site in a malicious webpage and trick users "
         "into clicking on elements they didn't intend to, potentially leading to unwanted actions or data theft."},
        {"X-Content-Type-Options", "Medium",
         "Prevents MIME-sniffing attacks",
         "Without this header, browsers might interpret files as a different type than what you intended, "
         "allowing attackers to potentially execute malicious scripts even when they shouldn't be executable."},
        {"Strict-Transport-Security", "High",
         "Forces HTTPS connections",
         "Without this header, communications between your site and users might be downgraded to insecure "
         "HTTP, allowing attackers to intercept and modify data in transit, or perform man-in-the-middle attacks."},
        {"Referrer-Policy", "Low",
         "Controls how much referrer information is included with requests",
         "Without this header, sensitive information might be leaked in the referrer header when users "
         "navigate from your site to other sites, potentially exposing private data or user activity."},
        {"Permissions-Policy", "Medium",
         "Restricts which browser features the page and its frames may use",
         "Without this header, embedded or injected content could use powerful browser features such as "
         "the camera, microphone or geolocation without any restriction set by your site."},
    };
    return headers;
}

std::string SecurityHeadersAnalyzer::finding_type(const std::string& header_name) {
    std::string type = "missing_" + to_lower_copy(header_name);
    for (auto& c : type) {
        if (c == '-') c = '_';
    }
    return type;
}

void SecurityHeadersAnalyzer::check(const CrawlResult& page, const ScanContext& ctx,
                                    std::vector<Finding>& findings) const {
    (void)ctx;
    for (const auto& info : tracked_headers()) {
        std::string key = to_lower_copy(info.name);
        bool present = false;
        for (const auto& h : page.headers) {
            if (to_lower_copy(h.first) == key) {
                present = true;
                break;
            }
        }
        if (present) continue;

        std::string header = info.name;
        auto details = finding_details(info.severity,
                                       "Missing " + header + ": " + info.description,
                                       "Implement the " + header + " header to improve security",
                                       info.consequences);
        details["header_name"] = header;
        details["header_description"] = info.description;
        findings.push_back(make_finding(finding_type(header), page.url, std::move(details)));
    }
}
