#pragma once
#include "analyzer.h"

// Missing security response headers.
// Emits one missing_<header> finding per absent header out of the six
// tracked ones.

struct SecurityHeaderInfo {
    const char* name;           // canonical header name
    const char* severity;
    const char* description;
    const char* consequences;
};

class SecurityHeadersAnalyzer : public Analyzer {
public:
    const char* name() const override { return "security_headers"; }

    bool enabled(const ScanConfig& config) const override { return config.scan_headers; }

    void check(const CrawlResult& page, const ScanContext& ctx,
               std::vector<Finding>& findings) const override;

    /**
     * @brief The tracked headers in reporting order
     */
    static const std::vector<SecurityHeaderInfo>& tracked_headers();

    /**
     * @brief Finding type for a header, e.g. "missing_x_frame_options"
     */
    static std::string finding_type(const std::string& header_name);
};
