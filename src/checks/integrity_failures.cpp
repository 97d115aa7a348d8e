// Integrity failure checks

#include "integrity_failures.h"
#include <core/findings.h>
#include <core/html_extract.h>
#include <core/response_analyzer.h>
#include <core/url_utils.h>

bool IntegrityFailuresAnalyzer::is_external_url(const std::string& script_url, const std::string& page_url) {
    std::string scheme = scheme_of(script_url);
    if (scheme != "http" && scheme != "https") return false;
    return host_of(script_url) != host_of(page_url);
}

void IntegrityFailuresAnalyzer::check(const CrawlResult& page, const ScanContext& ctx,
                                      std::vector<Finding>& findings) const {
    ctx.events.debug("check", "Checking integrity failures for " + page.url);

    for (const auto& script : extract_scripts(page.body, page.url)) {
        if (script.src.empty()) continue;

        // Protocol-relative sources are assumed to load over HTTPS.
        std::string script_url = script.raw_src.rfind("//", 0) == 0 ? "https:" + script.raw_src : script.src;

        if (script.integrity.empty() && is_external_url(script_url, page.url)) {
            auto details = finding_details("Medium",
                                           "External script without Subresource Integrity (SRI) protection",
                                           "Add integrity attribute to the script tag with a valid hash",
                                           "Without SRI, attackers who compromise the CDN or external resource "
                                           "could inject malicious code into your application");
            details["script_url"] = script_url;
            findings.push_back(make_finding("integrity_failure_missing_sri", page.url, std::move(details)));
        }

        if (scheme_of(script_url) == "http") {
            auto details = finding_details("High",
                                           "Script loaded over insecure HTTP",
                                           "Load all scripts over HTTPS",
                                           "Scripts loaded over HTTP are vulnerable to man-in-the-middle attacks");
            details["script_url"] = script_url;
            findings.push_back(make_finding("integrity_failure_insecure_script", page.url, std::move(details)));
        }
    }

    auto analysis = ResponseAnalyzer::shared().analyze(page.body);

    for (const auto& match : analysis.matches_of(PatternType::INSECURE_PACKAGE_SOURCE)) {
        auto details = finding_details("Medium",
                                       "Insecure package source or registry",
                                       "Use secure and verified package sources",
                                       "Insecure package sources could distribute compromised dependencies");
        details["source_url"] = match.evidence;
        findings.push_back(make_finding("integrity_failure_insecure_package_source", page.url, std::move(details)));
    }

    if (analysis.has_deserialization) {
        auto details = finding_details("High",
                                       "Potential insecure deserialization vulnerability",
                                       "Use secure deserialization methods or alternatives like JSON",
                                       "Insecure deserialization can lead to remote code execution");
        details["pattern"] = analysis.matches_of(PatternType::DESERIALIZATION).front().pattern_name;
        findings.push_back(make_finding("integrity_failure_insecure_deserialization", page.url, std::move(details)));
    }
}
