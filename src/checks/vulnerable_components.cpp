/**
 * @file vulnerable_components.cpp
 * @brief Library version identification and vulnerable-version lookup
 */

#include "vulnerable_components.h"
#include <core/findings.h>
#include <core/html_extract.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <regex>

using json = nlohmann::json;

namespace {

LibraryVulnerability make_entry(std::vector<std::string> versions, const std::string& cve,
                                const std::string& description, const std::string& severity,
                                const std::string& recommendation, const std::string& consequences) {
    LibraryVulnerability v;
    v.versions = std::move(versions);
    v.cve = cve;
    v.description = description;
    v.severity = severity;
    v.recommendation = recommendation;
    v.consequences = consequences;
    return v;
}

std::vector<std::string> split_version(const std::string& version) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = version.find('.', start);
        parts.push_back(version.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return parts;
}

bool parse_component(const std::string& part, long& out) {
    if (part.empty() || part.size() > 9) return false;
    for (char c : part) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    out = std::stol(part);
    return true;
}

// Helper function: "3.4.1" is covered by a listed "3.4"
bool covered_by(const std::string& version, const std::string& listed) {
    auto v = split_version(version);
    auto l = split_version(listed);
    if (l.size() > v.size()) return false;
    for (size_t i = 0; i < l.size(); i++) {
        if (v[i] != l[i]) return false;
    }
    return true;
}

} // namespace

int compare_versions(const std::string& a, const std::string& b, bool& ok) {
    ok = true;
    auto pa = split_version(a);
    auto pb = split_version(b);
    size_t n = std::max(pa.size(), pb.size());
    int result = 0;
    for (size_t i = 0; i < n; i++) {
        long va = 0, vb = 0;
        if (i < pa.size() && !parse_component(pa[i], va)) { ok = false; return 0; }
        if (i < pb.size() && !parse_component(pb[i], vb)) { ok = false; return 0; }
        if (result == 0 && va != vb) result = va < vb ? -1 : 1;
    }
    return result;
}

ComponentDatabase::ComponentDatabase() {
    libraries_["jquery"] = make_entry(
        {"1.0", "1.1", "1.2", "1.3", "1.4", "1.5", "1.6", "1.7", "1.8", "1.9", "1.10", "1.11", "1.12",
         "2.0", "2.1", "2.2", "3.0", "3.1", "3.2", "3.3", "3.4"},
        "Multiple CVEs",
        "Multiple vulnerabilities in jQuery may allow XSS, prototype pollution, or other security issues",
        "Medium", "Update to the latest version of jQuery",
        "Outdated jQuery versions may contain security vulnerabilities that could be exploited by attackers");
    libraries_["bootstrap"] = make_entry(
        {"2.0", "2.1", "2.2", "2.3", "3.0", "3.1", "3.2", "3.3", "4.0", "4.1", "4.2", "4.3", "4.4"},
        "Multiple CVEs",
        "Multiple vulnerabilities in Bootstrap may allow XSS or other security issues",
        "Medium", "Update to the latest version of Bootstrap",
        "Outdated Bootstrap versions may contain security vulnerabilities that could be exploited by attackers");
    libraries_["angular"] = make_entry(
        {"1.0", "1.1", "1.2", "1.3", "1.4", "1.5", "1.6", "1.7", "2.0", "2.1", "2.2", "2.3", "2.4",
         "4.0", "4.1", "4.2", "4.3", "5.0", "5.1", "5.2", "6.0", "6.1", "7.0", "7.1", "7.2",
         "8.0", "8.1", "8.2", "9.0"},
        "Multiple CVEs",
        "Multiple vulnerabilities in AngularJS may allow XSS, prototype pollution, or other security issues",
        "High", "Update to the latest version of Angular",
        "Outdated Angular versions may contain security vulnerabilities that could be exploited by attackers");
    libraries_["react"] = make_entry(
        {"0.3", "0.4", "0.5", "0.6", "0.7", "0.8", "0.9", "0.10", "0.11", "0.12", "0.13", "0.14",
         "15.0", "15.1", "15.2", "15.3", "15.4", "15.5", "15.6",
         "16.0", "16.1", "16.2", "16.3", "16.4", "16.5", "16.6", "16.7", "16.8", "16.9"},
        "Multiple CVEs",
        "Multiple vulnerabilities in React may allow XSS or other security issues",
        "Medium", "Update to the latest version of React",
        "Outdated React versions may contain security vulnerabilities that could be exploited by attackers");
    libraries_["vue"] = make_entry(
        {"1.0", "2.0", "2.1", "2.2", "2.3", "2.4", "2.5", "2.6"},
        "Multiple CVEs",
        "Multiple vulnerabilities in Vue may allow XSS or other security issues",
        "Medium", "Update to the latest version of Vue",
        "Outdated Vue versions may contain security vulnerabilities that could be exploited by attackers");

    std::vector<std::string> lodash = {
        "0.1", "0.2", "0.3", "0.4", "0.5", "0.6", "0.7", "0.8", "0.9", "1.0", "1.1", "1.2", "1.3",
        "2.0", "2.1", "2.2", "2.3", "2.4", "3.0", "3.1", "3.2", "3.3", "3.4", "3.5", "3.6", "3.7",
        "3.8", "3.9", "3.10", "4.0", "4.1", "4.2", "4.3", "4.4", "4.5", "4.6", "4.7", "4.8", "4.9",
        "4.10", "4.11", "4.12", "4.13", "4.14", "4.15", "4.16"};
    for (int patch = 0; patch <= 15; patch++) lodash.push_back("4.17." + std::to_string(patch));
    libraries_["lodash"] = make_entry(
        lodash, "CVE-2019-10744",
        "Prototype pollution vulnerability in Lodash",
        "High", "Update to the latest version of Lodash",
        "Attackers could potentially modify Object prototype, leading to application crashes or remote code execution");

    std::vector<std::string> moment = {"1.0", "1.1", "1.2", "1.3", "1.4", "1.5", "1.6", "1.7"};
    for (int minor = 0; minor <= 19; minor++) moment.push_back("2." + std::to_string(minor));
    libraries_["moment"] = make_entry(
        moment, "CVE-2017-18214",
        "Regular expression denial of service (ReDoS) vulnerability in Moment.js",
        "Medium", "Update to the latest version of Moment.js",
        "Attackers could cause denial of service by providing specially crafted input to the parser");
}

bool ComponentDatabase::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }
    try {
        json doc = json::parse(in);
        if (!doc.is_object()) {
            std::cerr << "Warning: Vulnerability database " << path << " is not a JSON object\n";
            return false;
        }
        merge(doc);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Error loading vulnerability database " << path << ": " << e.what() << "\n";
        return false;
    }
}

void ComponentDatabase::merge(const json& doc) {
    if (!doc.is_object()) return;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const json& data = it.value();
        if (!data.is_object()) continue;
        std::string lib = to_lower_copy(it.key());

        std::vector<std::string> versions;
        if (data.contains("versions") && data["versions"].is_array()) {
            for (const auto& v : data["versions"]) {
                if (v.is_string()) versions.push_back(v.get<std::string>());
            }
        }

        auto existing = libraries_.find(lib);
        if (existing != libraries_.end()) {
            auto& list = existing->second.versions;
            list.insert(list.end(), versions.begin(), versions.end());
            continue;
        }

        LibraryVulnerability entry;
        entry.versions = std::move(versions);
        entry.cve = data.value("cve", "Unknown");
        entry.description = data.value("description", "Vulnerable version of " + lib + " detected");
        entry.severity = data.value("severity", "Medium");
        entry.recommendation = data.value("recommendation", "Update " + lib + " to the latest version");
        entry.consequences = data.value("consequences",
            "Using outdated components with known vulnerabilities can lead to security breaches");
        libraries_[lib] = std::move(entry);
    }
}

bool ComponentDatabase::has_library(const std::string& library) const {
    return libraries_.count(to_lower_copy(library)) > 0;
}

std::vector<std::string> ComponentDatabase::libraries() const {
    std::vector<std::string> names;
    for (const auto& entry : libraries_) names.push_back(entry.first);
    return names;
}

std::optional<LibraryVulnerability> ComponentDatabase::check(const std::string& library,
                                                             const std::string& version) const {
    auto it = libraries_.find(to_lower_copy(library));
    if (it == libraries_.end()) return std::nullopt;
    const LibraryVulnerability& info = it->second;

    const std::string* highest = nullptr;
    for (const auto& listed : info.versions) {
        if (listed == version || covered_by(version, listed)) return info;

        bool ok = true;
        if (!highest) {
            compare_versions(listed, listed, ok);
            if (ok) highest = &listed;
        } else if (compare_versions(listed, *highest, ok) > 0 && ok) {
            highest = &listed;
        }
    }
    if (!highest) return std::nullopt;

    bool ok = true;
    int cmp = compare_versions(version, *highest, ok);
    if (!ok) return info;   // unparseable, assume the worst
    if (cmp < 0) return info;
    return std::nullopt;
}

std::optional<std::pair<std::string, std::string>>
identify_library_version(const std::string& url, const std::vector<std::string>& known_libraries) {
    static const std::vector<std::pair<std::regex, std::string>> patterns = [] {
        auto icase = std::regex::ECMAScript | std::regex::icase;
        std::vector<std::pair<std::regex, std::string>> p;
        p.emplace_back(std::regex(R"(jquery[.-](\d+\.\d+(?:\.\d+)?))", icase), "jquery");
        p.emplace_back(std::regex(R"(bootstrap[.-]?(\d+\.\d+(?:\.\d+)?))", icase), "bootstrap");
        p.emplace_back(std::regex(R"(angular[.-]?(\d+\.\d+(?:\.\d+)?))", icase), "angular");
        p.emplace_back(std::regex(R"(react[.-]?(\d+\.\d+(?:\.\d+)?))", icase), "react");
        p.emplace_back(std::regex(R"(vue[.-]?(\d+\.\d+(?:\.\d+)?))", icase), "vue");
        p.emplace_back(std::regex(R"(lodash[.-]?(\d+\.\d+(?:\.\d+)?))", icase), "lodash");
        p.emplace_back(std::regex(R"(moment[.-]?(\d+\.\d+(?:\.\d+)?))", icase), "moment");
        p.emplace_back(std::regex(R"([?&]v=(\d+\.\d+(?:\.\d+)?))", icase), "");
        p.emplace_back(std::regex(R"([?&]version=(\d+\.\d+(?:\.\d+)?))", icase), "");
        return p;
    }();

    std::string library;
    std::string version;
    for (const auto& [re, lib] : patterns) {
        std::smatch m;
        if (std::regex_search(url, m, re)) {
            library = lib;
            version = m[1].str();
            break;
        }
    }
    if (version.empty()) return std::nullopt;

    if (library.empty()) {
        std::string lower = to_lower_copy(url);
        for (const auto& name : known_libraries) {
            if (lower.find(name) != std::string::npos) {
                library = name;
                break;
            }
        }
    }
    if (library.empty()) return std::nullopt;
    return std::make_pair(library, version);
}

void VulnerableComponentsAnalyzer::check(const CrawlResult& page, const ScanContext& ctx,
                                         std::vector<Finding>& findings) const {
    std::vector<std::string> resources;
    for (const auto& script : extract_scripts(page.body, page.url)) {
        if (!script.src.empty()) resources.push_back(script.src);
    }
    for (const auto& sheet : extract_stylesheets(page.body, page.url)) {
        resources.push_back(sheet);
    }

    auto known = db_.libraries();
    for (const auto& resource : resources) {
        auto identified = identify_library_version(resource, known);
        if (!identified) continue;
        const auto& [library, version] = *identified;

        auto vuln = db_.check(library, version);
        if (!vuln) continue;

        auto details = finding_details(vuln->severity,
                                       vuln->description.empty() ? "Vulnerable version of " + library + " detected"
                                                                 : vuln->description,
                                       vuln->recommendation.empty() ? "Update " + library + " to the latest version"
                                                                    : vuln->recommendation,
                                       vuln->consequences.empty()
                                           ? "Using outdated components with known vulnerabilities can lead to security breaches"
                                           : vuln->consequences);
        details["library"] = library;
        details["version"] = version;
        details["script_url"] = resource;
        details["cve"] = vuln->cve;
        findings.push_back(make_finding("vulnerable_component", page.url, std::move(details)));
        ctx.events.debug("component", "Found vulnerable component: " + library + " " + version + " at " + page.url);
    }
}
