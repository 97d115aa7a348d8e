#pragma once
#include "analyzer.h"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Vulnerable and outdated client-side components.
// Library name and version are read from script and stylesheet URLs and
// compared against a table of known vulnerable versions.

struct LibraryVulnerability {
    std::vector<std::string> versions;
    std::string cve = "Unknown";
    std::string description;
    std::string severity = "Medium";
    std::string recommendation;
    std::string consequences;
};

class ComponentDatabase {
public:
    /**
     * @brief Database holding the built-in library table
     */
    ComponentDatabase();

    /**
     * @brief Merge a JSON file of {library: {versions, cve, description, ...}}
     *
     * Versions of a library already present are appended; new libraries
     * are added as a whole.
     *
     * @return false if the file is missing or malformed (nothing is merged)
     */
    bool load_file(const std::string& path);

    /**
     * @brief Merge one parsed document, same format as load_file
     */
    void merge(const nlohmann::json& doc);

    /**
     * @brief Look up a library version
     *
     * A version is vulnerable when it matches a listed version (3.4.1 matches
     * "3.4"), sorts below the highest listed version, or cannot be parsed.
     *
     * @return Vulnerability entry, or nullopt if not vulnerable or unknown library
     */
    std::optional<LibraryVulnerability> check(const std::string& library, const std::string& version) const;

    bool has_library(const std::string& library) const;

    std::vector<std::string> libraries() const;

private:
    std::map<std::string, LibraryVulnerability> libraries_;
};

/**
 * @brief Compare dotted numeric versions component by component
 *
 * Missing components count as 0.
 *
 * @param ok Set to false when either version has a non-numeric component
 * @return <0, 0, >0 like strcmp
 */
int compare_versions(const std::string& a, const std::string& b, bool& ok);

/**
 * @brief Identify library and version from a resource URL
 * @param known_libraries Names tried when only a ?v= / ?version= query is present
 * @return (library, version), or nullopt when either is unknown
 */
std::optional<std::pair<std::string, std::string>>
identify_library_version(const std::string& url, const std::vector<std::string>& known_libraries);

class VulnerableComponentsAnalyzer : public Analyzer {
public:
    const char* name() const override { return "vulnerable_components"; }

    bool enabled(const ScanConfig& config) const override { return config.scan_vulnerable_components; }

    void check(const CrawlResult& page, const ScanContext& ctx,
               std::vector<Finding>& findings) const override;

    ComponentDatabase& database() { return db_; }
    const ComponentDatabase& database() const { return db_; }

private:
    ComponentDatabase db_;
};
