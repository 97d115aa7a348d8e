#pragma once
#include <schema/finding.h>
#include <string>
#include <nlohmann/json.hpp>

// Construction and serialization of Finding records.

/**
 * @brief Create a finding stamped with the current local time
 * @param type Taxonomy tag, e.g. "sql_injection"
 * @param url URL the finding applies to
 * @param details Type-specific details (see schema/finding.h)
 */
Finding make_finding(const std::string& type, const std::string& url, nlohmann::json details);

/**
 * @brief The four keys every details object carries
 */
nlohmann::json finding_details(const std::string& severity,
                               const std::string& description,
                               const std::string& recommendation,
                               const std::string& consequences);

/**
 * @brief True if details holds the common keys plus the keys documented
 *        for the finding's type
 */
bool has_required_details(const Finding& finding);

/**
 * @brief Identity used to record a finding only once
 */
std::string finding_key(const Finding& finding);

nlohmann::json to_json(const Finding& finding);

/// "YYYY-MM-DD HH:MM:SS" in local time, as used in findings, link and form records.
std::string local_timestamp();

/// ISO-8601 local time with microseconds, as used for scan start and end times.
std::string iso_timestamp();
