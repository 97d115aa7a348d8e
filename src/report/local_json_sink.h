#pragma once
#include "result_sink.h"
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Writes a result bundle as a set of JSON files in a directory
 *
 * Files: vulnerabilities.json, scanned_links.json, scanned_forms.json,
 * scan_summary.json, scan_config.json, scanned_urls.txt and
 * detailed_results.json (the whole bundle). JSON is indented by 4 spaces.
 */
class LocalJsonSink : public ResultSink {
public:
    /**
     * @param output_dir Directory to write into, created if missing
     * @param config_json Document written to scan_config.json
     */
    LocalJsonSink(std::string output_dir, nlohmann::json config_json);

    SinkResult save_results(const std::string& scan_id, const nlohmann::json& bundle) override;

    /**
     * @brief Remembers the last progress report; nothing is written
     */
    SinkResult update_progress(const std::string& scan_id, int percent,
                               const std::string& message) override;

    int last_progress() const;
    std::string last_task() const;

    const std::string& output_dir() const { return output_dir_; }

private:
    std::string output_dir_;
    nlohmann::json config_;

    mutable std::mutex mutex_;
    int progress_ = 0;
    std::string task_;

    bool write_json(const std::string& file, const nlohmann::json& doc, std::string& error) const;
};
