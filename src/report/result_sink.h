#pragma once
#include <string>
#include <nlohmann/json.hpp>

// Destinations for finished scan results and progress reports.
// The scan coordinator is handed a sink when it is created; sink failures
// are reported through SinkResult and never abort a scan.

struct SinkResult {
    bool success = false;
    std::string message;
};

class ResultSink {
public:
    virtual ~ResultSink() = default;

    /**
     * @brief Persist a complete result bundle
     * @param scan_id Key the results are stored under
     * @param bundle Document produced by ScanStats::bundle()
     */
    virtual SinkResult save_results(const std::string& scan_id, const nlohmann::json& bundle) = 0;

    /**
     * @brief Record scan progress
     * @param percent 0-100
     * @param message Current task
     */
    virtual SinkResult update_progress(const std::string& scan_id, int percent,
                                       const std::string& message) = 0;
};
