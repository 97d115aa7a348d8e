#pragma once
#include <schema/crawl_result.h>
#include <schema/finding.h>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

// Per-scan statistics and result accumulation.
// Workers never touch the counters directly: they post updates to a
// StatsAggregator whose own thread is the single writer.

/**
 * @brief Point-in-time copy of everything a scan has accumulated
 */
struct ScanStats {
    std::string scan_id;
    std::string target_url;
    std::string start_time;   // ISO-8601
    std::string end_time;     // empty while running
    double duration = 0.0;    // seconds

    std::vector<std::string> scanned_urls;
    std::vector<LinkRecord> scanned_links;
    std::vector<FormRecord> scanned_forms;
    std::vector<Finding> findings;

    std::map<std::string, int> vulnerabilities_by_type;
    std::map<std::string, int> errors_by_type;
    std::map<long, int> response_codes;

    size_t total_requests = 0;
    double total_response_time = 0.0;
    double min_response_time = 0.0;
    double max_response_time = 0.0;

    double avg_response_time() const {
        return total_requests ? total_response_time / total_requests : 0.0;
    }

    /**
     * @brief The summary document (scan_info, vulnerabilities_by_type,
     *        errors_by_type, performance_metrics)
     */
    nlohmann::json summary() const;

    /**
     * @brief The full result bundle: summary, vulnerabilities,
     *        scanned_links, scanned_forms, scanned_urls
     */
    nlohmann::json bundle() const;
};

nlohmann::json to_json(const LinkRecord& link);
nlohmann::json to_json(const FormRecord& form);

class StatsAggregator {
public:
    /// Invoked on the aggregator thread for every finding recorded for the first time.
    using FindingCallback = std::function<void(const Finding&)>;

    StatsAggregator();
    ~StatsAggregator();

    StatsAggregator(const StatsAggregator&) = delete;
    StatsAggregator& operator=(const StatsAggregator&) = delete;

    /**
     * @brief Clear all state and stamp the start of a new scan
     *
     * Waits for queued updates of a previous scan to drain first.
     */
    void reset(const std::string& scan_id, const std::string& target_url);

    void set_finding_callback(FindingCallback cb);

    // Updates are queued and applied in order by the aggregator thread
    void record_url(const std::string& url);
    void record_link(LinkRecord link);
    void record_form(FormRecord form);
    void record_finding(Finding finding);
    void record_error(const std::string& error_type);
    void record_response(long status, double seconds);

    /**
     * @brief Stamp the end time
     */
    void complete();

    /**
     * @brief Block until every update posted so far has been applied
     */
    void flush();

    /**
     * @brief Copy of the current state (call flush() first for a settled view)
     */
    ScanStats snapshot() const;

private:
    struct UrlVisited { std::string url; };
    struct ErrorCounted { std::string type; };
    struct ResponseTimed { long status; double seconds; };
    struct Completed {};
    using Update = std::variant<UrlVisited, LinkRecord, FormRecord, Finding,
                                ErrorCounted, ResponseTimed, Completed>;

    void post(Update update);
    void run();
    void apply(Update& update);

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    std::deque<Update> queue_;
    size_t in_progress_ = 0;
    bool stopping_ = false;

    mutable std::mutex state_mutex_;
    ScanStats stats_;
    std::set<std::string> finding_keys_;
    std::chrono::steady_clock::time_point started_;
    bool completed_ = false;
    FindingCallback on_finding_;

    std::thread worker_;
};
