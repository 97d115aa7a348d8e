#pragma once
#include "crawler.h"
#include "http_client.h"
#include "payload_store.h"
#include "scan_config.h"
#include "scan_stats.h"
#include <checks/analyzer.h>
#include <injection/sqli_scanner.h>
#include <injection/xss_scanner.h>
#include <logging/events.h>
#include <report/local_json_sink.h>
#include <report/result_sink.h>
#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

// Scan coordinator.
// Owns the lifecycle of one scan at a time: site sweeps, then the crawl with
// per-page analyzers and injection scanners, then persistence through the
// result sink. Every result flows through the StatsAggregator.

enum class ScanState { Created, Running, Completed, Failed };

const char* state_name(ScanState state);

class Scanner : public CrawlObserver {
public:
    /**
     * @brief Create a coordinator
     *
     * Loads the payload lists and registers the built-in analyzers. The
     * client's cancel flag is bound to this scanner until it is destroyed.
     *
     * @param config Scan configuration, copied
     * @param client Client shared by the crawler and every check
     * @param sink Primary result destination
     * @param events Log event sink
     */
    Scanner(const ScanConfig& config, HttpClient& client, ResultSink& sink,
            logging::EventObserver& events);

    ~Scanner() override;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    /**
     * @brief Run a complete scan and persist its results
     *
     * Order: reset per-scan state, progress 10, site sweeps (access control
     * first), progress 20, crawl, progress 90, save, progress 100.
     * A failed save through the primary sink falls back to local JSON files
     * in config.output_dir.
     *
     * @param target_url Seed URL
     * @param requested_id Identifier to use; generated when empty
     * @return The scan id
     * @throws std::invalid_argument if the seed URL cannot be parsed
     * @throws std::runtime_error if the seed could not be fetched at all
     *         (results gathered so far are still saved)
     */
    std::string start_scan(const std::string& target_url, const std::string& requested_id = "");

    /**
     * @brief The result bundle of the current or last scan
     */
    nlohmann::json get_results() const;

    /**
     * @brief Settled copy of the statistics
     */
    ScanStats stats() const;

    ScanState state() const { return state_.load(); }

    std::string scan_id() const;

    /**
     * @brief Ask a running scan to stop; outstanding requests fail fast
     */
    void cancel();

    AnalyzerRegistry& registry() { return registry_; }
    const PayloadStore& payloads() const { return payloads_; }
    const ScanConfig& config() const { return config_; }

    /**
     * @brief "scan_YYYYMMDD_HHMMSS_xxxxxx" in UTC with a random suffix
     */
    static std::string generate_scan_id();

    // CrawlObserver
    void on_url(const std::string& url) override;
    void on_link(const LinkRecord& link) override;
    void on_form(const FormRecord& form) override;
    void on_response(long status, double seconds) override;
    void on_error(const std::string& url, const std::string& error_type) override;
    void on_page(const CrawlResult& page) override;

private:
    ScanConfig config_;
    HttpClient& client_;
    ResultSink& sink_;
    logging::EventObserver& events_;
    LocalJsonSink fallback_;

    PayloadStore payloads_;
    AnalyzerRegistry registry_;
    ProbeLimiter probes_;
    SqlInjectionScanner sqli_;
    XssScanner xss_;
    mutable StatsAggregator stats_;

    std::atomic<bool> cancel_{false};
    std::atomic<ScanState> state_{ScanState::Created};

    mutable std::mutex mutex_;
    std::string scan_id_;

    void load_payloads();
    Crawler::Options crawler_options() const;
    ScanContext context();

    void record(std::vector<Finding> findings);
    void report_progress(int percent, const std::string& message);
    bool save_results();
    void fail(const std::string& reason);

    /**
     * @brief Run one step of page processing, containing its failures
     */
    template <typename Fn>
    void guarded(const char* step, const std::string& url, Fn&& fn);
};
