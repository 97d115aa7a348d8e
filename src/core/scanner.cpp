/**
 * @file scanner.cpp
 * @brief Scan lifecycle: sweeps, crawl, per-page checks and persistence
 */

#include "scanner.h"
#include "url_utils.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

const char* state_name(ScanState state) {
    switch (state) {
        case ScanState::Created:   return "created";
        case ScanState::Running:   return "running";
        case ScanState::Completed: return "completed";
        case ScanState::Failed:    return "failed";
    }
    return "unknown";
}

namespace {

SqlInjectionScanner::Options sqli_options(const ScanConfig& config) {
    SqlInjectionScanner::Options opts;
    opts.length_threshold = static_cast<size_t>(std::max(0, config.sqli_length_threshold));
    opts.time_threshold = config.sqli_time_threshold;
    opts.baseline_subtraction = config.sqli_baseline_subtraction;
    opts.payload_delay = config.payload_delay;
    return opts;
}

} // namespace

Scanner::Scanner(const ScanConfig& config, HttpClient& client, ResultSink& sink,
                 logging::EventObserver& events)
    : config_(config),
      client_(client),
      sink_(sink),
      events_(events),
      fallback_(config.output_dir, config.to_json()),
      probes_(static_cast<size_t>(std::max(0, config.max_probe_targets))),
      sqli_(client, payloads_, events, sqli_options(config)),
      xss_(client, payloads_, events, config.payload_delay) {
    load_payloads();
    registry_.register_defaults(config_);
    client_.set_cancel_flag(&cancel_);

    stats_.set_finding_callback([this](const Finding& f) {
        events_.info("finding_recorded", "Found " + f.type + " at " + f.url,
                     {{"scan_id", scan_id()},
                      {"type", f.type},
                      {"url", f.url},
                      {"severity", f.details.value("severity", "")}});
    });
}

Scanner::~Scanner() {
    client_.set_cancel_flag(nullptr);
}

void Scanner::load_payloads() {
    if (!config_.sql_payloads_file.empty() && !payloads_.load_sql_file(config_.sql_payloads_file)) {
        events_.debug("config", "Using built-in SQL payloads (could not load " + config_.sql_payloads_file + ")");
    }
    if (!config_.xss_payloads_file.empty() && !payloads_.load_xss_file(config_.xss_payloads_file)) {
        events_.debug("config", "Using built-in XSS payloads (could not load " + config_.xss_payloads_file + ")");
    }
    payloads_.set_sql_payloads(config_.sql_payloads);
    payloads_.set_xss_payloads(config_.xss_payloads);
}

std::string Scanner::generate_scan_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned> pick(0, 0xffffff);

    std::ostringstream oss;
    oss << "scan_" << std::put_time(std::gmtime(&time_t), "%Y%m%d_%H%M%S") << "_"
        << std::hex << std::setw(6) << std::setfill('0') << pick(rng);
    return oss.str();
}

std::string Scanner::scan_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scan_id_;
}

void Scanner::cancel() {
    cancel_ = true;
}

Crawler::Options Scanner::crawler_options() const {
    Crawler::Options opts;
    opts.max_depth = config_.max_depth;
    opts.max_pages = static_cast<size_t>(std::max(0, config_.max_pages));
    opts.threads = config_.threads;
    opts.max_retries = config_.max_retries;
    opts.scan_delay = config_.scan_delay;
    opts.rate_limit = config_.rate_limit;
    opts.extract_forms = config_.scan_forms;
    opts.extract_links = config_.scan_links;
    opts.excluded_paths = config_.excluded_paths;
    return opts;
}

ScanContext Scanner::context() {
    return ScanContext{client_, config_, events_, probes_};
}

std::string Scanner::start_scan(const std::string& target_url, const std::string& requested_id) {
    if (state_.load() == ScanState::Running) {
        throw std::logic_error("A scan is already running");
    }

    std::string seed = normalize_url(target_url);
    std::string id = requested_id.empty() ? generate_scan_id() : requested_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scan_id_ = id;
    }

    if (seed.empty() || !is_valid_url(seed)) {
        fail("Invalid target URL: " + target_url);
        throw std::invalid_argument("Invalid target URL: " + target_url);
    }

    cancel_ = false;
    probes_.reset();
    stats_.reset(id, seed);
    state_ = ScanState::Running;

    events_.info("scan_start", "Starting scan " + id + " of " + seed,
                 {{"scan_id", id}, {"target_url", seed}});
    report_progress(10, "Starting scan");

    auto ctx = context();
    events_.info("site_sweep", "Checking restricted paths and site-level exposures");
    record(registry_.run_site(seed, ctx));
    report_progress(20, "Access control checks complete");

    CrawlOutcome outcome;
    try {
        Crawler crawler(client_, crawler_options(), *this, events_);
        outcome = crawler.run(seed);
    } catch (const std::exception& e) {
        stats_.complete();
        stats_.flush();
        fail(std::string("Crawl failed: ") + e.what());
        throw;
    }
    report_progress(90, "Crawl complete");

    stats_.complete();
    stats_.flush();

    if (!outcome.seed_reached && !outcome.cancelled) {
        if (!save_results()) {
            events_.error("results_save_failed", "Results of scan " + id + " could not be saved");
        }
        fail("Target unreachable: " + seed);
        throw std::runtime_error("Target unreachable: " + seed);
    }

    if (!save_results()) {
        events_.error("results_save_failed", "Results of scan " + id + " could not be saved");
    }
    report_progress(100, "Scan completed");

    ScanStats final_stats = stats_.snapshot();
    state_ = ScanState::Completed;
    events_.info("scan_complete",
                 "Scan completed in " + std::to_string(final_stats.duration) + " seconds",
                 {{"scan_id", id},
                  {"total_urls_scanned", final_stats.scanned_urls.size()},
                  {"total_vulnerabilities", final_stats.findings.size()},
                  {"duration", final_stats.duration},
                  {"cancelled", outcome.cancelled}});
    return id;
}

void Scanner::fail(const std::string& reason) {
    state_ = ScanState::Failed;
    events_.error("scan_failed", reason, {{"scan_id", scan_id()}, {"reason", reason}});
}

json Scanner::get_results() const {
    return stats().bundle();
}

ScanStats Scanner::stats() const {
    stats_.flush();
    return stats_.snapshot();
}

void Scanner::record(std::vector<Finding> findings) {
    for (auto& f : findings) {
        stats_.record_finding(std::move(f));
    }
}

void Scanner::report_progress(int percent, const std::string& message) {
    SinkResult result = sink_.update_progress(scan_id(), percent, message);
    if (!result.success) {
        events_.warn("progress_failed", "Could not update progress: " + result.message);
    }
    events_.debug("progress", std::to_string(percent) + "% " + message);
}

bool Scanner::save_results() {
    std::string id = scan_id();
    json bundle = stats_.snapshot().bundle();

    SinkResult result = sink_.save_results(id, bundle);
    if (result.success) {
        events_.info("results_saved", result.message, {{"scan_id", id}});
        return true;
    }
    events_.error("results_save_failed", "Failed to save results: " + result.message, {{"scan_id", id}});

    SinkResult local = fallback_.save_results(id, bundle);
    if (!local.success) {
        events_.error("results_save_failed", "Local fallback failed: " + local.message, {{"scan_id", id}});
        return false;
    }
    events_.info("results_saved", local.message, {{"scan_id", id}, {"fallback", true}});
    return true;
}

template <typename Fn>
void Scanner::guarded(const char* step, const std::string& url, Fn&& fn) {
    if (client_.cancelled()) return;
    try {
        record(fn());
    } catch (const std::exception& e) {
        events_.error("check_failed", std::string("Error in ") + step + " for " + url + ": " + e.what(),
                      {{"check", step}, {"url", url}});
        stats_.record_error("check_error");
    }
}

// CrawlObserver

void Scanner::on_url(const std::string& url) {
    stats_.record_url(url);
}

void Scanner::on_link(const LinkRecord& link) {
    stats_.record_link(link);
}

void Scanner::on_form(const FormRecord& form) {
    stats_.record_form(form);
}

void Scanner::on_response(long status, double seconds) {
    stats_.record_response(status, seconds);
}

void Scanner::on_error(const std::string& url, const std::string& error_type) {
    (void)url;
    stats_.record_error(error_type);
}

void Scanner::on_page(const CrawlResult& page) {
    if (config_.scan_forms) {
        for (const auto& form : page.forms) {
            if (config_.scan_sqli) {
                guarded("sql_injection", page.url, [&] { return sqli_.scan_form(form, page.url); });
            }
            if (config_.scan_xss) {
                guarded("xss", page.url, [&] { return xss_.scan_form(form, page.url); });
            }
        }
    }

    if (!parse_query(page.url).empty()) {
        if (config_.scan_sqli) {
            guarded("sql_injection", page.url, [&] { return sqli_.scan_url_parameters(page); });
        }
        if (config_.scan_xss) {
            guarded("xss", page.url, [&] { return xss_.scan_url_parameters(page); });
        }
    }

    auto ctx = context();
    guarded("analyzers", page.url, [&] { return registry_.run_page(page, ctx); });
}
