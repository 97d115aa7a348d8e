/**
 * @file scan_stats.cpp
 * @brief Single-writer statistics aggregator
 */

#include "scan_stats.h"
#include "findings.h"
#include <algorithm>

using json = nlohmann::json;

json to_json(const LinkRecord& link) {
    return json{
        {"source_url", link.source_url},
        {"target_url", link.target_url},
        {"timestamp", link.timestamp},
    };
}

json to_json(const FormRecord& record) {
    json inputs = json::array();
    for (const auto& input : record.form.inputs) {
        inputs.push_back({{"name", input.name}, {"type", input.type}, {"value", input.value}});
    }
    return json{
        {"url", record.url},
        {"action", record.form.action},
        {"method", record.form.method},
        {"inputs", inputs},
        {"timestamp", record.timestamp},
    };
}

json ScanStats::summary() const {
    json by_type = json::object();
    for (const auto& [type, count] : vulnerabilities_by_type) by_type[type] = count;
    json errors = json::object();
    for (const auto& [type, count] : errors_by_type) errors[type] = count;
    json codes = json::object();
    for (const auto& [code, count] : response_codes) codes[std::to_string(code)] = count;

    json scan_info = {
        {"scan_id", scan_id},
        {"target_url", target_url},
        {"start_time", start_time},
        {"end_time", end_time.empty() ? json(nullptr) : json(end_time)},
        {"duration", duration},
        {"total_urls_scanned", scanned_urls.size()},
        {"total_links_scanned", scanned_links.size()},
        {"total_forms_scanned", scanned_forms.size()},
        {"total_vulnerabilities", findings.size()},
        {"total_requests", total_requests},
    };

    return json{
        {"scan_info", scan_info},
        {"vulnerabilities_by_type", by_type},
        {"errors_by_type", errors},
        {"response_codes", codes},
        {"performance_metrics", {
            {"avg_response_time", avg_response_time()},
            {"min_response_time", min_response_time},
            {"max_response_time", max_response_time},
        }},
    };
}

json ScanStats::bundle() const {
    json vulns = json::array();
    for (const auto& f : findings) vulns.push_back(to_json(f));
    json links = json::array();
    for (const auto& l : scanned_links) links.push_back(to_json(l));
    json forms = json::array();
    for (const auto& f : scanned_forms) forms.push_back(to_json(f));

    return json{
        {"summary", summary()},
        {"vulnerabilities", vulns},
        {"scanned_links", links},
        {"scanned_forms", forms},
        {"scanned_urls", scanned_urls},
    };
}

// StatsAggregator

StatsAggregator::StatsAggregator()
    : started_(std::chrono::steady_clock::now()) {
    stats_.start_time = iso_timestamp();
    worker_ = std::thread(&StatsAggregator::run, this);
}

StatsAggregator::~StatsAggregator() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void StatsAggregator::reset(const std::string& scan_id, const std::string& target_url) {
    flush();
    std::lock_guard<std::mutex> lock(state_mutex_);
    stats_ = ScanStats{};
    stats_.scan_id = scan_id;
    stats_.target_url = target_url;
    stats_.start_time = iso_timestamp();
    finding_keys_.clear();
    started_ = std::chrono::steady_clock::now();
    completed_ = false;
}

void StatsAggregator::set_finding_callback(FindingCallback cb) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    on_finding_ = std::move(cb);
}

void StatsAggregator::record_url(const std::string& url) { post(UrlVisited{url}); }
void StatsAggregator::record_link(LinkRecord link) { post(std::move(link)); }
void StatsAggregator::record_form(FormRecord form) { post(std::move(form)); }
void StatsAggregator::record_finding(Finding finding) { post(std::move(finding)); }
void StatsAggregator::record_error(const std::string& error_type) { post(ErrorCounted{error_type}); }
void StatsAggregator::record_response(long status, double seconds) { post(ResponseTimed{status, seconds}); }
void StatsAggregator::complete() { post(Completed{}); }

void StatsAggregator::post(Update update) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(update));
    }
    queue_cv_.notify_one();
}

void StatsAggregator::flush() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    drained_cv_.wait(lock, [this] { return queue_.empty() && in_progress_ == 0; });
}

ScanStats StatsAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ScanStats copy = stats_;
    if (!completed_) {
        copy.duration = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - started_).count();
    }
    return copy;
}

void StatsAggregator::run() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            if (stopping_) break;
            continue;
        }
        Update update = std::move(queue_.front());
        queue_.pop_front();
        in_progress_++;
        lock.unlock();

        apply(update);

        lock.lock();
        in_progress_--;
        if (queue_.empty() && in_progress_ == 0) {
            drained_cv_.notify_all();
        }
    }
}

void StatsAggregator::apply(Update& update) {
    FindingCallback notify;
    const Finding* recorded = nullptr;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);

        if (auto* u = std::get_if<UrlVisited>(&update)) {
            stats_.scanned_urls.push_back(u->url);
        } else if (auto* link = std::get_if<LinkRecord>(&update)) {
            stats_.scanned_links.push_back(*link);
        } else if (auto* form = std::get_if<FormRecord>(&update)) {
            stats_.scanned_forms.push_back(*form);
        } else if (auto* finding = std::get_if<Finding>(&update)) {
            if (finding_keys_.insert(finding_key(*finding)).second) {
                stats_.findings.push_back(*finding);
                stats_.vulnerabilities_by_type[finding->type]++;
                notify = on_finding_;
                recorded = finding;
            }
        } else if (auto* err = std::get_if<ErrorCounted>(&update)) {
            stats_.errors_by_type[err->type]++;
        } else if (auto* timed = std::get_if<ResponseTimed>(&update)) {
            if (stats_.total_requests == 0) {
                stats_.min_response_time = timed->seconds;
                stats_.max_response_time = timed->seconds;
            } else {
                stats_.min_response_time = std::min(stats_.min_response_time, timed->seconds);
                stats_.max_response_time = std::max(stats_.max_response_time, timed->seconds);
            }
            stats_.total_requests++;
            stats_.total_response_time += timed->seconds;
            if (timed->status > 0) stats_.response_codes[timed->status]++;
        } else if (std::holds_alternative<Completed>(update)) {
            stats_.end_time = iso_timestamp();
            stats_.duration = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - started_).count();
            completed_ = true;
        }
    }

    // Outside the state lock so the callback may call snapshot()
    if (notify && recorded) {
        notify(*recorded);
    }
}
