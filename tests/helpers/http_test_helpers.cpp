/**
 * @file http_test_helpers.cpp
 * @brief Implementation of the network-free HTTP fixtures
 */

#include "http_test_helpers.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>

namespace test_helpers {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

} // namespace

CannedResponse html(const std::string& body, long status) {
    return respond(status, "text/html; charset=utf-8", body);
}

CannedResponse respond(long status, const std::string& content_type, const std::string& body) {
    CannedResponse r;
    r.status = status;
    if (!content_type.empty()) r.headers.emplace_back("Content-Type", content_type);
    r.body = body;
    return r;
}

void fill_response(const CannedResponse& canned, const HttpRequest& req, HttpResponse& resp) {
    resp.status = canned.status;
    resp.headers.clear();
    for (const auto& [name, value] : canned.headers) {
        resp.headers.emplace_back(lower(name), value);
    }
    resp.body = canned.body;
    resp.body_bytes = canned.body.size();
    resp.effective_url = req.url;
    resp.total_time = canned.total_time;
    resp.error.clear();
}

FakeHttpClient::FakeHttpClient(const HttpClient::Options& opts)
    : HttpClient(opts) {
    fallback_ = [](const HttpRequest& req, HttpResponse& resp) {
        fill_response(respond(404, "text/html", "<html><body>Not Found</body></html>"), req, resp);
        return true;
    };
}

void FakeHttpClient::on(const std::string& url, CannedResponse resp) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_["* " + url] = std::move(resp);
}

void FakeHttpClient::on(const std::string& method, const std::string& url, CannedResponse resp) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[upper(method) + " " + url] = std::move(resp);
}

void FakeHttpClient::on_prefix(const std::string& prefix, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    prefix_handlers_.emplace_back(prefix, std::move(handler));
}

void FakeHttpClient::set_fallback(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    fallback_ = std::move(handler);
}

void FakeHttpClient::fail(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_.insert(url);
}

void FakeHttpClient::set_extra_latency(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    extra_latency_ = seconds;
}

std::vector<HttpRequest> FakeHttpClient::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

size_t FakeHttpClient::count(const std::string& url_fragment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(log_.begin(), log_.end(), [&](const HttpRequest& r) {
        return r.url.find(url_fragment) != std::string::npos;
    });
}

size_t FakeHttpClient::count_method(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string m = upper(method);
    return std::count_if(log_.begin(), log_.end(), [&](const HttpRequest& r) {
        return upper(r.method) == m;
    });
}

void FakeHttpClient::clear_requests() {
    std::lock_guard<std::mutex> lock(mutex_);
    log_.clear();
}

bool FakeHttpClient::execute(const HttpRequest& req, HttpResponse& resp) const {
    Handler handler;
    double latency = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.push_back(req);
        latency = extra_latency_;

        if (failing_.count(req.url)) {
            resp.error = "Could not connect to server";
            return false;
        }

        auto exact = routes_.find(upper(req.method) + " " + req.url);
        if (exact == routes_.end()) exact = routes_.find("* " + req.url);
        if (exact != routes_.end()) {
            fill_response(exact->second, req, resp);
            resp.total_time += latency;
            return true;
        }

        for (const auto& [prefix, h] : prefix_handlers_) {
            if (req.url.rfind(prefix, 0) == 0) {
                handler = h;
                break;
            }
        }
        if (!handler) handler = fallback_;
    }

    bool ok = handler(req, resp);
    if (ok) {
        resp.effective_url = resp.effective_url.empty() ? req.url : resp.effective_url;
        resp.total_time += latency;
    }
    return ok;
}

ScanConfig fast_config() {
    ScanConfig config;
    config.threads = 1;
    config.max_retries = 1;
    config.scan_delay = 0.0;
    config.payload_delay = 0.0;
    config.probe_delay = 0.0;
    config.rate_limit = 0.0;
    config.sql_payloads_file.clear();
    config.xss_payloads_file.clear();
    config.vulnerable_libraries_file.clear();
    return config;
}

std::string make_temp_dir(const std::string& name) {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
        ("warden_" + name + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir.string();
}

void RecordingObserver::on_event(const logging::ScanEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<logging::ScanEvent> RecordingObserver::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

size_t RecordingObserver::count(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(events_.begin(), events_.end(),
                         [&](const logging::ScanEvent& e) { return e.kind == kind; });
}

} // namespace test_helpers
