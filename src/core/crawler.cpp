/**
 * @file crawler.cpp
 * @brief Worker-pool crawler over a shared frontier
 */

#include "crawler.h"
#include "findings.h"
#include "html_extract.h"
#include "url_utils.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

// Frontier

Frontier::Frontier(size_t max_pages, std::vector<std::string> excluded_paths)
    : max_pages_(max_pages), excluded_paths_(std::move(excluded_paths)) {}

bool Frontier::push(const std::string& url, int depth) {
    std::string norm = normalize_url(url);
    if (norm.empty()) return false;

    std::string path = path_of(norm);
    for (const auto& prefix : excluded_paths_) {
        if (!prefix.empty() && path.rfind(prefix, 0) == 0) {
            return false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        if (!seen_.insert(norm).second) return false;
        queue_.push_back(Item{norm, depth});
    }
    cv_.notify_one();
    return true;
}

bool Frontier::pop(Item& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty() || in_flight_ == 0; });

    if (closed_ || queue_.empty()) {
        // Closed, or nothing queued and nobody can queue more
        cv_.notify_all();
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    in_flight_++;
    return true;
}

bool Frontier::claim() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (claimed_ >= max_pages_) return false;
    claimed_++;
    return true;
}

void Frontier::task_done() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0) in_flight_--;
    }
    cv_.notify_all();
}

void Frontier::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool Frontier::seen(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.count(normalize_url(url)) > 0;
}

size_t Frontier::seen_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

size_t Frontier::claimed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_;
}

// Crawler

bool is_html_content_type(const std::string& content_type) {
    std::string ct = content_type;
    std::transform(ct.begin(), ct.end(), ct.begin(), [](unsigned char c) { return std::tolower(c); });
    return ct.find("text/html") != std::string::npos ||
           ct.find("application/xhtml+xml") != std::string::npos;
}

Crawler::Crawler(const HttpClient& client, const Options& opts,
                 CrawlObserver& observer, logging::EventObserver& events)
    : client_(client), opts_(opts), observer_(observer), events_(events) {}

namespace {

// Releases a popped frontier item however processing ends
struct TaskGuard {
    Frontier& frontier;
    ~TaskGuard() { frontier.task_done(); }
};

} // namespace

CrawlOutcome Crawler::run(const std::string& seed_url) {
    seed_ = normalize_url(seed_url);
    if (seed_.empty() || !is_valid_url(seed_)) {
        throw std::invalid_argument("Invalid seed URL: " + seed_url);
    }

    {
        std::lock_guard<std::mutex> lock(outcome_mutex_);
        outcome_ = CrawlOutcome{};
    }

    Frontier frontier(opts_.max_pages, opts_.excluded_paths);
    if (!frontier.push(seed_, 0)) {
        events_.warn("seed_excluded", "Seed URL is excluded from the crawl: " + seed_);
        return outcome_;
    }

    int n = std::max(1, opts_.threads);
    std::vector<std::thread> workers;
    workers.reserve(n);
    for (int i = 0; i < n; i++) {
        workers.emplace_back(&Crawler::worker, this, std::ref(frontier));
    }
    for (auto& t : workers) {
        t.join();
    }

    std::lock_guard<std::mutex> lock(outcome_mutex_);
    outcome_.cancelled = client_.cancelled();
    return outcome_;
}

void Crawler::worker(Frontier& frontier) {
    Frontier::Item item;
    auto interval = opts_.rate_limit > 0 ? 1.0 / opts_.rate_limit : 0.0;
    auto last_request = std::chrono::steady_clock::time_point{};

    while (frontier.pop(item)) {
        TaskGuard guard{frontier};

        if (client_.cancelled()) {
            frontier.close();
            break;
        }

        if (!frontier.claim()) {
            std::lock_guard<std::mutex> lock(outcome_mutex_);
            outcome_.skipped++;
            continue;
        }

        // Per-worker request spacing
        if (interval > 0 && last_request != std::chrono::steady_clock::time_point{}) {
            double since = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - last_request).count();
            if (since < interval) client_.pause(interval - since);
        }
        last_request = std::chrono::steady_clock::now();

        try {
            process(frontier, item);
        } catch (const std::exception& e) {
            events_.error("page_error", "Error processing " + item.url + ": " + e.what(),
                          {{"url", item.url}});
            observer_.on_error(item.url, "processing_error");
        }

        client_.pause(opts_.scan_delay);
    }
}

bool Crawler::fetch_with_retries(const std::string& url, HttpResponse& resp) {
    int attempts = std::max(1, opts_.max_retries);
    for (int attempt = 1; attempt <= attempts; attempt++) {
        HttpRequest req;
        req.method = "GET";
        req.url = url;
        req.headers["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
        resp = HttpResponse{};
        if (client_.perform(req, resp)) {
            return true;
        }
        events_.warn("request_failed",
                     "Request failed (attempt " + std::to_string(attempt) + "): " + url + ": " + resp.error,
                     {{"url", url}, {"attempt", attempt}});
        if (client_.cancelled()) break;
        if (attempt < attempts) client_.pause(opts_.scan_delay);
    }
    return false;
}

void Crawler::process(Frontier& frontier, const Frontier::Item& item) {
    const std::string& url = item.url;
    {
        std::lock_guard<std::mutex> lock(outcome_mutex_);
        outcome_.visited.push_back(url);
    }
    observer_.on_url(url);
    events_.info("page_fetch", "Scanning: " + url, {{"url", url}, {"depth", item.depth}});

    HttpResponse resp;
    if (!fetch_with_retries(url, resp)) {
        std::lock_guard<std::mutex> lock(outcome_mutex_);
        outcome_.failed++;
        observer_.on_error(url, "request_error");
        return;
    }
    if (item.depth == 0) {
        std::lock_guard<std::mutex> lock(outcome_mutex_);
        outcome_.seed_reached = true;
    }
    observer_.on_response(resp.status, resp.total_time);

    CrawlResult page;
    page.url = url;
    page.depth = item.depth;
    page.status = resp.status;
    page.content_type = resp.header("content-type");
    page.elapsed = resp.total_time;
    page.headers = std::move(resp.headers);
    page.body = std::move(resp.body);

    bool ok_status = page.status < 400;
    if (!ok_status) {
        observer_.on_error(url, page.status >= 500 ? "server_error" : "client_error");
        events_.error("http_error", "Error " + std::to_string(page.status) + " for " + url,
                      {{"url", url}, {"status", page.status}});
    }

    bool html = is_html_content_type(page.content_type);
    if (ok_status && html) {
        if (opts_.extract_forms) {
            page.forms = extract_forms(page.body, url);
            for (const auto& form : page.forms) {
                FormRecord record{url, form, local_timestamp()};
                observer_.on_form(record);
                std::lock_guard<std::mutex> lock(outcome_mutex_);
                outcome_.forms.push_back(std::move(record));
            }
        }
        if (opts_.extract_links) {
            page.links = extract_links(page.body, url);
            for (const auto& link : page.links) {
                LinkRecord record{url, link, local_timestamp()};
                observer_.on_link(record);
                {
                    std::lock_guard<std::mutex> lock(outcome_mutex_);
                    outcome_.links.push_back(record);
                }
                if (item.depth < opts_.max_depth && same_registrable_domain(link, seed_)) {
                    frontier.push(link, item.depth + 1);
                }
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(outcome_mutex_);
        if (ok_status && html) outcome_.processed++;
        else outcome_.failed++;
    }

    observer_.on_page(page);
}
