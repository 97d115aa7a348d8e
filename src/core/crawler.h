#pragma once
#include "http_client.h"
#include <logging/events.h>
#include <schema/crawl_result.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Concurrent same-site crawler.
// A fixed pool of workers pulls URLs from a shared Frontier, fetches them
// through the shared HttpClient, extracts forms and links, enqueues in-scope
// links one level deeper and hands every fetched page to a CrawlObserver.
// Each normalized URL is processed at most once.

/**
 * @brief Queue of pending URLs plus the set of URLs ever accepted
 *
 * push() is an atomic test-and-insert on the normalized URL, so two workers
 * discovering the same link cannot both enqueue it. pop() blocks until work
 * is available, or until the queue is empty and nothing is in flight, which
 * is the crawl's completion barrier.
 */
class Frontier {
public:
    struct Item {
        std::string url;
        int depth = 0;
    };

    /**
     * @param max_pages Maximum number of URLs that may be claimed for fetching
     * @param excluded_paths Path prefixes that are never accepted
     */
    Frontier(size_t max_pages, std::vector<std::string> excluded_paths);

    /**
     * @brief Accept a URL unless it was seen before or is excluded
     * @return true if the URL was queued
     */
    bool push(const std::string& url, int depth);

    /**
     * @brief Block until an item is queued, the frontier is closed, or the
     *        queue is empty with nothing in flight
     * @return false when the crawl is finished or closed
     */
    bool pop(Item& out);

    /**
     * @brief Reserve one slot of the page budget for a popped item
     * @return false once max_pages URLs have been claimed
     */
    bool claim();

    /**
     * @brief Mark a popped item as finished
     */
    void task_done();

    /**
     * @brief Wake every waiting worker and make pop() return false
     */
    void close();

    bool seen(const std::string& url) const;
    size_t seen_count() const;
    size_t claimed() const;

private:
    size_t max_pages_;
    std::vector<std::string> excluded_paths_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Item> queue_;
    std::set<std::string> seen_;
    size_t in_flight_ = 0;
    size_t claimed_ = 0;
    bool closed_ = false;
};

/**
 * @brief Receives crawl output on the worker threads
 */
class CrawlObserver {
public:
    virtual ~CrawlObserver() = default;

    /// A URL was claimed for fetching.
    virtual void on_url(const std::string& url) { (void)url; }

    virtual void on_link(const LinkRecord& link) { (void)link; }

    virtual void on_form(const FormRecord& form) { (void)form; }

    /// A response arrived; seconds is the total request time.
    virtual void on_response(long status, double seconds) { (void)status; (void)seconds; }

    /// error_type is "request_error", "client_error" or "server_error".
    virtual void on_error(const std::string& url, const std::string& error_type) {
        (void)url; (void)error_type;
    }

    /**
     * @brief A page was fetched; forms and links are already extracted and
     *        in-scope links already queued
     */
    virtual void on_page(const CrawlResult& page) = 0;
};

struct CrawlOutcome {
    std::vector<std::string> visited;   // claimed URLs, in claim order
    std::vector<FormRecord> forms;
    std::vector<LinkRecord> links;
    size_t processed = 0;
    size_t failed = 0;
    size_t skipped = 0;
    bool seed_reached = false;
    bool cancelled = false;
};

class Crawler {
public:
    struct Options {
        int max_depth;
        size_t max_pages;
        int threads;
        int max_retries;
        double scan_delay;       // between retries and after each page, per worker
        double rate_limit;       // requests per second per worker, 0 = unlimited
        bool extract_forms;
        bool extract_links;
        std::vector<std::string> excluded_paths;

        Options()
            : max_depth(3),
              max_pages(100),
              threads(4),
              max_retries(3),
              scan_delay(1.0),
              rate_limit(0.0),
              extract_forms(true),
              extract_links(true)
        {}
    };

    /**
     * @brief Create a crawler
     * @param client HTTP client shared with the checks
     * @param opts Crawl limits
     * @param observer Receiver of pages, links, forms and errors
     * @param events Log event sink
     */
    Crawler(const HttpClient& client, const Options& opts,
            CrawlObserver& observer, logging::EventObserver& events);

    /**
     * @brief Crawl from a seed URL until the frontier drains
     * @throws std::invalid_argument if the seed URL cannot be parsed
     */
    CrawlOutcome run(const std::string& seed_url);

private:
    const HttpClient& client_;
    Options opts_;
    CrawlObserver& observer_;
    logging::EventObserver& events_;

    std::mutex outcome_mutex_;
    CrawlOutcome outcome_;
    std::string seed_;

    void worker(Frontier& frontier);
    void process(Frontier& frontier, const Frontier::Item& item);
    bool fetch_with_retries(const std::string& url, HttpResponse& resp);
};

/**
 * @brief True for text/html and application/xhtml+xml content types
 */
bool is_html_content_type(const std::string& content_type);
