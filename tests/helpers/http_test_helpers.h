/**
 * @file http_test_helpers.h
 * @brief Network-free HTTP fixtures for the Catch2 tests
 *
 * FakeHttpClient replaces the libcurl transport of HttpClient with canned
 * responses, so the crawler, the analyzers, the injection scanners and the
 * scan coordinator can be exercised without a live target. Everything the
 * real client does before the transport (default headers, cookie jar,
 * cancellation) still runs.
 *
 * Example usage:
 * @code
 *   test_helpers::FakeHttpClient client;
 *   client.on("http://site.test/", test_helpers::html("<a href='/about'>About</a>"));
 *   client.on("http://site.test/about", test_helpers::html("<p>About</p>"));
 *
 *   HttpResponse resp;
 *   REQUIRE(client.get("http://site.test/about", resp));
 *   REQUIRE(resp.status == 200);
 * @endcode
 */

#pragma once

#include "core/http_client.h"
#include "core/scan_config.h"
#include "logging/events.h"
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace test_helpers {

/**
 * @brief A response the fake transport hands back
 */
struct CannedResponse {
    long status = 200;
    std::vector<std::pair<std::string, std::string>> headers;  ///< Names in any case
    std::string body;
    double total_time = 0.01;   ///< Reported request time in seconds
};

/// Computes a response from the request; return false for a transport error.
using Handler = std::function<bool(const HttpRequest& req, HttpResponse& resp)>;

/**
 * @brief A text/html response
 */
CannedResponse html(const std::string& body, long status = 200);

/**
 * @brief A response with the given status, content type and body
 */
CannedResponse respond(long status, const std::string& content_type, const std::string& body);

/**
 * @brief HttpClient whose transport serves canned responses
 *
 * Lookup order for each request: URLs marked as failing, then an exact
 * route for the request's method, then an exact route for any method, then
 * prefix handlers in the order they were added, then the fallback (404
 * "Not Found" unless replaced). Exact routes match the full URL including
 * the query string. Every request is recorded.
 */
class FakeHttpClient : public HttpClient {
public:
    explicit FakeHttpClient(const HttpClient::Options& opts = HttpClient::Options());

    /// Serve resp for url with any method.
    void on(const std::string& url, CannedResponse resp);

    /// Serve resp for url with one method ("GET", "POST", ...).
    void on(const std::string& method, const std::string& url, CannedResponse resp);

    /// Route every URL starting with prefix through a handler.
    void on_prefix(const std::string& prefix, Handler handler);

    /// Handler for requests nothing else matches.
    void set_fallback(Handler handler);

    /// Make requests to url fail at the transport level.
    void fail(const std::string& url);

    /// Delay reported in total_time for every response, on top of the canned value.
    void set_extra_latency(double seconds);

    std::vector<HttpRequest> requests() const;

    /// Number of recorded requests whose URL contains the fragment.
    size_t count(const std::string& url_fragment) const;

    /// Number of recorded requests with the given method.
    size_t count_method(const std::string& method) const;

    void clear_requests();

protected:
    bool execute(const HttpRequest& req, HttpResponse& resp) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, CannedResponse> routes_;   // "METHOD url", "* url"
    std::vector<std::pair<std::string, Handler>> prefix_handlers_;
    std::set<std::string> failing_;
    Handler fallback_;
    double extra_latency_ = 0.0;
    mutable std::vector<HttpRequest> log_;
};

/**
 * @brief Copy a canned response into an HttpResponse the way the transport would
 */
void fill_response(const CannedResponse& canned, const HttpRequest& req, HttpResponse& resp);

/**
 * @brief Scan configuration with every delay set to zero and one worker
 */
ScanConfig fast_config();

/**
 * @brief Fresh empty directory under the system temp directory
 */
std::string make_temp_dir(const std::string& name);

/**
 * @brief Collects events for assertions
 */
class RecordingObserver : public logging::EventObserver {
public:
    void on_event(const logging::ScanEvent& event) override;

    std::vector<logging::ScanEvent> events() const;

    /// Number of events of a kind.
    size_t count(const std::string& kind) const;

private:
    mutable std::mutex mutex_;
    std::vector<logging::ScanEvent> events_;
};

} // namespace test_helpers
