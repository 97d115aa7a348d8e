#pragma once
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// HTTP client wrapper around libcurl.
// Single point of configuration for every outbound request: timeouts, TLS
// verification, proxy, redirects, custom headers, user agent and a basic
// cookie jar. Shared by the crawler, the analyzers and the injection scanners.

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::optional<bool> follow_redirects;  // overrides Options::follow_redirects
    long timeout_seconds = 0;              // 0 = use Options::timeout_seconds
};

struct HttpResponse {
    long status = 0;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::string effective_url;
    std::string error;
    double total_time = 0.0;
    size_t body_bytes = 0;

    /**
     * @brief First value of a header (names are stored lower-cased)
     * @param name Header name, any case
     * @return Header value, or empty string if absent
     */
    std::string header(const std::string& name) const;

    /**
     * @brief All values of a repeated header such as set-cookie
     */
    std::vector<std::string> header_values(const std::string& name) const;

    bool has_header(const std::string& name) const;
};

class HttpClient {
public:
    struct Options {
        long timeout_seconds;
        long connect_timeout_seconds;
        bool follow_redirects;
        long max_redirects;
        std::string user_agent;
        bool accept_encoding;
        bool verify_ssl;
        bool use_proxy;
        std::string proxy_url;
        bool enable_cookies;
        std::map<std::string, std::string> default_headers;

        Options()
            : timeout_seconds(30),
              connect_timeout_seconds(10),
              follow_redirects(true),
              max_redirects(5),
              user_agent("warden/1.0"),
              accept_encoding(true),
              verify_ssl(true),
              use_proxy(false),
              enable_cookies(true)
        {}
    };

    /**
     * @brief Create an HTTP client with the given options
     * @param opts Client configuration (timeouts, redirects, etc.)
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit HttpClient(const Options& opts = Options());

    virtual ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Make an HTTP request and fill in the response
     *
     * Applies the default headers and the cookie jar, refuses to start once
     * the cancel flag is raised, and merges any Set-Cookie values received.
     *
     * @param req Request details (method, URL, headers, body)
     * @param resp Response object that gets populated
     * @return true if request succeeded, false on error (resp.error is set)
     */
    bool perform(const HttpRequest& req, HttpResponse& resp) const;

    /**
     * @brief GET a URL
     * @param follow_redirects Optional per-request redirect override
     */
    bool get(const std::string& url, HttpResponse& resp,
             std::optional<bool> follow_redirects = std::nullopt) const;

    /**
     * @brief POST URL-encoded form fields
     */
    bool post_form(const std::string& url,
                   const std::vector<std::pair<std::string, std::string>>& fields,
                   HttpResponse& resp,
                   std::optional<bool> follow_redirects = std::nullopt) const;

    /**
     * @brief POST a JSON document
     */
    bool post_json(const std::string& url, const std::string& json_body, HttpResponse& resp,
                   std::optional<bool> follow_redirects = std::nullopt) const;

    /**
     * @brief Submit form fields with the given method
     *
     * "get" puts the fields in the query string, anything else sends them
     * URL-encoded in the body.
     */
    bool send_form(const std::string& method, const std::string& url,
                   const std::vector<std::pair<std::string, std::string>>& fields,
                   HttpResponse& resp,
                   std::optional<bool> follow_redirects = std::nullopt) const;

    /**
     * @brief Abort in-flight and future requests once *flag becomes true
     * @param flag Pointer owned by the caller, or nullptr to detach
     */
    void set_cancel_flag(const std::atomic<bool>* flag);

    bool cancelled() const;

    /**
     * @brief Sleep for the given number of seconds, waking early on cancel
     */
    void pause(double seconds) const;

    /**
     * @brief Build a Cookie header string from a map of cookies
     * @param cookies Map of cookie name -> value
     * @return Cookie header value string (e.g., "name1=value1; name2=value2")
     */
    static std::string build_cookie_header(const std::map<std::string, std::string>& cookies);

    /**
     * @brief Snapshot of the cookie jar
     */
    std::map<std::string, std::string> cookies() const;

    const Options& options() const { return opts_; }

protected:
    /**
     * @brief Transport hook: send the fully prepared request
     *
     * The default implementation uses curl_easy. Tests override it to serve
     * canned responses.
     */
    virtual bool execute(const HttpRequest& req, HttpResponse& resp) const;

private:
    Options opts_;
    const std::atomic<bool>* cancel_flag_ = nullptr;
    mutable std::mutex jar_mutex_;
    mutable std::map<std::string, std::string> jar_;

    void store_cookies(const HttpResponse& resp) const;
};
