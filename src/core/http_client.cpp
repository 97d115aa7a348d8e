/**
 * @file http_client.cpp
 * @brief Lightweight HTTP client using libcurl
 */

#include "http_client.h"
#include "url_utils.h"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string_view>
#include <thread>

/// Callback invoked by libcurl to write the received body data.
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* s = static_cast<std::string*>(userdata);
    s->append(ptr, size * nmemb);
    return size * nmemb;
}

/// Callback invoked once per header line to parse header into map.
static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    std::string_view hv(buffer, total);
    auto* headers = static_cast<std::vector<std::pair<std::string, std::string>>*>(userdata);

    // A new status line starts a new header block (redirects, 100-continue)
    if (hv.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }

    auto pos = hv.find(':');
    if (pos != std::string_view::npos) {
        std::string name(hv.substr(0, pos));

        size_t val_start = pos + 1;
        while (val_start < hv.size() && (hv[val_start] == ' ' || hv[val_start] == '\t'))
            val_start++;

        size_t val_end = hv.size();
        while (val_end > val_start && (hv[val_end - 1] == '\r' || hv[val_end - 1] == '\n'))
            val_end--;
        std::string value(hv.substr(val_start, val_end - val_start));

        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return std::tolower(c); });

        headers->emplace_back(std::move(name), std::move(value));
    }
    return total;
}

/// Progress callback used to abort a transfer once the scan is cancelled.
static int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* flag = static_cast<const std::atomic<bool>*>(userdata);
    return (flag && flag->load()) ? 1 : 0;
}

static std::string lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string HttpResponse::header(const std::string& name) const {
    std::string key = lower_copy(name);
    for (const auto& h : headers) {
        if (h.first == key) return h.second;
    }
    return "";
}

std::vector<std::string> HttpResponse::header_values(const std::string& name) const {
    std::string key = lower_copy(name);
    std::vector<std::string> out;
    for (const auto& h : headers) {
        if (h.first == key) out.push_back(h.second);
    }
    return out;
}

bool HttpResponse::has_header(const std::string& name) const {
    std::string key = lower_copy(name);
    for (const auto& h : headers) {
        if (h.first == key) return true;
    }
    return false;
}

/// Initialize global libcurl state.
HttpClient::HttpClient(const Options& opts) : opts_(opts) {
    CURLcode c = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (c != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

/// Clean up global libcurl state.
HttpClient::~HttpClient() {
    curl_global_cleanup();
}

void HttpClient::set_cancel_flag(const std::atomic<bool>* flag) {
    cancel_flag_ = flag;
}

bool HttpClient::cancelled() const {
    return cancel_flag_ && cancel_flag_->load();
}

/// Sleep in short slices so a cancelled scan does not wait out its delays.
void HttpClient::pause(double seconds) const {
    if (seconds <= 0.0) return;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                        std::chrono::duration<double>(seconds));
    while (!cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        auto slice = std::min<std::chrono::steady_clock::duration>(
            deadline - now, std::chrono::milliseconds(50));
        std::this_thread::sleep_for(slice);
    }
}

std::string HttpClient::build_cookie_header(const std::map<std::string, std::string>& cookies) {
    std::string out;
    for (const auto& [name, value] : cookies) {
        if (!out.empty()) out += "; ";
        out += name + "=" + value;
    }
    return out;
}

std::map<std::string, std::string> HttpClient::cookies() const {
    std::lock_guard<std::mutex> lock(jar_mutex_);
    return jar_;
}

/// Merge name=value pairs of every Set-Cookie header into the jar.
void HttpClient::store_cookies(const HttpResponse& resp) const {
    std::lock_guard<std::mutex> lock(jar_mutex_);
    for (const auto& h : resp.headers) {
        if (h.first != "set-cookie") continue;
        std::string pair = h.second.substr(0, h.second.find(';'));
        size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string name = pair.substr(0, eq);
        name.erase(0, name.find_first_not_of(" \t"));
        name.erase(name.find_last_not_of(" \t") + 1);
        if (name.empty()) continue;
        jar_[name] = pair.substr(eq + 1);
    }
}

/// Apply client-wide settings, then hand the request to the transport.
bool HttpClient::perform(const HttpRequest& req, HttpResponse& resp) const {
    if (cancelled()) {
        resp.error = "scan cancelled";
        return false;
    }

    HttpRequest prepared = req;
    for (const auto& [name, value] : opts_.default_headers) {
        if (prepared.headers.find(name) == prepared.headers.end()) {
            prepared.headers[name] = value;
        }
    }
    if (opts_.enable_cookies && prepared.headers.find("Cookie") == prepared.headers.end()) {
        std::string cookie = build_cookie_header(cookies());
        if (!cookie.empty()) prepared.headers["Cookie"] = cookie;
    }

    bool ok = execute(prepared, resp);
    if (opts_.enable_cookies) store_cookies(resp);
    return ok;
}

/// Execute an HTTP request with curl_easy and populate a response object.
bool HttpClient::execute(const HttpRequest& req, HttpResponse& resp) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        resp.error = "curl_easy_init failed";
        return false;
    }

    std::string body;
    std::vector<std::pair<std::string, std::string>> resp_headers;
    bool follow = req.follow_redirects.value_or(opts_.follow_redirects);
    long timeout = req.timeout_seconds > 0 ? req.timeout_seconds : opts_.timeout_seconds;

    // Basic configuration
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, std::min(opts_.connect_timeout_seconds, timeout));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, follow ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, opts_.max_redirects);

    // TLS and proxy
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, opts_.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, opts_.verify_ssl ? 2L : 0L);
    if (opts_.use_proxy && !opts_.proxy_url.empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, opts_.proxy_url.c_str());
    }

    // Response and header callbacks
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp_headers);

    // Cancellation
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(cancel_flag_));
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, cancel_flag_ ? 0L : 1L);

    // Misc options
    curl_easy_setopt(curl, CURLOPT_USERAGENT, opts_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_VERBOSE, 0L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    if (opts_.accept_encoding) curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    // Request headers
    struct curl_slist* curl_headers = nullptr;
    for (const auto& h : req.headers) {
        std::string line = h.first + ": " + h.second;
        curl_headers = curl_slist_append(curl_headers, line.c_str());
    }
    if (curl_headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);

    // HTTP method and body
    if (req.method == "POST" || req.method == "PUT" || req.method == "PATCH") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
    } else if (req.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (req.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    }

    // Error buffer setup
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    // Perform request
    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        resp.error = "scan cancelled";
    } else if (rc != CURLE_OK) {
        resp.error = errbuf[0] ? std::string(errbuf) : curl_easy_strerror(rc);
    }

    // Extract response info
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);

    char* effective_url = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
    if (effective_url) resp.effective_url = effective_url;

    double total_time = 0.0;
    curl_easy_getinfo(curl, CURLINFO_TOTAL_TIME, &total_time);

    // Populate response
    resp.total_time = total_time;
    resp.body = std::move(body);
    resp.body_bytes = resp.body.size();
    resp.headers = std::move(resp_headers);

    // Cleanup
    if (curl_headers) curl_slist_free_all(curl_headers);
    curl_easy_cleanup(curl);
    return rc == CURLE_OK;
}

bool HttpClient::get(const std::string& url, HttpResponse& resp,
                     std::optional<bool> follow_redirects) const {
    HttpRequest req;
    req.url = url;
    req.follow_redirects = follow_redirects;
    return perform(req, resp);
}

bool HttpClient::post_form(const std::string& url,
                           const std::vector<std::pair<std::string, std::string>>& fields,
                           HttpResponse& resp,
                           std::optional<bool> follow_redirects) const {
    HttpRequest req;
    req.method = "POST";
    req.url = url;
    req.headers["Content-Type"] = "application/x-www-form-urlencoded";
    req.body = encode_form(fields);
    req.follow_redirects = follow_redirects;
    return perform(req, resp);
}

bool HttpClient::post_json(const std::string& url, const std::string& json_body, HttpResponse& resp,
                           std::optional<bool> follow_redirects) const {
    HttpRequest req;
    req.method = "POST";
    req.url = url;
    req.headers["Content-Type"] = "application/json";
    req.body = json_body;
    req.follow_redirects = follow_redirects;
    return perform(req, resp);
}

bool HttpClient::send_form(const std::string& method, const std::string& url,
                           const std::vector<std::pair<std::string, std::string>>& fields,
                           HttpResponse& resp,
                           std::optional<bool> follow_redirects) const {
    if (lower_copy(method) == "post") {
        return post_form(url, fields, resp, follow_redirects);
    }
    std::string target = url;
    std::string query = encode_form(fields);
    if (!query.empty()) {
        size_t hash = target.find('#');
        if (hash != std::string::npos) target.erase(hash);
        if (target.find('?') == std::string::npos) {
            target += "?" + query;
        } else {
            if (target.back() != '?' && target.back() != '&') target += "&";
            target += query;
        }
    }
    return get(target, resp, follow_redirects);
}
