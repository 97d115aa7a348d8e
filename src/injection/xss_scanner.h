#pragma once
#include <core/http_client.h>
#include <core/payload_store.h>
#include <logging/events.h>
#include <schema/crawl_result.h>
#include <schema/finding.h>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Reflected XSS probing of form fields and URL query parameters.

struct XssReflection {
    std::string payload;
    std::string reflection_type;          // "exact" or "marker"
    std::vector<std::string> contexts;
    bool waf_detected = false;
};

class XssScanner {
public:
    XssScanner(const HttpClient& client, const PayloadStore& payloads,
               logging::EventObserver& events, double payload_delay = 0.5);

    /**
     * @brief Test every text-like field of a form; findings have type "xss"
     *
     * Hidden, submit and button inputs are not tested. The form submitted
     * with its default values is the baseline; payloads already present in
     * it are not counted as reflections.
     */
    std::vector<Finding> scan_form(const Form& form, const std::string& page_url) const;

    /**
     * @brief Test every query parameter of a page; findings have type "reflected_xss"
     *
     * The fetched page is the baseline.
     */
    std::vector<Finding> scan_url_parameters(const CrawlResult& page) const;

    /**
     * @brief Exact reflection outside textarea, code and pre elements
     */
    static bool is_reflected(const std::string& body, const std::string& payload);

    /**
     * @brief Block page wording or a 403/406/429/501 status
     */
    static bool check_for_waf_block(const HttpResponse& resp);

    /**
     * @return "script tag", "event handler", "javascript URI" or "other"
     */
    static std::string classify_payload(const std::string& payload);

    /**
     * @brief A script payload around a random token
     * @param marker Set to the token, e.g. "xssA1b2C3d4"
     */
    static std::string make_marker_payload(std::string& marker);

    /**
     * @brief Finding details for a confirmed reflection
     *
     * Severity is Critical when the reflection lands inside a script body.
     */
    static nlohmann::json reflection_details(const XssReflection& reflection);

private:
    using Fields = std::vector<std::pair<std::string, std::string>>;
    using Sender = std::function<bool(const std::string& value, HttpResponse& resp)>;

    /**
     * @brief Run the payload list, then one marker probe, through a sender
     * @return true and fills out when a reflection is confirmed
     */
    bool probe(const Sender& send, const std::string& label, const std::string& baseline_body,
               XssReflection& out) const;

    const HttpClient& client_;
    const PayloadStore& payloads_;
    logging::EventObserver& events_;
    double payload_delay_;
};
