#pragma once
#include <core/http_client.h>
#include <core/scan_config.h>
#include <logging/events.h>
#include <schema/crawl_result.h>
#include <schema/finding.h>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Pluggable per-response checks.
// Every vulnerability category is an Analyzer; the AnalyzerRegistry runs the
// enabled ones against each fetched page and isolates their failures from one
// another.

/**
 * @brief First value of a response header on a fetched page (case-insensitive)
 */
std::string page_header(const CrawlResult& page, const std::string& name);

std::vector<std::string> page_header_values(const CrawlResult& page, const std::string& name);

std::string to_lower_copy(std::string s);

/**
 * @brief Case-insensitive substring test
 */
bool contains_ci(const std::string& haystack, const std::string& needle);

/**
 * @brief Plausible values for the submittable inputs of a form
 *
 * Used by the probes that submit forms. Submit, button, image, reset and
 * file inputs and unnamed inputs are left out; email, password and number
 * fields get values of the right shape, checkboxes and radios keep their
 * value ("on" when empty).
 */
std::vector<std::pair<std::string, std::string>> sample_form_fields(const Form& form);

/**
 * @brief True for submit, button, image and reset inputs
 */
bool is_button_input(const std::string& type);

/**
 * @brief Caps the distinct targets an active probe may hit per scan
 *
 * Keys are grouped by probe kind ("brute_force", "ssrf_api", ...). A key is
 * granted once; later requests for the same key, or for new keys once the
 * kind has reached its cap, are refused.
 */
class ProbeLimiter {
public:
    explicit ProbeLimiter(size_t max_targets = 10);

    /**
     * @return true the first time (kind, key) is seen while under the cap
     */
    bool try_acquire(const std::string& kind, const std::string& key);

    size_t count(const std::string& kind) const;

    void reset();

private:
    size_t max_targets_;
    mutable std::mutex mutex_;
    std::map<std::string, std::set<std::string>> granted_;
};

/**
 * @brief Everything a check may use besides the page itself
 */
struct ScanContext {
    const HttpClient& client;
    const ScanConfig& config;
    logging::EventObserver& events;
    ProbeLimiter& probes;
};

class Analyzer {
public:
    virtual ~Analyzer() = default;

    /// Short identifier used in log events, e.g. "security_headers".
    virtual const char* name() const = 0;

    /**
     * @brief Whether the category is switched on in the config
     */
    virtual bool enabled(const ScanConfig& config) const = 0;

    /**
     * @brief Inspect one fetched page
     *
     * May be called concurrently from several crawl workers. Must not throw
     * on malformed markup; anything it does throw is contained by the
     * registry.
     *
     * @param page Fetched page with extracted forms and links
     * @param ctx Shared client, config, events and probe limits
     * @param findings Output list to append to
     */
    virtual void check(const CrawlResult& page, const ScanContext& ctx,
                       std::vector<Finding>& findings) const = 0;

    /**
     * @brief Site-level sweep run once per scan before the crawl
     */
    virtual void sweep_site(const std::string& seed_url, const ScanContext& ctx,
                            std::vector<Finding>& findings) const {
        (void)seed_url; (void)ctx; (void)findings;
    }
};

class AnalyzerRegistry {
public:
    void add(std::unique_ptr<Analyzer> analyzer);

    /**
     * @brief Register every built-in analyzer, access control first
     */
    void register_defaults(const ScanConfig& config);

    /**
     * @brief Run check() of each enabled analyzer
     *
     * An analyzer that throws contributes no findings for this page and is
     * reported as a "check_failed" error event.
     */
    std::vector<Finding> run_page(const CrawlResult& page, const ScanContext& ctx) const;

    /**
     * @brief Run sweep_site() of each enabled analyzer, in registration order
     */
    std::vector<Finding> run_site(const std::string& seed_url, const ScanContext& ctx) const;

    size_t size() const { return analyzers_.size(); }

    const Analyzer* find(const std::string& name) const;

private:
    std::vector<std::unique_ptr<Analyzer>> analyzers_;
};
