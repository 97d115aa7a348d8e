#pragma once
#include <core/baseline_comparator.h>
#include <core/http_client.h>
#include <core/payload_store.h>
#include <logging/events.h>
#include <schema/crawl_result.h>
#include <schema/finding.h>
#include <string>
#include <vector>

// SQL injection probing of form fields and URL query parameters.
// Each field is tested against the payload list with the other fields held
// at their baseline values; the first confirmed payload ends the field.

class SqlInjectionScanner {
public:
    struct Options {
        size_t length_threshold;   // bytes of body length delta vs. baseline
        double time_threshold;     // seconds of latency
        double payload_delay;      // pause between payloads
        bool baseline_subtraction; // ignore error and result signals already in the baseline

        Options()
            : length_threshold(100),
              time_threshold(2.0),
              payload_delay(0.5),
              baseline_subtraction(false)
        {}
    };

    SqlInjectionScanner(const HttpClient& client,
                        const PayloadStore& payloads,
                        logging::EventObserver& events,
                        const Options& opts = Options());

    /**
     * @brief Test every submittable field of a form
     *
     * The baseline is the form submitted with its default values ("test" for
     * empty ones). When the baseline request fails the form is skipped.
     *
     * @param form Form to test
     * @param page_url Page the form was found on; findings are reported there
     * @return One finding per vulnerable field
     */
    std::vector<Finding> scan_form(const Form& form, const std::string& page_url) const;

    /**
     * @brief Test every query parameter of a fetched page
     *
     * The fetched page itself is the baseline.
     */
    std::vector<Finding> scan_url_parameters(const CrawlResult& page) const;

    /**
     * @brief Classify one probe response
     *
     * Signals in priority order: a database error in the response, the
     * payload's expected result in the response, a body length delta above
     * the threshold, a response slower than the time threshold. With
     * baseline_subtraction the first two only count when the baseline
     * lacks them.
     *
     * @return "Error based", "Result based", "Length based", "Time based",
     *         or empty when none applies
     */
    std::string detect(const HttpResponse& baseline, const HttpResponse& test,
                       const SqlPayload& payload) const;

    /**
     * @brief True if the body carries a database error signature that is not
     *        just the payload echoed back
     */
    static bool is_vulnerable_to_sql_injection(const HttpResponse& resp, const std::string& payload);

private:
    const HttpClient& client_;
    const PayloadStore& payloads_;
    logging::EventObserver& events_;
    Options opts_;
    BaselineComparator comparator_;
};
