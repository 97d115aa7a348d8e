#pragma once
#include "http_client.h"
#include <string>
#include <vector>

// Baseline comparison for detecting vulnerabilities based on behavioral differences.
// Compares the response to an unmodified request against the response to a
// payload-injected request and reports status, length, content, error and
// timing deltas.

struct ComparisonResult {
    // Status code comparison
    bool status_changed;
    long baseline_status;
    long test_status;

    // Response length comparison
    bool length_changed;
    size_t baseline_length;
    size_t test_length;
    long length_difference;   // test - baseline

    // Content similarity
    double similarity_score;  // 0.0 (completely different) to 1.0 (identical)

    // Error detection
    bool has_new_errors;
    std::vector<std::string> new_errors;  // SQL error patterns found in test but not baseline

    // Timing comparison
    bool timing_anomaly;
    double baseline_time;     // seconds
    double test_time;         // seconds

    ComparisonResult()
        : status_changed(false),
          baseline_status(0),
          test_status(0),
          length_changed(false),
          baseline_length(0),
          test_length(0),
          length_difference(0),
          similarity_score(1.0),
          has_new_errors(false),
          timing_anomaly(false),
          baseline_time(0.0),
          test_time(0.0)
    {}
};

class BaselineComparator {
public:
    struct Options {
        size_t length_threshold;   // |test - baseline| above this flags a change (default 100)
        double timing_threshold;   // test latency above this many seconds is anomalous (default 2.0)
        bool check_similarity;     // similarity is costly on large bodies

        Options()
            : length_threshold(100),
              timing_threshold(2.0),
              check_similarity(true)
        {}
    };

    explicit BaselineComparator(const Options& opts = Options());

    /**
     * @brief Compare baseline and test responses
     * @param baseline_response Baseline HTTP response
     * @param test_response Test HTTP response (with payload injected)
     * @return Comparison result with all metrics
     */
    ComparisonResult compare(const HttpResponse& baseline_response,
                             const HttpResponse& test_response) const;

    /**
     * @brief Calculate Jaccard similarity over whitespace-separated words
     * @param str1 First string
     * @param str2 Second string
     * @return Similarity score (0.0 to 1.0)
     */
    static double calculate_jaccard_similarity(const std::string& str1, const std::string& str2);

    const Options& options() const { return opts_; }

private:
    Options opts_;
};
