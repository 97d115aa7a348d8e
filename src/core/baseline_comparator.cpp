// Baseline comparison implementation

#include "baseline_comparator.h"
#include "response_analyzer.h"
#include <algorithm>
#include <cstdlib>
#include <set>
#include <sstream>
#include <unordered_set>

BaselineComparator::BaselineComparator(const Options& opts)
    : opts_(opts) {}

ComparisonResult BaselineComparator::compare(const HttpResponse& baseline_response,
                                             const HttpResponse& test_response) const {
    ComparisonResult result;

    // Compare status codes
    result.baseline_status = baseline_response.status;
    result.test_status = test_response.status;
    result.status_changed = baseline_response.status != test_response.status;

    // Compare response lengths
    result.baseline_length = baseline_response.body.size();
    result.test_length = test_response.body.size();
    result.length_difference = static_cast<long>(result.test_length) - static_cast<long>(result.baseline_length);
    result.length_changed = static_cast<size_t>(std::labs(result.length_difference)) > opts_.length_threshold;

    // Compare content similarity
    if (opts_.check_similarity) {
        result.similarity_score = calculate_jaccard_similarity(baseline_response.body, test_response.body);
    }

    // Compare error messages
    const ResponseAnalyzer& analyzer = ResponseAnalyzer::shared();
    std::set<std::string> baseline_errors;
    for (const auto& m : analyzer.analyze(baseline_response.body, PatternType::SQL_ERROR).matches) {
        baseline_errors.insert(m.pattern_name);
    }
    for (const auto& m : analyzer.analyze(test_response.body, PatternType::SQL_ERROR).matches) {
        if (!baseline_errors.count(m.pattern_name)) {
            result.new_errors.push_back(m.evidence);
        }
    }
    result.has_new_errors = !result.new_errors.empty();

    // Compare timing
    result.baseline_time = baseline_response.total_time;
    result.test_time = test_response.total_time;
    result.timing_anomaly = test_response.total_time > opts_.timing_threshold;

    return result;
}

double BaselineComparator::calculate_jaccard_similarity(const std::string& str1, const std::string& str2) {
    if (str1.empty() && str2.empty()) {
        return 1.0;
    }
    if (str1.empty() || str2.empty()) {
        return 0.0;
    }

    // Create sets of words (tokens)
    std::unordered_set<std::string> set1, set2;

    std::istringstream iss1(str1);
    std::string word;
    while (iss1 >> word) {
        std::transform(word.begin(), word.end(), word.begin(), ::tolower);
        set1.insert(word);
    }

    std::istringstream iss2(str2);
    while (iss2 >> word) {
        std::transform(word.begin(), word.end(), word.begin(), ::tolower);
        set2.insert(word);
    }

    // Calculate intersection and union
    size_t intersection = 0;
    for (const auto& w : set1) {
        if (set2.count(w) > 0) {
            intersection++;
        }
    }

    size_t union_size = set1.size() + set2.size() - intersection;

    if (union_size == 0) {
        return 1.0;
    }

    return static_cast<double>(intersection) / static_cast<double>(union_size);
}
