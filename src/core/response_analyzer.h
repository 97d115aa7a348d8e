#pragma once
#include <memory>
#include <regex>
#include <string>
#include <vector>

// Response pattern analysis for detecting vulnerability indicators in HTTP responses.
// Detects database error banners, verbose error pages, directory listings,
// unsafe deserialization calls, internal-service content returned to SSRF
// probes, and plain-HTTP package registries.

enum class DatabaseType {
    UNKNOWN,
    MYSQL,
    POSTGRESQL,
    SQL_SERVER,
    ORACLE,
    SQLITE
};

enum class PatternType {
    SQL_ERROR,
    VERBOSE_ERROR,
    DIRECTORY_LISTING,
    DESERIALIZATION,
    SSRF_INDICATOR,
    INSECURE_PACKAGE_SOURCE
};

struct PatternMatch {
    PatternType type;
    std::string pattern_name;
    std::string evidence;           // Matched text snippet
    std::string context;            // Surrounding context
    DatabaseType db_type;           // For SQL errors
    double confidence;              // Confidence score (0.0-1.0)

    PatternMatch()
        : type(PatternType::SQL_ERROR),
          db_type(DatabaseType::UNKNOWN),
          confidence(0.0)
    {}
};

struct AnalysisResult {
    bool has_sql_error;
    bool has_verbose_error;
    bool has_directory_listing;
    bool has_deserialization;
    bool has_ssrf_indicator;
    bool has_insecure_package_source;

    DatabaseType detected_db_type;

    std::vector<PatternMatch> matches;  // All detected patterns
    std::string summary;                // Human-readable summary

    AnalysisResult()
        : has_sql_error(false),
          has_verbose_error(false),
          has_directory_listing(false),
          has_deserialization(false),
          has_ssrf_indicator(false),
          has_insecure_package_source(false),
          detected_db_type(DatabaseType::UNKNOWN)
    {}

    /**
     * @brief Check if any vulnerability indicators were detected
     * @return true if any indicators found
     */
    bool has_indicators() const {
        return !matches.empty();
    }

    /**
     * @brief Matches of one pattern type, in pattern order
     */
    std::vector<PatternMatch> matches_of(PatternType type) const;
};

// Pattern configuration, built in or loaded from JSON
struct PatternConfig {
    std::string name;
    PatternType type;
    std::string regex_pattern;        // regex, or plain text when literal is set
    bool literal;                     // substring match instead of regex
    std::string database_type;        // For SQL errors: "mysql", "postgresql", etc.
    double confidence;                // Default confidence for this pattern
    bool case_sensitive;
    std::string description;

    PatternConfig()
        : type(PatternType::SQL_ERROR),
          literal(false),
          confidence(0.8),
          case_sensitive(false)
    {}
};

class ResponseAnalyzer {
public:
    /// Bodies are only inspected up to this many bytes.
    static constexpr size_t kMaxBodyBytes = 2 * 1024 * 1024;

    /**
     * @brief Create a response analyzer with default patterns
     */
    ResponseAnalyzer();

    /**
     * @brief Create a response analyzer and load extra patterns from JSON
     * @param config_path Path to a {"patterns": [...]} document
     */
    explicit ResponseAnalyzer(const std::string& config_path);

    /**
     * @brief Analyze HTTP response body for vulnerability indicators
     * @param response_body HTTP response body content
     * @return Analysis result with detected patterns
     */
    AnalysisResult analyze(const std::string& response_body) const;

    /**
     * @brief Analyze a body against the patterns of a single type only
     */
    AnalysisResult analyze(const std::string& response_body, PatternType only) const;

    /**
     * @brief Load patterns from a JSON configuration file
     *
     * Entries with an unknown type or an invalid regex are skipped with a
     * warning.
     *
     * @param config_path Path to the pattern file
     * @return true if the file was read and parsed, false otherwise
     */
    bool load_patterns(const std::string& config_path);

    /**
     * @brief Add a custom pattern
     * @param pattern Pattern configuration to add
     * @return false if the regex does not compile
     */
    bool add_pattern(const PatternConfig& pattern);

    /**
     * @brief Get all loaded patterns
     * @return Vector of pattern configurations
     */
    std::vector<PatternConfig> get_patterns() const;

    /**
     * @brief Process-wide analyzer holding the default patterns
     */
    static const ResponseAnalyzer& shared();

    static PatternType parse_pattern_type(const std::string& name, bool& ok);

private:
    struct CompiledPattern {
        PatternConfig config;
        std::shared_ptr<std::regex> regex;   // null for literal patterns
        std::string needle;                  // lower-cased literal text
    };

    std::vector<CompiledPattern> patterns_;

    /**
     * @brief Initialize default patterns (hardcoded)
     */
    void initialize_default_patterns();

    void add_default(PatternType type, const std::string& name, const std::string& pattern,
                     bool literal, const std::string& db = "", double confidence = 0.8);

    AnalysisResult run(const std::string& response_body, const PatternType* only) const;

    /**
     * @brief Match a single pattern against response body
     * @param pattern Pattern to match
     * @param body Response body (truncated)
     * @param lower_body Lower-cased copy of body for literal patterns
     * @param match Output match result if found
     * @return true if pattern matched
     */
    bool match_pattern(const CompiledPattern& pattern,
                       const std::string& body,
                       const std::string& lower_body,
                       PatternMatch& match) const;

    /**
     * @brief Extract context around a match (surrounding text)
     */
    std::string extract_context(const std::string& response_body,
                                size_t match_pos,
                                size_t match_length,
                                size_t context_size = 100) const;

    DatabaseType parse_database_type(const std::string& db_type_str) const;

    std::string build_summary(const AnalysisResult& result) const;
};
