// Response pattern analysis implementation

#include "response_analyzer.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

std::vector<PatternMatch> AnalysisResult::matches_of(PatternType type) const {
    std::vector<PatternMatch> out;
    for (const auto& m : matches) {
        if (m.type == type) out.push_back(m);
    }
    return out;
}

ResponseAnalyzer::ResponseAnalyzer() {
    initialize_default_patterns();
}

ResponseAnalyzer::ResponseAnalyzer(const std::string& config_path) {
    initialize_default_patterns();
    load_patterns(config_path);
}

const ResponseAnalyzer& ResponseAnalyzer::shared() {
    static const ResponseAnalyzer instance;
    return instance;
}

void ResponseAnalyzer::add_default(PatternType type, const std::string& name, const std::string& pattern,
                                   bool literal, const std::string& db, double confidence) {
    PatternConfig p;
    p.name = name;
    p.type = type;
    p.regex_pattern = pattern;
    p.literal = literal;
    p.database_type = db;
    p.confidence = confidence;
    p.case_sensitive = false;
    p.description = name;
    add_pattern(p);
}

void ResponseAnalyzer::initialize_default_patterns() {
    patterns_.clear();
    const bool LIT = true;
    const bool RE = false;

    // Database error banners
    const PatternType S = PatternType::SQL_ERROR;
    add_default(S, "sql_syntax", "SQL syntax", LIT, "mysql", 0.9);
    add_default(S, "mysql_fetch_array", "mysql_fetch_array", LIT, "mysql", 0.95);
    add_default(S, "mysql_fetch_assoc", "mysql_fetch_assoc", LIT, "mysql", 0.95);
    add_default(S, "mysql_num_rows", "mysql_num_rows", LIT, "mysql", 0.95);
    add_default(S, "mysql_result", "mysql_result", LIT, "mysql", 0.9);
    add_default(S, "mysql_query", "mysql_query", LIT, "mysql", 0.9);
    add_default(S, "mysql_error", "mysql error", LIT, "mysql", 0.9);
    add_default(S, "mysql_warning", "Warning: mysql_", LIT, "mysql", 0.95);
    add_default(S, "mysql_valid_result", "valid MySQL result", LIT, "mysql", 0.95);
    add_default(S, "mysql_manual", R"(check the manual that corresponds to your (MySQL|MariaDB) server version)", RE, "mysql", 0.95);
    add_default(S, "mysql_unknown_column", "Unknown column", LIT, "mysql", 0.85);
    add_default(S, "mysql_client", "MySqlClient.", LIT, "mysql", 0.9);
    add_default(S, "mysql_jdbc", "com.mysql.jdbc.exceptions", LIT, "mysql", 0.95);
    add_default(S, "oracle_error", "ORA-", LIT, "oracle", 0.85);
    add_default(S, "sqlite_jdbc", "SQLite/JDBCDriver", LIT, "sqlite", 0.95);
    add_default(S, "sqlite_exception", "SQLite.Exception", LIT, "sqlite", 0.95);
    add_default(S, "sqlite_dotnet", "System.Data.SQLite.SQLiteException", LIT, "sqlite", 0.95);
    add_default(S, "postgresql_error", R"(PostgreSQL.{0,200}ERROR)", RE, "postgresql", 0.9);
    add_default(S, "postgresql_warning", R"(Warning.{0,200}pg_)", RE, "postgresql", 0.9);
    add_default(S, "postgresql_valid_result", "valid PostgreSQL result", LIT, "postgresql", 0.95);
    add_default(S, "postgresql_npgsql", "Npgsql.", LIT, "postgresql", 0.9);
    add_default(S, "mssql_server", "Microsoft SQL Server", LIT, "sql_server", 0.85);
    add_default(S, "mssql_odbc", "ODBC SQL Server Driver", LIT, "sql_server", 0.95);
    add_default(S, "mssql_jdbc", "SQLServer JDBC Driver", LIT, "sql_server", 0.95);
    add_default(S, "mssql_jdbc_package", "com.microsoft.sqlserver.jdbc", LIT, "sql_server", 0.95);
    add_default(S, "mssql_exception", "SQLServerException", LIT, "sql_server", 0.95);
    add_default(S, "mssql_driver", "SQLServerDriver", LIT, "sql_server", 0.9);
    add_default(S, "mssql_unclosed_quote", "Unclosed quotation mark after the character string", LIT, "sql_server", 0.95);
    add_default(S, "mssql_sqlclient", "System.Data.SqlClient.SqlException", LIT, "sql_server", 0.95);
    add_default(S, "mssql_oledb", "Microsoft OLE DB Provider for SQL Server", LIT, "sql_server", 0.95);

    // Verbose error pages and stack traces
    const PatternType V = PatternType::VERBOSE_ERROR;
    add_default(V, "error_keywords", "exception|stack trace|syntax error|fatal error", RE);
    add_default(V, "driver_error", R"((sql|odbc|ole db|jdbc) error)", RE);
    add_default(V, "language_error", R"((php|python|ruby|perl|java|\.net) error)", RE);
    add_default(V, "line_of_file", R"(line \d+ of file)", RE);
    add_default(V, "call_stack", "call stack", LIT);
    add_default(V, "uncaught_exception", "uncaught exception", LIT);
    add_default(V, "debug_info", "debug info", LIT);
    add_default(V, "thrown_in", "thrown in", LIT);
    add_default(V, "undefined_index", "undefined index:", LIT);
    add_default(V, "undefined_variable", "undefined variable:", LIT);
    add_default(V, "error_occurred_in", "error occurred in", LIT);
    add_default(V, "php_warning", "<b>warning</b>:", LIT);
    add_default(V, "php_notice", "<b>notice</b>:", LIT);
    add_default(V, "php_error", "<b>error</b>:", LIT);

    // Directory listings
    const PatternType D = PatternType::DIRECTORY_LISTING;
    add_default(D, "title_index_of", "<title>index of", LIT);
    add_default(D, "h1_directory_listing", "<h1>directory listing", LIT);
    add_default(D, "h1_index_of", "<h1>index of", LIT);
    add_default(D, "parent_directory", "parent directory</a>", LIT);
    add_default(D, "directory_listing_for", "directory listing for", LIT);
    add_default(D, "apache_columns", R"(<pre>name\s+last modified\s+size\s+description)", RE);
    add_default(D, "pre_directory_listing", "<pre>directory listing of", LIT);

    // Unsafe deserialization call sites
    const PatternType Z = PatternType::DESERIALIZATION;
    add_default(Z, "deserialize_call", R"(\.deserialize\()", RE);
    add_default(Z, "java_object_input_stream", "ObjectInputStream", LIT);
    add_default(Z, "java_read_object", R"(readObject\()", RE);
    add_default(Z, "yaml_load", R"(yaml\.load\()", RE);
    add_default(Z, "pickle_loads", R"(pickle\.loads)", RE);
    add_default(Z, "ruby_marshal_load", R"(Marshal\.load)", RE);
    add_default(Z, "php_unserialize", R"(unserialize\()", RE);
    add_default(Z, "from_json", R"(fromJSON\()", RE);
    add_default(Z, "json_parse", R"(JSON\.parse\()", RE);
    add_default(Z, "eval_call", R"(eval\()", RE);
    add_default(Z, "from_char_code", R"(fromCharCode\()", RE);

    // Internal-service content returned to SSRF probes
    const PatternType F = PatternType::SSRF_INDICATOR;
    add_default(F, "aws_instance_metadata", "ami-id|instance-id|instance-type", RE, "", 0.95);
    add_default(F, "aws_placement", "availability-zone|region", RE, "", 0.6);
    add_default(F, "aws_credentials", "security-credentials", LIT, "", 0.95);
    add_default(F, "gcp_project", "project-id|numeric-project-id", RE, "", 0.9);
    add_default(F, "gcp_service_accounts", "instance/service-accounts", LIT, "", 0.95);
    add_default(F, "azure_metadata", R"(compute\.internal|metadata\.azure\.com)", RE, "", 0.9);
    add_default(F, "azure_instance", "metadata/instance", LIT, "", 0.9);
    add_default(F, "internal_title", R"(<title>[^<]{0,200}(dashboard|admin|console))", RE, "", 0.7);
    add_default(F, "internal_heading", R"(<h1>[^<]{0,200}(dashboard|admin|console))", RE, "", 0.7);
    add_default(F, "database_banner", "mysql|postgresql|oracle|mongodb|redis", RE, "", 0.6);
    add_default(F, "database_error", "database error|db error|connection error", RE, "", 0.7);
    add_default(F, "passwd_entries", "root:|nobody:|daemon:|bin:|sys:", RE, "", 0.9);
    add_default(F, "passwd_home", "home/[^/]+:|usr/[^/]+:", RE, "", 0.8);
    add_default(F, "fetch_error", R"(internal server error.{0,200}url|request to.{0,200}failed)", RE, "", 0.7);
    add_default(F, "connect_error", "could not connect to|connection refused", RE, "", 0.7);
    add_default(F, "route_error", "no route to host|host unreachable", RE, "", 0.7);
    add_default(F, "ssh_banner", R"(ssh-.{0,200}key-exchange|protocol mismatch)", RE, "", 0.9);
    add_default(F, "database_handshake", "mysql handshake|sql server", RE, "", 0.8);
    add_default(F, "cache_service", "memcached|redis", RE, "", 0.7);

    // Package registries referenced over plain HTTP
    const PatternType P = PatternType::INSECURE_PACKAGE_SOURCE;
    add_default(P, "npm_http", R"(http://registry\.npmjs\.org)", RE);
    add_default(P, "rubygems_http", R"(http://rubygems\.org)", RE);
    add_default(P, "pypi_http", R"(http://pypi\.org)", RE);
    add_default(P, "maven_http", R"(http://repo\d+\.maven\.org)", RE);
    add_default(P, "jquery_plugins_http", R"(http://plugins\.jquery\.com)", RE);
    add_default(P, "bower_http", R"(http://bower\.herokuapp\.com)", RE);
    add_default(P, "unpkg_http", R"(http://unpkg\.com)", RE);
    add_default(P, "jsdelivr_http", R"(http://cdn\.jsdelivr\.net)", RE);
    add_default(P, "cdnjs_http", R"(http://cdnjs\.cloudflare\.com)", RE);
}

PatternType ResponseAnalyzer::parse_pattern_type(const std::string& name, bool& ok) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    ok = true;
    if (lower == "sql_error") return PatternType::SQL_ERROR;
    if (lower == "verbose_error") return PatternType::VERBOSE_ERROR;
    if (lower == "directory_listing") return PatternType::DIRECTORY_LISTING;
    if (lower == "deserialization") return PatternType::DESERIALIZATION;
    if (lower == "ssrf_indicator") return PatternType::SSRF_INDICATOR;
    if (lower == "insecure_package_source") return PatternType::INSECURE_PACKAGE_SOURCE;
    ok = false;
    return PatternType::SQL_ERROR;
}

bool ResponseAnalyzer::load_patterns(const std::string& config_path) {
    std::ifstream in(config_path);
    if (!in.is_open()) {
        return false;
    }

    // Expected format:
    // {"patterns": [{"name": "...", "type": "sql_error", "regex": "...",
    //                "literal": false, "database_type": "mysql", "confidence": 0.9}]}
    nlohmann::json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Could not parse pattern file " << config_path << ": " << e.what() << "\n";
        return false;
    }
    if (!j.contains("patterns") || !j["patterns"].is_array()) {
        std::cerr << "Warning: Pattern file " << config_path << " has no patterns array\n";
        return false;
    }

    for (const auto& entry : j["patterns"]) {
        if (!entry.is_object()) continue;
        bool ok = false;
        PatternConfig p;
        p.type = parse_pattern_type(entry.value("type", ""), ok);
        if (!ok) {
            std::cerr << "Warning: Skipping pattern with unknown type: " << entry.value("type", "") << "\n";
            continue;
        }
        p.name = entry.value("name", "custom_pattern");
        p.regex_pattern = entry.value("regex", "");
        p.literal = entry.value("literal", false);
        p.database_type = entry.value("database_type", "");
        p.confidence = entry.value("confidence", 0.8);
        p.case_sensitive = entry.value("case_sensitive", false);
        p.description = entry.value("description", p.name);
        if (p.regex_pattern.empty()) continue;
        add_pattern(p);
    }
    return true;
}

bool ResponseAnalyzer::add_pattern(const PatternConfig& pattern) {
    CompiledPattern compiled;
    compiled.config = pattern;
    if (pattern.literal) {
        compiled.needle = pattern.regex_pattern;
        if (!pattern.case_sensitive) {
            std::transform(compiled.needle.begin(), compiled.needle.end(), compiled.needle.begin(), ::tolower);
        }
    } else {
        try {
            auto flags = std::regex_constants::ECMAScript;
            if (!pattern.case_sensitive) flags |= std::regex_constants::icase;
            compiled.regex = std::make_shared<std::regex>(pattern.regex_pattern, flags);
        } catch (const std::regex_error& e) {
            std::cerr << "Warning: Invalid regex for pattern " << pattern.name << ": " << e.what() << "\n";
            return false;
        }
    }
    patterns_.push_back(std::move(compiled));
    return true;
}

std::vector<PatternConfig> ResponseAnalyzer::get_patterns() const {
    std::vector<PatternConfig> out;
    out.reserve(patterns_.size());
    for (const auto& p : patterns_) out.push_back(p.config);
    return out;
}

AnalysisResult ResponseAnalyzer::analyze(const std::string& response_body) const {
    return run(response_body, nullptr);
}

AnalysisResult ResponseAnalyzer::analyze(const std::string& response_body, PatternType only) const {
    return run(response_body, &only);
}

AnalysisResult ResponseAnalyzer::run(const std::string& response_body, const PatternType* only) const {
    AnalysisResult result;

    if (response_body.empty()) {
        result.summary = build_summary(result);
        return result;
    }

    std::string body = response_body.size() > kMaxBodyBytes
        ? response_body.substr(0, kMaxBodyBytes)
        : response_body;
    std::string lower_body = body;
    std::transform(lower_body.begin(), lower_body.end(), lower_body.begin(), ::tolower);

    // Match all patterns against response body
    for (const auto& pattern : patterns_) {
        if (only && pattern.config.type != *only) continue;
        PatternMatch match;
        if (!match_pattern(pattern, body, lower_body, match)) continue;
        result.matches.push_back(match);

        // Update result flags
        switch (match.type) {
            case PatternType::SQL_ERROR:
                result.has_sql_error = true;
                if (result.detected_db_type == DatabaseType::UNKNOWN) {
                    result.detected_db_type = match.db_type;
                }
                break;
            case PatternType::VERBOSE_ERROR:
                result.has_verbose_error = true;
                break;
            case PatternType::DIRECTORY_LISTING:
                result.has_directory_listing = true;
                break;
            case PatternType::DESERIALIZATION:
                result.has_deserialization = true;
                break;
            case PatternType::SSRF_INDICATOR:
                result.has_ssrf_indicator = true;
                break;
            case PatternType::INSECURE_PACKAGE_SOURCE:
                result.has_insecure_package_source = true;
                break;
        }
    }

    result.summary = build_summary(result);
    return result;
}

bool ResponseAnalyzer::match_pattern(const CompiledPattern& pattern,
                                     const std::string& body,
                                     const std::string& lower_body,
                                     PatternMatch& match) const {
    size_t pos = std::string::npos;
    size_t length = 0;

    if (pattern.config.literal) {
        const std::string& haystack = pattern.config.case_sensitive ? body : lower_body;
        pos = haystack.find(pattern.needle);
        length = pattern.needle.size();
    } else if (pattern.regex) {
        try {
            std::smatch regex_match;
            if (std::regex_search(body, regex_match, *pattern.regex)) {
                pos = static_cast<size_t>(regex_match.position(0));
                length = static_cast<size_t>(regex_match.length(0));
            }
        } catch (const std::regex_error&) {
            // Complexity limits on very large inputs count as no match
            return false;
        }
    }
    if (pos == std::string::npos) return false;

    match.type = pattern.config.type;
    match.pattern_name = pattern.config.name;
    match.confidence = pattern.config.confidence;
    match.evidence = body.substr(pos, length);
    match.context = extract_context(body, pos, length);
    match.db_type = parse_database_type(pattern.config.database_type);
    return true;
}

std::string ResponseAnalyzer::extract_context(const std::string& response_body,
                                              size_t match_pos,
                                              size_t match_length,
                                              size_t context_size) const {
    size_t start = (match_pos > context_size) ? match_pos - context_size : 0;
    size_t end = std::min(response_body.length(), match_pos + match_length + context_size);

    std::string context = response_body.substr(start, end - start);

    // Replace newlines with spaces for readability
    std::replace(context.begin(), context.end(), '\n', ' ');
    std::replace(context.begin(), context.end(), '\r', ' ');

    return context;
}

DatabaseType ResponseAnalyzer::parse_database_type(const std::string& db_type_str) const {
    std::string lower = db_type_str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "mysql") {
        return DatabaseType::MYSQL;
    } else if (lower == "postgresql" || lower == "postgres") {
        return DatabaseType::POSTGRESQL;
    } else if (lower == "sql_server" || lower == "mssql" || lower == "sqlserver") {
        return DatabaseType::SQL_SERVER;
    } else if (lower == "oracle") {
        return DatabaseType::ORACLE;
    } else if (lower == "sqlite") {
        return DatabaseType::SQLITE;
    }

    return DatabaseType::UNKNOWN;
}

std::string ResponseAnalyzer::build_summary(const AnalysisResult& result) const {
    if (!result.has_indicators()) {
        return "No vulnerability indicators detected";
    }

    std::vector<std::string> indicators;
    if (result.has_sql_error) {
        std::string db_name = "Unknown";
        switch (result.detected_db_type) {
            case DatabaseType::MYSQL: db_name = "MySQL"; break;
            case DatabaseType::POSTGRESQL: db_name = "PostgreSQL"; break;
            case DatabaseType::SQL_SERVER: db_name = "SQL Server"; break;
            case DatabaseType::ORACLE: db_name = "Oracle"; break;
            case DatabaseType::SQLITE: db_name = "SQLite"; break;
            default: break;
        }
        indicators.push_back("SQL error (" + db_name + ")");
    }
    if (result.has_verbose_error) indicators.push_back("verbose error");
    if (result.has_directory_listing) indicators.push_back("directory listing");
    if (result.has_deserialization) indicators.push_back("deserialization call");
    if (result.has_ssrf_indicator) indicators.push_back("internal service content");
    if (result.has_insecure_package_source) indicators.push_back("insecure package source");

    std::ostringstream summary;
    summary << "Detected: ";
    for (size_t i = 0; i < indicators.size(); ++i) {
        if (i > 0) summary << ", ";
        summary << indicators[i];
    }
    return summary.str();
}
