#pragma once
#include <string>
#include <vector>

// SQL injection and XSS payload lists.
// File-backed with built-in fallbacks; explicit lists from the scan config
// replace both.

struct SqlPayload {
    std::string name;
    std::string payload;
    std::string expected_result;   // empty = no result-based signal
};

class PayloadStore {
public:
    /**
     * @brief Store holding the built-in payload lists
     */
    PayloadStore();

    /**
     * @brief Load SQL payloads from a JSON array of {name, payload, expected_result}
     * @return false if the file is missing or malformed (built-ins are kept)
     */
    bool load_sql_file(const std::string& path);

    /**
     * @brief Load XSS payloads, one per line; blank lines and '#' comments are skipped
     * @return false if the file is missing or holds no payloads
     */
    bool load_xss_file(const std::string& path);

    /**
     * @brief Replace the SQL payload list with bare payload strings
     */
    void set_sql_payloads(const std::vector<std::string>& payloads);

    void set_xss_payloads(const std::vector<std::string>& payloads);

    const std::vector<SqlPayload>& sql_payloads() const { return sql_; }
    const std::vector<std::string>& xss_payloads() const { return xss_; }

    static std::vector<SqlPayload> default_sql_payloads();
    static std::vector<std::string> default_xss_payloads();

private:
    std::vector<SqlPayload> sql_;
    std::vector<std::string> xss_;
};
