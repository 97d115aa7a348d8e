#pragma once
#include <string>
#include <utility>
#include <vector>

/**
 * @file crawl_result.h
 * @brief Data structures produced while crawling
 *
 * Contains the fetched page, the forms and links found on it, and the
 * records kept for the scanned_forms / scanned_links reports.
 */

struct FormInput {
    std::string name;
    std::string type;   // lower-cased; "text" when absent
    std::string value;
};

/**
 * A form as found on a page. Extracted fresh per fetch and passed by value.
 */
struct Form {
    std::string action;   // absolute URL
    std::string method;   // lower-cased, "get" or "post"
    std::vector<FormInput> inputs;
};

struct FormRecord {
    std::string url;
    Form form;
    std::string timestamp;
};

struct LinkRecord {
    std::string source_url;
    std::string target_url;
    std::string timestamp;
};

/**
 * Results from fetching a single URL
 */
struct CrawlResult {
    std::string url;
    int depth = 0;
    long status = 0;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    double elapsed = 0.0;
    std::string content_type;
    std::vector<Form> forms;
    std::vector<std::string> links;
};
