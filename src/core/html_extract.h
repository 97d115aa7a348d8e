#pragma once
#include <schema/crawl_result.h>
#include <string>
#include <vector>

// HTML extraction helpers built on gumbo.
// Every function tolerates malformed, truncated or binary input and returns
// an empty or partial result instead of failing.

struct ScriptTag {
    std::string src;        // absolute URL, empty for inline scripts
    std::string raw_src;    // attribute value as written
    std::string integrity;  // empty when absent
};

/**
 * @brief Extract all forms with their named inputs
 * @param html Page body
 * @param page_url URL the page was fetched from, used to resolve actions
 * @return Forms in document order; action defaults to page_url
 */
std::vector<Form> extract_forms(const std::string& html, const std::string& page_url);

/**
 * @brief Extract href/src targets of a, link, script and img elements
 * @return Resolved, normalized, de-duplicated http(s) URLs
 */
std::vector<std::string> extract_links(const std::string& html, const std::string& page_url);

/**
 * @brief Extract every script element with its integrity attribute
 */
std::vector<ScriptTag> extract_scripts(const std::string& html, const std::string& page_url);

/**
 * @brief Resolved href of every <link rel="stylesheet">
 */
std::vector<std::string> extract_stylesheets(const std::string& html, const std::string& page_url);

/**
 * @brief Lower-cased name attributes of all meta elements
 */
std::vector<std::string> meta_names(const std::string& html);

/**
 * @brief Number of <input type="password"> elements on the page
 */
size_t count_password_inputs(const std::string& html);

/**
 * @brief Remove textarea, code and pre elements including their content
 *
 * Matching is case-insensitive; an unclosed element is stripped to the
 * end of the document.
 */
std::string strip_inert_elements(const std::string& html);

/**
 * @brief Classify where a reflected marker appears in a page
 * @return Any of "script" (inside a script body), "attribute:<name>",
 *         "html" (anywhere in the document) and "url" (as a bare href or src
 *         value); empty if the marker is absent
 */
std::vector<std::string> reflection_contexts(const std::string& html, const std::string& marker);
