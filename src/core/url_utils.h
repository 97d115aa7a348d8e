#pragma once
#include <string>
#include <utility>
#include <vector>

// URL helpers shared by the crawler, the analyzers and the scanners.
// Parsing goes through libcurl's CURLU API; scope decisions use a
// public-suffix aware registrable domain.

/**
 * @brief Canonical form of an absolute URL
 *
 * Lower-cases scheme and host, drops default ports and the fragment, and
 * strips a trailing slash from non-root paths. The query is preserved.
 * Idempotent: normalize_url(normalize_url(u)) == normalize_url(u).
 *
 * @param url Absolute URL
 * @return Normalized URL, or empty string if the URL cannot be parsed
 */
std::string normalize_url(const std::string& url);

/**
 * @brief Resolve href against base following RFC 3986
 * @return Absolute URL without fragment, or empty string on failure
 */
std::string resolve_url(const std::string& base, const std::string& href);

/**
 * @brief True for parseable http/https URLs with a host
 */
bool is_valid_url(const std::string& url);

/**
 * @brief Extract the origin (scheme://host[:port]) from a URL
 * @return Origin string, or empty if URL is invalid
 */
std::string origin_of(const std::string& url);

/**
 * @brief Lower-cased host of a URL, empty if invalid
 */
std::string host_of(const std::string& url);

/**
 * @brief Scheme of a URL ("http", "https"), empty if invalid
 */
std::string scheme_of(const std::string& url);

/**
 * @brief Path component of a URL, "/" when empty
 */
std::string path_of(const std::string& url);

/**
 * @brief Registrable domain (eTLD+1) of a host
 *
 * Looked up in the public suffix list through libpsl, private suffixes
 * (github.io, s3.amazonaws.com, ...) included. IP addresses, single-label
 * hosts and hosts that are themselves a public suffix are returned
 * unchanged.
 */
std::string registrable_domain(const std::string& host);

/**
 * @brief True if both URLs share the same registrable domain
 */
bool same_registrable_domain(const std::string& a, const std::string& b);

/// Percent-decode, turning '+' into a space.
std::string url_decode(const std::string& str);

/// Percent-encode everything except unreserved characters.
std::string url_encode(const std::string& str);

/**
 * @brief Parse the query string of a URL into ordered key/value pairs
 */
std::vector<std::pair<std::string, std::string>> parse_query(const std::string& url);

/**
 * @brief Return url with parameter `name` set to `value`
 *
 * Other parameters keep their order and values. The parameter is appended
 * when it does not exist yet.
 */
std::string set_query_param(const std::string& url, const std::string& name, const std::string& value);

/**
 * @brief application/x-www-form-urlencoded body for the given fields
 */
std::string encode_form(const std::vector<std::pair<std::string, std::string>>& fields);

/**
 * @brief File name a finding is attributed to
 * @return Basename of the URL path, or "index.html" for empty or
 *         trailing-slash paths
 */
std::string file_from_url(const std::string& url);
