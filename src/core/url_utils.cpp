/**
 * @file url_utils.cpp
 * @brief URL parsing, normalization and scoping helpers built on CURLU
 */

#include "url_utils.h"
#include <curl/curl.h>
#include <libpsl.h>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* h) const { curl_url_cleanup(h); }
};
using CurlUrl = std::unique_ptr<CURLU, CurlUrlDeleter>;

/// Read one part of a parsed URL, empty when the part is absent.
std::string get_part(CURLU* h, CURLUPart part, unsigned int flags = 0) {
    char* value = nullptr;
    if (curl_url_get(h, part, &value, flags) != CURLUE_OK || !value) {
        return {};
    }
    std::string out(value);
    curl_free(value);
    return out;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

/// curl rejects raw spaces, browsers encode them.
std::string encode_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == ' ') out += "%20";
        else out.push_back(c);
    }
    return out;
}

/// Parse an absolute URL into a CURLU handle, nullptr on failure.
CurlUrl parse(const std::string& url) {
    CurlUrl h(curl_url());
    if (!h) return nullptr;
    std::string cleaned = encode_spaces(trim(url));
    if (cleaned.empty()) return nullptr;
    if (curl_url_set(h.get(), CURLUPART_URL, cleaned.c_str(), 0) != CURLUE_OK) {
        return nullptr;
    }
    return h;
}

bool is_ip_literal(const std::string& host) {
    if (host.find(':') != std::string::npos || host.find('[') != std::string::npos) {
        return true;
    }
    return !host.empty() &&
           std::all_of(host.begin(), host.end(), [](unsigned char c) {
               return std::isdigit(c) || c == '.';
           });
}

// Context for the public suffix list compiled into libpsl, or the system
// copy when the library was built without one.
const psl_ctx_t* suffix_list() {
    static const psl_ctx_t* ctx = []() -> const psl_ctx_t* {
        const psl_ctx_t* builtin = psl_builtin();
        if (builtin) return builtin;
        const psl_ctx_t* latest = psl_latest(nullptr);
        if (!latest) {
            std::cerr << "Warning: No public suffix list available; "
                      << "scoping falls back to exact hosts" << std::endl;
        }
        return latest;
    }();
    return ctx;
}

} // namespace

std::string normalize_url(const std::string& url) {
    CurlUrl h = parse(url);
    if (!h) return {};

    std::string scheme = to_lower(get_part(h.get(), CURLUPART_SCHEME));
    std::string host = to_lower(get_part(h.get(), CURLUPART_HOST));
    if (scheme.empty() || host.empty()) return {};
    std::string port = get_part(h.get(), CURLUPART_PORT, CURLU_NO_DEFAULT_PORT);
    std::string path = get_part(h.get(), CURLUPART_PATH);
    std::string query = get_part(h.get(), CURLUPART_QUERY);

    if (path.empty()) path = "/";
    while (path.size() > 1 && path.back() == '/') path.pop_back();

    std::string out = scheme + "://" + host;
    if (!port.empty()) out += ":" + port;
    out += path;
    if (!query.empty()) out += "?" + query;
    return out;
}

std::string resolve_url(const std::string& base, const std::string& href) {
    std::string target = trim(href);
    if (target.empty() || target[0] == '#') return {};
    std::string lower = to_lower(target);
    if (lower.rfind("javascript:", 0) == 0 || lower.rfind("mailto:", 0) == 0 ||
        lower.rfind("tel:", 0) == 0 || lower.rfind("data:", 0) == 0) {
        return {};
    }

    CurlUrl h = parse(base);
    if (!h) return {};
    std::string encoded = encode_spaces(target);
    if (curl_url_set(h.get(), CURLUPART_URL, encoded.c_str(), 0) != CURLUE_OK) {
        return {};
    }
    curl_url_set(h.get(), CURLUPART_FRAGMENT, nullptr, 0);
    return get_part(h.get(), CURLUPART_URL);
}

bool is_valid_url(const std::string& url) {
    CurlUrl h = parse(url);
    if (!h) return false;
    std::string scheme = to_lower(get_part(h.get(), CURLUPART_SCHEME));
    return (scheme == "http" || scheme == "https") && !get_part(h.get(), CURLUPART_HOST).empty();
}

/// Extract origin from a full URL.
std::string origin_of(const std::string& url) {
    CurlUrl h = parse(url);
    if (!h) return {};
    std::string scheme = to_lower(get_part(h.get(), CURLUPART_SCHEME));
    std::string host = to_lower(get_part(h.get(), CURLUPART_HOST));
    if (scheme.empty() || host.empty()) return {};
    std::string port = get_part(h.get(), CURLUPART_PORT, CURLU_NO_DEFAULT_PORT);
    std::string origin = scheme + "://" + host;
    if (!port.empty()) origin += ":" + port;
    return origin;
}

std::string host_of(const std::string& url) {
    CurlUrl h = parse(url);
    if (!h) return {};
    return to_lower(get_part(h.get(), CURLUPART_HOST));
}

std::string scheme_of(const std::string& url) {
    CurlUrl h = parse(url);
    if (!h) return {};
    return to_lower(get_part(h.get(), CURLUPART_SCHEME));
}

std::string path_of(const std::string& url) {
    CurlUrl h = parse(url);
    if (!h) return "/";
    std::string path = get_part(h.get(), CURLUPART_PATH);
    return path.empty() ? "/" : path;
}

std::string registrable_domain(const std::string& host) {
    std::string h = to_lower(host);
    while (!h.empty() && h.back() == '.') h.pop_back();
    if (h.empty() || is_ip_literal(h)) return h;

    const psl_ctx_t* psl = suffix_list();
    if (!psl) return h;

    // NULL when the host is itself a public suffix or a single label
    const char* domain = psl_registrable_domain(psl, h.c_str());
    return domain ? std::string(domain) : h;
}

bool same_registrable_domain(const std::string& a, const std::string& b) {
    std::string ha = host_of(a);
    std::string hb = host_of(b);
    if (ha.empty() || hb.empty()) return false;
    return registrable_domain(ha) == registrable_domain(hb);
}

// Helper function to decode URL
std::string url_decode(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); i++) {
        if (str[i] == '%' && i + 2 < str.size() &&
            std::isxdigit(static_cast<unsigned char>(str[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(str[i + 2]))) {
            int val = std::stoi(str.substr(i + 1, 2), nullptr, 16);
            result.push_back(static_cast<char>(val));
            i += 2;
        } else if (str[i] == '+') {
            result.push_back(' ');
        } else {
            result.push_back(str[i]);
        }
    }
    return result;
}

std::string url_encode(const std::string& str) {
    std::ostringstream out;
    out << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return out.str();
}

// Helper function to parse a url for query params
std::vector<std::pair<std::string, std::string>> parse_query(const std::string& url) {
    std::vector<std::pair<std::string, std::string>> params;
    size_t qpos = url.find('?');
    if (qpos == std::string::npos || qpos + 1 >= url.size())
        return params;

    std::string query = url.substr(qpos + 1);
    size_t hash = query.find('#');
    if (hash != std::string::npos) query.erase(hash);

    size_t start = 0;
    while (start < query.size()) {
        size_t amp = query.find('&', start);
        std::string token = (amp == std::string::npos) ?
            query.substr(start) :
            query.substr(start, amp - start);

        size_t eq = token.find('=');
        std::string key = url_decode(eq == std::string::npos ? token : token.substr(0, eq));
        std::string val = (eq == std::string::npos) ? "" : url_decode(token.substr(eq + 1));

        if (!key.empty())
            params.emplace_back(key, val);

        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return params;
}

std::string set_query_param(const std::string& url, const std::string& name, const std::string& value) {
    std::string fragment;
    std::string head = url;
    size_t hash = head.find('#');
    if (hash != std::string::npos) {
        fragment = head.substr(hash);
        head.erase(hash);
    }
    auto params = parse_query(head);
    size_t qpos = head.find('?');
    if (qpos != std::string::npos) head.erase(qpos);

    bool replaced = false;
    for (auto& p : params) {
        if (p.first == name && !replaced) {
            p.second = value;
            replaced = true;
        }
    }
    if (!replaced) params.emplace_back(name, value);
    return head + "?" + encode_form(params) + fragment;
}

std::string encode_form(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty()) out += "&";
        out += url_encode(key) + "=" + url_encode(value);
    }
    return out;
}

std::string file_from_url(const std::string& url) {
    std::string path = path_of(url);
    if (path.empty() || path.back() == '/') return "index.html";
    size_t slash = path.find_last_of('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    return name.empty() ? "index.html" : name;
}
