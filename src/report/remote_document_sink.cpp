/**
 * @file remote_document_sink.cpp
 * @brief Result upload to a remote document store over HTTP
 */

#include "remote_document_sink.h"
#include <core/findings.h>
#include <core/url_utils.h>

using json = nlohmann::json;

RemoteDocumentSink::RemoteDocumentSink(const HttpClient& client, std::string base_url, std::string token)
    : client_(client), base_url_(std::move(base_url)), token_(std::move(token)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string RemoteDocumentSink::document_url(const std::string& scan_id) const {
    std::string url = base_url_ + "/scans/" + url_encode(scan_id) + ".json";
    if (!token_.empty()) url += "?auth=" + url_encode(token_);
    return url;
}

SinkResult RemoteDocumentSink::send(const std::string& method, const std::string& scan_id,
                                    const json& doc, const std::string& what) const {
    SinkResult result;
    if (base_url_.empty()) {
        result.message = "No results store configured";
        return result;
    }

    HttpRequest req;
    req.method = method;
    req.url = document_url(scan_id);
    req.headers["Content-Type"] = "application/json";
    req.body = doc.dump();

    HttpResponse resp;
    if (!client_.perform(req, resp)) {
        result.message = "Failed to " + what + ": " + resp.error;
        return result;
    }
    if (resp.status < 200 || resp.status >= 300) {
        result.message = "Failed to " + what + ": HTTP " + std::to_string(resp.status);
        return result;
    }
    result.success = true;
    return result;
}

SinkResult RemoteDocumentSink::save_results(const std::string& scan_id, const json& bundle) {
    auto section = [&bundle](const char* key, json fallback) {
        return bundle.contains(key) ? bundle[key] : fallback;
    };

    json doc = {
        {"timestamp", iso_timestamp()},
        {"summary", section("summary", json::object())},
        {"vulnerabilities", section("vulnerabilities", json::array())},
        {"scanned_links", section("scanned_links", json::array())},
        {"scanned_forms", section("scanned_forms", json::array())},
    };

    SinkResult result = send("PUT", scan_id, doc, "save scan results");
    if (result.success) result.message = "Scan results saved with scan ID: " + scan_id;
    return result;
}

SinkResult RemoteDocumentSink::update_progress(const std::string& scan_id, int percent,
                                               const std::string& message) {
    json doc = {
        {"progress", percent},
        {"last_updated", iso_timestamp()},
    };
    if (!message.empty()) doc["current_task"] = message;

    SinkResult result = send("PATCH", scan_id, doc, "update scan progress");
    if (result.success) result.message = "Progress updated to " + std::to_string(percent) + "%";
    return result;
}
