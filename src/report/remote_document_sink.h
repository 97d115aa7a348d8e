#pragma once
#include "result_sink.h"
#include <core/http_client.h>
#include <string>

/**
 * @brief Stores results in a remote JSON document store keyed by scan id
 *
 * save_results PUTs {timestamp, summary, vulnerabilities, scanned_links,
 * scanned_forms} to <base_url>/scans/<scan_id>.json and update_progress
 * PATCHes {progress, last_updated, current_task} to the same document. The
 * token, when set, is passed as the auth query parameter. Any status outside
 * 2xx is a failure.
 */
class RemoteDocumentSink : public ResultSink {
public:
    RemoteDocumentSink(const HttpClient& client, std::string base_url, std::string token = "");

    SinkResult save_results(const std::string& scan_id, const nlohmann::json& bundle) override;

    SinkResult update_progress(const std::string& scan_id, int percent,
                               const std::string& message) override;

    /**
     * @brief URL of the document for a scan
     */
    std::string document_url(const std::string& scan_id) const;

private:
    const HttpClient& client_;
    std::string base_url_;
    std::string token_;

    SinkResult send(const std::string& method, const std::string& scan_id,
                    const nlohmann::json& doc, const std::string& what) const;
};
