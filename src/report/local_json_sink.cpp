/**
 * @file local_json_sink.cpp
 * @brief Local filesystem result writer
 */

#include "local_json_sink.h"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

LocalJsonSink::LocalJsonSink(std::string output_dir, json config_json)
    : output_dir_(std::move(output_dir)), config_(std::move(config_json)) {}

bool LocalJsonSink::write_json(const std::string& file, const json& doc, std::string& error) const {
    std::string path = (std::filesystem::path(output_dir_) / file).string();
    std::ofstream out(path);
    if (!out.is_open()) {
        error = "Cannot open " + path + " for writing";
        return false;
    }
    out << doc.dump(4) << "\n";
    if (!out) {
        error = "Error writing " + path;
        return false;
    }
    return true;
}

SinkResult LocalJsonSink::save_results(const std::string& scan_id, const json& bundle) {
    SinkResult result;

    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        result.message = "Cannot create " + output_dir_ + ": " + ec.message();
        return result;
    }

    auto section = [&bundle](const char* key) {
        return bundle.contains(key) ? bundle[key] : json::array();
    };
    json summary = bundle.contains("summary") ? bundle["summary"] : json::object();

    std::string error;
    bool ok = write_json("vulnerabilities.json", section("vulnerabilities"), error) &&
              write_json("scanned_links.json", section("scanned_links"), error) &&
              write_json("scanned_forms.json", section("scanned_forms"), error) &&
              write_json("scan_summary.json", summary, error) &&
              write_json("scan_config.json", config_, error);

    if (ok) {
        std::string urls_path = (std::filesystem::path(output_dir_) / "scanned_urls.txt").string();
        std::ofstream urls(urls_path);
        if (!urls.is_open()) {
            error = "Cannot open " + urls_path + " for writing";
            ok = false;
        } else {
            for (const auto& url : section("scanned_urls")) {
                if (url.is_string()) urls << url.get<std::string>() << "\n";
            }
        }
    }

    ok = ok && write_json("detailed_results.json", bundle, error);

    if (!ok) {
        result.message = error;
        return result;
    }
    result.success = true;
    result.message = "Results for scan " + scan_id + " saved to " + output_dir_;
    return result;
}

SinkResult LocalJsonSink::update_progress(const std::string& scan_id, int percent, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_ = percent;
    task_ = message;
    return {true, "Progress for " + scan_id + " updated to " + std::to_string(percent) + "%"};
}

int LocalJsonSink::last_progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

std::string LocalJsonSink::last_task() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return task_;
}
