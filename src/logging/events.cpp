/**
 * @file events.cpp
 * @brief Scan event observers: console, audit chain and fan-out
 */

#include "events.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace logging {

using json = nlohmann::json;

const char* level_name(Level level) {
    switch (level) {
        case Level::Debug:   return "DEBUG";
        case Level::Info:    return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Error:   return "ERROR";
    }
    return "INFO";
}

void EventObserver::debug(const std::string& kind, const std::string& message, json fields) {
    on_event(ScanEvent{Level::Debug, kind, message, std::move(fields)});
}

void EventObserver::info(const std::string& kind, const std::string& message, json fields) {
    on_event(ScanEvent{Level::Info, kind, message, std::move(fields)});
}

void EventObserver::warn(const std::string& kind, const std::string& message, json fields) {
    on_event(ScanEvent{Level::Warning, kind, message, std::move(fields)});
}

void EventObserver::error(const std::string& kind, const std::string& message, json fields) {
    on_event(ScanEvent{Level::Error, kind, message, std::move(fields)});
}

// ConsoleObserver

ConsoleObserver::ConsoleObserver(bool verbose, const std::string& log_file)
    : verbose_(verbose) {
    if (log_file.empty()) return;

    std::error_code ec;
    auto parent = std::filesystem::path(log_file).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    file_.open(log_file, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Warning: Could not open log file " << log_file << "\n";
    }
}

// Helper function
static std::string log_time() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void ConsoleObserver::on_event(const ScanEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (event.level != Level::Debug || verbose_) {
        std::ostream& out = (event.level == Level::Warning || event.level == Level::Error)
                                ? std::cerr : std::cout;
        out << level_name(event.level) << ": " << event.message << "\n";
    }

    if (file_.is_open()) {
        file_ << log_time() << " - " << level_name(event.level) << " - " << event.message << "\n";
        file_.flush();
    }
}

// ChainObserver

ChainObserver::ChainObserver(AuditChain& chain) : chain_(chain) {}

const std::set<std::string>& ChainObserver::lifecycle_kinds() {
    static const std::set<std::string> kinds = {
        "scan_start", "finding_recorded", "scan_complete", "scan_failed",
    };
    return kinds;
}

void ChainObserver::on_event(const ScanEvent& event) {
    if (lifecycle_kinds().count(event.kind) == 0) return;

    json data = event.fields.is_object() ? event.fields : json::object();
    data["level"] = level_name(event.level);
    data["message"] = event.message;
    if (!chain_.record(event.kind, data)) {
        std::cerr << "Warning: Could not append " << event.kind << " to audit log\n";
    }
}

// EventBus

void EventBus::attach(EventObserver* observer) {
    if (!observer) return;
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(observer);
}

void EventBus::on_event(const ScanEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto* observer : observers_) {
        observer->on_event(event);
    }
}

} // namespace logging
