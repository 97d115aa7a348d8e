#pragma once
#include "chain.h"
#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace logging {

// Structured scan events.
// Crawler, analyzers, scanners and the coordinator describe what happened as
// ScanEvent values; observers decide how to render or record them.

enum class Level { Debug, Info, Warning, Error };

const char* level_name(Level level);

struct ScanEvent {
    Level level = Level::Info;
    std::string kind;          // machine-readable tag, e.g. "page_fetched"
    std::string message;
    nlohmann::json fields = nlohmann::json::object();
};

/**
 * @brief Receiver of scan events
 *
 * on_event may be called from several worker threads at once;
 * implementations synchronize internally.
 */
class EventObserver {
public:
    virtual ~EventObserver() = default;

    virtual void on_event(const ScanEvent& event) = 0;

    void debug(const std::string& kind, const std::string& message,
               nlohmann::json fields = nlohmann::json::object());
    void info(const std::string& kind, const std::string& message,
              nlohmann::json fields = nlohmann::json::object());
    void warn(const std::string& kind, const std::string& message,
              nlohmann::json fields = nlohmann::json::object());
    void error(const std::string& kind, const std::string& message,
               nlohmann::json fields = nlohmann::json::object());
};

/**
 * @brief Discards every event
 */
class NullObserver : public EventObserver {
public:
    void on_event(const ScanEvent&) override {}
};

/**
 * @brief Prints events to the console and optionally appends them to a file
 *
 * Info and debug go to stdout, warnings and errors to stderr, each prefixed
 * with the level ("INFO: ..."). Debug events are printed only when verbose.
 * File lines read "YYYY-MM-DD HH:MM:SS - LEVEL - message".
 */
class ConsoleObserver : public EventObserver {
public:
    /**
     * @param verbose Print debug events too
     * @param log_file Optional file to append every event to
     */
    explicit ConsoleObserver(bool verbose = false, const std::string& log_file = "");

    void on_event(const ScanEvent& event) override;

    bool file_enabled() const { return file_.is_open(); }

private:
    bool verbose_;
    std::mutex mutex_;
    std::ofstream file_;
};

/**
 * @brief Records scan lifecycle events in a hash-chained audit log
 *
 * Only events whose kind is in the recorded set are appended; the record's
 * data is the event's fields plus its level and message.
 */
class ChainObserver : public EventObserver {
public:
    explicit ChainObserver(AuditChain& chain);

    void on_event(const ScanEvent& event) override;

    /**
     * @brief Kinds written to the chain by default
     */
    static const std::set<std::string>& lifecycle_kinds();

private:
    AuditChain& chain_;
};

/**
 * @brief Fans each event out to every attached observer
 */
class EventBus : public EventObserver {
public:
    /**
     * @brief Attach an observer; it must outlive the bus
     */
    void attach(EventObserver* observer);

    void on_event(const ScanEvent& event) override;

private:
    std::mutex mutex_;
    std::vector<EventObserver*> observers_;
};

} // namespace logging
