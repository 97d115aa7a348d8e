/**
 * @file analyzer.cpp
 * @brief Analyzer registry and probe limiter
 */

#include "analyzer.h"
#include "access_control.h"
#include "auth_failures.h"
#include "crypto_failures.h"
#include "insecure_design.h"
#include "integrity_failures.h"
#include "logging_monitoring.h"
#include "misconfiguration.h"
#include "security_headers.h"
#include "ssrf.h"
#include "vulnerable_components.h"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <iostream>

std::string to_lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower_copy(haystack).find(to_lower_copy(needle)) != std::string::npos;
}

std::string page_header(const CrawlResult& page, const std::string& name) {
    std::string key = to_lower_copy(name);
    for (const auto& h : page.headers) {
        if (to_lower_copy(h.first) == key) return h.second;
    }
    return {};
}

std::vector<std::string> page_header_values(const CrawlResult& page, const std::string& name) {
    std::string key = to_lower_copy(name);
    std::vector<std::string> values;
    for (const auto& h : page.headers) {
        if (to_lower_copy(h.first) == key) values.push_back(h.second);
    }
    return values;
}

bool is_button_input(const std::string& type) {
    return type == "submit" || type == "button" || type == "image" || type == "reset";
}

std::vector<std::pair<std::string, std::string>> sample_form_fields(const Form& form) {
    auto stamp = std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());

    std::vector<std::pair<std::string, std::string>> fields;
    for (const auto& input : form.inputs) {
        if (input.name.empty() || is_button_input(input.type) || input.type == "file") continue;
        if (input.type == "email") {
            fields.emplace_back(input.name, "test" + stamp + "@example.com");
        } else if (input.type == "password") {
            fields.emplace_back(input.name, "TestPassword123!");
        } else if (input.type == "number") {
            fields.emplace_back(input.name, "123");
        } else if (input.type == "checkbox" || input.type == "radio") {
            fields.emplace_back(input.name, input.value.empty() ? "on" : input.value);
        } else {
            fields.emplace_back(input.name, "Test value " + stamp);
        }
    }
    return fields;
}

// ProbeLimiter

ProbeLimiter::ProbeLimiter(size_t max_targets) : max_targets_(max_targets) {}

bool ProbeLimiter::try_acquire(const std::string& kind, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& keys = granted_[kind];
    if (keys.count(key)) return false;
    if (keys.size() >= max_targets_) return false;
    keys.insert(key);
    return true;
}

size_t ProbeLimiter::count(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = granted_.find(kind);
    return it == granted_.end() ? 0 : it->second.size();
}

void ProbeLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    granted_.clear();
}

// AnalyzerRegistry

void AnalyzerRegistry::add(std::unique_ptr<Analyzer> analyzer) {
    if (analyzer) analyzers_.push_back(std::move(analyzer));
}

void AnalyzerRegistry::register_defaults(const ScanConfig& config) {
    add(std::make_unique<AccessControlAnalyzer>());
    add(std::make_unique<SecurityHeadersAnalyzer>());
    add(std::make_unique<CryptoFailuresAnalyzer>());
    add(std::make_unique<MisconfigurationAnalyzer>());

    auto components = std::make_unique<VulnerableComponentsAnalyzer>();
    if (!config.vulnerable_libraries_file.empty() &&
        !components->database().load_file(config.vulnerable_libraries_file)) {
        std::cerr << "Warning: Could not load vulnerable library table from "
                  << config.vulnerable_libraries_file << ", using built-in table\n";
    }
    add(std::move(components));

    add(std::make_unique<InsecureDesignAnalyzer>());
    add(std::make_unique<AuthFailuresAnalyzer>());
    add(std::make_unique<IntegrityFailuresAnalyzer>());
    add(std::make_unique<LoggingMonitoringAnalyzer>());
    add(std::make_unique<SsrfAnalyzer>());
}

std::vector<Finding> AnalyzerRegistry::run_page(const CrawlResult& page, const ScanContext& ctx) const {
    std::vector<Finding> all;
    for (const auto& analyzer : analyzers_) {
        if (!analyzer->enabled(ctx.config)) continue;
        if (ctx.client.cancelled()) break;

        std::vector<Finding> found;
        try {
            analyzer->check(page, ctx, found);
        } catch (const std::exception& e) {
            ctx.events.error("check_failed",
                             std::string("Error in ") + analyzer->name() + " check for " + page.url + ": " + e.what(),
                             {{"check", analyzer->name()}, {"url", page.url}});
            continue;
        }
        for (auto& f : found) all.push_back(std::move(f));
    }
    return all;
}

std::vector<Finding> AnalyzerRegistry::run_site(const std::string& seed_url, const ScanContext& ctx) const {
    std::vector<Finding> all;
    for (const auto& analyzer : analyzers_) {
        if (!analyzer->enabled(ctx.config)) continue;
        if (ctx.client.cancelled()) break;

        std::vector<Finding> found;
        try {
            analyzer->sweep_site(seed_url, ctx, found);
        } catch (const std::exception& e) {
            ctx.events.error("check_failed",
                             std::string("Error in ") + analyzer->name() + " sweep: " + e.what(),
                             {{"check", analyzer->name()}, {"url", seed_url}});
            continue;
        }
        for (auto& f : found) all.push_back(std::move(f));
    }
    return all;
}

const Analyzer* AnalyzerRegistry::find(const std::string& name) const {
    for (const auto& analyzer : analyzers_) {
        if (std::strcmp(analyzer->name(), name.c_str()) == 0) return analyzer.get();
    }
    return nullptr;
}
