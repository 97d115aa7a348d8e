/**
 * @file chain.cpp
 * @brief Hash-linked audit trail of scan lifecycle events
 */

#include "chain.h"
#include <openssl/evp.h>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace logging {

using json = nlohmann::json;

const char* const kGenesisDigest = "sha256:genesis";

namespace {

std::string utc_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&secs, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return out.str();
}

struct ReadResult {
    bool opened = false;
    std::vector<AuditRecord> records;
    bool bad_line = false;     // strict reads stop here
    std::string error;
};

// Helper function
ReadResult read_records(const std::string& path, bool strict) {
    ReadResult result;
    std::ifstream in(path);
    if (!in.is_open()) return result;
    result.opened = true;

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (line.empty()) continue;
        try {
            result.records.push_back(AuditRecord::from_json(json::parse(line)));
        } catch (const json::exception& e) {
            if (strict) {
                result.bad_line = true;
                result.error = e.what();
                return result;
            }
            std::cerr << "Warning: Skipping audit line " << line_no << " of " << path << ": " << e.what() << "\n";
        }
    }
    return result;
}

} // namespace

json AuditRecord::body() const {
    json j;
    j["seq"] = seq;
    j["event"] = event;
    j["time"] = time;
    j["data"] = data;
    j["prev"] = prev;
    if (!scan_id.empty()) j["scan_id"] = scan_id;
    return j;
}

json AuditRecord::to_json() const {
    json j = body();
    j["digest"] = digest;
    return j;
}

AuditRecord AuditRecord::from_json(const json& j) {
    AuditRecord r;
    r.seq = j.at("seq").get<uint64_t>();
    r.event = j.at("event").get<std::string>();
    r.scan_id = j.value("scan_id", "");
    r.time = j.at("time").get<std::string>();
    r.data = j.value("data", json::object());
    r.prev = j.at("prev").get<std::string>();
    r.digest = j.at("digest").get<std::string>();
    return r;
}

std::string AuditChain::digest_of(const AuditRecord& record) {
    // json objects keep keys sorted, so the dump is canonical
    std::string canonical = record.body().dump(-1, ' ', false, json::error_handler_t::replace);

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_Digest(canonical.data(), canonical.size(), md, &md_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream hex;
    hex << "sha256:" << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < md_len; i++) {
        hex << std::setw(2) << static_cast<int>(md[i]);
    }
    return hex.str();
}

AuditChain::AuditChain(const std::string& path, const std::string& scan_id)
    : path_(path), scan_id_(scan_id) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    if (std::filesystem::exists(path, ec)) {
        auto existing = read_records(path, false).records;
        if (!existing.empty()) {
            head_ = existing.back().digest;
            next_seq_ = existing.back().seq + 1;
        }
        auto check = verify(path);
        if (!check.valid) {
            std::cerr << "Warning: Audit log " << path << " already fails verification at record "
                      << check.failed_index << " (" << check.error << ")\n";
        }
    }

    out_.open(path_, std::ios::app);
    if (!out_.is_open()) {
        std::cerr << "Warning: Could not open audit log " << path_ << "\n";
    }
}

std::string AuditChain::head() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return head_;
}

uint64_t AuditChain::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_seq_;
}

bool AuditChain::record(const std::string& event, const json& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) return false;

    AuditRecord r;
    r.seq = next_seq_;
    r.event = event;
    r.scan_id = scan_id_;
    r.time = utc_now();
    r.data = data.is_object() ? data : json{{"value", data}};
    r.prev = head_.empty() ? kGenesisDigest : head_;
    r.digest = digest_of(r);

    out_ << r.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    out_.flush();
    if (!out_.good()) return false;

    head_ = r.digest;
    next_seq_++;
    return true;
}

std::vector<AuditRecord> AuditChain::load(const std::string& path) {
    return read_records(path, false).records;
}

ChainVerification AuditChain::verify(const std::string& path) {
    ChainVerification result;
    ReadResult read = read_records(path, true);
    if (!read.opened) {
        result.valid = false;
        result.error = "cannot open " + path;
        return result;
    }
    if (read.bad_line) {
        result.valid = false;
        result.failed_index = read.records.size();
        result.error = "unparseable entry: " + read.error;
        return result;
    }

    const auto& records = read.records;
    result.entries = records.size();

    std::string expected_prev = kGenesisDigest;
    for (size_t i = 0; i < records.size(); i++) {
        const auto& r = records[i];
        if (r.prev != expected_prev) {
            result.valid = false;
            result.failed_index = i;
            result.error = "chain break: record links to " + r.prev + ", expected " + expected_prev;
            return result;
        }
        if (r.seq != i) {
            result.valid = false;
            result.failed_index = i;
            result.error = "sequence gap: record numbered " + std::to_string(r.seq);
            return result;
        }
        if (digest_of(r) != r.digest) {
            result.valid = false;
            result.failed_index = i;
            result.error = "hash mismatch on " + r.event + " at " + r.time;
            return result;
        }
        expected_prev = r.digest;
    }
    return result;
}

} // namespace logging
