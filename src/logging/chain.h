#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace logging {

// Tamper-evident audit trail of scan lifecycle events, one JSON record per
// line. A record carries its position in the file and the digest of the
// record before it, and its own digest covers every other field. Editing,
// dropping, reordering or renumbering records is caught by verify().

/// prev of the first record in a file
extern const char* const kGenesisDigest;

/**
 * @brief One line of the audit trail
 */
struct AuditRecord {
    uint64_t seq = 0;          ///< Zero-based position in the file
    std::string event;         ///< scan_start, finding_recorded, ...
    std::string scan_id;       ///< Omitted from the line when empty
    std::string time;          ///< UTC, millisecond precision
    nlohmann::json data = nlohmann::json::object();
    std::string prev;          ///< Digest of the previous record
    std::string digest;        ///< "sha256:" followed by 64 hex digits

    /**
     * @brief Every field except the digest, in canonical key order
     */
    nlohmann::json body() const;

    nlohmann::json to_json() const;

    /**
     * @brief Parse a record; throws nlohmann::json::exception when a
     *        required field is missing or has the wrong type
     */
    static AuditRecord from_json(const nlohmann::json& j);
};

/**
 * @brief Outcome of AuditChain::verify
 */
struct ChainVerification {
    bool valid = true;
    size_t entries = 0;
    size_t failed_index = 0;   // meaningful only when !valid
    std::string error;
};

class AuditChain {
public:
    /**
     * @brief Open an audit file for appending, continuing any chain in it
     *
     * An existing file that already fails verification is extended anyway,
     * with a warning; the damage stays visible to verify().
     *
     * @param path Audit file, created with its parent directory if needed
     * @param scan_id Stamped on every record this instance writes
     */
    AuditChain(const std::string& path, const std::string& scan_id);

    /**
     * @brief Append one record linked to the current head
     * @return false if the file is not open or the write failed
     */
    bool record(const std::string& event, const nlohmann::json& data);

    /// Digest of the last record, empty for a new file.
    std::string head() const;

    /// Records in the file, earlier scans included.
    uint64_t size() const;

    bool is_open() const { return out_.is_open(); }

    const std::string& path() const { return path_; }

    /**
     * @brief Check every link, position and digest of an audit file
     *
     * Any line that does not parse as a record fails verification.
     */
    static ChainVerification verify(const std::string& path);

    /**
     * @brief Read the records of an audit file, skipping unparseable lines
     */
    static std::vector<AuditRecord> load(const std::string& path);

    static std::string digest_of(const AuditRecord& record);

private:
    std::string path_;
    std::string scan_id_;
    std::string head_;
    uint64_t next_seq_ = 0;
    std::ofstream out_;
    mutable std::mutex mutex_;
};

} // namespace logging
