#pragma once
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "bus/message.hpp"

namespace conclave::bus {

class AuditError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Persisted copy of one sent message. `processed` is reserved and always false.
struct AuditRecord {
    Message message;
    bool processed = false;

    nlohmann::json to_json() const;
};

// Append-only destination for audit records. Implementations must serialize
// concurrent appends and throw AuditError on failure, including a repeated id
// they still remember.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void append(const AuditRecord& record) = 0;
    virtual size_t size() const = 0;
};

// JSON Lines file, one record per line, flushed after every append.
// Repeated ids are detected among the last `id_window` records only.
class FileAuditSink : public AuditSink {
public:
    static constexpr size_t DEFAULT_ID_WINDOW = 4096;

    explicit FileAuditSink(const std::filesystem::path& path, size_t id_window = DEFAULT_ID_WINDOW);

    void append(const AuditRecord& record) override;
    size_t size() const override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream out_;
    size_t id_window_;
    size_t written_ = 0;
    std::deque<std::string> recent_order_;
    std::unordered_set<std::string> recent_ids_;
    mutable std::mutex mutex_;
};

// Keeps records in memory, keyed by message id.
class MemoryAuditSink : public AuditSink {
public:
    void append(const AuditRecord& record) override;
    size_t size() const override;

    std::optional<AuditRecord> find(const std::string& message_id) const;
    std::vector<AuditRecord> records() const;

private:
    std::vector<AuditRecord> records_;
    std::unordered_map<std::string, size_t> index_;
    mutable std::mutex mutex_;
};

} // namespace conclave::bus
