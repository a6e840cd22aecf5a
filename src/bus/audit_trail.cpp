#include "bus/audit_trail.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace conclave::bus {

json AuditRecord::to_json() const {
    json j = message.to_json();
    j["processed"] = processed;
    return j;
}

FileAuditSink::FileAuditSink(const std::filesystem::path& path, size_t id_window)
    : path_(path), id_window_(id_window) {
    if (!core::paths::ensure_parent_dir(path_)) {
        throw AuditError("cannot create audit directory for " + path_.string());
    }
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        throw AuditError("cannot open audit trail " + path_.string());
    }
    spdlog::info("Audit trail: {}", path_.string());
}

void FileAuditSink::append(const AuditRecord& record) {
    std::string line = record.to_json().dump();

    std::lock_guard<std::mutex> lock(mutex_);
    if (recent_ids_.count(record.message.id) > 0) {
        throw AuditError("duplicate audit record: " + record.message.id);
    }
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        out_.clear();
        throw AuditError("write failed on " + path_.string());
    }
    written_++;

    if (id_window_ == 0) {
        return;
    }
    recent_ids_.insert(record.message.id);
    recent_order_.push_back(record.message.id);
    if (recent_order_.size() > id_window_) {
        recent_ids_.erase(recent_order_.front());
        recent_order_.pop_front();
    }
}

size_t FileAuditSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

void MemoryAuditSink::append(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index_.count(record.message.id) > 0) {
        throw AuditError("duplicate audit record: " + record.message.id);
    }
    index_[record.message.id] = records_.size();
    records_.push_back(record);
}

size_t MemoryAuditSink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::optional<AuditRecord> MemoryAuditSink::find(const std::string& message_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(message_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return records_[it->second];
}

std::vector<AuditRecord> MemoryAuditSink::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

} // namespace conclave::bus
