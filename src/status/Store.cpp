#include "status/Store.hpp"
#include "log/Registry.hpp"

#include <mutex>

using namespace vcs::status;
using namespace vcs::log;

std::optional<Record> Store::get(const std::filesystem::path& path) const {
    std::shared_lock lock(mutex_);
    if (const auto it = records_.find(path); it != records_.end()) return it->second;
    return std::nullopt;
}

bool Store::contains(const std::filesystem::path& path) const {
    std::shared_lock lock(mutex_);
    return records_.contains(path);
}

RecordMap Store::toRecords(const StatusMap& subset, const std::filesystem::path& base) {
    RecordMap out;
    out.reserve(subset.size());
    for (const auto& [path, state] : subset) {
        const auto abs = (path.is_relative() && !base.empty()) ? (base / path).lexically_normal() : path;
        out.insert_or_assign(abs, Record::fromDisk(abs, state));
    }
    return out;
}

void Store::merge(const StatusMap& subset, const std::filesystem::path& base) {
    if (subset.empty()) return;

    // stat() outside the lock
    merge(toRecords(subset, base));
}

void Store::merge(const RecordMap& subset) {
    if (subset.empty()) return;

    std::unique_lock lock(mutex_);
    for (const auto& [path, record] : subset) records_.insert_or_assign(path, record);

    Registry::store()->debug("[StatusStore] Merged {} records, {} cached", subset.size(), records_.size());
}

void Store::remove(const std::filesystem::path& path) {
    std::unique_lock lock(mutex_);
    records_.erase(path);
}

void Store::removeAll(const std::vector<std::filesystem::path>& paths) {
    std::unique_lock lock(mutex_);
    for (const auto& path : paths) records_.erase(path);
}

void Store::replace(RecordMap&& records) {
    std::unique_lock lock(mutex_);
    records_.swap(records);
    Registry::store()->debug("[StatusStore] Replaced cache contents, {} records", records_.size());
}

void Store::clear() {
    std::unique_lock lock(mutex_);
    records_.clear();
}

std::size_t Store::count() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

RecordMap Store::snapshot() const {
    std::shared_lock lock(mutex_);
    return records_;
}
