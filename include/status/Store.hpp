#pragma once

#include "status/Record.hpp"

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace vcs::status {

// Path -> Record cache. All mutation is merge or removal under an exclusive lock;
// readers take the shared lock and receive copies.
class Store {
public:
    Store() = default;

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    [[nodiscard]] std::optional<Record> get(const std::filesystem::path& path) const;
    [[nodiscard]] bool contains(const std::filesystem::path& path) const;

    // Every entry replaces the existing record for its path. Relative keys are resolved against base.
    void merge(const StatusMap& subset, const std::filesystem::path& base = {});
    void merge(const RecordMap& subset);

    void remove(const std::filesystem::path& path);
    void removeAll(const std::vector<std::filesystem::path>& paths);

    // Atomic swap, readers never see a partially rebuilt store.
    void replace(RecordMap&& records);

    void clear();

    [[nodiscard]] std::size_t count() const;
    [[nodiscard]] RecordMap snapshot() const;

    // Builds the records for a tool result without touching the store.
    static RecordMap toRecords(const StatusMap& subset, const std::filesystem::path& base = {});

private:
    mutable std::shared_mutex mutex_;
    RecordMap records_;
};

}
