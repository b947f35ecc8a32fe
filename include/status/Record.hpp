#pragma once

#include <cstdint>
#include <filesystem>
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace vcs::status {

// path -> single status character, as reported by the version control tool
using StatusMap = std::unordered_map<std::filesystem::path, char>;

struct Record {
    std::filesystem::path path{};
    char state{'?'};
    std::uintmax_t size{};
    std::filesystem::file_time_type mod_time{};

    Record() = default;
    Record(std::filesystem::path path, char state, std::uintmax_t size,
           std::filesystem::file_time_type modTime);

    // Captures the current size and last write time; an absent file yields size 0 and the epoch.
    static Record fromDisk(const std::filesystem::path& path, char state);

    bool operator==(const Record&) const = default;
};

using RecordMap = std::unordered_map<std::filesystem::path, Record>;

void to_json(nlohmann::json& j, const Record& record);

}
