#include "status/Record.hpp"
#include "status/FileStatus.hpp"

#include <chrono>
#include <nlohmann/json.hpp>

using namespace vcs::status;

Record::Record(std::filesystem::path path, const char state, const std::uintmax_t size,
               const std::filesystem::file_time_type modTime)
    : path(std::move(path)), state(state), size(size), mod_time(modTime) {}

Record Record::fromDisk(const std::filesystem::path& path, const char state) {
    namespace fs = std::filesystem;

    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (ec || !fs::is_regular_file(st)) return {path, state, 0, fs::file_time_type{}};

    const auto size = fs::file_size(path, ec);
    const auto size_bytes = ec ? 0 : size;
    const auto mtime = fs::last_write_time(path, ec);
    return {path, state, size_bytes, ec ? fs::file_time_type{} : mtime};
}

void vcs::status::to_json(nlohmann::json& j, const Record& record) {
    using namespace std::chrono;
    const auto sys = file_clock::to_sys(record.mod_time);

    j = {
        {"path", record.path.string()},
        {"state", std::string(1, record.state)},
        {"status", to_string(fromStateChar(record.state))},
        {"size", record.size},
        {"mod_time", duration_cast<seconds>(sys.time_since_epoch()).count()}
    };
}
