#include "status/FileStatus.hpp"

namespace vcs::status {

FileStatus fromStateChar(const char state) noexcept {
    switch (state) {
        case 'C': return FileStatus::Controlled;
        case 'M': return FileStatus::Modified;
        case 'A': return FileStatus::Added;
        case 'R': return FileStatus::Removed;
        case 'I': return FileStatus::Ignored;
        case 'N': return FileStatus::Renamed;
        default: return FileStatus::Uncontrolled;
    }
}

char toStateChar(const FileStatus status) noexcept {
    switch (status) {
        case FileStatus::Controlled: return 'C';
        case FileStatus::Modified: return 'M';
        case FileStatus::Added: return 'A';
        case FileStatus::Removed: return 'R';
        case FileStatus::Ignored: return 'I';
        case FileStatus::Renamed: return 'N';
        case FileStatus::Uncontrolled: break;
    }
    return '?';
}

std::string to_string(const FileStatus status) {
    switch (status) {
        case FileStatus::Uncontrolled: return "uncontrolled";
        case FileStatus::Controlled: return "controlled";
        case FileStatus::Modified: return "modified";
        case FileStatus::Added: return "added";
        case FileStatus::Removed: return "removed";
        case FileStatus::Renamed: return "renamed";
        case FileStatus::Ignored: return "ignored";
    }
    return "uncontrolled";
}

}
