#pragma once

#include <cstdint>
#include <string>

namespace vcs::status {

enum class FileStatus : std::uint8_t {
    Uncontrolled = 0,
    Controlled,
    Modified,
    Added,
    Removed,
    Renamed,
    Ignored
};

// Maps the tool's single-character state; '?' and unknown characters are Uncontrolled.
FileStatus fromStateChar(char state) noexcept;

// Inverse of fromStateChar, Uncontrolled maps to '?'.
char toStateChar(FileStatus status) noexcept;

std::string to_string(FileStatus status);

}
