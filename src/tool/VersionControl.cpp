#include "tool/VersionControl.hpp"

using namespace vcs::tool;

void VersionControl::queryRootStatusAsync(const std::filesystem::path& root, const Completion& done) {
    const auto result = queryRootStatus(root);
    if (result && done) done(root, *result);
}
