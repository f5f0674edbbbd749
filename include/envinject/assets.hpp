#pragma once

#include <envinject/result.hpp>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace envinject {

struct AssetFilter {
    // Extensions with a leading dot, compared case-sensitively
    std::set<std::string> extensions;
    // Glob patterns relative to the root; matching files are skipped
    std::vector<std::string> exclude;
};

// Ensure an extension starts with '.', e.g. "js" -> ".js". Empty stays empty.
std::string normalize_extension(const std::string& ext);

bool asset_selected(const AssetFilter& filter, const std::string& rel_path);

// Walk root_dir recursively and return the paths (relative to root_dir, with
// forward slashes) of regular files selected by the filter, sorted
// lexicographically. Symlinks are not followed or selected.
Result<std::vector<std::string>> enumerate_assets(const std::filesystem::path& root_dir,
                                                  const AssetFilter& filter);

} // namespace envinject
