#include <envinject/assets.hpp>
#include <envinject/glob.hpp>
#include <envinject/log.hpp>
#include <algorithm>

namespace envinject {

namespace fs = std::filesystem;

std::string normalize_extension(const std::string& ext) {
    if (ext.empty() || ext[0] == '.') return ext;
    return "." + ext;
}

bool asset_selected(const AssetFilter& filter, const std::string& rel_path) {
    auto ext = fs::path(rel_path).extension().string();
    if (filter.extensions.count(ext) == 0) return false;
    return !glob_match_any(filter.exclude, rel_path);
}

Result<std::vector<std::string>> enumerate_assets(const fs::path& root_dir,
                                                  const AssetFilter& filter) {
    std::error_code ec;
    if (!fs::is_directory(root_dir, ec)) {
        return InjectError(InjectError::Config,
            "asset root is not a directory: " + root_dir.string(),
            "pass the build output directory with --root");
    }

    std::vector<std::string> results;
    fs::recursive_directory_iterator it(root_dir, fs::directory_options::none, ec);
    if (ec) {
        return InjectError(InjectError::IO,
            "cannot read asset root: " + ec.message(), "", root_dir.string());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return InjectError(InjectError::IO,
                "error walking asset tree: " + ec.message(), "", root_dir.string());
        }

        const auto& entry = *it;
        if (entry.is_symlink(ec)) {
            log::debug("skipping symlink %s", entry.path().string().c_str());
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;

        auto rel = entry.path().lexically_relative(root_dir).generic_string();
        if (asset_selected(filter, rel)) {
            results.push_back(std::move(rel));
        }
    }
    if (ec) {
        return InjectError(InjectError::IO,
            "error walking asset tree: " + ec.message(), "", root_dir.string());
    }

    std::sort(results.begin(), results.end());
    return Result<std::vector<std::string>>::ok(std::move(results));
}

} // namespace envinject
