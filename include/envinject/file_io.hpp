#pragma once

#include <envinject/result.hpp>
#include <filesystem>
#include <string>

namespace envinject {

// Read a whole file as bytes.
Result<std::string> read_file(const std::filesystem::path& path);

// Replace the contents of an existing file. The data is written to a sibling
// temporary file which is then renamed over the target, so a reader never sees
// a half-written asset. The target's permission bits are carried over.
Status write_file_atomic(const std::filesystem::path& path, const std::string& contents);

} // namespace envinject
