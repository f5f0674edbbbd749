#pragma once

#include <envinject/config.hpp>
#include <envinject/env.hpp>
#include <envinject/result.hpp>
#include <envinject/substitution.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace envinject {

struct InjectReport {
    size_t files_scanned = 0;
    size_t files_modified = 0;   // in a dry run: files that would be modified
    size_t replacements = 0;
    bool dry_run = false;

    // Relative paths, in traversal order
    std::vector<std::string> modified_files;

    // One entry per substitution announced, in key order
    std::vector<std::string> announced_keys;

    // Per-file read/write failures. The run continued past each of them.
    std::vector<InjectError> io_errors;

    bool ok() const { return io_errors.empty(); }
};

using Deadline = std::optional<std::chrono::steady_clock::time_point>;

// Replace every placeholder of `set` in one file. The file is written back
// only when at least one replacement happened and dry_run is false.
// Returns the number of replacements.
Result<size_t> rewrite_file(const std::filesystem::path& path,
                            const SubstitutionSet& set, bool dry_run);

// Run one injection pass over root_dir.
//
// Fatal errors (InjectError::Config, InjectError::Timeout) are returned as
// errors. Config errors are always detected before any file is touched.
// Per-file I/O failures do not stop the run; they are collected in
// InjectReport::io_errors.
Result<InjectReport> inject(const std::filesystem::path& root_dir,
                            const EnvironmentSnapshot& env,
                            const InjectConfig& config);

// As inject(), with an explicit deadline instead of config.timeout_ms.
// The deadline is checked before each file is started; no file is started
// once it has passed. Work already in progress is not interrupted: the
// directory walk and a single read or write that blocks (e.g. on a stalled
// network mount) can run past the deadline.
Result<InjectReport> inject_until(const std::filesystem::path& root_dir,
                                  const EnvironmentSnapshot& env,
                                  const InjectConfig& config,
                                  Deadline deadline);

} // namespace envinject
