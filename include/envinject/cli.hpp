#pragma once

#include <envinject/config.hpp>
#include <envinject/env.hpp>
#include <envinject/injector.hpp>
#include <envinject/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace envinject {

struct CliOptions {
    // Only the fields given on the command line are marked explicit
    InjectConfig overrides;
    std::optional<std::string> config_path;
    // Program to exec after a successful pass (everything after "--")
    std::vector<std::string> command;
    bool show_help = false;
    bool show_version = false;
};

// Parse arguments, excluding argv[0].
Result<CliOptions> parse_args(const std::vector<std::string>& args);

std::string usage();
const char* version();

// Defaults < config file (--config, else $ENVINJECT_CONFIG) < command line.
Result<InjectConfig> resolve_config(const CliOptions& opts, const EnvironmentSnapshot& env);

// Process exit status for a finished run:
// 0 success, 1 I/O failure on some file, 2 configuration error, 3 timeout.
int exit_code_for(const Result<InjectReport>& result);

// Resolve the config, apply logging options, run the pass and report.
// Returns the process exit status. Does not exec the command.
int run_injection(const CliOptions& opts, const EnvironmentSnapshot& env);

// Replace the current process with `command`. Returns only on failure.
Status exec_command(const std::vector<std::string>& command);

} // namespace envinject
