#include <envinject/cli.hpp>
#include <envinject/assets.hpp>
#include <envinject/log.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <stdexcept>

#include <unistd.h>

#ifndef ENVINJECT_VERSION
#define ENVINJECT_VERSION "0.0.0"
#endif

namespace envinject {

namespace {

InjectError usage_error(const std::string& msg) {
    return InjectError{InjectError::InvalidArg, msg, "run 'envinject --help' for usage"};
}

Result<int64_t> parse_int(const std::string& flag, const std::string& text) {
    if (text.empty()) return usage_error(flag + " expects a number");
    size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(text, &used);
    } catch (const std::exception&) {
        return usage_error(flag + " expects a number, got '" + text + "'");
    }
    if (used != text.size()) {
        return usage_error(flag + " expects a number, got '" + text + "'");
    }
    return Result<int64_t>::ok(static_cast<int64_t>(v));
}

// Flags that never take a value
bool is_switch(const std::string& arg) {
    static const char* const switches[] = {
        "--help", "--version", "--strict", "--no-overlap-check", "--dry-run",
        "--show-values", "--verbose", "--quiet", "--color", "--no-color"
    };
    for (const char* s : switches) {
        if (arg == s) return true;
    }
    return false;
}

} // namespace

const char* version() {
    return ENVINJECT_VERSION;
}

std::string usage() {
    return
        "usage: envinject [options] [<root-dir>] [-- <command> [args...]]\n"
        "\n"
        "Replace build-time placeholders in static assets with values from the\n"
        "environment, then optionally exec <command> (e.g. the web server).\n"
        "\n"
        "options:\n"
        "  -r, --root <dir>          asset root (default: /usr/share/nginx/html)\n"
        "  -p, --prefix <prefix>     namespace prefix (default: MY_APP_)\n"
        "  -e, --ext <ext>           file extension to rewrite, repeatable (default: .js .css)\n"
        "  -x, --exclude <glob>      skip files matching glob, repeatable\n"
        "      --token-prefix <s>    text before the variable name in placeholders\n"
        "      --token-suffix <s>    text after the variable name in placeholders\n"
        "  -s, --strict              fail if no variable matches the prefix\n"
        "      --no-overlap-check    do not reject placeholders contained in others\n"
        "  -t, --timeout <ms>        overall time budget in milliseconds\n"
        "  -j, --jobs <n>            worker threads\n"
        "  -c, --config <file>       TOML config file (default: $ENVINJECT_CONFIG)\n"
        "  -n, --dry-run             report what would change, write nothing\n"
        "      --show-values         log values next to keys\n"
        "  -v, --verbose             debug output\n"
        "  -q, --quiet               warnings and errors only\n"
        "      --log-level <level>   trace, debug, info, warn or error\n"
        "      --color, --no-color   force colored output on or off\n"
        "  -h, --help                show this help\n"
        "      --version             show version\n";
}

Result<CliOptions> parse_args(const std::vector<std::string>& args) {
    CliOptions opts;
    InjectConfig& cfg = opts.overrides;
    bool ext_given = false;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];

        if (arg == "--") {
            opts.command.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
            if (opts.command.empty()) {
                return usage_error("'--' must be followed by a command");
            }
            break;
        }

        // --name=value
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        if (inline_value && is_switch(arg)) {
            return usage_error(arg + " does not take a value");
        }

        auto take_value = [&]() -> Result<std::string> {
            if (inline_value) return Result<std::string>::ok(*inline_value);
            if (i + 1 >= args.size()) return usage_error(arg + " requires a value");
            return Result<std::string>::ok(args[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (arg == "--version") {
            opts.show_version = true;
        } else if (arg == "-r" || arg == "--root") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            cfg.root = v.value();
            cfg.mark("root");
        } else if (arg == "-p" || arg == "--prefix") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            cfg.prefix = v.value();
            cfg.mark("prefix");
        } else if (arg == "-e" || arg == "--ext") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            if (!ext_given) {
                cfg.extensions.clear();
                ext_given = true;
            }
            cfg.extensions.insert(normalize_extension(v.value()));
            cfg.mark("extensions");
        } else if (arg == "-x" || arg == "--exclude") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            cfg.exclude.push_back(v.value());
            cfg.mark("exclude");
        } else if (arg == "--token-prefix") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            cfg.token_prefix = v.value();
            cfg.mark("token-prefix");
        } else if (arg == "--token-suffix") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            cfg.token_suffix = v.value();
            cfg.mark("token-suffix");
        } else if (arg == "-s" || arg == "--strict") {
            cfg.strict = true;
            cfg.mark("strict");
        } else if (arg == "--no-overlap-check") {
            cfg.check_overlap = false;
            cfg.mark("check-overlap");
        } else if (arg == "-t" || arg == "--timeout") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            auto n = parse_int(arg, v.value());
            if (n.is_err()) return std::move(n).error();
            cfg.timeout_ms = n.value();
            cfg.mark("timeout-ms");
        } else if (arg == "-j" || arg == "--jobs") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            auto n = parse_int(arg, v.value());
            if (n.is_err()) return std::move(n).error();
            if (n.value() < 1 || n.value() > kMaxJobs) {
                return usage_error(arg + " must be between 1 and " +
                                   std::to_string(kMaxJobs) + ", got " + v.value());
            }
            cfg.jobs = static_cast<int>(n.value());
            cfg.mark("jobs");
        } else if (arg == "-c" || arg == "--config") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            opts.config_path = v.value();
        } else if (arg == "-n" || arg == "--dry-run") {
            cfg.dry_run = true;
            cfg.mark("dry-run");
        } else if (arg == "--show-values") {
            cfg.show_values = true;
            cfg.mark("show-values");
        } else if (arg == "-v" || arg == "--verbose") {
            cfg.log_level = log::Debug;
        } else if (arg == "-q" || arg == "--quiet") {
            cfg.log_level = log::Warn;
        } else if (arg == "--log-level") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            auto lvl = log::parse_level(v.value());
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
        } else if (arg == "--color") {
            cfg.color = true;
        } else if (arg == "--no-color") {
            cfg.color = false;
        } else if (!arg.empty() && arg[0] == '-') {
            return usage_error("unknown option '" + arg + "'");
        } else {
            if (cfg.is_set("root")) {
                return usage_error("more than one asset root given ('" + cfg.root +
                                   "' and '" + arg + "')");
            }
            cfg.root = arg;
            cfg.mark("root");
        }

    }

    return Result<CliOptions>::ok(std::move(opts));
}

Result<InjectConfig> resolve_config(const CliOptions& opts, const EnvironmentSnapshot& env) {
    InjectConfig effective;

    std::optional<std::string> path = opts.config_path;
    if (!path) {
        auto from_env = env.get("ENVINJECT_CONFIG");
        if (from_env && !from_env->empty()) path = from_env;
    }

    if (path) {
        auto file_cfg = InjectConfig::load(*path);
        if (file_cfg.is_err()) return std::move(file_cfg).error();
        effective.merge(file_cfg.value());
    }

    effective.merge(opts.overrides);
    ENVINJECT_TRY(effective.validate());
    return Result<InjectConfig>::ok(std::move(effective));
}

int exit_code_for(const Result<InjectReport>& result) {
    if (result.is_err()) return result.error().exit_code();
    return result.value().ok() ? 0 : 1;
}

int run_injection(const CliOptions& opts, const EnvironmentSnapshot& env) {
    // Logging flags apply before the config file is read, so its warnings honor them
    if (opts.overrides.log_level) log::set_level(*opts.overrides.log_level);
    if (opts.overrides.color) log::set_color_enabled(*opts.overrides.color);

    auto cfg = resolve_config(opts, env);
    if (cfg.is_err()) {
        log::error("%s", cfg.error().format().c_str());
        return cfg.error().exit_code();
    }
    const InjectConfig& config = cfg.value();
    if (config.log_level) log::set_level(*config.log_level);
    if (config.color) log::set_color_enabled(*config.color);

    log::debug("root=%s prefix=%s jobs=%d timeout=%lldms%s", config.root.c_str(),
               config.prefix.c_str(), config.jobs,
               static_cast<long long>(config.timeout_ms),
               config.strict ? " strict" : "");

    auto result = inject(config.root, env, config);
    if (result.is_err()) {
        log::error("%s", result.error().format().c_str());
    } else if (!result.value().ok()) {
        log::error("%zu file(s) could not be rewritten; the asset tree is partially patched",
                   result.value().io_errors.size());
    }
    return exit_code_for(result);
}

Status exec_command(const std::vector<std::string>& command) {
    if (command.empty()) {
        return InjectError{InjectError::InvalidArg, "exec_command: empty command"};
    }

    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& a : command) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    log::debug("exec %s", command[0].c_str());
    std::fflush(stdout);
    std::fflush(stderr);

    execvp(argv[0], argv.data());

    return InjectError{InjectError::IO,
        "cannot exec '" + command[0] + "': " + std::strerror(errno),
        "check that the command exists and is on PATH"};
}

} // namespace envinject
