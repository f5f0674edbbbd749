#include <catch2/catch.hpp>
#include <envinject/cli.hpp>
#include <envinject/file_io.hpp>
#include <envinject/log.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace envinject;
namespace fs = std::filesystem;

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        static int counter = 0;
        const char* src = std::getenv("ENVINJECT_SOURCE_DIR");
        fs::path base = src ? fs::path(src) / "build" : fs::temp_directory_path();
        path = base / ("envinject_cli_test_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()) +
            "_" + std::to_string(counter++));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }
};

// Keep expected error output out of the test log
struct QuietLog {
    QuietLog() { log::set_level(log::Error); log::set_color_enabled(false); }
    ~QuietLog() { log::set_level(log::Info); }
};

// ===== parse_args =====

TEST_CASE("no arguments leaves everything default", "[cli]") {
    auto r = parse_args({});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().overrides.explicit_fields.empty());
    REQUIRE(r.value().command.empty());
    REQUIRE_FALSE(r.value().config_path.has_value());
}

TEST_CASE("long and short options", "[cli]") {
    auto r = parse_args({"--root", "/srv/www", "-p", "VITE_", "-s", "-j", "4",
                         "--timeout=1500", "-n", "--show-values"});
    REQUIRE(r.is_ok());
    const auto& cfg = r.value().overrides;
    REQUIRE(cfg.root == "/srv/www");
    REQUIRE(cfg.prefix == "VITE_");
    REQUIRE(cfg.strict);
    REQUIRE(cfg.jobs == 4);
    REQUIRE(cfg.timeout_ms == 1500);
    REQUIRE(cfg.dry_run);
    REQUIRE(cfg.show_values);
    REQUIRE(cfg.is_set("timeout-ms"));
}

TEST_CASE("positional root", "[cli]") {
    auto r = parse_args({"dist"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().overrides.root == "dist");
    REQUIRE(r.value().overrides.is_set("root"));
}

TEST_CASE("two roots are rejected", "[cli]") {
    auto r = parse_args({"--root", "a", "b"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == InjectError::InvalidArg);
}

TEST_CASE("repeated --ext replaces the default set", "[cli]") {
    auto r = parse_args({"-e", "js", "--ext", ".html", "--ext=mjs"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().overrides.extensions ==
            std::set<std::string>{".html", ".js", ".mjs"});
}

TEST_CASE("exclude and token decorations", "[cli]") {
    auto r = parse_args({"-x", "**/*.map", "--exclude", "vendor/**",
                         "--token-prefix", "__", "--token-suffix=__", "--no-overlap-check"});
    REQUIRE(r.is_ok());
    const auto& cfg = r.value().overrides;
    REQUIRE(cfg.exclude == std::vector<std::string>{"**/*.map", "vendor/**"});
    REQUIRE(cfg.token_prefix == "__");
    REQUIRE(cfg.token_suffix == "__");
    REQUIRE_FALSE(cfg.check_overlap);
}

TEST_CASE("command after --", "[cli]") {
    auto r = parse_args({"-s", "--", "nginx", "-g", "daemon off;"});
    REQUIRE(r.is_ok());
    std::vector<std::string> expected = {"nginx", "-g", "daemon off;"};
    REQUIRE(r.value().command == expected);
    // options after -- belong to the command
    REQUIRE_FALSE(r.value().overrides.is_set("root"));
}

TEST_CASE("-- without a command is an error", "[cli]") {
    REQUIRE(parse_args({"--"}).is_err());
}

TEST_CASE("logging flags", "[cli]") {
    REQUIRE(parse_args({"-v"}).value().overrides.log_level.value() == log::Debug);
    REQUIRE(parse_args({"-q"}).value().overrides.log_level.value() == log::Warn);
    REQUIRE(parse_args({"--log-level", "trace"}).value().overrides.log_level.value() == log::Trace);
    REQUIRE(parse_args({"--no-color"}).value().overrides.color.value() == false);
    REQUIRE(parse_args({"--log-level=noisy"}).is_err());
}

TEST_CASE("help and version", "[cli]") {
    REQUIRE(parse_args({"-h"}).value().show_help);
    REQUIRE(parse_args({"--version"}).value().show_version);
    REQUIRE(usage().find("--prefix") != std::string::npos);
    REQUIRE(std::string(version()).size() > 0);
}

TEST_CASE("bad arguments", "[cli]") {
    REQUIRE(parse_args({"--bogus"}).error().code == InjectError::InvalidArg);
    REQUIRE(parse_args({"--root"}).is_err());
    REQUIRE(parse_args({"-j", "many"}).is_err());
    REQUIRE(parse_args({"--timeout", "10s"}).is_err());
    REQUIRE(parse_args({"--strict=yes"}).is_err());
}

TEST_CASE("--jobs out of range is rejected before narrowing", "[cli]") {
    // 2^32 + 1 would wrap to 1 as an int
    auto wrapped = parse_args({"--jobs", "4294967297"});
    REQUIRE(wrapped.is_err());
    REQUIRE(wrapped.error().code == InjectError::InvalidArg);

    REQUIRE(parse_args({"-j", "0"}).is_err());
    REQUIRE(parse_args({"-j", "-3"}).is_err());
    REQUIRE(parse_args({"-j", std::to_string(kMaxJobs + 1)}).is_err());
    REQUIRE(parse_args({"-j", std::to_string(kMaxJobs)}).value().overrides.jobs == kMaxJobs);
}

// ===== resolve_config =====

TEST_CASE("command line beats config file beats defaults", "[cli]") {
    TempDir td;
    td.write_file("envinject.toml", R"(
[inject]
root = "/from/file"
prefix = "FILE_"
jobs = 3
)");
    auto opts = parse_args({"--config", (td.path / "envinject.toml").string(),
                            "--prefix", "CLI_"}).value();
    auto r = resolve_config(opts, EnvironmentSnapshot{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().root == "/from/file");
    REQUIRE(r.value().prefix == "CLI_");
    REQUIRE(r.value().jobs == 3);
    REQUIRE(r.value().extensions == std::set<std::string>{".css", ".js"});
}

TEST_CASE("config path from ENVINJECT_CONFIG", "[cli]") {
    TempDir td;
    td.write_file("c.toml", "[inject]\nstrict = true\n");
    auto env = EnvironmentSnapshot::from_entries(
        {"ENVINJECT_CONFIG=" + (td.path / "c.toml").string()});
    auto r = resolve_config(parse_args({}).value(), env);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().strict);
}

TEST_CASE("missing config file is a config error", "[cli]") {
    auto opts = parse_args({"-c", "/nonexistent/envinject.toml"}).value();
    auto r = resolve_config(opts, EnvironmentSnapshot{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == InjectError::Config);
}

TEST_CASE("resolved config is validated", "[cli]") {
    auto opts = parse_args({"--timeout", "-5"}).value();
    auto r = resolve_config(opts, EnvironmentSnapshot{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == InjectError::Config);
}

// ===== exit codes =====

TEST_CASE("exit_code_for maps outcomes", "[cli]") {
    REQUIRE(exit_code_for(Result<InjectReport>::ok(InjectReport{})) == 0);

    InjectReport partial;
    partial.io_errors.push_back(InjectError{InjectError::IO, "denied"});
    REQUIRE(exit_code_for(Result<InjectReport>::ok(partial)) == 1);

    REQUIRE(exit_code_for(InjectError{InjectError::Config, "x"}) == 2);
    REQUIRE(exit_code_for(InjectError{InjectError::Timeout, "x"}) == 3);
}

// ===== run_injection =====

TEST_CASE("run_injection end to end", "[cli]") {
    QuietLog quiet;
    TempDir td;
    td.write_file("static/js/main.js", "window.ENV='MY_APP_ENVIRONMENT';");
    auto env = EnvironmentSnapshot::from_entries({"MY_APP_ENVIRONMENT=uat"});

    auto opts = parse_args({td.path.string()}).value();
    REQUIRE(run_injection(opts, env) == 0);
    REQUIRE(read_file(td.path / "static/js/main.js").value() == "window.ENV='uat';");
}

TEST_CASE("run_injection with nothing to do succeeds", "[cli]") {
    QuietLog quiet;
    TempDir td;
    td.write_file("a.js", "MY_APP_X");
    auto opts = parse_args({td.path.string()}).value();
    REQUIRE(run_injection(opts, EnvironmentSnapshot{}) == 0);
    REQUIRE(read_file(td.path / "a.js").value() == "MY_APP_X");
}

TEST_CASE("run_injection strict without variables fails", "[cli]") {
    QuietLog quiet;
    TempDir td;
    auto opts = parse_args({td.path.string(), "--strict"}).value();
    REQUIRE(run_injection(opts, EnvironmentSnapshot{}) == 2);
}

TEST_CASE("run_injection with a missing root fails", "[cli]") {
    QuietLog quiet;
    TempDir td;
    auto opts = parse_args({(td.path / "missing").string()}).value();
    auto env = EnvironmentSnapshot::from_entries({"MY_APP_X=1"});
    REQUIRE(run_injection(opts, env) == 2);
}

// ===== exec_command =====

TEST_CASE("exec_command rejects an empty command", "[cli]") {
    auto st = exec_command({});
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == InjectError::InvalidArg);
}

TEST_CASE("exec_command reports a missing program", "[cli]") {
    QuietLog quiet;
    auto st = exec_command({"envinject-test-no-such-program-7f3a"});
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == InjectError::IO);
    REQUIRE(st.error().message.find("envinject-test-no-such-program-7f3a") != std::string::npos);
}
