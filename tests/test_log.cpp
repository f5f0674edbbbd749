#include <catch2/catch.hpp>
#include <envinject/log.hpp>
#include <cstdio>
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace envinject;

// Capture everything written to stderr while fn runs
static std::string capture_stderr(const std::function<void()>& fn) {
    std::fflush(stderr);
    int saved = dup(fileno(stderr));

    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved, fileno(stderr));
    close(saved);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("set_level / get_level", "[log]") {
    log::set_level(log::Trace);
    REQUIRE(log::get_level() == log::Trace);
    log::set_level(log::Error);
    REQUIRE(log::get_level() == log::Error);
    log::set_level(log::Info);
}

TEST_CASE("level_name strings", "[log]") {
    REQUIRE(std::string(log::level_name(log::Trace)) == "trace");
    REQUIRE(std::string(log::level_name(log::Debug)) == "debug");
    REQUIRE(std::string(log::level_name(log::Info)) == "info");
    REQUIRE(std::string(log::level_name(log::Warn)) == "warn");
    REQUIRE(std::string(log::level_name(log::Error)) == "error");
}

TEST_CASE("parse_level accepts names in any case", "[log]") {
    REQUIRE(log::parse_level("trace").value() == log::Trace);
    REQUIRE(log::parse_level("DEBUG").value() == log::Debug);
    REQUIRE(log::parse_level("Info").value() == log::Info);
    REQUIRE(log::parse_level("warning").value() == log::Warn);
    REQUIRE(log::parse_level("error").value() == log::Error);

    auto bad = log::parse_level("verbose");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == InjectError::InvalidArg);
}

TEST_CASE("color can be forced", "[log]") {
    log::set_color_enabled(true);
    REQUIRE(log::is_color_enabled());
    log::set_color_enabled(false);
    REQUIRE_FALSE(log::is_color_enabled());
}

TEST_CASE("messages below the level are dropped", "[log]") {
    log::set_level(log::Warn);
    log::set_color_enabled(false);
    auto out = capture_stderr([] { log::info("hidden %d", 1); });
    REQUIRE(out.empty());
    log::set_level(log::Info);
}

TEST_CASE("messages at or above the level are printed", "[log]") {
    log::set_level(log::Warn);
    log::set_color_enabled(false);
    auto out = capture_stderr([] {
        log::warn("careful");
        log::error("broken %s", "dist/app.js");
    });
    REQUIRE(out == "warn: careful\nerror: broken dist/app.js\n");
    log::set_level(log::Info);
}

TEST_CASE("colored prefix", "[log]") {
    log::set_color_enabled(true);
    auto out = capture_stderr([] { log::info("hi"); });
    REQUIRE(out.find("\033[32minfo\033[0m: hi") == 0);
    log::set_color_enabled(false);
}

TEST_CASE("concurrent messages stay whole", "[log]") {
    log::set_level(log::Info);
    log::set_color_enabled(false);
    auto out = capture_stderr([] {
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; t++) {
            threads.emplace_back([t] {
                for (int i = 0; i < 20; i++) log::info("worker %d line %d", t, i);
            });
        }
        for (auto& th : threads) th.join();
    });

    size_t lines = 0;
    size_t start = 0;
    while (start < out.size()) {
        size_t nl = out.find('\n', start);
        REQUIRE(nl != std::string::npos);
        REQUIRE(out.compare(start, 12, "info: worker") == 0);
        lines++;
        start = nl + 1;
    }
    REQUIRE(lines == 80);
}
