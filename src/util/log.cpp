#include <envinject/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>

#include <unistd.h>

namespace envinject::log {

namespace {

struct LevelInfo {
    Level level;
    const char* name;
    const char* color;
};

// One entry per Level, in severity order
constexpr LevelInfo kLevels[] = {
    {Trace, "trace", "\033[90m"},
    {Debug, "debug", "\033[36m"},
    {Info,  "info",  "\033[32m"},
    {Warn,  "warn",  "\033[33m"},
    {Error, "error", "\033[31m"},
};
constexpr const char* kReset = "\033[0m";

std::atomic<Level> g_level{Info};

// Color state is resolved lazily: explicit setting, then NO_COLOR, then isatty.
std::once_flag g_color_once;
std::atomic<bool> g_color_forced{false};
std::atomic<bool> g_color{false};

std::mutex g_write_mutex;

const LevelInfo* find_level(Level lvl) {
    for (const auto& li : kLevels) {
        if (li.level == lvl) return &li;
    }
    return nullptr;
}

bool color_on() {
    std::call_once(g_color_once, [] {
        if (g_color_forced.load()) return;
        // https://no-color.org
        const char* no_color = std::getenv("NO_COLOR");
        g_color.store(!(no_color && *no_color) && isatty(fileno(stderr)));
    });
    return g_color.load();
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < g_level.load(std::memory_order_relaxed)) return;

    va_list sizing;
    va_copy(sizing, args);
    int n = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    std::string body;
    if (n > 0) {
        body.resize(static_cast<size_t>(n) + 1);
        std::vsnprintf(&body[0], body.size(), fmt, args);
        body.resize(static_cast<size_t>(n));
    }

    const LevelInfo* li = find_level(lvl);
    const char* name = li ? li->name : "unknown";

    std::lock_guard<std::mutex> lock(g_write_mutex);
    if (li && color_on()) {
        std::fprintf(stderr, "%s%s%s: %s\n", li->color, name, kReset, body.c_str());
    } else {
        std::fprintf(stderr, "%s: %s\n", name, body.c_str());
    }
}

} // namespace

void set_level(Level lvl) {
    g_level.store(lvl);
}

Level get_level() {
    return g_level.load();
}

void set_color_enabled(bool enabled) {
    g_color_forced.store(true);
    g_color.store(enabled);
}

bool is_color_enabled() {
    return color_on();
}

const char* level_name(Level lvl) {
    const LevelInfo* li = find_level(lvl);
    return li ? li->name : "unknown";
}

Result<Level> parse_level(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning") lower = "warn";

    for (const auto& li : kLevels) {
        if (lower == li.name) return Result<Level>::ok(li.level);
    }
    return InjectError{InjectError::InvalidArg,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

#define ENVINJECT_LOG_FN(fn, lvl)          \
    void fn(const char* fmt, ...) {        \
        va_list args;                      \
        va_start(args, fmt);               \
        emit(lvl, fmt, args);              \
        va_end(args);                      \
    }

ENVINJECT_LOG_FN(trace, Trace)
ENVINJECT_LOG_FN(debug, Debug)
ENVINJECT_LOG_FN(info, Info)
ENVINJECT_LOG_FN(warn, Warn)
ENVINJECT_LOG_FN(error, Error)

#undef ENVINJECT_LOG_FN

} // namespace envinject::log
