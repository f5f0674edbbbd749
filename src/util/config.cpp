#include <envinject/config.hpp>
#include <envinject/assets.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace envinject {

namespace {

InjectError type_error(const std::string& where, const char* expected) {
    return InjectError{InjectError::Parse,
        "config key '" + where + "' must be " + expected};
}

// Reads tbl[key] into out when present. Missing keys are not an error.
template<typename T>
Result<bool> read_value(const toml::table& tbl, const std::string& section,
                        const char* key, const char* expected, T& out) {
    auto node = tbl[key];
    if (!node) return Result<bool>::ok(false);
    auto v = node.value<T>();
    if (!v) return type_error(section + "." + key, expected);
    out = *v;
    return Result<bool>::ok(true);
}

Result<bool> read_string_list(const toml::table& tbl, const std::string& section,
                              const char* key, std::vector<std::string>& out) {
    auto node = tbl[key];
    if (!node) return Result<bool>::ok(false);
    auto* arr = node.as_array();
    if (!arr) return type_error(section + "." + key, "an array of strings");

    std::vector<std::string> items;
    for (const auto& el : *arr) {
        auto s = el.value<std::string>();
        if (!s) return type_error(section + "." + key, "an array of strings");
        items.push_back(*s);
    }
    out = std::move(items);
    return Result<bool>::ok(true);
}

const std::set<std::string>& known_inject_keys() {
    static const std::set<std::string> keys = {
        "root", "prefix", "extensions", "exclude", "token-prefix", "token-suffix",
        "strict", "check-overlap", "timeout-ms", "jobs", "show-values", "dry-run"
    };
    return keys;
}

} // namespace

Result<InjectConfig> InjectConfig::parse(const std::string& toml_str,
                                         const std::string& source) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source);
    } catch (const toml::parse_error& e) {
        InjectError err{InjectError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
        err.file = source;
        return err;
    }

    InjectConfig cfg;

    // [inject] section
    if (auto* inject = doc["inject"].as_table()) {
        for (const auto& [key, val] : *inject) {
            std::string k(key.str());
            if (known_inject_keys().count(k) == 0) {
                log::warn("ignoring unknown config key 'inject.%s'", k.c_str());
            }
        }

        const std::string sec = "inject";
        struct StringField { const char* key; std::string* dst; };
        StringField strings[] = {
            {"root", &cfg.root},
            {"prefix", &cfg.prefix},
            {"token-prefix", &cfg.token_prefix},
            {"token-suffix", &cfg.token_suffix},
        };
        for (auto& f : strings) {
            auto r = read_value<std::string>(*inject, sec, f.key, "a string", *f.dst);
            if (r.is_err()) return std::move(r).error();
            if (r.value()) cfg.mark(f.key);
        }

        struct BoolField { const char* key; bool* dst; };
        BoolField bools[] = {
            {"strict", &cfg.strict},
            {"check-overlap", &cfg.check_overlap},
            {"show-values", &cfg.show_values},
            {"dry-run", &cfg.dry_run},
        };
        for (auto& f : bools) {
            auto r = read_value<bool>(*inject, sec, f.key, "a boolean", *f.dst);
            if (r.is_err()) return std::move(r).error();
            if (r.value()) cfg.mark(f.key);
        }

        auto timeout = read_value<int64_t>(*inject, sec, "timeout-ms", "an integer", cfg.timeout_ms);
        if (timeout.is_err()) return std::move(timeout).error();
        if (timeout.value()) cfg.mark("timeout-ms");

        int64_t jobs = cfg.jobs;
        auto jobs_r = read_value<int64_t>(*inject, sec, "jobs", "an integer", jobs);
        if (jobs_r.is_err()) return std::move(jobs_r).error();
        if (jobs_r.value()) {
            if (jobs < 1 || jobs > kMaxJobs) {
                return InjectError{InjectError::Parse,
                    "config key 'inject.jobs' must be between 1 and " +
                    std::to_string(kMaxJobs) + ", got " + std::to_string(jobs)};
            }
            cfg.jobs = static_cast<int>(jobs);
            cfg.mark("jobs");
        }

        std::vector<std::string> exts;
        auto ext_r = read_string_list(*inject, sec, "extensions", exts);
        if (ext_r.is_err()) return std::move(ext_r).error();
        if (ext_r.value()) {
            cfg.extensions.clear();
            for (const auto& e : exts) cfg.extensions.insert(normalize_extension(e));
            cfg.mark("extensions");
        }

        auto excl_r = read_string_list(*inject, sec, "exclude", cfg.exclude);
        if (excl_r.is_err()) return std::move(excl_r).error();
        if (excl_r.value()) cfg.mark("exclude");
    }

    // [log] section
    if (auto* lg = doc["log"].as_table()) {
        std::string level;
        auto level_r = read_value<std::string>(*lg, "log", "level", "a string", level);
        if (level_r.is_err()) return std::move(level_r).error();
        if (level_r.value()) {
            auto parsed = log::parse_level(level);
            if (parsed.is_err()) {
                auto err = std::move(parsed).error();
                err.code = InjectError::Parse;
                err.file = source;
                return err;
            }
            cfg.log_level = parsed.value();
        }

        bool color = false;
        auto color_r = read_value<bool>(*lg, "log", "color", "a boolean", color);
        if (color_r.is_err()) return std::move(color_r).error();
        if (color_r.value()) cfg.color = color;
    }

    return Result<InjectConfig>::ok(std::move(cfg));
}

Result<InjectConfig> InjectConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return InjectError{InjectError::Config,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return InjectConfig::parse(ss.str(), path);
}

void InjectConfig::merge(const InjectConfig& other) {
    if (other.is_set("root")) root = other.root;
    if (other.is_set("prefix")) prefix = other.prefix;
    if (other.is_set("extensions")) extensions = other.extensions;
    if (other.is_set("exclude")) exclude = other.exclude;
    if (other.is_set("token-prefix")) token_prefix = other.token_prefix;
    if (other.is_set("token-suffix")) token_suffix = other.token_suffix;
    if (other.is_set("strict")) strict = other.strict;
    if (other.is_set("check-overlap")) check_overlap = other.check_overlap;
    if (other.is_set("timeout-ms")) timeout_ms = other.timeout_ms;
    if (other.is_set("jobs")) jobs = other.jobs;
    if (other.is_set("show-values")) show_values = other.show_values;
    if (other.is_set("dry-run")) dry_run = other.dry_run;

    if (other.log_level.has_value()) log_level = other.log_level;
    if (other.color.has_value()) color = other.color;

    explicit_fields.insert(other.explicit_fields.begin(), other.explicit_fields.end());
}

Status InjectConfig::validate() const {
    if (prefix.empty()) {
        return InjectError{InjectError::Config,
            "namespace prefix must not be empty",
            "an empty prefix would inject every environment variable"};
    }
    if (extensions.empty() || extensions.count("") > 0) {
        return InjectError{InjectError::Config,
            "at least one non-empty file extension is required",
            "e.g. --ext .js --ext .css"};
    }
    if (jobs < 1 || jobs > kMaxJobs) {
        return InjectError{InjectError::Config,
            "jobs must be between 1 and " + std::to_string(kMaxJobs) +
            ", got " + std::to_string(jobs)};
    }
    if (timeout_ms < 0) {
        return InjectError{InjectError::Config,
            "timeout must not be negative, got " + std::to_string(timeout_ms)};
    }
    if (timeout_ms > kMaxTimeoutMs) {
        return InjectError{InjectError::Config,
            "timeout of " + std::to_string(timeout_ms) + "ms is too large",
            "use 0 for no time limit"};
    }
    return ok_status();
}

} // namespace envinject
