#pragma once

#include <envinject/log.hpp>
#include <envinject/result.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace envinject {

constexpr const char* kDefaultRoot = "/usr/share/nginx/html";
constexpr const char* kDefaultPrefix = "MY_APP_";

// Upper bounds accepted by validate(). The timeout bound keeps
// steady_clock::now() + timeout_ms from overflowing.
constexpr int kMaxJobs = 1024;
constexpr int64_t kMaxTimeoutMs = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::duration::max()).count() / 2;

// Options for one injection run.
// Layered: built-in defaults < config file < command line. Only fields that a
// layer explicitly sets override the layer below.
struct InjectConfig {
    std::string root = kDefaultRoot;
    std::string prefix = kDefaultPrefix;
    std::set<std::string> extensions = {".js", ".css"};
    std::vector<std::string> exclude;
    std::string token_prefix;
    std::string token_suffix;
    bool strict = false;
    bool check_overlap = true;
    int64_t timeout_ms = 0;   // 0 = unbounded
    int jobs = 1;
    bool show_values = false;
    bool dry_run = false;

    std::optional<log::Level> log_level;
    std::optional<bool> color;

    // Keys (config file spelling, e.g. "timeout-ms") set by this layer
    std::set<std::string> explicit_fields;

    void mark(const std::string& field) { explicit_fields.insert(field); }
    bool is_set(const std::string& field) const { return explicit_fields.count(field) > 0; }

    // Load from a TOML config file
    static Result<InjectConfig> load(const std::string& path);

    // Parse from TOML string. `source` names the origin in error messages.
    static Result<InjectConfig> parse(const std::string& toml_str,
                                      const std::string& source = "");

    // Merge another layer on top (other's explicitly set fields win)
    void merge(const InjectConfig& other);

    // Reject values no run can succeed with
    Status validate() const;
};

} // namespace envinject
