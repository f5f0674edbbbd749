#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace envinject {

// Immutable copy of a process environment, taken once at the start of a run.
// Later changes to the real environment are not observed.
class EnvironmentSnapshot {
public:
    using Map = std::map<std::string, std::string>;

    EnvironmentSnapshot() = default;
    explicit EnvironmentSnapshot(Map vars) : vars_(std::move(vars)) {}

    // Capture the current process environment (environ).
    static EnvironmentSnapshot capture();

    // Build from "KEY=VALUE" strings. Entries without '=' or with an empty key
    // are ignored; a repeated key keeps its first value, as getenv() would.
    static EnvironmentSnapshot from_entries(const std::vector<std::string>& entries);

    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const;

    // Entries whose key starts with prefix, in key order.
    Map with_prefix(const std::string& prefix) const;

    const Map& vars() const { return vars_; }
    size_t size() const { return vars_.size(); }
    bool empty() const { return vars_.empty(); }

private:
    Map vars_;
};

} // namespace envinject
