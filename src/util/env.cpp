#include <envinject/env.hpp>

#ifndef _WIN32
#include <unistd.h>
#endif

extern char** environ;

namespace envinject {

EnvironmentSnapshot EnvironmentSnapshot::capture() {
    std::vector<std::string> entries;
    if (environ != nullptr) {
        for (char** e = environ; *e != nullptr; ++e) {
            entries.emplace_back(*e);
        }
    }
    return from_entries(entries);
}

EnvironmentSnapshot EnvironmentSnapshot::from_entries(const std::vector<std::string>& entries) {
    Map vars;
    for (const auto& entry : entries) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        vars.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return EnvironmentSnapshot(std::move(vars));
}

std::optional<std::string> EnvironmentSnapshot::get(const std::string& key) const {
    auto it = vars_.find(key);
    if (it == vars_.end()) return std::nullopt;
    return it->second;
}

bool EnvironmentSnapshot::contains(const std::string& key) const {
    return vars_.count(key) > 0;
}

EnvironmentSnapshot::Map EnvironmentSnapshot::with_prefix(const std::string& prefix) const {
    Map out;
    // Keys sharing a prefix are contiguous in an ordered map
    for (auto it = vars_.lower_bound(prefix); it != vars_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        out.insert(*it);
    }
    return out;
}

} // namespace envinject
