#include <envinject/substitution.hpp>

namespace envinject {

SubstitutionSet derive_substitutions(const EnvironmentSnapshot& env,
                                     const std::string& prefix,
                                     const std::string& token_prefix,
                                     const std::string& token_suffix) {
    SubstitutionSet set;
    for (const auto& [key, value] : env.with_prefix(prefix)) {
        Substitution sub;
        sub.key = key;
        sub.token = token_prefix + key + token_suffix;
        sub.value = value;
        set.entries.push_back(std::move(sub));
    }
    return set;
}

Status check_token_overlap(const SubstitutionSet& set) {
    const auto& entries = set.entries;
    for (size_t i = 0; i < entries.size(); i++) {
        for (size_t j = 0; j < entries.size(); j++) {
            if (i == j) continue;
            const auto& inner = entries[i];
            const auto& outer = entries[j];
            if (outer.token.find(inner.token) == std::string::npos) continue;

            InjectError err{InjectError::Config,
                "placeholder '" + inner.token + "' is a substring of placeholder '" +
                    outer.token + "'",
                "rename one of the variables so that no placeholder contains another"};
            err.key = inner.key;
            return err;
        }
    }
    return ok_status();
}

std::vector<std::string> self_referential_keys(const SubstitutionSet& set) {
    std::vector<std::string> keys;
    for (const auto& sub : set.entries) {
        for (const auto& other : set.entries) {
            if (sub.value.find(other.token) != std::string::npos) {
                keys.push_back(sub.key);
                break;
            }
        }
    }
    return keys;
}

size_t replace_all_literal(std::string& buf, const std::string& token,
                           const std::string& value) {
    if (token.empty()) return 0;

    size_t pos = buf.find(token);
    if (pos == std::string::npos) return 0;

    // Rebuild into a fresh buffer: one pass, and inserted values are never rescanned.
    std::string out;
    out.reserve(buf.size());
    size_t last = 0;
    size_t count = 0;
    while (pos != std::string::npos) {
        out.append(buf, last, pos - last);
        out += value;
        last = pos + token.size();
        count++;
        pos = buf.find(token, last);
    }
    out.append(buf, last, std::string::npos);
    buf.swap(out);
    return count;
}

size_t apply_substitutions(std::string& buf, const SubstitutionSet& set) {
    size_t total = 0;
    for (const auto& sub : set.entries) {
        total += replace_all_literal(buf, sub.token, sub.value);
    }
    return total;
}

} // namespace envinject
