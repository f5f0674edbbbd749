#pragma once

#include <envinject/env.hpp>
#include <envinject/result.hpp>
#include <string>
#include <vector>

namespace envinject {

struct Substitution {
    std::string key;    // environment key
    std::string token;  // placeholder text searched for in assets
    std::string value;  // replacement, inserted verbatim
};

// Token -> value mapping for one injection run, ordered by key.
struct SubstitutionSet {
    std::vector<Substitution> entries;

    bool empty() const { return entries.empty(); }
    size_t size() const { return entries.size(); }
};

// Select every environment entry whose key starts with `prefix`.
// The token is token_prefix + key + token_suffix; the value is taken verbatim.
SubstitutionSet derive_substitutions(const EnvironmentSnapshot& env,
                                     const std::string& prefix,
                                     const std::string& token_prefix = "",
                                     const std::string& token_suffix = "");

// Fails with InjectError::Config if any token is a substring of another token
// in the set. Replacing the shorter one first would corrupt the longer one.
Status check_token_overlap(const SubstitutionSet& set);

// Keys whose value contains some token of the set. Running the injector twice
// with such a configuration is not idempotent.
std::vector<std::string> self_referential_keys(const SubstitutionSet& set);

// Literal, left-to-right, non-overlapping replacement of every occurrence of
// `token` in `buf`. Returns the number of occurrences replaced.
size_t replace_all_literal(std::string& buf, const std::string& token,
                           const std::string& value);

// Apply each entry of the set in order. Returns the total replacement count.
size_t apply_substitutions(std::string& buf, const SubstitutionSet& set);

} // namespace envinject
