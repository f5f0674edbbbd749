#pragma once

#include <string>
#include <vector>

namespace envinject {

// Match a glob pattern against a relative path (both normalized to forward slashes).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& path);

// True if any pattern matches path.
bool glob_match_any(const std::vector<std::string>& patterns, const std::string& path);

} // namespace envinject
