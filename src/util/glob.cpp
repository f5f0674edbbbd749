#include <envinject/glob.hpp>

namespace envinject {

static std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    // "./a/b" and "a/b" are the same relative path
    while (out.size() > 2 && out[0] == '.' && out[1] == '/') out.erase(0, 2);
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    size_t start = 0;
    while (true) {
        size_t slash = s.find('/', start);
        if (slash == std::string::npos) {
            segs.push_back(s.substr(start));
            break;
        }
        segs.push_back(s.substr(start, slash - start));
        start = slash + 1;
    }
    return segs;
}

// Match one character against a bracket expression starting at pat[pi] == '['.
// On return pi points past the closing ']'.
static bool match_class(const std::string& pat, size_t& pi, char c) {
    pi++;
    bool negate = pi < pat.size() && pat[pi] == '!';
    if (negate) pi++;

    bool matched = false;
    while (pi < pat.size() && pat[pi] != ']') {
        char lo = pat[pi];
        if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
            if (c >= lo && c <= pat[pi + 2]) matched = true;
            pi += 3;
        } else {
            if (c == lo) matched = true;
            pi++;
        }
    }
    if (pi < pat.size()) pi++;
    return matched != negate;
}

// Single segment match with star backtracking (no '/' in either argument).
static bool match_segment(const std::string& pat, const std::string& str) {
    size_t pi = 0, si = 0;
    size_t star_pi = std::string::npos, star_si = 0;

    while (si < str.size()) {
        if (pi < pat.size() && pat[pi] == '*') {
            star_pi = ++pi;
            star_si = si;
            continue;
        }
        if (pi < pat.size()) {
            size_t next = pi;
            bool ok;
            if (pat[pi] == '[') {
                ok = match_class(pat, next, str[si]);
            } else {
                ok = pat[pi] == '?' || pat[pi] == str[si];
                next = pi + 1;
            }
            if (ok) {
                pi = next;
                si++;
                continue;
            }
        }
        if (star_pi == std::string::npos) return false;
        // Let the last star absorb one more character and retry
        pi = star_pi;
        si = ++star_si;
    }

    while (pi < pat.size() && pat[pi] == '*') pi++;
    return pi == pat.size();
}

static bool match_segments(const std::vector<std::string>& pat, size_t pi,
                           const std::vector<std::string>& path, size_t si) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            while (pi < pat.size() && pat[pi] == "**") pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= path.size(); k++) {
                if (match_segments(pat, pi, path, k)) return true;
            }
            return false;
        }
        if (si == path.size() || !match_segment(pat[pi], path[si])) return false;
        pi++;
        si++;
    }
    return si == path.size();
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_segments(split_segments(normalize_path(pattern)), 0,
                          split_segments(normalize_path(path)), 0);
}

bool glob_match_any(const std::vector<std::string>& patterns, const std::string& path) {
    for (const auto& pat : patterns) {
        if (glob_match(pat, path)) return true;
    }
    return false;
}

} // namespace envinject
