#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace updsrv {

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Normalize tar path to a clean relative form:
// - convert '\' to '/'
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeTarPath(std::string s) {
    for (char& c : s) {
        if (c == '\\') c = '/';
    }
    while (!s.empty() && s.front() == '/') s.erase(0, 1);
    while (s.rfind("./", 0) == 0) s.erase(0, 2);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// True when `candidate`, once made absolute and lexically normalized, is
// `root` itself or lies beneath it.
inline bool IsWithinRoot(const std::filesystem::path& root, const std::filesystem::path& candidate) {
    namespace fs = std::filesystem;
    const fs::path r = fs::absolute(root).lexically_normal();
    const fs::path c = fs::absolute(candidate).lexically_normal();

    auto rit = r.begin();
    auto cit = c.begin();
    for (; rit != r.end(); ++rit, ++cit) {
        if (rit->empty()) continue; // trailing separator
        if (cit == c.end() || *rit != *cit) return false;
    }
    return true;
}

} // namespace updsrv
