#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace imgjoin {

// A chunk name must stay inside the manifest directory: relative, no ".."
// segment, no backslashes.
inline bool IsSafeRelativeName(std::string_view p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;
    if (p.find('\\') != std::string_view::npos) return false;

    while (!p.empty()) {
        while (!p.empty() && p.front() == '/') p.remove_prefix(1);
        const auto pos = p.find('/');
        const auto seg = p.substr(0, pos);
        if (seg == "..") return false;
        if (pos == std::string_view::npos) break;
        p.remove_prefix(pos);
    }
    return true;
}

inline std::filesystem::path ResolveInDirectory(const std::filesystem::path& dir,
                                                const std::string& name) {
    return dir / name;
}

// Absolute form of `p` with symlinks resolved as far as they exist.
inline std::string AbsolutePathString(const std::filesystem::path& p) {
    std::error_code ec;
    auto abs = std::filesystem::weakly_canonical(p, ec);
    if (ec) {
        abs = std::filesystem::absolute(p, ec);
        if (ec) return p.string();
    }
    return abs.string();
}

} // namespace imgjoin
