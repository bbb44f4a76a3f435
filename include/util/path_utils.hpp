#pragma once

#include <string>
#include <string_view>

namespace fpack {

inline bool IsDevPath(std::string_view s) {
    return s.rfind("/dev/", 0) == 0;
}

// Joins a directory and a relative name with exactly one '/'.
inline std::string JoinPath(std::string_view dir, std::string_view name) {
    if (dir.empty()) return std::string(name);
    while (!name.empty() && name.front() == '/') name.remove_prefix(1);
    std::string out(dir);
    if (out.back() != '/') out.push_back('/');
    out.append(name);
    return out;
}

// Replaces every occurrence of `from` in `s` with `to`. Returns the count.
inline size_t ReplaceAll(std::string& s, std::string_view from, std::string_view to) {
    if (from.empty()) return 0;
    size_t count = 0;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
        ++count;
    }
    return count;
}

} // namespace fpack
