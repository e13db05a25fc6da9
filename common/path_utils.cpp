#include "path_utils.hpp"
#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

static std::string foldCase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool PathUtils::isValidPath(const std::string& path) {
    if (path.empty() || path.size() >= Config::MAX_PATH_LENGTH) return false;
    if (path.find('\0') != std::string::npos) return false;
    return fs::path(path).is_absolute();
}

std::string PathUtils::normalize(const std::string& path) {
    std::string normal = fs::path(path).lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

bool PathUtils::pathEquals(const std::string& first, const std::string& second, bool caseSensitive) {
    std::string a = normalize(first);
    std::string b = normalize(second);
    if (!caseSensitive) {
        a = foldCase(a);
        b = foldCase(b);
    }
    return a == b;
}

bool PathUtils::isParentPath(const std::string& parent, const std::string& child, bool caseSensitive) {
    std::string p = normalize(parent);
    std::string c = normalize(child);
    if (!caseSensitive) {
        p = foldCase(p);
        c = foldCase(c);
    }

    if (p.empty() || c.size() <= p.size() || c.compare(0, p.size(), p) != 0) return false;

    // root is the only normalized path that already ends with a separator
    return p.back() == '/' || c[p.size()] == '/';
}

std::string PathUtils::combine(const std::string& base, const std::string& name) {
    return (fs::path(base) / name).string();
}
