#pragma once
#include <string>

class PathUtils {
public:
    // non-empty, absolute, no NUL byte, shorter than Config::MAX_PATH_LENGTH
    static bool isValidPath(const std::string& path);

    // lexically normal form without a trailing separator ("/a//b/./" -> "/a/b")
    static std::string normalize(const std::string& path);

    static bool pathEquals(const std::string& first, const std::string& second, bool caseSensitive = true);

    // true when child lies strictly below parent, compared component-wise
    static bool isParentPath(const std::string& parent, const std::string& child, bool caseSensitive = true);

    static std::string combine(const std::string& base, const std::string& name);
};
