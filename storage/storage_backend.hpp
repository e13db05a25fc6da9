#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "../common/result.hpp"

struct FileEntry {
    std::string name;       // last path component
    std::string fullPath;
};

// Filesystem primitives the transfer engine is built on. Implementations
// report failures through Result and never throw.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual bool fileExists(const std::string& path) const = 0;
    virtual bool folderExists(const std::string& path) const = 0;

    // creates missing parents as well
    virtual Result<void> createFolder(const std::string& path) = 0;
    virtual Result<void> deleteFolder(const std::string& path, bool recursive) = 0;
    virtual Result<void> deleteFile(const std::string& path) = 0;

    // neither copyFile nor moveFile replaces an existing target
    virtual Result<void> copyFile(const std::string& source, const std::string& target) = 0;
    virtual Result<void> moveFile(const std::string& source, const std::string& target) = 0;

    virtual bool tryCreateHardLink(const std::string& source, const std::string& target) = 0;

    virtual Result<uint64_t> getFileSize(const std::string& path) const = 0;

    virtual Result<std::vector<FileEntry>> listSubdirectories(const std::string& path) const = 0;
    virtual Result<std::vector<FileEntry>> listFiles(const std::string& path) const = 0;

    virtual bool isCaseSensitive() const = 0;
};
