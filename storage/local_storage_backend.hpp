#pragma once
#include "storage_backend.hpp"
#include "../common/logger.hpp"

// StorageBackend over the local filesystem (std::filesystem, error_code
// overloads only).
class LocalStorageBackend : public StorageBackend {
public:
    LocalStorageBackend();

    bool fileExists(const std::string& path) const override;
    bool folderExists(const std::string& path) const override;

    Result<void> createFolder(const std::string& path) override;
    Result<void> deleteFolder(const std::string& path, bool recursive) override;
    Result<void> deleteFile(const std::string& path) override;

    Result<void> copyFile(const std::string& source, const std::string& target) override;
    // rename, or copy + remove when source and target are on different devices
    Result<void> moveFile(const std::string& source, const std::string& target) override;

    bool tryCreateHardLink(const std::string& source, const std::string& target) override;

    Result<uint64_t> getFileSize(const std::string& path) const override;

    // both listings are sorted by name
    Result<std::vector<FileEntry>> listSubdirectories(const std::string& path) const override;
    Result<std::vector<FileEntry>> listFiles(const std::string& path) const override;

    bool isCaseSensitive() const override;

private:
    Result<std::vector<FileEntry>> listEntries(const std::string& path, bool directories) const;
    Logger logger_;
};
