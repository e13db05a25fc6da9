#include "local_storage_backend.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

LocalStorageBackend::LocalStorageBackend() : logger_("Storage") {}

bool LocalStorageBackend::fileExists(const std::string& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool LocalStorageBackend::folderExists(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

Result<void> LocalStorageBackend::createFolder(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        logger_.debug("create_directories [" + path + "] failed: " + ec.message());
        return Result<void>::Error("Failed to create folder [" + path + "]: " + ec.message());
    }
    return Result<void>::Ok();
}

Result<void> LocalStorageBackend::deleteFolder(const std::string& path, bool recursive) {
    if (!folderExists(path)) {
        return Result<void>::Error("Folder not found [" + path + "]");
    }

    std::error_code ec;
    if (recursive) {
        fs::remove_all(path, ec);
    } else {
        fs::remove(path, ec);
    }
    if (ec) {
        logger_.debug("remove [" + path + "] failed: " + ec.message());
        return Result<void>::Error("Failed to delete folder [" + path + "]: " + ec.message());
    }
    return Result<void>::Ok();
}

Result<void> LocalStorageBackend::deleteFile(const std::string& path) {
    std::error_code ec;
    if (!fs::remove(path, ec)) {
        std::string reason = ec ? ec.message() : "file not found";
        logger_.debug("remove [" + path + "] failed: " + reason);
        return Result<void>::Error("Failed to delete file [" + path + "]: " + reason);
    }
    return Result<void>::Ok();
}

Result<void> LocalStorageBackend::copyFile(const std::string& source, const std::string& target) {
    std::error_code ec;
    // copy_options::none fails when target exists
    fs::copy_file(source, target, fs::copy_options::none, ec);
    if (ec) {
        logger_.debug("copy_file [" + source + "] > [" + target + "] failed: " + ec.message());
        return Result<void>::Error("Failed to copy [" + source + "] to [" + target + "]: " + ec.message());
    }
    return Result<void>::Ok();
}

Result<void> LocalStorageBackend::moveFile(const std::string& source, const std::string& target) {
    std::error_code ec;
    // rename silently replaces an existing file
    if (fs::exists(target, ec)) {
        return Result<void>::Error("Failed to move [" + source + "] to [" + target + "]: target exists");
    }

    fs::rename(source, target, ec);
    if (!ec) return Result<void>::Ok();

    if (ec != std::errc::cross_device_link) {
        logger_.debug("rename [" + source + "] > [" + target + "] failed: " + ec.message());
        return Result<void>::Error("Failed to move [" + source + "] to [" + target + "]: " + ec.message());
    }

    logger_.trace("Cross device move, copying [" + source + "] to [" + target + "]");
    Result<void> copied = copyFile(source, target);
    if (!copied.success) return copied;

    fs::remove(source, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(target, cleanup);
        return Result<void>::Error("Failed to remove [" + source + "] after copying it to [" + target + "]: " + ec.message());
    }
    return Result<void>::Ok();
}

bool LocalStorageBackend::tryCreateHardLink(const std::string& source, const std::string& target) {
    std::error_code ec;
    fs::create_hard_link(source, target, ec);
    if (ec) {
        logger_.debug("Hardlink [" + source + "] > [" + target + "] failed: " + ec.message());
        return false;
    }
    return true;
}

Result<uint64_t> LocalStorageBackend::getFileSize(const std::string& path) const {
    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        return Result<uint64_t>::Error("Failed to read size of [" + path + "]: " + ec.message());
    }
    return Result<uint64_t>::Ok(static_cast<uint64_t>(size));
}

Result<std::vector<FileEntry>> LocalStorageBackend::listSubdirectories(const std::string& path) const {
    return listEntries(path, true);
}

Result<std::vector<FileEntry>> LocalStorageBackend::listFiles(const std::string& path) const {
    return listEntries(path, false);
}

bool LocalStorageBackend::isCaseSensitive() const {
    return true;
}

Result<std::vector<FileEntry>> LocalStorageBackend::listEntries(const std::string& path, bool directories) const {
    std::vector<FileEntry> entries;
    std::error_code ec;

    fs::directory_iterator it(path, ec);
    if (ec) {
        return Result<std::vector<FileEntry>>::Error("Failed to list [" + path + "]: " + ec.message());
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code typeError;
        if (directories && it->is_symlink(typeError)) {
            // linked folders lie outside the tree being walked
            logger_.debug("Skipping symlinked folder [" + it->path().string() + "]");
            continue;
        }
        bool matches = directories ? it->is_directory(typeError) : it->is_regular_file(typeError);
        if (typeError) {
            // dangling symlinks are neither files nor folders
            logger_.debug("Skipping [" + it->path().string() + "]: " + typeError.message());
            continue;
        }
        if (matches) {
            entries.push_back({it->path().filename().string(), it->path().string()});
        }
    }
    if (ec) {
        return Result<std::vector<FileEntry>>::Error("Failed to list [" + path + "]: " + ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.name < b.name; });
    return Result<std::vector<FileEntry>>::Ok(entries);
}
