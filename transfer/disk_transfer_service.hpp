#pragma once
#include <string>
#include "transfer_request.hpp"
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../common/result.hpp"
#include "../common/transfer_mode.hpp"
#include "../storage/storage_backend.hpp"

// Moves files and folders between two locations of a StorageBackend, trying
// hardlink, copy and move in that order. The returned mode is the strategy
// that completed; for folders it is the AND over every contained item.
class DiskTransferService {
public:
    explicit DiskTransferService(StorageBackend& storage, int retryCount = Config::RETRY_COUNT);

    Result<TransferMode> transferFolder(const std::string& sourcePath, const std::string& targetPath,
                                        TransferMode mode, bool verified = true);

    Result<TransferMode> transferFile(const std::string& sourcePath, const std::string& targetPath,
                                      TransferMode mode, bool overwrite = false, bool verified = true);

    // folder transfer when the source is an existing folder, file transfer otherwise
    Result<TransferMode> transfer(const TransferRequest& request);

    int retryCount() const { return retryCount_; }

private:
    Result<void> validatePaths(const std::string& sourcePath, const std::string& targetPath,
                               TransferMode mode) const;

    // copy and compare sizes, up to retryCount_ + 1 attempts
    Result<void> tryCopyFile(const std::string& sourcePath, const std::string& targetPath);

    // hardlinked backup moved into place, verified copy as fallback
    Result<void> tryMoveFile(const std::string& sourcePath, const std::string& targetPath);

    StorageBackend& storage_;
    int retryCount_;
    Logger logger_;
};
