#pragma once
#include "../storage/storage_backend.hpp"
#include "../transfer/disk_transfer_service.hpp"
#include <string>
#include <vector>

class TransferCLI {
public:
    TransferCLI(StorageBackend& storage, int retryCount);

    void startCLI();

    // runs one command line ("file copy /a /b --overwrite"), true on success
    bool handleCommand(const std::string& cmd);
    bool runCommand(const std::vector<std::string>& args);

    void printHelp() const;

private:
    enum class Target { FILE, FOLDER, DETECT };

    bool runTransfer(const std::vector<std::string>& args, Target target);
    bool setLevel(const std::vector<std::string>& args);

    DiskTransferService service_;
};
