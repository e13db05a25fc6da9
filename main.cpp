#include "cli/transfer_cli.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "storage/local_storage_backend.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static void printUsage() {
    std::cerr << "Usage: disktransfer [--log-level <level>] [--retries <n>] <command>\n"
              << "       disktransfer shell\n"
              << "Run 'disktransfer help' for the list of commands.\n";
}

int main(int argc, char** argv) {

    if (argc < 2) {
        std::cerr << "Insufficient arguments\n";
        printUsage();
        return 1;
    }

    std::string levelName = Config::DEFAULT_LOG_LEVEL;
    int retryCount = Config::RETRY_COUNT;
    std::vector<std::string> command;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (command.empty() && arg == "--log-level" && i + 1 < argc) {
            levelName = argv[++i];
        } else if (command.empty() && arg == "--retries" && i + 1 < argc) {
            try {
                retryCount = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid retry count '" << argv[i] << "'\n";
                return 1;
            }
            if (retryCount < 0) {
                std::cerr << "Retry count must not be negative\n";
                return 1;
            }
        } else {
            command.push_back(arg);
        }
    }

    Result<LogLevel> level = parseLogLevel(levelName);
    if (!level.success) {
        std::cerr << level.message << "\n";
        return 1;
    }
    Logger::setLevel(level.data);

    if (command.empty()) {
        printUsage();
        return 1;
    }

    LocalStorageBackend storage;
    TransferCLI cli(storage, retryCount);

    if (command[0] == "shell") {
        cli.startCLI();
        return 0;
    }

    return cli.runCommand(command) ? 0 : 1;
}
