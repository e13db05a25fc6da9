#include "transfer_cli.hpp"
#include "../common/logger.hpp"
#include <iostream>
#include <sstream>

TransferCLI::TransferCLI(StorageBackend& storage, int retryCount) : service_(storage, retryCount) {}

void TransferCLI::startCLI() {
    std::cout << "Transfer shell started. Type 'help' for commands.\n";
    std::string line;

    while (true) {
        std::cout << ">>> ";
        if (!std::getline(std::cin, line)) break;

        if (line.empty()) continue;
        if (line == "exit") {
            std::cout << "Exiting...\n";
            break;
        }

        handleCommand(line);
    }
}

bool TransferCLI::handleCommand(const std::string& cmd) {
    std::istringstream iss(cmd);
    std::vector<std::string> args;
    std::string word;
    while (iss >> word) args.push_back(word);

    if (args.empty()) return false;
    return runCommand(args);
}

bool TransferCLI::runCommand(const std::vector<std::string>& args) {
    const std::string& keyword = args[0];

    if (keyword == "help") {
        printHelp();
        return true;
    } else if (keyword == "file") {
        return runTransfer(args, Target::FILE);
    } else if (keyword == "folder") {
        return runTransfer(args, Target::FOLDER);
    } else if (keyword == "transfer") {
        return runTransfer(args, Target::DETECT);
    } else if (keyword == "level") {
        return setLevel(args);
    }

    std::cerr << "Unknown command. Type 'help' for available commands.\n";
    return false;
}

bool TransferCLI::runTransfer(const std::vector<std::string>& args, Target target) {
    if (args.size() < 4) {
        if (target == Target::FOLDER) {
            std::cerr << "Usage: folder <mode> <source> <target> [--no-verify]\n";
        } else {
            std::cerr << "Usage: " << args[0] << " <mode> <source> <target> [--overwrite] [--no-verify]\n";
        }
        return false;
    }

    Result<TransferMode> mode = parseTransferMode(args[1]);
    if (!mode.success) {
        std::cerr << "Error [" << toString(mode.error) << "]: " << mode.message << "\n";
        return false;
    }

    TransferRequest request;
    request.mode = mode.data;
    request.sourcePath = args[2];
    request.targetPath = args[3];

    for (size_t i = 4; i < args.size(); ++i) {
        if (args[i] == "--overwrite" && target != Target::FOLDER) {
            request.overwrite = true;
        } else if (args[i] == "--no-verify") {
            request.verified = false;
        } else {
            std::cerr << "Unknown option '" << args[i] << "'\n";
            return false;
        }
    }

    Result<TransferMode> result = Result<TransferMode>::Error(ErrorCode::TransferFailed, "No transfer attempted");
    switch (target) {
        case Target::FILE:
            result = service_.transferFile(request.sourcePath, request.targetPath, request.mode,
                                           request.overwrite, request.verified);
            break;
        case Target::FOLDER:
            result = service_.transferFolder(request.sourcePath, request.targetPath, request.mode, request.verified);
            break;
        case Target::DETECT:
            result = service_.transfer(request);
            break;
    }

    if (!result.success) {
        std::cerr << "Error [" << toString(result.error) << "]: " << result.message << "\n";
        return false;
    }

    std::cout << "Transferred [" << request.sourcePath << "] > [" << request.targetPath << "] using "
              << toString(result.data) << "\n";
    return true;
}

bool TransferCLI::setLevel(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: level <trace|debug|info|warn|error>\n";
        return false;
    }

    Result<LogLevel> level = parseLogLevel(args[1]);
    if (!level.success) {
        std::cerr << level.message << "\n";
        return false;
    }
    Logger::setLevel(level.data);
    return true;
}

// Help for commands
void TransferCLI::printHelp() const {
    std::cout << "Available Commands:\n"
              << " file <mode> <source> <target> [--overwrite] [--no-verify]      Transfer a single file\n"
              << " folder <mode> <source> <target> [--no-verify]                  Transfer a folder recursively\n"
              << " transfer <mode> <source> <target> [--overwrite] [--no-verify]  Pick file or folder from the source\n"
              << " level <trace|debug|info|warn|error>                            Change the log level\n"
              << " help                                                           Show this help\n"
              << " exit                                                           Exit the shell\n"
              << "Modes: hardlink, copy, move, combined with '|' (e.g. hardlink|copy)\n"
              << "Retries per verified copy: " << service_.retryCount() << "\n";
}
