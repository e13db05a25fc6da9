#pragma once
#include <string>
#include "../common/transfer_mode.hpp"

struct TransferRequest {
    std::string sourcePath;
    std::string targetPath;
    TransferMode mode = TransferMode::None;
    bool overwrite = false;     // ignored for folders, which always replace files
    bool verified = true;
};
