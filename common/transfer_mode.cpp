#include "transfer_mode.hpp"
#include <algorithm>
#include <cctype>

std::string toString(TransferMode mode) {
    if (mode == TransferMode::None) return "None";

    std::string result;
    auto append = [&result](const char* name) {
        if (!result.empty()) result += "|";
        result += name;
    };

    if (hasFlag(mode, TransferMode::HardLink)) append("HardLink");
    if (hasFlag(mode, TransferMode::Copy)) append("Copy");
    if (hasFlag(mode, TransferMode::Move)) append("Move");
    return result;
}

static std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Result<TransferMode> parseTransferMode(const std::string& text) {
    TransferMode mode = TransferMode::None;
    size_t start = 0;

    while (start <= text.size()) {
        size_t end = text.find_first_of("|,+", start);
        if (end == std::string::npos) end = text.size();

        std::string token = text.substr(start, end - start);
        token.erase(0, token.find_first_not_of(" \t"));
        token.erase(token.find_last_not_of(" \t") + 1);
        token = toLower(token);

        if (token == "hardlink" || token == "link") {
            mode |= TransferMode::HardLink;
        } else if (token == "copy") {
            mode |= TransferMode::Copy;
        } else if (token == "move") {
            mode |= TransferMode::Move;
        } else if (token == "hardlinkorcopy") {
            mode |= TransferMode::HardLinkOrCopy;
        } else {
            return Result<TransferMode>::Error(ErrorCode::InvalidMode, "Unknown transfer mode '" + token + "' in '" + text + "'");
        }
        start = end + 1;
    }

    return Result<TransferMode>::Ok(mode);
}
