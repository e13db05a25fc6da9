#pragma once
#include <cstdint>
#include <string>
#include "result.hpp"

// Strategies a transfer may use. A request combines bits, a result carries
// the single strategy that completed (or the AND over a folder's contents).
enum class TransferMode : uint8_t {
    None = 0,
    HardLink = 1,
    Copy = 2,
    Move = 4,
    HardLinkOrCopy = HardLink | Copy
};

inline constexpr TransferMode operator|(TransferMode a, TransferMode b) {
    return static_cast<TransferMode>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline constexpr TransferMode operator&(TransferMode a, TransferMode b) {
    return static_cast<TransferMode>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline TransferMode& operator|=(TransferMode& a, TransferMode b) {
    a = a | b;
    return a;
}

inline TransferMode& operator&=(TransferMode& a, TransferMode b) {
    a = a & b;
    return a;
}

inline constexpr bool hasFlag(TransferMode value, TransferMode flag) {
    return flag != TransferMode::None && (value & flag) == flag;
}

// "None", "HardLink", "Copy", "Move" or the set bits joined with '|'
std::string toString(TransferMode mode);

// accepts names in any case joined by '|', ',' or '+', and "HardLinkOrCopy"
Result<TransferMode> parseTransferMode(const std::string& text);
