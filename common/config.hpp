// config.hpp
#pragma once
#include <cstddef>

namespace Config {
    inline constexpr int RETRY_COUNT = 2;                          // verified copy makes RETRY_COUNT + 1 attempts
    inline constexpr const char* MOVE_BACKUP_SUFFIX = ".movebackup";
    inline constexpr size_t MAX_PATH_LENGTH = 4096;                // PATH_MAX on linux
    inline constexpr const char* DEFAULT_LOG_LEVEL = "info";
}
