#pragma once

#include <string>

#include "capsync/core/errors.hpp"

namespace capsync::core {
    struct LogConfig {
        std::string level{"info"};   // trace|debug|info|warn|error|off
        std::string file;            // optional, appended to
    };

    // Installs the process default spdlog logger. Library code logs through
    // spdlog::info/warn/error and works without this call.
    [[nodiscard]] Status log_init(const LogConfig& cfg);
} // namespace capsync::core
