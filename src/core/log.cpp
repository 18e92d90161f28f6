#include "capsync/core/log.hpp"

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace capsync::core {
    Status log_init(const LogConfig& cfg) {
        const spdlog::level::level_enum level = spdlog::level::from_str(cfg.level);
        // from_str maps anything unrecognised to off
        if (level == spdlog::level::off && cfg.level != "off") {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!cfg.file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, false));
            } catch (const spdlog::spdlog_ex& e) {
                spdlog::error("cannot open log file {}: {}", cfg.file, e.what());
                return make_status(StatusDomain::Core, StatusCode::Io);
            }
        }

        auto logger = std::make_shared<spdlog::logger>("capsync", sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        return ok_status();
    }
} // namespace capsync::core
