#include "Logging.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <vector>

namespace mcpdb {

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str() answers "off" for names it does not know
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

void setupLogging(const LoggingConfig& config) {
    auto level = parseLogLevel(config.level);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(level);
        sinks.push_back(console_sink);

        std::string file_error;
        if (!config.file.empty()) {
            try {
                std::filesystem::path log_path(config.file);
                if (log_path.has_parent_path()) {
                    std::filesystem::create_directories(log_path.parent_path());
                }
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.file, config.max_bytes, config.backup_count);
                file_sink->set_level(level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                file_error = ex.what();
            } catch (const std::filesystem::filesystem_error& ex) {
                file_error = ex.what();
            }
        }

        auto logger = std::make_shared<spdlog::logger>("mcpdb", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        if (!file_error.empty()) {
            spdlog::warn("File logging disabled ({}): {}", config.file, file_error);
        }
        if (spdlog::level::from_str(config.level) == spdlog::level::off && config.level != "off") {
            spdlog::warn("LOG_LEVEL '{}' not recognised, using info", config.level);
        }

        spdlog::info("Logging to stderr and {} (level: {}, max size: {} B, backups: {})",
                     config.file.empty() ? "no file" : config.file,
                     spdlog::level::to_string_view(level), config.max_bytes, config.backup_count);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

}  // namespace mcpdb
