#pragma once
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Log {
    // Full log goes to `path`; warnings and errors are also echoed to stderr.
    inline void init(const std::string& path, spdlog::level::level_enum level) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        file_sink->set_level(level);

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::warn);
        console_sink->set_pattern("[%l] %v");

        std::vector<spdlog::sink_ptr> sinks{ file_sink, console_sink };
        auto logger = std::make_shared<spdlog::logger>("sage", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);

        // File pattern; the console sink keeps its own short one
        file_sink->set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::flush_on(spdlog::level::info);
    }
}
