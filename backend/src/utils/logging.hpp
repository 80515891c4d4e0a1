#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    inline void init(const std::string& path = "tagtool.log",
                     spdlog::level::level_enum level = spdlog::level::debug)
    {
        // File logger becomes the default so library code can call spdlog:: directly
        auto file_logger = spdlog::basic_logger_mt("file_logger", path);
        spdlog::set_default_logger(file_logger);

        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
    }
}
