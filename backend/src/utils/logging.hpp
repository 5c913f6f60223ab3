#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    inline void init(const std::string& path = "recall.log",
        spdlog::level::level_enum level = spdlog::level::debug)
    {
        // File logger; the CLI owns the console
        auto file_logger = spdlog::basic_logger_mt("file_logger", path);

        // Make file logger the default
        spdlog::set_default_logger(file_logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        // Level and flushing setup
        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
    }

    // "debug", "info", "warn", ... ; unknown names fall back to info
    inline spdlog::level::level_enum levelFromName(const std::string& name)
    {
        auto lvl = spdlog::level::from_str(name);
        if (lvl == spdlog::level::off && name != "off") return spdlog::level::info;
        return lvl;
    }
}
