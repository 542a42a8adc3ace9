#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>
#include <utility>

/**
 * @brief Process-wide logging facade over a single spdlog logger
 *
 * Analysis workers log through it concurrently; the _mt sink serializes writes.
 * Accepted level names are TRACE, DEBUG, INFO, WARN and ERROR.
 */
class Logger
{
public:
    static void init(const std::string &log_level = "INFO")
    {
        auto sink = instance();
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        spdlog::level::level_enum level;
        if (parseLevel(log_level, level))
        {
            sink->set_level(level);
            return;
        }
        sink->set_level(spdlog::level::info);
        warn("Unknown log level '" + log_level + "', using INFO");
    }

    static void setLevel(const std::string &log_level)
    {
        spdlog::level::level_enum level;
        if (!parseLevel(log_level, level))
        {
            warn("Ignoring log level change to '" + log_level + "'");
            return;
        }
        instance()->set_level(level);
    }

    static bool isValidLevel(const std::string &log_level)
    {
        spdlog::level::level_enum unused;
        return parseLevel(log_level, unused);
    }

    static void trace(const std::string &message) { instance()->log(spdlog::level::trace, message); }
    static void debug(const std::string &message) { instance()->log(spdlog::level::debug, message); }
    static void info(const std::string &message) { instance()->log(spdlog::level::info, message); }
    static void warn(const std::string &message) { instance()->log(spdlog::level::warn, message); }
    static void error(const std::string &message) { instance()->log(spdlog::level::err, message); }

private:
    static std::shared_ptr<spdlog::logger> instance()
    {
        static std::shared_ptr<spdlog::logger> shared = spdlog::stdout_color_mt("tiktok_organizer");
        return shared;
    }

    static bool parseLevel(const std::string &name, spdlog::level::level_enum &level)
    {
        static const std::pair<const char *, spdlog::level::level_enum> names[] = {
            {"TRACE", spdlog::level::trace},
            {"DEBUG", spdlog::level::debug},
            {"INFO", spdlog::level::info},
            {"WARN", spdlog::level::warn},
            {"ERROR", spdlog::level::err}};

        for (const auto &entry : names)
        {
            if (name == entry.first)
            {
                level = entry.second;
                return true;
            }
        }
        return false;
    }
};
