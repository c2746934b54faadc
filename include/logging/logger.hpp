#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <memory>
#include <string>

class Logger
{
public:
    enum class Level
    {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    enum class ConsoleStream
    {
        STDOUT,
        STDERR
    };

    static void init(const std::string &log_level = "INFO")
    {
        auto logger = getLogger();
        spdlog::level::level_enum level;
        if (!parseLevel(log_level, level))
            level = spdlog::level::info; // Default to INFO
        logger->set_level(level);
    }

    static void setLevel(const std::string &log_level)
    {
        auto logger = getLogger();

        spdlog::level::level_enum level;
        if (!parseLevel(log_level, level))
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
            level = spdlog::level::info;
        }

        logger->set_level(level);
        info("Log level changed to: " + log_level);
    }

    /**
     * @brief Attach a rotating log file next to the console output
     * @param file_path Log file, its folder is created if missing
     * @param max_size_bytes Size at which the file is rotated
     * @param max_files Number of rotated files kept
     * @return true if the sink was attached
     */
    static bool addFileSink(const std::string &file_path, size_t max_size_bytes = 5 * 1024 * 1024, size_t max_files = 1)
    {
        try
        {
            std::filesystem::path path(file_path);
            if (path.has_parent_path())
                std::filesystem::create_directories(path.parent_path());

            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file_path, max_size_bytes, max_files);
            sink->set_pattern(pattern());
            getLogger()->sinks().push_back(sink);
            info("Logging to file: " + file_path);
            return true;
        }
        catch (const std::exception &e)
        {
            error("Could not create log file " + file_path + ": " + e.what());
            return false;
        }
    }

    /**
     * @brief Send console output to stdout or stderr
     * Keeps stdout free for machine-readable output.
     */
    static void setConsoleStream(ConsoleStream stream)
    {
        std::shared_ptr<spdlog::sinks::sink> console;
        if (stream == ConsoleStream::STDERR)
            console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        else
            console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern(pattern());

        // The console sink is always the first one
        auto &sinks = getLogger()->sinks();
        if (sinks.empty())
            sinks.push_back(console);
        else
            sinks[0] = console;
    }

    /**
     * @brief Whether a message at this level would be written
     */
    static bool isEnabled(Level level)
    {
        return getLogger()->should_log(toSpdlogLevel(level));
    }

    static void trace(const std::string &message)
    {
        log(Level::TRACE, message);
    }

    static void debug(const std::string &message)
    {
        log(Level::DEBUG, message);
    }

    static void info(const std::string &message)
    {
        log(Level::INFO, message);
    }

    static void warn(const std::string &message)
    {
        log(Level::WARN, message);
    }

    static void error(const std::string &message)
    {
        log(Level::ERROR, message);
    }

    static void critical(const std::string &message)
    {
        log(Level::CRITICAL, message);
    }

private:
    static const char *pattern()
    {
        return "%Y-%m-%d %H:%M:%S - %l - %v";
    }

    static bool parseLevel(const std::string &log_level, spdlog::level::level_enum &level)
    {
        if (log_level == "TRACE")
            level = spdlog::level::trace;
        else if (log_level == "DEBUG")
            level = spdlog::level::debug;
        else if (log_level == "INFO")
            level = spdlog::level::info;
        else if (log_level == "WARN")
            level = spdlog::level::warn;
        else if (log_level == "ERROR")
            level = spdlog::level::err;
        else if (log_level == "CRITICAL")
            level = spdlog::level::critical;
        else
            return false;
        return true;
    }

    static spdlog::level::level_enum toSpdlogLevel(Level level)
    {
        switch (level)
        {
        case Level::TRACE:
            return spdlog::level::trace;
        case Level::DEBUG:
            return spdlog::level::debug;
        case Level::INFO:
            return spdlog::level::info;
        case Level::WARN:
            return spdlog::level::warn;
        case Level::ERROR:
            return spdlog::level::err;
        case Level::CRITICAL:
            return spdlog::level::critical;
        }
        return spdlog::level::info;
    }

    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = []()
        {
            auto created = spdlog::stdout_color_mt("visual_dedup");
            created->set_pattern(pattern());
            return created;
        }();
        return logger;
    }

    static void log(Level level, const std::string &message)
    {
        auto logger = getLogger();
        switch (level)
        {
        case Level::TRACE:
            logger->trace(message);
            break;
        case Level::DEBUG:
            logger->debug(message);
            break;
        case Level::INFO:
            logger->info(message);
            break;
        case Level::WARN:
            logger->warn(message);
            break;
        case Level::ERROR:
            logger->error(message);
            break;
        case Level::CRITICAL:
            logger->critical(message);
            break;
        }
    }
};
