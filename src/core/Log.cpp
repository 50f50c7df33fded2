#include "Log.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <cstdio>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace holdfast::core {

namespace fs = std::filesystem;

static std::mutex g_mutex;
static std::shared_ptr<spdlog::logger> g_logger;
static LogLevel g_level = LogLevel::Info;

static spdlog::level::level_enum ToSpd(LogLevel lvl)
{
    switch (lvl)
    {
    case LogLevel::Trace:    return spdlog::level::trace;
    case LogLevel::Info:     return spdlog::level::info;
    case LogLevel::Warn:     return spdlog::level::warn;
    case LogLevel::Error:    return spdlog::level::err;
    case LogLevel::Critical: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

void LogInit(const fs::path& logDir)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!logDir.empty())
    {
        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (!ec)
        {
            const auto file = (logDir / "holdfast.log").string();
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1u << 20, 4));
            }
            catch (const spdlog::spdlog_ex& ex)
            {
                // Console-only logging is still usable; report after the logger exists.
                std::fprintf(stderr, "holdfast: cannot open %s: %s\n", file.c_str(), ex.what());
            }
        }
    }

    auto logger = std::make_shared<spdlog::logger>("holdfast", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");

    {
        std::lock_guard<std::mutex> lock(g_mutex);
        logger->set_level(ToSpd(g_level));
        g_logger = logger;
    }

    spdlog::set_default_logger(logger);
    logger->info("Logging started");
}

void LogShutdown()
{
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        logger.swap(g_logger);
    }
    if (logger)
        logger->flush();
}

void LogSetLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    g_level = level;
    if (g_logger)
        g_logger->set_level(ToSpd(level));
    else
        spdlog::set_level(ToSpd(level));
}

bool ParseLogLevel(std::string_view text, LogLevel& out) noexcept
{
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lowered == "trace" || lowered == "debug") { out = LogLevel::Trace; return true; }
    if (lowered == "info")                        { out = LogLevel::Info; return true; }
    if (lowered == "warn" || lowered == "warning") { out = LogLevel::Warn; return true; }
    if (lowered == "error")                       { out = LogLevel::Error; return true; }
    if (lowered == "critical" || lowered == "fatal") { out = LogLevel::Critical; return true; }
    return false;
}

std::shared_ptr<spdlog::logger> Logger()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger)
        return g_logger;
    return spdlog::default_logger();
}

void LogMessageV(LogLevel level, const char* fmt, va_list args)
{
    if (!fmt)
        return;

    char buf[2048];
    buf[0] = '\0';

    va_list copy;
    va_copy(copy, args);
    (void)std::vsnprintf(buf, sizeof(buf), fmt, copy);
    buf[sizeof(buf) - 1] = '\0';
    va_end(copy);

    Logger()->log(ToSpd(level), "{}", buf);
}

void LogMessage(LogLevel level, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    LogMessageV(level, fmt, args);
    va_end(args);
}

} // namespace holdfast::core
