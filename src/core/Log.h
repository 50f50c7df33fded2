// src/core/Log.h
#pragma once

#include <cstdarg>
#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#if defined(__GNUC__) || defined(__clang__)
  #define HF_PRINTF_ATTR(fmtIdx, argIdx) __attribute__((format(printf, fmtIdx, argIdx)))
#else
  #define HF_PRINTF_ATTR(fmtIdx, argIdx)
#endif

namespace holdfast::core {

enum class LogLevel { Trace, Info, Warn, Error, Critical };

// Installs the "holdfast" logger: colored console sink plus, when `logDir` is
// non-empty, a rotating file sink at <logDir>/holdfast.log (1 MiB x 4).
// Messages logged before LogInit go to spdlog's default logger.
void LogInit(const std::filesystem::path& logDir);
void LogShutdown();

void LogSetLevel(LogLevel level);

// Accepts trace/info/warn/error/critical (case-insensitive).
[[nodiscard]] bool ParseLogLevel(std::string_view text, LogLevel& out) noexcept;

// The active logger (the "holdfast" logger after LogInit, else spdlog's default).
[[nodiscard]] std::shared_ptr<spdlog::logger> Logger();

// Printf-style logging entry point.
void LogMessage(LogLevel level, const char* fmt, ...) HF_PRINTF_ATTR(2, 3);

// va_list variant for adapter wrappers and forwarding.
void LogMessageV(LogLevel level, const char* fmt, va_list args);

} // namespace holdfast::core

#ifndef HF_LOG_TRACE
  #define HF_LOG_TRACE(...)    ::holdfast::core::LogMessage(::holdfast::core::LogLevel::Trace,    __VA_ARGS__)
#endif
#ifndef HF_LOG_INFO
  #define HF_LOG_INFO(...)     ::holdfast::core::LogMessage(::holdfast::core::LogLevel::Info,     __VA_ARGS__)
#endif
#ifndef HF_LOG_WARN
  #define HF_LOG_WARN(...)     ::holdfast::core::LogMessage(::holdfast::core::LogLevel::Warn,     __VA_ARGS__)
#endif
#ifndef HF_LOG_ERROR
  #define HF_LOG_ERROR(...)    ::holdfast::core::LogMessage(::holdfast::core::LogLevel::Error,    __VA_ARGS__)
#endif
#ifndef HF_LOG_CRITICAL
  #define HF_LOG_CRITICAL(...) ::holdfast::core::LogMessage(::holdfast::core::LogLevel::Critical, __VA_ARGS__)
#endif
