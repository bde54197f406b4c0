#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <syncstream>
#include <utility>

#include <fmt/format.h>

namespace JsonPipe {

constexpr std::string_view EndLogLine = "\u001B[0m\n";

enum class LogLevel : uint32_t
{
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
};

// Diagnostics go to stderr; stdout carries data
inline LogLevel log_level = LogLevel::Warn;

inline
bool IsLogLevel(LogLevel level)
{
    return uint32_t(level) >= uint32_t(log_level);
}

template<class... Args>
void LogTrace(fmt::format_string<Args...> format, Args&&... args)
{
    if (!IsLogLevel(LogLevel::Trace)) return;
    std::osyncstream os(std::cerr);
    os << "[\u001B[90mTRACE\u001B[0m] \u001B[90m" << fmt::format(format, std::forward<Args>(args)...) << EndLogLine;
}

template<class... Args>
void LogDebug(fmt::format_string<Args...> format, Args&&... args)
{
    if (!IsLogLevel(LogLevel::Debug)) return;
    std::osyncstream os(std::cerr);
    os << "[\u001B[96mDEBUG\u001B[0m] " << fmt::format(format, std::forward<Args>(args)...) << EndLogLine;
}

template<class... Args>
void LogInfo(fmt::format_string<Args...> format, Args&&... args)
{
    if (!IsLogLevel(LogLevel::Info)) return;
    std::osyncstream os(std::cerr);
    os << "[\u001B[94mINFO\u001B[0m] " << fmt::format(format, std::forward<Args>(args)...) << EndLogLine;
}

template<class... Args>
void LogWarn(fmt::format_string<Args...> format, Args&&... args)
{
    if (!IsLogLevel(LogLevel::Warn)) return;
    std::osyncstream os(std::cerr);
    os << "[\u001B[93mWARN\u001B[0m] " << fmt::format(format, std::forward<Args>(args)...) << EndLogLine;
}

template<class... Args>
void LogError(fmt::format_string<Args...> format, Args&&... args)
{
    if (!IsLogLevel(LogLevel::Error)) return;
    std::osyncstream os(std::cerr);
    os << "[\u001B[91mERROR\u001B[0m] " << fmt::format(format, std::forward<Args>(args)...) << EndLogLine;
}

namespace formatting::detail {
    inline
    uint32_t DecimalsFor3SF(double value)
    {
        if (value < 10) return 2;
        if (value < 100) return 1;
        return 0;
    }
}

inline
std::string ByteSizeToString(uint64_t bytes)
{
    using formatting::detail::DecimalsFor3SF;

    constexpr auto Gigabyte = 1ull << 30;
    if (bytes >= Gigabyte) {
        double gigabytes = bytes / double(Gigabyte);
        return fmt::format("{:.{}f}GiB", gigabytes, DecimalsFor3SF(gigabytes));
    }

    constexpr auto Megabyte = 1ull << 20;
    if (bytes >= Megabyte) {
        double megabytes = bytes / double(Megabyte);
        return fmt::format("{:.{}f}MiB", megabytes, DecimalsFor3SF(megabytes));
    }

    constexpr auto Kilobyte = 1ull << 10;
    if (bytes >= Kilobyte) {
        double kilobytes = bytes / double(Kilobyte);
        return fmt::format("{:.{}f}KiB", kilobytes, DecimalsFor3SF(kilobytes));
    }

    if (bytes > 0) {
        return fmt::format("{} byte{}", bytes, bytes == 1 ? "" : "s");
    }

    return "0 bytes";
}

} // namespace JsonPipe
