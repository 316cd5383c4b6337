#pragma once

/**
 * @file Log.h
 * @brief Leveled logging facade with a replaceable sink
 *
 * Usage:
 * @code
 * Log::SetLevel(LogLevel::Debug);
 * Log::Info("pass {} produced {} primitives", index, count);
 *
 * Log::SetSink([](LogLevel level, const std::string& msg) {
 *     telemetry.Push(level, msg);
 * });
 * @endcode
 *
 * Messages below the current level are never formatted.
 */

#include <VxTrace/Core/Export.h>

#include <fmt/format.h>

#include <functional>
#include <string>
#include <utility>

namespace Vx::Trace::Platform {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error,
    Off
};

VXTRACE_API const char* LogLevelName(LogLevel level);

class VXTRACE_API Log {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    /// Replace the output sink (nullptr restores the stderr sink)
    static void SetSink(Sink sink);

    static void SetLevel(LogLevel level);
    static LogLevel Level();

    static bool IsEnabled(LogLevel level);

    /// Emit an already formatted message
    static void Write(LogLevel level, const std::string& message);

    template<typename... Args>
    static void Debug(fmt::format_string<Args...> format, Args&&... args) {
        Emit(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Info(fmt::format_string<Args...> format, Args&&... args) {
        Emit(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Warning(fmt::format_string<Args...> format, Args&&... args) {
        Emit(LogLevel::Warning, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Error(fmt::format_string<Args...> format, Args&&... args) {
        Emit(LogLevel::Error, format, std::forward<Args>(args)...);
    }

private:
    template<typename... Args>
    static void Emit(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
        if (!IsEnabled(level)) return;
        Write(level, fmt::format(format, std::forward<Args>(args)...));
    }
};

} // namespace Vx::Trace::Platform
