/**
 * @file Log.cpp
 * @brief Level-filtered logging through fmt
 */

#include <VxTrace/Platform/Log.h>

#include <atomic>
#include <cstdio>
#include <mutex>

namespace Vx::Trace::Platform {

namespace {

std::mutex& SinkMutex() {
    static std::mutex mutex;
    return mutex;
}

Log::Sink& CurrentSink() {
    static Log::Sink sink;
    return sink;
}

std::atomic<int>& CurrentLevel() {
    static std::atomic<int> level{static_cast<int>(LogLevel::Warning)};
    return level;
}

void StderrSink(LogLevel level, const std::string& message) {
    fmt::print(stderr, "[{}] {}\n", LogLevelName(level), message);
}

} // namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Off:     return "OFF";
    }
    return "UNKNOWN";
}

void Log::SetSink(Sink sink) {
    std::lock_guard<std::mutex> lock(SinkMutex());
    CurrentSink() = std::move(sink);
}

void Log::SetLevel(LogLevel level) {
    CurrentLevel().store(static_cast<int>(level));
}

LogLevel Log::Level() {
    return static_cast<LogLevel>(CurrentLevel().load());
}

bool Log::IsEnabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= CurrentLevel().load();
}

void Log::Write(LogLevel level, const std::string& message) {
    if (!IsEnabled(level)) return;

    std::lock_guard<std::mutex> lock(SinkMutex());
    if (CurrentSink()) {
        CurrentSink()(level, message);
    } else {
        StderrSink(level, message);
    }
}

} // namespace Vx::Trace::Platform
