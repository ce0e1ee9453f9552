/**
 * Component logging
 *
 * Each source file names its component once with SHALE_LOG_TAG and streams
 * messages through the level macros:
 *
 *   SHALE_LOG_TAG(Commit);
 *   SHALE_LOG_WARN(Commit) << "rebasing onto " << head;
 *
 * Nothing is formatted or written unless the build defines
 * SHALE_ENABLE_DEBUG_LOGGING; SHALE_MIN_LOG_LEVEL drops the lower levels at
 * compile time. Lines go to stderr as "[LEVEL] [Component] message".
 */

#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#ifndef SHALE_MIN_LOG_LEVEL
#define SHALE_MIN_LOG_LEVEL 2
#endif

namespace shale {
namespace logging {

enum class LogLevel : int {
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
};

struct Component {
    const char* name;
};

constexpr bool LevelCompiledIn(LogLevel level) {
    return static_cast<int>(level) >= SHALE_MIN_LOG_LEVEL;
}

inline void WriteLine(const Component& component, LogLevel level, const std::string& message) {
    static std::mutex mutex;
    static const char* const kNames[] = {"", "DEBUG", "INFO ", "WARN ", "ERROR"};
    std::lock_guard<std::mutex> lock(mutex);
    std::cerr << "[" << kNames[static_cast<int>(level)] << "] [" << component.name << "] "
              << message << "\n";
}

#ifdef SHALE_ENABLE_DEBUG_LOGGING

// Collects one line and writes it on destruction.
template <LogLevel Level>
class LogStream {
public:
    explicit LogStream(const Component& component) : component_(component) {}

    ~LogStream() {
        if (LevelCompiledIn(Level)) {
            WriteLine(component_, Level, buffer_.str());
        }
    }

    template <typename T>
    LogStream& operator<<(const T& value) {
        if (LevelCompiledIn(Level)) {
            buffer_ << value;
        }
        return *this;
    }

private:
    const Component& component_;
    std::ostringstream buffer_;
};

#else

template <LogLevel Level>
class LogStream {
public:
    explicit LogStream(const Component&) {}

    template <typename T>
    LogStream& operator<<(const T&) {
        return *this;
    }
};

#endif // SHALE_ENABLE_DEBUG_LOGGING

} // namespace logging
} // namespace shale

#define SHALE_LOG_TAG(name) static constexpr ::shale::logging::Component name##Tag{#name}

#define SHALE_LOG_DEBUG(component) \
    ::shale::logging::LogStream<::shale::logging::LogLevel::DEBUG>(component##Tag)
#define SHALE_LOG_INFO(component) \
    ::shale::logging::LogStream<::shale::logging::LogLevel::INFO>(component##Tag)
#define SHALE_LOG_WARN(component) \
    ::shale::logging::LogStream<::shale::logging::LogLevel::WARN>(component##Tag)
#define SHALE_LOG_ERROR(component) \
    ::shale::logging::LogStream<::shale::logging::LogLevel::ERROR>(component##Tag)
