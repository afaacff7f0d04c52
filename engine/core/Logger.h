// Console logger with a level filter and a swappable sink (tests capture output through it).
#pragma once

#include <functional>
#include <string_view>

namespace Surge {

enum class LogLevel { Debug, Info, Warning, Error };

class Logger {
public:
    using Sink = std::function<void(LogLevel, std::string_view)>;

    static void log(LogLevel level, std::string_view message);
    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();
    // Replaces stdout output; pass an empty function to restore it.
    static void setSink(Sink sink);
};

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Surge
