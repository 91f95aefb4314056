#pragma once

#include <atomic>
#include <iostream>
#include <string>
#include <mutex>

namespace Coalesce {

/**
 * @brief Thread-safe logging utility for the resolution engine.
 *
 * Debug/Info/Step/Success go to stdout, Warning/Error to stderr.
 * Messages below the process-wide minimum level are dropped.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error,
        Off
    };

    static void set_level(Level level) { min_level().store(level); }
    static Level level() { return min_level().load(); }

    static bool enabled(Level level) {
        return static_cast<int>(level) >= static_cast<int>(min_level().load());
    }

    static void log(Level level, const std::string& message) {
        if (level == Level::Off || !enabled(level)) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Off:     break;
        }

        std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::Info};
        return level;
    }
};

} // namespace Coalesce
