#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>
#include <cstdlib>
#include <cctype>
#include <algorithm>

namespace Lexigraph {

/**
 * @brief Thread-safe logging utility for the traversal engine.
 *
 * Writes to stderr so stdout stays free for query results. The minimum
 * level defaults to Info and can be lowered to Debug through
 * LEXIGRAPH_LOG_LEVEL=debug or set_level().
 */
class Logger {
public:
    enum class Level {
        Debug = 0,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void set_level(Level level) { min_level() = static_cast<int>(level); }
    static Level level() { return static_cast<Level>(min_level().load()); }

    static bool enabled(Level level) {
        return static_cast<int>(level) >= min_level().load();
    }

    /**
     * @brief Parse "debug", "info", "warn"/"warning" or "error".
     * Unknown names fall back to Info.
     */
    static Level parse_level(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "debug") return Level::Debug;
        if (name == "warn" || name == "warning") return Level::Warning;
        if (name == "error") return Level::Error;
        return Level::Info;
    }

    static void log(Level level, const std::string& message) {
        if (!enabled(level)) return;

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
        }

        std::cerr << color << prefix << message << "\033[0m" << std::endl;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<int>& min_level() {
        static std::atomic<int> level{initial_level()};
        return level;
    }

    static int initial_level() {
        const char* env = std::getenv("LEXIGRAPH_LOG_LEVEL");
        return static_cast<int>(env ? parse_level(env) : Level::Info);
    }
};

} // namespace Lexigraph
