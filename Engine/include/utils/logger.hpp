#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>
#include <cstdlib>
#include <unistd.h>

namespace Broadsheet {

/**
 * @brief Thread-safe console logger shared by the loader, integrator and CLI.
 *
 * Warnings and errors go to stderr, everything else to stdout.
 * Debug lines are suppressed unless the threshold is lowered to Level::Debug.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void log(Level level, const std::string& message) {
        if (level < threshold()) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "  . ";  break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        const bool to_err = level >= Level::Warning;
        std::ostream& out = to_err ? std::cerr : std::cout;
        if (use_color(to_err)) {
            out << color << prefix << message << "\033[0m" << std::endl;
        } else {
            out << prefix << message << std::endl;
        }
    }

    static void set_threshold(Level level) { threshold_ref().store(level); }
    static Level threshold() { return threshold_ref().load(); }
    static bool debug_enabled() { return threshold() == Level::Debug; }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& threshold_ref() {
        static std::atomic<Level> level{Level::Info};
        return level;
    }

    // BROADSHEET_NO_COLOR disables escapes; so does a redirected stream.
    static bool use_color(bool to_err) {
        static const bool disabled = std::getenv("BROADSHEET_NO_COLOR") != nullptr;
        if (disabled) return false;
        return ::isatty(to_err ? STDERR_FILENO : STDOUT_FILENO) != 0;
    }
};

} // namespace Broadsheet
