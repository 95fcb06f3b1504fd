#pragma once

#include <string>

namespace colpick::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static constexpr const char* DEFAULT_LOG_FILE = "/tmp/colpick_debug.log";

    static void init();
    // Truncates `path`; records logged since the previous init() are carried into it.
    static void init(const std::string& path, Level min_level);
    static void set_level(Level min_level);
    static bool enabled(Level level);

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // Accepts "debug", "info", "warn"/"warning", "error"; anything else yields fallback.
    static Level parse_level(const std::string& name, Level fallback);
};

}  // namespace colpick::util
