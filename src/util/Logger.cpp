#include "util/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <sstream>
#include <string_view>
#include <vector>

namespace colpick::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Kept open between records
static std::string log_path = Logger::DEFAULT_LOG_FILE;
static Logger::Level min_level = Logger::Level::Info;

// Records since the last init(), replayed into the reopened sink
static std::vector<std::string> carried_records;
static constexpr size_t MAX_CARRIED_RECORDS = 256;

void Logger::init() {
    init(DEFAULT_LOG_FILE, Level::Info);
}

void Logger::init(const std::string& path, Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = path.empty() ? DEFAULT_LOG_FILE : path;
    min_level = level;
    log_file.open(log_path, std::ios::trunc);
    for (const auto& record : carried_records) {
        log_file << record;
    }
    log_file.flush();
    carried_records.clear();
}

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level = level;
}

bool Logger::enabled(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    return static_cast<int>(level) >= static_cast<int>(min_level);
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (static_cast<int>(level) < static_cast<int>(min_level)) return;

    if (!log_file.is_open()) {
        // Not initialized: append rather than clobber another session's log
        log_file.open(log_path, std::ios::app);
    }
    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    std::ostringstream record;
    record << std::put_time(&tm, "[%H:%M:%S] ") << level_str << message << "\n";
    if (carried_records.size() < MAX_CARRIED_RECORDS) {
        carried_records.push_back(record.str());
    }

    if (!log_file) return;
    log_file << record.str();
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

Logger::Level Logger::parse_level(const std::string& name, Level fallback) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    return fallback;
}

}  // namespace colpick::util
