#include "stftp/stftp_logger.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace stftp {

namespace {

constexpr const char* kLevelNames[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "CRITICAL"};
constexpr int kLevelCount = sizeof(kLevelNames) / sizeof(kLevelNames[0]);

std::string Timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local;
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis.count();
    return out.str();
}

} // namespace

const char* LogLevelName(int level) {
    if (level < 0 || level >= kLevelCount) {
        return "UNKNOWN";
    }
    return kLevelNames[level];
}

bool ParseLogLevel(const std::string& name, int& level) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    for (int i = 0; i < kLevelCount; ++i) {
        if (upper == kLevelNames[i]) {
            level = i;
            return true;
        }
    }
    return false;
}

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    CloseLogFile();
}

bool Logger::SetLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    log_file_.clear();
    log_file_.open(filename, std::ios::app);
    return log_file_.is_open();
}

void Logger::CloseLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::Log(int level, const std::string& message) {
    if (!ShouldLog(level)) {
        return;
    }

    std::string line = Timestamp() + " [" + LogLevelName(level) + "] " + message + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_ << line;
        log_file_.flush();
    } else {
        std::cerr << line;
    }
}

} // namespace stftp
