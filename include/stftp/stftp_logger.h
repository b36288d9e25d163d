/**
 * @file stftp_logger.h
 * @brief Logging for the TFTP library and server
 */

#ifndef STFTP_LOGGER_H_
#define STFTP_LOGGER_H_

#include "stftp/stftp_common.h"
#include <atomic>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <string>

namespace stftp {

enum LogLevel {
    kLogTrace = 0,
    kLogDebug = 1,
    kLogInfo = 2,
    kLogWarn = 3,
    kLogError = 4,
    kLogCritical = 5
};

// Build threshold; messages below it compile away
#ifndef STFTP_LOG_LEVEL
    #if defined(STFTP_MINIMAL_LOGGING)
        #define STFTP_LOG_LEVEL kLogError
    #elif defined(NDEBUG)
        #define STFTP_LOG_LEVEL kLogWarn
    #elif defined(_DEBUG) || defined(DEBUG)
        #define STFTP_LOG_LEVEL kLogDebug
    #else
        #define STFTP_LOG_LEVEL kLogInfo
    #endif
#endif

#define STFTP_LOG_ENABLED(level) (level >= STFTP_LOG_LEVEL)

/**
 * @brief Upper-case name of a level ("TRACE" .. "CRITICAL", "UNKNOWN" otherwise)
 */
STFTP_EXPORT const char* LogLevelName(int level);

/**
 * @brief Parse a level name, case-insensitive ("info", "WARN", ...)
 * @param name Level name
 * @param level Receives the level on success
 * @return false if the name is not a level
 */
STFTP_EXPORT bool ParseLogLevel(const std::string& name, int& level);

/**
 * @class Logger
 * @brief Process-wide logger shared by every transfer and the server loop
 *
 * Lines look like `2024-05-01 12:00:00.123 [WARN] message`. Output goes to
 * stderr until a log file is opened.
 */
class STFTP_EXPORT Logger {
public:
    static Logger& GetInstance();

    ~Logger();

    /**
     * @brief Append output to a file instead of stderr
     * @return false if the file cannot be opened; output then stays on stderr
     */
    bool SetLogFile(const std::string& filename);

    // Back to stderr
    void CloseLogFile();

    void SetLogLevel(int level) { log_level_.store(level); }
    int GetLogLevel() const { return log_level_.load(); }
    bool ShouldLog(int level) const { return level >= log_level_.load(); }

    void Log(int level, const std::string& message);

    /**
     * @brief printf-style logging; output longer than 1023 bytes is truncated
     */
    template<typename... Args>
    void LogFormat(int level, const char* format, Args... args) {
        if (!ShouldLog(level)) {
            return;
        }
        char buffer[1024];
        std::snprintf(buffer, sizeof(buffer), format, args...);
        Log(level, buffer);
    }

private:
    Logger() : log_level_(STFTP_LOG_LEVEL) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<int> log_level_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

#define STFTP_LOG_AT(level, ...) stftp::Logger::GetInstance().LogFormat(level, __VA_ARGS__)

#if STFTP_LOG_ENABLED(kLogTrace)
    #define STFTP_TRACE(...) STFTP_LOG_AT(stftp::kLogTrace, __VA_ARGS__)
#else
    #define STFTP_TRACE(...) ((void)0)
#endif

#if STFTP_LOG_ENABLED(kLogDebug)
    #define STFTP_DEBUG(...) STFTP_LOG_AT(stftp::kLogDebug, __VA_ARGS__)
#else
    #define STFTP_DEBUG(...) ((void)0)
#endif

#if STFTP_LOG_ENABLED(kLogInfo)
    #define STFTP_INFO(...) STFTP_LOG_AT(stftp::kLogInfo, __VA_ARGS__)
#else
    #define STFTP_INFO(...) ((void)0)
#endif

#if STFTP_LOG_ENABLED(kLogWarn)
    #define STFTP_WARN(...) STFTP_LOG_AT(stftp::kLogWarn, __VA_ARGS__)
#else
    #define STFTP_WARN(...) ((void)0)
#endif

#if STFTP_LOG_ENABLED(kLogError)
    #define STFTP_ERROR(...) STFTP_LOG_AT(stftp::kLogError, __VA_ARGS__)
#else
    #define STFTP_ERROR(...) ((void)0)
#endif

#if STFTP_LOG_ENABLED(kLogCritical)
    #define STFTP_CRITICAL(...) STFTP_LOG_AT(stftp::kLogCritical, __VA_ARGS__)
#else
    #define STFTP_CRITICAL(...) ((void)0)
#endif

} // namespace stftp

#endif // STFTP_LOGGER_H_
