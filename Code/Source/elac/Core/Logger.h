/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef ELAC_CORE_LOGGER_H
#define ELAC_CORE_LOGGER_H

/**
 * @file Logger.h
 * @brief Logging infrastructure for the ELAC library
 *
 * Thread-safe, MPI-aware logging with severity levels, console and file
 * sinks, custom handlers and scoped timing.
 */

#include "Types.h"
#include "ElacConfig.h"
#include <chrono>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace elac {

enum class LogLevel : int {
    DEBUG    = 0,
    INFO     = 1,
    WARNING  = 2,
    ERROR    = 3,
    CRITICAL = 4,
    OFF      = 5
};

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default:                 return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name (case-insensitive); returns false if unknown
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/// Wall-clock stopwatch; elapsed() keeps counting until stop()
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    void start() {
        begin_ = Clock::now();
        end_.reset();
    }

    void stop() {
        if (!end_) end_ = Clock::now();
    }

    /// Seconds since start()
    double elapsed() const {
        return std::chrono::duration<double>(end_.value_or(Clock::now()) - begin_).count();
    }

private:
    Clock::time_point begin_{Clock::now()};
    std::optional<Clock::time_point> end_{};
};

/// One record as handed to handlers and sinks
struct LogMessage {
    LogLevel level{LogLevel::INFO};
    std::string text{};
    std::string file{};
    int line{0};
    std::string function{};
    std::chrono::system_clock::time_point when{};
    int rank{-1};
};

/**
 * @brief Process-wide logger
 *
 * Configured from the environment at static initialization:
 * ELAC_LOG_LEVEL, ELAC_LOG_FILE, ELAC_LOG_CONSOLE, ELAC_LOG_SHOW_RANK,
 * ELAC_LOG_SHOW_TIME.
 */
class Logger {
public:
    using LogHandler = std::function<void(const LogMessage&)>;

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void set_level(LogLevel level);
    LogLevel get_level() const;

    void set_console_output(bool enabled);

    /**
     * @brief Open a log file; the MPI rank is appended to the name in parallel runs
     */
    void set_file_output(const std::string& filename);

    void set_show_rank(bool show);
    void set_show_timestamp(bool show);

    void log(LogLevel level,
             const std::string& message,
             const char* file = "",
             int line = 0,
             const char* function = "");

    void log_timed(LogLevel level,
                   const std::string& message,
                   double elapsed_seconds);

    void add_handler(LogHandler handler);
    void clear_handlers();

    void flush();

private:
    Logger() = default;
    ~Logger();

    std::string format_message(const LogMessage& msg) const;

    mutable std::mutex mutex_;
    LogLevel min_level_{LogLevel::INFO};
    bool console_output_{true};
    bool show_rank_{true};
    bool show_timestamp_{true};
    std::ofstream file_stream_;
    std::vector<LogHandler> handlers_;
};

/// Logs "<label> (elapsed: <t>s)" when it goes out of scope
class ScopedTimer {
public:
    explicit ScopedTimer(std::string label, LogLevel level = LogLevel::DEBUG)
        : label_(std::move(label)), level_(level) {}

    ~ScopedTimer() { Logger::instance().log_timed(level_, label_, timer_.elapsed()); }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string label_;
    LogLevel level_;
    Timer timer_{};
};

#define ELAC_LOG(level, message) \
    elac::Logger::instance().log(level, message, __FILE__, __LINE__, __FUNCTION__)

#if ELAC_DEBUG_MODE
    #define ELAC_LOG_DEBUG(message) ELAC_LOG(elac::LogLevel::DEBUG, message)
#else
    #define ELAC_LOG_DEBUG(message) ((void)0)
#endif

#define ELAC_LOG_INFO(message) ELAC_LOG(elac::LogLevel::INFO, message)
#define ELAC_LOG_WARNING(message) ELAC_LOG(elac::LogLevel::WARNING, message)
#define ELAC_LOG_ERROR(message) ELAC_LOG(elac::LogLevel::ERROR, message)
#define ELAC_LOG_CRITICAL(message) ELAC_LOG(elac::LogLevel::CRITICAL, message)

#define ELAC_TIMED_SCOPE_CONCAT_(a, b) a##b
#define ELAC_TIMED_SCOPE_NAME_(line) ELAC_TIMED_SCOPE_CONCAT_(elac_scoped_timer_, line)

#define ELAC_TIMED_SCOPE(name) \
    elac::ScopedTimer ELAC_TIMED_SCOPE_NAME_(__LINE__)(name)

} // namespace elac

#endif // ELAC_CORE_LOGGER_H
