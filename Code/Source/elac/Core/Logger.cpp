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

/**
 * @file Logger.cpp
 * @brief Logger implementation and environment-driven initialization
 */

#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#if ELAC_HAS_MPI
#include <mpi.h>
#endif

namespace elac {

namespace {

int current_mpi_rank() {
    int rank = -1;
    #if ELAC_HAS_MPI
    int initialized = 0;
    int finalized = 0;
    MPI_Initialized(&initialized);
    MPI_Finalized(&finalized);
    if (initialized && !finalized) {
        MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    }
    #endif
    return rank;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool env_flag(const char* value) {
    const std::string v = lowercase(value);
    return v != "false" && v != "0" && v != "off";
}

class LoggerInitializer {
public:
    LoggerInitializer() {
        auto& logger = Logger::instance();

        if (const char* env_level = std::getenv("ELAC_LOG_LEVEL")) {
            LogLevel level;
            if (parse_log_level(env_level, level)) {
                logger.set_level(level);
            }
        }

        if (const char* env_file = std::getenv("ELAC_LOG_FILE")) {
            logger.set_file_output(env_file);
        }

        if (const char* env_console = std::getenv("ELAC_LOG_CONSOLE")) {
            logger.set_console_output(env_flag(env_console));
        }

        if (const char* env_rank = std::getenv("ELAC_LOG_SHOW_RANK")) {
            logger.set_show_rank(env_flag(env_rank));
        }

        if (const char* env_time = std::getenv("ELAC_LOG_SHOW_TIME")) {
            logger.set_show_timestamp(env_flag(env_time));
        }
    }
};

static LoggerInitializer logger_init;

} // anonymous namespace

bool parse_log_level(const std::string& name, LogLevel& level) {
    const std::string s = lowercase(name);
    if (s == "debug") {
        level = LogLevel::DEBUG;
    } else if (s == "info") {
        level = LogLevel::INFO;
    } else if (s == "warning" || s == "warn") {
        level = LogLevel::WARNING;
    } else if (s == "error") {
        level = LogLevel::ERROR;
    } else if (s == "critical" || s == "crit") {
        level = LogLevel::CRITICAL;
    } else if (s == "off") {
        level = LogLevel::OFF;
    } else {
        return false;
    }
    return true;
}

// ============================================================================
// Logger
// ============================================================================

Logger::~Logger() {
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_output_ = enabled;
}

void Logger::set_file_output(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    if (filename.empty()) {
        return;
    }

    std::string actual_filename = filename;
    const int rank = current_mpi_rank();
    if (rank >= 0) {
        const auto dot_pos = filename.rfind('.');
        if (dot_pos != std::string::npos) {
            actual_filename = filename.substr(0, dot_pos) + "_rank" +
                              std::to_string(rank) + filename.substr(dot_pos);
        } else {
            actual_filename += "_rank" + std::to_string(rank);
        }
    }

    file_stream_.open(actual_filename, std::ios::app);
    if (!file_stream_.is_open()) {
        std::cerr << "Failed to open log file: " << actual_filename << std::endl;
    }
}

void Logger::set_show_rank(bool show) {
    std::lock_guard<std::mutex> lock(mutex_);
    show_rank_ = show;
}

void Logger::set_show_timestamp(bool show) {
    std::lock_guard<std::mutex> lock(mutex_);
    show_timestamp_ = show;
}

void Logger::log(LogLevel level,
                 const std::string& message,
                 const char* file,
                 int line,
                 const char* function) {
    if (level == LogLevel::OFF || level < get_level()) {
        return;
    }

    LogMessage msg;
    msg.level = level;
    msg.text = message;
    msg.file = file;
    msg.line = line;
    msg.function = function;
    msg.when = std::chrono::system_clock::now();
    msg.rank = current_mpi_rank();

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string formatted = format_message(msg);

    if (console_output_) {
        if (level >= LogLevel::WARNING) {
            std::cerr << formatted << std::flush;
        } else {
            std::cout << formatted << std::flush;
        }
    }

    if (file_stream_.is_open()) {
        file_stream_ << formatted << std::flush;
    }

    for (const auto& handler : handlers_) {
        handler(msg);
    }
}

void Logger::log_timed(LogLevel level,
                       const std::string& message,
                       double elapsed_seconds) {
    std::ostringstream oss;
    oss << message << " (elapsed: " << std::fixed << std::setprecision(3)
        << elapsed_seconds << "s)";
    log(level, oss.str());
}

void Logger::add_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void Logger::clear_handlers() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
}

std::string Logger::format_message(const LogMessage& msg) const {
    std::ostringstream oss;

    if (show_timestamp_) {
        const auto time_t = std::chrono::system_clock::to_time_t(msg.when);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            msg.when.time_since_epoch()) % 1000;
        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);
        oss << "[" << std::put_time(&tm_buf, "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    if (show_rank_ && msg.rank >= 0) {
        oss << "[R" << msg.rank << "] ";
    }

    oss << "[" << log_level_to_string(msg.level) << "] " << msg.text;

    #if ELAC_DEBUG_MODE
    if (msg.level >= LogLevel::WARNING && !msg.file.empty()) {
        oss << " (" << msg.file << ":" << msg.line;
        if (!msg.function.empty()) {
            oss << " in " << msg.function << "()";
        }
        oss << ")";
    }
    #endif

    oss << "\n";
    return oss.str();
}

} // namespace elac
