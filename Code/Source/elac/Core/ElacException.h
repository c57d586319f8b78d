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

#ifndef ELAC_CORE_EXCEPTION_H
#define ELAC_CORE_EXCEPTION_H

/**
 * @file ElacException.h
 * @brief Exception hierarchy for error handling in the ELAC library
 *
 * Every error raised by the library derives from ElacException and carries
 * a status code, the throw site, and the MPI rank in parallel runs.
 */

#include "Types.h"
#include "ElacConfig.h"
#include <exception>
#include <string>
#include <utility>
#include <sstream>

#if ELAC_HAS_MPI
#include <mpi.h>
#endif

namespace elac {

// ============================================================================
// Base Exception Class
// ============================================================================

/**
 * @brief Base of every ELAC error
 *
 * what() reads "<status> [rank r] at file:line (function): message", with the
 * rank and site parts present only when known.
 */
class ElacException : public std::exception {
public:
    explicit ElacException(std::string message, ElacStatus status = ElacStatus::Unknown)
        : ElacException(std::move(message), "", 0, "", status) {}

    ElacException(std::string message,
                  const char* file,
                  int line,
                  const char* function = "",
                  ElacStatus status = ElacStatus::Unknown)
        : message_(std::move(message)),
          status_(status),
          file_(file ? file : ""),
          line_(line),
          function_(function ? function : ""),
          mpi_rank_(current_rank()) {
        format();
    }

    ~ElacException() noexcept override = default;

    const char* what() const noexcept override { return what_.c_str(); }

    ElacStatus status() const noexcept { return status_; }

    /// Message without status, rank or site
    const std::string& message() const noexcept { return message_; }

    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    const std::string& function() const noexcept { return function_; }

    /// Rank in MPI_COMM_WORLD, -1 outside an MPI run
    int mpi_rank() const noexcept { return mpi_rank_; }

    /// Prefix the message with what the caller was doing, e.g. "while compiling T0"
    void add_context(const std::string& context) {
        message_ = context + ": " + message_;
        format();
    }

private:
    std::string message_;
    ElacStatus status_;
    std::string file_;
    int line_;
    std::string function_;
    int mpi_rank_;
    std::string what_;

    static int current_rank() noexcept {
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

    void format() {
        std::ostringstream oss;
        oss << status_to_string(status_);
        if (mpi_rank_ >= 0) {
            oss << " [rank " << mpi_rank_ << "]";
        }
        if (!file_.empty()) {
            oss << " at " << file_ << ':' << line_;
            if (!function_.empty()) {
                oss << " (" << function_ << ')';
            }
        }
        oss << ": " << message_;
        what_ = oss.str();
    }
};

// ============================================================================
// Specific Exception Types
// ============================================================================

/**
 * @brief Malformed input (empty expression, non-block body, bad shapes)
 */
class InvalidArgumentException : public ElacException {
public:
    InvalidArgumentException(const std::string& message,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : ElacException(message, file, line, function, ElacStatus::InvalidArgument) {}
};

/**
 * @brief Operation called in the wrong lifecycle state
 */
class PreconditionException : public ElacException {
public:
    PreconditionException(const std::string& message,
                          const char* file = "",
                          int line = 0,
                          const char* function = "")
        : ElacException(message, file, line, function, ElacStatus::Precondition) {}
};

/**
 * @brief Recognized but unsupported input
 */
class NotImplementedException : public ElacException {
public:
    NotImplementedException(const std::string& feature,
                            const char* file = "",
                            int line = 0,
                            const char* function = "")
        : ElacException("Feature not implemented: " + feature, file, line, function,
                        ElacStatus::NotImplemented) {}
};

/**
 * @brief Failure raised by a terminal-form compiler
 */
class CompilationException : public ElacException {
public:
    CompilationException(const std::string& message,
                         const char* file = "",
                         int line = 0,
                         const char* function = "")
        : ElacException(message, file, line, function, ElacStatus::CompilationError) {}
};

/**
 * @brief Requested key is not part of the expression
 */
class LookupException : public ElacException {
public:
    LookupException(const std::string& message,
                    const char* file = "",
                    int line = 0,
                    const char* function = "")
        : ElacException(message, file, line, function, ElacStatus::LookupError) {}
};

/**
 * @brief MPI call returned an error code
 */
class MPIException : public ElacException {
public:
    MPIException(const std::string& message,
                 int error_code,
                 const char* file = "",
                 int line = 0,
                 const char* function = "")
        : ElacException(message + " (MPI error code: " + std::to_string(error_code) + ")",
                        file, line, function, ElacStatus::MPIError),
          error_code_(error_code) {}

    int error_code() const { return error_code_; }

private:
    int error_code_;
};

// ============================================================================
// Exception Throwing Macros
// ============================================================================

#define ELAC_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__, __FUNCTION__)

#define ELAC_THROW_IF_3(condition, ExceptionType, message) \
    do { \
        if (ELAC_UNLIKELY(condition)) { \
            ELAC_THROW(ExceptionType, message); \
        } \
    } while(0)

#define ELAC_THROW_IF_2(condition, message) \
    do { \
        if (ELAC_UNLIKELY(condition)) { \
            ELAC_THROW(ElacException, message); \
        } \
    } while(0)

#define ELAC_THROW_IF_SELECT(_1, _2, _3, NAME, ...) NAME

/**
 * @brief Conditional throw with source location
 *
 * Takes (condition, message) using ElacException, or
 * (condition, ExceptionType, message).
 */
#define ELAC_THROW_IF(...) \
    ELAC_THROW_IF_SELECT(__VA_ARGS__, ELAC_THROW_IF_3, ELAC_THROW_IF_2)(__VA_ARGS__)

#define ELAC_CHECK_ARG(condition, message) \
    ELAC_THROW_IF(!(condition), InvalidArgumentException, message)

#define ELAC_CHECK_NOT_NULL(ptr, name) \
    ELAC_THROW_IF((ptr) == nullptr, InvalidArgumentException, \
                  std::string(name) + " is null")

#define ELAC_CHECK_INDEX(index, size) \
    ELAC_THROW_IF((index) >= (size), \
                  InvalidArgumentException, \
                  "Index " + std::to_string(index) + " out of bounds [0, " + \
                  std::to_string(size) + ")")

#define ELAC_NOT_IMPLEMENTED(feature) \
    ELAC_THROW(NotImplementedException, feature)

/**
 * @brief Throw MPIException when an MPI call does not return MPI_SUCCESS
 */
#define ELAC_CHECK_MPI(call) \
    do { \
        const int elac_mpi_rc_ = (call); \
        if (ELAC_UNLIKELY(elac_mpi_rc_ != MPI_SUCCESS)) { \
            throw MPIException(#call, elac_mpi_rc_, __FILE__, __LINE__, __FUNCTION__); \
        } \
    } while(0)

} // namespace elac

#endif // ELAC_CORE_EXCEPTION_H
