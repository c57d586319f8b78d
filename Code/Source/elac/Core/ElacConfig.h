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

#ifndef ELAC_CORE_CONFIG_H
#define ELAC_CORE_CONFIG_H

/**
 * @file ElacConfig.h
 * @brief Compile-time configuration for the ELAC library
 *
 * Settings can be overridden via CMake or compiler flags.
 */

#include "Types.h"
#include <cstdio>

// --- build configuration detection

#if !defined(NDEBUG) || defined(DEBUG) || defined(_DEBUG)
    #define ELAC_DEBUG_MODE 1
#else
    #define ELAC_DEBUG_MODE 0
#endif

#if ELAC_DEBUG_MODE
#include <cassert>
#endif

// MPI support detection.
//
// CMake defines `ELAC_ENABLE_MPI` when MPI is found and requested.
// Normalize to a numeric macro suitable for `#if ELAC_HAS_MPI` use.
#ifdef ELAC_HAS_MPI
#  undef ELAC_HAS_MPI
#endif
#if defined(ELAC_ENABLE_MPI)
#  define ELAC_HAS_MPI 1
#else
#  define ELAC_HAS_MPI 0
#endif

// --- compiler hints

#if defined(__GNUC__) || defined(__clang__)
    #define ELAC_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define ELAC_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define ELAC_LIKELY(x)   (x)
    #define ELAC_UNLIKELY(x) (x)
#endif

// --- assertion macros

#if ELAC_DEBUG_MODE
    #define ELAC_ASSERT(cond) assert(cond)
    #define ELAC_ASSERT_MSG(cond, msg) assert((cond) && (msg))
#else
    #define ELAC_ASSERT(cond) ((void)0)
    #define ELAC_ASSERT_MSG(cond, msg) ((void)0)
#endif

namespace elac {
namespace config {

/**
 * @brief Prefix of generated subkernel names; the terminal position follows
 */
constexpr const char* SUBKERNEL_PREFIX = "subkernel";

/**
 * @brief Prefix of temporary symbols
 */
constexpr const char* TEMPORARY_PREFIX = "T";

/**
 * @brief Prefix of coefficient symbols
 */
constexpr const char* COEFFICIENT_PREFIX = "w_";

/**
 * @brief Base MPI tag used by halo exchanges
 */
constexpr int HALO_TAG_BASE = 4200;

/// One line per build switch, e.g. "elac: debug=off mpi=on"
inline void print_config() {
    std::printf("elac: debug=%s mpi=%s\n",
                ELAC_DEBUG_MODE ? "on" : "off",
                ELAC_HAS_MPI ? "on" : "off");
}

} // namespace config
} // namespace elac

#endif // ELAC_CORE_CONFIG_H
