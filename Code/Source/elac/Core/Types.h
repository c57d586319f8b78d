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

#ifndef ELAC_CORE_TYPES_H
#define ELAC_CORE_TYPES_H

/**
 * @file Types.h
 * @brief Fundamental type definitions for the ELAC kernel compiler
 *
 * Index aliases, scalar and integral-domain enumerations, and status codes
 * shared by the expression, compiler and halo modules.
 */

#include <cstdint>
#include <cstddef>
#include <limits>
#include <string>

namespace elac {

// ============================================================================
// Index Types
// ============================================================================

/**
 * @brief Local index type for process-local numbering (points, slots, dofs)
 */
using LocalIndex = std::int32_t;

/**
 * @brief Global index type for distributed numbering
 *
 * Signed 64-bit; negative values mark unassigned entries.
 */
using GlobalIndex = std::int64_t;

/**
 * @brief MPI rank type
 */
using Rank = int;

constexpr LocalIndex INVALID_LOCAL_INDEX = -1;
constexpr GlobalIndex INVALID_GLOBAL_INDEX = -1;

// ============================================================================
// Scalar Types
// ============================================================================

/**
 * @brief Scalar types of distributed arrays
 */
enum class ScalarType : std::uint8_t {
    Float64,
    Float32,
    Int32,
    Int64,
    Unknown = 255
};

inline const char* scalar_type_to_string(ScalarType t) noexcept {
    switch (t) {
        case ScalarType::Float64: return "float64";
        case ScalarType::Float32: return "float32";
        case ScalarType::Int32:   return "int32";
        case ScalarType::Int64:   return "int64";
        default:                  return "unknown";
    }
}

/**
 * @brief Size in bytes of one scalar, 0 for unknown types
 */
inline std::size_t scalar_type_size(ScalarType t) noexcept {
    switch (t) {
        case ScalarType::Float64: return sizeof(double);
        case ScalarType::Float32: return sizeof(float);
        case ScalarType::Int32:   return sizeof(std::int32_t);
        case ScalarType::Int64:   return sizeof(std::int64_t);
        default:                  return 0;
    }
}

// ============================================================================
// Integral Domains
// ============================================================================

/**
 * @brief Integration domain category of a kernel
 */
enum class IntegralType : std::uint8_t {
    Cell,
    ExteriorFacet,
    InteriorFacet,
    ExteriorFacetTop,
    ExteriorFacetBottom,
    InteriorFacetHorizontal
};

inline const char* integral_type_to_string(IntegralType t) noexcept {
    switch (t) {
        case IntegralType::Cell:                    return "cell";
        case IntegralType::ExteriorFacet:           return "exterior_facet";
        case IntegralType::InteriorFacet:           return "interior_facet";
        case IntegralType::ExteriorFacetTop:        return "exterior_facet_top";
        case IntegralType::ExteriorFacetBottom:     return "exterior_facet_bottom";
        case IntegralType::InteriorFacetHorizontal: return "interior_facet_horiz";
        default:                                    return "unknown";
    }
}

/**
 * @brief Subdomain identifier meaning "the whole integration domain"
 */
inline const std::string DEFAULT_SUBDOMAIN_ID = "otherwise";

// ============================================================================
// Error Codes
// ============================================================================

/**
 * @brief Status codes carried by ElacException
 */
enum class ElacStatus : std::uint8_t {
    Success          = 0,
    InvalidArgument  = 1,
    Precondition     = 2,
    NotImplemented   = 3,
    CompilationError = 4,
    LookupError      = 5,
    MPIError         = 6,
    Unknown          = 255
};

inline const char* status_to_string(ElacStatus status) noexcept {
    switch (status) {
        case ElacStatus::Success:          return "Success";
        case ElacStatus::InvalidArgument:  return "Invalid argument";
        case ElacStatus::Precondition:     return "Precondition violated";
        case ElacStatus::NotImplemented:   return "Not implemented";
        case ElacStatus::CompilationError: return "Compilation error";
        case ElacStatus::LookupError:      return "Lookup error";
        case ElacStatus::MPIError:         return "MPI error";
        default:                           return "Unknown error";
    }
}

} // namespace elac

#endif // ELAC_CORE_TYPES_H
