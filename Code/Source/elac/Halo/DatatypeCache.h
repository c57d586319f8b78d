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

#ifndef ELAC_HALO_DATATYPECACHE_H
#define ELAC_HALO_DATATYPECACHE_H

/**
 * @file DatatypeCache.h
 * @brief Process-wide registry of MPI datatypes for array blocks
 */

#include "Core/ElacConfig.h"
#include "Core/Types.h"

#if ELAC_HAS_MPI

#include <mpi.h>

#include <map>
#include <mutex>
#include <utility>

namespace elac {
namespace halo {

/**
 * @brief MPI datatype for `block_size` contiguous scalars, created once per key
 *
 * block_size 1 maps to the base type; larger blocks to a committed contiguous
 * type. Entries live until process exit and are never freed. Lookups are
 * serialized; MPI must be initialized before the first lookup.
 */
class DatatypeCache {
public:
    static DatatypeCache& instance();

    DatatypeCache(const DatatypeCache&) = delete;
    DatatypeCache& operator=(const DatatypeCache&) = delete;

    /// NotImplementedException for unknown scalar types
    [[nodiscard]] MPI_Datatype get(ScalarType dtype, int block_size);

    /// Base MPI type of a scalar type, NotImplementedException if unknown
    [[nodiscard]] static MPI_Datatype baseType(ScalarType dtype);

    [[nodiscard]] std::size_t size() const;

private:
    DatatypeCache() = default;

    mutable std::mutex mutex_;
    std::map<std::pair<ScalarType, int>, MPI_Datatype> types_;
};

} // namespace halo
} // namespace elac

#endif // ELAC_HAS_MPI

#endif // ELAC_HALO_DATATYPECACHE_H
