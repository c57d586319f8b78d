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

#include "Halo/DatatypeCache.h"

#if ELAC_HAS_MPI

#include "Core/ElacException.h"

namespace elac {
namespace halo {

DatatypeCache& DatatypeCache::instance()
{
    static DatatypeCache cache;
    return cache;
}

MPI_Datatype DatatypeCache::baseType(ScalarType dtype)
{
    switch (dtype) {
        case ScalarType::Float64: return MPI_DOUBLE;
        case ScalarType::Float32: return MPI_FLOAT;
        case ScalarType::Int32:   return MPI_INT32_T;
        case ScalarType::Int64:   return MPI_INT64_T;
        default:
            ELAC_NOT_IMPLEMENTED("unknown base type for MPI datatype (" +
                                 std::string(scalar_type_to_string(dtype)) + ")");
    }
}

MPI_Datatype DatatypeCache::get(ScalarType dtype, int block_size)
{
    ELAC_CHECK_ARG(block_size > 0,
                   "DatatypeCache::get: block size must be positive, got " + std::to_string(block_size));

    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = std::make_pair(dtype, block_size);
    const auto it = types_.find(key);
    if (it != types_.end()) {
        return it->second;
    }

    MPI_Datatype base = baseType(dtype);
    MPI_Datatype type = base;
    if (block_size > 1) {
        ELAC_CHECK_MPI(MPI_Type_contiguous(block_size, base, &type));
        ELAC_CHECK_MPI(MPI_Type_commit(&type));
    }
    types_.emplace(key, type);
    return type;
}

std::size_t DatatypeCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return types_.size();
}

} // namespace halo
} // namespace elac

#endif // ELAC_HAS_MPI
