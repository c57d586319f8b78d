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

#ifndef ELAC_HALO_HALO_H
#define ELAC_HALO_HALO_H

/**
 * @file Halo.h
 * @brief Ghost-value exchange for arrays laid out by a DataLayout
 *
 * Global-to-local copies owner values into ghost slots (WRITE only);
 * local-to-global adds ghost contributions into the owners (INC only).
 * Each exchange is split into begin/end so that communication can overlap
 * local work. Exchanges for several arrays may be in flight at once; every
 * rank must begin them in the same order. On a single-rank communicator all
 * exchanges are no-ops.
 */

#include "Core/ElacConfig.h"
#include "Core/Types.h"
#include "Halo/DataLayout.h"
#include "Halo/StarForest.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#if ELAC_HAS_MPI
#include <mpi.h>
#endif

namespace elac {
namespace halo {

/**
 * @brief Access mode of a distributed array during an exchange
 */
enum class InsertMode : std::uint8_t {
    Read,
    Write,
    ReadWrite,
    Inc,
    Min,
    Max
};

[[nodiscard]] const char* insertModeName(InsertMode m) noexcept;

/**
 * @brief Non-owning view of a distributed array
 *
 * `num_slots` blocks of `block_size` scalars; one slot per layout dof.
 */
struct ArrayView {
    void* data{nullptr};
    ScalarType dtype{ScalarType::Float64};
    int block_size{1};
    LocalIndex num_slots{0};

    static ArrayView of(std::vector<double>& v, int block_size = 1)
    {
        return {v.data(), ScalarType::Float64, block_size, static_cast<LocalIndex>(v.size()) / block_size};
    }
    static ArrayView of(std::vector<float>& v, int block_size = 1)
    {
        return {v.data(), ScalarType::Float32, block_size, static_cast<LocalIndex>(v.size()) / block_size};
    }
    static ArrayView of(std::vector<std::int32_t>& v, int block_size = 1)
    {
        return {v.data(), ScalarType::Int32, block_size, static_cast<LocalIndex>(v.size()) / block_size};
    }
    static ArrayView of(std::vector<std::int64_t>& v, int block_size = 1)
    {
        return {v.data(), ScalarType::Int64, block_size, static_cast<LocalIndex>(v.size()) / block_size};
    }
};

class Halo {
public:
    /// Single-participant halo; the layout may only reference rank 0
    explicit Halo(DataLayout layout);

#if ELAC_HAS_MPI
    Halo(DataLayout layout, MPI_Comm comm);

    [[nodiscard]] MPI_Comm comm() const noexcept { return comm_; }
#endif

    ~Halo();

    Halo(const Halo&) = delete;
    Halo& operator=(const Halo&) = delete;

    [[nodiscard]] Rank rank() const noexcept { return rank_; }
    [[nodiscard]] int size() const noexcept { return size_; }
    [[nodiscard]] const DataLayout& layout() const noexcept { return layout_; }

    /**
     * @brief Dof-level star forest, pruned of local roots
     *
     * Built on first use; collective on the communicator.
     */
    [[nodiscard]] const StarForest& sf();

    /// Message schedule of sf(); collective on first use
    [[nodiscard]] const CommGraph& commGraph();

    /**
     * @brief Global number of every local dof
     *
     * Owned dofs are numbered contiguously per rank in rank order; ghosts
     * carry their owner's number. Collective on first use.
     */
    [[nodiscard]] const std::vector<GlobalIndex>& localToGlobalNumbering();

    void globalToLocalBegin(const ArrayView& array, InsertMode mode);
    void globalToLocalEnd(const ArrayView& array, InsertMode mode);
    void localToGlobalBegin(const ArrayView& array, InsertMode mode);
    void localToGlobalEnd(const ArrayView& array, InsertMode mode);

    /// True between begin and end for `data`
    [[nodiscard]] bool hasPendingExchange(const void* data) const;

private:
    struct Pending;

    void checkArray(const ArrayView& array, const char* where) const;
    void begin(const ArrayView& array, bool reverse);
    void end(const ArrayView& array, bool reverse);

    DataLayout layout_;
    Rank rank_{0};
    int size_{1};

#if ELAC_HAS_MPI
    MPI_Comm comm_{MPI_COMM_SELF};
#endif

    std::optional<StarForest> sf_{};
    std::optional<CommGraph> graph_{};
    std::optional<std::vector<GlobalIndex>> l2g_{};
    std::vector<std::unique_ptr<Pending>> pending_{};
};

} // namespace halo
} // namespace elac

#endif // ELAC_HALO_HALO_H
