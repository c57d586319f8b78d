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

#ifndef ELAC_HALO_STARFOREST_H
#define ELAC_HALO_STARFOREST_H

/**
 * @file StarForest.h
 * @brief Leaf -> remote root mapping and the message schedule derived from it
 *
 * Every leaf (a local ghost slot) points to exactly one root: a slot owned
 * by some rank, identified by (rank, index). A CommGraph groups that mapping
 * per neighbour rank: the root slots a rank sends and the leaf slots it
 * receives, in matching order on both sides.
 */

#include "Core/ElacConfig.h"
#include "Core/Types.h"

#include <vector>

#if ELAC_HAS_MPI
#include <mpi.h>
#endif

namespace elac {
namespace halo {

struct RemoteIndex {
    Rank rank{-1};
    LocalIndex index{INVALID_LOCAL_INDEX};

    friend bool operator==(const RemoteIndex& a, const RemoteIndex& b)
    {
        return a.rank == b.rank && a.index == b.index;
    }
};

class StarForest {
public:
    StarForest() = default;

    /**
     * @param num_roots number of local slots other ranks may reference
     * @param leaves    local leaf slots
     * @param remotes   root of each leaf, same length as `leaves`
     */
    StarForest(LocalIndex num_roots, std::vector<LocalIndex> leaves, std::vector<RemoteIndex> remotes);

    [[nodiscard]] LocalIndex numRoots() const noexcept { return num_roots_; }
    [[nodiscard]] std::size_t numLeaves() const noexcept { return leaves_.size(); }
    [[nodiscard]] const std::vector<LocalIndex>& leaves() const noexcept { return leaves_; }
    [[nodiscard]] const std::vector<RemoteIndex>& remotes() const noexcept { return remotes_; }

    /// Copy without the leaves whose root lives on `my_rank`
    [[nodiscard]] StarForest pruned(Rank my_rank) const;

private:
    LocalIndex num_roots_{0};
    std::vector<LocalIndex> leaves_{};
    std::vector<RemoteIndex> remotes_{};
};

struct CommGraph {
    struct Neighbor {
        Rank rank{-1};

        /// Local root slots whose values go to `rank`
        std::vector<LocalIndex> send_slots{};

        /// Local leaf slots whose values come from `rank`
        std::vector<LocalIndex> recv_slots{};
    };

    /// Ascending rank; a neighbour may have only one of the two lists
    std::vector<Neighbor> neighbors{};

    [[nodiscard]] bool empty() const noexcept { return neighbors.empty(); }
};

/**
 * @brief Receive side of the schedule, computable without communication
 *
 * Leaves are grouped by root rank in ascending rank order, keeping leaf order
 * inside each group. `requested_roots[i]` lists the root indices wanted from
 * `graph.neighbors[i].rank`, in the same order as its recv_slots.
 */
struct LeafSchedule {
    CommGraph graph{};
    std::vector<std::vector<LocalIndex>> requested_roots{};
};

[[nodiscard]] LeafSchedule buildLeafSchedule(const StarForest& sf);

#if ELAC_HAS_MPI
/**
 * @brief Full schedule of a pruned star forest (collective over `comm`)
 *
 * Each rank tells the owners which roots it reads; an owner's send_slots for
 * a neighbour are those requests in the order they were made.
 */
[[nodiscard]] CommGraph buildCommGraph(const StarForest& sf, MPI_Comm comm);
#endif

} // namespace halo
} // namespace elac

#endif // ELAC_HALO_STARFOREST_H
