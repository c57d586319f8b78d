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

#include "Halo/StarForest.h"

#include "Core/ElacException.h"
#include "Core/Logger.h"

#include <map>

namespace elac {
namespace halo {

StarForest::StarForest(LocalIndex num_roots, std::vector<LocalIndex> leaves, std::vector<RemoteIndex> remotes)
    : num_roots_(num_roots),
      leaves_(std::move(leaves)),
      remotes_(std::move(remotes))
{
    ELAC_CHECK_ARG(num_roots_ >= 0, "StarForest: negative root count");
    ELAC_CHECK_ARG(leaves_.size() == remotes_.size(),
                   "StarForest: " + std::to_string(leaves_.size()) + " leaves but " +
                       std::to_string(remotes_.size()) + " remote roots");
    for (std::size_t i = 0; i < leaves_.size(); ++i) {
        ELAC_CHECK_ARG(leaves_[i] >= 0, "StarForest: negative leaf slot");
        ELAC_CHECK_ARG(remotes_[i].rank >= 0 && remotes_[i].index >= 0,
                       "StarForest: invalid remote root for leaf " + std::to_string(leaves_[i]));
    }
}

StarForest StarForest::pruned(Rank my_rank) const
{
    std::vector<LocalIndex> leaves;
    std::vector<RemoteIndex> remotes;
    for (std::size_t i = 0; i < leaves_.size(); ++i) {
        if (remotes_[i].rank == my_rank) continue;
        leaves.push_back(leaves_[i]);
        remotes.push_back(remotes_[i]);
    }
    return StarForest(num_roots_, std::move(leaves), std::move(remotes));
}

LeafSchedule buildLeafSchedule(const StarForest& sf)
{
    std::map<Rank, std::size_t> slot_of_rank;
    for (const auto& r : sf.remotes()) {
        slot_of_rank.emplace(r.rank, 0u);
    }

    LeafSchedule sched;
    sched.graph.neighbors.reserve(slot_of_rank.size());
    sched.requested_roots.resize(slot_of_rank.size());
    for (auto& [rank, slot] : slot_of_rank) {
        slot = sched.graph.neighbors.size();
        CommGraph::Neighbor n;
        n.rank = rank;
        sched.graph.neighbors.push_back(std::move(n));
    }

    for (std::size_t i = 0; i < sf.numLeaves(); ++i) {
        const auto& r = sf.remotes()[i];
        const std::size_t slot = slot_of_rank.at(r.rank);
        sched.graph.neighbors[slot].recv_slots.push_back(sf.leaves()[i]);
        sched.requested_roots[slot].push_back(r.index);
    }
    return sched;
}

#if ELAC_HAS_MPI

CommGraph buildCommGraph(const StarForest& sf, MPI_Comm comm)
{
    int rank = 0;
    int size = 1;
    ELAC_CHECK_MPI(MPI_Comm_rank(comm, &rank));
    ELAC_CHECK_MPI(MPI_Comm_size(comm, &size));

    const LeafSchedule sched = buildLeafSchedule(sf);

    std::vector<int> send_counts(static_cast<std::size_t>(size), 0);
    for (std::size_t i = 0; i < sched.graph.neighbors.size(); ++i) {
        const Rank r = sched.graph.neighbors[i].rank;
        ELAC_CHECK_ARG(r < size && r != rank,
                       "buildCommGraph: leaf references rank " + std::to_string(r) +
                           " (communicator size " + std::to_string(size) + ", star forest not pruned?)");
        send_counts[static_cast<std::size_t>(r)] = static_cast<int>(sched.requested_roots[i].size());
    }

    std::vector<int> recv_counts(static_cast<std::size_t>(size), 0);
    ELAC_CHECK_MPI(MPI_Alltoall(send_counts.data(), 1, MPI_INT,
                                recv_counts.data(), 1, MPI_INT, comm));

    std::vector<int> send_displs(static_cast<std::size_t>(size), 0);
    std::vector<int> recv_displs(static_cast<std::size_t>(size), 0);
    for (int r = 1; r < size; ++r) {
        send_displs[static_cast<std::size_t>(r)] = send_displs[static_cast<std::size_t>(r - 1)] +
                                                   send_counts[static_cast<std::size_t>(r - 1)];
        recv_displs[static_cast<std::size_t>(r)] = recv_displs[static_cast<std::size_t>(r - 1)] +
                                                   recv_counts[static_cast<std::size_t>(r - 1)];
    }

    std::vector<LocalIndex> send_buf;
    for (const auto& req : sched.requested_roots) {
        send_buf.insert(send_buf.end(), req.begin(), req.end());
    }
    std::vector<LocalIndex> recv_buf(static_cast<std::size_t>(recv_displs.back() + recv_counts.back()));

    ELAC_CHECK_MPI(MPI_Alltoallv(send_buf.data(), send_counts.data(), send_displs.data(), MPI_INT32_T,
                                 recv_buf.data(), recv_counts.data(), recv_displs.data(), MPI_INT32_T, comm));

    std::map<Rank, CommGraph::Neighbor> merged;
    for (const auto& n : sched.graph.neighbors) {
        merged[n.rank] = n;
    }
    for (int r = 0; r < size; ++r) {
        const auto count = recv_counts[static_cast<std::size_t>(r)];
        if (count == 0) continue;
        auto& n = merged[r];
        n.rank = r;
        const auto first = recv_buf.begin() + recv_displs[static_cast<std::size_t>(r)];
        n.send_slots.assign(first, first + count);
        for (const auto root : n.send_slots) {
            ELAC_THROW_IF(root < 0 || root >= sf.numRoots(), InvalidArgumentException,
                          "buildCommGraph: rank " + std::to_string(r) + " requested root " +
                              std::to_string(root) + " of " + std::to_string(sf.numRoots()));
        }
    }

    CommGraph graph;
    graph.neighbors.reserve(merged.size());
    for (auto& entry : merged) {
        graph.neighbors.push_back(std::move(entry.second));
    }

    ELAC_LOG_DEBUG("buildCommGraph: " + std::to_string(graph.neighbors.size()) + " neighbours, " +
                   std::to_string(sf.numLeaves()) + " leaves, " +
                   std::to_string(recv_buf.size()) + " requested roots");
    return graph;
}

#endif // ELAC_HAS_MPI

} // namespace halo
} // namespace elac
