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

#include "Halo/Halo.h"

#include "Core/ElacException.h"
#include "Core/Logger.h"
#include "Halo/DatatypeCache.h"

#include <algorithm>
#include <cstddef>
#include <cstring>

namespace elac {
namespace halo {

const char* insertModeName(InsertMode m) noexcept
{
    switch (m) {
        case InsertMode::Read:      return "READ";
        case InsertMode::Write:     return "WRITE";
        case InsertMode::ReadWrite: return "RW";
        case InsertMode::Inc:       return "INC";
        case InsertMode::Min:       return "MIN";
        case InsertMode::Max:       return "MAX";
        default:                    return "UNKNOWN";
    }
}

namespace {

#if ELAC_HAS_MPI
void set_mpi_rank_and_size(MPI_Comm comm, int& rank, int& size)
{
    int initialized = 0;
    MPI_Initialized(&initialized);
    if (initialized) {
        ELAC_CHECK_MPI(MPI_Comm_rank(comm, &rank));
        ELAC_CHECK_MPI(MPI_Comm_size(comm, &size));
    } else {
        rank = 0;
        size = 1;
    }
}

template <class T>
void accumulate(std::byte* dst, const std::byte* src, std::size_t n)
{
    for (std::size_t i = 0; i < n; ++i) {
        T a;
        T b;
        std::memcpy(&a, dst + i * sizeof(T), sizeof(T));
        std::memcpy(&b, src + i * sizeof(T), sizeof(T));
        a += b;
        std::memcpy(dst + i * sizeof(T), &a, sizeof(T));
    }
}

void accumulateScalars(ScalarType dtype, std::byte* dst, const std::byte* src, std::size_t n)
{
    switch (dtype) {
        case ScalarType::Float64: accumulate<double>(dst, src, n); break;
        case ScalarType::Float32: accumulate<float>(dst, src, n); break;
        case ScalarType::Int32:   accumulate<std::int32_t>(dst, src, n); break;
        case ScalarType::Int64:   accumulate<std::int64_t>(dst, src, n); break;
        default:
            ELAC_NOT_IMPLEMENTED("accumulation of scalar type " + std::string(scalar_type_to_string(dtype)));
    }
}
#endif

} // namespace

/**
 * @brief Buffers of one posted exchange and the requests that use them
 *
 * Requests still outstanding at destruction are waited on first, so the
 * buffers outlive every send and receive posted into them.
 */
struct Halo::Pending {
    const void* data{nullptr};
    bool reverse{false};
#if ELAC_HAS_MPI
    std::vector<MPI_Request> requests{};
#endif
    std::vector<std::vector<std::byte>> send_bufs{};
    std::vector<std::vector<std::byte>> recv_bufs{};

    Pending() = default;
    Pending(const Pending&) = delete;
    Pending& operator=(const Pending&) = delete;

    ~Pending()
    {
#if ELAC_HAS_MPI
        if (requests.empty()) return;
        int finalized = 0;
        MPI_Finalized(&finalized);
        if (finalized) return;
        const int rc = MPI_Waitall(static_cast<int>(requests.size()), requests.data(), MPI_STATUSES_IGNORE);
        if (rc != MPI_SUCCESS) {
            ELAC_LOG_ERROR("Halo: waiting on " + std::to_string(requests.size()) +
                           " abandoned requests failed (MPI error code: " + std::to_string(rc) + ")");
        }
#endif
    }

    /// Waits for every request; throws MPIException on failure
    void complete()
    {
#if ELAC_HAS_MPI
        ELAC_CHECK_MPI(MPI_Waitall(static_cast<int>(requests.size()), requests.data(), MPI_STATUSES_IGNORE));
        requests.clear();
#endif
    }
};

// ============================================================================
// Construction
// ============================================================================

Halo::Halo(DataLayout layout)
    : layout_(std::move(layout))
{
    for (const auto& g : layout_.ghosts()) {
        ELAC_CHECK_ARG(g.owner == 0,
                       "Halo: ghost point " + std::to_string(g.point) + " is owned by rank " +
                           std::to_string(g.owner) + " but the halo has a single participant");
    }
}

#if ELAC_HAS_MPI
Halo::Halo(DataLayout layout, MPI_Comm comm)
    : layout_(std::move(layout)),
      comm_(comm)
{
    set_mpi_rank_and_size(comm_, rank_, size_);
    for (const auto& g : layout_.ghosts()) {
        ELAC_CHECK_ARG(g.owner >= 0 && g.owner < size_,
                       "Halo: ghost point " + std::to_string(g.point) + " is owned by rank " +
                           std::to_string(g.owner) + " outside the communicator (size " +
                           std::to_string(size_) + ")");
    }
}
#endif

Halo::~Halo() = default;

// ============================================================================
// Star forest and schedules
// ============================================================================

const StarForest& Halo::sf()
{
    if (sf_) return *sf_;

    std::vector<LocalIndex> leaves;
    std::vector<RemoteIndex> remotes;

#if ELAC_HAS_MPI
    if (size_ > 1) {
        // Owners report (offset, dofs) of every point a neighbour ghosts.
        std::vector<LocalIndex> point_leaves;
        std::vector<RemoteIndex> point_remotes;
        for (const auto& g : layout_.ghosts()) {
            point_leaves.push_back(g.point);
            point_remotes.push_back({g.owner, g.owner_point});
        }
        const StarForest point_sf =
            StarForest(layout_.numPoints(), std::move(point_leaves), std::move(point_remotes)).pruned(rank_);
        const CommGraph point_graph = buildCommGraph(point_sf, comm_);

        const MPI_Datatype pair_type = DatatypeCache::instance().get(ScalarType::Int32, 2);
        std::vector<std::vector<LocalIndex>> send_bufs(point_graph.neighbors.size());
        std::vector<std::vector<LocalIndex>> recv_bufs(point_graph.neighbors.size());
        std::vector<MPI_Request> requests;
        for (std::size_t i = 0; i < point_graph.neighbors.size(); ++i) {
            const auto& n = point_graph.neighbors[i];
            if (!n.recv_slots.empty()) {
                recv_bufs[i].resize(2u * n.recv_slots.size());
                requests.emplace_back();
                ELAC_CHECK_MPI(MPI_Irecv(recv_bufs[i].data(), static_cast<int>(n.recv_slots.size()), pair_type,
                                         n.rank, config::HALO_TAG_BASE + 2, comm_, &requests.back()));
            }
            if (!n.send_slots.empty()) {
                for (const auto p : n.send_slots) {
                    send_bufs[i].push_back(layout_.offset(p));
                    send_bufs[i].push_back(layout_.dofs(p));
                }
                requests.emplace_back();
                ELAC_CHECK_MPI(MPI_Isend(send_bufs[i].data(), static_cast<int>(n.send_slots.size()), pair_type,
                                         n.rank, config::HALO_TAG_BASE + 2, comm_, &requests.back()));
            }
        }
        ELAC_CHECK_MPI(MPI_Waitall(static_cast<int>(requests.size()), requests.data(), MPI_STATUSES_IGNORE));

        for (std::size_t i = 0; i < point_graph.neighbors.size(); ++i) {
            const auto& n = point_graph.neighbors[i];
            for (std::size_t k = 0; k < n.recv_slots.size(); ++k) {
                const LocalIndex p = n.recv_slots[k];
                const LocalIndex owner_offset = recv_bufs[i][2u * k];
                const LocalIndex owner_dofs = recv_bufs[i][2u * k + 1u];
                ELAC_THROW_IF(owner_dofs != layout_.dofs(p), InvalidArgumentException,
                              "Halo::sf: ghost point " + std::to_string(p) + " has " +
                                  std::to_string(layout_.dofs(p)) + " dofs but its owner (rank " +
                                  std::to_string(n.rank) + ") has " + std::to_string(owner_dofs));
                for (LocalIndex d = 0; d < owner_dofs; ++d) {
                    leaves.push_back(layout_.offset(p) + d);
                    remotes.push_back({n.rank, owner_offset + d});
                }
            }
        }
    }
#endif

    sf_ = StarForest(layout_.numDofs(), std::move(leaves), std::move(remotes));
    ELAC_LOG_DEBUG("Halo::sf: " + std::to_string(sf_->numLeaves()) + " ghost dofs");
    return *sf_;
}

const CommGraph& Halo::commGraph()
{
    if (graph_) return *graph_;
#if ELAC_HAS_MPI
    if (size_ > 1) {
        graph_ = buildCommGraph(sf(), comm_);
        return *graph_;
    }
#endif
    graph_ = CommGraph{};
    return *graph_;
}

const std::vector<GlobalIndex>& Halo::localToGlobalNumbering()
{
    if (l2g_) return *l2g_;

    GlobalIndex start = 0;
#if ELAC_HAS_MPI
    if (size_ > 1) {
        const GlobalIndex owned = layout_.numOwnedDofs();
        ELAC_CHECK_MPI(MPI_Exscan(&owned, &start, 1, MPI_INT64_T, MPI_SUM, comm_));
        if (rank_ == 0) start = 0;
    }
#endif

    std::vector<GlobalIndex> numbers(static_cast<std::size_t>(layout_.numDofs()), INVALID_GLOBAL_INDEX);
    GlobalIndex next = start;
    for (LocalIndex p = 0; p < layout_.numPoints(); ++p) {
        if (layout_.isGhost(p)) continue;
        for (LocalIndex d = 0; d < layout_.dofs(p); ++d) {
            numbers[static_cast<std::size_t>(layout_.offset(p) + d)] = next++;
        }
    }

    for (const auto& g : layout_.ghosts()) {
        if (g.owner != rank_) continue;
        ELAC_CHECK_ARG(g.owner_point < layout_.numPoints() && !layout_.isGhost(g.owner_point),
                       "Halo: local ghost point " + std::to_string(g.point) +
                           " must reference an owned point");
        ELAC_CHECK_ARG(layout_.dofs(g.owner_point) == layout_.dofs(g.point),
                       "Halo: local ghost point " + std::to_string(g.point) +
                           " and its owner point differ in dof count");
        for (LocalIndex d = 0; d < layout_.dofs(g.point); ++d) {
            numbers[static_cast<std::size_t>(layout_.offset(g.point) + d)] =
                numbers[static_cast<std::size_t>(layout_.offset(g.owner_point) + d)];
        }
    }

    if (size_ > 1) {
        const ArrayView view = ArrayView::of(numbers);
        begin(view, false);
        end(view, false);
    }

    l2g_ = std::move(numbers);
    return *l2g_;
}

// ============================================================================
// Exchanges
// ============================================================================

void Halo::globalToLocalBegin(const ArrayView& array, InsertMode mode)
{
    ELAC_THROW_IF(mode != InsertMode::Write, NotImplementedException,
                  std::string("global-to-local exchange with insert mode ") + insertModeName(mode) +
                      " (only WRITE is supported)");
    if (size_ == 1) return;
    begin(array, false);
}

void Halo::globalToLocalEnd(const ArrayView& array, InsertMode mode)
{
    ELAC_THROW_IF(mode != InsertMode::Write, NotImplementedException,
                  std::string("global-to-local exchange with insert mode ") + insertModeName(mode) +
                      " (only WRITE is supported)");
    if (size_ == 1) return;
    end(array, false);
}

void Halo::localToGlobalBegin(const ArrayView& array, InsertMode mode)
{
    ELAC_THROW_IF(mode != InsertMode::Inc, NotImplementedException,
                  std::string("local-to-global exchange with insert mode ") + insertModeName(mode) +
                      " (only INC is supported)");
    if (size_ == 1) return;
    begin(array, true);
}

void Halo::localToGlobalEnd(const ArrayView& array, InsertMode mode)
{
    ELAC_THROW_IF(mode != InsertMode::Inc, NotImplementedException,
                  std::string("local-to-global exchange with insert mode ") + insertModeName(mode) +
                      " (only INC is supported)");
    if (size_ == 1) return;
    end(array, true);
}

bool Halo::hasPendingExchange(const void* data) const
{
    return std::any_of(pending_.begin(), pending_.end(),
                       [data](const auto& p) { return p->data == data; });
}

void Halo::checkArray(const ArrayView& array, const char* where) const
{
    ELAC_CHECK_ARG(array.block_size > 0,
                   std::string(where) + ": block size must be positive");
    ELAC_CHECK_ARG(array.num_slots == layout_.numDofs(),
                   std::string(where) + ": array has " + std::to_string(array.num_slots) +
                       " slots, layout has " + std::to_string(layout_.numDofs()) + " dofs");
    ELAC_CHECK_ARG(array.data != nullptr || array.num_slots == 0,
                   std::string(where) + ": array data is null");
    if (scalar_type_size(array.dtype) == 0) {
        ELAC_NOT_IMPLEMENTED(std::string(where) + ": unknown base type");
    }
}

void Halo::begin(const ArrayView& array, bool reverse)
{
    checkArray(array, "Halo::begin");
    ELAC_THROW_IF(hasPendingExchange(array.data), PreconditionException,
                  "Halo::begin: an exchange for this array is already in progress");

#if ELAC_HAS_MPI
    const MPI_Datatype type = DatatypeCache::instance().get(array.dtype, array.block_size);
    const std::size_t slot_bytes = scalar_type_size(array.dtype) * static_cast<std::size_t>(array.block_size);
    const int tag = config::HALO_TAG_BASE + (reverse ? 1 : 0);
    auto* bytes = static_cast<std::byte*>(array.data);

    const CommGraph& graph = commGraph();
    auto pending = std::make_unique<Pending>();
    pending->data = array.data;
    pending->reverse = reverse;
    pending->send_bufs.resize(graph.neighbors.size());
    pending->recv_bufs.resize(graph.neighbors.size());

    for (std::size_t i = 0; i < graph.neighbors.size(); ++i) {
        const auto& n = graph.neighbors[i];
        const auto& out_slots = reverse ? n.recv_slots : n.send_slots;
        const auto& in_slots = reverse ? n.send_slots : n.recv_slots;

        if (!in_slots.empty()) {
            auto& buf = pending->recv_bufs[i];
            buf.resize(in_slots.size() * slot_bytes);
            pending->requests.emplace_back();
            ELAC_CHECK_MPI(MPI_Irecv(buf.data(), static_cast<int>(in_slots.size()), type,
                                     n.rank, tag, comm_, &pending->requests.back()));
        }
        if (!out_slots.empty()) {
            auto& buf = pending->send_bufs[i];
            buf.resize(out_slots.size() * slot_bytes);
            for (std::size_t k = 0; k < out_slots.size(); ++k) {
                std::memcpy(buf.data() + k * slot_bytes,
                            bytes + static_cast<std::size_t>(out_slots[k]) * slot_bytes, slot_bytes);
            }
            pending->requests.emplace_back();
            ELAC_CHECK_MPI(MPI_Isend(buf.data(), static_cast<int>(out_slots.size()), type,
                                     n.rank, tag, comm_, &pending->requests.back()));
        }
    }
    pending_.push_back(std::move(pending));
#else
    (void)reverse;
#endif
}

void Halo::end(const ArrayView& array, bool reverse)
{
    checkArray(array, "Halo::end");
    const auto it = std::find_if(pending_.begin(), pending_.end(),
                                 [&array](const auto& p) { return p->data == array.data; });
    ELAC_THROW_IF(it == pending_.end(), PreconditionException,
                  "Halo::end: no exchange in progress for this array");
    ELAC_THROW_IF((*it)->reverse != reverse, PreconditionException,
                  "Halo::end: exchange direction does not match the pending begin");

    (*it)->complete();
    std::unique_ptr<Pending> pending = std::move(*it);
    pending_.erase(it);

#if ELAC_HAS_MPI

    const std::size_t slot_bytes = scalar_type_size(array.dtype) * static_cast<std::size_t>(array.block_size);
    const std::size_t slot_scalars = static_cast<std::size_t>(array.block_size);
    auto* bytes = static_cast<std::byte*>(array.data);

    const CommGraph& graph = commGraph();
    for (std::size_t i = 0; i < graph.neighbors.size(); ++i) {
        const auto& n = graph.neighbors[i];
        const auto& in_slots = reverse ? n.send_slots : n.recv_slots;
        const auto& buf = pending->recv_bufs[i];
        for (std::size_t k = 0; k < in_slots.size(); ++k) {
            std::byte* dst = bytes + static_cast<std::size_t>(in_slots[k]) * slot_bytes;
            const std::byte* src = buf.data() + k * slot_bytes;
            if (reverse) {
                accumulateScalars(array.dtype, dst, src, slot_scalars);
            } else {
                std::memcpy(dst, src, slot_bytes);
            }
        }
    }
#endif
}

} // namespace halo
} // namespace elac
