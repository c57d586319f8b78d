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

#ifndef ELAC_HALO_DATALAYOUT_H
#define ELAC_HALO_DATALAYOUT_H

/**
 * @file DataLayout.h
 * @brief Per-point dof layout of a distributed array and its ghost points
 */

#include "Core/Types.h"

#include <vector>

namespace elac {
namespace halo {

/**
 * @brief Local point whose values are owned by `owner`
 */
struct GhostPoint {
    LocalIndex point{INVALID_LOCAL_INDEX};
    Rank owner{-1};
    LocalIndex owner_point{INVALID_LOCAL_INDEX};
};

/**
 * @brief Local section (dofs per point) plus ghost ownership
 *
 * Dof offsets are the prefix sums of the per-point dof counts. Points not
 * listed as ghosts are owned by the local rank.
 */
class DataLayout {
public:
    DataLayout() = default;
    DataLayout(std::vector<LocalIndex> dofs_per_point, std::vector<GhostPoint> ghosts = {});

    /// Layout with `num_points` points of `dofs` dofs each
    static DataLayout uniform(LocalIndex num_points, LocalIndex dofs, std::vector<GhostPoint> ghosts = {});

    [[nodiscard]] LocalIndex numPoints() const noexcept { return static_cast<LocalIndex>(dofs_.size()); }
    [[nodiscard]] LocalIndex numDofs() const noexcept { return offsets_.empty() ? 0 : offsets_.back(); }
    [[nodiscard]] LocalIndex numOwnedDofs() const noexcept { return num_owned_dofs_; }

    [[nodiscard]] LocalIndex dofs(LocalIndex point) const;
    [[nodiscard]] LocalIndex offset(LocalIndex point) const;

    [[nodiscard]] const std::vector<GhostPoint>& ghosts() const noexcept { return ghosts_; }
    [[nodiscard]] bool isGhost(LocalIndex point) const;

    /// Ranks other than `my_rank` that own ghost points, ascending
    [[nodiscard]] std::vector<Rank> remoteOwners(Rank my_rank) const;

private:
    std::vector<LocalIndex> dofs_{};
    std::vector<LocalIndex> offsets_{};
    std::vector<GhostPoint> ghosts_{};
    std::vector<char> is_ghost_{};
    LocalIndex num_owned_dofs_{0};
};

} // namespace halo
} // namespace elac

#endif // ELAC_HALO_DATALAYOUT_H
