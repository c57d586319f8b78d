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

#include "Halo/DataLayout.h"

#include "Core/ElacException.h"

#include <algorithm>

namespace elac {
namespace halo {

DataLayout::DataLayout(std::vector<LocalIndex> dofs_per_point, std::vector<GhostPoint> ghosts)
    : dofs_(std::move(dofs_per_point)),
      ghosts_(std::move(ghosts))
{
    offsets_.resize(dofs_.size() + 1u, 0);
    for (std::size_t p = 0; p < dofs_.size(); ++p) {
        ELAC_CHECK_ARG(dofs_[p] >= 0,
                       "DataLayout: negative dof count at point " + std::to_string(p));
        offsets_[p + 1] = offsets_[p] + dofs_[p];
    }

    is_ghost_.assign(dofs_.size(), 0);
    for (const auto& g : ghosts_) {
        ELAC_CHECK_ARG(g.point >= 0 && g.point < numPoints(),
                       "DataLayout: ghost point " + std::to_string(g.point) + " out of range");
        ELAC_CHECK_ARG(g.owner >= 0,
                       "DataLayout: ghost point " + std::to_string(g.point) + " has no owner");
        ELAC_CHECK_ARG(g.owner_point >= 0,
                       "DataLayout: ghost point " + std::to_string(g.point) + " has an invalid owner point");
        ELAC_CHECK_ARG(!is_ghost_[static_cast<std::size_t>(g.point)],
                       "DataLayout: point " + std::to_string(g.point) + " listed as ghost twice");
        is_ghost_[static_cast<std::size_t>(g.point)] = 1;
    }

    num_owned_dofs_ = 0;
    for (std::size_t p = 0; p < dofs_.size(); ++p) {
        if (!is_ghost_[p]) num_owned_dofs_ += dofs_[p];
    }
}

DataLayout DataLayout::uniform(LocalIndex num_points, LocalIndex dofs, std::vector<GhostPoint> ghosts)
{
    ELAC_CHECK_ARG(num_points >= 0, "DataLayout::uniform: negative point count");
    return DataLayout(std::vector<LocalIndex>(static_cast<std::size_t>(num_points), dofs), std::move(ghosts));
}

LocalIndex DataLayout::dofs(LocalIndex point) const
{
    ELAC_CHECK_ARG(point >= 0 && point < numPoints(),
                   "DataLayout::dofs: point " + std::to_string(point) + " out of range");
    return dofs_[static_cast<std::size_t>(point)];
}

LocalIndex DataLayout::offset(LocalIndex point) const
{
    ELAC_CHECK_ARG(point >= 0 && point < numPoints(),
                   "DataLayout::offset: point " + std::to_string(point) + " out of range");
    return offsets_[static_cast<std::size_t>(point)];
}

bool DataLayout::isGhost(LocalIndex point) const
{
    ELAC_CHECK_ARG(point >= 0 && point < numPoints(),
                   "DataLayout::isGhost: point " + std::to_string(point) + " out of range");
    return is_ghost_[static_cast<std::size_t>(point)] != 0;
}

std::vector<Rank> DataLayout::remoteOwners(Rank my_rank) const
{
    std::vector<Rank> owners;
    for (const auto& g : ghosts_) {
        if (g.owner != my_rank) owners.push_back(g.owner);
    }
    std::sort(owners.begin(), owners.end());
    owners.erase(std::unique(owners.begin(), owners.end()), owners.end());
    return owners;
}

} // namespace halo
} // namespace elac
