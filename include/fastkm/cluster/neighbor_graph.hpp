#pragma once

/** \file neighbor_graph.hpp
 *  \brief Per-cluster sets of clusters worth re-examining during reassignment.
 *
 * NeighborClusters[c] is the union of the neighbor records of the points
 * currently assigned to c, with c removed. Iteration order is first insertion,
 * scanning points in index order and each record in its stored order.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "fastkm/cluster/bound_tracker.hpp"

namespace fastkm::cluster {

class NeighborGraph {
public:
    /** \brief Every cluster neighbors every other, ascending id order.
     *
     * Used on the first iteration, before any point has a record that
     * reflects recomputed centroids.
     */
    auto reset_complete(std::uint32_t k) -> void;

    /** \brief Rebuild from the current assignment and per-point records.
     *
     * Complexity: O(n * record length + k)
     */
    auto build(const BoundTracker& tracker, std::uint32_t k) -> void;

    auto neighbors(std::uint32_t c) const noexcept -> std::span<const std::uint32_t> {
        return adjacency_[c];
    }

    auto cluster_count() const noexcept -> std::size_t { return adjacency_.size(); }

    /** \brief Sum of neighbor set sizes; k * (k - 1) when complete. */
    auto edge_count() const noexcept -> std::size_t;

private:
    std::vector<std::vector<std::uint32_t>> adjacency_;
    std::vector<std::uint32_t> stamp_;
};

} // namespace fastkm::cluster
