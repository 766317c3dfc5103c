#pragma once

/** \file bound_tracker.hpp
 *  \brief Per-point distance bounds and neighbor records for pruned k-means.
 *
 * For every point the tracker owns:
 * - upper: distance to the assigned centroid when the point was last examined
 * - lower: threshold an alternative centroid must beat to take the point
 * - neighbors: nearest alternative clusters seen in the last full scan,
 *   nearest first, plus clusters added since (e.g. one the point has left)
 *
 * With a single centroid there is no alternative and has_lower stays false.
 *
 * Thread-safety: not thread-safe; owned by one engine run.
 * Memory: O(n * point_neighbors).
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "fastkm/dataset.hpp"
#include "fastkm/kernels/distance.hpp"

namespace fastkm::cluster {

class BoundTracker {
public:
    /** \brief Bounds and neighbor record of one point. */
    struct PointBounds {
        float upper{0.0f};                     /**< Distance to assigned centroid */
        float lower{0.0f};                     /**< Reassignment threshold */
        bool has_lower{false};                 /**< False when k == 1 */
        std::vector<std::uint32_t> neighbors;  /**< Recorded neighbor clusters */
    };

    /** \param point_neighbors Alternatives kept per point in a full scan (> 0) */
    explicit BoundTracker(std::size_t point_neighbors) : point_neighbors_(point_neighbors) {}

    /** \brief Full scan of every point: assignment, both bounds and neighbor record.
     *
     * Complexity: O(n * k * dim)
     */
    auto initialize(const Dataset& data,
                    const std::vector<std::vector<float>>& centroids,
                    const kernels::DistanceFn& distance) -> void;

    /** \brief Full scan of one point against the current centroids.
     *
     * Resets upper to the nearest distance, lower to the runner-up distance and
     * rewrites the neighbor record. Returns the nearest cluster id; the caller
     * decides whether to move the point there. The per-cluster distances of the
     * scan stay readable through scanned_distance() until the next refresh.
     */
    auto refresh(std::size_t i, std::span<const float> point,
                 const std::vector<std::vector<float>>& centroids,
                 const kernels::DistanceFn& distance) -> std::uint32_t;

    /** \brief Append c to point i's neighbor record unless already present.
     *
     * Used when a point leaves a cluster, so the cluster it left stays a
     * candidate for it.
     */
    auto add_neighbor(std::size_t i, std::uint32_t c) -> void;

    /** \brief Distance to centroid c measured by the most recent refresh(). */
    auto scanned_distance(std::uint32_t c) const noexcept -> float { return scanned_[c]; }

    auto bounds(std::size_t i) noexcept -> PointBounds& { return bounds_[i]; }
    auto bounds(std::size_t i) const noexcept -> const PointBounds& { return bounds_[i]; }

    auto assignments() const noexcept -> const std::vector<std::uint32_t>& { return assignments_; }
    auto assignment(std::size_t i) const noexcept -> std::uint32_t { return assignments_[i]; }
    auto assign(std::size_t i, std::uint32_t c) noexcept -> void { assignments_[i] = c; }

    auto size() const noexcept -> std::size_t { return bounds_.size(); }

private:
    std::size_t point_neighbors_;
    std::vector<PointBounds> bounds_;
    std::vector<std::uint32_t> assignments_;
    std::vector<std::pair<float, std::uint32_t>> scratch_;
    std::vector<float> scanned_;
};

} // namespace fastkm::cluster
