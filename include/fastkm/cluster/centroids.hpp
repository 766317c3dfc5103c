#pragma once

/** \file centroids.hpp
 *  \brief Exhaustive nearest-centroid search and centroid recomputation.
 *
 * These are the brute-force building blocks shared by the bound tracker, the
 * convergence verification pass and the tests.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "fastkm/dataset.hpp"
#include "fastkm/kernels/distance.hpp"

namespace fastkm::cluster {

/** \brief Nearest centroid by full scan; ties go to the lowest index.
 *
 * \return {index, distance}; {0, +inf} if centroids is empty
 * Complexity: O(k * dim)
 */
auto nearest_centroid(std::span<const float> point,
                      const std::vector<std::vector<float>>& centroids,
                      const kernels::DistanceFn& distance)
    -> std::pair<std::uint32_t, float>;

/** \brief Assign every point to its nearest centroid by full scan. */
auto assign_exhaustive(const Dataset& data,
                       const std::vector<std::vector<float>>& centroids,
                       const kernels::DistanceFn& distance)
    -> std::vector<std::uint32_t>;

/** \brief Outcome of a centroid recompute pass. */
struct CentroidUpdate {
    bool moved{false};                       /**< Any centroid changed beyond tolerance */
    std::vector<std::uint32_t> empty;        /**< Clusters with no points, left untouched */
};

/** \brief Recompute centroids as the coordinate-wise mean of their points.
 *
 * Sums are accumulated in double with Kahan compensation. A centroid counts as
 * moved when any coordinate differs from its previous value by more than
 * tolerance (0 means exact equality).
 *
 * Preconditions: assignments.size() == data.size(); every id < centroids.size()
 * Complexity: O(n * dim)
 */
auto update_centroids(const Dataset& data,
                      std::span<const std::uint32_t> assignments,
                      std::vector<std::vector<float>>& centroids,
                      float tolerance = 0.0f) -> CentroidUpdate;

/** \brief Sum of squared L2 distances from each point to its assigned centroid. */
auto compute_inertia(const Dataset& data,
                     std::span<const std::uint32_t> assignments,
                     const std::vector<std::vector<float>>& centroids) -> float;

} // namespace fastkm::cluster
