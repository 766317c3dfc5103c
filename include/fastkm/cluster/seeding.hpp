#pragma once

/** \file seeding.hpp
 *  \brief Random distinct-point centroid selection.
 *
 * Centroids are copies of dataset points, pairwise distinct by value. Sampling
 * is rejection based: draw a random index, reject it if its point already
 * equals a chosen centroid. Rejection is capped and falls back to a uniform
 * draw over the eligible indices, so the functions always terminate.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

#include "fastkm/core/random_source.hpp"
#include "fastkm/dataset.hpp"
#include "fastkm/error.hpp"

namespace fastkm::cluster {

/** \brief Draw the index of a point not equal to any of the given centroids.
 *
 * \param data Dataset to sample from
 * \param centroids Centroids the drawn point must differ from
 * \param rng Random source
 * \param skip Centroid slot to ignore in the comparison (the slot being replaced)
 * \return Point index, or insufficient_distinct_points if every point matches a centroid
 */
auto draw_distinct_point(const Dataset& data,
                         const std::vector<std::vector<float>>& centroids,
                         core::RandomSource& rng,
                         std::optional<std::size_t> skip = std::nullopt)
    -> std::expected<std::size_t, core::error>;

/** \brief Select k pairwise-distinct seed centroids from the dataset.
 *
 * Preconditions: k > 0. Fewer than k distinct points is reported as
 * insufficient_distinct_points instead of sampling forever.
 * Complexity: O(k * dim) expected per accepted draw.
 */
auto seed_centroids(const Dataset& data, std::uint32_t k, core::RandomSource& rng)
    -> std::expected<std::vector<std::vector<float>>, core::error>;

} // namespace fastkm::cluster
