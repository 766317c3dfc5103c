#pragma once

/** \file extract.hpp
 *  \brief Conversion of an assignment vector into the output partition.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace fastkm::cluster {

/** \brief Group point indices by cluster id.
 *
 * Clusters appear in order of the first point that references them; each
 * lists its point indices in ascending order. Unused ids are omitted, so the
 * result may hold fewer than k clusters.
 */
auto extract_clusters(std::span<const std::uint32_t> assignments)
    -> std::vector<std::vector<std::size_t>>;

/** \brief Points per cluster id, indexed 0..k-1. Ids >= k are ignored. */
auto cluster_sizes(std::span<const std::uint32_t> assignments, std::uint32_t k)
    -> std::vector<std::uint32_t>;

} // namespace fastkm::cluster
