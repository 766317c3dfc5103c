#include "fastkm/cluster/extract.hpp"

#include <unordered_map>

namespace fastkm::cluster {

auto extract_clusters(std::span<const std::uint32_t> assignments)
    -> std::vector<std::vector<std::size_t>> {
    std::vector<std::vector<std::size_t>> clusters;
    std::unordered_map<std::uint32_t, std::size_t> slot;

    for (std::size_t i = 0; i < assignments.size(); ++i) {
        const auto [it, inserted] = slot.try_emplace(assignments[i], clusters.size());
        if (inserted) {
            clusters.emplace_back();
        }
        clusters[it->second].push_back(i);
    }

    return clusters;
}

auto cluster_sizes(std::span<const std::uint32_t> assignments, std::uint32_t k)
    -> std::vector<std::uint32_t> {
    std::vector<std::uint32_t> sizes(k, 0);
    for (std::uint32_t a : assignments) {
        if (a < k) sizes[a]++;
    }
    return sizes;
}

} // namespace fastkm::cluster
