#include "fastkm/cluster/bound_tracker.hpp"

#include <algorithm>
#include <limits>

namespace fastkm::cluster {

auto BoundTracker::initialize(const Dataset& data,
                              const std::vector<std::vector<float>>& centroids,
                              const kernels::DistanceFn& distance) -> void {
    const std::size_t n = data.size();
    bounds_.assign(n, PointBounds{});
    assignments_.assign(n, 0);

    for (std::size_t i = 0; i < n; ++i) {
        assignments_[i] = refresh(i, data.row(i), centroids, distance);
    }
}

auto BoundTracker::refresh(std::size_t i, std::span<const float> point,
                           const std::vector<std::vector<float>>& centroids,
                           const kernels::DistanceFn& distance) -> std::uint32_t {
    const auto k = static_cast<std::uint32_t>(centroids.size());
    auto& b = bounds_[i];

    scratch_.clear();
    scanned_.resize(k);
    float best_dist = std::numeric_limits<float>::infinity();
    std::uint32_t best_c = 0;
    for (std::uint32_t c = 0; c < k; ++c) {
        const float dist = distance(point, centroids[c]);
        scratch_.emplace_back(dist, c);
        scanned_[c] = dist;
        if (dist < best_dist) {
            best_dist = dist;
            best_c = c;
        }
    }

    // Runner-up excluding the nearest; ties resolve to the first encountered
    float second_dist = std::numeric_limits<float>::infinity();
    bool has_second = false;
    for (const auto& [dist, c] : scratch_) {
        if (c == best_c) continue;
        if (!has_second || dist < second_dist) {
            second_dist = dist;
            has_second = true;
        }
    }

    b.upper = best_dist;
    b.has_lower = has_second;
    b.lower = has_second ? second_dist : std::numeric_limits<float>::infinity();

    // Keep the nearest alternatives, nearest first
    if (!scratch_.empty()) {
        scratch_.erase(scratch_.begin() + best_c);
    }
    const std::size_t keep = std::min(point_neighbors_, scratch_.size());
    std::partial_sort(scratch_.begin(), scratch_.begin() + static_cast<std::ptrdiff_t>(keep),
                      scratch_.end());
    b.neighbors.clear();
    for (std::size_t j = 0; j < keep; ++j) {
        b.neighbors.push_back(scratch_[j].second);
    }

    return best_c;
}

auto BoundTracker::add_neighbor(std::size_t i, std::uint32_t c) -> void {
    auto& record = bounds_[i].neighbors;
    if (std::find(record.begin(), record.end(), c) == record.end()) {
        record.push_back(c);
    }
}

} // namespace fastkm::cluster
