#include "fastkm/cluster/centroids.hpp"

#include <cmath>
#include <limits>

namespace fastkm::cluster {

auto nearest_centroid(std::span<const float> point,
                      const std::vector<std::vector<float>>& centroids,
                      const kernels::DistanceFn& distance)
    -> std::pair<std::uint32_t, float> {
    std::uint32_t best_idx = 0;
    float best_dist = std::numeric_limits<float>::infinity();

    for (std::uint32_t c = 0; c < centroids.size(); ++c) {
        const float dist = distance(point, centroids[c]);
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = c;
        }
    }

    return {best_idx, best_dist};
}

auto assign_exhaustive(const Dataset& data,
                       const std::vector<std::vector<float>>& centroids,
                       const kernels::DistanceFn& distance)
    -> std::vector<std::uint32_t> {
    std::vector<std::uint32_t> assignments(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        assignments[i] = nearest_centroid(data.row(i), centroids, distance).first;
    }
    return assignments;
}

auto update_centroids(const Dataset& data,
                      std::span<const std::uint32_t> assignments,
                      std::vector<std::vector<float>>& centroids,
                      float tolerance) -> CentroidUpdate {
    const std::size_t k = centroids.size();
    const std::size_t dim = data.dim();

    std::vector<std::vector<double>> sums(k, std::vector<double>(dim, 0.0));
    std::vector<std::vector<double>> comp(k, std::vector<double>(dim, 0.0));
    std::vector<std::uint32_t> counts(k, 0);

    for (std::size_t i = 0; i < data.size(); ++i) {
        const std::uint32_t c = assignments[i];
        counts[c]++;

        const auto point = data.row(i);
        auto& sum = sums[c];
        auto& cc = comp[c];
        for (std::size_t d = 0; d < dim; ++d) {
            const double y = point[d] - cc[d];
            const double t = sum[d] + y;
            cc[d] = (t - sum[d]) - y;
            sum[d] = t;
        }
    }

    CentroidUpdate update;
    for (std::uint32_t c = 0; c < k; ++c) {
        if (counts[c] == 0) {
            update.empty.push_back(c);
            continue;
        }

        const double scale = 1.0 / static_cast<double>(counts[c]);
        auto& centroid = centroids[c];
        for (std::size_t d = 0; d < dim; ++d) {
            const float mean = static_cast<float>(sums[c][d] * scale);
            if (std::abs(mean - centroid[d]) > tolerance) {
                update.moved = true;
            }
            centroid[d] = mean;
        }
    }

    return update;
}

auto compute_inertia(const Dataset& data,
                     std::span<const std::uint32_t> assignments,
                     const std::vector<std::vector<float>>& centroids) -> float {
    double inertia = 0.0;
    for (std::size_t i = 0; i < data.size(); ++i) {
        inertia += kernels::l2_sq(data.row(i), centroids[assignments[i]]);
    }
    return static_cast<float>(inertia);
}

} // namespace fastkm::cluster
