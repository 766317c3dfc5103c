#include "fastkm/cluster/seeding.hpp"

#include <algorithm>
#include <string>

namespace fastkm::cluster {

namespace {

auto matches_any(std::span<const float> point,
                 const std::vector<std::vector<float>>& centroids,
                 std::optional<std::size_t> skip) -> bool {
    for (std::size_t c = 0; c < centroids.size(); ++c) {
        if (skip && *skip == c) continue;
        if (std::equal(point.begin(), point.end(), centroids[c].begin(), centroids[c].end())) {
            return true;
        }
    }
    return false;
}

auto rejection_limit(std::size_t n) -> std::size_t {
    return std::max<std::size_t>(64, 4 * n);
}

} // anonymous namespace

auto draw_distinct_point(const Dataset& data,
                         const std::vector<std::vector<float>>& centroids,
                         core::RandomSource& rng,
                         std::optional<std::size_t> skip)
    -> std::expected<std::size_t, core::error> {
    const std::size_t n = data.size();

    for (std::size_t attempt = 0, limit = rejection_limit(n); attempt < limit; ++attempt) {
        const std::size_t idx = rng.uniform_index(n);
        if (idx < n && !matches_any(data.row(idx), centroids, skip)) {
            return idx;
        }
    }

    // Rejection stalled: enumerate what is still eligible and pick uniformly
    std::vector<std::size_t> eligible;
    for (std::size_t i = 0; i < n; ++i) {
        if (!matches_any(data.row(i), centroids, skip)) {
            eligible.push_back(i);
        }
    }
    if (eligible.empty()) {
        return std::unexpected(core::error{
            core::error_code::insufficient_distinct_points,
            "Every point already coincides with a centroid",
            "seeding"
        });
    }
    const std::size_t pick = rng.uniform_index(eligible.size());
    return eligible[std::min(pick, eligible.size() - 1)];
}

auto seed_centroids(const Dataset& data, std::uint32_t k, core::RandomSource& rng)
    -> std::expected<std::vector<std::vector<float>>, core::error> {
    using core::error;
    using core::error_code;

    if (k == 0) {
        return std::unexpected(error{error_code::config_invalid, "k must be > 0", "seeding"});
    }
    if (data.count_distinct(k) < k) {
        return std::unexpected(error{
            error_code::insufficient_distinct_points,
            "Fewer than " + std::to_string(k) + " distinct points",
            "seeding"
        });
    }

    std::vector<std::vector<float>> centroids;
    centroids.reserve(k);
    for (std::uint32_t c = 0; c < k; ++c) {
        auto idx = draw_distinct_point(data, centroids, rng);
        if (!idx) {
            return std::unexpected(idx.error());
        }
        const auto point = data.row(*idx);
        centroids.emplace_back(point.begin(), point.end());
    }
    return centroids;
}

} // namespace fastkm::cluster
