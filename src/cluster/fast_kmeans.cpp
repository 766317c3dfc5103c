#include "fastkm/cluster/fast_kmeans.hpp"
#include "fastkm/cluster/centroids.hpp"
#include "fastkm/cluster/extract.hpp"
#include "fastkm/cluster/seeding.hpp"
#include "fastkm/core/platform_utils.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>

namespace fastkm::cluster {

FastKmeans::FastKmeans(Dataset data, Config config, kernels::DistanceFn distance,
                       std::unique_ptr<core::RandomSource> rng)
    : data_(std::move(data)),
      config_(config),
      distance_(distance ? std::move(distance) : kernels::default_distance()),
      rng_(std::move(rng)),
      default_rng_(rng_ == nullptr) {}

auto FastKmeans::validate() const -> std::expected<void, core::error> {
    using core::error;
    using core::error_code;

    if (config_.k == 0) {
        return std::unexpected(error{error_code::config_invalid, "k must be > 0", "fast_kmeans"});
    }
    if (config_.max_iter == 0) {
        return std::unexpected(error{error_code::config_invalid, "max_iter must be > 0", "fast_kmeans"});
    }
    if (config_.point_neighbors == 0) {
        return std::unexpected(error{error_code::config_invalid,
                                     "point_neighbors must be > 0", "fast_kmeans"});
    }
    if (!(config_.tolerance >= 0.0f) || std::isinf(config_.tolerance)) {
        return std::unexpected(error{error_code::config_invalid,
                                     "tolerance must be finite and >= 0", "fast_kmeans"});
    }
    if (data_.size() == 0 || data_.dim() == 0) {
        return std::unexpected(error{error_code::empty_dataset, "Dataset has no points", "fast_kmeans"});
    }
    if (data_.count_distinct(config_.k) < config_.k) {
        return std::unexpected(error{
            error_code::insufficient_distinct_points,
            "k=" + std::to_string(config_.k) + " exceeds the number of distinct points",
            "fast_kmeans"
        });
    }
    return {};
}

auto FastKmeans::run() -> std::expected<FastKmeansResult, core::error> {
    if (auto ok = validate(); !ok) {
        return std::unexpected(ok.error());
    }

    if (default_rng_) {
        rng_ = std::make_unique<core::Mt19937Source>(config_.seed);
    }

    auto centroids = seed_centroids(data_, config_.k, *rng_);
    if (!centroids) {
        return std::unexpected(centroids.error());
    }
    return iterate(std::move(*centroids));
}

auto FastKmeans::run_with_centroids(std::vector<std::vector<float>> initial)
    -> std::expected<FastKmeansResult, core::error> {
    using core::error;
    using core::error_code;

    if (auto ok = validate(); !ok) {
        return std::unexpected(ok.error());
    }
    if (initial.size() != config_.k) {
        return std::unexpected(error{
            error_code::config_invalid,
            "Expected " + std::to_string(config_.k) + " initial centroids, got " +
                std::to_string(initial.size()),
            "fast_kmeans"
        });
    }
    for (std::size_t c = 0; c < initial.size(); ++c) {
        if (initial[c].size() != data_.dim()) {
            return std::unexpected(error{
                error_code::inconsistent_dimension,
                "Initial centroid " + std::to_string(c) + " has dimension " +
                    std::to_string(initial[c].size()) + ", expected " + std::to_string(data_.dim()),
                "fast_kmeans"
            });
        }
        for (float v : initial[c]) {
            if (!std::isfinite(v)) {
                return std::unexpected(error{
                    error_code::precondition_failed,
                    "Initial centroid " + std::to_string(c) + " has a non-finite coordinate",
                    "fast_kmeans"
                });
            }
        }
    }

    if (default_rng_) {
        rng_ = std::make_unique<core::Mt19937Source>(config_.seed);
    }
    return iterate(std::move(initial));
}

auto FastKmeans::iterate(std::vector<std::vector<float>> centroids)
    -> std::expected<FastKmeansResult, core::error> {
    const auto start_time = std::chrono::steady_clock::now();

    debug_ = config_.verbose || core::env_flag("FASTKM_DEBUG");
    const std::uint32_t max_iter = core::env_positive_u32("FASTKM_MAX_ITER").value_or(config_.max_iter);
    const std::uint32_t k = config_.k;
    const std::size_t n = data_.size();

    stats_ = Stats{};
    counted_distance_ = [this](std::span<const float> a, std::span<const float> b) {
        ++stats_.distance_computations;
        return distance_(a, b);
    };

    if (debug_) {
        std::cerr << "[FASTKM][fast_kmeans] start n=" << n << " dim=" << data_.dim()
                  << " k=" << k << " max_iter=" << max_iter << "\n";
    }

    tracker_ = BoundTracker(config_.point_neighbors);
    tracker_.initialize(data_, centroids, counted_distance_);

    std::uint32_t iter = 0;
    bool converged = false;
    while (iter < max_iter) {
        ++iter;

        // No recorded neighbor data describes the recomputed centroids yet
        if (iter == 1) {
            graph_.reset_complete(k);
        } else {
            graph_.build(tracker_, k);
        }

        auto moved = recompute_centroids(centroids);
        if (!moved) {
            return std::unexpected(moved.error());
        }
        bool change = *moved;

        // A reseeded centroid is in nobody's record yet
        if (!reseeded_.empty() && absorb_reseeded(centroids)) {
            change = true;
        }

        if (reassign_pruned(centroids)) {
            change = true;
        }

        if (!change && config_.verify_convergence) {
            change = verify_assignment(centroids);
        }

        if (!change) {
            converged = true;
            break;
        }
    }

    if (!converged && debug_) {
        std::cerr << "[FASTKM][fast_kmeans] iteration cap " << max_iter
                  << " reached before convergence\n";
    }

    FastKmeansResult result;
    result.assignments = tracker_.assignments();
    result.clusters = extract_clusters(result.assignments);
    result.cluster_sizes = cluster_sizes(result.assignments, k);
    result.inertia = compute_inertia(data_, result.assignments, centroids);
    result.centroids = std::move(centroids);
    result.iterations = iter;
    result.converged = converged;

    const auto end_time = std::chrono::steady_clock::now();
    result.time_sec = std::chrono::duration<float>(end_time - start_time).count();

    stats_.iterations = iter;
    stats_.converged = converged;
    stats_.final_inertia = result.inertia;
    stats_.time_sec = result.time_sec;

    if (debug_) {
        std::cerr << "[FASTKM][fast_kmeans] iterations=" << stats_.iterations
                  << " converged=" << (stats_.converged ? "yes" : "no")
                  << " inertia=" << stats_.final_inertia << "\n";
        std::cerr << "[FASTKM][fast_kmeans] distance_computations=" << stats_.distance_computations
                  << " points_skipped=" << stats_.points_skipped
                  << " pruned_reassignments=" << stats_.pruned_reassignments
                  << " verified_reassignments=" << stats_.verified_reassignments
                  << " reseed_reassignments=" << stats_.reseed_reassignments
                  << " reseeded_clusters=" << stats_.reseeded_clusters << "\n";
        std::cerr << "[FASTKM][fast_kmeans] time_sec=" << stats_.time_sec << "\n";
    }

    return result;
}

auto FastKmeans::recompute_centroids(std::vector<std::vector<float>>& centroids)
    -> std::expected<bool, core::error> {
    auto update = update_centroids(data_, tracker_.assignments(), centroids, config_.tolerance);
    bool moved = update.moved;
    reseeded_.clear();

    for (std::uint32_t c : update.empty) {
        auto idx = draw_distinct_point(data_, centroids, *rng_, c);
        if (!idx) {
            // validate() guarantees k distinct points, so a draw can only fail on a broken invariant
            return std::unexpected(core::error{
                core::error_code::internal,
                "Reseeding cluster " + std::to_string(c) + " failed: " + idx.error().message,
                "fast_kmeans"
            });
        }
        const auto point = data_.row(*idx);
        centroids[c].assign(point.begin(), point.end());
        reseeded_.push_back(c);
        ++stats_.reseeded_clusters;
        moved = true;

        if (debug_) {
            std::cerr << "[FASTKM][fast_kmeans] cluster " << c
                      << " empty, reseeded from point " << *idx << "\n";
        }
    }

    return moved;
}

auto FastKmeans::absorb_reseeded(const std::vector<std::vector<float>>& centroids) -> bool {
    bool change = false;

    for (std::size_t i = 0; i < data_.size(); ++i) {
        const auto point = data_.row(i);
        const std::uint32_t a = tracker_.assignment(i);
        const float d_assigned = counted_distance_(point, centroids[a]);

        bool closer = false;
        for (std::uint32_t c : reseeded_) {
            if (c == a) continue;
            if (counted_distance_(point, centroids[c]) < d_assigned) {
                closer = true;
                break;
            }
        }
        if (!closer) continue;

        // Strictly closer than the current centroid, so nearest != a
        const std::uint32_t nearest = tracker_.refresh(i, point, centroids, counted_distance_);
        tracker_.assign(i, nearest);
        tracker_.add_neighbor(i, a);
        ++stats_.reseed_reassignments;
        change = true;
    }

    return change;
}

auto FastKmeans::reassign_pruned(const std::vector<std::vector<float>>& centroids) -> bool {
    bool change = false;

    for (std::size_t i = 0; i < data_.size(); ++i) {
        const auto point = data_.row(i);
        auto& b = tracker_.bounds(i);
        const std::uint32_t a = tracker_.assignment(i);

        const float d_new = counted_distance_(point, centroids[a]);
        if (!(d_new < b.upper)) {
            ++stats_.points_skipped;
            continue;
        }
        b.upper = d_new;

        if (!b.has_lower) continue;

        // First neighbor under both bounds wins, not the nearest one
        for (std::uint32_t m : graph_.neighbors(a)) {
            if (m == a) continue;
            const float d = counted_distance_(point, centroids[m]);
            if (d < b.lower && d < d_new) {
                b.lower = d;
                b.upper = d;
                tracker_.assign(i, m);
                tracker_.add_neighbor(i, a);
                ++stats_.pruned_reassignments;
                change = true;
                break;
            }
        }
    }

    return change;
}

auto FastKmeans::verify_assignment(const std::vector<std::vector<float>>& centroids) -> bool {
    bool change = false;

    for (std::size_t i = 0; i < data_.size(); ++i) {
        const auto point = data_.row(i);
        const std::uint32_t a = tracker_.assignment(i);
        const std::uint32_t nearest = tracker_.refresh(i, point, centroids, counted_distance_);
        if (nearest == a) continue;

        if (tracker_.bounds(i).upper < tracker_.scanned_distance(a)) {
            tracker_.assign(i, nearest);
            tracker_.add_neighbor(i, a);
            ++stats_.verified_reassignments;
            change = true;
        } else {
            // Tie with a lower-index centroid: stay, but keep the tied cluster as a candidate
            tracker_.add_neighbor(i, nearest);
        }
    }

    if (change && debug_) {
        std::cerr << "[FASTKM][fast_kmeans] verification moved points; total verified_reassignments="
                  << stats_.verified_reassignments << "\n";
    }

    return change;
}

} // namespace fastkm::cluster
