#pragma once

/** \file fast_kmeans.hpp
 *  \brief Neighbor-graph accelerated k-means.
 *
 * Instead of scanning all k centroids for every point on every iteration, the
 * engine keeps per-point bounds and a per-cluster neighbor graph:
 * - a point is re-examined only if its own centroid moved strictly closer
 * - a re-examined point is checked only against its cluster's neighbors, and
 *   the first neighbor closer than both the point's lower bound and its own
 *   centroid takes it
 * - a centroid reseeded into an empty cluster is offered to every point once,
 *   since no neighbor record mentions it yet
 * - when a pass changes nothing, an exhaustive verification scan confirms
 *   every point sits at its nearest centroid before declaring convergence
 *
 * Thread-safety: single-threaded. An instance owns its dataset, metric, random
 * source and run state; do not call run() concurrently on one instance.
 * Determinism: fixed seed (or fixed injected source) gives identical output.
 * Memory: O(n * point_neighbors + k * dim).
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>

#include "fastkm/cluster/bound_tracker.hpp"
#include "fastkm/cluster/neighbor_graph.hpp"
#include "fastkm/core/random_source.hpp"
#include "fastkm/dataset.hpp"
#include "fastkm/error.hpp"
#include "fastkm/kernels/distance.hpp"

namespace fastkm::cluster {

/** \brief Clustering output. */
struct FastKmeansResult {
    std::vector<std::vector<std::size_t>> clusters;  /**< Point indices per occupied cluster, first-seen order */
    std::vector<std::vector<float>> centroids;       /**< Final centroids [k x dim] */
    std::vector<std::uint32_t> assignments;          /**< Cluster id per point [n] */
    std::vector<std::uint32_t> cluster_sizes;        /**< Points per cluster id [k] */
    float inertia{0.0f};                             /**< Sum of squared L2 distances */
    std::uint32_t iterations{0};                     /**< Iterations performed */
    bool converged{false};                           /**< False if max_iter was hit */
    float time_sec{0.0f};                            /**< Wall time */
};

class FastKmeans {
public:
    /** \brief Configuration. FASTKM_DEBUG and FASTKM_MAX_ITER override at run time. */
    struct Config {
        std::uint32_t k{8};                  /**< Number of clusters */
        std::uint32_t max_iter{300};         /**< Iteration cap */
        float tolerance{0.0f};               /**< Per-coordinate centroid movement threshold */
        std::uint32_t seed{42};              /**< Seed for the default random source */
        std::uint32_t point_neighbors{8};    /**< Alternatives recorded per point */
        bool verify_convergence{true};       /**< Exhaustive check before converging */
        bool verbose{false};                 /**< Progress output */
    };

    /** \brief Counters from the last run. */
    struct Stats {
        std::uint64_t distance_computations{0};   /**< Metric evaluations */
        std::uint64_t points_skipped{0};          /**< Point checks gated off by the upper bound */
        std::uint64_t pruned_reassignments{0};    /**< Moves made by the neighbor scan */
        std::uint64_t verified_reassignments{0};  /**< Moves made by verification */
        std::uint64_t reseed_reassignments{0};    /**< Moves into reseeded clusters */
        std::uint32_t reseeded_clusters{0};       /**< Empty clusters reseeded */
        std::uint32_t iterations{0};
        bool converged{false};
        float final_inertia{0.0f};
        float time_sec{0.0f};
    };

    /** \brief Construct an engine over a validated dataset.
     *
     * \param data Points to cluster
     * \param config Algorithm configuration
     * \param distance Metric; Euclidean when empty
     * \param rng Random source; a std::mt19937 seeded with config.seed when null,
     *            re-seeded at the start of every run
     */
    FastKmeans(Dataset data, Config config, kernels::DistanceFn distance = {},
               std::unique_ptr<core::RandomSource> rng = nullptr);

    /** \brief Seed k distinct centroids from the data and cluster to convergence.
     *
     * Errors: config_invalid, insufficient_distinct_points, empty_dataset;
     *         internal if reseeding fails despite validation.
     * Complexity: O(n * k * dim) for the first and verification passes,
     *             O(n * (1 + neighbors) * dim) for pruned passes.
     */
    auto run() -> std::expected<FastKmeansResult, core::error>;

    /** \brief Cluster starting from caller-supplied centroids.
     *
     * Errors: as run(), plus config_invalid when initial.size() != k,
     *         inconsistent_dimension when a centroid has the wrong length and
     *         precondition_failed when a coordinate is not finite.
     */
    auto run_with_centroids(std::vector<std::vector<float>> initial)
        -> std::expected<FastKmeansResult, core::error>;

    auto get_stats() const noexcept -> Stats { return stats_; }
    auto config() const noexcept -> const Config& { return config_; }
    auto dataset() const noexcept -> const Dataset& { return data_; }

private:
    auto validate() const -> std::expected<void, core::error>;

    auto iterate(std::vector<std::vector<float>> centroids)
        -> std::expected<FastKmeansResult, core::error>;

    /** \brief Move centroids to their means; reseed empty clusters. Returns whether anything moved. */
    auto recompute_centroids(std::vector<std::vector<float>>& centroids)
        -> std::expected<bool, core::error>;

    /** \brief Move points that are strictly closer to a just-reseeded centroid. */
    auto absorb_reseeded(const std::vector<std::vector<float>>& centroids) -> bool;

    /** \brief Bound-gated reassignment against neighbor clusters. */
    auto reassign_pruned(const std::vector<std::vector<float>>& centroids) -> bool;

    /** \brief Exhaustive scan; moves points to a strictly closer centroid. */
    auto verify_assignment(const std::vector<std::vector<float>>& centroids) -> bool;

    Dataset data_;
    Config config_;
    kernels::DistanceFn distance_;
    kernels::DistanceFn counted_distance_;
    std::unique_ptr<core::RandomSource> rng_;
    bool default_rng_{false};

    BoundTracker tracker_{1};
    NeighborGraph graph_;
    std::vector<std::uint32_t> reseeded_;
    Stats stats_;
    bool debug_{false};
};

} // namespace fastkm::cluster
