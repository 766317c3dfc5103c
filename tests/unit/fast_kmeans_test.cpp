#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <set>
#include <vector>

#include "fastkm/cluster/centroids.hpp"
#include "fastkm/cluster/fast_kmeans.hpp"
#include "tests/support/test_data.hpp"

using Catch::Approx;
using fastkm::Dataset;
using fastkm::cluster::FastKmeans;
using fastkm::cluster::FastKmeansResult;
using fastkm::core::error_code;
using test_support::ScriptedSource;

namespace {

auto make_dataset(const std::vector<std::vector<float>>& rows) -> Dataset {
    auto ds = Dataset::from_rows(rows);
    REQUIRE(ds.has_value());
    return std::move(*ds);
}

/** \brief Every index 0..n-1 appears exactly once across all clusters. */
auto is_partition(const FastKmeansResult& res, std::size_t n) -> bool {
    std::vector<int> seen(n, 0);
    for (const auto& cluster : res.clusters) {
        if (cluster.empty()) return false;
        for (std::size_t idx : cluster) {
            if (idx >= n) return false;
            seen[idx]++;
        }
    }
    return std::all_of(seen.begin(), seen.end(), [](int s) { return s == 1; });
}

auto as_groups(const FastKmeansResult& res) -> std::set<std::set<std::size_t>> {
    std::set<std::set<std::size_t>> groups;
    for (const auto& cluster : res.clusters) {
        groups.emplace(cluster.begin(), cluster.end());
    }
    return groups;
}

const std::vector<std::vector<float>> kThreeGroups{
    {0.0f, 0.0f}, {0.0f, 1.0f}, {1.0f, 0.0f},
    {10.0f, 10.0f}, {10.0f, 11.0f}, {11.0f, 10.0f},
    {-10.0f, 10.0f}, {-10.0f, 11.0f}, {-11.0f, 10.0f},
};

} // anonymous namespace

TEST_CASE("FastKmeans recovers well-separated groups", "[fast_kmeans]") {
    // One seed per group
    auto rng = std::make_unique<ScriptedSource>(std::vector<std::size_t>{0, 3, 6});
    FastKmeans engine(make_dataset(kThreeGroups), FastKmeans::Config{.k = 3}, {}, std::move(rng));

    auto result = engine.run();
    REQUIRE(result.has_value());
    REQUIRE(result->converged);
    REQUIRE(is_partition(*result, kThreeGroups.size()));

    const std::set<std::set<std::size_t>> expected{{0, 1, 2}, {3, 4, 5}, {6, 7, 8}};
    REQUIRE(as_groups(*result) == expected);

    // Centroids sit at the group means
    for (const auto& centroid : result->centroids) {
        const bool at_mean =
            (centroid[0] == Approx(1.0f / 3.0f) && centroid[1] == Approx(1.0f / 3.0f)) ||
            (centroid[0] == Approx(31.0f / 3.0f) && centroid[1] == Approx(31.0f / 3.0f)) ||
            (centroid[0] == Approx(-31.0f / 3.0f) && centroid[1] == Approx(31.0f / 3.0f));
        REQUIRE(at_mean);
    }
}

TEST_CASE("FastKmeans output is a partition with at most k clusters", "[fast_kmeans]") {
    auto blobs = test_support::make_blobs(5, 40, 4, 2024);
    const std::size_t n = blobs.rows.size();

    for (std::uint32_t k : {1u, 2u, 5u, 9u}) {
        FastKmeans engine(make_dataset(blobs.rows), FastKmeans::Config{.k = k, .seed = 7});
        auto result = engine.run();
        REQUIRE(result.has_value());
        REQUIRE(is_partition(*result, n));
        REQUIRE(result->clusters.size() <= k);
        REQUIRE(result->assignments.size() == n);
        REQUIRE(result->centroids.size() == k);
        REQUIRE(result->cluster_sizes.size() == k);

        std::uint32_t total = 0;
        for (auto s : result->cluster_sizes) total += s;
        REQUIRE(total == n);
        for (auto a : result->assignments) REQUIRE(a < k);
    }
}

TEST_CASE("FastKmeans with k = 1 converges to the global mean", "[fast_kmeans]") {
    const std::vector<std::vector<float>> rows{{1.0f, 2.0f}, {3.0f, 4.0f}, {5.0f, 0.0f}, {-1.0f, 2.0f}};
    FastKmeans engine(make_dataset(rows), FastKmeans::Config{.k = 1});

    auto result = engine.run();
    REQUIRE(result.has_value());
    REQUIRE(result->converged);
    REQUIRE(result->clusters.size() == 1);
    REQUIRE(result->clusters[0] == std::vector<std::size_t>{0, 1, 2, 3});
    REQUIRE(result->centroids[0][0] == Approx(2.0f));
    REQUIRE(result->centroids[0][1] == Approx(2.0f));

    const auto stats = engine.get_stats();
    REQUIRE(stats.pruned_reassignments == 0);
    REQUIRE(stats.verified_reassignments == 0);
    REQUIRE(stats.reseeded_clusters == 0);
}

TEST_CASE("FastKmeans is deterministic for a fixed seed", "[fast_kmeans]") {
    auto blobs = test_support::make_blobs(4, 30, 6, 99, 4.0f, 1.5f);
    FastKmeans::Config cfg{.k = 6, .seed = 1234};

    FastKmeans a(make_dataset(blobs.rows), cfg);
    FastKmeans b(make_dataset(blobs.rows), cfg);
    auto ra = a.run();
    auto rb = b.run();
    REQUIRE(ra.has_value());
    REQUIRE(rb.has_value());
    REQUIRE(ra->assignments == rb->assignments);
    REQUIRE(ra->centroids == rb->centroids);

    SECTION("repeated runs on one instance restart the default source") {
        auto again = a.run();
        REQUIRE(again.has_value());
        REQUIRE(again->assignments == ra->assignments);
    }

    SECTION("identically scripted sources give identical output") {
        std::vector<std::size_t> script{5, 17, 33, 60, 81, 100, 2, 9};
        FastKmeans sa(make_dataset(blobs.rows), cfg, {}, std::make_unique<ScriptedSource>(script));
        FastKmeans sb(make_dataset(blobs.rows), cfg, {}, std::make_unique<ScriptedSource>(script));
        auto xa = sa.run();
        auto xb = sb.run();
        REQUIRE(xa.has_value());
        REQUIRE(xb.has_value());
        REQUIRE(xa->assignments == xb->assignments);
    }
}

TEST_CASE("FastKmeans reseeds a cluster that loses all its points", "[fast_kmeans]") {
    const std::vector<std::vector<float>> rows{
        {0.0f, 0.0f}, {0.0f, 1.0f}, {1.0f, 0.0f},
        {5.0f, 5.0f}, {5.0f, 6.0f}, {6.0f, 5.0f},
    };
    // Centroid 1 is far from every point, so cluster 1 starts out empty
    std::vector<std::vector<float>> initial{{2.0f, 2.0f}, {1000.0f, 1000.0f}};

    FastKmeans engine(make_dataset(rows), FastKmeans::Config{.k = 2},
                      {}, std::make_unique<ScriptedSource>(std::vector<std::size_t>{4}));
    auto result = engine.run_with_centroids(initial);
    REQUIRE(result.has_value());
    REQUIRE(result->converged);
    REQUIRE(engine.get_stats().reseeded_clusters >= 1);
    REQUIRE(is_partition(*result, rows.size()));
    REQUIRE(result->clusters.size() == 2);

    const std::set<std::set<std::size_t>> expected{{0, 1, 2}, {3, 4, 5}};
    REQUIRE(as_groups(*result) == expected);

    // The reseeded centroid ended up inside the data, not at its far-away start
    for (const auto& c : result->centroids) {
        REQUIRE(c[0] < 10.0f);
        REQUIRE(c[1] < 10.0f);
    }
}

TEST_CASE("FastKmeans fills a reseeded cluster when the other centroids hold still", "[fast_kmeans]") {
    const std::vector<std::vector<float>> rows{
        {0.0f, 0.0f}, {2.0f, 0.0f}, {1.0f, 3.0f},
        {10.0f, 10.0f}, {12.0f, 10.0f}, {11.0f, 13.0f},
    };
    // Centroids 0 and 1 already sit at the group means, centroid 2 is unreachable
    std::vector<std::vector<float>> initial{{1.0f, 1.0f}, {11.0f, 11.0f}, {1000.0f, 1000.0f}};

    FastKmeans engine(make_dataset(rows), FastKmeans::Config{.k = 3},
                      {}, std::make_unique<ScriptedSource>(std::vector<std::size_t>{0}));
    auto result = engine.run_with_centroids(initial);
    REQUIRE(result.has_value());
    REQUIRE(result->converged);
    REQUIRE(result->iterations < 10);
    REQUIRE(result->clusters.size() == 3);
    REQUIRE(is_partition(*result, rows.size()));

    const auto stats = engine.get_stats();
    REQUIRE(stats.reseeded_clusters == 1);
    REQUIRE(stats.reseed_reassignments >= 1);

    const std::set<std::set<std::size_t>> expected{{0}, {1, 2}, {3, 4, 5}};
    REQUIRE(as_groups(*result) == expected);
}

TEST_CASE("FastKmeans pruned pass takes the first qualifying neighbor", "[fast_kmeans]") {
    // Point 0 starts in cluster 0. After the first recompute, clusters 1 and 2
    // are both closer to it than its own centroid; 2 is the nearest but 1 is
    // scanned first.
    const std::vector<std::vector<float>> rows{
        {0.0f, 0.0f}, {1.2f, 0.0f}, {-0.45f, 0.0f}, {0.0f, -0.3f},
    };
    std::vector<std::vector<float>> initial{{1.0f, 0.0f}, {-1.2f, 0.0f}, {0.0f, -1.2f}};

    FastKmeans engine(make_dataset(rows),
                      FastKmeans::Config{.k = 3, .max_iter = 1, .verify_convergence = false});
    auto result = engine.run_with_centroids(initial);
    REQUIRE(result.has_value());
    REQUIRE(result->centroids[0][0] == Approx(0.6f));
    REQUIRE(result->centroids[1][0] == Approx(-0.45f));
    REQUIRE(result->centroids[2][1] == Approx(-0.3f));

    REQUIRE(result->assignments[0] == 1);
    const auto nearest = fastkm::cluster::nearest_centroid(
        std::vector<float>{0.0f, 0.0f}, result->centroids, fastkm::kernels::default_distance());
    REQUIRE(nearest.first == 2);
    REQUIRE(engine.get_stats().pruned_reassignments == 1);

    SECTION("verification later settles the point at its nearest centroid") {
        FastKmeans full(make_dataset(rows), FastKmeans::Config{.k = 3});
        auto settled = full.run_with_centroids(initial);
        REQUIRE(settled.has_value());
        REQUIRE(settled->converged);
        REQUIRE(settled->assignments ==
                fastkm::cluster::assign_exhaustive(full.dataset(), settled->centroids,
                                                   fastkm::kernels::default_distance()));
    }
}

TEST_CASE("FastKmeans validates its inputs up front", "[fast_kmeans]") {
    const std::vector<std::vector<float>> rows{{0.0f}, {1.0f}, {2.0f}, {3.0f}};

    SECTION("k = 0") {
        FastKmeans engine(make_dataset(rows), FastKmeans::Config{.k = 0});
        auto result = engine.run();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == error_code::config_invalid);
        REQUIRE(result.error().component == "fast_kmeans");
    }

    SECTION("k > n") {
        FastKmeans engine(make_dataset(rows), FastKmeans::Config{.k = 5});
        auto result = engine.run();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == error_code::insufficient_distinct_points);
    }

    SECTION("k exceeds distinct points") {
        FastKmeans engine(make_dataset({{1.0f}, {1.0f}, {1.0f}, {2.0f}}), FastKmeans::Config{.k = 3});
        auto result = engine.run();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == error_code::insufficient_distinct_points);
    }

    SECTION("k = n is accepted and yields singletons") {
        FastKmeans engine(make_dataset(rows), FastKmeans::Config{.k = 4});
        auto result = engine.run();
        REQUIRE(result.has_value());
        REQUIRE(result->clusters.size() == 4);
        REQUIRE(result->inertia == Approx(0.0f).margin(1e-6f));
    }

    SECTION("invalid tuning parameters") {
        FastKmeans no_iter(make_dataset(rows), FastKmeans::Config{.k = 2, .max_iter = 0});
        REQUIRE(no_iter.run().error().code == error_code::config_invalid);

        FastKmeans bad_tol(make_dataset(rows), FastKmeans::Config{.k = 2, .tolerance = -1.0f});
        REQUIRE(bad_tol.run().error().code == error_code::config_invalid);

        FastKmeans no_neighbors(make_dataset(rows), FastKmeans::Config{.k = 2, .point_neighbors = 0});
        REQUIRE(no_neighbors.run().error().code == error_code::config_invalid);
    }

    SECTION("warm start with the wrong number of centroids") {
        FastKmeans engine(make_dataset(rows), FastKmeans::Config{.k = 2});
        auto result = engine.run_with_centroids({{0.0f}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == error_code::config_invalid);
    }

    SECTION("warm start with a centroid of the wrong dimension") {
        FastKmeans engine(make_dataset(rows), FastKmeans::Config{.k = 2});
        auto result = engine.run_with_centroids({{0.0f}, {1.0f, 2.0f}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == error_code::inconsistent_dimension);
    }

    SECTION("warm start with a non-finite centroid") {
        FastKmeans engine(make_dataset(rows), FastKmeans::Config{.k = 2});
        auto result = engine.run_with_centroids({{0.0f}, {std::nanf("")}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == error_code::precondition_failed);
    }
}

TEST_CASE("FastKmeans uses the injected metric", "[fast_kmeans]") {
    std::size_t calls = 0;
    fastkm::kernels::DistanceFn manhattan = [&calls](std::span<const float> a, std::span<const float> b) {
        ++calls;
        float s = 0.0f;
        for (std::size_t i = 0; i < a.size(); ++i) s += std::abs(a[i] - b[i]);
        return s;
    };

    auto rng = std::make_unique<ScriptedSource>(std::vector<std::size_t>{0, 3, 6});
    FastKmeans engine(make_dataset(kThreeGroups), FastKmeans::Config{.k = 3}, manhattan, std::move(rng));
    auto result = engine.run();
    REQUIRE(result.has_value());
    REQUIRE(calls > 0);
    REQUIRE(calls == engine.get_stats().distance_computations);

    const std::set<std::set<std::size_t>> expected{{0, 1, 2}, {3, 4, 5}, {6, 7, 8}};
    REQUIRE(as_groups(*result) == expected);
}

TEST_CASE("FastKmeans stops at the iteration cap", "[fast_kmeans]") {
    auto blobs = test_support::make_blobs(6, 50, 3, 5, 3.0f, 2.0f);

    FastKmeans engine(make_dataset(blobs.rows), FastKmeans::Config{.k = 12, .max_iter = 1});
    auto result = engine.run();
    REQUIRE(result.has_value());
    REQUIRE(result->iterations == 1);
    REQUIRE_FALSE(result->converged);
    REQUIRE(is_partition(*result, blobs.rows.size()));
}

TEST_CASE("FASTKM_MAX_ITER overrides the configured cap", "[fast_kmeans][env]") {
    auto blobs = test_support::make_blobs(6, 50, 3, 5, 3.0f, 2.0f);

#if !defined(_WIN32)
    setenv("FASTKM_MAX_ITER", "1", 1);
    FastKmeans engine(make_dataset(blobs.rows), FastKmeans::Config{.k = 12});
    auto result = engine.run();
    unsetenv("FASTKM_MAX_ITER");

    REQUIRE(result.has_value());
    REQUIRE(result->iterations == 1);
#else
    SUCCEED();
#endif
}

TEST_CASE("FastKmeans without verification still terminates with a partition", "[fast_kmeans]") {
    auto blobs = test_support::make_blobs(5, 40, 4, 77, 6.0f, 1.0f);
    FastKmeans engine(make_dataset(blobs.rows),
                      FastKmeans::Config{.k = 5, .max_iter = 200, .verify_convergence = false});
    auto result = engine.run();
    REQUIRE(result.has_value());
    REQUIRE(result->iterations <= 200);
    REQUIRE(is_partition(*result, blobs.rows.size()));
    REQUIRE(engine.get_stats().verified_reassignments == 0);
}

TEST_CASE("FastKmeans statistics account for pruning", "[fast_kmeans]") {
    auto blobs = test_support::make_blobs(8, 100, 8, 31);
    const std::size_t n = blobs.rows.size();
    const std::uint32_t k = 8;

    FastKmeans engine(make_dataset(blobs.rows), FastKmeans::Config{.k = k, .seed = 3});
    auto result = engine.run();
    REQUIRE(result.has_value());

    const auto stats = engine.get_stats();
    REQUIRE(stats.iterations == result->iterations);
    REQUIRE(stats.converged == result->converged);
    REQUIRE(stats.final_inertia == Approx(result->inertia));
    REQUIRE(stats.points_skipped > 0);
    // Initial scan alone costs n * k evaluations
    REQUIRE(stats.distance_computations >= n * k);
}
