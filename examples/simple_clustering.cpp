/**
 * Simple clustering example using fastkm
 *
 * This example demonstrates:
 * - Building a dataset from rows
 * - Running the accelerated k-means engine
 * - Reading clusters, centroids and run statistics
 */

#include <fastkm/cluster/fast_kmeans.hpp>
#include <iostream>
#include <random>
#include <vector>

// Three noisy groups in the plane
std::vector<std::vector<float>> generate_points(std::size_t per_group, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::normal_distribution<float> noise(0.0f, 0.75f);
    const float centers[3][2] = {{0.0f, 0.0f}, {10.0f, 10.0f}, {-10.0f, 10.0f}};

    std::vector<std::vector<float>> rows;
    rows.reserve(3 * per_group);
    for (const auto& c : centers) {
        for (std::size_t i = 0; i < per_group; ++i) {
            rows.push_back({c[0] + noise(gen), c[1] + noise(gen)});
        }
    }
    return rows;
}

int main() {
    using namespace fastkm;

    auto data = Dataset::from_rows(generate_points(200, 7));
    if (!data) {
        std::cerr << "Failed to build dataset: " << data.error().message << std::endl;
        return 1;
    }
    std::cout << "Dataset: " << data->size() << " points, dim " << data->dim() << std::endl;

    cluster::FastKmeans engine(std::move(*data), {
        .k = 3,
        .seed = 42,
        .verbose = true
    });

    auto result = engine.run();
    if (!result) {
        std::cerr << "Clustering failed: " << core::to_string(result.error().code)
                  << ": " << result.error().message << std::endl;
        return 1;
    }

    std::cout << "Converged: " << (result->converged ? "yes" : "no")
              << " after " << result->iterations << " iterations" << std::endl;
    for (std::size_t c = 0; c < result->clusters.size(); ++c) {
        std::cout << "  cluster " << c << ": " << result->clusters[c].size() << " points" << std::endl;
    }
    for (std::size_t c = 0; c < result->centroids.size(); ++c) {
        std::cout << "  centroid " << c << ": (" << result->centroids[c][0]
                  << ", " << result->centroids[c][1] << ")" << std::endl;
    }

    const auto stats = engine.get_stats();
    const std::size_t exhaustive = engine.dataset().size() * engine.config().k * (stats.iterations + 1);
    std::cout << "Distance computations: " << stats.distance_computations
              << " (exhaustive Lloyd: " << exhaustive << ")" << std::endl;
    std::cout << "Points skipped: " << stats.points_skipped << std::endl;
    std::cout << "Inertia: " << result->inertia << std::endl;

    return 0;
}
