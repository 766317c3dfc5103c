#include "fastkm/cluster/neighbor_graph.hpp"

namespace fastkm::cluster {

auto NeighborGraph::reset_complete(std::uint32_t k) -> void {
    adjacency_.assign(k, {});
    for (std::uint32_t c = 0; c < k; ++c) {
        auto& row = adjacency_[c];
        row.reserve(k > 0 ? k - 1 : 0);
        for (std::uint32_t m = 0; m < k; ++m) {
            if (m != c) row.push_back(m);
        }
    }
}

auto NeighborGraph::build(const BoundTracker& tracker, std::uint32_t k) -> void {
    adjacency_.assign(k, {});

    // Bucket points by cluster so each set is built in one sweep
    std::vector<std::size_t> offsets(static_cast<std::size_t>(k) + 1, 0);
    for (std::size_t i = 0; i < tracker.size(); ++i) {
        offsets[tracker.assignment(i) + 1]++;
    }
    for (std::uint32_t c = 0; c < k; ++c) {
        offsets[c + 1] += offsets[c];
    }
    std::vector<std::size_t> members(tracker.size());
    std::vector<std::size_t> cursor(offsets.begin(), offsets.end() - 1);
    for (std::size_t i = 0; i < tracker.size(); ++i) {
        members[cursor[tracker.assignment(i)]++] = i;
    }

    // stamp_[m] == c + 1 marks m as already present in c's set
    stamp_.assign(k, 0);
    for (std::uint32_t c = 0; c < k; ++c) {
        auto& row = adjacency_[c];
        for (std::size_t j = offsets[c]; j < offsets[c + 1]; ++j) {
            for (std::uint32_t m : tracker.bounds(members[j]).neighbors) {
                if (m == c || m >= k || stamp_[m] == c + 1) continue;
                stamp_[m] = c + 1;
                row.push_back(m);
            }
        }
    }
}

auto NeighborGraph::edge_count() const noexcept -> std::size_t {
    std::size_t total = 0;
    for (const auto& row : adjacency_) total += row.size();
    return total;
}

} // namespace fastkm::cluster
