#include "fastkm/dataset.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

namespace fastkm {

namespace {

auto validate_finite(const std::vector<float>& data) -> std::expected<void, core::error> {
    const auto it = std::find_if(data.begin(), data.end(),
                                 [](float v) { return !std::isfinite(v); });
    if (it != data.end()) {
        return std::unexpected(core::error{
            core::error_code::precondition_failed,
            "Non-finite coordinate at offset " + std::to_string(it - data.begin()),
            "dataset"
        });
    }
    return {};
}

} // anonymous namespace

auto Dataset::from_rows(const std::vector<std::vector<float>>& rows)
    -> std::expected<Dataset, core::error> {
    using core::error;
    using core::error_code;

    if (rows.empty() || rows.front().empty()) {
        return std::unexpected(error{error_code::empty_dataset,
                                     "Dataset has no points", "dataset"});
    }

    const std::size_t n = rows.size();
    const std::size_t dim = rows.front().size();
    std::vector<float> flat;
    flat.reserve(n * dim);

    for (std::size_t i = 0; i < n; ++i) {
        if (rows[i].size() != dim) {
            return std::unexpected(error{
                error_code::inconsistent_dimension,
                "Point " + std::to_string(i) + " has dimension " +
                    std::to_string(rows[i].size()) + ", expected " + std::to_string(dim),
                "dataset"
            });
        }
        flat.insert(flat.end(), rows[i].begin(), rows[i].end());
    }

    if (auto ok = validate_finite(flat); !ok) {
        return std::unexpected(ok.error());
    }

    return Dataset(std::move(flat), n, dim);
}

auto Dataset::from_flat(std::vector<float> data, std::size_t dim)
    -> std::expected<Dataset, core::error> {
    using core::error;
    using core::error_code;

    if (dim == 0 || data.empty()) {
        return std::unexpected(error{error_code::empty_dataset,
                                     "Dataset has no points", "dataset"});
    }
    if (data.size() % dim != 0) {
        return std::unexpected(error{
            error_code::inconsistent_dimension,
            "Buffer of " + std::to_string(data.size()) +
                " values is not a multiple of dimension " + std::to_string(dim),
            "dataset"
        });
    }

    if (auto ok = validate_finite(data); !ok) {
        return std::unexpected(ok.error());
    }

    const std::size_t n = data.size() / dim;
    return Dataset(std::move(data), n, dim);
}

auto Dataset::count_distinct(std::size_t limit) const -> std::size_t {
    if (n_ == 0) return 0;

    std::vector<std::size_t> order(n_);
    std::iota(order.begin(), order.end(), std::size_t{0});

    std::sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
        const auto ra = row(a);
        const auto rb = row(b);
        return std::lexicographical_compare(ra.begin(), ra.end(), rb.begin(), rb.end());
    });

    std::size_t distinct = 1;
    for (std::size_t i = 1; i < n_ && distinct < limit; ++i) {
        const auto prev = row(order[i - 1]);
        const auto cur = row(order[i]);
        if (!std::equal(prev.begin(), prev.end(), cur.begin())) {
            ++distinct;
        }
    }
    return std::min(distinct, limit);
}

} // namespace fastkm
