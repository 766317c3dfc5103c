#pragma once

/** \file dataset.hpp
 *  \brief Validated, immutable point set in row-major float storage.
 *
 * Layout: point i occupies data()[i * dim() .. (i + 1) * dim()).
 * Thread-safety: immutable after construction; safe to share for reads.
 */

#include <cstddef>
#include <expected>
#include <span>
#include <utility>
#include <vector>

#include "fastkm/error.hpp"

namespace fastkm {

class Dataset {
public:
    /** \brief Build from per-point rows.
     *
     * \return empty_dataset if rows is empty or the first row has no coordinates;
     *         inconsistent_dimension if any row length differs from the first.
     */
    static auto from_rows(const std::vector<std::vector<float>>& rows)
        -> std::expected<Dataset, core::error>;

    /** \brief Build from a flat row-major buffer of n * dim values. */
    static auto from_flat(std::vector<float> data, std::size_t dim)
        -> std::expected<Dataset, core::error>;

    auto size() const noexcept -> std::size_t { return n_; }
    auto dim() const noexcept -> std::size_t { return dim_; }
    auto data() const noexcept -> const float* { return data_.data(); }

    auto row(std::size_t i) const noexcept -> std::span<const float> {
        return {data_.data() + i * dim_, dim_};
    }

    /** \brief Number of pairwise distinct points, counting stops at limit.
     *
     * Complexity: O(n log n * dim) worst case.
     */
    auto count_distinct(std::size_t limit) const -> std::size_t;

private:
    Dataset(std::vector<float> data, std::size_t n, std::size_t dim)
        : data_(std::move(data)), n_(n), dim_(dim) {}

    std::vector<float> data_;
    std::size_t n_{0};
    std::size_t dim_{0};
};

} // namespace fastkm
