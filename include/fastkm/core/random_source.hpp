#pragma once

/** \file random_source.hpp
 *  \brief Injectable source of random indices for seeding and reseeding.
 *
 * Thread-safety: implementations are stateful and not thread-safe.
 * Determinism: a given implementation and seed always yield the same sequence.
 */

#include <cstddef>
#include <cstdint>
#include <random>

namespace fastkm::core {

/** \brief Abstract random index generator. */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /** \brief Uniform index in [0, n). Precondition: n > 0. */
    virtual auto uniform_index(std::size_t n) -> std::size_t = 0;
};

/** \brief Default source backed by std::mt19937. */
class Mt19937Source final : public RandomSource {
public:
    explicit Mt19937Source(std::uint32_t seed) : gen_(seed) {}

    auto uniform_index(std::size_t n) -> std::size_t override;

private:
    std::mt19937 gen_;
};

} // namespace fastkm::core
