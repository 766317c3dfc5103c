#pragma once

/** \file distance.hpp
 *  \brief Scalar reference distance kernels and the pluggable metric type.
 *
 * Preconditions
 * - a.size() == b.size() > 0
 * - All inputs are finite
 * Determinism: pure functions, no allocations, no exceptions.
 *
 * The clustering engine only requires a metric that is non-negative, symmetric
 * and satisfies the triangle inequality. None of that is checked.
 */

#include <cmath>
#include <cstddef>
#include <functional>
#include <span>

namespace fastkm::kernels {

/** \brief Binary metric over two equal-length vectors. */
using DistanceFn = std::function<float(std::span<const float>, std::span<const float>)>;

/** \brief Sum of squared differences: sum((a[i] - b[i])^2). O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop for better instruction-level parallelism
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    const float d0 = pa[i] - pb[i];
    const float d1 = pa[i+1] - pb[i+1];
    const float d2 = pa[i+2] - pb[i+2];
    const float d3 = pa[i+3] - pb[i+3];

    s0 += d0 * d0;
    s1 += d1 * d1;
    s2 += d2 * d2;
    s3 += d3 * d3;
  }

  float s = s0 + s1 + s2 + s3;

  for (; i < n; ++i) {
    const float d = pa[i] - pb[i];
    s += d * d;
  }
  return s;
}

/** \brief Euclidean distance: sqrt(l2_sq(a, b)). Default clustering metric. O(d). */
inline float euclidean(std::span<const float> a, std::span<const float> b) noexcept {
  return std::sqrt(l2_sq(a, b));
}

/** \brief Metric used when the caller does not inject one. */
inline DistanceFn default_distance() {
  return [](std::span<const float> a, std::span<const float> b) { return euclidean(a, b); };
}

} // namespace fastkm::kernels
