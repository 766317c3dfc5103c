#include "fastkm/core/random_source.hpp"

namespace fastkm::core {

auto Mt19937Source::uniform_index(std::size_t n) -> std::size_t {
    if (n <= 1) return 0;
    std::uniform_int_distribution<std::size_t> dist(0, n - 1);
    return dist(gen_);
}

} // namespace fastkm::core
