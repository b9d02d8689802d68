#ifndef PSHARE_UTILS_RANDOM_HPP_
#define PSHARE_UTILS_RANDOM_HPP_

#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>
#include <random>
#include <type_traits>
#include <vector>

namespace pshare::utils
{
class Random
{
public:
    Random();

    template<typename Int = int>
    auto next(Int min, Int max) -> std::enable_if_t<std::is_integral_v<Int>, Int>
    {
        std::uniform_int_distribution<Int> d {min, max};
        std::lock_guard                    lock {mutex_};
        return d(prng_);
    }

    template<typename Int = int>
    auto next(Int max = std::numeric_limits<Int>::max())
        -> std::enable_if_t<std::is_integral_v<Int>, Int>
    {
        return next<Int>(0, max);
    }

    std::vector<uint8_t> bytes(size_t count);

private:
    std::mt19937_64 prng_;
    std::mutex      mutex_;
};
}  // namespace pshare::utils

#endif  // PSHARE_UTILS_RANDOM_HPP_
