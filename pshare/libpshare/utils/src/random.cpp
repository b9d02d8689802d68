#include "random.hpp"

namespace pshare::utils
{
Random::Random()
    : prng_ {std::random_device {}()}
{}

std::vector<uint8_t> Random::bytes(size_t count)
{
    std::vector<uint8_t>                    out(count);
    std::uniform_int_distribution<unsigned> d {0, 255};
    std::lock_guard                         lock {mutex_};
    for (auto &b : out)
    {
        b = uint8_t(d(prng_));
    }
    return out;
}
}  // namespace pshare::utils
