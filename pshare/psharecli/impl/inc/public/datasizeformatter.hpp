#ifndef PSHARECLI_DATASIZEFORMATTER_HPP_
#define PSHARECLI_DATASIZEFORMATTER_HPP_

#include <cstddef>
#include <string>

namespace psharecli
{
class DataSizeFormatter
{
public:
    // Picks the smallest binary unit (B, KiB, MiB, ...) that keeps the integral part within
    // integral_part_max_digits digits
    [[nodiscard]] std::string format(
        size_t size, int integral_part_max_digits = 3, int fractional_part_max_digits = 3) const;
};
}  // namespace psharecli

#endif  // PSHARECLI_DATASIZEFORMATTER_HPP_
