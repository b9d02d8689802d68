#include "datasizeformatter.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace psharecli
{
namespace
{
constexpr std::array<const char *, 9> byte_units {
    "B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB", "ZiB", "YiB"};

int count_integral_digits(double value)
{
    return int(std::to_string(size_t(std::floor(value))).size());
}
}  // namespace

std::string DataSizeFormatter::format(
    size_t size, int integral_part_max_digits, int fractional_part_max_digits) const
{
    integral_part_max_digits   = std::max(integral_part_max_digits, 1);
    fractional_part_max_digits = std::max(fractional_part_max_digits, 0);

    size_t unit_index           = 0;
    auto   scaled_size          = double(size);
    int    integral_part_digits = count_integral_digits(scaled_size);

    while (integral_part_digits > integral_part_max_digits && unit_index + 1 < byte_units.size())
    {
        scaled_size /= 1024;
        ++unit_index;
        integral_part_digits = count_integral_digits(scaled_size);
    }

    std::ostringstream ss;
    ss << std::setprecision(integral_part_digits + fractional_part_max_digits) << scaled_size
       << ' ' << byte_units[unit_index];
    return ss.str();
}
}  // namespace psharecli
