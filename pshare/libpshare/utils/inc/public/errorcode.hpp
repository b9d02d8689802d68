#ifndef PSHARE_UTILS_ERRORCODE_HPP_
#define PSHARE_UTILS_ERRORCODE_HPP_

#include <ostream>

namespace pshare::utils
{
enum class ErrorCode
{
    OK,
    IO_ERROR,
    INTEGRITY_ERROR,
    RANGE_ERROR,
    INVALID_ARGUMENT,
    NOT_FOUND
};

constexpr const char *to_string(ErrorCode error_code)
{
    switch (error_code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::INTEGRITY_ERROR: return "INTEGRITY_ERROR";
        case ErrorCode::RANGE_ERROR: return "RANGE_ERROR";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        default: return "INVALID_ERROR_CODE";
    }
}

inline std::ostream &operator<<(std::ostream &os, ErrorCode error_code)
{
    return os << to_string(error_code);
}
}  // namespace pshare::utils

#endif  // PSHARE_UTILS_ERRORCODE_HPP_
