#pragma once
////////////////////////////////////////////////////////////////////////////////
// Standardized Error Handling
//
// Every fallible call returns Result<T> = std::expected<T, std::error_code>.
// Kernel failures keep their native errno (system_category). Failures the
// library originates itself use the "dio" category (Errc).
//
// Callers classify either kind by comparing against an ErrorKind condition:
//
//     if (!r && r.error() == dio::ErrorKind::kInvalidOffsetOrAlignment) ...
////////////////////////////////////////////////////////////////////////////////

#include <cstdint>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>

namespace dio
{
template <typename T = void>
using Result = std::expected<T, std::error_code>;

inline std::unexpected<std::error_code> ErrorFromErrno(int err)
{
    return std::unexpected(std::error_code(err, std::system_category()));
}

inline std::error_code MakeErrorCode(int err)
{
    return std::error_code{err > 0 ? err : -err, std::system_category()};
}

/// Error codes originated by dio itself (not by the kernel).
enum class Errc : uint8_t
{
    kAllocationFailed = 1,
};

/// Error kinds shared by the blocking and suspending façades.
/// End-of-file is not a kind: a read returning 0 is a successful result.
enum class ErrorKind : uint8_t
{
    kAllocationFailed = 1,
    kInvalidOffsetOrAlignment,
    kCancelled,
    kUnderlyingIo,
};

const std::error_category& dio_category() noexcept;
const std::error_category& error_kind_category() noexcept;

inline std::error_code make_error_code(Errc e) noexcept
{
    return {static_cast<int>(e), dio_category()};
}

inline std::error_condition make_error_condition(ErrorKind k) noexcept
{
    return {static_cast<int>(k), error_kind_category()};
}

inline std::unexpected<std::error_code> Fail(Errc e)
{
    return std::unexpected(make_error_code(e));
}

/// Maps any error code onto the shared vocabulary.
ErrorKind Classify(const std::error_code& ec) noexcept;

}  // namespace dio

template <>
struct std::is_error_code_enum<dio::Errc> : std::true_type
{
};

template <>
struct std::is_error_condition_enum<dio::ErrorKind> : std::true_type
{
};
