#include "dio/result.hpp"

#include <cerrno>

namespace dio
{
namespace
{
struct DioCategory final : std::error_category
{
    const char* name() const noexcept override { return "dio"; }

    std::string message(const int ev) const override
    {
        switch (static_cast<Errc>(ev))
        {
            case Errc::kAllocationFailed:
                return "aligned buffer allocation failed";
        }
        return "unknown dio error";
    }

    std::error_condition default_error_condition(const int ev) const noexcept override
    {
        if (static_cast<Errc>(ev) == Errc::kAllocationFailed)
        {
            return ErrorKind::kAllocationFailed;
        }
        return {ev, *this};
    }
};

struct ErrorKindCategory final : std::error_category
{
    const char* name() const noexcept override { return "dio.kind"; }

    std::string message(const int ev) const override
    {
        switch (static_cast<ErrorKind>(ev))
        {
            case ErrorKind::kAllocationFailed:
                return "allocation error";
            case ErrorKind::kInvalidOffsetOrAlignment:
                return "invalid offset or alignment";
            case ErrorKind::kCancelled:
                return "operation cancelled";
            case ErrorKind::kUnderlyingIo:
                return "underlying I/O error";
        }
        return "unknown error kind";
    }

    bool equivalent(const std::error_code& code, const int condition) const noexcept override
    {
        return static_cast<int>(Classify(code)) == condition;
    }
};
}  // namespace

const std::error_category& dio_category() noexcept
{
    static DioCategory cat;
    return cat;
}

const std::error_category& error_kind_category() noexcept
{
    static ErrorKindCategory cat;
    return cat;
}

// Only the allocator reports kAllocationFailed; a kernel ENOMEM from a read or
// write is an I/O failure like any other.
ErrorKind Classify(const std::error_code& ec) noexcept
{
    if (ec.category() == dio_category())
    {
        return ErrorKind::kAllocationFailed;
    }

    if (ec.category() == std::system_category() || ec.category() == std::generic_category())
    {
        switch (ec.value())
        {
            case EINVAL:
                return ErrorKind::kInvalidOffsetOrAlignment;
            case ECANCELED:
                return ErrorKind::kCancelled;
            default:
                break;
        }
    }
    return ErrorKind::kUnderlyingIo;
}
}  // namespace dio
