#pragma once

#include <cstddef>
#include <cstdint>

#include "dio/result.hpp"

namespace dio
{

/// Platform page size, queried once.
size_t PageSize() noexcept;

constexpr bool IsPowerOfTwo(const size_t v) noexcept
{
    return v != 0 && (v & (v - 1)) == 0;
}

constexpr bool IsAligned(const uint64_t value, const size_t alignment) noexcept
{
    return alignment <= 1 || value % alignment == 0;
}

inline bool IsAligned(const void* p, const size_t alignment) noexcept
{
    return IsAligned(static_cast<uint64_t>(reinterpret_cast<uintptr_t>(p)), alignment);
}

constexpr uint64_t AlignDown(const uint64_t value, const size_t alignment) noexcept
{
    return alignment <= 1 ? value : value - value % alignment;
}

constexpr uint64_t AlignUp(const uint64_t value, const size_t alignment) noexcept
{
    return alignment <= 1 ? value : AlignDown(value + alignment - 1, alignment);
}

/// Alignment O_DIRECT requires for a given file.
struct DirectIoAlignment
{
    /// Required alignment of user buffer addresses (and lengths).
    size_t memory = 0;
    /// Required alignment of file offsets and transfer lengths.
    size_t offset = 0;

    /// The stricter of the two; a single value safe for every constraint.
    [[nodiscard]] size_t Strictest() const noexcept { return memory > offset ? memory : offset; }
};

/// @brief Reports the O_DIRECT alignment of an open file.
///
/// Uses statx(STATX_DIOALIGN) when both the kernel and the headers support
/// it. Falls back to the page size for both values otherwise, which is
/// valid for every Linux block device.
///
/// @return An error only when the fd itself is unusable (statx failure other
///         than "unsupported").
Result<DirectIoAlignment> QueryDirectIoAlignment(int fd);

}  // namespace dio
