#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

#include <sys/uio.h>

namespace dio
{

enum class Direction : uint8_t
{
    kRead,   // filled by the transfer
    kWrite,  // transmitted by the transfer
};

/**
 * @brief A byte range tagged with the direction of the transfer that uses it.
 *
 * ReadView points at mutable bytes, WriteView at const bytes. A ReadView
 * converts to a WriteView; the reverse does not compile. Views never own
 * memory: the backing AlignedBuffer (or caller storage) must outlive every
 * operation that references the view.
 */
template <Direction D>
class BufferView
{
public:
    using ByteType = std::conditional_t<D == Direction::kRead, std::byte, const std::byte>;

    constexpr BufferView() noexcept = default;
    constexpr BufferView(ByteType* data, const size_t size) noexcept : data_(data), size_(size) {}
    constexpr BufferView(std::span<ByteType> s) noexcept : data_(s.data()), size_(s.size()) {}

    // Read -> Write (and mutable span -> WriteView).
    template <Direction Other>
        requires(D == Direction::kWrite && Other == Direction::kRead)
    constexpr BufferView(const BufferView<Other>& other) noexcept : data_(other.data()), size_(other.size())
    {
    }

    template <typename U>
        requires(D == Direction::kWrite && std::is_same_v<U, std::byte>)
    constexpr BufferView(std::span<U> s) noexcept : data_(s.data()), size_(s.size())
    {
    }

    [[nodiscard]] constexpr ByteType* data() const noexcept { return data_; }
    [[nodiscard]] constexpr size_t size() const noexcept { return size_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] constexpr std::span<ByteType> Span() const noexcept { return {data_, size_}; }

    /// Prefix of at most n bytes.
    [[nodiscard]] constexpr BufferView First(const size_t n) const noexcept
    {
        return {data_, n < size_ ? n : size_};
    }

    [[nodiscard]] iovec ToIovec() const noexcept
    {
        // iovec is direction-agnostic; writes never store through it.
        return {const_cast<std::byte*>(data_), size_};
    }

private:
    ByteType* data_ = nullptr;
    size_t size_ = 0;
};

using ReadView = BufferView<Direction::kRead>;
using WriteView = BufferView<Direction::kWrite>;

template <Direction D>
using BufferList = std::span<const BufferView<D>>;

using ReadList = BufferList<Direction::kRead>;
using WriteList = BufferList<Direction::kWrite>;

namespace detail
{
template <Direction D>
constexpr size_t TotalLength(BufferList<D> buffers) noexcept
{
    size_t total = 0;
    for (const auto& b : buffers)
    {
        total += b.size();
    }
    return total;
}

template <Direction D>
std::vector<size_t> Distribute(BufferList<D> buffers, size_t transferred)
{
    std::vector<size_t> out;
    out.reserve(buffers.size());
    for (const auto& b : buffers)
    {
        const size_t take = transferred < b.size() ? transferred : b.size();
        out.push_back(take);
        transferred -= take;
    }
    return out;
}

template <Direction D>
std::vector<BufferView<D>> TrimToLength(BufferList<D> buffers, uint64_t limit)
{
    std::vector<BufferView<D>> out;
    for (const auto& b : buffers)
    {
        if (limit == 0)
        {
            break;
        }
        const auto view = b.First(limit < b.size() ? static_cast<size_t>(limit) : b.size());
        out.push_back(view);
        limit -= view.size();
    }
    return out;
}
}  // namespace detail

constexpr size_t TotalLength(ReadList buffers) noexcept
{
    return detail::TotalLength(buffers);
}

constexpr size_t TotalLength(WriteList buffers) noexcept
{
    return detail::TotalLength(buffers);
}

/**
 * @brief Attributes a transferred byte count to the buffers in list order.
 *
 * Buffer i absorbs min(remaining, len(i)) bytes before the rest spills over
 * into buffer i+1. The result has one entry per buffer; trailing entries are
 * zero once the count is exhausted. The rule is the same whether the
 * transfer went out as one primitive call or several.
 *
 * @code
 *   // two 4096-byte views, 5000 bytes read
 *   Distribute(views, 5000);  // {4096, 904}
 * @endcode
 */
inline std::vector<size_t> Distribute(ReadList buffers, const size_t transferred)
{
    return detail::Distribute(buffers, transferred);
}

inline std::vector<size_t> Distribute(WriteList buffers, const size_t transferred)
{
    return detail::Distribute(buffers, transferred);
}

/// Leading views covering at most `limit` bytes; the view that straddles the
/// limit is cut short.
inline std::vector<ReadView> TrimToLength(ReadList buffers, const uint64_t limit)
{
    return detail::TrimToLength(buffers, limit);
}

inline std::vector<WriteView> TrimToLength(WriteList buffers, const uint64_t limit)
{
    return detail::TrimToLength(buffers, limit);
}

}  // namespace dio
