#include "dio/aligned_buffer.hpp"

#include <cstdint>
#include <format>
#include <limits>
#include <new>
#include <stdexcept>
#include <utility>

#include "dio/logger.hpp"

namespace dio
{
AlignedBuffer::AlignedBuffer(AlignedBuffer&& other) noexcept
    : backing_(std::move(other.backing_)),
      aligned_(std::exchange(other.aligned_, nullptr)),
      size_(std::exchange(other.size_, 0)),
      alignment_(std::exchange(other.alignment_, 0))
{
}

AlignedBuffer& AlignedBuffer::operator=(AlignedBuffer&& other) noexcept
{
    if (this != &other)
    {
        backing_ = std::move(other.backing_);
        aligned_ = std::exchange(other.aligned_, nullptr);
        size_ = std::exchange(other.size_, 0);
        alignment_ = std::exchange(other.alignment_, 0);
    }
    return *this;
}

Result<AlignedBuffer> AlignedBuffer::Allocate(const size_t size, const size_t alignment)
{
    if (size == 0 || alignment == 0)
    {
        alog::warn("rejecting aligned allocation: size={} alignment={}", size, alignment);
        return Fail(Errc::kAllocationFailed);
    }

    if (size > std::numeric_limits<size_t>::max() - (alignment - 1))
    {
        alog::warn("aligned allocation overflows: size={} alignment={}", size, alignment);
        return Fail(Errc::kAllocationFailed);
    }

    const size_t padded = size + alignment - 1;
    std::unique_ptr<std::byte[]> backing(new (std::nothrow) std::byte[padded]);
    if (backing == nullptr)
    {
        alog::error("out of memory allocating {} bytes", padded);
        return Fail(Errc::kAllocationFailed);
    }

    const auto base = reinterpret_cast<uintptr_t>(backing.get());
    const size_t skew = (alignment - base % alignment) % alignment;
    std::byte* aligned = backing.get() + skew;

    return AlignedBuffer{std::move(backing), aligned, size, alignment};
}

void AlignedBuffer::CheckRange(const size_t offset, const size_t length) const
{
    if (offset > size_ || length > size_ - offset)
    {
        throw std::out_of_range(
            std::format("AlignedBuffer slice [{}, +{}) beyond buffer of {} bytes", offset, length, size_));
    }
}

ReadView AlignedBuffer::ReadSlice(const size_t offset, const size_t length) const
{
    CheckRange(offset, length);
    return ReadView{aligned_ + offset, length};
}

WriteView AlignedBuffer::WriteSlice(const size_t offset, const size_t length) const
{
    CheckRange(offset, length);
    return WriteView{aligned_ + offset, length};
}

void AlignedBuffer::Dispose() noexcept
{
    if (backing_ == nullptr)
    {
        return;
    }
    backing_.reset();
    aligned_ = nullptr;
    size_ = 0;
}
}  // namespace dio
