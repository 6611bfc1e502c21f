#pragma once

#include <cstddef>
#include <memory>
#include <span>

#include "dio/alignment.hpp"
#include "dio/buffer_view.hpp"
#include "dio/result.hpp"

namespace dio
{
/**
 * @brief An owned memory region whose usable view starts on an alignment boundary.
 *
 * The backing block is over-allocated by `alignment - 1` bytes and the view is
 * placed at the first aligned address inside it. This works for any non-zero
 * alignment, not only powers of two.
 *
 * Memory layout:
 * [slack | view (size bytes) | slack]
 * ^backing ^aligned
 *
 * Slicing hands out direction-tagged views over sub-ranges; those views are
 * only valid while the buffer is alive and not disposed.
 *
 * ```cpp
 * auto buf = AlignedBuffer::Allocate(2 * 4096, 4096);
 * if (!buf) return std::unexpected(buf.error());
 *
 * std::array views{buf->ReadSlice(0, 4096), buf->ReadSlice(4096, 4096)};
 * auto n = ReadAt(fd, 0, views);
 * ```
 */
class AlignedBuffer
{
public:
    AlignedBuffer() = default;

    AlignedBuffer(AlignedBuffer&& other) noexcept;
    AlignedBuffer& operator=(AlignedBuffer&& other) noexcept;

    AlignedBuffer(const AlignedBuffer&) = delete;
    AlignedBuffer& operator=(const AlignedBuffer&) = delete;

    ~AlignedBuffer() = default;

    /// @brief Allocates `size` usable bytes starting on an `alignment` boundary.
    /// @return Errc::kAllocationFailed when size or alignment is zero, when
    ///         the padded size overflows, or when the platform allocator fails.
    static Result<AlignedBuffer> Allocate(size_t size, size_t alignment = PageSize());

    /// Mutable view of exactly Size() bytes. Empty once disposed.
    [[nodiscard]] std::span<std::byte> View() const noexcept { return {aligned_, size_}; }

    [[nodiscard]] size_t Size() const noexcept { return size_; }
    [[nodiscard]] size_t Alignment() const noexcept { return alignment_; }
    [[nodiscard]] bool Empty() const noexcept { return size_ == 0; }

    [[nodiscard]] ReadView AsRead() const noexcept { return ReadView{View()}; }
    [[nodiscard]] WriteView AsWrite() const noexcept { return WriteView{View()}; }

    /// Throws std::out_of_range when [offset, offset + length) exceeds Size().
    [[nodiscard]] ReadView ReadSlice(size_t offset, size_t length) const;
    [[nodiscard]] WriteView WriteSlice(size_t offset, size_t length) const;

    /// Releases the backing allocation. Calling it again is a no-op.
    void Dispose() noexcept;

    [[nodiscard]] bool Disposed() const noexcept { return backing_ == nullptr; }

private:
    AlignedBuffer(std::unique_ptr<std::byte[]> backing, std::byte* aligned, size_t size, size_t alignment)
        : backing_(std::move(backing)), aligned_(aligned), size_(size), alignment_(alignment)
    {
    }

    void CheckRange(size_t offset, size_t length) const;

    std::unique_ptr<std::byte[]> backing_;
    std::byte* aligned_ = nullptr;
    size_t size_ = 0;
    size_t alignment_ = 0;
};
}  // namespace dio
