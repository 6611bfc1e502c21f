#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <sys/uio.h>

#include "dio/buffer_view.hpp"
#include "dio/result.hpp"

namespace dio
{

/// Linux UIO_MAXIOV: the most iovecs one preadv/pwritev/IORING_OP_READV accepts.
inline constexpr size_t kMaxIovecsPerCall = 1024;

/// One positional scatter/gather transfer as issued by a caller.
template <Direction D>
struct TransferRequest
{
    int fd = -1;
    uint64_t file_offset = 0;
    BufferList<D> buffers;
    /// 0 leaves validation to the kernel; otherwise offset, addresses and
    /// lengths must all be multiples of it.
    size_t alignment = 0;
};

using ReadRequest = TransferRequest<Direction::kRead>;
using WriteRequest = TransferRequest<Direction::kWrite>;

/// @brief Checks offset, every buffer address and every buffer length against `alignment`.
/// @return EINVAL (system category), the code the kernel reports for the same
///         violation under O_DIRECT, so callers see one error either way.
Result<void> ValidateAlignment(uint64_t file_offset, ReadList buffers, size_t alignment);
Result<void> ValidateAlignment(uint64_t file_offset, WriteList buffers, size_t alignment);

namespace detail
{

/// A slice of a prepared transfer that goes out as one primitive call.
struct Batch
{
    std::span<const iovec> iovecs;
    uint64_t file_offset = 0;
    size_t length = 0;
};

/**
 * Validated iovec form of a TransferRequest, split into batches of at most
 * `max_iovecs` entries. Zero-length views are dropped. Batches are laid out
 * back to back: batch k+1 starts at batch k's offset plus its length.
 *
 * Both the blocking and the suspending façade consume this type, so the
 * validation and the split are identical across modes.
 */
class PreparedTransfer
{
public:
    static Result<PreparedTransfer> Prepare(const ReadRequest& req, size_t max_iovecs = kMaxIovecsPerCall);
    static Result<PreparedTransfer> Prepare(const WriteRequest& req, size_t max_iovecs = kMaxIovecsPerCall);

    PreparedTransfer(PreparedTransfer&&) noexcept = default;
    PreparedTransfer& operator=(PreparedTransfer&&) noexcept = default;
    PreparedTransfer(const PreparedTransfer&) = delete;
    PreparedTransfer& operator=(const PreparedTransfer&) = delete;

    [[nodiscard]] bool Empty() const noexcept { return total_ == 0; }
    [[nodiscard]] size_t TotalLength() const noexcept { return total_; }
    [[nodiscard]] size_t BatchCount() const noexcept { return bounds_.size(); }
    [[nodiscard]] Batch GetBatch(size_t index) const;

private:
    struct Bounds
    {
        size_t first;  // index into iovecs_
        size_t count;
        uint64_t file_offset;
        size_t length;
    };

    PreparedTransfer() = default;

    template <Direction D>
    static PreparedTransfer Build(const TransferRequest<D>& req, size_t max_iovecs);

    std::vector<iovec> iovecs_;
    std::vector<Bounds> bounds_;
    size_t total_ = 0;
};

/**
 * Walks the batches of a PreparedTransfer and folds their results into one
 * count. Stops after the first batch that moves fewer bytes than it asked
 * for, so the combined count obeys the same in-order distribution as a
 * single call would.
 *
 * An error on the first batch is the result. An error after earlier batches
 * already moved bytes (including cancellation) is reported as a short
 * transfer of those bytes; the caller sees the failure on its next call.
 *
 *     BatchCursor cursor(prepared);
 *     while (const Batch* b = cursor.Current())
 *         cursor.Record(issue(*b));
 *     return cursor.Finish();
 */
class BatchCursor
{
public:
    explicit BatchCursor(const PreparedTransfer& transfer) noexcept : transfer_(transfer) {}

    /// The batch to issue next, or nullptr when the transfer is finished.
    [[nodiscard]] const Batch* Current();

    void Record(const Result<size_t>& result);

    [[nodiscard]] Result<size_t> Finish() const;

    [[nodiscard]] size_t Transferred() const noexcept { return transferred_; }

private:
    const PreparedTransfer& transfer_;
    Batch current_{};
    size_t index_ = 0;
    size_t transferred_ = 0;
    std::error_code error_;
    bool done_ = false;
};

}  // namespace detail
}  // namespace dio
