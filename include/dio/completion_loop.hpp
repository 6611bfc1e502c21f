#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <utility>
#include <vector>

#include "dio/aligned_buffer.hpp"
#include "dio/buffer_view.hpp"
#include "dio/io_context.hpp"
#include "dio/logger.hpp"
#include "dio/positional_io.hpp"
#include "dio/result.hpp"
#include "dio/task.hpp"

namespace dio
{

// -----------------------------------------------------------------------------
// Loop state shared by the blocking and suspending drivers
// -----------------------------------------------------------------------------

enum class LoopState : uint8_t
{
    kNotStarted,
    kInProgress,
    kComplete,        // the requested range (or the whole payload) moved
    kShortCircuited,  // a call moved less than it asked for: EOF or alignment boundary
};

/// Both terminal states are successes. Failures travel in the Result.
struct LoopOutcome
{
    uint64_t total = 0;
    size_t calls = 0;
    LoopState state = LoopState::kNotStarted;
    size_t last_transfer = 0;
};

inline constexpr uint64_t kUnbounded = std::numeric_limits<uint64_t>::max();

/**
 * Offset/total bookkeeping and the termination rule of a transfer loop.
 *
 * The loop stops at the first call that moves fewer bytes than it requested.
 * Under O_DIRECT the next offset would no longer be sector aligned and a
 * further call would fail, so the short call is the end of the payload, not
 * something to retry.
 */
class TransferCursor
{
public:
    explicit TransferCursor(const uint64_t start_offset, const uint64_t limit = kUnbounded) noexcept
        : offset_(start_offset), limit_(limit)
    {
        if (limit_ == 0)
        {
            state_ = LoopState::kComplete;
        }
    }

    [[nodiscard]] bool Active() const noexcept
    {
        return state_ == LoopState::kNotStarted || state_ == LoopState::kInProgress;
    }

    [[nodiscard]] LoopState State() const noexcept { return state_; }
    [[nodiscard]] uint64_t Offset() const noexcept { return offset_; }
    [[nodiscard]] uint64_t Total() const noexcept { return total_; }
    [[nodiscard]] uint64_t Remaining() const noexcept { return limit_ - total_; }

    /// Records one call. Returns true while the loop should issue another.
    bool Advance(size_t requested, size_t transferred) noexcept;

    /// Terminates a loop that cannot make progress (nothing to request).
    void Finish() noexcept;

    [[nodiscard]] LoopOutcome Outcome() const noexcept { return {total_, calls_, state_, last_}; }

private:
    uint64_t offset_;
    uint64_t limit_;
    uint64_t total_ = 0;
    size_t calls_ = 0;
    size_t last_ = 0;
    LoopState state_ = LoopState::kNotStarted;
};

template <typename S>
concept ReadSink = std::invocable<S&, uint64_t, size_t>;

struct ReadLoopOptions
{
    uint64_t offset = 0;
    /// Stop (kComplete) after this many bytes. Should be a multiple of the
    /// alignment when one is enforced.
    uint64_t max_bytes = kUnbounded;
    size_t alignment = 0;
};

struct WriteLoopOptions
{
    uint64_t offset = 0;
    /// Bytes per view; 0 means the page size. Must satisfy the alignment.
    size_t buffer_size = 0;
    /// Views per call.
    size_t buffer_count = 1;
    /// Enforced before every call when non-zero. Also the staging buffer's
    /// alignment (page size when zero).
    size_t alignment = 0;
};

namespace detail
{
/// Buffers for the next read: the full list, or its prefix trimmed to what
/// is left of the range.
struct ReadPlan
{
    ReadList buffers;
    size_t requested = 0;
};

ReadPlan PlanRead(ReadList buffers, size_t capacity, uint64_t remaining, std::vector<ReadView>& scratch);

void LogShortCircuit(const char* what, const LoopOutcome& outcome, uint64_t at);

/**
 * Aligned staging area for the write loop: content is copied chunk by chunk
 * into `count` views of `size` bytes carved from one AlignedBuffer.
 */
class WriteStaging
{
public:
    static Result<WriteStaging> Create(const WriteLoopOptions& opts);

    /// Copies the next chunk of `content` starting at `consumed`; returns
    /// the views to write (the last one possibly short).
    WriteList Stage(std::span<const std::byte> content, uint64_t consumed);

    [[nodiscard]] size_t Capacity() const noexcept { return buffer_.Size(); }

private:
    WriteStaging(AlignedBuffer buffer, size_t view_size) : buffer_(std::move(buffer)), view_size_(view_size) {}

    AlignedBuffer buffer_;
    size_t view_size_;
    std::vector<WriteView> views_;
};

Result<LoopOutcome> DriveWriteFd(int fd, std::span<const std::byte> content, const WriteLoopOptions& opts);
Task<Result<LoopOutcome>> AsyncDriveWriteFd(IoContext& ctx, int fd, std::span<const std::byte> content,
                                            WriteLoopOptions opts, CancelToken* token);
}  // namespace detail

// -----------------------------------------------------------------------------
// Read loop
// -----------------------------------------------------------------------------

/// @brief Reads a whole range through repeated ReadAt calls on the same views.
/// @param f File descriptor (typically O_DIRECT)
/// @param buffers Views reused by every call; their total length is the per-call capacity
/// @param sink Called as sink(file_offset, bytes) after each non-empty call,
///        before the views are reused. Distribute() tells which views hold the bytes.
/// @param opts Start offset, optional byte limit, enforced alignment
/// @return Outcome with the accumulated total. kShortCircuited means a call
///         came back short (EOF or alignment boundary); kComplete means
///         max_bytes was reached (or there was nothing to read into).
///
/// @code
///   auto out = DriveRead(fd, views, [&](uint64_t off, size_t n) { consume(off, n); });
///   // out->total == file size, out->state == LoopState::kShortCircuited
/// @endcode
template <FileDescriptor F, ReadSink S>
Result<LoopOutcome> DriveRead(const F& f, ReadList buffers, S&& sink, const ReadLoopOptions& opts = {})
{
    const size_t capacity = TotalLength(buffers);
    TransferCursor cursor(opts.offset, opts.max_bytes);
    if (capacity == 0)
    {
        cursor.Finish();
    }

    std::vector<ReadView> scratch;
    while (cursor.Active())
    {
        const auto plan = detail::PlanRead(buffers, capacity, cursor.Remaining(), scratch);
        const uint64_t at = cursor.Offset();

        auto n = ReadAt(f, at, plan.buffers, opts.alignment);
        if (!n)
        {
            return std::unexpected(n.error());
        }
        if (*n > 0)
        {
            sink(at, *n);
        }
        cursor.Advance(plan.requested, *n);
    }

    const auto outcome = cursor.Outcome();
    detail::LogShortCircuit("read", outcome, cursor.Offset());
    return outcome;
}

template <FileDescriptor F>
Result<LoopOutcome> DriveRead(const F& f, ReadList buffers, const ReadLoopOptions& opts = {})
{
    return DriveRead(f, buffers, [](uint64_t, size_t) {}, opts);
}

namespace detail
{
template <typename S>
Task<Result<LoopOutcome>> AsyncDriveReadFd(IoContext& ctx, const int fd, ReadList buffers, S sink,
                                           const ReadLoopOptions opts, CancelToken* token)
{
    const size_t capacity = TotalLength(buffers);
    TransferCursor cursor(opts.offset, opts.max_bytes);
    if (capacity == 0)
    {
        cursor.Finish();
    }

    std::vector<ReadView> scratch;
    while (cursor.Active())
    {
        const auto plan = PlanRead(buffers, capacity, cursor.Remaining(), scratch);
        const uint64_t at = cursor.Offset();

        auto n = co_await AsyncReadAt(ctx, fd, at, plan.buffers, opts.alignment, token);
        if (!n)
        {
            co_return std::unexpected(n.error());
        }
        if (*n > 0)
        {
            sink(at, *n);
        }
        cursor.Advance(plan.requested, *n);
    }

    const auto outcome = cursor.Outcome();
    LogShortCircuit("read", outcome, cursor.Offset());
    co_return outcome;
}
}  // namespace detail

/// @brief Suspending form of DriveRead. The sink is stored in the coroutine
/// frame; pass std::ref to keep state in the caller.
template <FileDescriptor F, ReadSink S>
Task<Result<LoopOutcome>> AsyncDriveRead(IoContext& ctx, const F& f, ReadList buffers, S sink,
                                         const ReadLoopOptions& opts = {}, CancelToken* token = nullptr)
{
    return detail::AsyncDriveReadFd(ctx, GetRawFd(f), buffers, std::move(sink), opts, token);
}

// -----------------------------------------------------------------------------
// Write loop
// -----------------------------------------------------------------------------

/// @brief Writes `content` in aligned chunks at an advancing offset.
/// @param content Payload; copied through an internal aligned staging buffer
///        of buffer_size * buffer_count bytes, released on every exit path
/// @return kComplete once every byte is written; kShortCircuited if the
///         kernel accepted fewer bytes than a call offered.
///
/// @note Padding a final partial sector is the caller's job: with an enforced
///       alignment, a content length that is not a multiple of it fails the
///       last call with kInvalidOffsetOrAlignment.
template <FileDescriptor F>
Result<LoopOutcome> DriveWrite(const F& f, std::span<const std::byte> content, const WriteLoopOptions& opts = {})
{
    return detail::DriveWriteFd(GetRawFd(f), content, opts);
}

/// @brief Suspending form of DriveWrite. `content` must stay valid until co_await returns.
template <FileDescriptor F>
Task<Result<LoopOutcome>> AsyncDriveWrite(IoContext& ctx, const F& f, std::span<const std::byte> content,
                                          const WriteLoopOptions& opts = {}, CancelToken* token = nullptr)
{
    return detail::AsyncDriveWriteFd(ctx, GetRawFd(f), content, opts, token);
}

}  // namespace dio
