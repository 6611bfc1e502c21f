#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

#include <sys/uio.h>

#include "dio/buffer_view.hpp"
#include "dio/io_context.hpp"
#include "dio/result.hpp"
#include "dio/task.hpp"
#include "dio/transfer.hpp"

namespace dio
{

// -----------------------------------------------------------------------------
// Concepts & Helpers
// -----------------------------------------------------------------------------

// Matches int, or any type with a .Get() -> int method (like an fd guard)
template <typename T>
concept FileDescriptor = std::convertible_to<T, int> || requires(const T& t) {
    { t.Get() } -> std::convertible_to<int>;
};

constexpr int GetRawFd(const FileDescriptor auto& fd)
{
    if constexpr (std::convertible_to<decltype(fd), int>)
    {
        return static_cast<int>(fd);
    }
    else
    {
        return fd.Get();
    }
}

// -----------------------------------------------------------------------------
// Blocking façade (preadv / pwritev)
// -----------------------------------------------------------------------------

namespace detail
{
Result<size_t> ReadAtFd(const ReadRequest& req);
Result<size_t> WriteAtFd(const WriteRequest& req);
}  // namespace detail

/// @brief Scatter-reads into `buffers`, in order, starting at `file_offset`.
/// @param f File descriptor, typically opened with O_DIRECT
/// @param file_offset Absolute file offset; the fd's cursor is neither used nor moved
/// @param buffers Views filled in list order (see Distribute)
/// @param alignment When non-zero, offset, addresses and lengths are checked
///        against it before the syscall
/// @return Bytes read, <= TotalLength(buffers). 0 means EOF at file_offset.
///
/// @note An empty list (or all-empty views) returns 0 without a syscall.
/// @note A short count is a result, not an error: it marks EOF or the point
///       past which an unbuffered read would no longer be aligned.
/// @warning EINVAL (ErrorKind::kInvalidOffsetOrAlignment) is never retried.
///
/// @code
///   auto buf = AlignedBuffer::Allocate(4096);
///   std::array views{buf->AsRead()};
///   auto n = ReadAt(fd, 0, views, 4096);
/// @endcode
template <FileDescriptor F>
Result<size_t> ReadAt(const F& f, const uint64_t file_offset, ReadList buffers, const size_t alignment = 0)
{
    return detail::ReadAtFd(ReadRequest{GetRawFd(f), file_offset, buffers, alignment});
}

/// @brief Gather-writes `buffers`, in order, starting at `file_offset`.
/// @return Bytes written. Equal to TotalLength(buffers) unless the kernel
///         stopped early (e.g. no space); a short count is not an error.
template <FileDescriptor F>
Result<size_t> WriteAt(const F& f, const uint64_t file_offset, WriteList buffers, const size_t alignment = 0)
{
    return detail::WriteAtFd(WriteRequest{GetRawFd(f), file_offset, buffers, alignment});
}

// -----------------------------------------------------------------------------
// Suspending façade (io_uring READV / WRITEV)
// -----------------------------------------------------------------------------

struct ReadvAtOp : UringOp
{
    int fd;
    detail::Batch batch;

    ReadvAtOp(IoContext& ctx, const int f, const detail::Batch& b, CancelToken* t)
        : UringOp(&ctx, t), fd(f), batch(b)
    {
    }

    void PrepareSqe(io_uring_sqe* sqe) const
    {
        io_uring_prep_readv(sqe, fd, batch.iovecs.data(), static_cast<unsigned>(batch.iovecs.size()),
                            batch.file_offset);
    }
};

struct WritevAtOp : UringOp
{
    int fd;
    detail::Batch batch;

    WritevAtOp(IoContext& ctx, const int f, const detail::Batch& b, CancelToken* t)
        : UringOp(&ctx, t), fd(f), batch(b)
    {
    }

    void PrepareSqe(io_uring_sqe* sqe) const
    {
        io_uring_prep_writev(sqe, fd, batch.iovecs.data(), static_cast<unsigned>(batch.iovecs.size()),
                             batch.file_offset);
    }
};

namespace detail
{
Task<Result<size_t>> AsyncReadAtFd(IoContext& ctx, ReadRequest req, CancelToken* token);
Task<Result<size_t>> AsyncWriteAtFd(IoContext& ctx, WriteRequest req, CancelToken* token);
}  // namespace detail

/// @brief Suspending form of ReadAt; same contract, same error vocabulary.
/// @param ctx The IoContext whose thread runs the calling coroutine
/// @param token Optional cancellation; see CancelToken for the policy
/// @return Task yielding Result<size_t>
///
/// @warning `buffers` (the span and the memory behind every view) must stay
///          valid until co_await returns. The Task is lazy: nothing is
///          submitted until it is awaited.
///
/// @code
///   auto n = co_await AsyncReadAt(ctx, fd, offset, views, 4096);
///   if (n && *n < TotalLength(views)) {
///       // boundary reached: stop issuing further reads
///   }
/// @endcode
template <FileDescriptor F>
Task<Result<size_t>> AsyncReadAt(IoContext& ctx, const F& f, const uint64_t file_offset, ReadList buffers,
                                 const size_t alignment = 0, CancelToken* token = nullptr)
{
    return detail::AsyncReadAtFd(ctx, ReadRequest{GetRawFd(f), file_offset, buffers, alignment}, token);
}

/// @brief Suspending form of WriteAt.
template <FileDescriptor F>
Task<Result<size_t>> AsyncWriteAt(IoContext& ctx, const F& f, const uint64_t file_offset, WriteList buffers,
                                  const size_t alignment = 0, CancelToken* token = nullptr)
{
    return detail::AsyncWriteAtFd(ctx, WriteRequest{GetRawFd(f), file_offset, buffers, alignment}, token);
}

}  // namespace dio
