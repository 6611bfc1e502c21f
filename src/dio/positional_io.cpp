#include "dio/positional_io.hpp"

#include <cerrno>

#include <sys/uio.h>

#include "dio/logger.hpp"

namespace dio
{
namespace
{
Result<size_t> IssueReadv(const int fd, const detail::Batch& b)
{
    const ssize_t n = ::preadv(fd, b.iovecs.data(), static_cast<int>(b.iovecs.size()), static_cast<off_t>(b.file_offset));
    if (n < 0)
    {
        return ErrorFromErrno(errno);
    }
    return static_cast<size_t>(n);
}

Result<size_t> IssueWritev(const int fd, const detail::Batch& b)
{
    const ssize_t n =
        ::pwritev(fd, b.iovecs.data(), static_cast<int>(b.iovecs.size()), static_cast<off_t>(b.file_offset));
    if (n < 0)
    {
        return ErrorFromErrno(errno);
    }
    return static_cast<size_t>(n);
}

void LogFailure(const char* what, const int fd, const uint64_t offset, const std::error_code& ec)
{
    if (ec == ErrorKind::kInvalidOffsetOrAlignment)
    {
        alog::warn("{} fd={} offset={}: misaligned for unbuffered I/O ({})", what, fd, offset, ec.message());
    }
    else if (ec != ErrorKind::kCancelled)
    {
        alog::warn("{} fd={} offset={}: {}", what, fd, offset, ec.message());
    }
}

template <typename Issue>
Result<size_t> RunBlocking(const char* what, const int fd, const uint64_t offset,
                           const detail::PreparedTransfer& prepared, Issue issue)
{
    detail::BatchCursor cursor(prepared);
    while (const detail::Batch* b = cursor.Current())
    {
        cursor.Record(issue(fd, *b));
    }
    auto result = cursor.Finish();
    if (!result)
    {
        LogFailure(what, fd, offset, result.error());
    }
    return result;
}
}  // namespace

namespace detail
{

Result<size_t> ReadAtFd(const ReadRequest& req)
{
    auto prepared = PreparedTransfer::Prepare(req);
    if (!prepared)
    {
        return std::unexpected(prepared.error());
    }
    if (prepared->Empty())
    {
        return 0;
    }
    return RunBlocking("preadv", req.fd, req.file_offset, *prepared, IssueReadv);
}

Result<size_t> WriteAtFd(const WriteRequest& req)
{
    auto prepared = PreparedTransfer::Prepare(req);
    if (!prepared)
    {
        return std::unexpected(prepared.error());
    }
    if (prepared->Empty())
    {
        return 0;
    }
    return RunBlocking("pwritev", req.fd, req.file_offset, *prepared, IssueWritev);
}

Task<Result<size_t>> AsyncReadAtFd(IoContext& ctx, const ReadRequest req, CancelToken* token)
{
    auto prepared = PreparedTransfer::Prepare(req);
    if (!prepared)
    {
        co_return std::unexpected(prepared.error());
    }
    if (prepared->Empty())
    {
        co_return 0;
    }

    BatchCursor cursor(*prepared);
    while (const Batch* b = cursor.Current())
    {
        cursor.Record(co_await ReadvAtOp(ctx, req.fd, *b, token));
    }

    auto result = cursor.Finish();
    if (!result)
    {
        LogFailure("readv", req.fd, req.file_offset, result.error());
    }
    co_return result;
}

Task<Result<size_t>> AsyncWriteAtFd(IoContext& ctx, const WriteRequest req, CancelToken* token)
{
    auto prepared = PreparedTransfer::Prepare(req);
    if (!prepared)
    {
        co_return std::unexpected(prepared.error());
    }
    if (prepared->Empty())
    {
        co_return 0;
    }

    BatchCursor cursor(*prepared);
    while (const Batch* b = cursor.Current())
    {
        cursor.Record(co_await WritevAtOp(ctx, req.fd, *b, token));
    }

    auto result = cursor.Finish();
    if (!result)
    {
        LogFailure("writev", req.fd, req.file_offset, result.error());
    }
    co_return result;
}

}  // namespace detail
}  // namespace dio
