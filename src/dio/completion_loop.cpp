#include "dio/completion_loop.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace dio
{

bool TransferCursor::Advance(const size_t requested, const size_t transferred) noexcept
{
    if (!Active())
    {
        return false;
    }

    state_ = LoopState::kInProgress;
    ++calls_;
    last_ = transferred;
    total_ += transferred;
    offset_ += transferred;

    if (transferred < requested)
    {
        state_ = LoopState::kShortCircuited;
    }
    else if (total_ >= limit_)
    {
        state_ = LoopState::kComplete;
    }
    return Active();
}

void TransferCursor::Finish() noexcept
{
    if (Active())
    {
        state_ = LoopState::kComplete;
    }
}

namespace detail
{

ReadPlan PlanRead(ReadList buffers, const size_t capacity, const uint64_t remaining, std::vector<ReadView>& scratch)
{
    if (remaining >= capacity)
    {
        return {buffers, capacity};
    }
    scratch = TrimToLength(buffers, remaining);
    return {scratch, static_cast<size_t>(remaining)};
}

void LogShortCircuit(const char* what, const LoopOutcome& outcome, const uint64_t at)
{
    if (outcome.state == LoopState::kShortCircuited)
    {
        alog::debug("{} loop stopped at offset {}: short call of {} bytes after {} calls, {} bytes total", what, at,
                    outcome.last_transfer, outcome.calls, outcome.total);
    }
}

Result<WriteStaging> WriteStaging::Create(const WriteLoopOptions& opts)
{
    const size_t view_size = opts.buffer_size == 0 ? PageSize() : opts.buffer_size;
    if (opts.buffer_count == 0 || view_size > SIZE_MAX / opts.buffer_count)
    {
        alog::warn("write loop: invalid staging geometry {} x {}", view_size, opts.buffer_count);
        return ErrorFromErrno(EINVAL);
    }
    if (opts.alignment != 0 && !IsAligned(static_cast<uint64_t>(view_size), opts.alignment))
    {
        alog::warn("write loop: buffer size {} is not a multiple of alignment {}", view_size, opts.alignment);
        return ErrorFromErrno(EINVAL);
    }

    const size_t buffer_alignment = opts.alignment == 0 ? PageSize() : opts.alignment;
    auto buffer = AlignedBuffer::Allocate(view_size * opts.buffer_count, buffer_alignment);
    if (!buffer)
    {
        return std::unexpected(buffer.error());
    }
    return WriteStaging(std::move(*buffer), view_size);
}

WriteList WriteStaging::Stage(std::span<const std::byte> content, const uint64_t consumed)
{
    const auto rest = content.subspan(static_cast<size_t>(consumed));
    const size_t chunk = std::min(rest.size(), buffer_.Size());
    std::memcpy(buffer_.View().data(), rest.data(), chunk);

    views_.clear();
    for (size_t at = 0; at < chunk; at += view_size_)
    {
        views_.push_back(buffer_.WriteSlice(at, std::min(view_size_, chunk - at)));
    }
    return views_;
}

Result<LoopOutcome> DriveWriteFd(const int fd, std::span<const std::byte> content, const WriteLoopOptions& opts)
{
    auto staging = WriteStaging::Create(opts);
    if (!staging)
    {
        return std::unexpected(staging.error());
    }

    TransferCursor cursor(opts.offset, content.size());
    while (cursor.Active())
    {
        const WriteList views = staging->Stage(content, cursor.Total());
        const size_t requested = TotalLength(views);

        auto n = WriteAt(fd, cursor.Offset(), views, opts.alignment);
        if (!n)
        {
            return std::unexpected(n.error());
        }
        cursor.Advance(requested, *n);
    }

    const auto outcome = cursor.Outcome();
    LogShortCircuit("write", outcome, cursor.Offset());
    return outcome;
}

Task<Result<LoopOutcome>> AsyncDriveWriteFd(IoContext& ctx, const int fd, std::span<const std::byte> content,
                                            const WriteLoopOptions opts, CancelToken* token)
{
    auto staging = WriteStaging::Create(opts);
    if (!staging)
    {
        co_return std::unexpected(staging.error());
    }

    TransferCursor cursor(opts.offset, content.size());
    while (cursor.Active())
    {
        const WriteList views = staging->Stage(content, cursor.Total());
        const size_t requested = TotalLength(views);

        auto n = co_await AsyncWriteAt(ctx, fd, cursor.Offset(), views, opts.alignment, token);
        if (!n)
        {
            co_return std::unexpected(n.error());
        }
        cursor.Advance(requested, *n);
    }

    const auto outcome = cursor.Outcome();
    LogShortCircuit("write", outcome, cursor.Offset());
    co_return outcome;
}

}  // namespace detail
}  // namespace dio
