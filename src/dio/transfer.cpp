#include "dio/transfer.hpp"

#include <cerrno>
#include <stdexcept>

#include "dio/alignment.hpp"
#include "dio/logger.hpp"

namespace dio
{
namespace
{
template <Direction D>
Result<void> CheckAlignment(const uint64_t file_offset, BufferList<D> buffers, const size_t alignment)
{
    if (alignment <= 1)
    {
        return {};
    }

    if (!IsAligned(file_offset, alignment))
    {
        alog::warn("file offset {} is not a multiple of {}", file_offset, alignment);
        return ErrorFromErrno(EINVAL);
    }

    for (size_t i = 0; i < buffers.size(); ++i)
    {
        const auto& b = buffers[i];
        if (b.empty())
        {
            continue;
        }
        if (!IsAligned(b.data(), alignment) || !IsAligned(b.size(), alignment))
        {
            alog::warn("buffer {} ({} bytes at {}) violates {}-byte alignment", i, b.size(),
                       static_cast<const void*>(b.data()), alignment);
            return ErrorFromErrno(EINVAL);
        }
    }
    return {};
}
}  // namespace

Result<void> ValidateAlignment(const uint64_t file_offset, ReadList buffers, const size_t alignment)
{
    return CheckAlignment(file_offset, buffers, alignment);
}

Result<void> ValidateAlignment(const uint64_t file_offset, WriteList buffers, const size_t alignment)
{
    return CheckAlignment(file_offset, buffers, alignment);
}

namespace detail
{

template <Direction D>
PreparedTransfer PreparedTransfer::Build(const TransferRequest<D>& req, const size_t max_iovecs)
{
    PreparedTransfer t;
    t.iovecs_.reserve(req.buffers.size());

    uint64_t offset = req.file_offset;
    for (const auto& b : req.buffers)
    {
        if (b.empty())
        {
            continue;
        }

        if (t.bounds_.empty() || t.bounds_.back().count == max_iovecs)
        {
            t.bounds_.push_back({t.iovecs_.size(), 0, offset, 0});
        }

        auto& batch = t.bounds_.back();
        t.iovecs_.push_back(b.ToIovec());
        batch.count++;
        batch.length += b.size();
        offset += b.size();
        t.total_ += b.size();
    }

    if (t.bounds_.size() > 1)
    {
        alog::debug("transfer of {} iovecs split into {} calls", t.iovecs_.size(), t.bounds_.size());
    }
    return t;
}

Result<PreparedTransfer> PreparedTransfer::Prepare(const ReadRequest& req, const size_t max_iovecs)
{
    if (max_iovecs == 0)
    {
        return ErrorFromErrno(EINVAL);
    }
    // Nothing to move: no validation, no primitive call, whatever the offset or fd.
    if (dio::TotalLength(req.buffers) == 0)
    {
        return PreparedTransfer();
    }
    if (auto ok = ValidateAlignment(req.file_offset, req.buffers, req.alignment); !ok)
    {
        return std::unexpected(ok.error());
    }
    return Build(req, max_iovecs);
}

Result<PreparedTransfer> PreparedTransfer::Prepare(const WriteRequest& req, const size_t max_iovecs)
{
    if (max_iovecs == 0)
    {
        return ErrorFromErrno(EINVAL);
    }
    // Nothing to move: no validation, no primitive call, whatever the offset or fd.
    if (dio::TotalLength(req.buffers) == 0)
    {
        return PreparedTransfer();
    }
    if (auto ok = ValidateAlignment(req.file_offset, req.buffers, req.alignment); !ok)
    {
        return std::unexpected(ok.error());
    }
    return Build(req, max_iovecs);
}

Batch PreparedTransfer::GetBatch(const size_t index) const
{
    if (index >= bounds_.size())
    {
        throw std::out_of_range("PreparedTransfer::GetBatch() beyond batch count");
    }
    const auto& b = bounds_[index];
    return Batch{std::span<const iovec>(iovecs_).subspan(b.first, b.count), b.file_offset, b.length};
}

const Batch* BatchCursor::Current()
{
    if (done_ || index_ >= transfer_.BatchCount())
    {
        return nullptr;
    }
    current_ = transfer_.GetBatch(index_);
    return &current_;
}

void BatchCursor::Record(const Result<size_t>& result)
{
    if (!result)
    {
        if (transferred_ == 0)
        {
            error_ = result.error();
        }
        else
        {
            alog::debug("batch {} failed after {} bytes moved ({}); reporting short transfer", index_, transferred_,
                        result.error().message());
        }
        done_ = true;
        return;
    }

    transferred_ += *result;
    if (*result < current_.length)
    {
        done_ = true;
        return;
    }
    ++index_;
}

Result<size_t> BatchCursor::Finish() const
{
    if (error_)
    {
        return std::unexpected(error_);
    }
    return transferred_;
}

}  // namespace detail
}  // namespace dio
