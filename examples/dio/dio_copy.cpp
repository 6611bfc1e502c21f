// examples/dio/dio_copy.cpp
// Demonstrates: AsyncReadAt + AsyncWriteAt driven by a TransferCursor, padding the
// final partial sector and trimming the destination back to the source size

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <gflags/gflags.h>

#include "dio/dio.hpp"

DEFINE_string(src, "", "Source file");
DEFINE_string(dst, "", "Destination file (created or truncated)");
DEFINE_uint64(buffer_size, 256 * 1024, "Bytes per buffer, rounded up to the O_DIRECT alignment");
DEFINE_uint32(buffers, 4, "Buffers per call");

namespace
{
struct CopyStats
{
    uint64_t bytes = 0;
    size_t reads = 0;
};

dio::Task<dio::Result<CopyStats>> Copy(dio::IoContext& ctx, const int src, const int dst, dio::AlignedBuffer& buffer,
                                       const size_t buffer_size, const size_t align)
{
    std::vector<dio::ReadView> read_views;
    std::vector<dio::WriteView> write_views;
    for (size_t at = 0; at < buffer.Size(); at += buffer_size)
    {
        read_views.push_back(buffer.ReadSlice(at, buffer_size));
        write_views.push_back(buffer.WriteSlice(at, buffer_size));
    }
    const size_t capacity = dio::TotalLength(read_views);

    dio::TransferCursor cursor(0);
    while (cursor.Active())
    {
        const uint64_t at = cursor.Offset();
        auto n = co_await dio::AsyncReadAt(ctx, src, at, read_views, align);
        if (!n)
        {
            co_return std::unexpected(n.error());
        }

        if (*n > 0)
        {
            // The tail of a file is written as whole sectors; the zero padding
            // is cut off with ftruncate once the copy is done.
            const size_t padded = dio::AlignUp(*n, align);
            std::memset(buffer.View().data() + *n, 0, padded - *n);

            const auto chunk = dio::TrimToLength(write_views, padded);
            auto w = co_await dio::AsyncWriteAt(ctx, dst, at, chunk, align);
            if (!w)
            {
                co_return std::unexpected(w.error());
            }
            if (*w < padded)
            {
                dio::alog::error("short write at offset {}: {} of {} bytes", at, *w, padded);
                co_return dio::ErrorFromErrno(EIO);
            }
        }
        cursor.Advance(capacity, *n);
    }

    const auto out = cursor.Outcome();
    co_return CopyStats{out.total, out.calls};
}
}  // namespace

int main(int argc, char** argv)
{
    gflags::SetUsageMessage("Copies a file with O_DIRECT reads and writes on io_uring");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    if (FLAGS_src.empty() || FLAGS_dst.empty() || FLAGS_buffers == 0 || FLAGS_buffer_size == 0)
    {
        std::println(stderr, "usage: dio_copy --src=<file> --dst=<file> [--buffers=N] [--buffer_size=B]");
        return 2;
    }

    dio::alog::start();

    const int src = ::open(FLAGS_src.c_str(), O_RDONLY | O_CLOEXEC | O_DIRECT);
    if (src < 0)
    {
        dio::alog::error("open {}: {}", FLAGS_src, dio::MakeErrorCode(errno).message());
        dio::alog::stop();
        return 1;
    }
    const int dst = ::open(FLAGS_dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_DIRECT, 0644);
    if (dst < 0)
    {
        dio::alog::error("open {}: {}", FLAGS_dst, dio::MakeErrorCode(errno).message());
        ::close(src);
        dio::alog::stop();
        return 1;
    }

    auto src_align = dio::QueryDirectIoAlignment(src);
    auto dst_align = dio::QueryDirectIoAlignment(dst);
    if (!src_align || !dst_align)
    {
        dio::alog::error("statx failed: {}", (!src_align ? src_align.error() : dst_align.error()).message());
        ::close(src);
        ::close(dst);
        dio::alog::stop();
        return 1;
    }
    const size_t align = std::max(src_align->Strictest(), dst_align->Strictest());
    const size_t buffer_size = dio::AlignUp(FLAGS_buffer_size, align);

    int rc = 0;
    auto buffer = dio::AlignedBuffer::Allocate(buffer_size * FLAGS_buffers, align);
    if (!buffer)
    {
        dio::alog::error("allocation: {}", buffer.error().message());
        rc = 1;
    }
    else
    {
        dio::IoContext ctx;
        auto task = Copy(ctx, src, dst, *buffer, buffer_size, align);
        ctx.RunUntilDone(task);

        auto stats = task.Result();
        if (!stats)
        {
            std::println(stderr, "copy failed: {}", stats.error().message());
            rc = 1;
        }
        else if (::ftruncate(dst, static_cast<off_t>(stats->bytes)) != 0)
        {
            std::println(stderr, "ftruncate: {}", dio::MakeErrorCode(errno).message());
            rc = 1;
        }
        else
        {
            std::println("copied {} bytes in {} reads ({} x {} byte buffers, alignment {})", stats->bytes,
                         stats->reads, FLAGS_buffers, buffer_size, align);
        }
    }

    ::close(src);
    ::close(dst);
    dio::alog::stop();
    return rc;
}
