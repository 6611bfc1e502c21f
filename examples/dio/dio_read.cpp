// examples/dio/dio_read.cpp
// Demonstrates: QueryDirectIoAlignment, AlignedBuffer slicing, DriveRead / AsyncDriveRead

#include <cerrno>
#include <functional>
#include <print>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <gflags/gflags.h>

#include "dio/dio.hpp"

DEFINE_string(path, "", "File to read");
DEFINE_uint64(buffer_size, 0, "Bytes per buffer (0: the file's O_DIRECT alignment times 16)");
DEFINE_uint32(buffers, 2, "Buffers per read call");
DEFINE_bool(async, false, "Use the io_uring loop instead of preadv");
DEFINE_bool(direct, true, "Open with O_DIRECT");
DEFINE_bool(verbose, false, "Log debug records");

namespace
{
// FNV-1a over the bytes a loop delivers.
struct Checksum
{
    dio::ReadList views;
    uint64_t hash = 0xcbf29ce484222325ULL;

    void operator()(uint64_t /*offset*/, const size_t n)
    {
        const auto parts = dio::Distribute(views, n);
        for (size_t i = 0; i < views.size(); ++i)
        {
            for (const std::byte b : views[i].Span().first(parts[i]))
            {
                hash = (hash ^ static_cast<uint64_t>(b)) * 0x100000001b3ULL;
            }
        }
    }
};

const char* StateName(const dio::LoopState s)
{
    switch (s)
    {
        case dio::LoopState::kNotStarted:
            return "not started";
        case dio::LoopState::kInProgress:
            return "in progress";
        case dio::LoopState::kComplete:
            return "complete";
        case dio::LoopState::kShortCircuited:
            return "short-circuited";
    }
    return "?";
}

int Report(const dio::Result<dio::LoopOutcome>& out, const Checksum& sum)
{
    if (!out)
    {
        std::println(stderr, "read failed: {}", out.error().message());
        return 1;
    }
    std::println("{} bytes in {} calls ({}), last call {} bytes, fnv1a {:016x}", out->total, out->calls,
                 StateName(out->state), out->last_transfer, sum.hash);
    return 0;
}
}  // namespace

int main(int argc, char** argv)
{
    gflags::SetUsageMessage("Reads a file with unbuffered I/O and prints its size and checksum");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    if (FLAGS_path.empty() || FLAGS_buffers == 0)
    {
        std::println(stderr, "usage: dio_read --path=<file> [--buffers=N] [--buffer_size=B] [--async]");
        return 2;
    }

    dio::alog::g_level = FLAGS_verbose ? dio::alog::Level::Debug : dio::alog::Level::Info;
    dio::alog::start();

    const int flags = O_RDONLY | O_CLOEXEC | (FLAGS_direct ? O_DIRECT : 0);
    const int fd = ::open(FLAGS_path.c_str(), flags);
    if (fd < 0)
    {
        dio::alog::error("open {}: {}", FLAGS_path, dio::MakeErrorCode(errno).message());
        dio::alog::stop();
        return 1;
    }

    auto alignment = dio::QueryDirectIoAlignment(fd);
    if (!alignment)
    {
        dio::alog::error("statx {}: {}", FLAGS_path, alignment.error().message());
        ::close(fd);
        dio::alog::stop();
        return 1;
    }
    const size_t align = alignment->Strictest();
    const size_t buffer_size = FLAGS_buffer_size != 0 ? dio::AlignUp(FLAGS_buffer_size, align) : 16 * align;
    dio::alog::info("{}: alignment {} (memory {}, offset {}), {} x {} bytes per call", FLAGS_path, align,
                    alignment->memory, alignment->offset, FLAGS_buffers, buffer_size);

    auto buffer = dio::AlignedBuffer::Allocate(buffer_size * FLAGS_buffers, align);
    if (!buffer)
    {
        dio::alog::error("allocation: {}", buffer.error().message());
        ::close(fd);
        dio::alog::stop();
        return 1;
    }

    std::vector<dio::ReadView> views;
    for (size_t i = 0; i < FLAGS_buffers; ++i)
    {
        views.push_back(buffer->ReadSlice(i * buffer_size, buffer_size));
    }

    Checksum sum{views};
    const dio::ReadLoopOptions opts{.alignment = FLAGS_direct ? align : 0};
    int rc = 0;

    if (FLAGS_async)
    {
        dio::IoContext ctx;
        auto task = dio::AsyncDriveRead(ctx, fd, views, std::ref(sum), opts);
        ctx.RunUntilDone(task);
        rc = Report(task.Result(), sum);
    }
    else
    {
        rc = Report(dio::DriveRead(fd, views, sum, opts), sum);
    }

    ::close(fd);
    dio::alog::stop();
    return rc;
}
