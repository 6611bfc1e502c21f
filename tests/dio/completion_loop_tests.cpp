// tests/dio/completion_loop_tests.cpp
// Tests for TransferCursor and the DriveRead / DriveWrite loops

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <functional>
#include <vector>

#include "dio/aligned_buffer.hpp"
#include "dio/completion_loop.hpp"
#include "dio/result.hpp"
#include "test_helpers.hpp"

using namespace dio;
using namespace dio::test;

namespace {
constexpr size_t kFileSize = 1'000'000;

/// Collects what a read loop delivers, checking offsets are contiguous.
struct Collector {
    std::span<const ReadView> views;
    std::vector<std::byte> bytes;
    std::vector<size_t> last_distribution;
    uint64_t next_offset = 0;
    bool contiguous = true;

    void operator()(uint64_t offset, size_t n) {
        contiguous = contiguous && offset == next_offset;
        next_offset = offset + n;
        last_distribution = Distribute(views, n);
        size_t left = n;
        for (const auto& v : views) {
            const size_t take = std::min(left, v.size());
            bytes.insert(bytes.end(), v.data(), v.data() + take);
            left -= take;
        }
    }
};
}  // namespace

// -----------------------------------------------------------------------------
// TransferCursor
// -----------------------------------------------------------------------------

TEST(TransferCursorTest, FullCallsKeepGoing) {
    TransferCursor cursor(4096);
    EXPECT_EQ(cursor.State(), LoopState::kNotStarted);
    EXPECT_TRUE(cursor.Advance(4096, 4096));
    EXPECT_EQ(cursor.State(), LoopState::kInProgress);
    EXPECT_EQ(cursor.Offset(), 8192u);
    EXPECT_EQ(cursor.Total(), 4096u);
}

TEST(TransferCursorTest, ShortCallEndsLoop) {
    TransferCursor cursor(0);
    cursor.Advance(4096, 4096);
    EXPECT_FALSE(cursor.Advance(4096, 576));
    EXPECT_FALSE(cursor.Active());

    const auto out = cursor.Outcome();
    EXPECT_EQ(out.state, LoopState::kShortCircuited);
    EXPECT_EQ(out.total, 4672u);
    EXPECT_EQ(out.calls, 2u);
    EXPECT_EQ(out.last_transfer, 576u);
}

TEST(TransferCursorTest, ZeroByteCallIsShort) {
    TransferCursor cursor(0);
    EXPECT_FALSE(cursor.Advance(4096, 0));
    EXPECT_EQ(cursor.State(), LoopState::kShortCircuited);
    EXPECT_EQ(cursor.Outcome().calls, 1u);
}

TEST(TransferCursorTest, LimitCompletes) {
    TransferCursor cursor(0, 8192);
    EXPECT_TRUE(cursor.Advance(4096, 4096));
    EXPECT_EQ(cursor.Remaining(), 4096u);
    EXPECT_FALSE(cursor.Advance(4096, 4096));
    EXPECT_EQ(cursor.State(), LoopState::kComplete);
}

TEST(TransferCursorTest, ZeroLimitIsCompleteImmediately) {
    TransferCursor cursor(0, 0);
    EXPECT_FALSE(cursor.Active());
    EXPECT_EQ(cursor.State(), LoopState::kComplete);
    EXPECT_FALSE(cursor.Advance(1, 1));
    EXPECT_EQ(cursor.Outcome().calls, 0u);
}

TEST(TransferCursorTest, FinishStopsActiveLoopOnly) {
    TransferCursor active(0);
    active.Finish();
    EXPECT_EQ(active.State(), LoopState::kComplete);

    TransferCursor shorted(0);
    shorted.Advance(10, 5);
    shorted.Finish();
    EXPECT_EQ(shorted.State(), LoopState::kShortCircuited);
}

// -----------------------------------------------------------------------------
// DriveRead
// -----------------------------------------------------------------------------

class DriveReadTest : public ::testing::Test {
protected:
    void SetUp() override {
        content_ = GeneratePattern(kFileSize);
        file_ = MakeDirectFile(content_);
        ASSERT_TRUE(file_.Valid());

        auto buf = AlignedBuffer::Allocate(2 * kBlock, kBlock);
        ASSERT_TRUE(buf.has_value());
        buffer_ = std::move(*buf);
    }

    std::vector<std::byte> content_;
    TestFile file_;
    AlignedBuffer buffer_;
};

TEST_F(DriveReadTest, SingleBufferReadsWholeFile) {
    std::array views{buffer_.ReadSlice(0, kBlock)};
    Collector sink{views};

    auto out = DriveRead(file_, views, sink, {.alignment = kBlock});
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(out->total, kFileSize);
    EXPECT_EQ(out->calls, 245u);
    EXPECT_EQ(out->last_transfer, 576u);
    EXPECT_EQ(out->state, LoopState::kShortCircuited);

    EXPECT_TRUE(sink.contiguous);
    ASSERT_EQ(sink.bytes.size(), kFileSize);
    EXPECT_TRUE(MatchesAt(content_, 0, sink.bytes));
}

TEST_F(DriveReadTest, TwoBuffersDistributeTheTail) {
    std::array views{buffer_.ReadSlice(0, kBlock), buffer_.ReadSlice(kBlock, kBlock)};
    Collector sink{views};

    auto out = DriveRead(file_, views, sink, {.alignment = kBlock});
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(out->total, kFileSize);
    EXPECT_EQ(out->calls, 123u);
    EXPECT_EQ(out->last_transfer, 576u);
    EXPECT_EQ(out->state, LoopState::kShortCircuited);
    EXPECT_EQ(sink.last_distribution, (std::vector<size_t>{576, 0}));
    EXPECT_TRUE(MatchesAt(content_, 0, sink.bytes));
}

TEST_F(DriveReadTest, ExactMultipleEndsWithEmptyCall) {
    const auto data = GeneratePattern(10 * kBlock, 4);
    auto file = MakeDirectFile(data);
    ASSERT_TRUE(file.Valid());

    std::array views{buffer_.ReadSlice(0, kBlock)};
    auto out = DriveRead(file, views, {.alignment = kBlock});
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(out->total, 10 * kBlock);
    EXPECT_EQ(out->calls, 11u);
    EXPECT_EQ(out->last_transfer, 0u);
    EXPECT_EQ(out->state, LoopState::kShortCircuited);
}

TEST_F(DriveReadTest, MaxBytesCompletes) {
    std::array views{buffer_.ReadSlice(0, kBlock), buffer_.ReadSlice(kBlock, kBlock)};
    Collector sink{views};

    auto out = DriveRead(file_, views, sink, {.max_bytes = 3 * kBlock, .alignment = kBlock});
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(out->state, LoopState::kComplete);
    EXPECT_EQ(out->total, 3 * kBlock);
    EXPECT_EQ(out->calls, 2u);
    EXPECT_EQ(out->last_transfer, kBlock);
    EXPECT_TRUE(MatchesAt(content_, 0, sink.bytes));
}

TEST_F(DriveReadTest, StartsAtOffset) {
    std::array views{buffer_.ReadSlice(0, kBlock)};
    const uint64_t start = AlignDown(kFileSize, kBlock);

    auto out = DriveRead(file_, views, {.offset = start, .alignment = kBlock});
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(out->calls, 1u);
    EXPECT_EQ(out->total, kFileSize - start);
}

TEST_F(DriveReadTest, NoBuffersMeansNothingToDo) {
    int calls = 0;
    auto out = DriveRead(-1, ReadList{}, [&](uint64_t, size_t) { ++calls; });
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->state, LoopState::kComplete);
    EXPECT_EQ(out->calls, 0u);
    EXPECT_EQ(calls, 0);
}

TEST_F(DriveReadTest, MisalignedStartFails) {
    std::array views{buffer_.ReadSlice(0, kBlock)};
    auto out = DriveRead(file_, views, {.offset = 100, .alignment = kBlock});
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error(), ErrorKind::kInvalidOffsetOrAlignment);
}

// -----------------------------------------------------------------------------
// DriveWrite
// -----------------------------------------------------------------------------

class DriveWriteTest : public ::testing::Test {
protected:
    void SetUp() override {
        file_ = MakeDirectFile();
        ASSERT_TRUE(file_.Valid());
    }

    TestFile file_;
};

TEST_F(DriveWriteTest, WritesBlocksOneCallEach) {
    const auto data = GeneratePattern(10 * kBlock, 2);

    auto out = DriveWrite(file_, data, {.buffer_size = kBlock, .alignment = kBlock});
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(out->state, LoopState::kComplete);
    EXPECT_EQ(out->total, 10 * kBlock);
    EXPECT_EQ(out->calls, 10u);
    EXPECT_EQ(out->last_transfer, kBlock);

    EXPECT_EQ(GetFileSize(file_.Get()), static_cast<off_t>(10 * kBlock));
    EXPECT_TRUE(MatchesAt(data, 0, ReadAllBuffered(file_.Get())));
}

TEST_F(DriveWriteTest, SeveralViewsPerCall) {
    const auto data = GeneratePattern(10 * kBlock, 6);

    auto out = DriveWrite(file_, data, {.buffer_size = kBlock, .buffer_count = 4, .alignment = kBlock});
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(out->calls, 3u);
    EXPECT_EQ(out->last_transfer, 2 * kBlock);
    EXPECT_TRUE(MatchesAt(data, 0, ReadAllBuffered(file_.Get())));
}

TEST_F(DriveWriteTest, WritesAtOffset) {
    const auto data = GeneratePattern(2 * kBlock, 8);

    auto out = DriveWrite(file_, data, {.offset = 4 * kBlock, .buffer_size = kBlock, .alignment = kBlock});
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(GetFileSize(file_.Get()), static_cast<off_t>(6 * kBlock));

    const auto on_disk = ReadAllBuffered(file_.Get());
    EXPECT_TRUE(MatchesAt(data, 0, std::span(on_disk).subspan(4 * kBlock)));
}

TEST_F(DriveWriteTest, EmptyContentCompletesWithoutCalls) {
    auto out = DriveWrite(-1, std::span<const std::byte>{});
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->state, LoopState::kComplete);
    EXPECT_EQ(out->calls, 0u);
}

TEST_F(DriveWriteTest, UnpaddedTailFailsAlignment) {
    const auto data = GeneratePattern(kBlock + 100, 1);

    auto out = DriveWrite(file_, data, {.buffer_size = kBlock, .alignment = kBlock});
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error(), ErrorKind::kInvalidOffsetOrAlignment);
    // The aligned head made it to disk before the tail was rejected.
    EXPECT_EQ(GetFileSize(file_.Get()), static_cast<off_t>(kBlock));
}

TEST_F(DriveWriteTest, UnalignedBufferSizeRejected) {
    const auto data = GeneratePattern(kBlock, 1);
    auto out = DriveWrite(file_, data, {.buffer_size = 1000, .alignment = kBlock});
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().value(), EINVAL);
}

TEST_F(DriveWriteTest, ZeroBufferCountRejected) {
    const auto data = GeneratePattern(kBlock, 1);
    auto out = DriveWrite(file_, data, {.buffer_size = kBlock, .buffer_count = 0});
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().value(), EINVAL);
}

TEST_F(DriveWriteTest, RoundTripThroughBothLoops) {
    const auto data = GeneratePattern(64 * kBlock, 13);

    auto written = DriveWrite(file_, data, {.buffer_size = 2 * kBlock, .buffer_count = 3, .alignment = kBlock});
    ASSERT_TRUE(written.has_value()) << written.error().message();
    EXPECT_EQ(written->total, data.size());

    auto buf = AlignedBuffer::Allocate(3 * kBlock, kBlock);
    ASSERT_TRUE(buf.has_value());
    std::array views{buf->ReadSlice(0, kBlock), buf->ReadSlice(kBlock, 2 * kBlock)};
    Collector sink{views};

    auto read = DriveRead(file_, views, sink, {.alignment = kBlock});
    ASSERT_TRUE(read.has_value()) << read.error().message();
    EXPECT_EQ(read->total, data.size());
    ASSERT_EQ(sink.bytes.size(), data.size());
    EXPECT_TRUE(MatchesAt(data, 0, sink.bytes));
}

// -----------------------------------------------------------------------------
// Async loops
// -----------------------------------------------------------------------------

class AsyncLoopTest : public UringTest {};

TEST_F(AsyncLoopTest, AsyncDriveReadMatchesBlockingLoop) {
    const auto content = GeneratePattern(kFileSize);
    auto file = MakeDirectFile(content);
    ASSERT_TRUE(file.Valid());

    auto buf = AlignedBuffer::Allocate(kBlock, kBlock);
    ASSERT_TRUE(buf.has_value());
    std::array views{buf->AsRead()};
    Collector sink{views};

    auto task = AsyncDriveRead(ctx(), file, views, std::ref(sink), {.alignment = kBlock});
    auto out = Run(task);
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(out->total, kFileSize);
    EXPECT_EQ(out->calls, 245u);
    EXPECT_EQ(out->last_transfer, 576u);
    EXPECT_EQ(out->state, LoopState::kShortCircuited);
    EXPECT_TRUE(sink.contiguous);
    EXPECT_TRUE(MatchesAt(content, 0, sink.bytes));
}

TEST_F(AsyncLoopTest, AsyncTwoBuffersDistributeTheTail) {
    const auto content = GeneratePattern(kFileSize);
    auto file = MakeDirectFile(content);
    ASSERT_TRUE(file.Valid());

    auto buf = AlignedBuffer::Allocate(2 * kBlock, kBlock);
    ASSERT_TRUE(buf.has_value());
    std::array views{buf->ReadSlice(0, kBlock), buf->ReadSlice(kBlock, kBlock)};
    Collector sink{views};

    auto task = AsyncDriveRead(ctx(), file, views, std::ref(sink), {.alignment = kBlock});
    auto out = Run(task);
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(out->total, kFileSize);
    EXPECT_EQ(out->calls, 123u);
    EXPECT_EQ(out->last_transfer, 576u);
    EXPECT_EQ(out->state, LoopState::kShortCircuited);
    EXPECT_EQ(sink.last_distribution, (std::vector<size_t>{576, 0}));
    EXPECT_TRUE(sink.contiguous);
    EXPECT_TRUE(MatchesAt(content, 0, sink.bytes));
}

TEST_F(AsyncLoopTest, AsyncWriteThenAsyncRead) {
    auto file = MakeDirectFile();
    ASSERT_TRUE(file.Valid());
    const auto data = GeneratePattern(10 * kBlock, 21);

    auto buf = AlignedBuffer::Allocate(2 * kBlock, kBlock);
    ASSERT_TRUE(buf.has_value());
    std::array views{buf->ReadSlice(0, kBlock), buf->ReadSlice(kBlock, kBlock)};
    Collector sink{views};

    auto test = [&]() -> Task<> {
        auto w = co_await AsyncDriveWrite(ctx(), file, data, {.buffer_size = kBlock, .alignment = kBlock});
        EXPECT_TRUE(w.has_value());
        EXPECT_EQ(w->state, LoopState::kComplete);
        EXPECT_EQ(w->calls, 10u);

        auto r = co_await AsyncDriveRead(ctx(), file, views, std::ref(sink), {.alignment = kBlock});
        EXPECT_TRUE(r.has_value());
        EXPECT_EQ(r->total, data.size());
        EXPECT_EQ(r->calls, 6u);
        EXPECT_EQ(r->last_transfer, 0u);
        co_return;
    };

    auto task = test();
    Run(task);
    EXPECT_EQ(GetFileSize(file.Get()), static_cast<off_t>(data.size()));
    EXPECT_TRUE(MatchesAt(data, 0, sink.bytes));
}

TEST_F(AsyncLoopTest, CancelledTokenStopsLoopBeforeFirstCall) {
    auto file = MakeDirectFile(GeneratePattern(4 * kBlock));
    ASSERT_TRUE(file.Valid());

    auto buf = AlignedBuffer::Allocate(kBlock, kBlock);
    ASSERT_TRUE(buf.has_value());
    std::array views{buf->AsRead()};

    CancelToken token(ctx());
    token.Cancel();

    int calls = 0;
    auto task = AsyncDriveRead(ctx(), file, views, [&](uint64_t, size_t) { ++calls; }, {}, &token);
    auto out = Run(task);
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error(), ErrorKind::kCancelled);
    EXPECT_EQ(calls, 0);
}

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
