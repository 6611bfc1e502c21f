// tests/dio/buffer_view_tests.cpp
// Tests for direction-tagged views and the list helpers

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <type_traits>
#include <vector>

#include "dio/buffer_view.hpp"

using namespace dio;

static_assert(std::is_convertible_v<ReadView, WriteView>);
static_assert(!std::is_convertible_v<WriteView, ReadView>);
static_assert(std::is_same_v<WriteView::ByteType, const std::byte>);

class BufferViewTest : public ::testing::Test {
protected:
    std::array<std::byte, 4096> a_{};
    std::array<std::byte, 4096> b_{};
    std::array<std::byte, 512> c_{};
};

TEST_F(BufferViewTest, TotalLengthSumsViews) {
    std::array views{ReadView{a_}, ReadView{b_}, ReadView{c_}};
    EXPECT_EQ(TotalLength(views), 4096u + 4096u + 512u);

    std::vector<WriteView> none;
    EXPECT_EQ(TotalLength(none), 0u);
}

TEST_F(BufferViewTest, DistributeFillsInListOrder) {
    std::array views{ReadView{a_}, ReadView{b_}};

    EXPECT_EQ(Distribute(views, 5000), (std::vector<size_t>{4096, 904}));
    EXPECT_EQ(Distribute(views, 576), (std::vector<size_t>{576, 0}));
    EXPECT_EQ(Distribute(views, 8192), (std::vector<size_t>{4096, 4096}));
    EXPECT_EQ(Distribute(views, 0), (std::vector<size_t>{0, 0}));
}

TEST_F(BufferViewTest, DistributeSkipsEmptyViews) {
    std::array views{ReadView{a_}, ReadView{}, ReadView{c_}};
    EXPECT_EQ(Distribute(views, 4200), (std::vector<size_t>{4096, 0, 104}));
}

TEST_F(BufferViewTest, TrimToLengthCutsTheTail) {
    std::array views{WriteView{ReadView{a_}}, WriteView{ReadView{b_}}};

    auto trimmed = TrimToLength(views, 5000);
    ASSERT_EQ(trimmed.size(), 2u);
    EXPECT_EQ(trimmed[0].size(), 4096u);
    EXPECT_EQ(trimmed[1].size(), 904u);
    EXPECT_EQ(trimmed[1].data(), b_.data());

    auto one = TrimToLength(views, 4096);
    ASSERT_EQ(one.size(), 1u);

    EXPECT_TRUE(TrimToLength(views, 0).empty());
    EXPECT_EQ(TrimToLength(views, 1'000'000).size(), 2u);
}

TEST_F(BufferViewTest, FirstClampsToSize) {
    ReadView v{c_};
    EXPECT_EQ(v.First(100).size(), 100u);
    EXPECT_EQ(v.First(10'000).size(), 512u);
    EXPECT_EQ(v.First(0).size(), 0u);
    EXPECT_TRUE(v.First(0).empty());
}

TEST_F(BufferViewTest, ToIovecKeepsAddressAndLength) {
    const ReadView v{a_.data() + 8, 100};
    const iovec io = v.ToIovec();
    EXPECT_EQ(io.iov_base, static_cast<void*>(a_.data() + 8));
    EXPECT_EQ(io.iov_len, 100u);

    const WriteView w = v;
    EXPECT_EQ(w.ToIovec().iov_base, io.iov_base);
}

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
