// tests/dio/result_tests.cpp
// Tests for the error vocabulary

#include <gtest/gtest.h>

#include <cerrno>
#include <system_error>

#include "dio/result.hpp"

using namespace dio;

TEST(ResultTest, ErrnoCodesKeepNativeValue) {
    auto r = Result<int>{ErrorFromErrno(EBADF)};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().value(), EBADF);
    EXPECT_EQ(r.error().category(), std::system_category());
}

TEST(ResultTest, MakeErrorCodeAcceptsNegatedErrno) {
    EXPECT_EQ(MakeErrorCode(-EIO).value(), EIO);
    EXPECT_EQ(MakeErrorCode(EIO).value(), EIO);
}

TEST(ResultTest, ClassifyMapsErrnoToKinds) {
    EXPECT_EQ(Classify(MakeErrorCode(EINVAL)), ErrorKind::kInvalidOffsetOrAlignment);
    EXPECT_EQ(Classify(MakeErrorCode(ECANCELED)), ErrorKind::kCancelled);
    EXPECT_EQ(Classify(MakeErrorCode(EIO)), ErrorKind::kUnderlyingIo);
    EXPECT_EQ(Classify(MakeErrorCode(EBADF)), ErrorKind::kUnderlyingIo);
    EXPECT_EQ(Classify(make_error_code(Errc::kAllocationFailed)), ErrorKind::kAllocationFailed);
}

TEST(ResultTest, KernelOutOfMemoryIsUnderlyingIo) {
    const std::error_code enomem = MakeErrorCode(ENOMEM);
    EXPECT_EQ(Classify(enomem), ErrorKind::kUnderlyingIo);
    EXPECT_TRUE(enomem == ErrorKind::kUnderlyingIo);
    EXPECT_FALSE(enomem == ErrorKind::kAllocationFailed);
}

TEST(ResultTest, CodesCompareAgainstKinds) {
    const std::error_code einval = MakeErrorCode(EINVAL);
    EXPECT_TRUE(einval == ErrorKind::kInvalidOffsetOrAlignment);
    EXPECT_FALSE(einval == ErrorKind::kCancelled);

    const std::error_code alloc = Errc::kAllocationFailed;
    EXPECT_TRUE(alloc == ErrorKind::kAllocationFailed);
    EXPECT_FALSE(alloc == ErrorKind::kUnderlyingIo);
    EXPECT_STREQ(alloc.category().name(), "dio");
}

TEST(ResultTest, KindConditionHasReadableMessage) {
    const std::error_condition kind = ErrorKind::kCancelled;
    EXPECT_FALSE(kind.message().empty());
    EXPECT_STREQ(kind.category().name(), "dio.kind");
}

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
