#include <gtest/gtest.h>

#include <cerrno>
#include "infra/error_handler/error.hpp"

using namespace parcp::infra;

TEST(ErrorTest, ExitCodes)
{
    EXPECT_EQ(make_error(ErrorCode::InputNotFound, "x").to_exit_code(), 1);
    EXPECT_EQ(make_error(ErrorCode::OutputCreateFailed, "x").to_exit_code(), 1);
    EXPECT_EQ(make_error(ErrorCode::ContentMismatch, "x").to_exit_code(), 1);
    EXPECT_EQ(make_error(ErrorCode::ShortRead, "x").to_exit_code(), 1);
    EXPECT_EQ(make_error(ErrorCode::Cancelled, "x").to_exit_code(), 130);
}

TEST(ErrorTest, ClockErrorIsNotFatal)
{
    EXPECT_FALSE(make_error(ErrorCode::ClockError, "clock").is_fatal());
    EXPECT_TRUE(make_error(ErrorCode::IOError, "io").is_fatal());
}

TEST(ErrorTest, CapturesCallSite)
{
    const auto line = __LINE__ + 1;
    auto err = make_error(ErrorCode::IOError, "boom");
    EXPECT_EQ(err.line, static_cast<int>(line));
    EXPECT_NE(err.file.find("error_test.cpp"), std::string::npos);
    EXPECT_STREQ(err.what(), "boom");
}

TEST(ErrorTest, ErrnoTextAppended)
{
    auto err = make_errno_error(ErrorCode::IOError, "pread", ENOENT);
    EXPECT_EQ(err.message.rfind("pread: ", 0), 0u);
    EXPECT_GT(err.message.size(), std::string("pread: ").size());
}

TEST(ErrorTest, CodeNames)
{
    EXPECT_EQ(to_string(ErrorCode::ShortRead), "ShortRead");
    EXPECT_EQ(to_string(ErrorCode::ContentMismatch), "ContentMismatch");
}
