#include <gtest/gtest.h>

#include <algorithm>

#include "adapters/fs.hpp"
#include "core/copy_worker/copy_worker.hpp"
#include "test_utils.hpp"

using namespace parcp;
using parcp::core::ByteRange;
using parcp::core::WorkerContext;

class CopyWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_ = test::random_bytes(10'000, 7);
        test::write_file(dir_ / "src.bin", data_);

        auto src = adapters::fs::open_source(dir_ / "src.bin");
        ASSERT_TRUE(src.has_value());
        source_ = std::move(*src);

        auto dst = adapters::fs::create_destination(dir_ / "dst.bin");
        ASSERT_TRUE(dst.has_value());
        destination_ = std::move(*dst);
        ASSERT_TRUE(adapters::fs::set_length(destination_, data_.size()).has_value());
    }

    auto context(std::size_t buffer_size) -> WorkerContext {
        return WorkerContext{
            .source = source_,
            .destination = destination_,
            .buffer_size = buffer_size,
            .progress = progress_,
            .cancel = cancel_,
        };
    }

    test::TempDir dir_;
    std::vector<char> data_;
    adapters::fs::FileHandle source_;
    adapters::fs::FileHandle destination_;
    core::ProgressCounter progress_{0};
    infra::CancellationToken cancel_;
};

TEST_F(CopyWorkerTest, CopiesOnlyItsRange)
{
    auto report = core::copy_range(ByteRange{1000, 4500}, context(1024));
    ASSERT_TRUE(report.has_value()) << report.error().message;

    EXPECT_EQ(report->bytes, 3500u);
    EXPECT_EQ(report->reads, 4u);   // 1024 * 3 + 428
    EXPECT_EQ(report->writes, 4u);
    EXPECT_EQ(progress_.load(), 3500u);

    auto copied = test::read_file(dir_ / "dst.bin");
    ASSERT_EQ(copied.size(), data_.size());
    EXPECT_TRUE(std::equal(copied.begin() + 1000, copied.begin() + 4500, data_.begin() + 1000));
    // Вне диапазона файл назначения остался нулевым после ftruncate
    EXPECT_TRUE(std::all_of(copied.begin(), copied.begin() + 1000, [](char c) { return c == 0; }));
    EXPECT_TRUE(std::all_of(copied.begin() + 4500, copied.end(), [](char c) { return c == 0; }));
}

TEST_F(CopyWorkerTest, EmptyRangeDoesNoIo)
{
    auto report = core::copy_range(ByteRange{500, 500}, context(1024));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->bytes, 0u);
    EXPECT_EQ(report->reads, 0u);
    EXPECT_EQ(report->writes, 0u);
    EXPECT_EQ(progress_.load(), 0u);
}

TEST_F(CopyWorkerTest, RangePastEndOfSourceIsShortRead)
{
    // Источник "укоротился": диапазон заходит за его конец
    auto report = core::copy_range(ByteRange{9000, 12'000}, context(4096));
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, infra::ErrorCode::ShortRead);
    EXPECT_EQ(progress_.load(), 1000u);
}

TEST_F(CopyWorkerTest, CancelledBeforeFirstIteration)
{
    cancel_.request_cancel();
    auto report = core::copy_range(ByteRange{0, 10'000}, context(1024));
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, infra::ErrorCode::Cancelled);
    EXPECT_EQ(progress_.load(), 0u);
}

TEST_F(CopyWorkerTest, WriteFailureIsIoError)
{
    // Дескриптор только на чтение: pwrite вернёт EBADF
    auto read_only = adapters::fs::open_source(dir_ / "dst.bin");
    ASSERT_TRUE(read_only.has_value());

    WorkerContext ctx{
        .source = source_,
        .destination = *read_only,
        .buffer_size = 1024,
        .progress = progress_,
        .cancel = cancel_,
    };
    auto report = core::copy_range(ByteRange{0, 2048}, ctx);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, infra::ErrorCode::IOError);
    EXPECT_EQ(progress_.load(), 0u);
}
