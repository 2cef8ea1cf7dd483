#include <gtest/gtest.h>

#include <csignal>
#include "infra/cancellation.hpp"
#include "infra/interrupt.hpp"

using namespace parcp;

class InterruptTest : public ::testing::Test {
protected:
    void SetUp() override {
        infra::clear_interrupt();
        infra::install_signal_handler();
    }
    void TearDown() override {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        infra::clear_interrupt();
    }
};

TEST_F(InterruptTest, SigintSetsFlagAndRecordsSignal)
{
    ASSERT_FALSE(infra::is_interrupted());
    ASSERT_EQ(std::raise(SIGINT), 0);
    EXPECT_TRUE(infra::is_interrupted());
    EXPECT_EQ(infra::interrupt_signal(), SIGINT);
}

TEST_F(InterruptTest, SigtermCancelsEveryToken)
{
    infra::CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    ASSERT_EQ(std::raise(SIGTERM), 0);
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_EQ(infra::interrupt_signal(), SIGTERM);
}

TEST_F(InterruptTest, ClearResetsState)
{
    ASSERT_EQ(std::raise(SIGINT), 0);
    infra::clear_interrupt();
    EXPECT_FALSE(infra::is_interrupted());
    EXPECT_EQ(infra::interrupt_signal(), 0);
}
