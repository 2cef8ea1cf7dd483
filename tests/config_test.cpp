#include <gtest/gtest.h>

#include "cli/args_parser/args_parser.hpp"
#include "infra/config/config.hpp"
#include "test_utils.hpp"

using namespace parcp;

TEST(ConfigTest, DefaultsWhenUnset)
{
    infra::Config cfg;
    EXPECT_EQ(cfg.worker_count(), infra::DEFAULT_THREADS);
    EXPECT_EQ(cfg.transfer_buffer_size(), 1024u * 1024);
    EXPECT_EQ(cfg.verify_chunk(), 10u * 1024 * 1024);
    EXPECT_EQ(cfg.small_file_limit(), 1024u * 1024);
    EXPECT_EQ(cfg.progress_interval(), std::chrono::milliseconds(50));
    EXPECT_EQ(cfg.io_timeout().count(), 0);
    EXPECT_TRUE(cfg.validate().has_value());
}

TEST(ConfigTest, LoadsYamlFile)
{
    test::TempDir dir;
    test::write_text(dir / "parcp.yaml",
        "threads: 6\n"
        "buffer_size: 65536\n"
        "verify_chunk_size: 1048576\n"
        "small_file_threshold: 0\n"
        "io_timeout_ms: 2500\n"
        "verify: true\n"
        "fail_fast: true\n"
        "continue_on_error: false\n"
        "log_level: debug\n"
        "exclude:\n"
        "  - '.*\\.tmp'\n");

    auto cfg = infra::load_config_from_file(dir / "parcp.yaml");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->worker_count(), 6u);
    EXPECT_EQ(cfg->transfer_buffer_size(), 65536u);
    EXPECT_EQ(cfg->verify_chunk(), 1048576u);
    EXPECT_EQ(cfg->small_file_limit(), 0u);
    EXPECT_EQ(cfg->io_timeout(), std::chrono::milliseconds(2500));
    EXPECT_TRUE(cfg->verify);
    EXPECT_TRUE(cfg->fail_fast);
    EXPECT_FALSE(cfg->continue_on_error);
    EXPECT_EQ(cfg->log_level, "debug");
    ASSERT_EQ(cfg->exclude_patterns.size(), 1u);
    EXPECT_EQ(cfg->exclude_patterns[0], ".*\\.tmp");
}

TEST(ConfigTest, MalformedYamlIsError)
{
    test::TempDir dir;
    test::write_text(dir / "bad.yaml", "threads: [1, 2\n");
    EXPECT_FALSE(infra::load_config_from_file(dir / "bad.yaml").has_value());
}

TEST(ConfigTest, ZeroThreadsRejected)
{
    test::TempDir dir;
    test::write_text(dir / "zero.yaml", "threads: 0\n");
    auto cfg = infra::load_config_from_file(dir / "zero.yaml");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("threads"), std::string::npos);
}

TEST(ConfigTest, UnknownLogLevelRejected)
{
    infra::Config cfg;
    cfg.log_level = "loud";
    EXPECT_FALSE(cfg.validate().has_value());
    cfg.log_level = "off";
    EXPECT_TRUE(cfg.validate().has_value());
}

TEST(ConfigTest, ExplicitMissingFileIsError)
{
    test::TempDir dir;
    EXPECT_FALSE(infra::load_config_from_file(dir / "absent.yaml").has_value());
}

TEST(ConfigTest, CliOverridesFile)
{
    infra::Config file_cfg;
    file_cfg.threads = 4;
    file_cfg.buffer_size = 4096;
    file_cfg.progress = true;

    args_parser::CLIArgs args;
    args.threads = 16;
    args.verify = true;
    args.no_progress = true;
    args.stop_on_error = true;

    file_cfg.merge_with(infra::config_from_cli(args));
    EXPECT_EQ(file_cfg.worker_count(), 16u);
    EXPECT_EQ(file_cfg.transfer_buffer_size(), 4096u);
    EXPECT_TRUE(file_cfg.verify);
    EXPECT_FALSE(file_cfg.progress);
    EXPECT_FALSE(file_cfg.continue_on_error);
    EXPECT_TRUE(file_cfg.preserve_metadata);
}

TEST(ArgsParserTest, SourceDestinationAndTrailingThreads)
{
    const char* argv[] = {"parcp", "/no/such/in.bin", "/no/such/out.bin", "8", "--verify"};
    auto args = args_parser::parse_args(5, argv);
    ASSERT_TRUE(args.has_value());
    ASSERT_EQ(args->sources.size(), 1u);
    EXPECT_EQ(args->sources[0], "/no/such/in.bin");
    EXPECT_EQ(args->destination, "/no/such/out.bin");
    EXPECT_EQ(args->threads, 8u);
    EXPECT_TRUE(args->verify);
}

TEST(ArgsParserTest, ThreadsOptionAndRecursive)
{
    const char* argv[] = {"parcp", "-r", "-t", "3", "a", "b", "dest"};
    auto args = args_parser::parse_args(7, argv);
    ASSERT_TRUE(args.has_value());
    EXPECT_TRUE(args->recursive);
    EXPECT_EQ(args->threads, 3u);
    EXPECT_EQ(args->sources, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(args->destination, "dest");
}

TEST(ArgsParserTest, MissingDestinationFails)
{
    const char* argv[] = {"parcp", "only-source"};
    auto args = args_parser::parse_args(2, argv);
    ASSERT_FALSE(args.has_value());
    EXPECT_NE(args.error(), 0);
}

TEST(ArgsParserTest, HelpExitsWithZero)
{
    const char* argv[] = {"parcp", "--help"};
    auto args = args_parser::parse_args(2, argv);
    ASSERT_FALSE(args.has_value());
    EXPECT_EQ(args.error(), 0);
}
