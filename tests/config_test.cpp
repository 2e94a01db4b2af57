#include <gtest/gtest.h>

#include <cstdlib>

#include "cli/args_parser/args_parser.hpp"
#include "infra/config/config.hpp"
#include "test_support.hpp"

using ferry::infra::Config;
using ferry::testing::TempDir;
using ferry::testing::write_file;

TEST(ConfigTest, LoadsAllKeys)
{
    TempDir dir;
    write_file(dir / ".ferry.yaml",
               "compression_level: 9\n"
               "member_prefix: data\n"
               "follow_symlinks: true\n"
               "exclude: ['.*\\.tmp', 'core\\..*']\n"
               "progress: false\n"
               "quiet: true\n"
               "store_root: /mnt/shared\n"
               "temp_path: /scratch\n"
               "required_env: [CONDA_PREFIX]\n");

    auto cfg = ferry::infra::load_config_from(dir / ".ferry.yaml");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->compression_level, 9);
    EXPECT_EQ(cfg->member_prefix, "data");
    EXPECT_TRUE(cfg->follow_symlinks);
    EXPECT_EQ(cfg->exclude_patterns.size(), 2u);
    EXPECT_FALSE(cfg->progress);
    EXPECT_TRUE(cfg->quiet);
    EXPECT_EQ(cfg->store_root, "/mnt/shared");
    EXPECT_EQ(cfg->temp_path, "/scratch");
    EXPECT_EQ(cfg->required_env, std::vector<std::string>{"CONDA_PREFIX"});
}

TEST(ConfigTest, RejectsOutOfRangeCompressionLevel)
{
    TempDir dir;
    write_file(dir / "c.yaml", "compression_level: 12\n");
    EXPECT_FALSE(ferry::infra::load_config_from(dir / "c.yaml").has_value());
}

TEST(ConfigTest, MalformedYamlIsAnError)
{
    TempDir dir;
    write_file(dir / "c.yaml", "exclude: [unterminated\n");
    EXPECT_FALSE(ferry::infra::load_config_from(dir / "c.yaml").has_value());
}

TEST(ConfigTest, CliValuesOverrideFileValues)
{
    Config file;
    file.compression_level = 1;
    file.store_root = "/file/store";
    file.exclude_patterns = {"a"};

    Config cli;
    cli.compression_level = 8;
    cli.progress = false;

    file.merge_with(cli);
    EXPECT_EQ(file.compression_level, 8);
    EXPECT_EQ(file.store_root, "/file/store");
    EXPECT_EQ(file.exclude_patterns, std::vector<std::string>{"a"});
    EXPECT_FALSE(file.progress);
}

TEST(ConfigTest, RequiredEnvironmentIsChecked)
{
    Config cfg;
    cfg.required_env = {"FERRY_TEST_SURELY_UNSET_VARIABLE"};
    ::unsetenv("FERRY_TEST_SURELY_UNSET_VARIABLE");
    auto missing = ferry::infra::check_required_env(cfg);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ferry::infra::ErrorCode::PreconditionFailed);

    ::setenv("FERRY_TEST_SURELY_UNSET_VARIABLE", "/opt/env", 1);
    EXPECT_TRUE(ferry::infra::check_required_env(cfg).has_value());
    ::unsetenv("FERRY_TEST_SURELY_UNSET_VARIABLE");
}

TEST(ArgsParserTest, PackWithGlobalOptions)
{
    const char* argv[] = {"ferry", "-q", "pack", "--source", "/data/run1", "--archive", "/tmp/run1.tar.gz",
                          "--exclude", ".*\\.tmp", "--compression-level", "3", "--no-progress"};
    auto args = ferry::args_parser::parse_args(static_cast<int>(std::size(argv)), argv);
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->command, ferry::args_parser::Command::Pack);
    EXPECT_EQ(args->source, "/data/run1");
    EXPECT_EQ(args->archive, "/tmp/run1.tar.gz");
    EXPECT_TRUE(args->quiet);
    EXPECT_EQ(args->compression_level, 3);
    EXPECT_EQ(args->progress, false);
    EXPECT_EQ(args->exclude_patterns, std::vector<std::string>{".*\\.tmp"});

    auto cfg = ferry::infra::config_from_cli(*args);
    EXPECT_FALSE(cfg.progress);
    EXPECT_EQ(cfg.compression_level, 3);
}

TEST(ArgsParserTest, DownloadFlags)
{
    const char* argv[] = {"ferry", "download", "-s", "bucket:k.tar.gz", "-d", "/tmp/out",
                          "--extract", "--delete-remote"};
    auto args = ferry::args_parser::parse_args(static_cast<int>(std::size(argv)), argv);
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->command, ferry::args_parser::Command::Download);
    EXPECT_TRUE(args->extract);
    EXPECT_TRUE(args->delete_remote);
    EXPECT_FALSE(args->overwrite);
    EXPECT_FALSE(args->progress.has_value());
}

TEST(ArgsParserTest, MissingSubcommandFails)
{
    const char* argv[] = {"ferry"};
    EXPECT_FALSE(ferry::args_parser::parse_args(1, argv).has_value());
}

TEST(ArgsParserTest, EmptyPrefixIsKept)
{
    const char* argv[] = {"ferry", "--prefix", "", "pack", "-s", "/data/run1", "-a", "/tmp/run1.tar.gz"};
    auto args = ferry::args_parser::parse_args(static_cast<int>(std::size(argv)), argv);
    ASSERT_TRUE(args.has_value());
    ASSERT_TRUE(args->prefix.has_value());
    EXPECT_EQ(*args->prefix, "");

    const char* no_prefix[] = {"ferry", "pack", "-s", "/data/run1", "-a", "/tmp/run1.tar.gz"};
    auto defaults = ferry::args_parser::parse_args(static_cast<int>(std::size(no_prefix)), no_prefix);
    ASSERT_TRUE(defaults.has_value());
    EXPECT_FALSE(defaults->prefix.has_value());
}
