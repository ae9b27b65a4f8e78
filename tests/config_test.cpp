#include <gtest/gtest.h>

#include "cli/args_parser/args_parser.hpp"
#include "infra/config/config.hpp"
#include "test_support.hpp"

using smartmig::infra::Config;
using smartmig::infra::HashAlgorithm;
using smartmig::infra::load_config;
using smartmig::test::TempDir;
using smartmig::test::write_file;

TEST(ConfigTest, DefaultsWhenNothingIsSet)
{
    Config config;
    EXPECT_FALSE(config.verify);
    EXPECT_FALSE(config.resume);
    EXPECT_TRUE(config.progress);
    EXPECT_EQ(config.checkpoint_path(), ".migration_state.json");
    EXPECT_EQ(config.log_path(), "migration.log");
    EXPECT_FALSE(config.checkpoint_interval.has_value());
}

TEST(ConfigTest, LoadsAllKeys)
{
    TempDir dir;
    write_file(dir / "smartmig.yaml",
        "verify: true\n"
        "resume: true\n"
        "progress: false\n"
        "verbose: true\n"
        "checkpoint_file: /var/tmp/state.json\n"
        "log_file: \"\"\n"
        "checkpoint_interval: 25\n"
        "chunk_size: 1048576\n"
        "hash: xxh3\n"
        "exclude:\n"
        "  - secrets\n"
        "  - \"*.bak\"\n"
        "include:\n"
        "  - keep.me\n");

    auto config = load_config(dir / "smartmig.yaml");
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_TRUE(config->verify);
    EXPECT_TRUE(config->resume);
    EXPECT_FALSE(config->progress);
    EXPECT_TRUE(config->verbose);
    EXPECT_FALSE(config->quiet);
    EXPECT_EQ(config->checkpoint_path(), "/var/tmp/state.json");
    EXPECT_EQ(config->log_path(), "");
    EXPECT_EQ(config->checkpoint_interval, 25u);
    EXPECT_EQ(config->chunk_size, 1048576u);
    EXPECT_EQ(config->hash_algorithm, HashAlgorithm::XXH3);
    EXPECT_EQ(config->exclude_patterns, (std::vector<std::string>{"secrets", "*.bak"}));
    EXPECT_EQ(config->include_patterns, std::vector<std::string>{"keep.me"});
}

TEST(ConfigTest, EmptyFileGivesDefaults)
{
    TempDir dir;
    write_file(dir / "empty.yaml", "");

    auto config = load_config(dir / "empty.yaml");
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_TRUE(config->progress);
    EXPECT_TRUE(config->exclude_patterns.empty());
}

TEST(ConfigTest, RejectsInvalidValues)
{
    TempDir dir;
    const std::vector<std::string> bad{
        "hash: md5\n",
        "checkpoint_interval: 0\n",
        "chunk_size: 0\n",
        "verify: perhaps\n",
        "- just\n- a list\n",
        "verify: [unterminated\n",
    };
    for (const auto& text : bad) {
        write_file(dir / "bad.yaml", text);
        auto config = load_config(dir / "bad.yaml");
        EXPECT_FALSE(config.has_value()) << text;
        if (!config) {
            EXPECT_NE(config.error().find("bad.yaml"), std::string::npos);
        }
    }
}

TEST(ConfigTest, MissingExplicitFileIsAnError)
{
    TempDir dir;
    EXPECT_FALSE(load_config(dir / "absent.yaml").has_value());
}

TEST(ConfigTest, MergeLetsSetValuesWin)
{
    Config file;
    file.verify = true;
    file.checkpoint_interval = 50;
    file.hash_algorithm = HashAlgorithm::XXH32;
    file.exclude_patterns = {"secrets"};

    Config cli;
    cli.progress = false;
    cli.checkpoint_file = "/tmp/job.json";
    cli.hash_algorithm = HashAlgorithm::XXH64;
    cli.exclude_patterns = {"*.bak"};

    file.merge_with(cli);
    EXPECT_TRUE(file.verify);
    EXPECT_FALSE(file.progress);
    EXPECT_EQ(file.checkpoint_interval, 50u);
    EXPECT_EQ(file.checkpoint_path(), "/tmp/job.json");
    EXPECT_EQ(file.hash_algorithm, HashAlgorithm::XXH64);
    EXPECT_EQ(file.exclude_patterns, (std::vector<std::string>{"secrets", "*.bak"}));
}

TEST(ConfigTest, FromCommandLine)
{
    smartmig::args_parser::CLIArgs args;
    args.source = "/src";
    args.destination = "/dst";
    args.resume = true;
    args.quiet = true;
    args.state_file = "job.json";
    args.log_file = "";
    args.hash = "xxh32";
    args.include = {"special.cfg"};

    const auto config = smartmig::infra::config_from_cli(args);
    EXPECT_TRUE(config.resume);
    EXPECT_FALSE(config.verify);
    EXPECT_TRUE(config.quiet);
    EXPECT_TRUE(config.progress);
    EXPECT_EQ(config.checkpoint_path(), "job.json");
    EXPECT_EQ(config.log_path(), "");
    EXPECT_EQ(config.hash_algorithm, HashAlgorithm::XXH32);
    EXPECT_EQ(config.include_patterns, std::vector<std::string>{"special.cfg"});
    EXPECT_FALSE(config.checkpoint_interval.has_value());
}
