#include "ixport/cli/arg-options.h"
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace ixport::cli;

namespace {

// Owns argument storage for the duration of one parse
class Argv
{
public:
    Argv(std::initializer_list<std::string> args) : args_(args)
    {
        for (auto& a : args_)
            ptrs_.push_back(a.data());
    }

    int
    argc() const
    {
        return static_cast<int>(ptrs_.size());
    }

    char**
    argv()
    {
        return ptrs_.data();
    }

private:
    std::vector<std::string> args_;
    std::vector<char*> ptrs_;
};

}  // namespace

class ArgOptionsTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        unsetenv(ADMIN_KEY_ENV);
    }

    void
    TearDown() override
    {
        unsetenv(ADMIN_KEY_ENV);
    }
};

TEST_F(ArgOptionsTest, GetBoundsRequiresConnectionOptions)
{
    Argv args{
        "ixport",
        "--endpoint",
        "https://svc.search.windows.net",
        "--admin-key",
        "secret",
        "--index-name",
        "docs",
        "--field-name",
        "timestamp"};
    auto options = parse_get_bounds_argv(args.argc(), args.argv());
    ASSERT_TRUE(options.valid) << options.error_message.value_or("");
    EXPECT_EQ(options.command, Subcommand::GetBounds);
    EXPECT_EQ(*options.endpoint, "https://svc.search.windows.net");
    EXPECT_EQ(*options.admin_key, "secret");
    EXPECT_EQ(*options.index_name, "docs");
    EXPECT_EQ(*options.field_name, "timestamp");
    EXPECT_EQ(options.log_level, "info");
}

TEST_F(ArgOptionsTest, MissingFieldNameIsInvalid)
{
    Argv args{
        "ixport",
        "--endpoint",
        "https://svc",
        "--admin-key",
        "k",
        "--index-name",
        "docs"};
    auto options = parse_get_bounds_argv(args.argc(), args.argv());
    EXPECT_FALSE(options.valid);
    ASSERT_TRUE(options.error_message.has_value());
    EXPECT_NE(options.error_message->find("--field-name"), std::string::npos);
}

TEST_F(ArgOptionsTest, AdminKeyFallsBackToEnvironment)
{
    setenv(ADMIN_KEY_ENV, "from-env", 1);
    Argv args{
        "ixport",
        "--endpoint",
        "https://svc",
        "--index-name",
        "docs",
        "--field-name",
        "ts"};
    auto options = parse_get_bounds_argv(args.argc(), args.argv());
    ASSERT_TRUE(options.valid);
    EXPECT_EQ(*options.admin_key, "from-env");
}

TEST_F(ArgOptionsTest, MissingAdminKeyIsInvalid)
{
    Argv args{
        "ixport",
        "--endpoint",
        "https://svc",
        "--index-name",
        "docs",
        "--field-name",
        "ts"};
    auto options = parse_get_bounds_argv(args.argc(), args.argv());
    EXPECT_FALSE(options.valid);
}

TEST_F(ArgOptionsTest, HelpIsNotAnError)
{
    Argv args{"ixport", "--help"};
    auto options = parse_partition_index_argv(args.argc(), args.argv());
    EXPECT_TRUE(options.valid);
    EXPECT_TRUE(options.show_help);
    EXPECT_NE(options.help_text.find("--lower-bound"), std::string::npos);
}

TEST_F(ArgOptionsTest, PartitionIndexOptionalBounds)
{
    Argv args{
        "ixport",
        "--endpoint",
        "https://svc",
        "--admin-key",
        "k",
        "--index-name",
        "docs",
        "--field-name",
        "ts",
        "--lower-bound",
        "2021-01-01T00:00:00Z",
        "--partition-path",
        "plans/docs.json",
        "--log-level",
        "debug"};
    auto options = parse_partition_index_argv(args.argc(), args.argv());
    ASSERT_TRUE(options.valid) << options.error_message.value_or("");
    EXPECT_EQ(*options.lower_bound, "2021-01-01T00:00:00Z");
    EXPECT_FALSE(options.upper_bound.has_value());
    EXPECT_EQ(*options.partition_path, "plans/docs.json");
    EXPECT_EQ(options.log_level, "debug");
}

TEST_F(ArgOptionsTest, ExportDefaults)
{
    Argv args{
        "ixport", "--partition-path", "docs-partitions.json", "--admin-key", "k"};
    auto options = parse_export_partitions_argv(args.argc(), args.argv());
    ASSERT_TRUE(options.valid) << options.error_message.value_or("");
    EXPECT_EQ(options.export_path, ".");
    EXPECT_EQ(options.concurrent_partitions, 2);
    EXPECT_EQ(options.page_size, 1000);
    EXPECT_TRUE(options.include_partitions.empty());
    EXPECT_TRUE(options.exclude_partitions.empty());
}

TEST_F(ArgOptionsTest, RepeatedIncludePartitions)
{
    Argv args{
        "ixport",
        "--partition-path",
        "p.json",
        "--admin-key",
        "k",
        "--include-partition",
        "0",
        "--include-partition",
        "1"};
    auto options = parse_export_partitions_argv(args.argc(), args.argv());
    ASSERT_TRUE(options.valid) << options.error_message.value_or("");
    EXPECT_EQ(options.include_partitions, (std::vector<int>{0, 1}));
}

TEST_F(ArgOptionsTest, ConflictingSelectionIsRejected)
{
    Argv args{
        "ixport",
        "--partition-path",
        "p.json",
        "--admin-key",
        "k",
        "--include-partition",
        "0",
        "--exclude-partition",
        "1"};
    auto options = parse_export_partitions_argv(args.argc(), args.argv());
    EXPECT_FALSE(options.valid);
    ASSERT_TRUE(options.error_message.has_value());
    EXPECT_NE(
        options.error_message->find("--include-partition"), std::string::npos);
}

TEST_F(ArgOptionsTest, NonPositiveNumbersAreRejected)
{
    Argv workers{
        "ixport",
        "--partition-path",
        "p.json",
        "--admin-key",
        "k",
        "--concurrent-partitions",
        "0"};
    EXPECT_FALSE(
        parse_export_partitions_argv(workers.argc(), workers.argv()).valid);

    Argv page{
        "ixport", "--partition-path", "p.json", "--admin-key", "k", "--page-size", "-5"};
    EXPECT_FALSE(parse_export_partitions_argv(page.argc(), page.argv()).valid);
}

TEST_F(ArgOptionsTest, BadLogLevelAndUnknownOptionAreInvalid)
{
    Argv level{
        "ixport", "--partition-path", "p.json", "--admin-key", "k", "-l", "loud"};
    EXPECT_FALSE(parse_export_partitions_argv(level.argc(), level.argv()).valid);

    Argv unknown{"ixport", "--partition-path", "p.json", "--frobnicate"};
    auto options = parse_export_partitions_argv(unknown.argc(), unknown.argv());
    EXPECT_FALSE(options.valid);
    EXPECT_TRUE(options.error_message.has_value());
}
