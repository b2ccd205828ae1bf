#include "ixport/archive/partition-exporter.h"
#include "ixport/archive/partition.h"
#include "ixport/cli/commands.h"
#include "ixport/test-utils/fake-search-backend.h"

#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <sstream>

using namespace ixport;
using namespace ixport::cli;
using namespace ixport::search;
using namespace ixport::test_utils;
namespace fs = boost::filesystem;

class CommandsTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        dir_ = make_temp_directory("ixport-cli");
    }

    void
    TearDown() override
    {
        boost::system::error_code ec;
        fs::remove_all(dir_, ec);
    }

    // Every backend built holds 1000 timestamps over one day, limit 300
    BackendFactory
    factory()
    {
        return [this](const AzureSearchOptions& options) {
            ++backends_built_;
            last_options_ = options;
            auto backend = std::make_unique<FakeSearchBackend>(
                make_field("timestamp", FieldType::DateTimeOffset), 300, 100);
            FieldInfo text{"title", "Edm.String", FieldType::Unsupported, true, true};
            backend->add_field(text);
            add_timestamp_documents(
                *backend,
                "timestamp",
                "2021-01-01T00:00:00Z",
                "2021-01-02T00:00:00Z",
                1000);
            return std::unique_ptr<SearchBackend>(std::move(backend));
        };
    }

    CommandLineOptions
    connection(const std::string& field = "timestamp") const
    {
        CommandLineOptions options;
        options.endpoint = "https://svc.search.windows.net";
        options.admin_key = "secret";
        options.index_name = "docs";
        options.field_name = field;
        return options;
    }

    std::string dir_;
    int backends_built_ = 0;
    AzureSearchOptions last_options_;
};

TEST_F(CommandsTest, GetBoundsPrintsBothBounds)
{
    std::ostringstream out;
    EXPECT_EQ(run_get_bounds(connection(), factory(), out), 0);
    EXPECT_EQ(
        out.str(),
        "Lower Bound 2021-01-01T00:00:00.000000Z\n"
        "Upper Bound 2021-01-01T23:58:33.600000Z\n");
    EXPECT_EQ(last_options_.api_key, "secret");
    EXPECT_EQ(last_options_.index_name, "docs");
}

TEST_F(CommandsTest, UnsupportedFieldFails)
{
    std::ostringstream out;
    EXPECT_EQ(run_get_bounds(connection("title"), factory(), out), 1);
    EXPECT_EQ(run_get_bounds(connection("missing"), factory(), out), 1);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CommandsTest, PartitionThenExport)
{
    auto plan_path = (fs::path(dir_) / "docs-partitions.json").string();

    auto options = connection();
    options.partition_path = plan_path;
    std::ostringstream out;
    ASSERT_EQ(run_partition_index(options, factory(), out), 0);

    auto plan = archive::read_partition_file(plan_path);
    EXPECT_GE(plan.partitions.size(), 4u);
    EXPECT_EQ(plan.total_document_count, 1000);
    EXPECT_EQ(plan.endpoint, "https://svc.search.windows.net");

    CommandLineOptions export_options;
    export_options.admin_key = "secret";
    export_options.partition_path = plan_path;
    export_options.export_path = (fs::path(dir_) / "out").string();
    export_options.page_size = 100;
    export_options.concurrent_partitions = 3;
    ASSERT_EQ(run_export_partitions(export_options, factory(), out), 0);

    // The exporter connects to the service recorded in the plan
    EXPECT_EQ(last_options_.endpoint, "https://svc.search.windows.net");
    EXPECT_EQ(last_options_.index_name, "docs");

    std::size_t lines = 0;
    for (const auto& p : plan.partitions)
    {
        lines += read_lines(
                     (fs::path(export_options.export_path) /
                      archive::export_file_name("docs", p.index))
                         .string())
                     .size();
    }
    EXPECT_EQ(lines, 1000u);
}

TEST_F(CommandsTest, ExplicitBoundsNarrowThePlan)
{
    auto plan_path = (fs::path(dir_) / "narrow.json").string();
    auto options = connection();
    options.partition_path = plan_path;
    options.lower_bound = "2021-01-01T06:00:00Z";
    options.upper_bound = "2021-01-01T12:00:00Z";

    std::ostringstream out;
    ASSERT_EQ(run_partition_index(options, factory(), out), 0);

    auto plan = archive::read_partition_file(plan_path);
    ASSERT_FALSE(plan.partitions.empty());
    EXPECT_EQ(
        format_bound(plan.partitions.front().lower_bound),
        "2021-01-01T06:00:00.000000Z");
    EXPECT_EQ(
        format_bound(plan.partitions.back().upper_bound),
        "2021-01-01T12:00:00.000000Z");
    EXPECT_LT(plan.total_document_count, 1000);
}

TEST_F(CommandsTest, MalformedBoundFails)
{
    auto options = connection();
    options.partition_path = (fs::path(dir_) / "bad.json").string();
    options.lower_bound = "first thing monday";

    std::ostringstream out;
    EXPECT_EQ(run_partition_index(options, factory(), out), 1);
    EXPECT_FALSE(fs::exists(*options.partition_path));
    EXPECT_EQ(backends_built_, 0);
}

TEST_F(CommandsTest, MissingPartitionFileFails)
{
    CommandLineOptions options;
    options.admin_key = "secret";
    options.partition_path = (fs::path(dir_) / "none.json").string();

    std::ostringstream out;
    EXPECT_EQ(run_export_partitions(options, factory(), out), 1);
    EXPECT_EQ(backends_built_, 0);
}

TEST_F(CommandsTest, ConflictingSelectionBuildsNoBackend)
{
    std::vector<std::string> args{
        "ixport",
        "--partition-path",
        "p.json",
        "--admin-key",
        "k",
        "--include-partition",
        "0",
        "--exclude-partition",
        "1"};
    std::vector<char*> argv;
    for (auto& a : args)
        argv.push_back(a.data());

    EXPECT_EQ(
        dispatch(
            Subcommand::ExportPartitions,
            static_cast<int>(argv.size()),
            argv.data(),
            factory()),
        1);
    EXPECT_EQ(backends_built_, 0);
}
