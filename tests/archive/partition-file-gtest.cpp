#include "ixport/archive/partition.h"
#include "ixport/core/errors.h"
#include "ixport/test-utils/fake-search-backend.h"

#include <boost/filesystem.hpp>
#include <boost/json.hpp>
#include <cstdint>
#include <fstream>
#include <gtest/gtest.h>
#include <limits>

using namespace ixport;
using namespace ixport::archive;
using namespace ixport::search;
using namespace ixport::test_utils;
namespace fs = boost::filesystem;
namespace json = boost::json;

class PartitionFileTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        dir_ = make_temp_directory("ixport-partition-file");
    }

    void
    TearDown() override
    {
        boost::system::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string
    path(const std::string& name) const
    {
        return (fs::path(dir_) / name).string();
    }

    static PartitionFile
    sample_plan()
    {
        PartitionFile file;
        file.endpoint = "https://svc.search.windows.net";
        file.index_name = "docs";
        file.field_name = "timestamp";
        file.field_type = FieldType::DateTimeOffset;
        file.partitions.push_back(Partition{
            0,
            timestamp("2021-01-01T00:00:00Z"),
            timestamp("2021-01-05T12:00:00Z"),
            90000});
        file.partitions.push_back(Partition{
            1,
            timestamp("2021-01-05T12:00:00Z"),
            timestamp("2021-01-10T00:00:00.25Z"),
            80000});
        file.total_document_count = 170000;
        return file;
    }

    std::string dir_;
};

TEST_F(PartitionFileTest, WriteThenReadPreservesEveryField)
{
    auto plan = sample_plan();
    write_partition_file(plan, path("docs-partitions.json"));

    auto loaded = read_partition_file(path("docs-partitions.json"));
    EXPECT_EQ(loaded.endpoint, plan.endpoint);
    EXPECT_EQ(loaded.index_name, plan.index_name);
    EXPECT_EQ(loaded.field_name, plan.field_name);
    EXPECT_EQ(loaded.field_type, plan.field_type);
    EXPECT_EQ(loaded.total_document_count, plan.total_document_count);
    ASSERT_EQ(loaded.partitions.size(), plan.partitions.size());
    for (std::size_t i = 0; i < plan.partitions.size(); ++i)
    {
        EXPECT_EQ(loaded.partitions[i].index, plan.partitions[i].index);
        EXPECT_EQ(
            loaded.partitions[i].lower_bound, plan.partitions[i].lower_bound);
        EXPECT_EQ(
            loaded.partitions[i].upper_bound, plan.partitions[i].upper_bound);
        EXPECT_EQ(
            loaded.partitions[i].document_count,
            plan.partitions[i].document_count);
    }
}

TEST_F(PartitionFileTest, JsonUsesCamelCaseAndCanonicalBounds)
{
    auto jv = to_json(sample_plan());
    const auto& obj = jv.as_object();
    EXPECT_EQ(obj.at("indexName").as_string(), "docs");
    EXPECT_EQ(obj.at("fieldName").as_string(), "timestamp");
    EXPECT_EQ(obj.at("fieldType").as_string(), "Edm.DateTimeOffset");
    EXPECT_EQ(obj.at("totalDocumentCount").as_int64(), 170000);

    const auto& first = obj.at("partitions").as_array().at(0).as_object();
    EXPECT_EQ(first.at("lowerBound").as_string(), "2021-01-01T00:00:00.000000Z");
    EXPECT_EQ(first.at("documentCount").as_int64(), 90000);
}

TEST_F(PartitionFileTest, CreatesParentDirectories)
{
    auto nested = path("a/b/plan.json");
    write_partition_file(sample_plan(), nested);
    EXPECT_TRUE(fs::exists(nested));
}

TEST_F(PartitionFileTest, OverwritesExistingFile)
{
    auto target = path("plan.json");
    {
        std::ofstream out(target);
        out << "stale content that is much longer than nothing at all";
    }
    write_partition_file(sample_plan(), target);
    EXPECT_NO_THROW(read_partition_file(target));
}

TEST_F(PartitionFileTest, FinalPartitionFilterIsClosed)
{
    auto plan = sample_plan();
    EXPECT_FALSE(plan.is_last(plan.partitions[0]));
    EXPECT_TRUE(plan.is_last(plan.partitions[1]));
    EXPECT_FALSE(plan.filter_for(plan.partitions[0]).upper_inclusive);
    EXPECT_TRUE(plan.filter_for(plan.partitions[1]).upper_inclusive);
}

TEST_F(PartitionFileTest, MissingFieldTypeDefaultsToTimestamp)
{
    auto jv = to_json(sample_plan());
    jv.as_object().erase("fieldType");
    auto loaded = partition_file_from_json(jv);
    EXPECT_EQ(loaded.field_type, FieldType::DateTimeOffset);
    EXPECT_EQ(loaded.partitions.size(), 2u);
}

TEST_F(PartitionFileTest, IntegerPlanRoundTrips)
{
    PartitionFile plan;
    plan.endpoint = "http://localhost:8080";
    plan.index_name = "nums";
    plan.field_name = "n";
    plan.field_type = FieldType::Int64;
    plan.partitions.push_back(Partition{
        0,
        OrderableValue::from_integer(FieldType::Int64, -5),
        OrderableValue::from_integer(FieldType::Int64, 500),
        12});
    plan.total_document_count = 12;

    auto loaded = partition_file_from_json(to_json(plan));
    EXPECT_EQ(loaded.field_type, FieldType::Int64);
    EXPECT_EQ(loaded.partitions[0].lower_bound.as_integer(), -5);
    EXPECT_EQ(loaded.partitions[0].upper_bound.as_integer(), 500);
}

TEST_F(PartitionFileTest, MalformedBoundRaisesInvalidBoundFormat)
{
    auto jv = to_json(sample_plan());
    jv.as_object()["partitions"].as_array()[0].as_object()["lowerBound"] =
        "last tuesday";
    EXPECT_THROW(partition_file_from_json(jv), InvalidBoundFormatError);
}

TEST_F(PartitionFileTest, StructuralProblemsRaisePartitionFileError)
{
    EXPECT_THROW(
        partition_file_from_json(json::value(42)), PartitionFileError);

    auto missing = to_json(sample_plan());
    missing.as_object().erase("indexName");
    EXPECT_THROW(partition_file_from_json(missing), PartitionFileError);

    auto gap = to_json(sample_plan());
    gap.as_object()["partitions"].as_array()[1].as_object()["index"] = 5;
    EXPECT_THROW(partition_file_from_json(gap), PartitionFileError);

    auto bad_type = to_json(sample_plan());
    bad_type.as_object()["fieldType"] = "Edm.String";
    EXPECT_THROW(partition_file_from_json(bad_type), PartitionFileError);
}

TEST_F(PartitionFileTest, OutOfRangeIntegersRaisePartitionFileError)
{
    auto huge = to_json(sample_plan());
    huge.as_object()["totalDocumentCount"] =
        std::numeric_limits<std::uint64_t>::max();
    EXPECT_THROW(partition_file_from_json(huge), PartitionFileError);

    auto huge_count = to_json(sample_plan());
    huge_count.as_object()["partitions"].as_array()[0].as_object()
        ["documentCount"] = std::uint64_t(1) << 63;
    EXPECT_THROW(partition_file_from_json(huge_count), PartitionFileError);

    auto negative = to_json(sample_plan());
    negative.as_object()["partitions"].as_array()[0].as_object()["index"] = -1;
    EXPECT_THROW(partition_file_from_json(negative), PartitionFileError);
}

TEST(PartitionIndices, CheckAcceptsContiguousAndRejectsGaps)
{
    PartitionFile file;
    auto v = OrderableValue::from_integer(FieldType::Int64, 1);
    file.partitions.push_back(Partition{0, v, v, 1});
    file.partitions.push_back(Partition{1, v, v, 1});
    EXPECT_NO_THROW(check_partition_indices(file));

    file.partitions.push_back(Partition{3, v, v, 1});
    EXPECT_THROW(check_partition_indices(file), PartitionFileError);
}

TEST_F(PartitionFileTest, UnreadableFileRaisesPartitionFileError)
{
    EXPECT_THROW(read_partition_file(path("missing.json")), PartitionFileError);

    auto garbage = path("garbage.json");
    {
        std::ofstream out(garbage);
        out << "{ not json";
    }
    EXPECT_THROW(read_partition_file(garbage), PartitionFileError);
}

TEST(PartitionPaths, DefaultPartitionPath)
{
    EXPECT_EQ(default_partition_path("docs"), "docs-partitions.json");
}
