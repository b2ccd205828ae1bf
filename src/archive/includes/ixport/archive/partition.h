#pragma once

#include "ixport/search/orderable-value.h"
#include "ixport/search/search-backend.h"
#include <boost/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace ixport::archive {

/**
 * A contiguous slice of the ordering field's value range
 *
 * Covers [lower_bound, upper_bound), except for the final partition of a
 * plan which covers [lower_bound, upper_bound] so the maximum value is
 * included. document_count never exceeds the backend's page-depth limit.
 */
struct Partition
{
    int index;
    search::OrderableValue lower_bound;
    search::OrderableValue upper_bound;
    std::int64_t document_count;
};

/**
 * Persisted partition plan
 *
 * Written once by partition-index, read-only afterwards.
 */
struct PartitionFile
{
    std::string endpoint;
    std::string index_name;
    std::string field_name;
    search::FieldType field_type = search::FieldType::DateTimeOffset;
    std::int64_t total_document_count = 0;
    std::vector<Partition> partitions;

    bool
    is_last(const Partition& partition) const
    {
        return !partitions.empty() &&
            partition.index == partitions.back().index;
    }

    /** Filter selecting exactly the documents of one partition */
    search::RangeFilter
    filter_for(const Partition& partition) const
    {
        return search::RangeFilter::between(
            field_name,
            partition.lower_bound,
            partition.upper_bound,
            is_last(partition));
    }
};

/**
 * Check that partition i carries index i, so indices double as positions
 *
 * @throws PartitionFileError naming the first out-of-place index
 */
void
check_partition_indices(const PartitionFile& file);

/** Default partition file name: <index>-partitions.json */
std::string
default_partition_path(const std::string& index_name);

boost::json::value
to_json(const PartitionFile& file);

/**
 * Rebuild a plan from its JSON form
 *
 * @throws PartitionFileError on missing or mistyped members
 * @throws InvalidBoundFormatError on malformed bound text
 */
PartitionFile
partition_file_from_json(const boost::json::value& jv);

/**
 * Write a plan, replacing any existing file
 *
 * @throws PartitionFileError if the file cannot be written
 */
void
write_partition_file(const PartitionFile& file, const std::string& path);

/**
 * Load a plan
 *
 * @throws PartitionFileError if the file cannot be read or parsed
 * @throws InvalidBoundFormatError on malformed bound text
 */
PartitionFile
read_partition_file(const std::string& path);

}  // namespace ixport::archive
