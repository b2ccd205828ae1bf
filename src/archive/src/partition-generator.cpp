#include "ixport/archive/partition-generator.h"
#include "ixport/core/errors.h"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace ixport::archive {

LogPartition partition_log("PARTITION");

namespace {

struct PendingRange
{
    search::OrderableValue lower;
    search::OrderableValue upper;
    bool upper_inclusive;
};

}  // namespace

PartitionGenerator::PartitionGenerator(
    search::SearchBackend& backend,
    search::FieldInfo field,
    search::OrderableValue lower,
    search::OrderableValue upper)
    : backend_(backend)
    , field_(std::move(field))
    , lower_(std::move(lower))
    , upper_(std::move(upper))
    , domain_(search::domain_for(field_.type))
    , limit_(backend.max_skip())
{
    if (lower_.type() != field_.type || upper_.type() != field_.type)
    {
        throw std::invalid_argument(
            "Bounds must be of the field's type " +
            search::field_type_name(field_.type));
    }
    if (upper_ < lower_)
    {
        throw std::invalid_argument(
            "Lower bound " + domain_.format(lower_) +
            " is greater than upper bound " + domain_.format(upper_));
    }
    if (limit_ < 1)
    {
        throw std::invalid_argument("Backend page-depth limit must be positive");
    }
}

std::vector<Partition>
PartitionGenerator::generate()
{
    stats_ = GeneratorStats{};
    auto start_time = std::chrono::steady_clock::now();

    std::vector<Partition> partitions;
    std::vector<PendingRange> pending;
    pending.push_back(PendingRange{lower_, upper_, true});

    while (!pending.empty())
    {
        PendingRange range = std::move(pending.back());
        pending.pop_back();

        auto filter = search::RangeFilter::between(
            field_.name, range.lower, range.upper, range.upper_inclusive);
        std::int64_t count = backend_.count(filter);
        if (stats_.count_queries++ == 0)
        {
            stats_.root_count = count;
            LOGI(
                "Range ",
                domain_.format(range.lower),
                " - ",
                domain_.format(range.upper),
                " holds ",
                count,
                " documents (limit ",
                limit_,
                " per partition)");
        }

        if (count <= limit_)
        {
            PLOGD(
                partition_log,
                "Partition ",
                partitions.size(),
                ": [",
                domain_.format(range.lower),
                ", ",
                domain_.format(range.upper),
                range.upper_inclusive ? "]" : ")",
                " = ",
                count);
            stats_.partitioned_count += count;
            partitions.push_back(Partition{
                static_cast<int>(partitions.size()),
                std::move(range.lower),
                std::move(range.upper),
                count});
            continue;
        }

        auto mid = domain_.bisect(range.lower, range.upper);
        if (!(range.lower < mid && mid < range.upper))
        {
            throw UnsplittablePartitionError(
                domain_.format(range.lower),
                domain_.format(range.upper),
                count,
                limit_);
        }

        PLOGD(
            partition_log,
            "Splitting [",
            domain_.format(range.lower),
            ", ",
            domain_.format(range.upper),
            range.upper_inclusive ? "]" : ")",
            " (",
            count,
            " documents) at ",
            domain_.format(mid));
        ++stats_.splits;

        // Right half first so the left half is examined next
        pending.push_back(
            PendingRange{mid, std::move(range.upper), range.upper_inclusive});
        pending.push_back(PendingRange{std::move(range.lower), mid, false});
    }

    auto elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start_time)
                       .count();
    LOGI(
        "Generated ",
        partitions.size(),
        " partitions from ",
        stats_.count_queries,
        " count queries in ",
        elapsed,
        " seconds");
    return partitions;
}

PartitionFile
PartitionGenerator::generate_file(
    const std::string& endpoint,
    const std::string& index_name)
{
    PartitionFile file;
    file.endpoint = endpoint;
    file.index_name = index_name;
    file.field_name = field_.name;
    file.field_type = field_.type;
    file.partitions = generate();
    file.total_document_count = stats_.partitioned_count;

    if (stats_.partitioned_count != stats_.root_count)
    {
        LOGW(
            "Partition counts sum to ",
            stats_.partitioned_count,
            " but the whole range held ",
            stats_.root_count,
            " documents; the index changed while partitioning");
    }
    return file;
}

}  // namespace ixport::archive
