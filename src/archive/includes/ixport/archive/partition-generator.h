#pragma once

#include "ixport/archive/partition.h"
#include "ixport/core/logger.h"
#include "ixport/search/field-info.h"
#include "ixport/search/orderable-value.h"
#include "ixport/search/search-backend.h"

#include <cstdint>
#include <string>
#include <vector>

namespace ixport::archive {

// Per-range tracing; enable with partition_log.enable(LogLevel::DEBUG)
extern LogPartition partition_log;

/**
 * Statistics collected during one generation pass
 */
struct GeneratorStats
{
    /** Count queries issued (one per range examined) */
    std::int64_t count_queries = 0;

    /** Ranges that exceeded the limit and were bisected */
    std::int64_t splits = 0;

    /** Count of the whole [lower, upper] range, from the first query */
    std::int64_t root_count = 0;

    /** Sum of the emitted partitions' counts */
    std::int64_t partitioned_count = 0;
};

/**
 * Splits [lower, upper] into partitions that each fit under the backend's
 * page-depth limit
 *
 * Ranges are counted remotely; any range above the limit is bisected and
 * both halves examined, left first, using an explicit stack so deep splits
 * never grow the call stack. Partitions are emitted in ascending order and
 * numbered 0..n-1.
 *
 * Every partition but the last is [lower, upper); the last one is
 * [lower, upper] so the maximum value itself is exported.
 */
class PartitionGenerator
{
public:
    /**
     * @throws std::invalid_argument if lower > upper or the bounds are not of
     * the field's type
     * @throws FieldValidationError if the field type cannot be partitioned
     */
    PartitionGenerator(
        search::SearchBackend& backend,
        search::FieldInfo field,
        search::OrderableValue lower,
        search::OrderableValue upper);

    /**
     * Run the bisection
     *
     * @return Partitions in ascending order, indices contiguous from 0
     * @throws UnsplittablePartitionError if a range above the limit cannot be
     * bisected any further
     */
    std::vector<Partition>
    generate();

    /**
     * Run the bisection and wrap the result into a persistable plan
     *
     * totalDocumentCount is the sum of the partitions' counts. A mismatch
     * against the whole-range count is logged; it means the collection
     * changed while the plan was being computed.
     */
    PartitionFile
    generate_file(const std::string& endpoint, const std::string& index_name);

    /** Page-depth limit in effect (the backend's max_skip) */
    std::int64_t
    document_limit() const
    {
        return limit_;
    }

    const GeneratorStats&
    stats() const
    {
        return stats_;
    }

private:
    search::SearchBackend& backend_;
    search::FieldInfo field_;
    search::OrderableValue lower_;
    search::OrderableValue upper_;
    const search::ValueDomain& domain_;
    std::int64_t limit_;
    GeneratorStats stats_;
};

}  // namespace ixport::archive
