#pragma once

#include "ixport/archive/partition.h"
#include "ixport/core/errors.h"
#include "ixport/core/logger.h"
#include "ixport/search/search-backend.h"

#include <cstdint>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace ixport::archive {

// Partition progress at INFO, per-page tracing at DEBUG
extern LogPartition export_log;

/**
 * Configuration for an export run
 */
struct ExportOptions
{
    /** Directory receiving the .jsonl files; created if missing */
    std::string output_directory = ".";

    /** Partitions exported in parallel */
    int concurrency = 2;

    /** Documents requested per page */
    std::int64_t page_size = 1000;

    /** Only these partitions, when non-empty */
    std::vector<int> include_partitions;

    /** All partitions but these, when non-empty */
    std::set<int> exclude_partitions;
};

/**
 * Outcome of one exported partition
 */
struct PartitionResult
{
    int index = 0;
    std::int64_t documents_written = 0;
    std::int64_t pages_requested = 0;
    std::string output_path;
    double elapsed_seconds = 0.0;
};

/**
 * Outcome of a successful export run
 */
struct ExportSummary
{
    /** One entry per exported partition, ordered by index */
    std::vector<PartitionResult> partitions;
    std::int64_t total_documents = 0;
    double elapsed_seconds = 0.0;
};

/** <index>-<partition>-documents.jsonl */
std::string
export_file_name(const std::string& index_name, int partition_index);

/**
 * Exports the selected partitions of a plan with bounded concurrency
 *
 * A pool of at most `concurrency` workers takes partitions from a shared
 * queue. Each worker pages through one partition at a time, in ascending
 * offset order, writing one JSON document per line to that partition's own
 * file. A failing partition does not stop the others; failures are collected
 * and reported together once every worker has finished.
 */
class PartitionExporter
{
public:
    /**
     * Validates the options and resolves the selection; no remote calls
     *
     * @throws ConflictingSelectionError if both include and exclude lists
     * are non-empty
     * @throws std::invalid_argument on a non-positive concurrency or page
     * size, or a page size above the backend's maximum
     * @throws PartitionFileError if a selected partition holds more
     * documents than the backend can page through
     */
    PartitionExporter(
        const PartitionFile& file,
        search::SearchBackend& backend,
        ExportOptions options);

    /** Indices that export_all() will process, ascending */
    const std::vector<int>&
    selected() const
    {
        return selected_;
    }

    /**
     * Export every selected partition
     *
     * @throws ExportFailedError listing every failed partition, after all
     * partitions have been attempted
     */
    ExportSummary
    export_all();

    /**
     * Export a single partition, overwriting its output file
     *
     * @throws on any remote or I/O failure
     */
    PartitionResult
    export_partition(const Partition& partition);

private:
    void
    worker();

    const PartitionFile& file_;
    search::SearchBackend& backend_;
    ExportOptions options_;
    std::vector<int> selected_;

    std::mutex queue_mutex_;
    std::deque<int> queue_;

    std::mutex results_mutex_;
    std::vector<PartitionResult> results_;
    std::vector<PartitionExportError> failures_;
};

}  // namespace ixport::archive
