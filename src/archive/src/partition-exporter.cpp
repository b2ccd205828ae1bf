#include "ixport/archive/partition-exporter.h"

#include <boost/filesystem.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace fs = boost::filesystem;

namespace ixport::archive {

LogPartition export_log("EXPORT");

std::string
export_file_name(const std::string& index_name, int partition_index)
{
    return index_name + "-" + std::to_string(partition_index) +
        "-documents.jsonl";
}

PartitionExporter::PartitionExporter(
    const PartitionFile& file,
    search::SearchBackend& backend,
    ExportOptions options)
    : file_(file), backend_(backend), options_(std::move(options))
{
    check_partition_indices(file_);
    if (!options_.include_partitions.empty() &&
        !options_.exclude_partitions.empty())
    {
        throw ConflictingSelectionError();
    }
    if (options_.concurrency < 1)
    {
        throw std::invalid_argument("Concurrency must be at least 1");
    }
    if (options_.page_size < 1)
    {
        throw std::invalid_argument("Page size must be at least 1");
    }
    if (options_.page_size > backend_.max_page_size())
    {
        throw std::invalid_argument(
            "Page size " + std::to_string(options_.page_size) +
            " exceeds the backend maximum of " +
            std::to_string(backend_.max_page_size()));
    }

    if (!options_.include_partitions.empty())
    {
        std::set<int> wanted(
            options_.include_partitions.begin(),
            options_.include_partitions.end());
        for (int index : wanted)
        {
            if (index < 0 ||
                index >= static_cast<int>(file_.partitions.size()))
            {
                LOGW("Ignoring unknown partition ", index);
            }
        }
        for (const auto& p : file_.partitions)
        {
            if (wanted.contains(p.index))
                selected_.push_back(p.index);
        }
    }
    else
    {
        for (const auto& p : file_.partitions)
        {
            if (!options_.exclude_partitions.contains(p.index))
                selected_.push_back(p.index);
        }
    }

    for (int index : selected_)
    {
        const auto& p = file_.partitions[index];
        if (p.document_count > backend_.max_skip())
        {
            throw PartitionFileError(
                "Partition " + std::to_string(index) + " holds " +
                std::to_string(p.document_count) +
                " documents, more than the backend can page through (" +
                std::to_string(backend_.max_skip()) + ")");
        }
    }
}

ExportSummary
PartitionExporter::export_all()
{
    auto start_time = std::chrono::steady_clock::now();

    boost::system::error_code ec;
    fs::create_directories(options_.output_directory, ec);
    if (ec)
    {
        throw IxportError(
            "Cannot create export directory " + options_.output_directory +
            ": " + ec.message());
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.assign(selected_.begin(), selected_.end());
    }
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        results_.clear();
        failures_.clear();
    }

    std::size_t worker_count = std::min<std::size_t>(
        static_cast<std::size_t>(options_.concurrency), selected_.size());
    LOGI(
        "Exporting ",
        selected_.size(),
        " of ",
        file_.partitions.size(),
        " partitions from ",
        file_.index_name,
        " with ",
        worker_count,
        " workers");

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i)
    {
        workers.emplace_back([this]() { worker(); });
    }
    for (auto& w : workers)
    {
        if (w.joinable())
            w.join();
    }

    ExportSummary summary;
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        if (!failures_.empty())
        {
            std::sort(
                failures_.begin(),
                failures_.end(),
                [](const auto& a, const auto& b) {
                    return a.partition_index() < b.partition_index();
                });
            throw ExportFailedError(std::move(failures_));
        }
        summary.partitions = std::move(results_);
    }

    std::sort(
        summary.partitions.begin(),
        summary.partitions.end(),
        [](const auto& a, const auto& b) { return a.index < b.index; });
    for (const auto& r : summary.partitions)
    {
        summary.total_documents += r.documents_written;
    }
    summary.elapsed_seconds = std::chrono::duration<double>(
                                  std::chrono::steady_clock::now() - start_time)
                                  .count();

    LOGI(
        "Exported ",
        summary.total_documents,
        " documents from ",
        summary.partitions.size(),
        " partitions in ",
        summary.elapsed_seconds,
        " seconds");
    return summary;
}

void
PartitionExporter::worker()
{
    while (true)
    {
        int index;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty())
                return;
            index = queue_.front();
            queue_.pop_front();
        }

        try
        {
            auto result = export_partition(file_.partitions[index]);
            std::lock_guard<std::mutex> lock(results_mutex_);
            results_.push_back(std::move(result));
        }
        catch (const std::exception& e)
        {
            PLOGE(export_log, "Partition ", index, " failed: ", e.what());
            std::lock_guard<std::mutex> lock(results_mutex_);
            failures_.emplace_back(index, e.what());
        }
    }
}

PartitionResult
PartitionExporter::export_partition(const Partition& partition)
{
    auto start_time = std::chrono::steady_clock::now();

    PartitionResult result;
    result.index = partition.index;
    result.output_path =
        (fs::path(options_.output_directory) /
         export_file_name(file_.index_name, partition.index))
            .string();

    std::ofstream out(result.output_path, std::ios::out | std::ios::trunc);
    if (!out.is_open())
    {
        throw std::runtime_error("Cannot open " + result.output_path);
    }

    PLOGI(
        export_log,
        "Partition ",
        partition.index,
        ": exporting ",
        partition.document_count,
        " documents to ",
        result.output_path);

    search::QueryRequest request;
    request.filter = file_.filter_for(partition);
    request.sort_field = file_.field_name;
    request.direction = search::SortDirection::Ascending;
    request.top = options_.page_size;

    // The document count bounds the walk even if the index has grown since
    // the plan was made; offsets therefore stay under the page-depth limit
    for (std::int64_t offset = 0; offset < partition.document_count;
         offset += options_.page_size)
    {
        request.skip = offset;
        auto page = backend_.query(request);
        ++result.pages_requested;

        for (const auto& doc : page)
        {
            out << boost::json::serialize(doc) << '\n';
        }
        if (!out)
        {
            throw std::runtime_error(
                "Write failed for " + result.output_path);
        }
        result.documents_written += static_cast<std::int64_t>(page.size());

        PLOGD(
            export_log,
            "Partition ",
            partition.index,
            ": offset ",
            offset,
            " returned ",
            page.size(),
            " documents");

        if (static_cast<std::int64_t>(page.size()) < options_.page_size)
            break;
    }

    out.close();
    if (!out)
    {
        throw std::runtime_error("Failed to close " + result.output_path);
    }

    if (result.documents_written != partition.document_count)
    {
        PLOGW(
            export_log,
            "Partition ",
            partition.index,
            ": expected ",
            partition.document_count,
            " documents, wrote ",
            result.documents_written);
    }

    result.elapsed_seconds = std::chrono::duration<double>(
                                 std::chrono::steady_clock::now() - start_time)
                                 .count();
    PLOGI(
        export_log,
        "Partition ",
        partition.index,
        ": wrote ",
        result.documents_written,
        " documents in ",
        result.elapsed_seconds,
        " seconds");
    return result;
}

}  // namespace ixport::archive
