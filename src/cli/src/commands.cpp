#include "ixport/cli/commands.h"
#include "ixport/archive/bound-finder.h"
#include "ixport/archive/partition-exporter.h"
#include "ixport/archive/partition-generator.h"
#include "ixport/archive/partition.h"
#include "ixport/core/errors.h"
#include "ixport/core/logger.h"

#include <exception>
#include <iomanip>
#include <iostream>
#include <set>
#include <utility>

namespace ixport::cli {

BackendFactory
default_backend_factory()
{
    return [](const search::AzureSearchOptions& options) {
        return std::make_unique<search::AzureSearchBackend>(options);
    };
}

search::AzureSearchOptions
make_search_options(const CommandLineOptions& options)
{
    search::AzureSearchOptions search_options;
    search_options.endpoint = options.endpoint.value_or("");
    search_options.index_name = options.index_name.value_or("");
    search_options.api_key = options.admin_key.value_or("");
    search_options.max_retries = options.max_retries;
    return search_options;
}

search::FieldInfo
resolve_field(search::SearchBackend& backend, const std::string& field_name)
{
    auto field = backend.describe_field(field_name);
    search::validate_field(field);
    LOGD(
        "Field ",
        field.name,
        " is ",
        field.type_name,
        " (sortable, filterable)");
    return field;
}

int
run_get_bounds(
    const CommandLineOptions& options,
    const BackendFactory& factory,
    std::ostream& out)
{
    try
    {
        auto backend = factory(make_search_options(options));
        auto field = resolve_field(*backend, *options.field_name);

        auto lower = archive::find_lower_bound(field, *backend);
        auto upper = archive::find_upper_bound(field, *backend);

        out << "Lower Bound " << search::format_bound(lower) << std::endl;
        out << "Upper Bound " << search::format_bound(upper) << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        LOGE("get-bounds failed: ", e.what());
        return 1;
    }
}

int
run_partition_index(
    const CommandLineOptions& options,
    const BackendFactory& factory,
    std::ostream& out)
{
    try
    {
        if (options.lower_bound)
            search::check_bound_syntax(*options.lower_bound);
        if (options.upper_bound)
            search::check_bound_syntax(*options.upper_bound);

        auto backend = factory(make_search_options(options));
        auto field = resolve_field(*backend, *options.field_name);

        // Explicit bounds are parsed with the field's type
        auto lower = options.lower_bound
            ? search::parse_bound(field.type, *options.lower_bound)
            : archive::find_lower_bound(field, *backend);
        auto upper = options.upper_bound
            ? search::parse_bound(field.type, *options.upper_bound)
            : archive::find_upper_bound(field, *backend);

        LOGI(
            "Partitioning ",
            *options.index_name,
            " on ",
            field.name,
            " from ",
            search::format_bound(lower),
            " to ",
            search::format_bound(upper));

        archive::PartitionGenerator generator(*backend, field, lower, upper);
        auto file =
            generator.generate_file(*options.endpoint, *options.index_name);

        std::string path = options.partition_path.value_or(
            archive::default_partition_path(*options.index_name));
        archive::write_partition_file(file, path);

        out << "Wrote " << file.partitions.size() << " partitions ("
            << file.total_document_count << " documents) to " << path
            << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        LOGE("partition-index failed: ", e.what());
        return 1;
    }
}

int
run_export_partitions(
    const CommandLineOptions& options,
    const BackendFactory& factory,
    std::ostream& out)
{
    try
    {
        auto file = archive::read_partition_file(*options.partition_path);
        LOGI(
            "Loaded ",
            file.partitions.size(),
            " partitions of ",
            file.index_name,
            " (",
            file.total_document_count,
            " documents) from ",
            *options.partition_path);

        archive::ExportOptions export_options;
        export_options.output_directory = options.export_path;
        export_options.concurrency = options.concurrent_partitions;
        export_options.page_size = options.page_size;
        export_options.include_partitions = options.include_partitions;
        export_options.exclude_partitions = std::set<int>(
            options.exclude_partitions.begin(),
            options.exclude_partitions.end());

        // The plan names the service and index it was computed against
        auto search_options = make_search_options(options);
        search_options.endpoint = file.endpoint;
        search_options.index_name = file.index_name;
        auto backend = factory(search_options);

        archive::PartitionExporter exporter(
            file, *backend, std::move(export_options));
        auto summary = exporter.export_all();

        for (const auto& r : summary.partitions)
        {
            out << "Partition " << r.index << ": " << r.documents_written
                << " documents -> " << r.output_path << std::endl;
        }
        out << "Exported " << summary.total_documents << " documents in "
            << std::fixed << std::setprecision(2) << summary.elapsed_seconds
            << " seconds" << std::endl;
        return 0;
    }
    catch (const ExportFailedError& e)
    {
        for (const auto& failure : e.failures())
        {
            LOGE(
                "Partition ",
                failure.partition_index(),
                " failed: ",
                failure.reason());
        }
        LOGE("export-partitions failed: ", e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        LOGE("export-partitions failed: ", e.what());
        return 1;
    }
}

int
dispatch(
    Subcommand command,
    int argc,
    char* argv[],
    const BackendFactory& factory)
{
    CommandLineOptions options;
    switch (command)
    {
        case Subcommand::GetBounds:
            options = parse_get_bounds_argv(argc, argv);
            break;
        case Subcommand::PartitionIndex:
            options = parse_partition_index_argv(argc, argv);
            break;
        case Subcommand::ExportPartitions:
            options = parse_export_partitions_argv(argc, argv);
            break;
    }

    if (options.show_help || !options.valid)
    {
        if (!options.valid && options.error_message)
        {
            std::cerr << "Error: " << *options.error_message << std::endl
                      << std::endl;
        }
        std::cout << options.help_text << std::endl;
        return options.valid ? 0 : 1;
    }

    if (!Logger::set_level(options.log_level))
    {
        Logger::set_level(LogLevel::INFO);
        std::cerr << "Unrecognized log level: " << options.log_level
                  << ", falling back to 'info'" << std::endl;
    }

    switch (command)
    {
        case Subcommand::GetBounds:
            return run_get_bounds(options, factory, std::cout);
        case Subcommand::PartitionIndex:
            return run_partition_index(options, factory, std::cout);
        case Subcommand::ExportPartitions:
            return run_export_partitions(options, factory, std::cout);
    }
    return 1;
}

}  // namespace ixport::cli
