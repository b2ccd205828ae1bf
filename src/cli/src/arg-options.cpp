#include "ixport/cli/arg-options.h"
#include "ixport/core/errors.h"

#include <boost/program_options.hpp>
#include <cstdlib>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;

namespace ixport::cli {

namespace {

void
add_common_options(po::options_description& desc)
{
    desc.add_options()("help,h", "Display this help message")(
        "log-level,l",
        po::value<std::string>()->default_value("info"),
        "Log level (error, warn, info, debug)")(
        "max-retries",
        po::value<int>()->default_value(3),
        "Extra attempts for a failed remote request (throttling, 5xx, "
        "network errors)");
}

void
add_service_options(po::options_description& desc, bool with_index)
{
    if (with_index)
    {
        desc.add_options()(
            "endpoint",
            po::value<std::string>(),
            "Endpoint of the search service to export data from")(
            "index-name",
            po::value<std::string>(),
            "Name of the index to export data from")(
            "field-name",
            po::value<std::string>(),
            "Name of field used to partition the index data. This field "
            "must be filterable and sortable.");
    }
    desc.add_options()(
        "admin-key",
        po::value<std::string>(),
        "Admin key to the search service (default: $IXPORT_ADMIN_KEY)");
}

bool
fail(CommandLineOptions& options, const std::string& message)
{
    options.valid = false;
    options.error_message = message;
    return false;
}

bool
require(
    CommandLineOptions& options,
    const po::variables_map& vm,
    const char* name,
    std::optional<std::string>& target)
{
    if (!vm.count(name))
    {
        return fail(
            options,
            std::string("No value specified for --") + name);
    }
    target = vm[name].as<std::string>();
    return true;
}

bool
read_common(CommandLineOptions& options, const po::variables_map& vm)
{
    std::string level = vm["log-level"].as<std::string>();
    if (level != "error" && level != "warn" && level != "info" &&
        level != "debug")
    {
        return fail(
            options, "Log level must be one of: error, warn, info, debug");
    }
    options.log_level = level;

    options.max_retries = vm["max-retries"].as<int>();
    if (options.max_retries < 0)
    {
        return fail(options, "--max-retries must not be negative");
    }

    if (vm.count("admin-key"))
    {
        options.admin_key = vm["admin-key"].as<std::string>();
    }
    else if (const char* env = std::getenv(ADMIN_KEY_ENV); env && *env)
    {
        options.admin_key = std::string(env);
    }
    else
    {
        return fail(
            options,
            std::string("No admin key specified (--admin-key or $") +
                ADMIN_KEY_ENV + ")");
    }
    return true;
}

// Shared driver: parse, handle --help, then hand the map to `extract`
CommandLineOptions
run_parser(
    int argc,
    char* argv[],
    Subcommand command,
    const po::options_description& desc,
    const std::string& usage,
    const std::function<bool(CommandLineOptions&, const po::variables_map&)>&
        extract)
{
    CommandLineOptions options;
    options.command = command;

    std::ostringstream help_stream;
    help_stream << usage << std::endl << desc << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        if (!read_common(options, vm))
            return options;
        extract(options, vm);
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }

    return options;
}

}  // namespace

CommandLineOptions
parse_get_bounds_argv(int argc, char* argv[])
{
    po::options_description desc("get-bounds options");
    add_service_options(desc, true);
    add_common_options(desc);

    std::string usage =
        "ixport get-bounds - Find and display the largest and lowest value "
        "for the specified field\n\nUsage: ixport get-bounds --endpoint <url> "
        "--admin-key <key> --index-name <index> --field-name <field>";

    return run_parser(
        argc,
        argv,
        Subcommand::GetBounds,
        desc,
        usage,
        [](CommandLineOptions& options, const po::variables_map& vm) {
            return require(options, vm, "endpoint", options.endpoint) &&
                require(options, vm, "index-name", options.index_name) &&
                require(options, vm, "field-name", options.field_name);
        });
}

CommandLineOptions
parse_partition_index_argv(int argc, char* argv[])
{
    po::options_description desc("partition-index options");
    add_service_options(desc, true);
    desc.add_options()(
        "lower-bound",
        po::value<std::string>(),
        "Smallest value to use to partition the index data. Defaults to the "
        "smallest value in the index.")(
        "upper-bound",
        po::value<std::string>(),
        "Largest value to use to partition the index data. Defaults to the "
        "largest value in the index.")(
        "partition-path",
        po::value<std::string>(),
        "Path of the file with JSON description of partitions. Should end "
        "in .json. Default is <index name>-partitions.json");
    add_common_options(desc);

    std::string usage =
        "ixport partition-index - Partitions the data in the index between "
        "the lower and upper bound into partitions that each fit under the "
        "service's paging limit\n\nUsage: ixport partition-index --endpoint "
        "<url> --admin-key <key> --index-name <index> --field-name <field> "
        "[options]";

    return run_parser(
        argc,
        argv,
        Subcommand::PartitionIndex,
        desc,
        usage,
        [](CommandLineOptions& options, const po::variables_map& vm) {
            if (!(require(options, vm, "endpoint", options.endpoint) &&
                  require(options, vm, "index-name", options.index_name) &&
                  require(options, vm, "field-name", options.field_name)))
            {
                return false;
            }
            if (vm.count("lower-bound"))
                options.lower_bound = vm["lower-bound"].as<std::string>();
            if (vm.count("upper-bound"))
                options.upper_bound = vm["upper-bound"].as<std::string>();
            if (vm.count("partition-path"))
                options.partition_path =
                    vm["partition-path"].as<std::string>();
            return true;
        });
}

CommandLineOptions
parse_export_partitions_argv(int argc, char* argv[])
{
    po::options_description desc("export-partitions options");
    desc.add_options()(
        "partition-path",
        po::value<std::string>(),
        "Path of the partition file written by partition-index")(
        "export-path",
        po::value<std::string>()->default_value("."),
        "Directory to write JSON Lines partition files to. Every line holds "
        "one search document. File names are "
        "<index name>-<partition id>-documents.jsonl")(
        "concurrent-partitions",
        po::value<int>()->default_value(2),
        "Number of partitions to concurrently export")(
        "page-size",
        po::value<std::int64_t>()->default_value(1000),
        "Page size to use when running export queries")(
        "include-partition",
        po::value<std::vector<int>>()->composing(),
        "Partition index to include in the export; repeatable. Example: "
        "--include-partition 0 --include-partition 1 only exports the first "
        "2 partitions")(
        "exclude-partition",
        po::value<std::vector<int>>()->composing(),
        "Partition index to exclude from the export; repeatable");
    add_service_options(desc, false);
    add_common_options(desc);

    std::string usage =
        "ixport export-partitions - Exports data from a search index using a "
        "partition file from partition-index\n\nUsage: ixport "
        "export-partitions --partition-path <file> --admin-key <key> "
        "[options]";

    return run_parser(
        argc,
        argv,
        Subcommand::ExportPartitions,
        desc,
        usage,
        [](CommandLineOptions& options, const po::variables_map& vm) {
            if (!require(options, vm, "partition-path", options.partition_path))
                return false;

            options.export_path = vm["export-path"].as<std::string>();
            options.concurrent_partitions =
                vm["concurrent-partitions"].as<int>();
            options.page_size = vm["page-size"].as<std::int64_t>();
            if (vm.count("include-partition"))
                options.include_partitions =
                    vm["include-partition"].as<std::vector<int>>();
            if (vm.count("exclude-partition"))
                options.exclude_partitions =
                    vm["exclude-partition"].as<std::vector<int>>();

            if (!options.include_partitions.empty() &&
                !options.exclude_partitions.empty())
            {
                return fail(options, ConflictingSelectionError().what());
            }
            if (options.concurrent_partitions < 1)
            {
                return fail(
                    options, "--concurrent-partitions must be at least 1");
            }
            if (options.page_size < 1)
            {
                return fail(options, "--page-size must be at least 1");
            }
            return true;
        });
}

}  // namespace ixport::cli
