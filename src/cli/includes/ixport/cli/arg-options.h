#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ixport::cli {

/** Environment variable consulted when --admin-key is not given */
inline constexpr const char* ADMIN_KEY_ENV = "IXPORT_ADMIN_KEY";

enum class Subcommand { GetBounds, PartitionIndex, ExportPartitions };

/**
 * Type-safe structure for command line options
 *
 * One structure serves all subcommands; each parser only fills the members
 * its subcommand accepts.
 */
struct CommandLineOptions
{
    Subcommand command = Subcommand::GetBounds;

    /** Search service URL */
    std::optional<std::string> endpoint;

    /** Admin key for the search service */
    std::optional<std::string> admin_key;

    /** Index to export data from */
    std::optional<std::string> index_name;

    /** Filterable and sortable field used to partition the index */
    std::optional<std::string> field_name;

    /** Smallest value to partition from; discovered when absent */
    std::optional<std::string> lower_bound;

    /** Largest value to partition to; discovered when absent */
    std::optional<std::string> upper_bound;

    /** Partition plan path; <index>-partitions.json when absent */
    std::optional<std::string> partition_path;

    /** Directory receiving the exported .jsonl files */
    std::string export_path = ".";

    /** Partitions exported concurrently */
    int concurrent_partitions = 2;

    /** Documents requested per page */
    std::int64_t page_size = 1000;

    /** Partitions to export (all when empty) */
    std::vector<int> include_partitions;

    /** Partitions to skip */
    std::vector<int> exclude_partitions;

    /** Extra attempts for failed remote requests */
    int max_retries = 3;

    /** Log verbosity level */
    std::string log_level = "info";

    /** Whether to display help information */
    bool show_help = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;
};

/**
 * Parse `get-bounds` arguments (argv[0] is the program name)
 */
CommandLineOptions
parse_get_bounds_argv(int argc, char* argv[]);

/**
 * Parse `partition-index` arguments
 */
CommandLineOptions
parse_partition_index_argv(int argc, char* argv[]);

/**
 * Parse `export-partitions` arguments
 *
 * Supplying both --include-partition and --exclude-partition makes the
 * result invalid.
 */
CommandLineOptions
parse_export_partitions_argv(int argc, char* argv[]);

}  // namespace ixport::cli
