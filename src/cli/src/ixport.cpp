#include "ixport/cli/commands.h"

#include <iostream>
#include <string>

using namespace ixport::cli;

void
print_usage(const char* program_name)
{
    std::cout << "ixport - Export every document of a search index\n\n"
              << "Usage: " << program_name << " <subcommand> [options]\n\n"
              << "Subcommands:\n"
              << "  get-bounds         Show the smallest and largest value of "
                 "a field\n"
              << "  partition-index    Split the index into partitions that "
                 "fit the paging limit\n"
              << "  export-partitions  Export partitions to JSON Lines "
                 "files\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name
              << " get-bounds --endpoint https://svc.search.windows.net "
                 "--index-name docs --field-name timestamp\n"
              << "  " << program_name
              << " partition-index --endpoint https://svc.search.windows.net "
                 "--index-name docs --field-name timestamp\n"
              << "  " << program_name
              << " export-partitions --partition-path docs-partitions.json "
                 "--export-path out --concurrent-partitions 4\n"
              << "\n"
              << "The admin key is read from --admin-key or $"
              << ADMIN_KEY_ENV << ".\n"
              << "\n"
              << "For subcommand-specific help:\n"
              << "  " << program_name << " <subcommand> --help\n";
}

int
main(int argc, char* argv[])
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return 1;
    }

    std::string subcommand = argv[1];

    // Create new argv for subcommand (skip program name and subcommand)
    int sub_argc = argc - 1;
    char** sub_argv = argv + 1;
    sub_argv[0] = argv[0];

    auto factory = default_backend_factory();
    if (subcommand == "get-bounds")
    {
        return dispatch(Subcommand::GetBounds, sub_argc, sub_argv, factory);
    }
    else if (subcommand == "partition-index")
    {
        return dispatch(
            Subcommand::PartitionIndex, sub_argc, sub_argv, factory);
    }
    else if (subcommand == "export-partitions")
    {
        return dispatch(
            Subcommand::ExportPartitions, sub_argc, sub_argv, factory);
    }
    else if (subcommand == "--help" || subcommand == "-h")
    {
        print_usage(argv[0]);
        return 0;
    }
    else
    {
        std::cerr << "Error: Unknown subcommand '" << subcommand << "'\n\n";
        print_usage(argv[0]);
        return 1;
    }
}
