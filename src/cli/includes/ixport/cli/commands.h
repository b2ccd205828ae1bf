#pragma once

#include "ixport/cli/arg-options.h"
#include "ixport/search/azure-search-backend.h"
#include "ixport/search/field-info.h"
#include "ixport/search/search-backend.h"

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

namespace ixport::cli {

/** Builds the backend a command talks to; tests substitute a fake */
using BackendFactory = std::function<std::unique_ptr<search::SearchBackend>(
    const search::AzureSearchOptions&)>;

/** Factory returning an AzureSearchBackend */
BackendFactory
default_backend_factory();

/** Connection settings from parsed options */
search::AzureSearchOptions
make_search_options(const CommandLineOptions& options);

/**
 * Look up a field and check it can drive partitioning
 *
 * @throws FieldValidationError
 */
search::FieldInfo
resolve_field(search::SearchBackend& backend, const std::string& field_name);

/*
 * Subcommand bodies. Each returns the process exit code: 0 on success, 1 on
 * any error (logged before returning). Results go to `out`.
 */

int
run_get_bounds(
    const CommandLineOptions& options,
    const BackendFactory& factory,
    std::ostream& out);

int
run_partition_index(
    const CommandLineOptions& options,
    const BackendFactory& factory,
    std::ostream& out);

int
run_export_partitions(
    const CommandLineOptions& options,
    const BackendFactory& factory,
    std::ostream& out);

/**
 * Parse, apply the log level, then run; what the executable's main calls
 */
int
dispatch(
    Subcommand command,
    int argc,
    char* argv[],
    const BackendFactory& factory);

}  // namespace ixport::cli
