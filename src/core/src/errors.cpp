#include "ixport/core/errors.h"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace ixport {

namespace {

std::string
describe_failures(const std::vector<PartitionExportError>& failures)
{
    std::ostringstream oss;
    oss << failures.size() << " partition(s) failed to export:";
    for (const auto& failure : failures)
    {
        oss << "\n  partition " << failure.partition_index() << ": "
            << failure.reason();
    }
    return oss.str();
}

}  // namespace

EmptyCollectionError::EmptyCollectionError(const std::string& field_name)
    : IxportError(
          "No documents with a value for '" + field_name +
          "' were found; cannot determine bounds")
{
}

InvalidBoundFormatError::InvalidBoundFormatError(
    const std::string& text,
    const std::string& reason)
    : IxportError("Invalid bound '" + text + "': " + reason), text_(text)
{
}

UnsplittablePartitionError::UnsplittablePartitionError(
    const std::string& lower,
    const std::string& upper,
    std::int64_t document_count,
    std::int64_t limit)
    : IxportError(
          "Range [" + lower + ", " + upper + "] holds " +
          std::to_string(document_count) + " documents (limit " +
          std::to_string(limit) +
          ") and cannot be split further; too many documents share the "
          "same field value")
    , lower_(lower)
    , upper_(upper)
    , document_count_(document_count)
{
}

ConflictingSelectionError::ConflictingSelectionError()
    : IxportError(
          "Only pass either --include-partition or --exclude-partition, not "
          "both")
{
}

PartitionExportError::PartitionExportError(
    int partition_index,
    const std::string& reason)
    : IxportError(
          "Partition " + std::to_string(partition_index) +
          " failed: " + reason)
    , partition_index_(partition_index)
    , reason_(reason)
{
}

ExportFailedError::ExportFailedError(
    std::vector<PartitionExportError> failures)
    : IxportError(describe_failures(failures)), failures_(std::move(failures))
{
}

SearchRequestError::SearchRequestError(unsigned status, const std::string& msg)
    : IxportError(msg), status_(status)
{
}

}  // namespace ixport
