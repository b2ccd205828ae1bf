#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace ixport {

// Base exception for everything ixport reports
class IxportError : public std::runtime_error
{
public:
    explicit IxportError(const std::string& msg) : std::runtime_error(msg)
    {
    }
};

// Bound discovery found no document carrying the ordering field
class EmptyCollectionError : public IxportError
{
public:
    explicit EmptyCollectionError(const std::string& field_name);
};

// Malformed bound text, either user supplied or read from a partition file
class InvalidBoundFormatError : public IxportError
{
public:
    InvalidBoundFormatError(const std::string& text, const std::string& reason);

    const std::string&
    text() const
    {
        return text_;
    }

private:
    std::string text_;
};

// A range still exceeds the page-depth limit but cannot be bisected further
class UnsplittablePartitionError : public IxportError
{
public:
    UnsplittablePartitionError(
        const std::string& lower,
        const std::string& upper,
        std::int64_t document_count,
        std::int64_t limit);

    const std::string&
    lower() const
    {
        return lower_;
    }

    const std::string&
    upper() const
    {
        return upper_;
    }

    std::int64_t
    document_count() const
    {
        return document_count_;
    }

private:
    std::string lower_;
    std::string upper_;
    std::int64_t document_count_;
};

// Both an inclusion and an exclusion partition list were supplied
class ConflictingSelectionError : public IxportError
{
public:
    ConflictingSelectionError();
};

// One partition failed mid-export
class PartitionExportError : public IxportError
{
public:
    PartitionExportError(int partition_index, const std::string& reason);

    int
    partition_index() const
    {
        return partition_index_;
    }

    const std::string&
    reason() const
    {
        return reason_;
    }

private:
    int partition_index_;
    std::string reason_;
};

// Raised once all partitions have finished and at least one failed
class ExportFailedError : public IxportError
{
public:
    explicit ExportFailedError(std::vector<PartitionExportError> failures);

    const std::vector<PartitionExportError>&
    failures() const
    {
        return failures_;
    }

private:
    std::vector<PartitionExportError> failures_;
};

// Field is missing, not sortable/filterable, or of an unsupported type
class FieldValidationError : public IxportError
{
public:
    explicit FieldValidationError(const std::string& msg) : IxportError(msg)
    {
    }
};

// Remote call failed; status is 0 when no HTTP response was received
class SearchRequestError : public IxportError
{
public:
    SearchRequestError(unsigned status, const std::string& msg);

    unsigned
    status() const
    {
        return status_;
    }

private:
    unsigned status_;
};

// Partition file is unreadable or structurally invalid
class PartitionFileError : public IxportError
{
public:
    explicit PartitionFileError(const std::string& msg) : IxportError(msg)
    {
    }
};

}  // namespace ixport
