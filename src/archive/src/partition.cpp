#include "ixport/archive/partition.h"
#include "ixport/core/errors.h"
#include "ixport/core/pretty-json.h"

#include <boost/filesystem.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace fs = boost::filesystem;
namespace json = boost::json;

namespace ixport::archive {

namespace {

const json::value&
member(const json::object& obj, const char* key, const char* where)
{
    const auto* v = obj.if_contains(key);
    if (!v)
    {
        throw PartitionFileError(
            std::string(where) + " is missing \"" + key + "\"");
    }
    return *v;
}

std::string
string_member(const json::object& obj, const char* key, const char* where)
{
    const auto& v = member(obj, key, where);
    if (!v.is_string())
    {
        throw PartitionFileError(
            std::string(where) + " member \"" + key + "\" must be a string");
    }
    return std::string(v.as_string());
}

std::int64_t
integer_member(const json::object& obj, const char* key, const char* where)
{
    const auto& v = member(obj, key, where);
    if (!v.is_int64() && !v.is_uint64())
    {
        throw PartitionFileError(
            std::string(where) + " member \"" + key + "\" must be an integer");
    }
    if (v.is_uint64() &&
        v.get_uint64() >
            static_cast<std::uint64_t>(
                std::numeric_limits<std::int64_t>::max()))
    {
        throw PartitionFileError(
            std::string(where) + " member \"" + key + "\" is out of range");
    }
    return v.to_number<std::int64_t>();
}

}  // namespace

void
check_partition_indices(const PartitionFile& file)
{
    for (std::size_t i = 0; i < file.partitions.size(); ++i)
    {
        if (file.partitions[i].index != static_cast<int>(i))
        {
            throw PartitionFileError(
                "Partition indices must be contiguous from 0; expected " +
                std::to_string(i) + ", found " +
                std::to_string(file.partitions[i].index));
        }
    }
}

std::string
default_partition_path(const std::string& index_name)
{
    return index_name + "-partitions.json";
}

json::value
to_json(const PartitionFile& file)
{
    json::array partitions;
    for (const auto& p : file.partitions)
    {
        json::object entry;
        entry["index"] = p.index;
        entry["lowerBound"] = search::format_bound(p.lower_bound);
        entry["upperBound"] = search::format_bound(p.upper_bound);
        entry["documentCount"] = p.document_count;
        partitions.push_back(std::move(entry));
    }

    json::object obj;
    obj["endpoint"] = file.endpoint;
    obj["indexName"] = file.index_name;
    obj["fieldName"] = file.field_name;
    obj["fieldType"] = search::field_type_name(file.field_type);
    obj["totalDocumentCount"] = file.total_document_count;
    obj["partitions"] = std::move(partitions);
    return obj;
}

PartitionFile
partition_file_from_json(const json::value& jv)
{
    if (!jv.is_object())
    {
        throw PartitionFileError("Partition file must contain a JSON object");
    }
    const auto& obj = jv.as_object();

    PartitionFile file;
    file.endpoint = string_member(obj, "endpoint", "Partition file");
    file.index_name = string_member(obj, "indexName", "Partition file");
    file.field_name = string_member(obj, "fieldName", "Partition file");
    file.total_document_count =
        integer_member(obj, "totalDocumentCount", "Partition file");

    // Plans written before numeric fields were supported carry no type
    if (obj.contains("fieldType"))
    {
        auto type_name = string_member(obj, "fieldType", "Partition file");
        file.field_type = search::field_type_from_name(type_name);
        if (file.field_type == search::FieldType::Unsupported)
        {
            throw PartitionFileError(
                "Partition file has unsupported fieldType " + type_name);
        }
    }

    const auto& partitions = member(obj, "partitions", "Partition file");
    if (!partitions.is_array())
    {
        throw PartitionFileError("\"partitions\" must be an array");
    }

    const auto& domain = search::domain_for(file.field_type);
    for (const auto& entry : partitions.as_array())
    {
        if (!entry.is_object())
        {
            throw PartitionFileError("Partition entries must be objects");
        }
        const auto& p = entry.as_object();
        auto index = integer_member(p, "index", "Partition entry");
        if (index < 0 || index > std::numeric_limits<int>::max())
        {
            throw PartitionFileError(
                "Partition index " + std::to_string(index) + " is out of range");
        }

        file.partitions.push_back(Partition{
            static_cast<int>(index),
            domain.parse(string_member(p, "lowerBound", "Partition entry")),
            domain.parse(string_member(p, "upperBound", "Partition entry")),
            integer_member(p, "documentCount", "Partition entry")});
    }

    check_partition_indices(file);
    return file;
}

void
write_partition_file(const PartitionFile& file, const std::string& path)
{
    fs::path out_path(path);
    if (out_path.has_parent_path())
    {
        boost::system::error_code ec;
        fs::create_directories(out_path.parent_path(), ec);
        if (ec)
        {
            throw PartitionFileError(
                "Cannot create directory for " + path + ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open())
    {
        throw PartitionFileError("Cannot open " + path + " for writing");
    }
    core::pretty_print(out, to_json(file));
    out.flush();
    if (!out)
    {
        throw PartitionFileError("Failed writing partition file " + path);
    }
}

PartitionFile
read_partition_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw PartitionFileError("Could not open partition file: " + path);
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    json::error_code ec;
    json::value jv = json::parse(buffer.str(), ec);
    if (ec)
    {
        throw PartitionFileError(
            "Failed to parse " + path + ": " + ec.message());
    }
    return partition_file_from_json(jv);
}

}  // namespace ixport::archive
