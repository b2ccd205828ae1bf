#pragma once

#include "ixport/search/field-info.h"
#include "ixport/search/orderable-value.h"
#include "ixport/search/search-backend.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ixport::test_utils {

/**
 * In-memory SearchBackend for tests
 *
 * Documents are kept ordered by the ordering field (insertion order breaks
 * ties) so count and query are binary searches. Documents without a value
 * for the field sort first, as the real service does. Thread safe.
 */
class FakeSearchBackend : public search::SearchBackend
{
public:
    /** Backend whose documents are ordered by `field` */
    explicit FakeSearchBackend(
        search::FieldInfo field,
        std::int64_t max_skip = 100000,
        std::int64_t max_page_size = 1000);

    /** Add a document; its ordering field may be missing or null */
    void
    add_document(search::Document doc);

    /** Register another field for describe_field() */
    void
    add_field(search::FieldInfo field);

    /** Called before every query; throw from it to simulate a failure */
    void
    set_query_hook(std::function<void(const search::QueryRequest&)> hook);

    std::int64_t
    count(const search::RangeFilter& filter) override;

    std::vector<search::Document>
    query(const search::QueryRequest& request) override;

    search::FieldInfo
    describe_field(const std::string& name) override;

    std::int64_t
    max_skip() const override
    {
        return max_skip_;
    }

    std::int64_t
    max_page_size() const override
    {
        return max_page_size_;
    }

    std::int64_t
    document_count() const;

    /** Calls made so far */
    std::int64_t
    count_calls() const
    {
        return count_calls_;
    }

    std::int64_t
    query_calls() const
    {
        return query_calls_;
    }

    std::int64_t
    describe_calls() const
    {
        return describe_calls_;
    }

    std::int64_t
    total_calls() const
    {
        return count_calls_ + query_calls_ + describe_calls_;
    }

    /** Every query received, in arrival order */
    std::vector<search::QueryRequest>
    recorded_queries() const;

private:
    struct Entry
    {
        std::optional<search::OrderableValue> value;
        std::uint64_t sequence;
        search::Document doc;
    };

    // [first, last) positions of entries matching the filter
    std::pair<std::size_t, std::size_t>
    matching_range(const search::RangeFilter& filter) const;

    search::FieldInfo field_;
    const search::ValueDomain& domain_;
    std::int64_t max_skip_;
    std::int64_t max_page_size_;

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::uint64_t next_sequence_ = 0;
    std::map<std::string, search::FieldInfo> fields_;
    std::function<void(const search::QueryRequest&)> query_hook_;
    std::vector<search::QueryRequest> queries_;

    std::atomic<std::int64_t> count_calls_{0};
    std::atomic<std::int64_t> query_calls_{0};
    std::atomic<std::int64_t> describe_calls_{0};
};

/** Sortable, filterable field description */
search::FieldInfo
make_field(const std::string& name, search::FieldType type);

/** Timestamp from canonical text, e.g. "2021-01-01T00:00:00Z" */
search::OrderableValue
timestamp(const std::string& text);

/**
 * Fill a backend with `n` documents whose `field` timestamps are spread
 * evenly over [from, to), each with a unique "id"
 */
void
add_timestamp_documents(
    FakeSearchBackend& backend,
    const std::string& field,
    const std::string& from,
    const std::string& to,
    std::int64_t n);

/** One document per value, with integer field values */
void
add_integer_documents(
    FakeSearchBackend& backend,
    const std::string& field,
    const std::vector<std::int64_t>& values);

/** Fresh empty directory under the system temp directory */
std::string
make_temp_directory(const std::string& prefix);

/** Lines of a text file */
std::vector<std::string>
read_lines(const std::string& path);

}  // namespace ixport::test_utils
