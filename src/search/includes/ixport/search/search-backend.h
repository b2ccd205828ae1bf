#pragma once

#include "ixport/search/field-info.h"
#include "ixport/search/orderable-value.h"
#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ixport::search {

/** A returned document: field name to JSON value */
using Document = boost::json::object;

enum class SortDirection { Ascending, Descending };

/**
 * Range restriction on the ordering field
 *
 * The lower bound is always inclusive. The upper bound is exclusive unless
 * upper_inclusive is set. An absent bound leaves that side open. With
 * require_value set, documents whose field is null are excluded as well
 * (bounded filters exclude them implicitly).
 */
struct RangeFilter
{
    std::string field;
    std::optional<OrderableValue> lower;
    std::optional<OrderableValue> upper;
    bool upper_inclusive = false;
    bool require_value = false;

    /** lower <= field < upper, or <= upper when upper_inclusive */
    static RangeFilter
    between(
        const std::string& field,
        const OrderableValue& lower,
        const OrderableValue& upper,
        bool upper_inclusive)
    {
        RangeFilter filter;
        filter.field = field;
        filter.lower = lower;
        filter.upper = upper;
        filter.upper_inclusive = upper_inclusive;
        return filter;
    }

    /** Every document that has a value for the field */
    static RangeFilter
    with_value(const std::string& field)
    {
        RangeFilter filter;
        filter.field = field;
        filter.require_value = true;
        return filter;
    }
};

/**
 * One page request
 */
struct QueryRequest
{
    RangeFilter filter;
    std::string sort_field;
    SortDirection direction = SortDirection::Ascending;
    std::int64_t skip = 0;
    std::int64_t top = 1;
};

/**
 * Remote, paginated, filterable and sortable document collection
 *
 * Implementations must allow concurrent calls from several threads; the
 * exporter shares one backend between all of its workers.
 */
class SearchBackend
{
public:
    virtual ~SearchBackend() = default;

    /** Number of documents matching the filter */
    virtual std::int64_t
    count(const RangeFilter& filter) = 0;

    /** One page of documents, in the requested order */
    virtual std::vector<Document>
    query(const QueryRequest& request) = 0;

    /**
     * Describe one field of the collection
     *
     * @throws FieldValidationError if the field does not exist
     */
    virtual FieldInfo
    describe_field(const std::string& name) = 0;

    /**
     * Page-depth limit: the largest skip a single query may use, and so the
     * largest number of documents one partition may hold
     */
    virtual std::int64_t
    max_skip() const = 0;

    /** Largest top a single query honours in full */
    virtual std::int64_t
    max_page_size() const = 0;
};

}  // namespace ixport::search
