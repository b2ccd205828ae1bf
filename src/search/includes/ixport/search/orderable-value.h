#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace ixport::search {

/**
 * Field types that can drive partitioning: totally ordered and bisectable
 */
enum class FieldType {
    DateTimeOffset,
    Int32,
    Int64,
    Double,
    Unsupported
};

/** Backend type name, e.g. "Edm.DateTimeOffset" */
std::string
field_type_name(FieldType type);

/**
 * Map a backend type name to a FieldType
 *
 * Accepts both the qualified ("Edm.Int64") and bare ("Int64") spellings.
 * Anything else maps to FieldType::Unsupported.
 */
FieldType
field_type_from_name(const std::string& name);

/** Comma separated list of the supported type names, for error messages */
std::string
supported_field_types();

/** Microsecond resolution UTC instant */
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

/**
 * A single value of the ordering field
 *
 * Values only compare against values of the same FieldType; comparing
 * across types throws std::invalid_argument.
 */
class OrderableValue
{
public:
    static OrderableValue
    from_timestamp(Timestamp ts);

    static OrderableValue
    from_integer(FieldType type, std::int64_t value);

    static OrderableValue
    from_double(double value);

    FieldType
    type() const
    {
        return type_;
    }

    Timestamp
    as_timestamp() const;

    std::int64_t
    as_integer() const;

    double
    as_double() const;

    bool
    operator==(const OrderableValue& other) const;

    bool
    operator<(const OrderableValue& other) const;

    bool
    operator!=(const OrderableValue& other) const
    {
        return !(*this == other);
    }

    bool
    operator<=(const OrderableValue& other) const
    {
        return !(other < *this);
    }

    bool
    operator>(const OrderableValue& other) const
    {
        return other < *this;
    }

private:
    OrderableValue(FieldType type, std::variant<Timestamp, std::int64_t, double> v)
        : type_(type), value_(v)
    {
    }

    void
    require_same_type(const OrderableValue& other) const;

    FieldType type_;
    std::variant<Timestamp, std::int64_t, double> value_;
};

/**
 * Per-type strategy for everything the partitioning algorithms need from a
 * value: text round-trip, midpoint, and extraction from a returned document.
 *
 * New orderable types are added by implementing this interface and
 * registering it in domain_for(); the generator and exporter never switch on
 * FieldType themselves.
 */
class ValueDomain
{
public:
    virtual ~ValueDomain() = default;

    virtual FieldType
    type() const = 0;

    /**
     * Parse canonical (or accepted alternative) text
     *
     * @throws InvalidBoundFormatError on malformed input
     */
    virtual OrderableValue
    parse(const std::string& text) const = 0;

    /** Canonical text; also valid as an OData filter literal */
    virtual std::string
    format(const OrderableValue& value) const = 0;

    /**
     * Deterministic midpoint of [lower, upper]
     *
     * May return lower (or upper) when the two are adjacent in the domain;
     * callers must check that the result strictly separates them.
     */
    virtual OrderableValue
    bisect(const OrderableValue& lower, const OrderableValue& upper) const = 0;

    /**
     * Extract a value from a document field as returned by the backend
     *
     * @throws InvalidBoundFormatError if the JSON value has the wrong shape
     */
    virtual OrderableValue
    from_json(const boost::json::value& jv) const = 0;
};

/**
 * Strategy for a field type
 *
 * @throws FieldValidationError for FieldType::Unsupported
 */
const ValueDomain&
domain_for(FieldType type);

/** Parse bound text for a field type (InvalidBoundFormatError on failure) */
OrderableValue
parse_bound(FieldType type, const std::string& text);

/** Canonical text of a bound */
std::string
format_bound(const OrderableValue& value);

/**
 * Reject text that is not a bound of any supported type
 *
 * Lets malformed input fail before the field's actual type is known.
 *
 * @throws InvalidBoundFormatError
 */
void
check_bound_syntax(const std::string& text);

}  // namespace ixport::search
