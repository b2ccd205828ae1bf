#include "ixport/search/orderable-value.h"
#include "ixport/core/errors.h"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>

namespace ixport::search {

namespace {

using namespace std::chrono;

std::string
trimmed(const std::string& text)
{
    const char* ws = " \t\r\n";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos)
        return {};
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

// Reads exactly `count` decimal digits starting at `pos`
bool
read_fixed(const std::string& s, std::size_t& pos, std::size_t count, int& out)
{
    if (pos + count > s.size())
        return false;
    int value = 0;
    for (std::size_t i = 0; i < count; ++i)
    {
        char c = s[pos + i];
        if (c < '0' || c > '9')
            return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool
expect(const std::string& s, std::size_t& pos, char c)
{
    if (pos >= s.size() || s[pos] != c)
        return false;
    ++pos;
    return true;
}

std::int64_t
midpoint(std::int64_t lower, std::int64_t upper)
{
    // Unsigned difference cannot overflow even for the full int64 span
    auto span = static_cast<std::uint64_t>(upper) -
        static_cast<std::uint64_t>(lower);
    return static_cast<std::int64_t>(
        static_cast<std::uint64_t>(lower) + span / 2);
}

class TimestampDomain : public ValueDomain
{
public:
    FieldType
    type() const override
    {
        return FieldType::DateTimeOffset;
    }

    // YYYY-MM-DDTHH:MM:SS[.fffffff](Z|+HH:MM|-HH:MM)
    OrderableValue
    parse(const std::string& raw) const override
    {
        std::string s = trimmed(raw);
        std::size_t pos = 0;
        int y, mo, d, h, mi, sec;

        if (!read_fixed(s, pos, 4, y) || !expect(s, pos, '-') ||
            !read_fixed(s, pos, 2, mo) || !expect(s, pos, '-') ||
            !read_fixed(s, pos, 2, d))
        {
            throw InvalidBoundFormatError(raw, "expected YYYY-MM-DD date");
        }
        if (pos >= s.size() || (s[pos] != 'T' && s[pos] != 't'))
        {
            throw InvalidBoundFormatError(
                raw, "expected 'T' between date and time");
        }
        ++pos;
        if (!read_fixed(s, pos, 2, h) || !expect(s, pos, ':') ||
            !read_fixed(s, pos, 2, mi) || !expect(s, pos, ':') ||
            !read_fixed(s, pos, 2, sec))
        {
            throw InvalidBoundFormatError(raw, "expected HH:MM:SS time");
        }

        std::int64_t micros = 0;
        if (pos < s.size() && s[pos] == '.')
        {
            ++pos;
            std::size_t digits = 0;
            std::int64_t scale = 100000;
            while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9')
            {
                if (digits < 6)
                {
                    micros += (s[pos] - '0') * scale;
                    scale /= 10;
                }
                ++digits;
                ++pos;
            }
            if (digits == 0 || digits > 9)
            {
                throw InvalidBoundFormatError(
                    raw, "fractional seconds must have 1 to 9 digits");
            }
        }

        minutes offset{0};
        if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z'))
        {
            ++pos;
        }
        else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-'))
        {
            int sign = s[pos] == '-' ? -1 : 1;
            ++pos;
            int oh, om;
            if (!read_fixed(s, pos, 2, oh) || !expect(s, pos, ':') ||
                !read_fixed(s, pos, 2, om) || oh > 23 || om > 59)
            {
                throw InvalidBoundFormatError(
                    raw, "expected UTC offset as +HH:MM or -HH:MM");
            }
            offset = minutes{sign * (oh * 60 + om)};
        }
        else
        {
            throw InvalidBoundFormatError(
                raw, "missing time zone designator (Z or +HH:MM)");
        }

        if (pos != s.size())
        {
            throw InvalidBoundFormatError(raw, "trailing characters");
        }

        year_month_day ymd{
            year{y},
            month{static_cast<unsigned>(mo)},
            day{static_cast<unsigned>(d)}};
        if (!ymd.ok())
        {
            throw InvalidBoundFormatError(raw, "no such calendar date");
        }
        if (h > 23 || mi > 59 || sec > 59)
        {
            throw InvalidBoundFormatError(raw, "time of day out of range");
        }

        Timestamp ts = sys_days{ymd} + hours{h} + minutes{mi} + seconds{sec} +
            microseconds{micros} - offset;

        // The canonical UTC form must itself be a four-digit year
        year_month_day utc{floor<days>(ts)};
        if (utc.year() < year{0} || utc.year() > year{9999})
        {
            throw InvalidBoundFormatError(
                raw, "instant falls outside years 0000 to 9999 in UTC");
        }
        return OrderableValue::from_timestamp(ts);
    }

    std::string
    format(const OrderableValue& value) const override
    {
        Timestamp ts = value.as_timestamp();
        auto day_point = floor<days>(ts);
        year_month_day ymd{day_point};
        hh_mm_ss<microseconds> tod{ts - day_point};

        std::array<char, 64> buf{};
        std::snprintf(
            buf.data(),
            buf.size(),
            "%04d-%02u-%02uT%02d:%02d:%02d.%06lldZ",
            static_cast<int>(ymd.year()),
            static_cast<unsigned>(ymd.month()),
            static_cast<unsigned>(ymd.day()),
            static_cast<int>(tod.hours().count()),
            static_cast<int>(tod.minutes().count()),
            static_cast<int>(tod.seconds().count()),
            static_cast<long long>(tod.subseconds().count()));
        return buf.data();
    }

    OrderableValue
    bisect(const OrderableValue& lower, const OrderableValue& upper)
        const override
    {
        auto lo = lower.as_timestamp().time_since_epoch().count();
        auto hi = upper.as_timestamp().time_since_epoch().count();
        return OrderableValue::from_timestamp(
            Timestamp{microseconds{midpoint(lo, hi)}});
    }

    OrderableValue
    from_json(const boost::json::value& jv) const override
    {
        if (!jv.is_string())
        {
            throw InvalidBoundFormatError(
                boost::json::serialize(jv), "expected a timestamp string");
        }
        return parse(std::string(jv.as_string()));
    }
};

class IntegerDomain : public ValueDomain
{
public:
    explicit IntegerDomain(FieldType type) : type_(type)
    {
    }

    FieldType
    type() const override
    {
        return type_;
    }

    OrderableValue
    parse(const std::string& raw) const override
    {
        std::string s = trimmed(raw);
        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (s.empty() || ec != std::errc() || ptr != s.data() + s.size())
        {
            throw InvalidBoundFormatError(raw, "expected a decimal integer");
        }
        return checked(raw, value);
    }

    std::string
    format(const OrderableValue& value) const override
    {
        return std::to_string(value.as_integer());
    }

    OrderableValue
    bisect(const OrderableValue& lower, const OrderableValue& upper)
        const override
    {
        return OrderableValue::from_integer(
            type_, midpoint(lower.as_integer(), upper.as_integer()));
    }

    OrderableValue
    from_json(const boost::json::value& jv) const override
    {
        if (jv.is_int64())
        {
            return checked(boost::json::serialize(jv), jv.as_int64());
        }
        if (jv.is_uint64() &&
            jv.as_uint64() <=
                static_cast<std::uint64_t>(
                    std::numeric_limits<std::int64_t>::max()))
        {
            return checked(
                boost::json::serialize(jv),
                static_cast<std::int64_t>(jv.as_uint64()));
        }
        throw InvalidBoundFormatError(
            boost::json::serialize(jv), "expected an integer");
    }

private:
    OrderableValue
    checked(const std::string& raw, std::int64_t value) const
    {
        if (type_ == FieldType::Int32 &&
            (value < std::numeric_limits<std::int32_t>::min() ||
             value > std::numeric_limits<std::int32_t>::max()))
        {
            throw InvalidBoundFormatError(raw, "out of range for Edm.Int32");
        }
        return OrderableValue::from_integer(type_, value);
    }

    FieldType type_;
};

class DoubleDomain : public ValueDomain
{
public:
    FieldType
    type() const override
    {
        return FieldType::Double;
    }

    OrderableValue
    parse(const std::string& raw) const override
    {
        std::string s = trimmed(raw);
        double value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (s.empty() || ec != std::errc() || ptr != s.data() + s.size())
        {
            throw InvalidBoundFormatError(raw, "expected a decimal number");
        }
        if (!std::isfinite(value))
        {
            throw InvalidBoundFormatError(raw, "value must be finite");
        }
        return OrderableValue::from_double(value);
    }

    std::string
    format(const OrderableValue& value) const override
    {
        std::array<char, 64> buf{};
        auto [ptr, ec] =
            std::to_chars(buf.data(), buf.data() + buf.size(), value.as_double());
        if (ec != std::errc())
        {
            throw std::runtime_error("Failed to format double bound");
        }
        return std::string(buf.data(), ptr);
    }

    OrderableValue
    bisect(const OrderableValue& lower, const OrderableValue& upper)
        const override
    {
        // Halving first keeps the sum finite near the ends of the range
        double lo = lower.as_double();
        double hi = upper.as_double();
        return OrderableValue::from_double(lo / 2 + hi / 2);
    }

    OrderableValue
    from_json(const boost::json::value& jv) const override
    {
        if (jv.is_double() && std::isfinite(jv.as_double()))
            return OrderableValue::from_double(jv.as_double());
        if (jv.is_int64())
            return OrderableValue::from_double(
                static_cast<double>(jv.as_int64()));
        if (jv.is_uint64())
            return OrderableValue::from_double(
                static_cast<double>(jv.as_uint64()));
        throw InvalidBoundFormatError(
            boost::json::serialize(jv), "expected a finite number");
    }
};

}  // namespace

std::string
field_type_name(FieldType type)
{
    switch (type)
    {
        case FieldType::DateTimeOffset:
            return "Edm.DateTimeOffset";
        case FieldType::Int32:
            return "Edm.Int32";
        case FieldType::Int64:
            return "Edm.Int64";
        case FieldType::Double:
            return "Edm.Double";
        case FieldType::Unsupported:
            break;
    }
    return "Unsupported";
}

FieldType
field_type_from_name(const std::string& name)
{
    std::string bare = name.rfind("Edm.", 0) == 0 ? name.substr(4) : name;
    if (bare == "DateTimeOffset")
        return FieldType::DateTimeOffset;
    if (bare == "Int32")
        return FieldType::Int32;
    if (bare == "Int64")
        return FieldType::Int64;
    if (bare == "Double")
        return FieldType::Double;
    return FieldType::Unsupported;
}

std::string
supported_field_types()
{
    return "Edm.DateTimeOffset, Edm.Int32, Edm.Int64, Edm.Double";
}

OrderableValue
OrderableValue::from_timestamp(Timestamp ts)
{
    return OrderableValue(FieldType::DateTimeOffset, ts);
}

OrderableValue
OrderableValue::from_integer(FieldType type, std::int64_t value)
{
    if (type != FieldType::Int32 && type != FieldType::Int64)
    {
        throw std::invalid_argument(
            "Integer value requires Edm.Int32 or Edm.Int64, got " +
            field_type_name(type));
    }
    return OrderableValue(type, value);
}

OrderableValue
OrderableValue::from_double(double value)
{
    return OrderableValue(FieldType::Double, value);
}

Timestamp
OrderableValue::as_timestamp() const
{
    if (type_ != FieldType::DateTimeOffset)
    {
        throw std::invalid_argument(
            "Value of type " + field_type_name(type_) + " is not a timestamp");
    }
    return std::get<Timestamp>(value_);
}

std::int64_t
OrderableValue::as_integer() const
{
    if (type_ != FieldType::Int32 && type_ != FieldType::Int64)
    {
        throw std::invalid_argument(
            "Value of type " + field_type_name(type_) + " is not an integer");
    }
    return std::get<std::int64_t>(value_);
}

double
OrderableValue::as_double() const
{
    if (type_ != FieldType::Double)
    {
        throw std::invalid_argument(
            "Value of type " + field_type_name(type_) + " is not a double");
    }
    return std::get<double>(value_);
}

void
OrderableValue::require_same_type(const OrderableValue& other) const
{
    if (type_ != other.type_)
    {
        throw std::invalid_argument(
            "Cannot compare " + field_type_name(type_) + " with " +
            field_type_name(other.type_));
    }
}

bool
OrderableValue::operator==(const OrderableValue& other) const
{
    require_same_type(other);
    return value_ == other.value_;
}

bool
OrderableValue::operator<(const OrderableValue& other) const
{
    require_same_type(other);
    return value_ < other.value_;
}

const ValueDomain&
domain_for(FieldType type)
{
    static const TimestampDomain timestamp_domain;
    static const IntegerDomain int32_domain(FieldType::Int32);
    static const IntegerDomain int64_domain(FieldType::Int64);
    static const DoubleDomain double_domain;

    switch (type)
    {
        case FieldType::DateTimeOffset:
            return timestamp_domain;
        case FieldType::Int32:
            return int32_domain;
        case FieldType::Int64:
            return int64_domain;
        case FieldType::Double:
            return double_domain;
        case FieldType::Unsupported:
            break;
    }
    throw FieldValidationError(
        "Field type is not supported for partitioning; supported types: " +
        supported_field_types());
}

OrderableValue
parse_bound(FieldType type, const std::string& text)
{
    return domain_for(type).parse(text);
}

std::string
format_bound(const OrderableValue& value)
{
    return domain_for(value.type()).format(value);
}

void
check_bound_syntax(const std::string& text)
{
    // Timestamp last, so its error (the common case) is the one reported
    for (auto type :
         {FieldType::Double, FieldType::Int64, FieldType::DateTimeOffset})
    {
        try
        {
            domain_for(type).parse(text);
            return;
        }
        catch (const InvalidBoundFormatError&)
        {
            if (type == FieldType::DateTimeOffset)
                throw;
        }
    }
}

}  // namespace ixport::search
