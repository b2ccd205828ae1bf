#pragma once

#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <iterator>
#include <ostream>
#include <string>

namespace ixport::core {

/**
 * Write a JSON value with two-space indentation, the layout used for
 * partition files so they stay diffable and hand-editable.
 *
 * @param os Output stream to write to
 * @param jv JSON value to print
 * @param indent Current indentation (internal use, leave null at top level)
 */
inline void
pretty_print(
    std::ostream& os,
    const boost::json::value& jv,
    std::string* indent = nullptr)
{
    std::string indent_;
    if (!indent)
        indent = &indent_;

    switch (jv.kind())
    {
        case boost::json::kind::object: {
            const auto& obj = jv.get_object();
            if (obj.empty())
            {
                os << "{}";
                break;
            }
            os << "{\n";
            indent->append(2, ' ');
            for (auto it = obj.begin(); it != obj.end(); ++it)
            {
                os << *indent << boost::json::serialize(it->key()) << ": ";
                pretty_print(os, it->value(), indent);
                if (std::next(it) != obj.end())
                    os << ",";
                os << "\n";
            }
            indent->resize(indent->size() - 2);
            os << *indent << "}";
            break;
        }
        case boost::json::kind::array: {
            const auto& arr = jv.get_array();
            if (arr.empty())
            {
                os << "[]";
                break;
            }
            os << "[\n";
            indent->append(2, ' ');
            for (auto it = arr.begin(); it != arr.end(); ++it)
            {
                os << *indent;
                pretty_print(os, *it, indent);
                if (std::next(it) != arr.end())
                    os << ",";
                os << "\n";
            }
            indent->resize(indent->size() - 2);
            os << *indent << "]";
            break;
        }
        default:
            // Scalars: let Boost.JSON handle escaping and number formatting
            os << boost::json::serialize(jv);
            break;
    }

    if (indent->empty())
        os << "\n";
}

}  // namespace ixport::core
