#include "ixport/archive/bound-finder.h"
#include "ixport/core/errors.h"
#include "ixport/core/logger.h"

namespace ixport::archive {

namespace {

search::OrderableValue
find_bound(
    const search::FieldInfo& field,
    search::SearchBackend& backend,
    search::SortDirection direction)
{
    const auto& domain = search::domain_for(field.type);

    search::QueryRequest request;
    request.filter = search::RangeFilter::with_value(field.name);
    request.sort_field = field.name;
    request.direction = direction;
    request.skip = 0;
    request.top = 1;

    auto documents = backend.query(request);
    if (documents.empty())
    {
        throw EmptyCollectionError(field.name);
    }

    const auto* value = documents.front().if_contains(field.name);
    if (!value || value->is_null())
    {
        throw EmptyCollectionError(field.name);
    }

    auto bound = domain.from_json(*value);
    LOGD(
        direction == search::SortDirection::Ascending ? "Lower" : "Upper",
        " bound of ",
        field.name,
        " is ",
        domain.format(bound));
    return bound;
}

}  // namespace

search::OrderableValue
find_lower_bound(const search::FieldInfo& field, search::SearchBackend& backend)
{
    return find_bound(field, backend, search::SortDirection::Ascending);
}

search::OrderableValue
find_upper_bound(const search::FieldInfo& field, search::SearchBackend& backend)
{
    return find_bound(field, backend, search::SortDirection::Descending);
}

}  // namespace ixport::archive
