#pragma once

#include "ixport/search/field-info.h"
#include "ixport/search/orderable-value.h"
#include "ixport/search/search-backend.h"

namespace ixport::archive {

/**
 * Smallest value of the field currently in the collection
 *
 * Issues a single one-document query sorted ascending by the field.
 *
 * @throws EmptyCollectionError if no document carries a value for the field
 */
search::OrderableValue
find_lower_bound(const search::FieldInfo& field, search::SearchBackend& backend);

/**
 * Largest value of the field currently in the collection
 *
 * @throws EmptyCollectionError if no document carries a value for the field
 */
search::OrderableValue
find_upper_bound(const search::FieldInfo& field, search::SearchBackend& backend);

}  // namespace ixport::archive
