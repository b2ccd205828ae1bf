#pragma once

#include "ixport/search/orderable-value.h"
#include <string>

namespace ixport::search {

/**
 * Capabilities of one index field as reported by the backend
 */
struct FieldInfo
{
    /** Field name as it appears in documents and filters */
    std::string name;

    /** Backend type name, e.g. "Edm.DateTimeOffset" */
    std::string type_name;

    /** Parsed type; Unsupported for anything not range-bisectable */
    FieldType type = FieldType::Unsupported;

    bool sortable = false;
    bool filterable = false;
};

/**
 * Check that a field can drive partitioning
 *
 * @throws FieldValidationError if the field is not sortable and filterable,
 * or its type is not one of the supported orderable types
 */
void
validate_field(const FieldInfo& field);

}  // namespace ixport::search
