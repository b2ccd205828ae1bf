#include "ixport/search/field-info.h"
#include "ixport/core/errors.h"

namespace ixport::search {

void
validate_field(const FieldInfo& field)
{
    if (!field.sortable || !field.filterable)
    {
        throw FieldValidationError(
            field.name + " must be sortable and filterable");
    }
    if (field.type == FieldType::Unsupported)
    {
        throw FieldValidationError(
            field.name + " is of type " + field.type_name +
            ", supported types " + supported_field_types());
    }
}

}  // namespace ixport::search
