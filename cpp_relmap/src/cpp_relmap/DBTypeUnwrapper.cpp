#include "cpp_relmap/src/cpp_relmap/DBTypeUnwrapper.hpp"

#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"

namespace cpp_relmap
{

FieldShape unwrapType(const TypeExpression& type)
{
  FieldShape shape{};
  const TypeExpression* current = &type;

  if (current->kind() == TypeExpression::Kind::ANNOTATED)
  {
    shape.relation = current->metadata();
    current = &current->inner();
  }

  if (current->kind() == TypeExpression::Kind::NULLABLE)
  {
    shape.isNullable = true;
    current = &current->inner();
  }

  if (current->kind() == TypeExpression::Kind::COLLECTION)
  {
    shape.isCollection = true;
    current = &current->inner();
  }

  switch (current->kind())
  {
    case TypeExpression::Kind::SCALAR:
      shape.bareType = current->scalarType();
      return shape;
    case TypeExpression::Kind::ENTITY_REFERENCE:
      shape.bareType = current->entityName();
      return shape;
    default:
      throw DefinitionError{"Malformed type expression '" + type.toString() +
                            "': wrappers must compose as "
                            "relation<nullable<list<T>>>"};
  }
}

FieldShapeKind classifyShape(const FieldShape& shape,
                             std::string_view fieldName)
{
  const std::string field{fieldName};

  if (shape.relation.has_value())
  {
    if (!shape.isEntityReference())
    {
      throw DefinitionError{"Field '" + field +
                            "' carries relation metadata but does not "
                            "reference an entity"};
    }

    if (shape.isCollection)
    {
      return FieldShapeKind::TO_MANY;
    }
    return shape.isNullable ? FieldShapeKind::NULLABLE_TO_ONE
                            : FieldShapeKind::TO_ONE;
  }

  if (shape.isEntityReference())
  {
    throw DefinitionError{"Field '" + field + "' references entity '" +
                          std::get<std::string>(shape.bareType) +
                          "' without relation metadata"};
  }

  if (shape.isCollection)
  {
    throw DefinitionError{"Field '" + field +
                          "' is a collection of scalars, which cannot be "
                          "stored as a column"};
  }

  return shape.isNullable ? FieldShapeKind::NULLABLE_SCALAR
                          : FieldShapeKind::PLAIN_SCALAR;
}

}  // namespace cpp_relmap
