#include "cpp_relmap/src/cpp_relmap/DBRelationship.hpp"

#include <algorithm>
#include <utility>

#include "cpp_relmap/src/cpp_relmap/DBTypeUnwrapper.hpp"

namespace cpp_relmap
{

void RelationshipMap::insert(RelationshipDescriptor descriptor)
{
  descriptors_.push_back(std::move(descriptor));
}

const RelationshipDescriptor* RelationshipMap::find(
  std::string_view fieldName) const
{
  auto it = std::find_if(descriptors_.begin(),
                         descriptors_.end(),
                         [fieldName](const RelationshipDescriptor& descriptor)
                         { return descriptor.fieldName == fieldName; });
  return it == descriptors_.end() ? nullptr : &*it;
}

RelationshipMap extractRelationships(const EntityDefinition& definition)
{
  RelationshipMap relationships;

  for (const auto& field : definition.fields())
  {
    FieldShape shape = unwrapType(*field.type);
    FieldShapeKind kind = classifyShape(shape, field.name);

    if (kind == FieldShapeKind::PLAIN_SCALAR ||
        kind == FieldShapeKind::NULLABLE_SCALAR)
    {
      continue;
    }

    RelationshipDescriptor descriptor;
    descriptor.fieldName = field.name;
    descriptor.targetEntity = std::get<std::string>(shape.bareType);
    descriptor.cardinality = kind == FieldShapeKind::TO_MANY
                               ? Cardinality::TO_MANY
                               : Cardinality::TO_ONE;
    descriptor.nullable = shape.isNullable;
    descriptor.reverseField = shape.relation->backPopulates;

    relationships.insert(std::move(descriptor));
  }

  return relationships;
}

}  // namespace cpp_relmap
