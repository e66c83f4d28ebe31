#include "cpp_relmap/src/cpp_relmap/DBPersistenceSchema.hpp"

#include <algorithm>

#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/cpp_relmap/DBTypeUnwrapper.hpp"

namespace cpp_relmap
{

namespace
{

void checkPrimaryKey(const EntityDefinition& definition)
{
  const auto* field = definition.findField(definition.primaryKey());
  if (field == nullptr)
  {
    throw DefinitionError{"Entity '" + definition.name() +
                          "' does not declare its primary key field '" +
                          definition.primaryKey() + "'"};
  }

  FieldShape shape = unwrapType(*field->type);
  if (shape.relation.has_value() || shape.isCollection ||
      shape.isEntityReference() ||
      std::get<ScalarType>(shape.bareType) != ScalarType::INTEGER)
  {
    throw DefinitionError{"Primary key '" + field->name + "' of entity '" +
                          definition.name() + "' must be an integer, found " +
                          field->type->toString()};
  }
}

}  // namespace

const StorageField* PersistenceSchema::findField(
  std::string_view fieldName) const
{
  auto it = std::find_if(fields.begin(),
                         fields.end(),
                         [fieldName](const StorageField& field)
                         { return field.name == fieldName; });
  return it == fields.end() ? nullptr : &*it;
}

std::vector<std::string> PersistenceSchema::columnNames() const
{
  std::vector<std::string> names;
  names.reserve(fields.size());
  for (const auto& field : fields)
  {
    names.push_back(field.name);
  }
  return names;
}

PersistenceSchema buildPersistenceSchema(const EntityDefinition& definition,
                                         const EntityRegistry& registry)
{
  PersistenceSchema schema;
  schema.entityName = definition.name();
  schema.tableName = definition.tableName();
  schema.primaryKey = definition.primaryKey();
  schema.relationships = extractRelationships(definition);

  checkPrimaryKey(definition);

  auto foreignKeys = synthesizeForeignKeys(definition, schema.relationships);

  for (const auto& field : definition.fields())
  {
    if (schema.relationships.contains(field.name))
    {
      continue;
    }

    FieldShape shape = unwrapType(*field.type);

    StorageField column;
    column.name = field.name;
    column.type = std::get<ScalarType>(shape.bareType);
    column.primaryKey = field.name == schema.primaryKey;
    // The primary key is assigned by storage when left unset
    column.nullable = shape.isNullable && !column.primaryKey;
    column.origin = StorageField::Origin::DECLARED;
    schema.fields.push_back(std::move(column));
  }

  for (const auto& key : foreignKeys)
  {
    const auto& target = registry.require(key.targetEntity, key.relationField);

    StorageField column;
    column.name = key.name;
    column.type = ScalarType::INTEGER;
    column.nullable = key.nullable;
    column.origin = StorageField::Origin::FOREIGN_KEY;
    column.relationField = key.relationField;
    schema.fields.push_back(std::move(column));

    schema.foreignKeys.push_back(ForeignKeyConstraint{
      key.name, target.name(), target.tableName(), target.primaryKey()});
  }

  return schema;
}

}  // namespace cpp_relmap
