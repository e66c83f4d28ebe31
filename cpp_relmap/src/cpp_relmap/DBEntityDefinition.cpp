#include "cpp_relmap/src/cpp_relmap/DBEntityDefinition.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/utils/StringUtils.hpp"

namespace cpp_relmap
{

std::string EntityDefinition::tableName() const
{
  return tableName_.value_or(toLower(name_));
}

const FieldDeclaration* EntityDefinition::findField(
  std::string_view fieldName) const
{
  auto it = std::find_if(fields_.begin(),
                         fields_.end(),
                         [fieldName](const FieldDeclaration& field)
                         { return field.name == fieldName; });
  return it == fields_.end() ? nullptr : &*it;
}

EntityBuilder::EntityBuilder(std::string entityName)
{
  definition_.name_ = std::move(entityName);
}

EntityBuilder& EntityBuilder::field(std::string name,
                                    TypeExpressionPtr type,
                                    std::optional<Value> defaultValue)
{
  definition_.fields_.push_back(
    FieldDeclaration{std::move(name), std::move(type), std::move(defaultValue)});
  return *this;
}

EntityBuilder& EntityBuilder::primaryKey(std::string fieldName)
{
  definition_.primaryKey_ = std::move(fieldName);
  return *this;
}

EntityBuilder& EntityBuilder::tableName(std::string table)
{
  definition_.tableName_ = std::move(table);
  return *this;
}

EntityDefinition EntityBuilder::build() const
{
  if (definition_.name_.empty())
  {
    throw DefinitionError{"Entity name cannot be empty"};
  }

  if (definition_.primaryKey_.empty())
  {
    throw DefinitionError{"Entity '" + definition_.name_ +
                          "' has an empty primary key name"};
  }

  if (definition_.tableName_.has_value() && definition_.tableName_->empty())
  {
    throw DefinitionError{"Entity '" + definition_.name_ +
                          "' has an empty table name"};
  }

  std::set<std::string, std::less<>> seen;
  for (const auto& field : definition_.fields_)
  {
    if (field.name.empty())
    {
      throw DefinitionError{"Entity '" + definition_.name_ +
                            "' declares a field without a name"};
    }
    if (!field.type)
    {
      throw DefinitionError{"Field '" + field.name + "' of entity '" +
                            definition_.name_ + "' has no type"};
    }
    if (!seen.insert(field.name).second)
    {
      throw DefinitionError{"Entity '" + definition_.name_ +
                            "' declares field '" + field.name + "' twice"};
    }
  }

  return definition_;
}

}  // namespace cpp_relmap
