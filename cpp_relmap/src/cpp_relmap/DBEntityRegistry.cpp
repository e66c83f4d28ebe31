#include "cpp_relmap/src/cpp_relmap/DBEntityRegistry.hpp"

#include <utility>

#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/utils/StringUtils.hpp"

namespace cpp_relmap
{

const EntityDefinition& EntityRegistry::declare(EntityDefinition definition)
{
  std::string name = definition.name();

  if (definitions_.find(name) != definitions_.end())
  {
    throw DefinitionError{"Entity '" + name + "' is already registered"};
  }

  // SQLite table names are case-insensitive
  const std::string table = toLower(definition.tableName());
  for (const auto& [otherName, other] : definitions_)
  {
    if (toLower(other->tableName()) == table)
    {
      throw DefinitionError{"Entity '" + name + "' uses table '" +
                            definition.tableName() +
                            "' which is already used by entity '" +
                            otherName + "'"};
    }
  }

  auto owned = std::make_unique<const EntityDefinition>(std::move(definition));
  const auto& ref = *owned;
  definitions_.emplace(name, std::move(owned));
  order_.push_back(std::move(name));
  return ref;
}

const EntityDefinition* EntityRegistry::find(std::string_view entityName) const
{
  auto it = definitions_.find(std::string{entityName});
  if (it == definitions_.end())
  {
    return nullptr;
  }
  return it->second.get();
}

const EntityDefinition& EntityRegistry::require(
  std::string_view entityName,
  std::string_view relationField) const
{
  const auto* definition = find(entityName);
  if (definition == nullptr)
  {
    throw UnregisteredTargetError{std::string{relationField},
                                  std::string{entityName}};
  }
  return *definition;
}

}  // namespace cpp_relmap
