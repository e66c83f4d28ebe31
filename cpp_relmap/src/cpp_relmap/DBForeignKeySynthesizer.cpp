#include "cpp_relmap/src/cpp_relmap/DBForeignKeySynthesizer.hpp"

#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"

namespace cpp_relmap
{

std::vector<SynthesizedForeignKey> synthesizeForeignKeys(
  const EntityDefinition& definition,
  const RelationshipMap& relationships)
{
  std::vector<SynthesizedForeignKey> keys;

  for (const auto& descriptor : relationships)
  {
    if (!descriptor.isToOne())
    {
      continue;
    }

    std::string name = foreignKeyName(descriptor.fieldName);

    if (definition.findField(name) != nullptr)
    {
      throw DefinitionError{"Foreign key '" + name + "' synthesized for "
                            "relationship '" + descriptor.fieldName +
                            "' collides with a declared field of entity '" +
                            definition.name() + "'"};
    }

    keys.push_back(SynthesizedForeignKey{std::move(name),
                                         descriptor.fieldName,
                                         descriptor.targetEntity,
                                         descriptor.nullable});
  }

  return keys;
}

}  // namespace cpp_relmap
