#ifndef DB_FOREIGN_KEY_SYNTHESIZER_HPP
#define DB_FOREIGN_KEY_SYNTHESIZER_HPP

#include <string>
#include <string_view>
#include <vector>

#include "cpp_relmap/src/cpp_relmap/DBEntityDefinition.hpp"
#include "cpp_relmap/src/cpp_relmap/DBRelationship.hpp"

namespace cpp_relmap
{

/*!
 * A storage-only scalar holding the identifier of a related entity.
 * Its type is always the identifier type (INTEGER).
 */
struct SynthesizedForeignKey
{
  //! Always "{relationField}_id"
  std::string name;

  std::string relationField;
  std::string targetEntity;
  bool nullable{false};

  bool operator==(const SynthesizedForeignKey&) const = default;
};

//! The column name holding the key of a to-one relationship
inline std::string foreignKeyName(std::string_view relationField)
{
  return std::string(relationField) + "_id";
}

/*!
 * \brief Generate one key field per to-one relationship
 *
 * To-many relationships produce nothing: the key lives on the other side.
 *
 * \throws DefinitionError when a synthesized name is already declared
 */
std::vector<SynthesizedForeignKey> synthesizeForeignKeys(
  const EntityDefinition& definition,
  const RelationshipMap& relationships);

}  // namespace cpp_relmap

#endif  // DB_FOREIGN_KEY_SYNTHESIZER_HPP
