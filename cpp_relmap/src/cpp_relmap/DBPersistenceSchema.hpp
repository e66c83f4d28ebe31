#ifndef DB_PERSISTENCE_SCHEMA_HPP
#define DB_PERSISTENCE_SCHEMA_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cpp_relmap/src/cpp_relmap/DBEntityDefinition.hpp"
#include "cpp_relmap/src/cpp_relmap/DBEntityRegistry.hpp"
#include "cpp_relmap/src/cpp_relmap/DBForeignKeySynthesizer.hpp"
#include "cpp_relmap/src/cpp_relmap/DBRelationship.hpp"
#include "cpp_relmap/src/cpp_relmap/DBValue.hpp"

namespace cpp_relmap
{

/*!
 * A column of the derived storage schema.
 */
struct StorageField
{
  enum class Origin : uint8_t
  {
    DECLARED,
    FOREIGN_KEY
  };

  std::string name;
  ScalarType type{ScalarType::INTEGER};
  bool nullable{false};
  bool primaryKey{false};
  Origin origin{Origin::DECLARED};

  //! For FOREIGN_KEY columns, the relationship field the key belongs to
  std::optional<std::string> relationField;

  bool operator==(const StorageField&) const = default;
};

/*!
 * FOREIGN KEY (column) REFERENCES targetTable(targetColumn)
 */
struct ForeignKeyConstraint
{
  std::string column;
  std::string targetEntity;
  std::string targetTable;
  std::string targetColumn;

  bool operator==(const ForeignKeyConstraint&) const = default;
};

/*!
 * \brief The storage-side view of an entity
 *
 * Derived once per entity and immutable afterwards. Relationship fields are
 * never columns; they are carried in relationships() so that resolvers and
 * the transfer projector can see them.
 */
struct PersistenceSchema
{
  std::string entityName;
  std::string tableName;
  std::string primaryKey;

  //! Declared scalar fields, then synthesized keys
  std::vector<StorageField> fields;

  std::vector<ForeignKeyConstraint> foreignKeys;

  RelationshipMap relationships;

  //! \return nullptr when no such column exists
  const StorageField* findField(std::string_view fieldName) const;

  //! Column names in storage order
  std::vector<std::string> columnNames() const;

  bool operator==(const PersistenceSchema&) const = default;
};

/*!
 * \brief Derive the persistence schema of a registered entity
 *
 * Does not memoize; Mapper::deriveSchema() caches the result per entity.
 *
 * \throws DefinitionError for malformed fields, an invalid primary key or a
 *         synthesized key colliding with a declared field
 * \throws UnregisteredTargetError when a to-one target is not registered
 */
PersistenceSchema buildPersistenceSchema(const EntityDefinition& definition,
                                         const EntityRegistry& registry);

}  // namespace cpp_relmap

#endif  // DB_PERSISTENCE_SCHEMA_HPP
