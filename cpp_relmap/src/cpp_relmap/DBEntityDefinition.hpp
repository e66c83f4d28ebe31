#ifndef DB_ENTITY_DEFINITION_HPP
#define DB_ENTITY_DEFINITION_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cpp_relmap/src/cpp_relmap/DBTypeExpression.hpp"
#include "cpp_relmap/src/cpp_relmap/DBValue.hpp"

namespace cpp_relmap
{

/*!
 * A single declared field of an entity.
 */
struct FieldDeclaration
{
  std::string name;
  TypeExpressionPtr type;

  //! Applied by the validation schema when the field is omitted
  std::optional<Value> defaultValue;

  bool operator==(const FieldDeclaration& other) const
  {
    return name == other.name && *type == *other.type &&
           defaultValue == other.defaultValue;
  }
};

/*!
 * \brief An author-declared entity
 *
 * Immutable after construction. Schema derivation produces separate
 * artifacts and never writes back into the definition.
 */
class EntityDefinition
{
public:
  const std::string& name() const
  {
    return name_;
  }

  const std::vector<FieldDeclaration>& fields() const
  {
    return fields_;
  }

  //! Name of the primary key field, "id" unless overridden
  const std::string& primaryKey() const
  {
    return primaryKey_;
  }

  //! The storage table name: the override or the lower-cased entity name
  std::string tableName() const;

  /*!
   * \brief Find a declared field by name
   * \return nullptr when the field is not declared
   */
  const FieldDeclaration* findField(std::string_view fieldName) const;

  bool operator==(const EntityDefinition& other) const = default;

private:
  friend class EntityBuilder;

  EntityDefinition() = default;

  std::string name_;
  std::vector<FieldDeclaration> fields_;
  std::string primaryKey_{"id"};
  std::optional<std::string> tableName_;
};

/*!
 * \brief Fluent construction of an EntityDefinition
 *
 * \code
 * using namespace cpp_relmap::types;
 * auto author = EntityBuilder{"Author"}
 *                 .field("id", integer())
 *                 .field("name", text())
 *                 .field("books", toMany("Book", "author"))
 *                 .build();
 * \endcode
 */
class EntityBuilder
{
public:
  explicit EntityBuilder(std::string entityName);

  EntityBuilder& field(std::string name,
                       TypeExpressionPtr type,
                       std::optional<Value> defaultValue = std::nullopt);

  EntityBuilder& primaryKey(std::string fieldName);

  EntityBuilder& tableName(std::string table);

  /*!
   * \brief Produce the definition
   * \throws DefinitionError on an empty entity name, an empty or duplicate
   *         field name, or a missing type
   */
  EntityDefinition build() const;

private:
  EntityDefinition definition_;
};

}  // namespace cpp_relmap

#endif  // DB_ENTITY_DEFINITION_HPP
