#ifndef DB_TYPE_EXPRESSION_HPP
#define DB_TYPE_EXPRESSION_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "cpp_relmap/src/cpp_relmap/DBValue.hpp"

namespace cpp_relmap
{

/*!
 * Metadata attached to a relationship field.
 */
struct RelationMetadata
{
  //! Name of the reverse field on the target entity. Informational only.
  std::optional<std::string> backPopulates;

  bool operator==(const RelationMetadata&) const = default;
};

class TypeExpression;

using TypeExpressionPtr = std::shared_ptr<const TypeExpression>;

/*!
 * \brief The declared type of a field
 *
 * A small immutable tree. Leaves are scalars or (possibly forward) entity
 * references; inner nodes wrap a single child as nullable, as a collection
 * or with relation metadata. Relationship declarations compose as
 *
 *   relation( nullable( list( ref("Entity") ) ) )
 *
 * where every wrapper is optional but the order is fixed. Build expressions
 * with the helpers in cpp_relmap::types rather than the factories directly.
 */
class TypeExpression
{
public:
  enum class Kind : uint8_t
  {
    SCALAR,
    ENTITY_REFERENCE,
    NULLABLE,
    COLLECTION,
    ANNOTATED
  };

  static TypeExpressionPtr scalar(ScalarType type);
  static TypeExpressionPtr entityReference(std::string entityName);
  static TypeExpressionPtr nullable(TypeExpressionPtr inner);
  static TypeExpressionPtr collection(TypeExpressionPtr inner);
  static TypeExpressionPtr annotated(TypeExpressionPtr inner,
                                     RelationMetadata metadata);

  Kind kind() const
  {
    return kind_;
  }

  //! Only meaningful for SCALAR
  ScalarType scalarType() const
  {
    return scalarType_;
  }

  //! Only meaningful for ENTITY_REFERENCE
  const std::string& entityName() const
  {
    return entityName_;
  }

  //! Only meaningful for ANNOTATED
  const RelationMetadata& metadata() const
  {
    return metadata_;
  }

  /*!
   * \brief The wrapped child of a NULLABLE, COLLECTION or ANNOTATED node
   * \throws std::logic_error on a leaf
   */
  const TypeExpression& inner() const;

  /*!
   * \brief Human readable form, e.g. "relation<nullable<Author>>"
   */
  std::string toString() const;

  bool operator==(const TypeExpression& other) const;

private:
  //! Restricts construction to the factories while allowing make_shared
  struct Passkey
  {
    explicit Passkey() = default;
  };

public:
  TypeExpression(Passkey,
                 Kind kind,
                 ScalarType scalarType,
                 std::string entityName,
                 TypeExpressionPtr inner,
                 RelationMetadata metadata);

private:
  Kind kind_;
  ScalarType scalarType_;
  std::string entityName_;
  TypeExpressionPtr inner_;
  RelationMetadata metadata_;
};

/*!
 * Builder helpers for field declarations.
 *
 * \code
 * using namespace cpp_relmap::types;
 * auto book = EntityBuilder{"Book"}
 *               .field("id", integer())
 *               .field("title", text())
 *               .field("author", relation(ref("Author"), {"books"}))
 *               .build();
 * \endcode
 */
namespace types
{

TypeExpressionPtr integer();
TypeExpressionPtr real();
TypeExpressionPtr text();
TypeExpressionPtr boolean();
TypeExpressionPtr blob();

//! Reference another entity by name; the name may not be declared yet.
TypeExpressionPtr ref(std::string entityName);

TypeExpressionPtr nullable(TypeExpressionPtr inner);
TypeExpressionPtr list(TypeExpressionPtr inner);
TypeExpressionPtr relation(TypeExpressionPtr inner,
                           RelationMetadata metadata = {});

//! relation(ref(target))
TypeExpressionPtr toOne(std::string target,
                        std::optional<std::string> backPopulates = {});

//! relation(nullable(ref(target)))
TypeExpressionPtr optionalToOne(std::string target,
                                std::optional<std::string> backPopulates = {});

//! relation(list(ref(target)))
TypeExpressionPtr toMany(std::string target,
                         std::optional<std::string> backPopulates = {});

}  // namespace types

}  // namespace cpp_relmap

#endif  // DB_TYPE_EXPRESSION_HPP
