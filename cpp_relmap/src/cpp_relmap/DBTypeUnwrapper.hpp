#ifndef DB_TYPE_UNWRAPPER_HPP
#define DB_TYPE_UNWRAPPER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "cpp_relmap/src/cpp_relmap/DBTypeExpression.hpp"
#include "cpp_relmap/src/cpp_relmap/DBValue.hpp"

namespace cpp_relmap
{

/*!
 * The canonical shape of a declared field type.
 */
struct FieldShape
{
  //! Either a scalar column type or the (unresolved) name of an entity
  std::variant<ScalarType, std::string> bareType;

  bool isCollection{false};
  bool isNullable{false};

  //! Present only for relationship fields
  std::optional<RelationMetadata> relation;

  bool isEntityReference() const
  {
    return std::holds_alternative<std::string>(bareType);
  }

  bool operator==(const FieldShape&) const = default;
};

/*!
 * The closed set of field shapes the mapper supports.
 */
enum class FieldShapeKind : uint8_t
{
  PLAIN_SCALAR,
  NULLABLE_SCALAR,
  TO_ONE,
  NULLABLE_TO_ONE,
  TO_MANY
};

/*!
 * \brief Normalize a declared type to its canonical shape
 *
 * Wrappers are removed in a fixed order: relation metadata first, then
 * nullability, then the collection wrapper. What remains must be a scalar
 * or an entity reference. Entity names are not resolved here.
 *
 * \throws DefinitionError for any other nesting, e.g. list<nullable<T>>
 */
FieldShape unwrapType(const TypeExpression& type);

/*!
 * \brief Classify a shape for the given field
 *
 * \throws DefinitionError when the shape has no storage meaning: relation
 *         metadata over a scalar, an entity reference without relation
 *         metadata, or a collection of scalars.
 */
FieldShapeKind classifyShape(const FieldShape& shape,
                             std::string_view fieldName);

}  // namespace cpp_relmap

#endif  // DB_TYPE_UNWRAPPER_HPP
