#ifndef DB_TRANSFER_SCHEMA_HPP
#define DB_TRANSFER_SCHEMA_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cpp_relmap/src/cpp_relmap/DBPersistenceSchema.hpp"
#include "cpp_relmap/src/cpp_relmap/DBRecord.hpp"
#include "cpp_relmap/src/cpp_relmap/DBValue.hpp"

namespace cpp_relmap
{

/*!
 * How relationship fields are carried into a transfer schema.
 */
enum class RelationshipStrategy : uint8_t
{
  //! Drop relationship fields and their synthesized keys
  OMIT,
  //! Keep every column and add relationship fields as opaque optionals
  OPAQUE_OPTIONAL,
  //! Drop relationship fields, keep their synthesized keys
  ID_ONLY
};

struct TransferField
{
  enum class Kind : uint8_t
  {
    SCALAR,
    //! Unconstrained optional value, populated by the caller
    OPAQUE
  };

  std::string name;
  Kind kind{Kind::SCALAR};

  //! Empty for OPAQUE fields
  std::optional<ScalarType> type;

  bool nullable{false};

  bool operator==(const TransferField&) const = default;
};

/*!
 * \brief Flat, lazy-free projection of a persistence schema
 *
 * Used to shape data at an API boundary. A transfer schema carries no
 * relationship descriptors, so no resolver can ever be attached to it.
 */
struct TransferSchema
{
  std::string entityName;
  RelationshipStrategy strategy{RelationshipStrategy::OMIT};
  std::vector<TransferField> fields;

  //! \return nullptr when the field is not part of the projection
  const TransferField* find(std::string_view fieldName) const;

  bool contains(std::string_view fieldName) const
  {
    return find(fieldName) != nullptr;
  }

  bool operator==(const TransferSchema&) const = default;
};

/*!
 * \brief Project a persistence schema onto a transfer schema
 *
 * Scalar columns are copied in storage order. Relationship fields follow
 * the strategy; to-many relationships are treated like to-one ones except
 * that they never have a key to keep.
 */
TransferSchema project(const PersistenceSchema& schema,
                       RelationshipStrategy strategy);

/*!
 * \brief Copy a record into a row shaped by a transfer schema
 *
 * Opaque fields are left NULL. Reading the record's columns never triggers
 * lazy resolution.
 *
 * \throws std::invalid_argument if the record is of another entity
 */
Row toTransferRow(const Record& record, const TransferSchema& transferSchema);

std::string_view strategyName(RelationshipStrategy strategy);

}  // namespace cpp_relmap

#endif  // DB_TRANSFER_SCHEMA_HPP
