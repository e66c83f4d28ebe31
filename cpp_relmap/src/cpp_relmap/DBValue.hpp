#ifndef DB_VALUE_HPP
#define DB_VALUE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cpp_relmap
{

/*!
 * The column types a field can be stored as.
 * Identifiers (primary and foreign keys) are always INTEGER.
 */
enum class ScalarType : uint8_t
{
  INTEGER,
  REAL,
  TEXT,
  BOOLEAN,
  BLOB
};

//! Binary payloads
using Blob = std::vector<uint8_t>;

/*!
 * A single field value. std::monostate stands for NULL / unset.
 */
using Value =
  std::variant<std::monostate, int64_t, double, std::string, bool, Blob>;

//! Field or column name -> value
using Row = std::map<std::string, Value, std::less<>>;

//! The identifier type used by primary and synthesized foreign keys
using Identifier = int64_t;

inline bool isNull(const Value& value)
{
  return std::holds_alternative<std::monostate>(value);
}

inline std::string_view scalarTypeName(ScalarType type)
{
  switch (type)
  {
    case ScalarType::INTEGER:
      return "INTEGER";
    case ScalarType::REAL:
      return "REAL";
    case ScalarType::TEXT:
      return "TEXT";
    case ScalarType::BOOLEAN:
      return "BOOLEAN";
    case ScalarType::BLOB:
      return "BLOB";
  }
  return "UNKNOWN";
}

/*!
 * \brief The scalar type a non-null value carries
 * \return Empty for NULL
 */
inline std::optional<ScalarType> scalarTypeOf(const Value& value)
{
  switch (value.index())
  {
    case 1:
      return ScalarType::INTEGER;
    case 2:
      return ScalarType::REAL;
    case 3:
      return ScalarType::TEXT;
    case 4:
      return ScalarType::BOOLEAN;
    case 5:
      return ScalarType::BLOB;
    default:
      return std::nullopt;
  }
}

/*!
 * \brief Read a value as an identifier
 * \return Empty when the value is NULL or not an integer
 */
inline std::optional<Identifier> asIdentifier(const Value& value)
{
  if (const auto* id = std::get_if<int64_t>(&value))
  {
    return *id;
  }
  return std::nullopt;
}

}  // namespace cpp_relmap

#endif  // DB_VALUE_HPP
