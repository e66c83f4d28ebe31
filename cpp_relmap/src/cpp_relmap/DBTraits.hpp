#ifndef DB_TRAITS_HPP
#define DB_TRAITS_HPP

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "cpp_relmap/src/DBBaseEntity.hpp"
#include "cpp_relmap/src/cpp_relmap/DBRelation.hpp"
#include "cpp_relmap/src/cpp_relmap/DBRelationship.hpp"
#include "cpp_relmap/src/cpp_relmap/DBValue.hpp"

namespace cpp_relmap
{

// Primary concept: Must derive from BaseEntity
template <typename T>
concept Entity = std::derived_from<T, BaseEntity>;

// Comprehensive concept combining common requirements
template <typename T>
concept ValidEntity =
  Entity<T> && std::default_initializable<T> && std::copyable<T>;

template <typename T>
struct is_vector : std::false_type
{
};

template <typename T, typename Allocator>
struct is_vector<std::vector<T, Allocator>> : std::true_type
{
};

template <typename T>
inline constexpr bool is_vector_v = is_vector<T>::value;

template <typename T>
struct is_optional : std::false_type
{
};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type
{
};

template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

// --- Relation Type Traits ---

// Primary template for detecting Relation
template <typename T>
struct relation_traits
{
  static constexpr bool is_relation = false;
};

// Relation<T>: required to-one
template <typename T>
struct relation_traits<Relation<T>>
{
  static constexpr bool is_relation = true;
  static constexpr Cardinality cardinality = Cardinality::TO_ONE;
  static constexpr bool nullable = false;
  using target_type = T;
};

// Relation<std::optional<T>>: nullable to-one
template <typename T>
struct relation_traits<Relation<std::optional<T>>>
{
  static constexpr bool is_relation = true;
  static constexpr Cardinality cardinality = Cardinality::TO_ONE;
  static constexpr bool nullable = true;
  using target_type = T;
};

// Relation<std::vector<T>>: to-many
template <typename T, typename Allocator>
struct relation_traits<Relation<std::vector<T, Allocator>>>
{
  static_assert(!is_optional_v<T>,
                "A to-many relation cannot hold optional elements");

  static constexpr bool is_relation = true;
  static constexpr Cardinality cardinality = Cardinality::TO_MANY;
  static constexpr bool nullable = false;
  using target_type = T;
};

// Concept for detecting Relation types
template <typename T>
concept IsRelation = relation_traits<T>::is_relation;

// Helper alias to get the referenced type
template <IsRelation T>
using RelationTarget = typename relation_traits<T>::target_type;

// --- Basic Type Concepts ---

// bool is integral in the standard library; it maps to its own column type
template <typename T>
concept isBoolean = std::is_same_v<T, bool>;
template <typename T>
concept isIntegral = std::integral<T> && !isBoolean<T>;
template <typename T>
concept floatingPoint = std::floating_point<T>;
template <typename T>
concept isString = std::is_same_v<T, std::string>;
template <typename T>
concept isBlob = std::is_same_v<T, std::vector<uint8_t>>;

template <typename T>
concept isScalar = isBoolean<T> || isIntegral<T> || floatingPoint<T> ||
                   isString<T> || isBlob<T>;

/*!
 * A member type supported by the mapper is either:
 *  - A scalar (integral, floating point, bool, string or BLOB)
 *  - An optional scalar
 *  - A Relation to another entity
 */
template <typename T>
concept isSupportedMemberType =
  isScalar<T> || (is_optional_v<T> && isScalar<typename T::value_type>) ||
  IsRelation<T>;

template <isScalar T>
constexpr ScalarType scalarTypeFor()
{
  if constexpr (isBoolean<T>)
  {
    return ScalarType::BOOLEAN;
  }
  else if constexpr (isIntegral<T>)
  {
    return ScalarType::INTEGER;
  }
  else if constexpr (floatingPoint<T>)
  {
    return ScalarType::REAL;
  }
  else if constexpr (isString<T>)
  {
    return ScalarType::TEXT;
  }
  else
  {
    return ScalarType::BLOB;
  }
}

}  // namespace cpp_relmap

#endif  // DB_TRAITS_HPP
