#ifndef DB_DESCRIBE_HPP
#define DB_DESCRIBE_HPP

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <boost/describe.hpp>
#include <boost/mp11.hpp>
#include <boost/type_index.hpp>

#include "cpp_relmap/src/cpp_relmap/DBEntityDefinition.hpp"
#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/cpp_relmap/DBForeignKeySynthesizer.hpp"
#include "cpp_relmap/src/cpp_relmap/DBRecord.hpp"
#include "cpp_relmap/src/cpp_relmap/DBTraits.hpp"
#include "cpp_relmap/src/cpp_relmap/DBTypeExpression.hpp"
#include "cpp_relmap/src/cpp_relmap/DBValue.hpp"
#include "cpp_relmap/src/utils/StringUtils.hpp"

namespace cpp_relmap
{

//! Field name of the key inherited from BaseEntity
inline constexpr std::string_view kEntityIdField{"id"};

/*!
 * \brief Entity name of a described struct
 *
 * The type name with its namespace stripped: library::Author -> "Author".
 */
template <typename T>
std::string entityName()
{
  return stripNamespace(boost::typeindex::type_id<T>().pretty_name());
}

template <isScalar T>
TypeExpressionPtr scalarExpressionFor()
{
  return TypeExpression::scalar(scalarTypeFor<T>());
}

/*!
 * \brief The type expression a member type declares
 */
template <isSupportedMemberType M>
TypeExpressionPtr typeExpressionFor()
{
  if constexpr (IsRelation<M>)
  {
    using traits = relation_traits<M>;
    auto target = entityName<RelationTarget<M>>();

    if constexpr (traits::cardinality == Cardinality::TO_MANY)
    {
      return types::toMany(std::move(target));
    }
    else if constexpr (traits::nullable)
    {
      return types::optionalToOne(std::move(target));
    }
    else
    {
      return types::toOne(std::move(target));
    }
  }
  else if constexpr (is_optional_v<M>)
  {
    return types::nullable(scalarExpressionFor<typename M::value_type>());
  }
  else
  {
    return scalarExpressionFor<M>();
  }
}

/*!
 * \brief Build the entity definition of a struct described with
 *        BOOST_DESCRIBE_STRUCT
 *
 * Every public member, including the inherited id, becomes a field in
 * declaration order. The id is declared as a plain integer: it is optional
 * only until storage assigns it.
 */
template <ValidEntity T>
EntityDefinition describeEntity()
{
  EntityBuilder builder{entityName<T>()};

  boost::mp11::mp_for_each<boost::describe::describe_members<
    T,
    boost::describe::mod_inherited | boost::describe::mod_public>>(
    [&](auto D)
    {
      using memberType = std::remove_cv_t<
        std::remove_reference_t<decltype(std::declval<T>().*D.pointer)>>;

      static_assert(isSupportedMemberType<memberType>,
                    "Unsupported entity member type");

      if (kEntityIdField == D.name)
      {
        builder.field(D.name, types::integer());
      }
      else
      {
        builder.field(D.name, typeExpressionFor<memberType>());
      }
    });

  return builder.build();
}

namespace detail
{

[[noreturn]] inline void throwOutOfRange(const std::string& entity,
                                         std::string_view field)
{
  throw ValidationError{
    entity, {FieldError{std::string{field}, "integer out of range"}}};
}

//! Whether a stored integer fits the member type M
template <isIntegral M>
bool fitsIn(int64_t value)
{
  if constexpr (std::is_signed_v<M>)
  {
    return value >= std::numeric_limits<M>::min() &&
           value <= std::numeric_limits<M>::max();
  }
  else
  {
    return value >= 0 &&
           static_cast<uint64_t>(value) <= std::numeric_limits<M>::max();
  }
}

template <isScalar M>
Value toValue(const M& value, const std::string& entity, std::string_view field)
{
  if constexpr (isBoolean<M>)
  {
    return Value{value};
  }
  else if constexpr (isIntegral<M>)
  {
    if constexpr (std::is_unsigned_v<M> && sizeof(M) >= sizeof(int64_t))
    {
      if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      {
        throwOutOfRange(entity, field);
      }
    }
    return Value{static_cast<int64_t>(value)};
  }
  else if constexpr (floatingPoint<M>)
  {
    return Value{static_cast<double>(value)};
  }
  else
  {
    return Value{value};
  }
}

template <isScalar M>
M fromValue(const Value& value,
            const std::string& entity,
            std::string_view field)
{
  if constexpr (isBoolean<M>)
  {
    if (const auto* flag = std::get_if<bool>(&value))
    {
      return *flag;
    }
    // SQLite keeps booleans as integers
    if (const auto* number = std::get_if<int64_t>(&value))
    {
      return *number != 0;
    }
  }
  else if constexpr (isIntegral<M>)
  {
    if (const auto* number = std::get_if<int64_t>(&value))
    {
      if (!fitsIn<M>(*number))
      {
        throwOutOfRange(entity, field);
      }
      return static_cast<M>(*number);
    }
  }
  else if constexpr (floatingPoint<M>)
  {
    if (const auto* number = std::get_if<double>(&value))
    {
      return static_cast<M>(*number);
    }
    if (const auto* number = std::get_if<int64_t>(&value))
    {
      return static_cast<M>(*number);
    }
  }
  else
  {
    if (const auto* data = std::get_if<M>(&value))
    {
      return *data;
    }
  }

  throw ValidationError{
    entity,
    {FieldError{std::string{field},
                "expected " + std::string{scalarTypeName(scalarTypeFor<M>())}}}};
}

}  // namespace detail

/*!
 * \brief Flatten a described struct into a row of column values
 *
 * To-one relations become their synthesized key columns ({field}_id);
 * to-many relations have no column and are skipped.
 *
 * \throws ValidationError if an unsigned member exceeds the INTEGER range
 */
template <ValidEntity T>
Row toRow(const T& object)
{
  Row row;
  const std::string entity = entityName<T>();

  boost::mp11::mp_for_each<boost::describe::describe_members<
    T,
    boost::describe::mod_inherited | boost::describe::mod_public>>(
    [&](auto D)
    {
      using memberType = std::remove_cv_t<
        std::remove_reference_t<decltype(std::declval<T>().*D.pointer)>>;

      const auto& member = object.*D.pointer;

      if constexpr (IsRelation<memberType>)
      {
        if constexpr (relation_traits<memberType>::cardinality ==
                      Cardinality::TO_ONE)
        {
          row[foreignKeyName(D.name)] =
            member.isSet() ? Value{*member.id} : Value{};
        }
      }
      else if constexpr (is_optional_v<memberType>)
      {
        row[D.name] = member.has_value()
                        ? detail::toValue(*member, entity, D.name)
                        : Value{};
      }
      else
      {
        row[D.name] = detail::toValue(member, entity, D.name);
      }
    });

  return row;
}

/*!
 * \brief Copy a record's column values back into a described struct
 *
 * To-one relations receive the stored key only; call Record::related() to
 * load the target.
 *
 * \throws std::invalid_argument if the record is of another entity
 * \throws ValidationError if a stored value does not fit its member
 */
template <ValidEntity T>
T fromRecord(const Record& record)
{
  if (record.entityName() != entityName<T>())
  {
    throw std::invalid_argument("A " + record.entityName() +
                                " record cannot be read as " +
                                entityName<T>());
  }

  T object{};

  boost::mp11::mp_for_each<boost::describe::describe_members<
    T,
    boost::describe::mod_inherited | boost::describe::mod_public>>(
    [&](auto D)
    {
      using memberType = std::remove_cv_t<
        std::remove_reference_t<decltype(std::declval<T>().*D.pointer)>>;

      auto& member = object.*D.pointer;

      if constexpr (IsRelation<memberType>)
      {
        if constexpr (relation_traits<memberType>::cardinality ==
                      Cardinality::TO_ONE)
        {
          member.id = asIdentifier(record.get(foreignKeyName(D.name)));
        }
      }
      else if constexpr (is_optional_v<memberType>)
      {
        const auto& value = record.get(D.name);
        if (isNull(value))
        {
          member.reset();
        }
        else
        {
          member = detail::fromValue<typename memberType::value_type>(
            value, record.entityName(), D.name);
        }
      }
      else
      {
        member = detail::fromValue<memberType>(
          record.get(D.name), record.entityName(), D.name);
      }
    });

  return object;
}

}  // namespace cpp_relmap

#endif  // DB_DESCRIBE_HPP
