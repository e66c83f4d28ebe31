#ifndef DB_RELATIONSHIP_HPP
#define DB_RELATIONSHIP_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cpp_relmap/src/cpp_relmap/DBEntityDefinition.hpp"

namespace cpp_relmap
{

enum class Cardinality : uint8_t
{
  TO_ONE,
  TO_MANY
};

/*!
 * Extracted description of a cross-entity reference field.
 */
struct RelationshipDescriptor
{
  std::string fieldName;

  //! Target entity as written; resolved through the EntityRegistry later
  std::string targetEntity;

  Cardinality cardinality{Cardinality::TO_ONE};

  //! To-many relationships are never null-checked
  bool nullable{false};

  //! Informational only, no live back-reference is maintained
  std::optional<std::string> reverseField;

  bool isToOne() const
  {
    return cardinality == Cardinality::TO_ONE;
  }

  bool operator==(const RelationshipDescriptor&) const = default;
};

/*!
 * \brief Field name -> relationship descriptor, in declaration order
 */
class RelationshipMap
{
public:
  using const_iterator = std::vector<RelationshipDescriptor>::const_iterator;

  void insert(RelationshipDescriptor descriptor);

  //! \return nullptr when the field is not a relationship
  const RelationshipDescriptor* find(std::string_view fieldName) const;

  bool contains(std::string_view fieldName) const
  {
    return find(fieldName) != nullptr;
  }

  size_t size() const
  {
    return descriptors_.size();
  }

  bool empty() const
  {
    return descriptors_.empty();
  }

  const_iterator begin() const
  {
    return descriptors_.begin();
  }

  const_iterator end() const
  {
    return descriptors_.end();
  }

  bool operator==(const RelationshipMap&) const = default;

private:
  std::vector<RelationshipDescriptor> descriptors_;
};

/*!
 * \brief Collect every relationship field of an entity
 *
 * Fields without relation metadata are plain scalars and produce no
 * descriptor. Target names are recorded without being resolved, so forward
 * and self references never fail here.
 *
 * \throws DefinitionError for malformed type expressions
 */
RelationshipMap extractRelationships(const EntityDefinition& definition);

}  // namespace cpp_relmap

#endif  // DB_RELATIONSHIP_HPP
