#ifndef DB_ENTITY_REGISTRY_HPP
#define DB_ENTITY_REGISTRY_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/unordered_map.hpp>

#include "cpp_relmap/src/cpp_relmap/DBEntityDefinition.hpp"

namespace cpp_relmap
{

/*!
 * \brief Arena of entity definitions keyed by entity name
 *
 * Resolves forward and self references during schema derivation and lazy
 * resolution. Entries are never removed, and the addresses of registered
 * definitions stay stable for the lifetime of the registry.
 *
 * Not synchronized: register every entity before the first persistence
 * operation and treat the registry as read-only afterwards.
 */
class EntityRegistry
{
public:
  /*!
   * \brief Take ownership of a definition
   * \throws DefinitionError when the name or the table name is already
   *         registered
   */
  const EntityDefinition& declare(EntityDefinition definition);

  //! \return nullptr when no entity with that name is registered
  const EntityDefinition* find(std::string_view entityName) const;

  /*!
   * \brief Look up the target of a relationship
   * \throws UnregisteredTargetError naming the field and the missing target
   */
  const EntityDefinition& require(std::string_view entityName,
                                  std::string_view relationField) const;

  bool contains(std::string_view entityName) const
  {
    return find(entityName) != nullptr;
  }

  //! Registered names, in registration order
  const std::vector<std::string>& names() const
  {
    return order_;
  }

  size_t size() const
  {
    return order_.size();
  }

private:
  boost::unordered_map<std::string, std::unique_ptr<const EntityDefinition>>
    definitions_;

  std::vector<std::string> order_;
};

}  // namespace cpp_relmap

#endif  // DB_ENTITY_REGISTRY_HPP
