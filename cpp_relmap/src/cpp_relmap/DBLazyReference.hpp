#ifndef DB_LAZY_REFERENCE_HPP
#define DB_LAZY_REFERENCE_HPP

#include <memory>
#include <string>

#include "cpp_relmap/src/cpp_relmap/DBRecord.hpp"
#include "cpp_relmap/src/cpp_relmap/DBRelationship.hpp"
#include "cpp_relmap/src/utils/Logger.hpp"

namespace cpp_relmap
{

class Mapper;

/*!
 * \brief Accessor/mutator pair for one to-one relationship field
 *
 * One resolver is installed per to-one relationship when the owning
 * entity's DataAccessObject is created. The per-instance state lives in the
 * record's cache slot; the resolver itself is stateless and shared by every
 * record of the entity.
 */
class LazyReferenceResolver
{
public:
  LazyReferenceResolver(Mapper& mapper,
                        RelationshipDescriptor descriptor,
                        std::shared_ptr<spdlog::logger> pLogger = nullptr);

  /*!
   * \brief Read the related record
   *
   * A cached value is returned without touching storage. An unset key
   * caches and returns nullptr without a query. Otherwise the target is
   * loaded by primary key and whatever storage returns, including nothing,
   * is cached.
   *
   * \throws UnregisteredTargetError if the target entity is not registered
   */
  RecordPtr get(Record& owner) const;

  /*!
   * \brief Write the related record
   *
   * Updates the cache and the foreign key in one step. nullptr clears the
   * key; whether that is allowed is decided at save time.
   *
   * \throws InvalidReferenceError if value has no primary key or belongs to
   *         another entity
   */
  void set(Record& owner, RecordPtr value) const;

  const RelationshipDescriptor& descriptor() const
  {
    return descriptor_;
  }

  const std::string& foreignKey() const
  {
    return foreignKey_;
  }

private:
  Mapper& mapper_;
  RelationshipDescriptor descriptor_;
  std::string foreignKey_;
  std::shared_ptr<spdlog::logger> pLogger_;
};

}  // namespace cpp_relmap

#endif  // DB_LAZY_REFERENCE_HPP
