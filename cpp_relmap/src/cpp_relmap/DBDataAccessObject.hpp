#ifndef DATA_ACCESS_OBJECT_HPP
#define DATA_ACCESS_OBJECT_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/unordered_map.hpp>

#include "cpp_relmap/src/cpp_relmap/DBEntityDefinition.hpp"
#include "cpp_relmap/src/cpp_relmap/DBLazyReference.hpp"
#include "cpp_relmap/src/cpp_relmap/DBPersistenceSchema.hpp"
#include "cpp_relmap/src/cpp_relmap/DBRecord.hpp"
#include "cpp_relmap/src/cpp_relmap/DBValidationSchema.hpp"
#include "cpp_relmap/src/utils/Logger.hpp"

namespace cpp_relmap
{

class Mapper;

/*!
 * \brief Persistence gateway for one entity
 *
 * Created by the Mapper on the first persistence use of an entity. Creation
 * materializes the storage table and installs one LazyReferenceResolver per
 * to-one relationship.
 */
class DataAccessObject
{
public:
  /*!
   * Construct a data access object for a registered entity and its
   * derived schema. Both must outlive the object.
   */
  DataAccessObject(Mapper& mapper,
                   const EntityDefinition& definition,
                   const PersistenceSchema& schema,
                   std::shared_ptr<spdlog::logger> pLogger = nullptr);

  const std::string& getEntityName() const
  {
    return definition_.name();
  }

  const std::string& getTableName() const
  {
    return schema_.tableName;
  }

  const EntityDefinition& definition() const
  {
    return definition_;
  }

  const PersistenceSchema& schema() const
  {
    return schema_;
  }

  const ValidationSchema& validationSchema() const
  {
    return validation_;
  }

  /*!
   * \brief Build a new, unsaved record
   *
   * Declared fields go through the validation schema (defaults applied).
   * Synthesized keys may be given directly; relationship fields are
   * assigned afterwards with Record::setRelated().
   *
   * \throws ValidationError listing every rejected field
   */
  RecordPtr create(const Row& values = {});

  /*!
   * \brief Insert or update a record
   *
   * Required relationships are checked first; on failure storage is never
   * called. The primary key assigned by storage is written back.
   *
   * \throws RequiredRelationshipError, InvalidReferenceError
   */
  void save(Record& record);

  /*!
   * \brief Select a single record by ID
   * \param id The ID of the record to retrieve
   * \return The record, or nullptr if no row has that key
   */
  RecordPtr selectById(Identifier id);

  /*!
   * \brief Select all records from the table
   * \return Vector of all records, ordered by primary key
   */
  std::vector<RecordPtr> selectAll();

  /*!
   * \brief Delete a saved record
   * \return false if storage no longer had the row
   * \throws InvalidReferenceError if the record was never saved
   */
  bool remove(Record& record);

  /*!
   * \brief The resolver of a to-one relationship
   * \return nullptr if the field is not a to-one relationship
   */
  const LazyReferenceResolver* findResolver(std::string_view field) const;

private:
  RecordPtr materialize(Row row);

  //! Reference to the owning Mapper
  //! The Mapper manages DAO lifetime through its internal storage.
  Mapper& mapper_;

  const EntityDefinition& definition_;
  const PersistenceSchema& schema_;
  ValidationSchema validation_;

  //! Installed resolvers keyed by relationship field
  boost::unordered_map<std::string, LazyReferenceResolver> resolvers_;

  //! The local logger
  std::shared_ptr<spdlog::logger> pLogger_;
};

}  // namespace cpp_relmap

#endif  // DATA_ACCESS_OBJECT_HPP
