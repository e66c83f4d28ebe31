#ifndef DB_MAPPER_HPP
#define DB_MAPPER_HPP

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <boost/unordered_map.hpp>

#include "cpp_relmap/src/cpp_relmap/DBDataAccessObject.hpp"
#include "cpp_relmap/src/cpp_relmap/DBDescribe.hpp"
#include "cpp_relmap/src/cpp_relmap/DBEntityDefinition.hpp"
#include "cpp_relmap/src/cpp_relmap/DBEntityRegistry.hpp"
#include "cpp_relmap/src/cpp_relmap/DBPersistenceSchema.hpp"
#include "cpp_relmap/src/cpp_relmap/DBRecord.hpp"
#include "cpp_relmap/src/cpp_relmap/DBRelationship.hpp"
#include "cpp_relmap/src/cpp_relmap/DBStorage.hpp"
#include "cpp_relmap/src/cpp_relmap/DBTraits.hpp"
#include "cpp_relmap/src/cpp_relmap/DBTransferSchema.hpp"
#include "cpp_relmap/src/cpp_relmap/DBValidationSchema.hpp"
#include "cpp_relmap/src/utils/Logger.hpp"

namespace cpp_relmap
{

/*!
 * \brief Top-level context tying entity definitions to a storage backend
 *
 * Owns the entity registry, the memoized persistence schemas and one
 * DataAccessObject per entity, created on first persistence use.
 *
 * \code
 * auto storage = std::make_shared<SQLiteStorage>(SQLiteStorage::Options{});
 * Mapper mapper{storage, Logger::getInstance().getLogger()};
 * mapper.declare(authorDefinition);
 * mapper.declare(bookDefinition);
 *
 * auto author = mapper.create("Author", {{"name", std::string{"Herbert"}}});
 * mapper.save(*author);
 * \endcode
 *
 * Schema derivation and DAO creation are serialized; records themselves are
 * not synchronized.
 */
class Mapper
{
public:
  /*!
   * \param storage The backend every DAO of this mapper writes to
   * \param pLogger Optional logger
   */
  explicit Mapper(std::shared_ptr<StorageBackend> storage,
                  std::shared_ptr<spdlog::logger> pLogger = nullptr);

  Mapper(const Mapper&) = delete;
  Mapper& operator=(const Mapper&) = delete;

  /*!
   * \brief Register an entity definition
   * \throws DefinitionError when the name or the table name is already
   *         registered
   */
  const EntityDefinition& declare(EntityDefinition definition);

  /*!
   * \brief Register a struct described with BOOST_DESCRIBE_STRUCT
   */
  template <ValidEntity T>
  const EntityDefinition& declare()
  {
    return declare(describeEntity<T>());
  }

  const EntityRegistry& registry() const
  {
    return registry_;
  }

  /*!
   * \brief The persistence schema of a registered entity
   *
   * Derived on first call and memoized; later calls return the same object.
   *
   * \throws DefinitionError if the entity is not registered or malformed
   * \throws UnregisteredTargetError if a to-one target is not registered
   */
  const PersistenceSchema& deriveSchema(std::string_view entityName);

  /*!
   * \brief The persistence schema of a definition
   *
   * Registers the definition when its name is new.
   *
   * \throws DefinitionError if another definition is registered under the
   *         same name
   */
  const PersistenceSchema& deriveSchema(const EntityDefinition& definition);

  /*!
   * \brief Relationship descriptors of a registered entity
   *
   * Does not resolve targets, so it succeeds even when a target is not
   * registered yet.
   */
  RelationshipMap extractRelationships(std::string_view entityName) const;

  ValidationSchema validationSchema(std::string_view entityName) const;

  /*!
   * \brief Get or create the DAO of a registered entity
   *
   * Creation derives the schema, creates the table and installs the lazy
   * resolvers.
   */
  DataAccessObject& getDAO(std::string_view entityName);

  RecordPtr create(std::string_view entityName, const Row& values = {});

  template <ValidEntity T>
  RecordPtr create(const T& object)
  {
    return create(entityName<T>(), toRow(object));
  }

  /*!
   * \brief Create a record from a JSON object
   *
   * Values are coerced as described for ValidationSchema::decodeJson();
   * synthesized keys may be given as JSON integers.
   *
   * \throws ValidationError collecting every decoding and validation failure
   */
  RecordPtr createFromJson(std::string_view entityName, std::string_view json);

  void save(Record& record);

  //! \return nullptr when no row has that key
  RecordPtr findById(std::string_view entityName, Identifier id);

  std::vector<RecordPtr> findAll(std::string_view entityName);

  bool remove(Record& record);

  /*!
   * \brief Transfer schema of a registered entity
   */
  TransferSchema project(std::string_view entityName,
                         RelationshipStrategy strategy);

  StorageBackend& storage()
  {
    return *storage_;
  }

  std::shared_ptr<spdlog::logger> logger() const
  {
    return pLogger_;
  }

private:
  const EntityDefinition& requireEntity(std::string_view entityName) const;

  const PersistenceSchema& deriveSchemaLocked(
    const EntityDefinition& definition);

  std::shared_ptr<StorageBackend> storage_;

  //! The pointer to the spdlog for this object.
  std::shared_ptr<spdlog::logger> pLogger_;

  EntityRegistry registry_;

  //! Memoized schemas keyed by entity name
  boost::unordered_map<std::string, std::unique_ptr<const PersistenceSchema>>
    schemas_;

  //! DAO storage using boost::unordered_map for better performance
  boost::unordered_map<std::string, std::unique_ptr<DataAccessObject>> daos_;

  //! Guards registry_ and schemas_
  mutable std::mutex schemaMutex_;

  //! Guards daos_; always taken before schemaMutex_
  std::mutex daoMutex_;
};

}  // namespace cpp_relmap

#endif  // DB_MAPPER_HPP
