#include "cpp_relmap/src/cpp_relmap/DBMapper.hpp"

#include <stdexcept>
#include <utility>

#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/utils/StringUtils.hpp"

namespace cpp_relmap
{

Mapper::Mapper(std::shared_ptr<StorageBackend> storage,
               std::shared_ptr<spdlog::logger> pLogger)
  : storage_{std::move(storage)},
    pLogger_{pLogger},
    registry_{},
    schemas_{},
    daos_{}
{
  if (!storage_)
  {
    throw std::invalid_argument("Mapper requires a storage backend");
  }
}

const EntityDefinition& Mapper::declare(EntityDefinition definition)
{
  std::lock_guard<std::mutex> lock{schemaMutex_};

  const auto& declared = registry_.declare(std::move(definition));

  LOG_SAFE(pLogger_,
           spdlog::level::debug,
           "Declared entity {} ({} fields)",
           declared.name(),
           declared.fields().size());

  return declared;
}

const PersistenceSchema& Mapper::deriveSchema(std::string_view entityName)
{
  std::lock_guard<std::mutex> lock{schemaMutex_};
  return deriveSchemaLocked(requireEntity(entityName));
}

const PersistenceSchema& Mapper::deriveSchema(
  const EntityDefinition& definition)
{
  std::lock_guard<std::mutex> lock{schemaMutex_};

  const auto* registered = registry_.find(definition.name());
  if (registered == nullptr)
  {
    registered = &registry_.declare(definition);
  }
  else if (!(*registered == definition))
  {
    throw DefinitionError{"A different definition of entity '" +
                          definition.name() + "' is already registered"};
  }

  return deriveSchemaLocked(*registered);
}

RelationshipMap Mapper::extractRelationships(std::string_view entityName) const
{
  std::lock_guard<std::mutex> lock{schemaMutex_};
  return cpp_relmap::extractRelationships(requireEntity(entityName));
}

ValidationSchema Mapper::validationSchema(std::string_view entityName) const
{
  std::lock_guard<std::mutex> lock{schemaMutex_};
  return ValidationSchema::fromDefinition(requireEntity(entityName));
}

DataAccessObject& Mapper::getDAO(std::string_view entityName)
{
  std::lock_guard<std::mutex> lock{daoMutex_};

  auto it = daos_.find(std::string{entityName});
  if (it != daos_.end())
  {
    return *it->second;
  }

  const EntityDefinition* definition = nullptr;
  const PersistenceSchema* schema = nullptr;
  {
    std::lock_guard<std::mutex> schemaLock{schemaMutex_};
    definition = &requireEntity(entityName);
    schema = &deriveSchemaLocked(*definition);
  }

  LOG_SAFE(pLogger_,
           spdlog::level::debug,
           "Creating DAO for {} (table {})",
           schema->entityName,
           schema->tableName);

  auto dao =
    std::make_unique<DataAccessObject>(*this, *definition, *schema, pLogger_);
  auto& daoRef = *dao;
  daos_.emplace(std::string{entityName}, std::move(dao));
  return daoRef;
}

RecordPtr Mapper::create(std::string_view entityName, const Row& values)
{
  return getDAO(entityName).create(values);
}

RecordPtr Mapper::createFromJson(std::string_view entityName,
                                 std::string_view json)
{
  ValidationSchema schema = validationSchema(entityName);
  ValidationResult decoded = schema.decodeJson(json);
  if (!decoded.ok())
  {
    LOG_SAFE(pLogger_,
             spdlog::level::debug,
             "Rejected JSON input for {} ({} errors)",
             schema.entityName(),
             decoded.errors.size());
    throw ValidationError{schema.entityName(), std::move(decoded.errors)};
  }

  return create(entityName, decoded.values);
}

void Mapper::save(Record& record)
{
  getDAO(record.entityName()).save(record);
}

RecordPtr Mapper::findById(std::string_view entityName, Identifier id)
{
  return getDAO(entityName).selectById(id);
}

std::vector<RecordPtr> Mapper::findAll(std::string_view entityName)
{
  return getDAO(entityName).selectAll();
}

bool Mapper::remove(Record& record)
{
  return getDAO(record.entityName()).remove(record);
}

TransferSchema Mapper::project(std::string_view entityName,
                               RelationshipStrategy strategy)
{
  const auto& schema = deriveSchema(entityName);

  LOG_SAFE(pLogger_,
           spdlog::level::debug,
           "Projecting {} with strategy {}",
           schema.entityName,
           strategyName(strategy));

  return cpp_relmap::project(schema, strategy);
}

const EntityDefinition& Mapper::requireEntity(std::string_view entityName) const
{
  const auto* definition = registry_.find(entityName);
  if (definition == nullptr)
  {
    throw DefinitionError{"Entity '" + std::string{entityName} +
                          "' is not registered"};
  }
  return *definition;
}

const PersistenceSchema& Mapper::deriveSchemaLocked(
  const EntityDefinition& definition)
{
  auto it = schemas_.find(definition.name());
  if (it != schemas_.end())
  {
    return *it->second;
  }

  auto schema = std::make_unique<const PersistenceSchema>(
    buildPersistenceSchema(definition, registry_));

  LOG_SAFE(pLogger_,
           spdlog::level::debug,
           "Derived schema for {}: table {} ({}), {} relationship(s)",
           schema->entityName,
           schema->tableName,
           join(schema->columnNames(), ", "),
           schema->relationships.size());

  const auto& schemaRef = *schema;
  schemas_.emplace(definition.name(), std::move(schema));
  return schemaRef;
}

}  // namespace cpp_relmap
