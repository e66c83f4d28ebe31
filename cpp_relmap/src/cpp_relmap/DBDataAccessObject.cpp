#include "cpp_relmap/src/cpp_relmap/DBDataAccessObject.hpp"

#include <utility>

#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/cpp_relmap/DBMapper.hpp"
#include "cpp_relmap/src/cpp_relmap/DBRequiredRelationships.hpp"

namespace cpp_relmap
{

DataAccessObject::DataAccessObject(Mapper& mapper,
                                   const EntityDefinition& definition,
                                   const PersistenceSchema& schema,
                                   std::shared_ptr<spdlog::logger> pLogger)
  : mapper_{mapper},
    definition_{definition},
    schema_{schema},
    validation_{ValidationSchema::fromDefinition(definition)},
    resolvers_{},
    pLogger_{pLogger}
{
  mapper_.storage().ensureTable(schema_);

  for (const auto& descriptor : schema_.relationships)
  {
    if (!descriptor.isToOne())
    {
      continue;
    }

    LOG_SAFE(pLogger_,
             spdlog::level::debug,
             "Installing lazy resolver {}.{} -> {}",
             schema_.entityName,
             descriptor.fieldName,
             descriptor.targetEntity);

    resolvers_.emplace(descriptor.fieldName,
                       LazyReferenceResolver{mapper_, descriptor, pLogger_});
  }
}

RecordPtr DataAccessObject::create(const Row& values)
{
  Row declared;
  Row keys;
  std::vector<FieldError> errors;

  for (const auto& [name, value] : values)
  {
    const auto* column = schema_.findField(name);
    if (column != nullptr && column->origin == StorageField::Origin::FOREIGN_KEY)
    {
      if (!isNull(value) && !asIdentifier(value).has_value())
      {
        errors.push_back(FieldError{name, "expected INTEGER identifier"});
        continue;
      }
      keys[name] = value;
    }
    else if (schema_.relationships.contains(name))
    {
      errors.push_back(
        FieldError{name, "relationship fields are assigned with setRelated()"});
    }
    else
    {
      declared[name] = value;
    }
  }

  ValidationResult result = validation_.validate(declared);
  errors.insert(errors.end(), result.errors.begin(), result.errors.end());

  if (!errors.empty())
  {
    throw ValidationError{schema_.entityName, std::move(errors)};
  }

  Row row = std::move(result.values);
  for (const auto& field : schema_.fields)
  {
    if (field.origin != StorageField::Origin::FOREIGN_KEY)
    {
      continue;
    }
    auto it = keys.find(field.name);
    row[field.name] = it == keys.end() ? Value{} : it->second;
  }

  return std::make_shared<Record>(*this, std::move(row), false);
}

void DataAccessObject::save(Record& record)
{
  if (&record.dao() != this)
  {
    throw InvalidReferenceError{"A " + record.entityName() +
                                " record cannot be saved as " +
                                schema_.entityName};
  }

  validateRequired(record, schema_, pLogger_);

  Row row;
  for (const auto& field : schema_.fields)
  {
    row[field.name] = record.get(field.name);
  }

  Identifier id = mapper_.storage().insertOrUpdate(schema_, row);

  record.assign(schema_.primaryKey, id);
  record.persisted_ = true;
}

RecordPtr DataAccessObject::selectById(Identifier id)
{
  auto row = mapper_.storage().findById(schema_, id);
  if (!row.has_value())
  {
    return nullptr;
  }
  return materialize(std::move(*row));
}

std::vector<RecordPtr> DataAccessObject::selectAll()
{
  std::vector<RecordPtr> records;
  for (auto& row : mapper_.storage().findAll(schema_))
  {
    records.push_back(materialize(std::move(row)));
  }
  return records;
}

bool DataAccessObject::remove(Record& record)
{
  auto id = record.primaryKey();
  if (!record.isPersisted() || !id.has_value())
  {
    throw InvalidReferenceError{"Cannot delete unsaved " +
                                schema_.entityName +
                                " instance. Use save() before remove()"};
  }

  bool removed = mapper_.storage().remove(schema_, *id);
  record.persisted_ = false;

  LOG_SAFE(pLogger_,
           spdlog::level::debug,
           "Removed {}({}): {}",
           schema_.entityName,
           *id,
           removed);

  return removed;
}

const LazyReferenceResolver* DataAccessObject::findResolver(
  std::string_view field) const
{
  auto it = resolvers_.find(std::string{field});
  return it == resolvers_.end() ? nullptr : &it->second;
}

RecordPtr DataAccessObject::materialize(Row row)
{
  // Columns missing from the backend row read as NULL
  for (const auto& field : schema_.fields)
  {
    row.try_emplace(field.name, Value{});
  }
  return std::make_shared<Record>(*this, std::move(row), true);
}

}  // namespace cpp_relmap
