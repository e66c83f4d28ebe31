#include "cpp_relmap/src/cpp_relmap/DBRecord.hpp"

#include <stdexcept>
#include <utility>

#include "cpp_relmap/src/cpp_relmap/DBDataAccessObject.hpp"
#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"

namespace cpp_relmap
{

Record::Record(DataAccessObject& dao, Row values, bool persisted)
  : dao_{&dao}, values_{std::move(values)}, persisted_{persisted}
{
}

const std::string& Record::entityName() const
{
  return dao_->getEntityName();
}

const Value& Record::get(std::string_view field) const
{
  auto it = values_.find(field);
  if (it == values_.end())
  {
    throw std::out_of_range("Entity '" + entityName() + "' has no column '" +
                            std::string{field} + "'");
  }
  return it->second;
}

void Record::set(std::string_view field, Value value)
{
  const auto& schema = dao_->schema();
  const auto* column = schema.findField(field);

  if (column != nullptr && column->origin == StorageField::Origin::FOREIGN_KEY)
  {
    if (!isNull(value) && !asIdentifier(value).has_value())
    {
      throw ValidationError{
        entityName(),
        {FieldError{std::string{field}, "expected INTEGER identifier"}}};
    }
    assign(field, std::move(value));
    // The cached record no longer matches the key
    cacheSlot(*column->relationField).reset();
    return;
  }

  if (schema.relationships.contains(field))
  {
    throw ValidationError{
      entityName(),
      {FieldError{std::string{field},
                  "relationship fields are assigned with setRelated()"}}};
  }

  assign(field, dao_->validationSchema().validateField(field, std::move(value)));
}

RecordPtr Record::related(std::string_view field)
{
  const auto* resolver = dao_->findResolver(field);
  if (resolver == nullptr)
  {
    throw std::invalid_argument("'" + std::string{field} +
                                "' is not a to-one relationship of " +
                                entityName());
  }
  return resolver->get(*this);
}

void Record::setRelated(std::string_view field, RecordPtr value)
{
  const auto* resolver = dao_->findResolver(field);
  if (resolver == nullptr)
  {
    throw std::invalid_argument("'" + std::string{field} +
                                "' is not a to-one relationship of " +
                                entityName());
  }
  resolver->set(*this, std::move(value));
}

std::vector<RecordPtr>& Record::collection(std::string_view field)
{
  const auto* descriptor = dao_->schema().relationships.find(field);
  if (descriptor == nullptr || descriptor->isToOne())
  {
    throw std::invalid_argument("'" + std::string{field} +
                                "' is not a to-many relationship of " +
                                entityName());
  }
  return collections_[std::string{field}];
}

std::optional<Identifier> Record::primaryKey() const
{
  auto it = values_.find(dao_->schema().primaryKey);
  if (it == values_.end())
  {
    return std::nullopt;
  }
  return asIdentifier(it->second);
}

Record::CacheSlot& Record::cacheSlot(std::string_view field)
{
  return relationCache_[std::string{field}];
}

void Record::assign(std::string_view field, Value value)
{
  auto it = values_.find(field);
  if (it == values_.end())
  {
    values_.emplace(std::string{field}, std::move(value));
    return;
  }
  it->second = std::move(value);
}

}  // namespace cpp_relmap
