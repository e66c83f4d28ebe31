#include "cpp_relmap/src/cpp_relmap/DBTransferSchema.hpp"

#include <algorithm>
#include <stdexcept>

namespace cpp_relmap
{

const TransferField* TransferSchema::find(std::string_view fieldName) const
{
  auto it = std::find_if(fields.begin(),
                         fields.end(),
                         [fieldName](const TransferField& field)
                         { return field.name == fieldName; });
  return it == fields.end() ? nullptr : &*it;
}

TransferSchema project(const PersistenceSchema& schema,
                       RelationshipStrategy strategy)
{
  TransferSchema transfer;
  transfer.entityName = schema.entityName;
  transfer.strategy = strategy;

  for (const auto& column : schema.fields)
  {
    if (column.origin == StorageField::Origin::FOREIGN_KEY &&
        strategy == RelationshipStrategy::OMIT)
    {
      continue;
    }

    // The key is optional on the way in; storage assigns it
    transfer.fields.push_back(
      TransferField{column.name,
                    TransferField::Kind::SCALAR,
                    column.type,
                    column.nullable || column.primaryKey});
  }

  if (strategy == RelationshipStrategy::OPAQUE_OPTIONAL)
  {
    for (const auto& descriptor : schema.relationships)
    {
      transfer.fields.push_back(TransferField{
        descriptor.fieldName, TransferField::Kind::OPAQUE, std::nullopt, true});
    }
  }

  return transfer;
}

Row toTransferRow(const Record& record, const TransferSchema& transferSchema)
{
  if (record.entityName() != transferSchema.entityName)
  {
    throw std::invalid_argument("A " + record.entityName() +
                                " record cannot be shaped as " +
                                transferSchema.entityName);
  }

  Row row;
  for (const auto& field : transferSchema.fields)
  {
    if (field.kind == TransferField::Kind::OPAQUE)
    {
      row[field.name] = std::monostate{};
      continue;
    }
    row[field.name] = record.get(field.name);
  }
  return row;
}

std::string_view strategyName(RelationshipStrategy strategy)
{
  switch (strategy)
  {
    case RelationshipStrategy::OMIT:
      return "omit";
    case RelationshipStrategy::OPAQUE_OPTIONAL:
      return "opaque-optional";
    case RelationshipStrategy::ID_ONLY:
      return "id-only";
  }
  return "unknown";
}

}  // namespace cpp_relmap
