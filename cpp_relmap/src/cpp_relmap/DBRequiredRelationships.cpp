#include "cpp_relmap/src/cpp_relmap/DBRequiredRelationships.hpp"

#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/cpp_relmap/DBForeignKeySynthesizer.hpp"

namespace cpp_relmap
{

void validateRequired(const Row& values,
                      const PersistenceSchema& schema,
                      const std::shared_ptr<spdlog::logger>& pLogger)
{
  for (const auto& descriptor : schema.relationships)
  {
    if (!descriptor.isToOne() || descriptor.nullable)
    {
      continue;
    }

    auto it = values.find(foreignKeyName(descriptor.fieldName));
    if (it == values.end() || isNull(it->second))
    {
      LOG_SAFE(pLogger,
               spdlog::level::warn,
               "Refusing to write {}: required relationship '{}' ({}) is unset",
               schema.entityName,
               descriptor.fieldName,
               descriptor.targetEntity);
      throw RequiredRelationshipError{descriptor.fieldName,
                                      descriptor.targetEntity};
    }
  }
}

void validateRequired(const Record& record,
                      const PersistenceSchema& schema,
                      const std::shared_ptr<spdlog::logger>& pLogger)
{
  validateRequired(record.values(), schema, pLogger);
}

}  // namespace cpp_relmap
