#include "cpp_relmap/src/cpp_relmap/DBLazyReference.hpp"

#include <utility>

#include "cpp_relmap/src/cpp_relmap/DBDataAccessObject.hpp"
#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/cpp_relmap/DBForeignKeySynthesizer.hpp"
#include "cpp_relmap/src/cpp_relmap/DBMapper.hpp"

namespace cpp_relmap
{

LazyReferenceResolver::LazyReferenceResolver(
  Mapper& mapper,
  RelationshipDescriptor descriptor,
  std::shared_ptr<spdlog::logger> pLogger)
  : mapper_{mapper},
    descriptor_{std::move(descriptor)},
    foreignKey_{foreignKeyName(descriptor_.fieldName)},
    pLogger_{pLogger}
{
}

RecordPtr LazyReferenceResolver::get(Record& owner) const
{
  auto& slot = owner.cacheSlot(descriptor_.fieldName);
  if (slot.has_value())
  {
    return *slot;
  }

  auto id = asIdentifier(owner.get(foreignKey_));
  if (!id.has_value())
  {
    slot = RecordPtr{};
    return nullptr;
  }

  mapper_.registry().require(descriptor_.targetEntity, descriptor_.fieldName);

  LOG_SAFE(pLogger_,
           spdlog::level::debug,
           "Resolving {}.{} -> {}({})",
           owner.entityName(),
           descriptor_.fieldName,
           descriptor_.targetEntity,
           *id);

  RecordPtr target = mapper_.getDAO(descriptor_.targetEntity).selectById(*id);
  if (!target)
  {
    LOG_SAFE(pLogger_,
             spdlog::level::debug,
             "{}.{} points at missing {}({})",
             owner.entityName(),
             descriptor_.fieldName,
             descriptor_.targetEntity,
             *id);
  }

  slot = target;
  return target;
}

void LazyReferenceResolver::set(Record& owner, RecordPtr value) const
{
  if (!value)
  {
    owner.assign(foreignKey_, std::monostate{});
    owner.cacheSlot(descriptor_.fieldName) = RecordPtr{};
    return;
  }

  if (value->entityName() != descriptor_.targetEntity)
  {
    throw InvalidReferenceError{"Relationship '" + descriptor_.fieldName +
                                "' expects a " + descriptor_.targetEntity +
                                " instance, got " + value->entityName()};
  }

  auto id = value->primaryKey();
  if (!id.has_value())
  {
    throw InvalidReferenceError{"Related " + descriptor_.targetEntity +
                                " assigned to '" + descriptor_.fieldName +
                                "' must be saved first (it has no primary "
                                "key)"};
  }

  owner.assign(foreignKey_, *id);
  owner.cacheSlot(descriptor_.fieldName) = std::move(value);
}

}  // namespace cpp_relmap
