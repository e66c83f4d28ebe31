#ifndef DB_REQUIRED_RELATIONSHIPS_HPP
#define DB_REQUIRED_RELATIONSHIPS_HPP

#include <memory>

#include "cpp_relmap/src/cpp_relmap/DBPersistenceSchema.hpp"
#include "cpp_relmap/src/cpp_relmap/DBRecord.hpp"
#include "cpp_relmap/src/cpp_relmap/DBValue.hpp"
#include "cpp_relmap/src/utils/Logger.hpp"

namespace cpp_relmap
{

/*!
 * \brief Check that every required to-one relationship has its key set
 *
 * Stops at the first violation. Only NULL/unset keys are detected; a key
 * pointing at a missing row passes. To-many relationships are never checked.
 *
 * \throws RequiredRelationshipError naming the field and the target entity
 */
void validateRequired(const Row& values,
                      const PersistenceSchema& schema,
                      const std::shared_ptr<spdlog::logger>& pLogger = nullptr);

//! \overload
void validateRequired(const Record& record,
                      const PersistenceSchema& schema,
                      const std::shared_ptr<spdlog::logger>& pLogger = nullptr);

}  // namespace cpp_relmap

#endif  // DB_REQUIRED_RELATIONSHIPS_HPP
