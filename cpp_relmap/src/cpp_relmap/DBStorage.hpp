#ifndef DB_STORAGE_HPP
#define DB_STORAGE_HPP

#include <optional>
#include <vector>

#include "cpp_relmap/src/cpp_relmap/DBPersistenceSchema.hpp"
#include "cpp_relmap/src/cpp_relmap/DBValue.hpp"

namespace cpp_relmap
{

/*!
 * Abstract base class for storage backends.
 * The mapper only talks to storage through this interface, and passes
 * backend errors through to its callers unchanged.
 */
class StorageBackend
{
public:
  virtual ~StorageBackend() = default;

  /*!
   * \brief Materialize the table for a schema if it does not exist yet
   */
  virtual void ensureTable(const PersistenceSchema& schema) = 0;

  /*!
   * \brief Insert a row, or update it when its primary key already exists
   *
   * \param row One value per schema column. A NULL primary key asks the
   *        backend to assign one.
   * \return The primary key of the stored row
   */
  virtual Identifier insertOrUpdate(const PersistenceSchema& schema,
                                    const Row& row) = 0;

  /*!
   * \brief Fetch a single row by primary key
   * \return Empty if no row has that key
   */
  virtual std::optional<Row> findById(const PersistenceSchema& schema,
                                      Identifier id) = 0;

  /*!
   * \brief Fetch every row, ordered by primary key
   */
  virtual std::vector<Row> findAll(const PersistenceSchema& schema) = 0;

  /*!
   * \brief Delete a row by primary key
   * \return false if no row had that key
   */
  virtual bool remove(const PersistenceSchema& schema, Identifier id) = 0;
};

}  // namespace cpp_relmap

#endif  // DB_STORAGE_HPP
