#ifndef DB_SQLITE_STORAGE_HPP
#define DB_SQLITE_STORAGE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/unordered_map.hpp>
#include "sqlite3.h"

#include "cpp_relmap/src/cpp_relmap/DBPersistenceSchema.hpp"
#include "cpp_relmap/src/cpp_relmap/DBStorage.hpp"
#include "cpp_relmap/src/utils/Logger.hpp"

namespace cpp_relmap
{

/*!
 * A wrapping alias for the sqlite3 prepared statement
 * that allows us to use modern C++ memory management
 * with this library.
 */
using PreparedSQLStmt =
  std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

/*!
 * \brief StorageBackend on top of the SQLite C API
 *
 * Tables are created from derived persistence schemas and the statements
 * for each table are prepared once and reused. Every SQLite failure is
 * raised as a StorageError carrying the SQLite message.
 */
class SQLiteStorage : public StorageBackend
{
public:
  struct Options
  {
    //! The string url to pass to sqlite3_open_v2
    std::string url{":memory:"};

    //! Open read-write (creating the file) instead of read-only
    bool allowWrite{true};

    //! Run PRAGMA foreign_keys = ON after opening
    bool enforceForeignKeys{false};
  };

  /*!
   * \brief Open the database described by the options
   * \throws StorageError if SQLite cannot open the url
   */
  explicit SQLiteStorage(Options options,
                         std::shared_ptr<spdlog::logger> pLogger = nullptr);

  void ensureTable(const PersistenceSchema& schema) override;

  Identifier insertOrUpdate(const PersistenceSchema& schema,
                            const Row& row) override;

  std::optional<Row> findById(const PersistenceSchema& schema,
                              Identifier id) override;

  std::vector<Row> findAll(const PersistenceSchema& schema) override;

  bool remove(const PersistenceSchema& schema, Identifier id) override;

  /*!
   * \brief Get raw SQLite database pointer for direct access
   * \return Raw sqlite3 reference
   */
  sqlite3& getRawDB();

  //! The CREATE TABLE statement for a schema
  static std::string generateCreateTableSQL(const PersistenceSchema& schema);

private:
  //! The prepared statements of one table
  struct TableStatements
  {
    PreparedSQLStmt upsertStmt;
    PreparedSQLStmt selectByIdStmt;
    PreparedSQLStmt selectAllStmt;
    PreparedSQLStmt deleteStmt;
  };

  TableStatements& ensureTableLocked(const PersistenceSchema& schema);

  PreparedSQLStmt prepare(const std::string& sql);

  void execute(const std::string& sql);

  void bindValue(sqlite3_stmt* stmt, int index, const Value& value);

  std::vector<Row> readRows(sqlite3_stmt* stmt,
                            const PersistenceSchema& schema);

  [[noreturn]] void fail(const std::string& context, int code);

  static std::string generateUpsertSQL(const PersistenceSchema& schema);
  static std::string generateSelectByIdSQL(const PersistenceSchema& schema);
  static std::string generateSelectAllSQL(const PersistenceSchema& schema);
  static std::string generateDeleteSQL(const PersistenceSchema& schema);

  //!< The unique pointer storing the SQLite database
  //!< object
  std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db_;

  //! The pointer to the spdlog for this object.
  std::shared_ptr<spdlog::logger> pLogger_;

  //! Statements keyed by table name
  boost::unordered_map<std::string, TableStatements> tables_;

  //! Serializes statement use; prepared statements are not reentrant
  std::mutex mutex_;
};

}  // namespace cpp_relmap

#endif  // DB_SQLITE_STORAGE_HPP
