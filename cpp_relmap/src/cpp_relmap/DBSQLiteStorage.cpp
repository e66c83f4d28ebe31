#include "cpp_relmap/src/cpp_relmap/DBSQLiteStorage.hpp"

#include <sstream>
#include <utility>

#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/utils/StringUtils.hpp"

namespace cpp_relmap
{

namespace
{

std::string sqlType(ScalarType type)
{
  switch (type)
  {
    case ScalarType::INTEGER:
    case ScalarType::BOOLEAN:
      return "INTEGER";
    case ScalarType::REAL:
      return "REAL";
    case ScalarType::TEXT:
      return "TEXT";
    case ScalarType::BLOB:
      return "BLOB";
  }
  return "BLOB";
}

//! Double-quoted SQL identifier, so that keywords like "order" are usable
std::string quoteIdentifier(const std::string& name)
{
  std::string quoted{"\""};
  for (char c : name)
  {
    if (c == '"')
    {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::vector<std::string> quoteIdentifiers(const std::vector<std::string>& names)
{
  std::vector<std::string> quoted;
  quoted.reserve(names.size());
  for (const auto& name : names)
  {
    quoted.push_back(quoteIdentifier(name));
  }
  return quoted;
}

/*!
 * Resets a statement when leaving scope so that it can be reused even if
 * reading the results throws.
 */
class StatementReset
{
public:
  explicit StatementReset(sqlite3_stmt* stmt) : stmt_{stmt}
  {
  }

  ~StatementReset()
  {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  StatementReset(const StatementReset&) = delete;
  StatementReset& operator=(const StatementReset&) = delete;

private:
  sqlite3_stmt* stmt_;
};

}  // namespace

SQLiteStorage::SQLiteStorage(Options options,
                             std::shared_ptr<spdlog::logger> pLogger)
  : db_(nullptr, sqlite3_close), pLogger_{pLogger}
{
  LOG_SAFE(pLogger_,
           spdlog::level::debug,
           "Opening SQLite storage with url: {}",
           options.url);

  sqlite3* raw_db = nullptr;

  // Determine flags based on allowWrite parameter
  int flags = options.allowWrite ? (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE)
                                 : SQLITE_OPEN_READONLY;

  // Open the database
  int result = sqlite3_open_v2(options.url.c_str(), &raw_db, flags, nullptr);

  if (result != SQLITE_OK)
  {
    std::string error_msg = "Failed to open database: ";
    if (raw_db)
    {
      error_msg += sqlite3_errmsg(raw_db);
      sqlite3_close(raw_db);
    }
    else
    {
      error_msg += "Unknown error";
    }
    throw StorageError(error_msg);
  }

  // Transfer ownership to unique_ptr
  db_.reset(raw_db);

  if (options.enforceForeignKeys)
  {
    execute("PRAGMA foreign_keys = ON;");
  }
}

sqlite3& SQLiteStorage::getRawDB()
{
  return *db_;
}

void SQLiteStorage::ensureTable(const PersistenceSchema& schema)
{
  std::lock_guard<std::mutex> lock(mutex_);
  ensureTableLocked(schema);
}

Identifier SQLiteStorage::insertOrUpdate(const PersistenceSchema& schema,
                                         const Row& row)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto& statements = ensureTableLocked(schema);
  sqlite3_stmt* stmt = statements.upsertStmt.get();
  StatementReset reset{stmt};

  // Track parameter index (SQLite uses 1-based indexing)
  int paramIndex = 1;
  std::optional<Identifier> primaryKey;

  for (const auto& field : schema.fields)
  {
    auto it = row.find(field.name);
    const Value value = it == row.end() ? Value{} : it->second;

    if (field.primaryKey)
    {
      primaryKey = asIdentifier(value);
    }

    bindValue(stmt, paramIndex, value);
    paramIndex++;
  }

  int result = sqlite3_step(stmt);
  if (result != SQLITE_DONE)
  {
    fail("Insert into " + schema.tableName + " failed", result);
  }

  // A NULL INTEGER PRIMARY KEY is assigned by SQLite
  Identifier id = primaryKey.value_or(sqlite3_last_insert_rowid(db_.get()));

  LOG_SAFE(
    pLogger_, spdlog::level::debug, "Stored {} row {}", schema.tableName, id);

  return id;
}

std::optional<Row> SQLiteStorage::findById(const PersistenceSchema& schema,
                                           Identifier id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto& statements = ensureTableLocked(schema);
  sqlite3_stmt* stmt = statements.selectByIdStmt.get();
  StatementReset reset{stmt};

  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id));

  auto rows = readRows(stmt, schema);
  if (rows.empty())
  {
    return std::nullopt;
  }

  return std::move(rows.front());
}

std::vector<Row> SQLiteStorage::findAll(const PersistenceSchema& schema)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto& statements = ensureTableLocked(schema);
  sqlite3_stmt* stmt = statements.selectAllStmt.get();
  StatementReset reset{stmt};

  return readRows(stmt, schema);
}

bool SQLiteStorage::remove(const PersistenceSchema& schema, Identifier id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto& statements = ensureTableLocked(schema);
  sqlite3_stmt* stmt = statements.deleteStmt.get();
  StatementReset reset{stmt};

  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id));

  int result = sqlite3_step(stmt);
  if (result != SQLITE_DONE)
  {
    fail("Delete from " + schema.tableName + " failed", result);
  }

  return sqlite3_changes(db_.get()) > 0;
}

SQLiteStorage::TableStatements& SQLiteStorage::ensureTableLocked(
  const PersistenceSchema& schema)
{
  auto it = tables_.find(schema.tableName);
  if (it != tables_.end())
  {
    return it->second;
  }

  std::string createQuery = generateCreateTableSQL(schema);
  LOG_SAFE(pLogger_, spdlog::level::trace, "Executing: {}", createQuery);
  execute(createQuery);

  TableStatements statements{prepare(generateUpsertSQL(schema)),
                             prepare(generateSelectByIdSQL(schema)),
                             prepare(generateSelectAllSQL(schema)),
                             prepare(generateDeleteSQL(schema))};

  auto inserted = tables_.emplace(schema.tableName, std::move(statements));
  return inserted.first->second;
}

PreparedSQLStmt SQLiteStorage::prepare(const std::string& sql)
{
  LOG_SAFE(pLogger_, spdlog::level::debug, sql);

  sqlite3_stmt* rawPtr = nullptr;
  int result = sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &rawPtr, nullptr);

  if (result != SQLITE_OK)
  {
    sqlite3_finalize(rawPtr);
    fail("Could not prepare statement '" + sql + "'", result);
  }

  return PreparedSQLStmt{rawPtr, sqlite3_finalize};
}

void SQLiteStorage::execute(const std::string& sql)
{
  char* err_msg = nullptr;
  int result = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);

  if (result != SQLITE_OK)
  {
    std::string message = err_msg ? err_msg : sqlite3_errstr(result);
    sqlite3_free(err_msg);
    LOG_SAFE(pLogger_, spdlog::level::err, "SQL error: {}", message);
    throw StorageError("SQL error executing '" + sql + "': " + message);
  }
}

void SQLiteStorage::bindValue(sqlite3_stmt* stmt, int index, const Value& value)
{
  int result = SQLITE_OK;

  if (std::holds_alternative<std::monostate>(value))
  {
    result = sqlite3_bind_null(stmt, index);
  }
  else if (const auto* integer = std::get_if<int64_t>(&value))
  {
    result =
      sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(*integer));
  }
  else if (const auto* real = std::get_if<double>(&value))
  {
    result = sqlite3_bind_double(stmt, index, *real);
  }
  else if (const auto* text = std::get_if<std::string>(&value))
  {
    result = sqlite3_bind_text(stmt,
                               index,
                               text->c_str(),
                               static_cast<int>(text->length()),
                               SQLITE_TRANSIENT);
  }
  else if (const auto* flag = std::get_if<bool>(&value))
  {
    result = sqlite3_bind_int64(stmt, index, *flag ? 1 : 0);
  }
  else if (const auto* blob = std::get_if<Blob>(&value))
  {
    result = sqlite3_bind_blob(stmt,
                               index,
                               blob->data(),
                               static_cast<int>(blob->size()),
                               SQLITE_TRANSIENT);
  }

  if (result != SQLITE_OK)
  {
    fail("Could not bind parameter " + std::to_string(index), result);
  }
}

std::vector<Row> SQLiteStorage::readRows(sqlite3_stmt* stmt,
                                         const PersistenceSchema& schema)
{
  std::vector<Row> rows;

  int result = SQLITE_ROW;
  while ((result = sqlite3_step(stmt)) == SQLITE_ROW)
  {
    Row row;
    int columnIndex = 0;

    for (const auto& field : schema.fields)
    {
      if (sqlite3_column_type(stmt, columnIndex) == SQLITE_NULL)
      {
        row[field.name] = std::monostate{};
        columnIndex++;
        continue;
      }

      switch (field.type)
      {
        case ScalarType::INTEGER:
          row[field.name] =
            static_cast<int64_t>(sqlite3_column_int64(stmt, columnIndex));
          break;
        case ScalarType::REAL:
          row[field.name] = sqlite3_column_double(stmt, columnIndex);
          break;
        case ScalarType::TEXT:
        {
          const unsigned char* text = sqlite3_column_text(stmt, columnIndex);
          int textSize = sqlite3_column_bytes(stmt, columnIndex);
          row[field.name] =
            text ? std::string(reinterpret_cast<const char*>(text),
                               static_cast<size_t>(textSize))
                 : std::string{};
          break;
        }
        case ScalarType::BOOLEAN:
          row[field.name] = sqlite3_column_int64(stmt, columnIndex) != 0;
          break;
        case ScalarType::BLOB:
        {
          const void* blobData = sqlite3_column_blob(stmt, columnIndex);
          int blobSize = sqlite3_column_bytes(stmt, columnIndex);

          Blob blob;
          if (blobData && blobSize > 0)
          {
            const uint8_t* data = static_cast<const uint8_t*>(blobData);
            blob.assign(data, data + blobSize);
          }
          row[field.name] = std::move(blob);
          break;
        }
      }
      columnIndex++;
    }

    rows.push_back(std::move(row));
  }

  if (result != SQLITE_DONE)
  {
    fail("Select from " + schema.tableName + " failed", result);
  }

  return rows;
}

void SQLiteStorage::fail(const std::string& context, int code)
{
  std::string message =
    context + " (SQLite code " + std::to_string(code) + "): " +
    sqlite3_errmsg(db_.get());
  LOG_SAFE(pLogger_, spdlog::level::err, message);
  throw StorageError(message);
}

std::string SQLiteStorage::generateCreateTableSQL(
  const PersistenceSchema& schema)
{
  std::vector<std::string> definitions;

  for (const auto& field : schema.fields)
  {
    std::string column = quoteIdentifier(field.name) + " " + sqlType(field.type);

    if (field.primaryKey)
    {
      column += " PRIMARY KEY";
    }
    else if (!field.nullable)
    {
      column += " NOT NULL";
    }

    definitions.push_back(std::move(column));
  }

  for (const auto& constraint : schema.foreignKeys)
  {
    definitions.push_back("FOREIGN KEY (" + quoteIdentifier(constraint.column) +
                          ") REFERENCES " +
                          quoteIdentifier(constraint.targetTable) + "(" +
                          quoteIdentifier(constraint.targetColumn) + ")");
  }

  return "CREATE TABLE IF NOT EXISTS " + quoteIdentifier(schema.tableName) +
         " (" + join(definitions, ", ") + ");";
}

std::string SQLiteStorage::generateUpsertSQL(const PersistenceSchema& schema)
{
  std::ostringstream sql;
  auto columns = quoteIdentifiers(schema.columnNames());
  const std::string primaryKey = quoteIdentifier(schema.primaryKey);

  std::vector<std::string> placeholders(columns.size(), "?");
  std::vector<std::string> updates;
  for (const auto& column : columns)
  {
    if (column != primaryKey)
    {
      updates.push_back(column + " = excluded." + column);
    }
  }

  sql << "INSERT INTO " << quoteIdentifier(schema.tableName) << " ("
      << join(columns, ", ") << ") VALUES (" << join(placeholders, ", ")
      << ") ON CONFLICT(" << primaryKey << ") DO ";

  if (updates.empty())
  {
    sql << "NOTHING;";
  }
  else
  {
    sql << "UPDATE SET " << join(updates, ", ") << ";";
  }

  return sql.str();
}

std::string SQLiteStorage::generateSelectByIdSQL(
  const PersistenceSchema& schema)
{
  std::ostringstream sql;
  sql << "SELECT " << join(quoteIdentifiers(schema.columnNames()), ", ")
      << " FROM " << quoteIdentifier(schema.tableName) << " WHERE "
      << quoteIdentifier(schema.primaryKey) << " = ?;";
  return sql.str();
}

std::string SQLiteStorage::generateSelectAllSQL(
  const PersistenceSchema& schema)
{
  std::ostringstream sql;
  sql << "SELECT " << join(quoteIdentifiers(schema.columnNames()), ", ")
      << " FROM " << quoteIdentifier(schema.tableName) << " ORDER BY "
      << quoteIdentifier(schema.primaryKey) << ";";
  return sql.str();
}

std::string SQLiteStorage::generateDeleteSQL(const PersistenceSchema& schema)
{
  std::ostringstream sql;
  sql << "DELETE FROM " << quoteIdentifier(schema.tableName) << " WHERE "
      << quoteIdentifier(schema.primaryKey) << " = ?;";
  return sql.str();
}

}  // namespace cpp_relmap
