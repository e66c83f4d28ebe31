#ifndef RELMAP_TEST_HPP
#define RELMAP_TEST_HPP

#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cpp_relmap/src/cpp_relmap/DBEntityDefinition.hpp"
#include "cpp_relmap/src/cpp_relmap/DBMapper.hpp"
#include "cpp_relmap/src/cpp_relmap/DBSQLiteStorage.hpp"
#include "cpp_relmap/src/cpp_relmap/DBStorage.hpp"
#include "cpp_relmap/src/utils/Logger.hpp"

/*!
 * Storage decorator counting the calls that reach the backend.
 */
class CountingStorage : public cpp_relmap::StorageBackend
{
public:
  explicit CountingStorage(std::shared_ptr<cpp_relmap::StorageBackend> inner)
    : inner_{std::move(inner)}
  {
  }

  void ensureTable(const cpp_relmap::PersistenceSchema& schema) override
  {
    ensureTableCalls++;
    inner_->ensureTable(schema);
  }

  cpp_relmap::Identifier insertOrUpdate(
    const cpp_relmap::PersistenceSchema& schema,
    const cpp_relmap::Row& row) override
  {
    insertCalls++;
    return inner_->insertOrUpdate(schema, row);
  }

  std::optional<cpp_relmap::Row> findById(
    const cpp_relmap::PersistenceSchema& schema,
    cpp_relmap::Identifier id) override
  {
    findByIdCalls++;
    return inner_->findById(schema, id);
  }

  std::vector<cpp_relmap::Row> findAll(
    const cpp_relmap::PersistenceSchema& schema) override
  {
    findAllCalls++;
    return inner_->findAll(schema);
  }

  bool remove(const cpp_relmap::PersistenceSchema& schema,
              cpp_relmap::Identifier id) override
  {
    removeCalls++;
    return inner_->remove(schema, id);
  }

  void resetCounts()
  {
    ensureTableCalls = 0;
    insertCalls = 0;
    findByIdCalls = 0;
    findAllCalls = 0;
    removeCalls = 0;
  }

  int ensureTableCalls{0};
  int insertCalls{0};
  int findByIdCalls{0};
  int findAllCalls{0};
  int removeCalls{0};

private:
  std::shared_ptr<cpp_relmap::StorageBackend> inner_;
};

class RelmapTest : public ::testing::Test
{
public:
  ~RelmapTest() = default;

protected:
  void SetUp() override;

  //! In-memory SQLite wrapped in a call counter
  std::shared_ptr<CountingStorage> makeStorage();

  //! A mapper over makeStorage() with Author, Book and Review declared
  std::unique_ptr<cpp_relmap::Mapper> makeLibrary();

  //! Author{id, name, books: to-many Book}
  static cpp_relmap::EntityDefinition authorDefinition();

  //! Book{id, title, pages = 0, author: to-one Author}
  static cpp_relmap::EntityDefinition bookDefinition();

  //! Review{id, body, rating?, book: nullable to-one Book}
  static cpp_relmap::EntityDefinition reviewDefinition();

  std::shared_ptr<CountingStorage> storage_;

private:
  const static inline std::string testLogFile = "test_relmap.log";
};

#endif  // RELMAP_TEST_HPP
