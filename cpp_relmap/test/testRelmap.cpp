#include "cpp_relmap/test/testRelmap.hpp"

#include "cpp_relmap/src/cpp_relmap/DBTypeExpression.hpp"

using namespace cpp_relmap;

void RelmapTest::SetUp()
{
  // Configure logger for testing with debug level
  Logger::getInstance().configure(
    "test_cpp_relmap", testLogFile, spdlog::level::debug);
}

std::shared_ptr<CountingStorage> RelmapTest::makeStorage()
{
  auto sqlite = std::make_shared<SQLiteStorage>(
    SQLiteStorage::Options{}, Logger::getInstance().getLogger());
  return std::make_shared<CountingStorage>(sqlite);
}

std::unique_ptr<Mapper> RelmapTest::makeLibrary()
{
  storage_ = makeStorage();
  auto mapper =
    std::make_unique<Mapper>(storage_, Logger::getInstance().getLogger());

  // Book is declared before Author to exercise the forward reference
  mapper->declare(bookDefinition());
  mapper->declare(authorDefinition());
  mapper->declare(reviewDefinition());
  return mapper;
}

EntityDefinition RelmapTest::authorDefinition()
{
  using namespace cpp_relmap::types;
  return EntityBuilder{"Author"}
    .field("id", integer())
    .field("name", text())
    .field("books", toMany("Book", "author"))
    .build();
}

EntityDefinition RelmapTest::bookDefinition()
{
  using namespace cpp_relmap::types;
  return EntityBuilder{"Book"}
    .field("id", integer())
    .field("title", text())
    .field("pages", integer(), Value{int64_t{0}})
    .field("author", toOne("Author", "books"))
    .build();
}

EntityDefinition RelmapTest::reviewDefinition()
{
  using namespace cpp_relmap::types;
  return EntityBuilder{"Review"}
    .field("id", integer())
    .field("body", text())
    .field("rating", nullable(real()))
    .field("book", optionalToOne("Book"))
    .build();
}
