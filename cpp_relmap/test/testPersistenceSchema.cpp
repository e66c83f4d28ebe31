#include <string>
#include <thread>
#include <vector>

#include "cpp_relmap/src/cpp_relmap/DBEntityRegistry.hpp"
#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/cpp_relmap/DBMapper.hpp"
#include "cpp_relmap/src/cpp_relmap/DBPersistenceSchema.hpp"
#include "cpp_relmap/src/cpp_relmap/DBSQLiteStorage.hpp"
#include "cpp_relmap/test/testRelmap.hpp"

using namespace cpp_relmap;
using namespace cpp_relmap::types;

TEST_F(RelmapTest, BookSchemaHasSynthesizedKeyAndNoRelationshipColumn)
{
  EntityRegistry registry;
  registry.declare(authorDefinition());
  const auto& book = registry.declare(bookDefinition());

  PersistenceSchema schema = buildPersistenceSchema(book, registry);

  ASSERT_EQ(schema.entityName, "Book");
  ASSERT_EQ(schema.tableName, "book");
  ASSERT_EQ(schema.primaryKey, "id");
  ASSERT_EQ(schema.columnNames(),
            (std::vector<std::string>{"id", "title", "pages", "author_id"}));
  ASSERT_EQ(schema.findField("author"), nullptr);

  const auto* key = schema.findField("author_id");
  ASSERT_NE(key, nullptr);
  ASSERT_EQ(key->type, ScalarType::INTEGER);
  ASSERT_FALSE(key->nullable);
  ASSERT_EQ(key->origin, StorageField::Origin::FOREIGN_KEY);
  ASSERT_EQ(key->relationField, std::optional<std::string>{"author"});

  ASSERT_TRUE(schema.findField("id")->primaryKey);
  ASSERT_FALSE(schema.findField("id")->nullable);

  ASSERT_EQ(schema.foreignKeys.size(), 1u);
  ASSERT_EQ(schema.foreignKeys[0],
            (ForeignKeyConstraint{"author_id", "Author", "author", "id"}));

  ASSERT_TRUE(schema.relationships.contains("author"));
}

TEST_F(RelmapTest, AuthorSchemaHasNoKeyForToMany)
{
  EntityRegistry registry;
  const auto& author = registry.declare(authorDefinition());

  // Book is not registered: to-many targets are not needed for derivation
  PersistenceSchema schema = buildPersistenceSchema(author, registry);

  ASSERT_EQ(schema.columnNames(), (std::vector<std::string>{"id", "name"}));
  ASSERT_TRUE(schema.foreignKeys.empty());

  const auto* books = schema.relationships.find("books");
  ASSERT_NE(books, nullptr);
  ASSERT_EQ(books->cardinality, Cardinality::TO_MANY);
}

TEST_F(RelmapTest, NullableRelationshipProducesNullableKey)
{
  EntityRegistry registry;
  registry.declare(authorDefinition());
  registry.declare(bookDefinition());
  const auto& review = registry.declare(reviewDefinition());

  PersistenceSchema schema = buildPersistenceSchema(review, registry);

  ASSERT_TRUE(schema.findField("book_id")->nullable);
  ASSERT_TRUE(schema.findField("rating")->nullable);
  ASSERT_FALSE(schema.findField("body")->nullable);
}

TEST_F(RelmapTest, UnregisteredToOneTargetFailsDerivation)
{
  EntityRegistry registry;
  const auto& book = registry.declare(bookDefinition());

  try
  {
    buildPersistenceSchema(book, registry);
    FAIL() << "Expected UnregisteredTargetError";
  }
  catch (const UnregisteredTargetError& error)
  {
    ASSERT_EQ(error.field(), "author");
    ASSERT_EQ(error.target(), "Author");
  }
}

TEST_F(RelmapTest, SelfReferenceDerives)
{
  EntityRegistry registry;
  const auto& category = registry.declare(EntityBuilder{"Category"}
                                            .field("id", integer())
                                            .field("name", text())
                                            .field("parent",
                                                   optionalToOne("Category"))
                                            .build());

  PersistenceSchema schema = buildPersistenceSchema(category, registry);

  ASSERT_EQ(schema.foreignKeys.size(), 1u);
  ASSERT_EQ(schema.foreignKeys[0].targetTable, "category");
  ASSERT_TRUE(schema.findField("parent_id")->nullable);
}

TEST_F(RelmapTest, PrimaryKeyMustBeDeclaredInteger)
{
  EntityRegistry registry;

  const auto& missing = registry.declare(
    EntityBuilder{"Missing"}.field("name", text()).build());
  ASSERT_THROW(buildPersistenceSchema(missing, registry), DefinitionError);

  const auto& textual = registry.declare(
    EntityBuilder{"Textual"}.field("id", text()).build());
  ASSERT_THROW(buildPersistenceSchema(textual, registry), DefinitionError);

  const auto& custom = registry.declare(EntityBuilder{"Custom"}
                                          .field("code", integer())
                                          .field("label", text())
                                          .primaryKey("code")
                                          .build());
  PersistenceSchema schema = buildPersistenceSchema(custom, registry);
  ASSERT_EQ(schema.primaryKey, "code");
  ASSERT_TRUE(schema.findField("code")->primaryKey);
}

TEST_F(RelmapTest, DeriveSchemaIsMemoized)
{
  auto mapper = makeLibrary();

  const auto& first = mapper->deriveSchema("Book");
  const auto& second = mapper->deriveSchema("Book");
  ASSERT_EQ(&first, &second);

  // Structurally equal to a fresh build
  EntityRegistry registry;
  registry.declare(authorDefinition());
  const auto& book = registry.declare(bookDefinition());
  ASSERT_EQ(first, buildPersistenceSchema(book, registry));

  // Deriving by definition returns the memoized schema as well
  ASSERT_EQ(&mapper->deriveSchema(bookDefinition()), &first);
}

TEST_F(RelmapTest, DeriveSchemaLeavesDefinitionUntouched)
{
  auto mapper = makeLibrary();
  auto before = *mapper->registry().find("Book");

  mapper->deriveSchema("Book");

  ASSERT_EQ(*mapper->registry().find("Book"), before);
  ASSERT_EQ(mapper->registry().find("Book")->findField("author_id"), nullptr);
}

TEST_F(RelmapTest, DeriveSchemaRejectsConflictingDefinition)
{
  auto mapper = makeLibrary();

  auto other = EntityBuilder{"Book"}.field("id", integer()).build();
  ASSERT_THROW(mapper->deriveSchema(other), DefinitionError);
  ASSERT_THROW(mapper->deriveSchema("Nope"), DefinitionError);
}

TEST_F(RelmapTest, DeriveSchemaRegistersNewDefinition)
{
  auto mapper = makeLibrary();

  auto tag =
    EntityBuilder{"Tag"}.field("id", integer()).field("label", text()).build();
  const auto& schema = mapper->deriveSchema(tag);

  ASSERT_EQ(schema.tableName, "tag");
  ASSERT_TRUE(mapper->registry().contains("Tag"));
}

TEST_F(RelmapTest, MapperExtractRelationshipsDoesNotResolveTargets)
{
  storage_ = makeStorage();
  Mapper mapper{storage_, Logger::getInstance().getLogger()};
  mapper.declare(bookDefinition());

  auto relationships = mapper.extractRelationships("Book");
  ASSERT_TRUE(relationships.contains("author"));

  ASSERT_THROW(mapper.deriveSchema("Book"), UnregisteredTargetError);

  // Nothing was memoized by the failed attempt
  mapper.declare(authorDefinition());
  ASSERT_NO_THROW(mapper.deriveSchema("Book"));
}

TEST_F(RelmapTest, CreateTableStatement)
{
  EntityRegistry registry;
  registry.declare(authorDefinition());
  const auto& book = registry.declare(bookDefinition());

  ASSERT_EQ(SQLiteStorage::generateCreateTableSQL(
              buildPersistenceSchema(book, registry)),
            "CREATE TABLE IF NOT EXISTS \"book\" (\"id\" INTEGER PRIMARY KEY, "
            "\"title\" TEXT NOT NULL, \"pages\" INTEGER NOT NULL, "
            "\"author_id\" INTEGER NOT NULL, "
            "FOREIGN KEY (\"author_id\") REFERENCES \"author\"(\"id\"));");
}

TEST_F(RelmapTest, ConcurrentFirstUseBuildsOnce)
{
  auto mapper = makeLibrary();
  constexpr int threadCount = 8;

  std::vector<const PersistenceSchema*> schemas(threadCount, nullptr);
  std::vector<DataAccessObject*> daos(threadCount, nullptr);
  std::vector<std::thread> threads;

  for (int i = 0; i < threadCount; ++i)
  {
    threads.emplace_back(
      [&, i]()
      {
        schemas[i] = &mapper->deriveSchema("Book");
        daos[i] = &mapper->getDAO("Book");
      });
  }
  for (auto& thread : threads)
  {
    thread.join();
  }

  for (int i = 0; i < threadCount; ++i)
  {
    ASSERT_EQ(schemas[i], schemas[0]);
    ASSERT_EQ(daos[i], daos[0]);
  }
  ASSERT_EQ(&daos[0]->schema(), schemas[0]);
  ASSERT_EQ(storage_->ensureTableCalls, 1);
}
