#include <string>

#include "cpp_relmap/src/cpp_relmap/DBEntityDefinition.hpp"
#include "cpp_relmap/src/cpp_relmap/DBEntityRegistry.hpp"
#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/cpp_relmap/DBForeignKeySynthesizer.hpp"
#include "cpp_relmap/src/cpp_relmap/DBRelationship.hpp"
#include "cpp_relmap/test/testRelmap.hpp"

using namespace cpp_relmap;
using namespace cpp_relmap::types;

TEST_F(RelmapTest, ExtractBookRelationships)
{
  auto relationships = extractRelationships(bookDefinition());

  ASSERT_EQ(relationships.size(), 1u);
  const auto* author = relationships.find("author");
  ASSERT_NE(author, nullptr);
  ASSERT_EQ(author->targetEntity, "Author");
  ASSERT_EQ(author->cardinality, Cardinality::TO_ONE);
  ASSERT_FALSE(author->nullable);
  ASSERT_EQ(author->reverseField, std::optional<std::string>{"books"});

  ASSERT_FALSE(relationships.contains("title"));
  ASSERT_FALSE(relationships.contains("pages"));
}

TEST_F(RelmapTest, ExtractAuthorRelationships)
{
  auto relationships = extractRelationships(authorDefinition());

  ASSERT_EQ(relationships.size(), 1u);
  const auto* books = relationships.find("books");
  ASSERT_NE(books, nullptr);
  ASSERT_EQ(books->targetEntity, "Book");
  ASSERT_EQ(books->cardinality, Cardinality::TO_MANY);
  ASSERT_FALSE(books->isToOne());
}

TEST_F(RelmapTest, ExtractWithoutRelationshipsIsEmpty)
{
  auto definition = EntityBuilder{"Tag"}
                      .field("id", integer())
                      .field("label", text())
                      .field("weight", nullable(real()))
                      .build();

  ASSERT_TRUE(extractRelationships(definition).empty());
}

TEST_F(RelmapTest, ExtractPreservesDeclarationOrder)
{
  auto definition = EntityBuilder{"Loan"}
                      .field("id", integer())
                      .field("member", toOne("Member"))
                      .field("book", toOne("Book"))
                      .field("witness", optionalToOne("Member"))
                      .build();

  auto relationships = extractRelationships(definition);

  std::vector<std::string> names;
  for (const auto& descriptor : relationships)
  {
    names.push_back(descriptor.fieldName);
  }
  ASSERT_EQ(names, (std::vector<std::string>{"member", "book", "witness"}));
}

TEST_F(RelmapTest, ExtractFailsOnMalformedField)
{
  auto definition = EntityBuilder{"Broken"}
                      .field("id", integer())
                      .field("owner", ref("Person"))
                      .build();

  ASSERT_THROW(extractRelationships(definition), DefinitionError);
}

TEST_F(RelmapTest, SynthesizeOneKeyPerToOne)
{
  auto definition = bookDefinition();
  auto keys =
    synthesizeForeignKeys(definition, extractRelationships(definition));

  ASSERT_EQ(keys.size(), 1u);
  ASSERT_EQ(keys[0].name, "author_id");
  ASSERT_EQ(keys[0].relationField, "author");
  ASSERT_EQ(keys[0].targetEntity, "Author");
  ASSERT_FALSE(keys[0].nullable);
}

TEST_F(RelmapTest, SynthesizeNothingForToMany)
{
  auto definition = authorDefinition();
  auto keys =
    synthesizeForeignKeys(definition, extractRelationships(definition));

  ASSERT_TRUE(keys.empty());
}

TEST_F(RelmapTest, SynthesizedKeyOfNullableRelationIsNullable)
{
  auto definition = reviewDefinition();
  auto keys =
    synthesizeForeignKeys(definition, extractRelationships(definition));

  ASSERT_EQ(keys.size(), 1u);
  ASSERT_EQ(keys[0].name, "book_id");
  ASSERT_TRUE(keys[0].nullable);
}

TEST_F(RelmapTest, SynthesizedKeyCollisionIsRejected)
{
  auto definition = EntityBuilder{"Book"}
                      .field("id", integer())
                      .field("author_id", text())
                      .field("author", toOne("Author"))
                      .build();

  ASSERT_THROW(
    synthesizeForeignKeys(definition, extractRelationships(definition)),
    DefinitionError);
}

TEST_F(RelmapTest, BuilderRejectsInvalidDefinitions)
{
  ASSERT_THROW(EntityBuilder{""}.field("id", integer()).build(),
               DefinitionError);
  ASSERT_THROW(
    EntityBuilder{"Book"}.field("id", integer()).field("id", text()).build(),
    DefinitionError);
  ASSERT_THROW(EntityBuilder{"Book"}.field("", integer()).build(),
               DefinitionError);
  ASSERT_THROW(EntityBuilder{"Book"}.field("title", nullptr).build(),
               DefinitionError);
}

TEST_F(RelmapTest, TableNameDefaultsToLowerCasedEntityName)
{
  ASSERT_EQ(bookDefinition().tableName(), "book");

  auto definition = EntityBuilder{"BookLoan"}
                      .field("loan_id", integer())
                      .primaryKey("loan_id")
                      .tableName("loans")
                      .build();
  ASSERT_EQ(definition.tableName(), "loans");
  ASSERT_EQ(definition.primaryKey(), "loan_id");
  ASSERT_EQ(EntityBuilder{"BookLoan"}.field("id", integer()).build().tableName(),
            "bookloan");
}

TEST_F(RelmapTest, RegistryRejectsDuplicatesAndReportsMissingTargets)
{
  EntityRegistry registry;
  registry.declare(bookDefinition());

  ASSERT_TRUE(registry.contains("Book"));
  ASSERT_EQ(registry.find("Author"), nullptr);
  ASSERT_THROW(registry.declare(bookDefinition()), DefinitionError);

  try
  {
    registry.require("Author", "author");
    FAIL() << "Expected UnregisteredTargetError";
  }
  catch (const UnregisteredTargetError& error)
  {
    ASSERT_EQ(error.field(), "author");
    ASSERT_EQ(error.target(), "Author");
  }

  registry.declare(authorDefinition());
  ASSERT_EQ(registry.names(), (std::vector<std::string>{"Book", "Author"}));
  ASSERT_EQ(registry.require("Author", "author").name(), "Author");
}

TEST_F(RelmapTest, DeclareRejectsSharedTableName)
{
  auto mapper = makeLibrary();

  auto clash = EntityBuilder{"Edition"}
                 .field("id", integer())
                 .tableName("Book")
                 .build();
  ASSERT_THROW(mapper->declare(clash), DefinitionError);
  ASSERT_FALSE(mapper->registry().contains("Edition"));

  auto loans = EntityBuilder{"Loan"}
                 .field("id", integer())
                 .tableName("loans")
                 .build();
  mapper->declare(loans);

  auto renewal = EntityBuilder{"Renewal"}
                   .field("id", integer())
                   .tableName("loans")
                   .build();
  ASSERT_THROW(mapper->declare(renewal), DefinitionError);
  ASSERT_THROW(mapper->deriveSchema(renewal), DefinitionError);
}
