#include <string>

#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/cpp_relmap/DBTypeExpression.hpp"
#include "cpp_relmap/src/cpp_relmap/DBTypeUnwrapper.hpp"
#include "cpp_relmap/test/testRelmap.hpp"

using namespace cpp_relmap;
using namespace cpp_relmap::types;

TEST_F(RelmapTest, UnwrapPlainScalar)
{
  FieldShape shape = unwrapType(*text());

  ASSERT_EQ(std::get<ScalarType>(shape.bareType), ScalarType::TEXT);
  ASSERT_FALSE(shape.isNullable);
  ASSERT_FALSE(shape.isCollection);
  ASSERT_FALSE(shape.relation.has_value());
  ASSERT_EQ(classifyShape(shape, "title"), FieldShapeKind::PLAIN_SCALAR);
}

TEST_F(RelmapTest, UnwrapNullableScalar)
{
  FieldShape shape = unwrapType(*nullable(real()));

  ASSERT_EQ(std::get<ScalarType>(shape.bareType), ScalarType::REAL);
  ASSERT_TRUE(shape.isNullable);
  ASSERT_EQ(classifyShape(shape, "rating"), FieldShapeKind::NULLABLE_SCALAR);
}

TEST_F(RelmapTest, UnwrapToOneKeepsTargetUnresolved)
{
  // "Publisher" is never declared; unwrapping must not care
  FieldShape shape = unwrapType(*toOne("Publisher", "books"));

  ASSERT_TRUE(shape.isEntityReference());
  ASSERT_EQ(std::get<std::string>(shape.bareType), "Publisher");
  ASSERT_FALSE(shape.isNullable);
  ASSERT_FALSE(shape.isCollection);
  ASSERT_TRUE(shape.relation.has_value());
  ASSERT_EQ(shape.relation->backPopulates, std::optional<std::string>{"books"});
  ASSERT_EQ(classifyShape(shape, "publisher"), FieldShapeKind::TO_ONE);
}

TEST_F(RelmapTest, UnwrapNullableToOne)
{
  FieldShape shape = unwrapType(*optionalToOne("Book"));

  ASSERT_TRUE(shape.isNullable);
  ASSERT_FALSE(shape.relation->backPopulates.has_value());
  ASSERT_EQ(classifyShape(shape, "book"), FieldShapeKind::NULLABLE_TO_ONE);
}

TEST_F(RelmapTest, UnwrapToMany)
{
  FieldShape shape = unwrapType(*toMany("Book", "author"));

  ASSERT_TRUE(shape.isCollection);
  ASSERT_FALSE(shape.isNullable);
  ASSERT_EQ(std::get<std::string>(shape.bareType), "Book");
  ASSERT_EQ(classifyShape(shape, "books"), FieldShapeKind::TO_MANY);
}

TEST_F(RelmapTest, UnwrapNullableCollection)
{
  FieldShape shape = unwrapType(*relation(nullable(list(ref("Book")))));

  ASSERT_TRUE(shape.isNullable);
  ASSERT_TRUE(shape.isCollection);
  ASSERT_EQ(classifyShape(shape, "books"), FieldShapeKind::TO_MANY);
}

TEST_F(RelmapTest, UnwrapRejectsCollectionOfNullable)
{
  ASSERT_THROW(unwrapType(*relation(list(nullable(ref("Book"))))),
               DefinitionError);
}

TEST_F(RelmapTest, UnwrapRejectsWrappersOutOfOrder)
{
  ASSERT_THROW(unwrapType(*nullable(relation(ref("Author")))), DefinitionError);
  ASSERT_THROW(unwrapType(*nullable(nullable(integer()))), DefinitionError);
  ASSERT_THROW(unwrapType(*list(list(ref("Book")))), DefinitionError);
}

TEST_F(RelmapTest, ClassifyRejectsShapesWithoutStorageMeaning)
{
  // Relation metadata over a scalar
  ASSERT_THROW(classifyShape(unwrapType(*relation(integer())), "count"),
               DefinitionError);

  // Entity reference without relation metadata
  ASSERT_THROW(classifyShape(unwrapType(*ref("Author")), "author"),
               DefinitionError);

  // Collection of scalars
  ASSERT_THROW(classifyShape(unwrapType(*list(text())), "tags"),
               DefinitionError);
}

TEST_F(RelmapTest, TypeExpressionToString)
{
  ASSERT_EQ(optionalToOne("Author")->toString(), "relation<nullable<Author>>");
  ASSERT_EQ(toMany("Book")->toString(), "relation<list<Book>>");
  ASSERT_EQ(nullable(integer())->toString(), "nullable<integer>");
}

TEST_F(RelmapTest, TypeExpressionEquality)
{
  ASSERT_EQ(*toOne("Author", "books"), *relation(ref("Author"), {"books"}));
  ASSERT_FALSE(*toOne("Author") == *optionalToOne("Author"));
  ASSERT_FALSE(*toOne("Author", "books") == *toOne("Author", "titles"));
}

TEST_F(RelmapTest, InnerOfLeafThrows)
{
  ASSERT_THROW(integer()->inner(), std::logic_error);
}

TEST_F(RelmapTest, FactoriesShareInnerNodes)
{
  auto author = ref("Author");
  auto optional = nullable(author);

  ASSERT_EQ(&optional->inner(), author.get());
  ASSERT_EQ(author.use_count(), 2);
  ASSERT_EQ(optional->kind(), TypeExpression::Kind::NULLABLE);

  ASSERT_THROW(TypeExpression::nullable(nullptr), std::invalid_argument);
  ASSERT_THROW(TypeExpression::collection(nullptr), std::invalid_argument);
  ASSERT_THROW(TypeExpression::annotated(nullptr, {}), std::invalid_argument);
  ASSERT_THROW(TypeExpression::entityReference(""), std::invalid_argument);
}
