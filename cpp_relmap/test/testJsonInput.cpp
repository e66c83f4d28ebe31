#include <algorithm>
#include <string>
#include <vector>

#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/cpp_relmap/DBValidationSchema.hpp"
#include "cpp_relmap/test/testRelmap.hpp"

using namespace cpp_relmap;
using namespace cpp_relmap::types;

namespace
{

EntityDefinition userDefinition()
{
  return EntityBuilder{"User"}
    .field("id", integer())
    .field("name", text())
    .field("age", integer())
    .build();
}

bool hasErrorFor(const std::vector<FieldError>& errors, const std::string& field)
{
  return std::any_of(errors.begin(),
                     errors.end(),
                     [&field](const FieldError& error)
                     { return error.field == field; });
}

}  // namespace

TEST_F(RelmapTest, CreateFromJsonWithCorrectData)
{
  storage_ = makeStorage();
  Mapper mapper{storage_, Logger::getInstance().getLogger()};
  mapper.declare(userDefinition());

  auto user = mapper.createFromJson(
    "User", R"({"id": 123, "name": "Alice Cooper", "age": 28})");

  ASSERT_EQ(user->entityName(), "User");
  ASSERT_EQ(user->primaryKey(), std::optional<Identifier>{123});
  ASSERT_EQ(user->get("name"), Value{std::string{"Alice Cooper"}});
  ASSERT_EQ(user->get("age"), Value{int64_t{28}});
}

TEST_F(RelmapTest, CreateFromJsonCoercesNumericStrings)
{
  storage_ = makeStorage();
  Mapper mapper{storage_, Logger::getInstance().getLogger()};
  mapper.declare(userDefinition());

  auto user = mapper.createFromJson(
    "User", R"({"id": "123", "name": "Bob Dylan", "age": 30})");

  ASSERT_EQ(user->get("id"), Value{int64_t{123}});
  ASSERT_EQ(user->get("name"), Value{std::string{"Bob Dylan"}});
  ASSERT_EQ(user->get("age"), Value{int64_t{30}});

  mapper.save(*user);
  auto stored = mapper.findById("User", 123);
  ASSERT_NE(stored, nullptr);
  ASSERT_EQ(stored->get("age"), Value{int64_t{30}});
}

TEST_F(RelmapTest, CreateFromJsonReportsMissingField)
{
  storage_ = makeStorage();
  Mapper mapper{storage_, Logger::getInstance().getLogger()};
  mapper.declare(userDefinition());

  try
  {
    mapper.createFromJson("User", R"({"id": 123, "name": "Charlie Brown"})");
    FAIL() << "Expected ValidationError";
  }
  catch (const ValidationError& error)
  {
    ASSERT_EQ(error.entity(), "User");
    ASSERT_TRUE(hasErrorFor(error.errors(), "age"));
  }
}

TEST_F(RelmapTest, CreateFromJsonRejectsUncoercibleValues)
{
  storage_ = makeStorage();
  Mapper mapper{storage_, Logger::getInstance().getLogger()};
  mapper.declare(userDefinition());

  try
  {
    mapper.createFromJson(
      "User", R"({"id": 789, "name": "Bob Smith", "age": "not_a_number"})");
    FAIL() << "Expected ValidationError";
  }
  catch (const ValidationError& error)
  {
    ASSERT_EQ(error.errors().size(), 1u);
    ASSERT_EQ(error.errors()[0].field, "age");
  }

  // Numbers are not silently turned into text
  ASSERT_THROW(mapper.createFromJson("User", R"({"name": 42, "age": 1})"),
               ValidationError);
  ASSERT_THROW(mapper.createFromJson("User", R"({"name": "x", "age": 1.5})"),
               ValidationError);
}

TEST_F(RelmapTest, ValidateJsonRejectsMalformedDocuments)
{
  auto schema = ValidationSchema::fromDefinition(userDefinition());

  auto broken = schema.validateJson(R"({"name": "Alice",)");
  ASSERT_FALSE(broken.ok());
  ASSERT_EQ(broken.errors[0].field, "");

  auto array = schema.validateJson(R"([1, 2, 3])");
  ASSERT_FALSE(array.ok());
  ASSERT_EQ(array.errors[0].message, "expected a JSON object");

  auto unknown = schema.validateJson(R"({"name": "A", "age": 1, "email": "a"})");
  ASSERT_FALSE(unknown.ok());
  ASSERT_TRUE(hasErrorFor(unknown.errors, "email"));
}

TEST_F(RelmapTest, ValidateJsonCoercesByFieldType)
{
  auto schema = ValidationSchema::fromDefinition(
    EntityBuilder{"Reading"}
      .field("id", integer())
      .field("value", real())
      .field("count", integer())
      .field("valid", boolean())
      .field("raw", blob())
      .field("note", nullable(text()))
      .build());

  auto result = schema.validateJson(
    R"({"value": "2.5", "count": 3.0, "valid": "yes", "raw": "ab", "note": null})");

  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.values.at("value"), Value{2.5});
  ASSERT_EQ(result.values.at("count"), Value{int64_t{3}});
  ASSERT_EQ(result.values.at("valid"), Value{true});
  ASSERT_EQ(result.values.at("raw"), (Value{Blob{'a', 'b'}}));
  ASSERT_TRUE(isNull(result.values.at("note")));
  ASSERT_TRUE(isNull(result.values.at("id")));

  auto integerReal = schema.validateJson(
    R"({"value": 4, "count": "7", "valid": 0, "raw": ""})");
  ASSERT_TRUE(integerReal.ok());
  ASSERT_EQ(integerReal.values.at("value"), Value{4.0});
  ASSERT_EQ(integerReal.values.at("valid"), Value{false});

  auto invalid =
    schema.validateJson(R"({"value": 1, "count": 1, "valid": 2, "raw": 5})");
  ASSERT_FALSE(invalid.ok());
  ASSERT_TRUE(hasErrorFor(invalid.errors, "valid"));
  ASSERT_TRUE(hasErrorFor(invalid.errors, "raw"));
}

TEST_F(RelmapTest, CreateFromJsonAcceptsSynthesizedKeys)
{
  auto mapper = makeLibrary();
  auto author = mapper->create("Author", {{"name", std::string{"Herbert"}}});
  mapper->save(*author);

  auto book = mapper->createFromJson(
    "Book",
    R"({"title": "Dune", "author_id": )" +
      std::to_string(*author->primaryKey()) + "}");

  ASSERT_EQ(book->get("pages"), Value{int64_t{0}});
  ASSERT_NO_THROW(mapper->save(*book));
  ASSERT_EQ(book->related("author")->get("name"),
            Value{std::string{"Herbert"}});

  ASSERT_THROW(
    mapper->createFromJson("Book", R"({"title": "Dune", "author": {"id": 1}})"),
    ValidationError);
}
