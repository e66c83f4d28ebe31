#include "cpp_relmap/src/cpp_relmap/DBTypeExpression.hpp"

#include <stdexcept>
#include <utility>

#include "cpp_relmap/src/utils/StringUtils.hpp"

namespace cpp_relmap
{

TypeExpression::TypeExpression(Passkey,
                               Kind kind,
                               ScalarType scalarType,
                               std::string entityName,
                               TypeExpressionPtr inner,
                               RelationMetadata metadata)
  : kind_{kind},
    scalarType_{scalarType},
    entityName_{std::move(entityName)},
    inner_{std::move(inner)},
    metadata_{std::move(metadata)}
{
}

TypeExpressionPtr TypeExpression::scalar(ScalarType type)
{
  return std::make_shared<const TypeExpression>(
    Passkey{}, Kind::SCALAR, type, std::string{}, nullptr, RelationMetadata{});
}

TypeExpressionPtr TypeExpression::entityReference(std::string entityName)
{
  if (entityName.empty())
  {
    throw std::invalid_argument("Entity reference requires a name");
  }
  return std::make_shared<const TypeExpression>(Passkey{},
                                                Kind::ENTITY_REFERENCE,
                                                ScalarType::INTEGER,
                                                std::move(entityName),
                                                nullptr,
                                                RelationMetadata{});
}

TypeExpressionPtr TypeExpression::nullable(TypeExpressionPtr inner)
{
  if (!inner)
  {
    throw std::invalid_argument("nullable() requires an inner type");
  }
  return std::make_shared<const TypeExpression>(Passkey{},
                                                Kind::NULLABLE,
                                                ScalarType::INTEGER,
                                                std::string{},
                                                std::move(inner),
                                                RelationMetadata{});
}

TypeExpressionPtr TypeExpression::collection(TypeExpressionPtr inner)
{
  if (!inner)
  {
    throw std::invalid_argument("list() requires an inner type");
  }
  return std::make_shared<const TypeExpression>(Passkey{},
                                                Kind::COLLECTION,
                                                ScalarType::INTEGER,
                                                std::string{},
                                                std::move(inner),
                                                RelationMetadata{});
}

TypeExpressionPtr TypeExpression::annotated(TypeExpressionPtr inner,
                                            RelationMetadata metadata)
{
  if (!inner)
  {
    throw std::invalid_argument("relation() requires an inner type");
  }
  return std::make_shared<const TypeExpression>(Passkey{},
                                                Kind::ANNOTATED,
                                                ScalarType::INTEGER,
                                                std::string{},
                                                std::move(inner),
                                                std::move(metadata));
}

const TypeExpression& TypeExpression::inner() const
{
  if (!inner_)
  {
    throw std::logic_error("Type expression " + toString() +
                           " has no inner type");
  }
  return *inner_;
}

std::string TypeExpression::toString() const
{
  switch (kind_)
  {
    case Kind::SCALAR:
      return toLower(scalarTypeName(scalarType_));
    case Kind::ENTITY_REFERENCE:
      return entityName_;
    case Kind::NULLABLE:
      return "nullable<" + inner_->toString() + ">";
    case Kind::COLLECTION:
      return "list<" + inner_->toString() + ">";
    case Kind::ANNOTATED:
      return "relation<" + inner_->toString() + ">";
  }
  return "?";
}

bool TypeExpression::operator==(const TypeExpression& other) const
{
  if (kind_ != other.kind_)
  {
    return false;
  }

  switch (kind_)
  {
    case Kind::SCALAR:
      return scalarType_ == other.scalarType_;
    case Kind::ENTITY_REFERENCE:
      return entityName_ == other.entityName_;
    case Kind::ANNOTATED:
      if (!(metadata_ == other.metadata_))
      {
        return false;
      }
      return *inner_ == *other.inner_;
    case Kind::NULLABLE:
    case Kind::COLLECTION:
      return *inner_ == *other.inner_;
  }
  return false;
}

namespace types
{

TypeExpressionPtr integer()
{
  return TypeExpression::scalar(ScalarType::INTEGER);
}

TypeExpressionPtr real()
{
  return TypeExpression::scalar(ScalarType::REAL);
}

TypeExpressionPtr text()
{
  return TypeExpression::scalar(ScalarType::TEXT);
}

TypeExpressionPtr boolean()
{
  return TypeExpression::scalar(ScalarType::BOOLEAN);
}

TypeExpressionPtr blob()
{
  return TypeExpression::scalar(ScalarType::BLOB);
}

TypeExpressionPtr ref(std::string entityName)
{
  return TypeExpression::entityReference(std::move(entityName));
}

TypeExpressionPtr nullable(TypeExpressionPtr inner)
{
  return TypeExpression::nullable(std::move(inner));
}

TypeExpressionPtr list(TypeExpressionPtr inner)
{
  return TypeExpression::collection(std::move(inner));
}

TypeExpressionPtr relation(TypeExpressionPtr inner, RelationMetadata metadata)
{
  return TypeExpression::annotated(std::move(inner), std::move(metadata));
}

TypeExpressionPtr toOne(std::string target,
                        std::optional<std::string> backPopulates)
{
  return relation(ref(std::move(target)),
                  RelationMetadata{std::move(backPopulates)});
}

TypeExpressionPtr optionalToOne(std::string target,
                                std::optional<std::string> backPopulates)
{
  return relation(nullable(ref(std::move(target))),
                  RelationMetadata{std::move(backPopulates)});
}

TypeExpressionPtr toMany(std::string target,
                         std::optional<std::string> backPopulates)
{
  return relation(list(ref(std::move(target))),
                  RelationMetadata{std::move(backPopulates)});
}

}  // namespace types

}  // namespace cpp_relmap
