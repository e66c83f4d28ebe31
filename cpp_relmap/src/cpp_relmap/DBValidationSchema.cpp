#include "cpp_relmap/src/cpp_relmap/DBValidationSchema.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>

#include <nlohmann/json.hpp>

#include "cpp_relmap/src/cpp_relmap/DBTypeUnwrapper.hpp"
#include "cpp_relmap/src/utils/StringUtils.hpp"

namespace cpp_relmap
{

namespace
{

using json = nlohmann::json;

std::optional<int64_t> parseInteger(const std::string& text)
{
  int64_t number = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, number);
  if (ec != std::errc{} || ptr != end || text.empty())
  {
    return std::nullopt;
  }
  return number;
}

std::optional<double> parseReal(const std::string& text)
{
  double number = 0.0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, number);
  if (ec != std::errc{} || ptr != end || text.empty())
  {
    return std::nullopt;
  }
  return number;
}

std::optional<int64_t> integerFromJson(const json& value)
{
  if (value.is_number_unsigned())
  {
    auto number = value.get<uint64_t>();
    if (number > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
    {
      return std::nullopt;
    }
    return static_cast<int64_t>(number);
  }
  if (value.is_number_integer())
  {
    return value.get<int64_t>();
  }
  if (value.is_number_float())
  {
    double number = value.get<double>();
    // 2^63 itself is out of range
    if (std::trunc(number) != number || number < -9.223372036854775808e18 ||
        number >= 9.223372036854775808e18)
    {
      return std::nullopt;
    }
    return static_cast<int64_t>(number);
  }
  if (value.is_string())
  {
    return parseInteger(value.get<std::string>());
  }
  return std::nullopt;
}

std::optional<bool> booleanFromJson(const json& value)
{
  if (value.is_boolean())
  {
    return value.get<bool>();
  }
  if (value.is_number_integer())
  {
    auto number = value.get<int64_t>();
    if (number == 0 || number == 1)
    {
      return number == 1;
    }
    return std::nullopt;
  }
  if (value.is_string())
  {
    auto text = toLower(value.get<std::string>());
    if (text == "true" || text == "1" || text == "yes" || text == "on" ||
        text == "t" || text == "y")
    {
      return true;
    }
    if (text == "false" || text == "0" || text == "no" || text == "off" ||
        text == "f" || text == "n")
    {
      return false;
    }
  }
  return std::nullopt;
}

//! Coerce one JSON member to a rule's scalar type
std::optional<Value> coerce(const json& value, ScalarType type)
{
  if (value.is_null())
  {
    return Value{};
  }

  switch (type)
  {
    case ScalarType::INTEGER:
      if (auto number = integerFromJson(value))
      {
        return Value{*number};
      }
      break;
    case ScalarType::REAL:
      if (value.is_number())
      {
        return Value{value.get<double>()};
      }
      if (value.is_string())
      {
        if (auto number = parseReal(value.get<std::string>()))
        {
          return Value{*number};
        }
      }
      break;
    case ScalarType::TEXT:
      if (value.is_string())
      {
        return Value{value.get<std::string>()};
      }
      break;
    case ScalarType::BOOLEAN:
      if (auto flag = booleanFromJson(value))
      {
        return Value{*flag};
      }
      break;
    case ScalarType::BLOB:
      if (value.is_string())
      {
        const auto& text = value.get_ref<const std::string&>();
        return Value{Blob(text.begin(), text.end())};
      }
      break;
  }
  return std::nullopt;
}

//! Members without a rule keep their JSON type
std::optional<Value> passThrough(const json& value)
{
  if (value.is_null())
  {
    return Value{};
  }
  if (value.is_boolean())
  {
    return Value{value.get<bool>()};
  }
  if (value.is_number_integer() || value.is_number_unsigned())
  {
    if (auto number = integerFromJson(value))
    {
      return Value{*number};
    }
    return std::nullopt;
  }
  if (value.is_number_float())
  {
    return Value{value.get<double>()};
  }
  if (value.is_string())
  {
    return Value{value.get<std::string>()};
  }
  return std::nullopt;
}

}  // namespace

ValidationSchema ValidationSchema::fromDefinition(
  const EntityDefinition& definition)
{
  ValidationSchema schema;
  schema.entityName_ = definition.name();
  schema.primaryKey_ = definition.primaryKey();

  for (const auto& field : definition.fields())
  {
    FieldShape shape = unwrapType(*field.type);
    FieldShapeKind kind = classifyShape(shape, field.name);

    if (kind != FieldShapeKind::PLAIN_SCALAR &&
        kind != FieldShapeKind::NULLABLE_SCALAR)
    {
      continue;
    }

    schema.rules_.push_back(FieldRule{field.name,
                                      std::get<ScalarType>(shape.bareType),
                                      shape.isNullable,
                                      field.defaultValue});
  }

  return schema;
}

const FieldRule* ValidationSchema::findRule(std::string_view fieldName) const
{
  auto it = std::find_if(rules_.begin(),
                         rules_.end(),
                         [fieldName](const FieldRule& rule)
                         { return rule.name == fieldName; });
  return it == rules_.end() ? nullptr : &*it;
}

std::optional<FieldError> ValidationSchema::checkValue(const FieldRule& rule,
                                                       Value& value) const
{
  auto actual = scalarTypeOf(value);

  if (!actual.has_value())
  {
    if (rule.nullable || rule.name == primaryKey_)
    {
      return std::nullopt;
    }
    return FieldError{rule.name, "value cannot be null"};
  }

  if (*actual == rule.type)
  {
    return std::nullopt;
  }

  if (rule.type == ScalarType::REAL && *actual == ScalarType::INTEGER)
  {
    value = static_cast<double>(std::get<int64_t>(value));
    return std::nullopt;
  }

  return FieldError{rule.name,
                    "expected " + std::string{scalarTypeName(rule.type)} +
                      ", got " + std::string{scalarTypeName(*actual)}};
}

ValidationResult ValidationSchema::validate(const Row& values) const
{
  ValidationResult result;

  for (const auto& rule : rules_)
  {
    auto it = values.find(rule.name);

    if (it == values.end())
    {
      if (rule.defaultValue.has_value())
      {
        result.values[rule.name] = *rule.defaultValue;
      }
      else if (rule.nullable || rule.name == primaryKey_)
      {
        result.values[rule.name] = std::monostate{};
      }
      else
      {
        result.errors.push_back(FieldError{rule.name, "field required"});
      }
      continue;
    }

    Value value = it->second;
    if (auto error = checkValue(rule, value))
    {
      result.errors.push_back(std::move(*error));
      continue;
    }
    result.values[rule.name] = std::move(value);
  }

  for (const auto& [name, value] : values)
  {
    if (findRule(name) == nullptr)
    {
      result.errors.push_back(FieldError{name, "unknown field"});
    }
  }

  return result;
}

Value ValidationSchema::validateField(std::string_view fieldName,
                                      Value value) const
{
  const auto* rule = findRule(fieldName);
  if (rule == nullptr)
  {
    throw ValidationError{
      entityName_, {FieldError{std::string{fieldName}, "unknown field"}}};
  }

  if (auto error = checkValue(*rule, value))
  {
    throw ValidationError{entityName_, {std::move(*error)}};
  }
  return value;
}

ValidationResult ValidationSchema::decodeJson(std::string_view text) const
{
  ValidationResult result;

  json document;
  try
  {
    document = json::parse(text.begin(), text.end());
  }
  catch (const json::parse_error& error)
  {
    result.errors.push_back(
      FieldError{"", std::string{"invalid JSON: "} + error.what()});
    return result;
  }

  if (!document.is_object())
  {
    result.errors.push_back(FieldError{"", "expected a JSON object"});
    return result;
  }

  for (const auto& [name, member] : document.items())
  {
    const auto* rule = findRule(name);
    auto value = rule ? coerce(member, rule->type) : passThrough(member);

    if (!value.has_value())
    {
      std::string expected =
        rule ? std::string{scalarTypeName(rule->type)} : "a scalar";
      result.errors.push_back(FieldError{
        name, "expected " + expected + ", got JSON " + member.type_name()});
      continue;
    }
    result.values[name] = std::move(*value);
  }

  return result;
}

ValidationResult ValidationSchema::validateJson(std::string_view text) const
{
  ValidationResult decoded = decodeJson(text);
  if (!decoded.ok())
  {
    return decoded;
  }
  return validate(decoded.values);
}

}  // namespace cpp_relmap
