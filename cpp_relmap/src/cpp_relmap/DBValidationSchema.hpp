#ifndef DB_VALIDATION_SCHEMA_HPP
#define DB_VALIDATION_SCHEMA_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cpp_relmap/src/cpp_relmap/DBEntityDefinition.hpp"
#include "cpp_relmap/src/cpp_relmap/DBErrors.hpp"
#include "cpp_relmap/src/cpp_relmap/DBValue.hpp"

namespace cpp_relmap
{

/*!
 * Constraint on a single field value.
 */
struct FieldRule
{
  std::string name;
  ScalarType type{ScalarType::INTEGER};
  bool nullable{false};
  std::optional<Value> defaultValue;

  bool operator==(const FieldRule&) const = default;
};

/*!
 * Outcome of ValidationSchema::validate().
 */
struct ValidationResult
{
  //! Validated values with defaults applied; only meaningful when ok()
  Row values;

  std::vector<FieldError> errors;

  bool ok() const
  {
    return errors.empty();
  }
};

/*!
 * \brief Field constraints enforced before any persistence action
 *
 * The validation half of the dual schema: one rule per declared
 * non-relationship field. Relationship fields and their synthesized keys are
 * not part of it; the required-relationship check covers those at save time.
 */
class ValidationSchema
{
public:
  /*!
   * \brief Derive the rules from an entity definition
   * \throws DefinitionError for malformed field types
   */
  static ValidationSchema fromDefinition(const EntityDefinition& definition);

  const std::string& entityName() const
  {
    return entityName_;
  }

  const std::vector<FieldRule>& rules() const
  {
    return rules_;
  }

  //! \return nullptr when the field has no rule
  const FieldRule* findRule(std::string_view fieldName) const;

  /*!
   * \brief Check a complete set of values
   *
   * Applies defaults, rejects missing non-nullable fields, type mismatches
   * and unknown fields. Integers are widened for REAL fields. Every failing
   * field is reported.
   */
  ValidationResult validate(const Row& values) const;

  /*!
   * \brief Check one value against one field's rule
   * \return The (possibly widened) value
   * \throws ValidationError naming the field
   */
  Value validateField(std::string_view fieldName, Value value) const;

  /*!
   * \brief Decode a JSON object into a row
   *
   * Values of fields with a rule are coerced to the rule's type the lenient
   * way: numeric strings for INTEGER and REAL ("123" -> 123), integral
   * floats for INTEGER (3.0 -> 3), 0/1 and "true"/"false"/"yes"/"no" style
   * strings for BOOLEAN, strings as bytes for BLOB. Other members are
   * passed through by their JSON type so that synthesized keys survive.
   * Missing, unknown and null fields are left to validate().
   *
   * Malformed input or a non-object document is reported as an error with
   * an empty field name.
   */
  ValidationResult decodeJson(std::string_view json) const;

  //! decodeJson() followed by validate()
  ValidationResult validateJson(std::string_view json) const;

private:
  std::optional<FieldError> checkValue(const FieldRule& rule,
                                       Value& value) const;

  std::string entityName_;
  std::string primaryKey_;
  std::vector<FieldRule> rules_;
};

}  // namespace cpp_relmap

#endif  // DB_VALIDATION_SCHEMA_HPP
