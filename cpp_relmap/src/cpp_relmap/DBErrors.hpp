#ifndef DB_ERRORS_HPP
#define DB_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace cpp_relmap
{

/*!
 * Root of every error raised by this library.
 */
class RelmapError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/*!
 * An entity declaration cannot be turned into a schema: malformed type
 * expression, duplicate names, invalid primary key or a synthesized
 * foreign key colliding with a declared field.
 */
class DefinitionError : public RelmapError
{
public:
  using RelmapError::RelmapError;
};

/*!
 * A relationship names an entity that has not been declared in the registry
 * at the time the target is needed.
 */
class UnregisteredTargetError : public RelmapError
{
public:
  UnregisteredTargetError(std::string field, std::string target)
    : RelmapError{"Relationship '" + field + "' targets entity '" + target +
                  "' which is not registered"},
      field_{std::move(field)},
      target_{std::move(target)}
  {
  }

  const std::string& field() const
  {
    return field_;
  }

  const std::string& target() const
  {
    return target_;
  }

private:
  std::string field_;
  std::string target_;
};

/*!
 * A non-nullable to-one relationship has no foreign key at write time.
 */
class RequiredRelationshipError : public RelmapError
{
public:
  RequiredRelationshipError(std::string field, std::string target)
    : RelmapError{"Required relationship '" + field +
                  "' cannot be empty. Please provide a saved " + target +
                  " instance"},
      field_{std::move(field)},
      target_{std::move(target)}
  {
  }

  const std::string& field() const
  {
    return field_;
  }

  const std::string& target() const
  {
    return target_;
  }

private:
  std::string field_;
  std::string target_;
};

//! A single rejected field
struct FieldError
{
  std::string field;
  std::string message;

  bool operator==(const FieldError&) const = default;
};

/*!
 * Values rejected by a validation schema.
 */
class ValidationError : public RelmapError
{
public:
  ValidationError(std::string entity, std::vector<FieldError> errors)
    : RelmapError{formatMessage(entity, errors)},
      entity_{std::move(entity)},
      errors_{std::move(errors)}
  {
  }

  const std::string& entity() const
  {
    return entity_;
  }

  const std::vector<FieldError>& errors() const
  {
    return errors_;
  }

private:
  static std::string formatMessage(const std::string& entity,
                                   const std::vector<FieldError>& errors)
  {
    std::string message = "Validation failed for " + entity + ":";
    for (const auto& error : errors)
    {
      message += " [" + error.field + ": " + error.message + "]";
    }
    return message;
  }

  std::string entity_;
  std::vector<FieldError> errors_;
};

/*!
 * A record cannot be used as a reference: it has no primary key yet, or it
 * belongs to a different entity than the relationship expects.
 */
class InvalidReferenceError : public RelmapError
{
public:
  using RelmapError::RelmapError;
};

/*!
 * Raised by storage backends. Passed through the mapper untranslated.
 */
class StorageError : public RelmapError
{
public:
  using RelmapError::RelmapError;
};

}  // namespace cpp_relmap

#endif  // DB_ERRORS_HPP
