#ifndef DB_RECORD_HPP
#define DB_RECORD_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/unordered_map.hpp>

#include "cpp_relmap/src/cpp_relmap/DBValue.hpp"

namespace cpp_relmap
{

class DataAccessObject;
class Record;

using RecordPtr = std::shared_ptr<Record>;

/*!
 * \brief A live instance of an entity
 *
 * Holds one value per storage column (declared scalar fields and
 * synthesized foreign keys), a cache slot per to-one relationship and an
 * in-memory collection per to-many relationship.
 *
 * Records are created by their entity's DataAccessObject and keep a
 * reference to it, so they must not outlive the Mapper that produced them.
 * They are not synchronized.
 *
 * \code
 * auto book = mapper.create("Book", {{"title", std::string{"Dune"}}});
 * book->setRelated("author", author);  // updates author_id as well
 * mapper.save(*book);
 * auto sameAuthor = book->related("author");  // served from the cache
 * \endcode
 */
class Record
{
public:
  Record(DataAccessObject& dao, Row values, bool persisted);

  const std::string& entityName() const;

  /*!
   * \brief Read a column value
   * \throws std::out_of_range if the entity has no such column
   */
  const Value& get(std::string_view field) const;

  /*!
   * \brief Write a column value
   *
   * Declared fields are checked against the validation schema. Writing a
   * synthesized foreign key directly drops the cached related record.
   *
   * \throws ValidationError for unknown fields, relationship fields and
   *         values of the wrong type
   */
  void set(std::string_view field, Value value);

  /*!
   * \brief Read a to-one relationship, resolving it lazily on first access
   * \return nullptr when the relationship is unset or dangling
   * \throws std::invalid_argument if the field is not a to-one relationship
   */
  RecordPtr related(std::string_view field);

  /*!
   * \brief Assign a to-one relationship and its foreign key together
   * \throws InvalidReferenceError if the record is unsaved or of the wrong
   *         entity
   */
  void setRelated(std::string_view field, RecordPtr value);

  /*!
   * \brief The in-memory collection of a to-many relationship
   *
   * Starts empty and is never persisted: the owning key lives on the
   * records of the other side.
   */
  std::vector<RecordPtr>& collection(std::string_view field);

  std::optional<Identifier> primaryKey() const;

  //! True once the record has been written to or read from storage
  bool isPersisted() const
  {
    return persisted_;
  }

  const Row& values() const
  {
    return values_;
  }

  DataAccessObject& dao() const
  {
    return *dao_;
  }

private:
  friend class DataAccessObject;
  friend class LazyReferenceResolver;

  //! nullopt: never resolved; nullptr: resolved to absent
  using CacheSlot = std::optional<RecordPtr>;

  CacheSlot& cacheSlot(std::string_view field);

  //! Raw column write, no validation or cache invalidation
  void assign(std::string_view field, Value value);

  DataAccessObject* dao_;
  Row values_;
  boost::unordered_map<std::string, CacheSlot> relationCache_;
  boost::unordered_map<std::string, std::vector<RecordPtr>> collections_;
  bool persisted_;
};

}  // namespace cpp_relmap

#endif  // DB_RECORD_HPP
