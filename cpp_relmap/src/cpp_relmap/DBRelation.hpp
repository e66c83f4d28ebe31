#ifndef DB_RELATION_HPP
#define DB_RELATION_HPP

#include <cstdint>
#include <optional>

namespace cpp_relmap
{

/*!
 * \brief Relationship member of a described entity
 *
 * Relation<T> is a required to-one reference, Relation<std::optional<T>> a
 * nullable one and Relation<std::vector<T>> a to-many relationship. Only the
 * key of a to-one target is stored in the struct; the related record itself
 * is resolved lazily through Record::related().
 *
 * Example:
 * \code
 * struct Book : public cpp_relmap::BaseEntity {
 *     std::string title;
 *     Relation<Author> author;   // stored as author_id, NOT NULL
 * };
 *
 * struct Author : public cpp_relmap::BaseEntity {
 *     std::string name;
 *     Relation<std::vector<Book>> books;  // no column
 * };
 * \endcode
 *
 * The target type may be incomplete where the member is declared, so
 * forward and self references are allowed.
 */
template <typename Target>
struct Relation
{
  //! The ID of the referenced object, unused for to-many relationships
  std::optional<int64_t> id;

  /*!
   * \brief Default constructor - creates an unset relation
   */
  Relation() = default;

  /*!
   * \brief Construct from an ID
   */
  explicit Relation(int64_t foreignId) : id{foreignId}
  {
  }

  /*!
   * \brief Check if this relation carries a key
   */
  bool isSet() const
  {
    return id.has_value();
  }
};

}  // namespace cpp_relmap

#endif  // DB_RELATION_HPP
