#ifndef BASE_ENTITY_HPP
#define BASE_ENTITY_HPP

#include <cstdint>
#include <optional>

#include <boost/describe.hpp>
#include <boost/describe/class.hpp>

namespace cpp_relmap
{

struct BaseEntity
{
  //! The unique identifier of the entity
  //! Left empty until the record is saved
  std::optional<int64_t> id;
};

// Register the base entity with
// boost::describe
BOOST_DESCRIBE_STRUCT(BaseEntity, (), (id));

}  // namespace cpp_relmap

#endif  // BASE_ENTITY_HPP
