#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace cpp_relmap
{

/*!
 * \brief Strip namespace prefix from a type name
 *
 * Converts "namespace::TypeName" to "TypeName"
 * Handles nested namespaces: "outer::inner::TypeName" -> "TypeName"
 * If no namespace exists, returns the original name unchanged
 *
 * \param fullTypeName The full type name (e.g., from boost::typeindex)
 * \return Type name without namespace prefix
 *
 * \example
 * stripNamespace("library::Author") -> "Author"
 * stripNamespace("Author") -> "Author"
 */
inline std::string stripNamespace(std::string_view fullTypeName)
{
  // Find the last occurrence of "::"
  auto pos = fullTypeName.rfind("::");

  if (pos == std::string_view::npos)
  {
    // No namespace found, return as-is
    return std::string(fullTypeName);
  }

  // Return everything after the last "::"
  return std::string(fullTypeName.substr(pos + 2));
}

/*!
 * \brief ASCII lower-casing used for default table names
 *
 * \example
 * toLower("OrderItem") -> "orderitem"
 */
inline std::string toLower(std::string_view text)
{
  std::string lowered(text);
  std::transform(lowered.begin(),
                 lowered.end(),
                 lowered.begin(),
                 [](unsigned char c)
                 { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

/*!
 * \brief Join strings with a separator
 *
 * \example
 * join({"id", "title"}, ", ") -> "id, title"
 */
inline std::string join(const std::vector<std::string>& parts,
                        std::string_view separator)
{
  std::string joined;
  bool first = true;
  for (const auto& part : parts)
  {
    if (!first)
      joined += separator;
    joined += part;
    first = false;
  }
  return joined;
}

}  // namespace cpp_relmap

#endif  // STRING_UTILS_HPP
