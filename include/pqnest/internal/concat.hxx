#ifndef PQNEST_H_CONCAT
#define PQNEST_H_CONCAT

#include <string>
#include <string_view>
#include <type_traits>


namespace pqnest::internal
{
/// Render one item for @c concat().
template<typename T> inline void append_item(std::string &buf, T const &item)
{
  if constexpr (std::is_arithmetic_v<T>)
    buf.append(std::to_string(item));
  else
    buf.append(std::string_view{item});
}


/// Efficiently combine a bunch of items into one big string.
/** Strings and string views go in as they are, numbers get converted to
 * their decimal representation.
 */
template<typename... TYPE>
[[nodiscard]] inline std::string concat(TYPE const &...item)
{
  std::string buf;
  (append_item(buf, item), ...);
  return buf;
}
} // namespace pqnest::internal
#endif
