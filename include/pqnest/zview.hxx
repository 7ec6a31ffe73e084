/* Zero-terminated string view.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PQNEST_H_ZVIEW
#define PQNEST_H_ZVIEW

#include "pqnest/compiler-public.hxx"

#include <cstddef>
#include <string>
#include <string_view>


namespace pqnest
{
/// Marker-type wrapper: zero-terminated @c std::string_view.
/** @warning Use this only if the underlying string is zero-terminated.
 *
 * SQL text ends up in libpq, which wants C-style strings.  A zview lets us
 * pass statements around as views without losing the guarantee that there is
 * a terminating zero right after the last character.
 */
class zview : public std::string_view
{
public:
  constexpr zview() noexcept = default;

  /// Construct using pointer and length.
  /** @warning Only do this if you are sure that text[len] is a zero.
   */
  constexpr zview(char const text[], std::size_t len) noexcept :
          std::string_view{text, len}
  {}

  /// @warning There's an implicit conversion from @c std::string.
  zview(std::string const &str) noexcept :
          std::string_view{str.c_str(), std::size(str)}
  {}

  /// Construct a @c zview from a C-style string.
  constexpr zview(char const str[]) : std::string_view{str} {}

  /// Construct a @c zview from a string literal, without scanning it.
  template<std::size_t size>
  constexpr zview(char const (&literal)[size]) noexcept :
          zview(literal, size - 1)
  {}

  /// Either a null pointer, or a zero-terminated text buffer.
  [[nodiscard]] constexpr char const *c_str() const noexcept { return data(); }
};


/// Support @c zview literals.
/** You can "import" this selectively into your namespace, without pulling in
 * all of the @c pqnest namespace:
 *
 * @c using pqnest::operator"" _zv;
 */
constexpr zview operator"" _zv(char const str[], std::size_t len) noexcept
{
  return zview{str, len};
}
} // namespace pqnest
#endif
