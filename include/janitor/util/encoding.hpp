#pragma once

#include <boost/locale/utf.hpp>

#include <string_view>

namespace janitor::util {

[[nodiscard]] inline auto is_valid_utf8(std::string_view text) noexcept
    -> bool {
  using traits = boost::locale::utf::utf_traits<char>;
  auto it = text.begin();
  const auto end = text.end();
  while (it != end) {
    const auto cp = traits::decode(it, end);
    if (cp == boost::locale::utf::illegal ||
        cp == boost::locale::utf::incomplete) {
      return false;
    }
  }
  return true;
}

} // namespace janitor::util
