#include "brinksmanship/BasicTypes.hpp"

#include <cctype>

namespace brinksmanship {

template <typename E>
std::string enum_to_tag(E e) {
  std::string_view name = magic_enum::enum_name(e);
  if (!name.empty() && name[0] == 'k') name.remove_prefix(1);

  std::string tag;
  for (char c : name) {
    if (std::isupper(static_cast<unsigned char>(c))) {
      if (!tag.empty()) tag += '_';
      tag += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    } else {
      tag += c;
    }
  }
  return tag;
}

template <typename E>
std::optional<E> enum_from_tag(std::string_view tag) {
  for (E e : magic_enum::enum_values<E>()) {
    if (enum_to_tag(e) == tag) return e;
  }
  return std::nullopt;
}

}  // namespace brinksmanship
