#include "util/StringUtil.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <string_view>

namespace util {

inline std::vector<std::string> split(const std::string& s, const char* t) {
  std::vector<std::string> result;
  std::string_view sep(t);

  if (sep.empty()) {
    std::size_t pos = 0, n = s.size();
    while (pos < n) {
      while (pos < n && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
      if (pos >= n) break;
      std::size_t start = pos;
      while (pos < n && !std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
      result.emplace_back(s.substr(start, pos - start));
    }
    return result;
  }

  std::size_t start = 0, end;
  while ((end = s.find(sep, start)) != std::string::npos) {
    result.emplace_back(s.substr(start, end - start));
    start = end + sep.size();
  }
  result.emplace_back(s.substr(start));
  return result;
}

inline std::string to_lower(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

inline std::string replace_chars(const std::string& s, const char* from, char to) {
  std::string out = s;
  for (char& c : out) {
    if (std::strchr(from, c) && c != '\0') c = to;
  }
  return out;
}

inline std::string grammatically_join(const std::vector<std::string>& items,
                                      const std::string& conjunction, bool oxford_comma) {
  if (items.empty()) return "";
  if (items.size() == 1) return items[0];
  if (items.size() == 2) {
    return items[0] + " " + conjunction + " " + items[1];
  }

  std::string result;
  for (size_t i = 0; i < items.size(); ++i) {
    result += items[i];
    if (i == items.size() - 2) {
      result += (oxford_comma ? ", " : " ") + conjunction + " ";
    } else if (i < items.size() - 1) {
      result += ", ";
    }
  }
  return result;
}

}  // namespace util
