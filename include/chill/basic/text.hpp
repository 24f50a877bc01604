// chill/basic/text.hpp - Small ASCII text helpers shared by the scanner and queries
#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace chill::text
{

inline bool is_ident_char(unsigned char c) { return std::isalnum(c) != 0 || c == '_'; }

inline bool is_ident_start(unsigned char c) { return std::isalpha(c) != 0 || c == '_'; }

inline bool is_space(unsigned char c) { return std::isspace(c) != 0; }

inline std::string to_upper(std::string_view s)
{
  std::string out(s);
  for (auto & ch : out) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  return out;
}

inline std::string_view trim(std::string_view s)
{
  size_t b = 0;
  while (b < s.size() && is_space(static_cast<unsigned char>(s[b]))) {
    ++b;
  }
  size_t e = s.size();
  while (e > b && is_space(static_cast<unsigned char>(s[e - 1]))) {
    --e;
  }
  return s.substr(b, e - b);
}

inline bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

/// Case-insensitive prefix test; `prefix` may be in any case.
inline bool istarts_with(std::string_view s, std::string_view prefix)
{
  if (s.size() < prefix.size()) {
    return false;
  }
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (
      std::toupper(static_cast<unsigned char>(s[i])) !=
      std::toupper(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

inline bool iequals(std::string_view a, std::string_view b)
{
  return a.size() == b.size() && istarts_with(a, b);
}

}  // namespace chill::text
