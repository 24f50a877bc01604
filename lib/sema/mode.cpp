// chill/sema/mode.cpp - Mode category inference
#include "chill/sema/mode.hpp"

#include <algorithm>
#include <array>
#include <string>

#include "chill/basic/text.hpp"

namespace chill
{
namespace
{

struct NamedMode
{
  std::string_view name;
  ModeKind kind;
};

constexpr std::array<NamedMode, 28> k_builtin_mode_names = {{
  {"INT", ModeKind::Int},
  {"BOOL", ModeKind::Bool},
  {"CHAR", ModeKind::Char},
  {"CHARS", ModeKind::Chars},
  {"BOOLS", ModeKind::Bools},
  {"SET", ModeKind::Set},
  {"RANGE", ModeKind::Range},
  {"POWERSET", ModeKind::Powerset},
  {"REF", ModeKind::Ref},
  {"STRUCT", ModeKind::Struct},
  {"ARRAY", ModeKind::Array},
  {"PROC", ModeKind::Proc},
  {"PROCESS", ModeKind::Process},
  {"BUFFER", ModeKind::Buffer},
  {"EVENT", ModeKind::Event},
  {"SIGNAL", ModeKind::Signal},
  {"ASSOCIATION", ModeKind::Association},
  {"ACCESS", ModeKind::Access},
  {"TEXT", ModeKind::Text},
  {"DURATION", ModeKind::Duration},
  {"TIME", ModeKind::Time},
  // Implementation-defined aliases
  {"BYTE", ModeKind::Int},
  {"UBYTE", ModeKind::Int},
  {"UINT", ModeKind::Int},
  {"LONG", ModeKind::Int},
  {"ULONG", ModeKind::Int},
  {"REAL", ModeKind::Int},
  {"LONG_REAL", ModeKind::Int},
}};

// Ordered: the first matching prefix wins.
constexpr std::array<NamedMode, 12> k_rhs_prefixes = {{
  {"SET", ModeKind::Set},
  {"RANGE", ModeKind::Range},
  {"STRUCT", ModeKind::Struct},
  {"ARRAY", ModeKind::Array},
  {"REF", ModeKind::Ref},
  {"POWERSET", ModeKind::Powerset},
  {"CHARS", ModeKind::Chars},
  {"BOOLS", ModeKind::Bools},
  {"PROC", ModeKind::Proc},
  {"BUFFER", ModeKind::Buffer},
  {"EVENT", ModeKind::Event},
  {"SIGNAL", ModeKind::Signal},
}};

constexpr std::array<std::string_view, 16> k_builtin_names = {
  "INT",  "BOOL",  "CHAR",    "CHARS",     "BOOLS",    "BYTE", "UBYTE",       "UINT",
  "LONG", "ULONG", "REAL",    "LONG_REAL", "DURATION", "TIME", "ASSOCIATION", "INSTANCE",
};

std::string leading_token_upper(std::string_view text)
{
  const std::string_view t = text::trim(text);
  size_t end = 0;
  while (end < t.size() && !text::is_space(static_cast<unsigned char>(t[end])) && t[end] != '(') {
    ++end;
  }
  return text::to_upper(t.substr(0, end));
}

}  // namespace

std::string_view to_string(ModeKind kind) noexcept
{
  switch (kind) {
    case ModeKind::Int:
      return "INT";
    case ModeKind::Bool:
      return "BOOL";
    case ModeKind::Char:
      return "CHAR";
    case ModeKind::Chars:
      return "CHARS";
    case ModeKind::Bools:
      return "BOOLS";
    case ModeKind::Set:
      return "SET";
    case ModeKind::Range:
      return "RANGE";
    case ModeKind::Powerset:
      return "POWERSET";
    case ModeKind::Ref:
      return "REF";
    case ModeKind::Struct:
      return "STRUCT";
    case ModeKind::Array:
      return "ARRAY";
    case ModeKind::Proc:
      return "PROC";
    case ModeKind::Process:
      return "PROCESS";
    case ModeKind::Buffer:
      return "BUFFER";
    case ModeKind::Event:
      return "EVENT";
    case ModeKind::Signal:
      return "SIGNAL";
    case ModeKind::Association:
      return "ASSOCIATION";
    case ModeKind::Access:
      return "ACCESS";
    case ModeKind::Text:
      return "TEXT";
    case ModeKind::Duration:
      return "DURATION";
    case ModeKind::Time:
      return "TIME";
    case ModeKind::UserDefined:
      return "USER";
    case ModeKind::Unknown:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

ModeKind mode_kind_from_name(std::string_view mode_text)
{
  const std::string token = leading_token_upper(mode_text);
  const auto it = std::find_if(
    k_builtin_mode_names.begin(), k_builtin_mode_names.end(),
    [&](const NamedMode & m) { return m.name == token; });
  return it != k_builtin_mode_names.end() ? it->kind : ModeKind::UserDefined;
}

ModeKind infer_mode_kind(std::string_view rhs)
{
  const std::string upper = text::to_upper(text::trim(rhs));
  for (const auto & p : k_rhs_prefixes) {
    if (text::starts_with(upper, p.name)) {
      return p.kind;
    }
  }
  return mode_kind_from_name(upper);
}

bool is_builtin_mode_name(std::string_view mode_text)
{
  const std::string token = leading_token_upper(mode_text);
  return std::find(k_builtin_names.begin(), k_builtin_names.end(), token) !=
         k_builtin_names.end();
}

}  // namespace chill
