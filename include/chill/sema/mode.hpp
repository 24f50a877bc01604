// chill/sema/mode.hpp - Mode (type) categories
#pragma once

#include <cstdint>
#include <string_view>

namespace chill
{

/**
 * Category of a CHILL mode, as far as it can be told from the leading
 * keyword of its definition.
 */
enum class ModeKind : uint8_t {
  Int,
  Bool,
  Char,
  Chars,        ///< Character string
  Bools,        ///< Bit string
  Set,          ///< Enumeration
  Range,        ///< Integer subrange
  Powerset,
  Ref,
  Struct,
  Array,
  Proc,
  Process,
  Buffer,
  Event,
  Signal,
  Association,
  Access,
  Text,
  Duration,
  Time,
  UserDefined,
  Unknown,
};

/// CHILL spelling of a mode category ("INT", "SET", ..., "USER", "UNKNOWN").
[[nodiscard]] std::string_view to_string(ModeKind kind) noexcept;

/**
 * Map the first token of a mode text to a built-in category.
 *
 * The token ends at whitespace or '('. Implementation aliases (BYTE, UBYTE,
 * UINT, LONG, ULONG, REAL, LONG_REAL) are treated as Int. Anything else,
 * including empty text, is UserDefined.
 */
[[nodiscard]] ModeKind mode_kind_from_name(std::string_view mode_text);

/**
 * Infer the category of the right-hand side of a NEWMODE/SYNMODE.
 *
 * Checks the leading keyword in a fixed order (SET, RANGE, STRUCT, ARRAY,
 * REF, POWERSET, CHARS, BOOLS, PROC, BUFFER, EVENT, SIGNAL) and defers to
 * mode_kind_from_name() otherwise.
 */
[[nodiscard]] ModeKind infer_mode_kind(std::string_view rhs);

/// True if the first token of `mode_text` names a built-in mode.
[[nodiscard]] bool is_builtin_mode_name(std::string_view mode_text);

}  // namespace chill
