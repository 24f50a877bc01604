// chill/syntax/keywords.hpp - Reserved words and predefined names
#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace chill::syntax
{

// NOTE: Reserved words follow ITU-T Z.200 (1999) Appendix III; predefined
// names follow Appendix III.2 plus the implementation-defined modes and time
// units of common CHILL compilers. Both tables are sorted.

inline constexpr std::array<std::string_view, 124> k_reserved_words = {
  "ABSTRACT", "ACCESS", "AFTER", "ALL", "AND", "ANDIF", "ANY", "ANY_ASSIGN", "ANY_DISCRETE",
  "ANY_INT", "ANY_REAL", "ARRAY", "ASSERT", "ASSIGNABLE", "AT", "BASED_ON", "BEGIN", "BIN", "BODY",
  "BOOLS", "BUFFER", "BY", "CASE", "CAUSE", "CHARS", "CONSTR", "CONTEXT", "CONTINUE", "CYCLE",
  "DCL", "DELAY", "DESTR", "DO", "DOWN", "DYNAMIC", "ELSE", "ELSIF", "END", "ESAC", "EVENT",
  "EVER", "EXCEPTIONS", "EXIT", "FI", "FINAL", "FOR", "FORBID", "GENERAL", "GENERIC", "GOTO",
  "GRANT", "IF", "IMPLEMENTS", "IN", "INCOMPLETE", "INIT", "INLINE", "INOUT", "INTERFACE",
  "INVARIANT", "LOC", "MOD", "MODE", "MODULE", "NEW", "NEWMODE", "NONREF", "NOPACK", "NOT",
  "NOT_ASSIGNABLE", "OD", "OF", "ON", "OR", "ORIF", "OUT", "PACK", "POS", "POST", "POWERSET",
  "PRE", "PREFIXED", "PRIORITY", "PROC", "PROCESS", "RANGE", "READ", "RECEIVE", "REF", "REGION",
  "REIMPLEMENT", "REM", "REMOTE", "RESULT", "RETURN", "RETURNS", "ROW", "SEIZE", "SELF", "SEND",
  "SET", "SIGNAL", "SIMPLE", "SPEC", "START", "STATIC", "STEP", "STOP", "STRUCT", "SYN", "SYNMODE",
  "TASK", "TEXT", "THEN", "THIS", "TIMEOUT", "TO", "UP", "VARYING", "WCHARS", "WHILE", "WITH",
  "WTEXT", "XOR",
};

inline constexpr std::array<std::string_view, 91> k_predefined_names = {
  "ABS", "ABSTIME", "ALLOCATE", "ARCCOS", "ARCSIN", "ARCTAN", "ASSOCIATE", "ASSOCIATION", "BOOL",
  "BYTE", "CARD", "CHAR", "CONNECT", "COS", "CREATE", "DAYS", "DELETE", "DISCONNECT", "DISSOCIATE",
  "DURATION", "EOLN", "EXISTING", "EXP", "EXPIRED", "FALSE", "FIRST", "FLOAT", "GETASSOCIATION",
  "GETSTACK", "GETTEXTACCESS", "GETTEXTINDEX", "GETTEXTRECORD", "GETUSAGE", "HOURS", "INDEXABLE",
  "INSTANCE", "INT", "INTTIME", "ISASSOCIATED", "LAST", "LENGTH", "LN", "LOG", "LONG", "LONG_REAL",
  "LOWER", "MAX", "MICROSECS", "MILLISECS", "MIN", "MINUTES", "MODIFY", "NULL", "NUM", "OUTOFFILE",
  "PRED", "PTR", "READABLE", "READONLY", "READRECORD", "READTEXT", "READWRITE", "REAL", "SAME",
  "SECONDS", "SECS", "SEQUENCIBLE", "SETTEXTACCESS", "SETTEXTINDEX", "SETTEXTRECORD", "SIN",
  "SIZE", "SQRT", "SUCC", "TAN", "TERMINATE", "TIME", "TRUE", "UBYTE", "UINT", "ULONG", "UPPER",
  "USAGE", "VARIABLE", "WAIT", "WCHAR", "WHERE", "WRITEABLE", "WRITEONLY", "WRITERECORD",
  "WRITETEXT",
};

/// Case-insensitive membership tests.
[[nodiscard]] bool is_reserved_word(std::string_view word);
[[nodiscard]] bool is_predefined_name(std::string_view word);

/// One-line documentation for common keywords and built-in names.
[[nodiscard]] std::optional<std::string_view> keyword_doc(std::string_view word);

}  // namespace chill::syntax
