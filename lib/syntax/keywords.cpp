// chill/syntax/keywords.cpp - Keyword lookup and documentation
#include "chill/syntax/keywords.hpp"

#include <algorithm>
#include <string>

#include "chill/basic/text.hpp"

namespace chill::syntax
{
namespace
{

struct KeywordDoc
{
  std::string_view word;
  std::string_view doc;
};

constexpr std::array<KeywordDoc, 63> k_keyword_docs = {{
  {"AND", "Logical AND operator"},
  {"ANDIF", "Short-circuit AND (evaluates right only if left is TRUE)"},
  {"ARRAY", "Array mode"},
  {"BEGIN", "Begin a block"},
  {"BOOL", "Boolean mode (TRUE/FALSE)"},
  {"BOOLS", "Bit string mode"},
  {"BUFFER", "Declares a buffer for inter-process message passing"},
  {"CASE", "Case selection statement"},
  {"CHAR", "Character mode"},
  {"CHARS", "Character string mode"},
  {"DCL", "Declares a variable with a specified mode (type)"},
  {"DELAY", "Delay process execution for a duration"},
  {"DO", "Begins a loop construct"},
  {"ELSE", "Introduces the alternative of IF"},
  {"ELSIF", "Introduces an alternative condition"},
  {"END", "End a block or construct"},
  {"ESAC", "Terminates CASE statement"},
  {"EVENT", "Declares an event for process synchronization"},
  {"EXIT", "Exit from a loop"},
  {"FALSE", "Boolean false value"},
  {"FI", "Terminates IF statement"},
  {"FOR", "Counted loop"},
  {"GOTO", "Unconditional jump (discouraged)"},
  {"GRANT", "Make names visible outside module"},
  {"IF", "Conditional statement"},
  {"INIT", "Initialize with value"},
  {"INT", "Integer mode"},
  {"LOC", "Local (stack) storage"},
  {"MOD", "Modulo operator"},
  {"MODULE", "Defines a module - the basic unit of CHILL program structure"},
  {"NEWMODE", "Defines a new mode (type) derived from existing modes"},
  {"NOT", "Logical NOT operator"},
  {"NULL", "Null reference value"},
  {"OD", "Terminates a DO loop"},
  {"OR", "Logical OR operator"},
  {"ORIF", "Short-circuit OR (evaluates right only if left is FALSE)"},
  {"POWERSET", "Set of discrete values mode"},
  {"PROC", "Defines a procedure"},
  {"PROCESS", "Defines a concurrent process"},
  {"RANGE", "Integer subrange mode"},
  {"READ", "Read-only attribute"},
  {"RECEIVE", "Receive a signal from a process"},
  {"REF", "Reference (pointer) mode"},
  {"REGION", "Defines a protected region for mutual exclusion"},
  {"REM", "Remainder operator"},
  {"RETURN", "Return from procedure with optional value"},
  {"SEIZE", "Access names from another module"},
  {"SEND", "Send a signal to a process"},
  {"SET", "Enumeration mode"},
  {"SIGNAL", "Defines a signal for inter-process communication"},
  {"START", "Start a new process instance"},
  {"STATIC", "Static storage duration"},
  {"STOP", "Stop the current process"},
  {"STRUCT", "Structure mode (record)"},
  {"SYN", "Defines a synonym (named constant)"},
  {"SYNMODE", "Defines a synonym mode (type alias)"},
  {"THEN", "Introduces the consequent of IF"},
  {"TRUE", "Boolean true value"},
  {"WHILE", "Loop while condition is true"},
  {"XOR", "Logical exclusive OR operator"},
  {"BODY", "Introduces a module or region body"},
  {"SPEC", "Introduces a module or region specification"},
  {"GENERAL", "Procedure attribute: may be called through a procedure mode"},
}};

template <size_t N>
bool contains_sorted(const std::array<std::string_view, N> & table, std::string_view word)
{
  const std::string upper = text::to_upper(word);
  return std::binary_search(table.begin(), table.end(), std::string_view(upper));
}

}  // namespace

bool is_reserved_word(std::string_view word) { return contains_sorted(k_reserved_words, word); }

bool is_predefined_name(std::string_view word)
{
  return contains_sorted(k_predefined_names, word);
}

std::optional<std::string_view> keyword_doc(std::string_view word)
{
  const std::string upper = text::to_upper(word);
  const auto it = std::find_if(
    k_keyword_docs.begin(), k_keyword_docs.end(),
    [&](const KeywordDoc & d) { return d.word == upper; });
  if (it == k_keyword_docs.end()) {
    return std::nullopt;
  }
  return it->doc;
}

}  // namespace chill::syntax
