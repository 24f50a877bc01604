// chill/lsp/queries.cpp - Completion, hover, definition and reference queries
#include "chill/lsp/queries.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

#include "chill/basic/text.hpp"
#include "chill/syntax/comment_stripper.hpp"
#include "chill/syntax/keywords.hpp"

namespace chill::lsp
{
namespace
{

inline unsigned char uc(char c) { return static_cast<unsigned char>(c); }

std::string declaration_detail(const Declaration & d)
{
  return "DCL " + std::string(to_string(d.mode));
}

std::string mode_detail(const ModeDefinition & m)
{
  return std::string(m.is_synmode ? "SYNMODE " : "NEWMODE ") + std::string(to_string(m.base));
}

std::string join(const std::vector<std::string> & items)
{
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += items[i];
  }
  return out;
}

// -----------------------------
// Hover rendering per entity
// -----------------------------

std::string describe(std::string_view word, const Declaration & d)
{
  std::string md = "**" + std::string(word) + "** - " + declaration_detail(d);
  if (d.mode_name) {
    md += " (" + *d.mode_name + ")";
  }
  if (d.initial_value) {
    md += "\n\nInitial value: " + *d.initial_value;
  }
  return md;
}

std::string describe(std::string_view word, const ModeDefinition & m)
{
  std::string md = "**" + std::string(word) + "** - " + mode_detail(m);
  if (!m.set_values.empty()) {
    md += "\n\nValues: " + join(m.set_values);
  }
  if (m.range_low && m.range_high) {
    md += "\n\nRange: " + std::to_string(*m.range_low) + ":" + std::to_string(*m.range_high);
  }
  if (!m.struct_fields.empty()) {
    std::vector<std::string> names;
    names.reserve(m.struct_fields.size());
    for (const auto & f : m.struct_fields) {
      names.push_back(f.name);
    }
    md += "\n\nFields: " + join(names);
  }
  return md;
}

std::string describe(std::string_view word, const Procedure & p)
{
  std::string md =
    "**" + std::string(word) + "** - PROC(" + format_parameters(p.parameters, true) + ")";
  if (p.returns) {
    md += " RETURNS(" + *p.returns + ")";
  }
  return md;
}

std::string describe(std::string_view word, const Process & p)
{
  return "**" + std::string(word) + "** - PROCESS(" + format_parameters(p.parameters, true) + ")";
}

std::string describe(std::string_view word, const Synonym & s)
{
  return "**" + std::string(word) + "** - SYN = " + s.value;
}

std::string describe(std::string_view word, const Signal & s)
{
  return "**" + std::string(word) + "** - SIGNAL(" + format_parameters(s.parameters, false) + ")";
}

}  // namespace

// ============================================================================
// Kind mappings
// ============================================================================

std::string_view to_string(CompletionKind kind) noexcept
{
  switch (kind) {
    case CompletionKind::Keyword:
      return "Keyword";
    case CompletionKind::Predefined:
      return "Predefined";
    case CompletionKind::Declaration:
      return "Declaration";
    case CompletionKind::Mode:
      return "Mode";
    case CompletionKind::Procedure:
      return "Procedure";
    case CompletionKind::Synonym:
      return "Synonym";
  }
  return "Keyword";
}

int protocol_kind(CompletionKind kind) noexcept
{
  // LSP CompletionItemKind
  switch (kind) {
    case CompletionKind::Keyword:
      return 14;  // Keyword
    case CompletionKind::Predefined:
      return 3;  // Function
    case CompletionKind::Declaration:
      return 6;  // Variable
    case CompletionKind::Mode:
      return 7;  // Class
    case CompletionKind::Procedure:
      return 3;  // Function
    case CompletionKind::Synonym:
      return 21;  // Constant
  }
  return 1;  // Text
}

int protocol_kind(SymbolKind kind) noexcept
{
  // LSP SymbolKind
  switch (kind) {
    case SymbolKind::Module:
      return 2;  // Module
    case SymbolKind::Mode:
      return 5;  // Class
    case SymbolKind::Declaration:
      return 13;  // Variable
    case SymbolKind::Synonym:
      return 14;  // Constant
    case SymbolKind::Procedure:
      return 12;  // Function
    case SymbolKind::Process:
      return 12;  // Function
    case SymbolKind::Signal:
      return 24;  // Event
  }
  return 13;
}

// ============================================================================
// Completion
// ============================================================================

std::string completion_prefix(std::string_view line, uint32_t column)
{
  size_t end = std::min<size_t>(column, line.size());
  size_t start = end;
  while (start > 0 && text::is_ident_char(uc(line[start - 1]))) {
    --start;
  }
  return std::string(line.substr(start, end - start));
}

std::vector<CompletionItem> complete(
  const SymbolTable & model, std::string_view line, uint32_t column,
  const CompletionOptions & options)
{
  const std::string prefix = completion_prefix(line, column);
  std::vector<CompletionItem> items;

  auto offer = [&](std::string_view name, CompletionKind kind, std::string detail) {
    if (text::istarts_with(name, prefix)) {
      items.push_back(CompletionItem{std::string(name), kind, std::move(detail)});
    }
  };

  if (options.keywords) {
    for (const auto kw : syntax::k_reserved_words) {
      offer(kw, CompletionKind::Keyword, "CHILL keyword");
    }
  }
  if (options.predefined) {
    for (const auto name : syntax::k_predefined_names) {
      offer(name, CompletionKind::Predefined, "Built-in");
    }
  }
  for (const auto & name : model.names(SymbolKind::Declaration)) {
    if (const auto * d = model.find_declaration(name)) {
      offer(name, CompletionKind::Declaration, declaration_detail(*d));
    }
  }
  for (const auto & m : model.modes()) {
    offer(m.name, CompletionKind::Mode, mode_detail(m));
  }
  for (const auto & p : model.procedures()) {
    offer(p.name, CompletionKind::Procedure, "PROC(" + format_parameters(p.parameters, false) + ")");
  }
  for (const auto & s : model.synonyms()) {
    offer(s.name, CompletionKind::Synonym, "SYN = " + s.value);
  }
  return items;
}

// ============================================================================
// Hover / definition
// ============================================================================

std::optional<std::string> hover(const SymbolTable & model, std::string_view word)
{
  if (word.empty()) {
    return std::nullopt;
  }
  const std::string head = "**" + std::string(word) + "** - ";
  const auto doc = syntax::keyword_doc(word);

  if (syntax::is_reserved_word(word)) {
    std::string md = head + "CHILL reserved word";
    if (doc) {
      md += "\n\n" + std::string(*doc);
    }
    return md;
  }
  if (syntax::is_predefined_name(word)) {
    std::string md = head + "CHILL predefined name";
    if (doc) {
      md += "\n\n" + std::string(*doc);
    }
    return md;
  }

  if (const auto * d = model.find_declaration(word)) return describe(word, *d);
  if (const auto * m = model.find_mode(word)) return describe(word, *m);
  if (const auto * p = model.find_procedure(word)) return describe(word, *p);
  if (const auto * s = model.find_synonym(word)) return describe(word, *s);
  if (const auto * p = model.find_process(word)) return describe(word, *p);
  if (const auto * s = model.find_signal(word)) return describe(word, *s);

  if (doc) {
    return head + std::string(*doc);
  }
  return std::nullopt;
}

std::optional<DefinitionSite> find_definition(const SymbolTable & model, std::string_view word)
{
  const auto ref = model.find_any(word);
  if (!ref) {
    return std::nullopt;
  }

  DefinitionSite site{*ref};
  std::visit(
    [&](const auto * entity) {
      site.line = entity->line > 0 ? entity->line - 1 : 0;
      using T = std::decay_t<decltype(*entity)>;
      if constexpr (std::is_same_v<T, Declaration>) {
        site.column_start = entity->column_start;
        site.column_end = entity->column_end;
      }
    },
    *ref);
  return site;
}

// ============================================================================
// Text-level queries
// ============================================================================

std::vector<TextSpan> find_references(std::string_view text, std::string_view word)
{
  std::vector<TextSpan> spans;
  if (word.empty()) {
    return spans;
  }
  const std::string needle = text::to_upper(word);
  const auto lines = syntax::split_lines(text);

  for (size_t li = 0; li < lines.size(); ++li) {
    const std::string upper = text::to_upper(lines[li]);
    size_t pos = upper.find(needle);
    while (pos != std::string::npos) {
      const size_t end = pos + needle.size();
      const bool left_ok = pos == 0 || !text::is_ident_char(uc(upper[pos - 1]));
      const bool right_ok = end >= upper.size() || !text::is_ident_char(uc(upper[end]));
      if (left_ok && right_ok) {
        spans.push_back(TextSpan{
          static_cast<uint32_t>(li), static_cast<uint32_t>(pos), static_cast<uint32_t>(end)});
        pos = upper.find(needle, end);
      } else {
        pos = upper.find(needle, pos + 1);
      }
    }
  }
  return spans;
}

std::vector<OutlineSymbol> document_symbols(const SymbolTable & model)
{
  return model.all_symbols();
}

std::optional<std::string> word_at(std::string_view line, uint32_t column)
{
  const size_t col = std::min<size_t>(column, line.size());
  size_t start = col;
  while (start > 0 && text::is_ident_char(uc(line[start - 1]))) {
    --start;
  }
  size_t end = col;
  while (end < line.size() && text::is_ident_char(uc(line[end]))) {
    ++end;
  }
  if (end <= start) {
    return std::nullopt;
  }
  return std::string(line.substr(start, end - start));
}

}  // namespace chill::lsp
