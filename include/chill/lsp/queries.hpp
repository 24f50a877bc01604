// chill/lsp/queries.hpp - IDE queries over a finished symbol table
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chill/sema/symbol_table.hpp"

namespace chill::lsp
{

// ============================================================================
// Completion
// ============================================================================

enum class CompletionKind : uint8_t {
  Keyword,
  Predefined,
  Declaration,
  Mode,
  Procedure,
  Synonym,
};

[[nodiscard]] std::string_view to_string(CompletionKind kind) noexcept;

/// LSP CompletionItemKind for a completion category.
[[nodiscard]] int protocol_kind(CompletionKind kind) noexcept;

/// LSP SymbolKind for an entity kind.
[[nodiscard]] int protocol_kind(SymbolKind kind) noexcept;

struct CompletionItem
{
  std::string label;
  CompletionKind kind = CompletionKind::Keyword;
  std::string detail;
};

struct CompletionOptions
{
  bool keywords = true;    ///< Offer reserved words
  bool predefined = true;  ///< Offer predefined names
};

/**
 * Identifier characters immediately before `column` in `line`.
 *
 * `column` is a 0-based byte column and is clamped to the line length.
 */
[[nodiscard]] std::string completion_prefix(std::string_view line, uint32_t column);

/**
 * Names starting with the prefix at the cursor (case-insensitive).
 *
 * Order: reserved words, predefined names, declarations, modes, procedures,
 * synonyms. Within a group, keywords are alphabetical and entities follow
 * source order.
 */
[[nodiscard]] std::vector<CompletionItem> complete(
  const SymbolTable & model, std::string_view line, uint32_t column,
  const CompletionOptions & options = {});

// ============================================================================
// Hover / definition
// ============================================================================

/**
 * Markdown description of `word`, or std::nullopt when nothing is known.
 *
 * Reserved words and predefined names are answered without consulting the
 * model.
 */
[[nodiscard]] std::optional<std::string> hover(const SymbolTable & model, std::string_view word);

struct DefinitionSite
{
  SymbolRef symbol;
  uint32_t line = 0;          ///< 0-based
  uint32_t column_start = 0;  ///< 0-based
  uint32_t column_end = 0;    ///< 0 when only the line is known
};

[[nodiscard]] std::optional<DefinitionSite> find_definition(
  const SymbolTable & model, std::string_view word);

// ============================================================================
// Text-level queries
// ============================================================================

struct TextSpan
{
  uint32_t line = 0;  ///< 0-based
  uint32_t column_start = 0;
  uint32_t column_end = 0;

  bool operator==(const TextSpan &) const = default;
};

/// Case-insensitive whole-word occurrences of `word` in `text`.
[[nodiscard]] std::vector<TextSpan> find_references(std::string_view text, std::string_view word);

[[nodiscard]] std::vector<OutlineSymbol> document_symbols(const SymbolTable & model);

/// Identifier touching `column` in `line` (either side of the cursor).
[[nodiscard]] std::optional<std::string> word_at(std::string_view line, uint32_t column);

}  // namespace chill::lsp
