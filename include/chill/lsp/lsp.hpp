// chill/lsp/lsp.hpp - LSP-like language service APIs (serverless)
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "chill/lsp/queries.hpp"
#include "chill/sema/symbol_table.hpp"

namespace chill::lsp
{

/**
 * Serverless language service for CHILL.
 *
 * Keeps one symbol table per document and answers LSP-equivalent queries
 * (diagnostics/completion/hover/definition/references/outline) as JSON
 * strings. It does not implement the protocol itself; a host (the stdio
 * server, or a test) owns transport and position conversion.
 *
 * Positions passed in are UTF-8 byte offsets into the document text. Ranges
 * in results carry both byte offsets and 1-indexed line/column pairs.
 *
 * Every update rebuilds the document's model completely before it replaces
 * the previous one, so queries never observe a partially built model.
 */
class Workspace
{
public:
  Workspace();
  ~Workspace();

  Workspace(const Workspace &) = delete;
  Workspace & operator=(const Workspace &) = delete;

  Workspace(Workspace && other) noexcept;
  Workspace & operator=(Workspace && other) noexcept;

  void set_document(std::string uri, std::string text);
  void remove_document(std::string_view uri);
  [[nodiscard]] bool has_document(std::string_view uri) const;

  /// Symbol table of a document, or nullptr for an unknown URI.
  [[nodiscard]] const SymbolTable * model(std::string_view uri) const;

  // Settings (normally taken from chill.yaml)
  void set_completion_options(CompletionOptions options);
  void set_diagnostics_enabled(bool enabled);

  // Diagnostics (scanner warnings and hints)
  std::string diagnostics_json(std::string_view uri);

  // Completion
  std::string completion_json(std::string_view uri, uint32_t byte_offset);

  // Hover
  std::string hover_json(std::string_view uri, uint32_t byte_offset);

  // Go-to-definition
  std::string definition_json(std::string_view uri, uint32_t byte_offset);

  // Find references (case-insensitive whole-word matches of the word at the offset)
  std::string references_json(std::string_view uri, uint32_t byte_offset);

  // Document symbols (outline)
  std::string document_symbols_json(std::string_view uri);

private:
  struct Impl;
  Impl * impl_;
};

}  // namespace chill::lsp
