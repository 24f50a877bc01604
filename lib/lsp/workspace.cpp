// chill/lsp/workspace.cpp - Serverless language service implementation
#include <algorithm>
#include <cstdint>
#include <fmt/format.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "chill/basic/diagnostic.hpp"
#include "chill/basic/source_manager.hpp"
#include "chill/basic/text.hpp"
#include "chill/lsp/lsp.hpp"
#include "chill/lsp/queries.hpp"
#include "chill/sema/declaration_scanner.hpp"
#include "chill/syntax/comment_stripper.hpp"

namespace chill::lsp
{
namespace
{

using json = nlohmann::json;

// -----------------------------
// Range helpers
// -----------------------------

uint32_t clamp_byte_offset(uint32_t off, size_t text_size)
{
  if (off > text_size) {
    return static_cast<uint32_t>(text_size);
  }
  return off;
}

struct ByteRange
{
  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

json range_to_json(const FullSourceRange & r)
{
  return json{
    {"startByte", r.start_byte},     {"endByte", r.end_byte}, {"startLine", r.start_line},
    {"startColumn", r.start_column}, {"endLine", r.end_line}, {"endColumn", r.end_column},
  };
}

json byte_range_to_json(const ByteRange & r)
{
  return json{{"startByte", r.startByte}, {"endByte", r.endByte}};
}

/// Cursor position split into a 0-based line index and byte column.
struct Cursor
{
  uint32_t line = 0;
  uint32_t column = 0;
};

Cursor cursor_at(const SourceManager & sm, uint32_t byte_offset)
{
  byte_offset = clamp_byte_offset(byte_offset, sm.get_source().size());
  const LineColumn lc = sm.get_line_column(byte_offset);
  Cursor c;
  c.line = lc.line > 0 ? lc.line - 1 : 0;
  c.column = byte_offset - sm.get_line_offset(c.line);
  return c;
}

/// Byte range of columns [start, end) on a line, clamped to the line content.
SourceRange line_span(const SourceManager & sm, uint32_t line_index, uint32_t start, uint32_t end)
{
  const uint32_t base = sm.get_line_offset(line_index);
  const auto len = static_cast<uint32_t>(sm.get_line(line_index).size());
  start = std::min(start, len);
  end = std::clamp(end, start, len);
  return {base + start, base + end};
}

/**
 * Span of `name` on a raw line.
 *
 * Entity columns are measured on the comment-free line; when a block comment
 * earlier on the line shifted them, the first whole-word occurrence is used.
 * Falls back to the line content.
 */
SourceRange name_span(
  const SourceManager & sm, uint32_t line_index, std::string_view name, uint32_t column_start,
  uint32_t column_end)
{
  const std::string_view line = sm.get_line(line_index);
  if (column_end > column_start && column_end <= line.size()) {
    if (text::iequals(line.substr(column_start, column_end - column_start), name)) {
      return line_span(sm, line_index, column_start, column_end);
    }
  }
  const auto spans = find_references(line, name);
  if (!spans.empty()) {
    return line_span(sm, line_index, spans.front().column_start, spans.front().column_end);
  }
  return sm.get_line_content_range(line_index);
}

}  // namespace

struct Workspace::Impl
{
  struct Document
  {
    std::string uri;
    std::string text;
    std::string cleaned;

    SourceManager source;          // raw text, for cursor positions
    SourceManager cleaned_source;  // comment-free text, for diagnostics

    SymbolTable model;
    DiagnosticBag diags;
  };

  std::unordered_map<std::string, std::unique_ptr<Document>> docs;

  CompletionOptions completion_options;
  bool diagnostics_enabled = true;

  [[nodiscard]] const Document * get_doc(std::string_view uri) const
  {
    auto it = docs.find(std::string(uri));
    if (it == docs.end()) {
      return nullptr;
    }
    return it->second.get();
  }

  static std::unique_ptr<Document> build_document(std::string uri, std::string text)
  {
    auto d = std::make_unique<Document>();
    d->uri = std::move(uri);
    d->cleaned = syntax::strip_comments(text);
    d->model = scan_declarations(d->cleaned, &d->diags);
    d->cleaned_source = SourceManager(d->cleaned);
    d->source = SourceManager(text);
    d->text = std::move(text);
    return d;
  }

  // ===========================================================================
  // Diagnostics
  // ===========================================================================

  json diagnostics_json_impl(std::string_view uri) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["items"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr || !diagnostics_enabled) {
      return out;
    }

    for (const auto & diag : doc->diags) {
      json item;
      item["source"] = "chill";
      item["message"] = diag.message;
      item["severity"] = to_string(diag.severity);
      if (!diag.code.empty()) {
        item["code"] = diag.code;
      }
      if (diag.help_message) {
        item["help"] = *diag.help_message;
      }
      const SourceRange r = diag.primary_range();
      if (r.is_valid()) {
        item["range"] = range_to_json(doc->cleaned_source.get_full_range(r));
      }
      out["items"].push_back(std::move(item));
    }
    return out;
  }

  // ===========================================================================
  // Completion
  // ===========================================================================

  json completion_json_impl(std::string_view uri, uint32_t byte_offset) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["items"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    const Cursor c = cursor_at(doc->source, byte_offset);
    const std::string_view line = doc->source.get_line(c.line);
    const uint32_t column = std::min<uint32_t>(c.column, static_cast<uint32_t>(line.size()));

    const std::string prefix = completion_prefix(line, column);
    const uint32_t end_byte = doc->source.get_line_offset(c.line) + column;
    const ByteRange replace_range{end_byte - static_cast<uint32_t>(prefix.size()), end_byte};

    const auto items = complete(doc->model, line, column, completion_options);
    for (size_t i = 0; i < items.size(); ++i) {
      const auto & ci = items[i];
      json item;
      item["label"] = ci.label;
      item["kind"] = std::string(to_string(ci.kind));
      item["lspKind"] = protocol_kind(ci.kind);
      item["detail"] = ci.detail;
      item["insertText"] = ci.label;
      item["sortText"] = fmt::format("{:04d}", i);
      item["replaceRange"] = byte_range_to_json(replace_range);
      out["items"].push_back(std::move(item));
    }
    return out;
  }

  // ===========================================================================
  // Hover
  // ===========================================================================

  json hover_json_impl(std::string_view uri, uint32_t byte_offset) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["contents"] = nullptr;

    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    const Cursor c = cursor_at(doc->source, byte_offset);
    const std::string_view line = doc->source.get_line(c.line);
    const auto word = word_at(line, c.column);
    if (!word) {
      return out;
    }

    const auto md = hover(doc->model, *word);
    if (!md) {
      return out;
    }
    out["contents"] = *md;

    // Range of the hovered word
    const uint32_t col = std::min<uint32_t>(c.column, static_cast<uint32_t>(line.size()));
    for (const auto & span : find_references(line, *word)) {
      if (span.column_start <= col && col <= span.column_end) {
        out["range"] = range_to_json(doc->source.get_full_range(
          line_span(doc->source, c.line, span.column_start, span.column_end)));
        break;
      }
    }
    return out;
  }

  // ===========================================================================
  // Definition / references
  // ===========================================================================

  json definition_json_impl(std::string_view uri, uint32_t byte_offset) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["locations"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    const Cursor c = cursor_at(doc->source, byte_offset);
    const auto word = word_at(doc->source.get_line(c.line), c.column);
    if (!word) {
      return out;
    }

    const auto site = find_definition(doc->model, *word);
    if (!site || site->line >= doc->source.get_line_count()) {
      return out;
    }

    const SourceRange r =
      site->column_end > site->column_start
        ? name_span(
            doc->source, site->line, symbol_name(site->symbol), site->column_start, site->column_end)
        : doc->source.get_line_content_range(site->line);

    json loc;
    loc["uri"] = doc->uri;
    loc["name"] = symbol_name(site->symbol);
    loc["kind"] = std::string(to_string(symbol_kind_of(site->symbol)));
    loc["range"] = range_to_json(doc->source.get_full_range(r));
    out["locations"].push_back(std::move(loc));
    return out;
  }

  json references_json_impl(std::string_view uri, uint32_t byte_offset) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["locations"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    const Cursor c = cursor_at(doc->source, byte_offset);
    const auto word = word_at(doc->source.get_line(c.line), c.column);
    if (!word) {
      return out;
    }

    for (const auto & span : find_references(doc->text, *word)) {
      json loc;
      loc["uri"] = doc->uri;
      loc["range"] = range_to_json(doc->source.get_full_range(
        line_span(doc->source, span.line, span.column_start, span.column_end)));
      out["locations"].push_back(std::move(loc));
    }
    return out;
  }

  // ===========================================================================
  // Document symbols
  // ===========================================================================

  json document_symbols_json_impl(std::string_view uri) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["symbols"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    const SourceManager & sm = doc->source;
    const auto line_count = static_cast<uint32_t>(sm.get_line_count());

    for (const auto & sym : document_symbols(doc->model)) {
      if (sym.line == 0 || sym.line > line_count) {
        continue;
      }
      const uint32_t first = sym.line - 1;
      const uint32_t last = std::clamp(sym.line_end, sym.line, line_count) - 1;

      const SourceRange head = sm.get_line_content_range(first);
      const SourceRange tail = sm.get_line_content_range(last);
      const SourceRange whole(head.get_begin(), tail.get_end());

      // Selection: the name as written on its header line
      const SourceRange selection =
        name_span(sm, first, sym.name, sym.column_start, sym.column_end);

      json s;
      s["name"] = sym.name;
      s["kind"] = std::string(to_string(sym.kind));
      s["lspKind"] = protocol_kind(sym.kind);
      s["detail"] = sym.detail;
      s["range"] = range_to_json(sm.get_full_range(whole));
      s["selectionRange"] = range_to_json(sm.get_full_range(selection));
      out["symbols"].push_back(std::move(s));
    }
    return out;
  }
};

// ============================================================================
// Public API
// ============================================================================

Workspace::Workspace() : impl_(new Impl()) {}

Workspace::~Workspace() { delete impl_; }

Workspace::Workspace(Workspace && other) noexcept : impl_(other.impl_) { other.impl_ = nullptr; }

Workspace & Workspace::operator=(Workspace && other) noexcept
{
  if (this == &other) {
    return *this;
  }
  delete impl_;
  impl_ = other.impl_;
  other.impl_ = nullptr;
  return *this;
}

void Workspace::set_document(std::string uri, std::string text)
{
  // Build the new model first; the previous one stays visible until the swap.
  auto doc = Impl::build_document(uri, std::move(text));
  impl_->docs[std::move(uri)] = std::move(doc);
}

void Workspace::remove_document(std::string_view uri) { impl_->docs.erase(std::string(uri)); }

bool Workspace::has_document(std::string_view uri) const
{
  return impl_->docs.find(std::string(uri)) != impl_->docs.end();
}

const SymbolTable * Workspace::model(std::string_view uri) const
{
  const auto * doc = impl_->get_doc(uri);
  return doc != nullptr ? &doc->model : nullptr;
}

void Workspace::set_completion_options(CompletionOptions options)
{
  impl_->completion_options = options;
}

void Workspace::set_diagnostics_enabled(bool enabled) { impl_->diagnostics_enabled = enabled; }

std::string Workspace::diagnostics_json(std::string_view uri)
{
  return impl_->diagnostics_json_impl(uri).dump();
}

std::string Workspace::completion_json(std::string_view uri, uint32_t byte_offset)
{
  return impl_->completion_json_impl(uri, byte_offset).dump();
}

std::string Workspace::hover_json(std::string_view uri, uint32_t byte_offset)
{
  return impl_->hover_json_impl(uri, byte_offset).dump();
}

std::string Workspace::definition_json(std::string_view uri, uint32_t byte_offset)
{
  return impl_->definition_json_impl(uri, byte_offset).dump();
}

std::string Workspace::references_json(std::string_view uri, uint32_t byte_offset)
{
  return impl_->references_json_impl(uri, byte_offset).dump();
}

std::string Workspace::document_symbols_json(std::string_view uri)
{
  return impl_->document_symbols_json_impl(uri).dump();
}

}  // namespace chill::lsp
