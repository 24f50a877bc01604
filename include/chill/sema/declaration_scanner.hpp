// chill/sema/declaration_scanner.hpp - Line-oriented declaration discovery
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "chill/basic/diagnostic.hpp"
#include "chill/sema/symbol_table.hpp"

namespace chill
{

// ============================================================================
// Scope context
// ============================================================================

enum class ScopeKind : uint8_t {
  Module,
  Procedure,
  Process,
};

struct ScopeFrame
{
  std::string name;
  ScopeKind kind = ScopeKind::Module;
  uint32_t last_line = 0;  ///< 1-based, inclusive
};

/**
 * Lexical nesting state of one scan.
 *
 * Frames are pushed when a module, procedure or process header is read and
 * dropped once the scan moves past their last line. Each scan owns its own
 * context, so concurrent scans of different documents share nothing.
 */
class ScopeContext
{
public:
  void push(ScopeFrame frame) { frames_.push_back(std::move(frame)); }

  /// Drop every frame whose last line is before `line`.
  void leave_before(uint32_t line);

  [[nodiscard]] const ScopeFrame * innermost() const noexcept
  {
    return frames_.empty() ? nullptr : &frames_.back();
  }

  /// Innermost frame of the given kind, or nullptr.
  [[nodiscard]] const ScopeFrame * innermost(ScopeKind kind) const noexcept;

  /// Name used to qualify declarations (the global sentinel outside any frame).
  [[nodiscard]] std::string_view current_scope() const noexcept;

  /// True if the innermost frame is a procedure or process body.
  [[nodiscard]] bool in_body() const noexcept;

  [[nodiscard]] size_t depth() const noexcept { return frames_.size(); }

private:
  std::vector<ScopeFrame> frames_;
};

// ============================================================================
// Scanner entry points
// ============================================================================

/**
 * Build a symbol table from comment-free text.
 *
 * Lines are classified one at a time; the first matching rule extracts at
 * most one entity. The scan never throws. When `diags` is given, lines that
 * start like a declaration but cannot be read yield a Hint (H001) and
 * bodies without a matching END yield a Warning (W001). Diagnostic ranges
 * are byte offsets into `cleaned_text`.
 */
[[nodiscard]] SymbolTable scan_declarations(
  std::string_view cleaned_text, DiagnosticBag * diags = nullptr);

/// strip_comments() followed by scan_declarations().
[[nodiscard]] SymbolTable parse_document(std::string_view raw_text, DiagnosticBag * diags = nullptr);

/**
 * Parse the inside of a parenthesized parameter list.
 *
 * Entries are separated by top-level commas. A whole-word INOUT, OUT or IN
 * (in that precedence) sets the direction and is removed; the first
 * remaining token is the name and the last one the mode.
 */
[[nodiscard]] std::vector<Parameter> parse_parameter_list(std::string_view text);

/**
 * Find the END matching the construct header on `lines[header_index]`.
 *
 * @return 1-based line of the matching END, or std::nullopt if the input
 *         ends first
 */
[[nodiscard]] std::optional<uint32_t> find_construct_end(
  const std::vector<std::string_view> & lines, size_t header_index);

}  // namespace chill
