// chill/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "chill/basic/diagnostic.hpp"
#include "chill/basic/source_manager.hpp"

namespace chill
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[W001]: procedure 'handler' has no matching END
 *     --> src/main.chl:14:1
 *      |
 *   14 | handler: PROC(input INT) RETURNS(INT);
 *      | ^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^^ opened here
 *      |
 *      = help: add `END handler;` to close the body
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print a single diagnostic against the (comment-stripped) source it was reported on.
  void print(const Diagnostic & diag, const SourceManager & source);

  /// Print all diagnostics sorted by primary location.
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceManager & source);

  void print_source_line(
    const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  /// Trailing `= help: ...` / `= note: ...` line.
  void print_footer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter(std::string_view text) const;
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace chill
