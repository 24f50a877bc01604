// chill/sema/symbol_table.hpp - Entities discovered in one CHILL document
//
// The symbol table is populated by the declaration scanner in a single pass
// and is read-only afterwards. Lookups are case-insensitive.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "chill/sema/mode.hpp"

namespace chill
{

/// Scope name used for declarations outside any module or procedure.
inline constexpr std::string_view k_global_scope = "GLOBAL";

// ============================================================================
// Entities
// ============================================================================

/**
 * A location declaration (`DCL`).
 */
struct Declaration
{
  std::string name;
  ModeKind mode = ModeKind::Unknown;
  std::optional<std::string> mode_name;      ///< User mode name when not built-in
  std::optional<std::string> initial_value;  ///< Text after `:=`, unparsed
  bool is_static = false;
  bool is_dynamic = false;
  bool is_loc = false;
  bool is_read = false;
  uint32_t line = 0;          ///< 1-based
  uint32_t column_start = 0;  ///< 0-based, name start in its line
  uint32_t column_end = 0;    ///< 0-based, one past the name
  std::string scope = std::string(k_global_scope);
};

/**
 * A mode definition (`NEWMODE` / `SYNMODE`).
 */
struct ModeDefinition
{
  std::string name;
  bool is_synmode = false;
  ModeKind base = ModeKind::Unknown;
  std::string definition;  ///< Right-hand side text
  std::vector<std::string> set_values;
  std::optional<int64_t> range_low;
  std::optional<int64_t> range_high;
  std::vector<Declaration> struct_fields;  ///< In declaration order
  std::optional<std::string> element_mode;  ///< ARRAY element mode
  std::optional<std::string> ref_mode;      ///< REF target mode
  uint32_t line = 0;
};

/// A named constant (`SYN`).
struct Synonym
{
  std::string name;
  std::string value;
  std::optional<std::string> mode_name;
  uint32_t line = 0;
};

enum class ParamDirection : uint8_t {
  In,
  Out,
  InOut,
};

[[nodiscard]] std::string_view to_string(ParamDirection dir) noexcept;

struct Parameter
{
  std::string name;
  std::string mode;  ///< Mode text, or "UNKNOWN" when absent
  ParamDirection direction = ParamDirection::In;
};

/// Render "a INT, b CHARS(10)"; with directions "a IN INT, b OUT CHARS(10)".
[[nodiscard]] std::string format_parameters(
  const std::vector<Parameter> & params, bool with_direction);

/**
 * A procedure definition (`name: PROC ...`).
 *
 * Declarations and modes found inside the body are also recorded on the
 * procedure itself, in source order.
 */
struct Procedure
{
  std::string name;
  std::vector<Parameter> parameters;
  std::optional<std::string> returns;
  bool is_general = false;
  bool is_inline = false;
  bool is_recursive = false;
  uint32_t line = 0;
  uint32_t line_end = 0;  ///< Line of the matching END, or `line` if unterminated
  std::vector<Declaration> local_declarations;
  std::vector<ModeDefinition> local_modes;

  [[nodiscard]] const Declaration * find_local_declaration(std::string_view name) const;
};

/// A process definition (`name: PROCESS ...`).
struct Process
{
  std::string name;
  std::vector<Parameter> parameters;
  uint32_t line = 0;
  uint32_t line_end = 0;
  std::vector<Declaration> local_declarations;
  std::vector<ModeDefinition> local_modes;

  [[nodiscard]] const Declaration * find_local_declaration(std::string_view name) const;
};

struct Module
{
  std::string name;
  bool is_spec = false;
  uint32_t line = 0;
  uint32_t line_end = 0;
  std::vector<std::string> granted;
  std::vector<std::string> seized;
};

/// A signal definition; parameters carry no direction.
struct Signal
{
  std::string name;
  std::vector<Parameter> parameters;
  uint32_t line = 0;
};

// ============================================================================
// Kind tagging
// ============================================================================

/// Entity kinds, in the same order as the alternatives of SymbolRef.
enum class SymbolKind : uint8_t {
  Declaration,
  Mode,
  Procedure,
  Process,
  Synonym,
  Module,
  Signal,
};

[[nodiscard]] std::string_view to_string(SymbolKind kind) noexcept;

using SymbolRef = std::variant<
  const Declaration *, const ModeDefinition *, const Procedure *, const Process *,
  const Synonym *, const Module *, const Signal *>;

[[nodiscard]] SymbolKind symbol_kind_of(const SymbolRef & ref) noexcept;

/// Name of the entity behind a reference, as written in the source.
[[nodiscard]] const std::string & symbol_name(const SymbolRef & ref) noexcept;

/// One row of the document outline.
struct OutlineSymbol
{
  std::string name;
  SymbolKind kind = SymbolKind::Declaration;
  uint32_t line = 0;      ///< 1-based
  uint32_t line_end = 0;  ///< 1-based, equals `line` for single-line entities
  uint32_t column_start = 0;
  uint32_t column_end = 0;  ///< 0 when the entity spans whole lines
  std::string detail;
};

// ============================================================================
// SymbolTable
// ============================================================================

/**
 * Per-document store of entities.
 *
 * Each kind keeps its entities in source order; a re-definition of the same
 * name and kind replaces the earlier entity in place.
 *
 * Declarations are reachable by their bare name and by `scope.name`
 * (`GLOBAL.name` for global ones). The bare-name slot follows last-write-wins
 * among declarations outside procedure/process bodies; a declaration inside a
 * body only takes the bare slot, and its module's `module.name` key, while
 * they are still empty.
 */
class SymbolTable
{
public:
  SymbolTable() = default;

  // ===========================================================================
  // Population
  // ===========================================================================

  /**
   * Add a declaration.
   *
   * @param decl The declaration (its `scope` selects the qualified key)
   * @param body_local True if it was found inside a procedure/process body
   * @param enclosing_module Module around that body, if any
   */
  void add_declaration(
    Declaration decl, bool body_local = false, std::string_view enclosing_module = {});
  void add_mode(ModeDefinition mode);
  void add_synonym(Synonym syn);
  void add_procedure(Procedure proc);
  void add_process(Process proc);
  void add_module(Module mod);
  void add_signal(Signal sig);

  /// Mutable access used by the scanner to attach body-local entities.
  [[nodiscard]] Procedure * find_procedure_mut(std::string_view name);
  [[nodiscard]] Process * find_process_mut(std::string_view name);
  [[nodiscard]] Module * find_module_mut(std::string_view name);

  // ===========================================================================
  // Lookup
  // ===========================================================================

  /**
   * Find a declaration.
   *
   * With a scope, `scope.name` is tried before the bare name. A `name` of the
   * form `qualifier.name` is looked up by that qualified key directly.
   */
  [[nodiscard]] const Declaration * find_declaration(
    std::string_view name, std::string_view scope = {}) const;
  [[nodiscard]] const ModeDefinition * find_mode(std::string_view name) const;
  [[nodiscard]] const Procedure * find_procedure(std::string_view name) const;
  [[nodiscard]] const Process * find_process(std::string_view name) const;
  [[nodiscard]] const Synonym * find_synonym(std::string_view name) const;
  [[nodiscard]] const Module * find_module(std::string_view name) const;
  [[nodiscard]] const Signal * find_signal(std::string_view name) const;

  /// First entity named `name`, in the order declaration, mode, procedure,
  /// process, synonym, signal, module.
  [[nodiscard]] std::optional<SymbolRef> find_any(std::string_view name) const;

  // ===========================================================================
  // Enumeration
  // ===========================================================================

  /// Names of one kind in source order (declarations: distinct bare names).
  [[nodiscard]] std::vector<std::string> names(SymbolKind kind) const;

  [[nodiscard]] const std::vector<Declaration> & declarations() const noexcept
  {
    return declarations_.items;
  }
  [[nodiscard]] const std::vector<ModeDefinition> & modes() const noexcept { return modes_.items; }
  [[nodiscard]] const std::vector<Procedure> & procedures() const noexcept
  {
    return procedures_.items;
  }
  [[nodiscard]] const std::vector<Process> & processes() const noexcept
  {
    return processes_.items;
  }
  [[nodiscard]] const std::vector<Synonym> & synonyms() const noexcept { return synonyms_.items; }
  [[nodiscard]] const std::vector<Module> & modules() const noexcept { return modules_.items; }
  [[nodiscard]] const std::vector<Signal> & signals() const noexcept { return signals_.items; }

  /// Outline rows sorted by start line (stable within a line).
  [[nodiscard]] std::vector<OutlineSymbol> all_symbols() const;

  /// Number of distinct entities.
  [[nodiscard]] size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

private:
  template <typename T>
  struct Ordered
  {
    std::vector<T> items;
    std::unordered_map<std::string, size_t> index;  ///< Uppercase key -> item

    void upsert(std::string key, T value);
    [[nodiscard]] const T * find(std::string_view name) const;
    [[nodiscard]] T * find(std::string_view name);
  };

  Ordered<Declaration> declarations_;
  Ordered<ModeDefinition> modes_;
  Ordered<Procedure> procedures_;
  Ordered<Process> processes_;
  Ordered<Synonym> synonyms_;
  Ordered<Module> modules_;
  Ordered<Signal> signals_;
};

}  // namespace chill
