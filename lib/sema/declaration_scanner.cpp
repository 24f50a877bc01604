// chill/sema/declaration_scanner.cpp - Line-oriented declaration discovery
//
// The scanner walks comment-free text once. Each non-blank line is matched
// against an ordered rule table; the first rule whose predicate accepts the
// line reads it with a small cursor and records at most one entity.
//
#include "chill/sema/declaration_scanner.hpp"

#include <algorithm>
#include <array>
#include <charconv>

#include "chill/basic/text.hpp"
#include "chill/syntax/comment_stripper.hpp"

namespace chill
{
namespace
{

inline unsigned char uc(char c) { return static_cast<unsigned char>(c); }

// ============================================================================
// LineCursor - hand-written reader over one line
// ============================================================================

class LineCursor
{
public:
  explicit LineCursor(std::string_view text) : text_(text) {}

  void skip_space()
  {
    while (pos_ < text_.size() && text::is_space(uc(text_[pos_]))) {
      ++pos_;
    }
  }

  [[nodiscard]] char peek()
  {
    skip_space();
    return pos_ < text_.size() ? text_[pos_] : '\0';
  }

  bool consume(char c)
  {
    skip_space();
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  /// Case-insensitive keyword followed by a non-identifier character.
  bool keyword(std::string_view kw)
  {
    skip_space();
    if (!text::istarts_with(text_.substr(pos_), kw)) {
      return false;
    }
    const size_t end = pos_ + kw.size();
    if (end < text_.size() && text::is_ident_char(uc(text_[end]))) {
      return false;
    }
    pos_ = end;
    return true;
  }

  std::optional<std::string_view> identifier()
  {
    skip_space();
    if (pos_ >= text_.size() || !text::is_ident_start(uc(text_[pos_]))) {
      return std::nullopt;
    }
    const size_t start = pos_;
    while (pos_ < text_.size() && text::is_ident_char(uc(text_[pos_]))) {
      ++pos_;
    }
    return text_.substr(start, pos_ - start);
  }

  /// Inside of a balanced `( ... )`; the cursor does not move if unbalanced.
  std::optional<std::string_view> parenthesized()
  {
    skip_space();
    if (pos_ >= text_.size() || text_[pos_] != '(') {
      return std::nullopt;
    }
    int depth = 0;
    for (size_t i = pos_; i < text_.size(); ++i) {
      if (text_[i] == '(') {
        ++depth;
      } else if (text_[i] == ')' && --depth == 0) {
        const std::string_view inner = text_.substr(pos_ + 1, i - pos_ - 1);
        pos_ = i + 1;
        return inner;
      }
    }
    return std::nullopt;
  }

  /// Text up to the first of `stops` outside parentheses.
  std::string_view take_until(std::string_view stops)
  {
    const size_t start = pos_;
    int depth = 0;
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (depth == 0 && stops.find(c) != std::string_view::npos) {
        break;
      }
      if (c == '(') {
        ++depth;
      } else if (c == ')' && depth > 0) {
        --depth;
      }
      ++pos_;
    }
    return text_.substr(start, pos_ - start);
  }

  [[nodiscard]] bool at_space() const noexcept
  {
    return pos_ < text_.size() && text::is_space(uc(text_[pos_]));
  }

  [[nodiscard]] bool looking_at(std::string_view s) const noexcept
  {
    return text::starts_with(text_.substr(pos_), s);
  }

  [[nodiscard]] std::string_view rest() const noexcept { return text_.substr(pos_); }

  [[nodiscard]] size_t offset_of(std::string_view part) const noexcept
  {
    return static_cast<size_t>(part.data() - text_.data());
  }

private:
  std::string_view text_;
  size_t pos_ = 0;
};

// ============================================================================
// Text helpers
// ============================================================================

std::vector<std::string_view> split_words(std::string_view s)
{
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && text::is_space(uc(s[i]))) {
      ++i;
    }
    const size_t start = i;
    while (i < s.size() && !text::is_space(uc(s[i]))) {
      ++i;
    }
    if (i > start) {
      out.push_back(s.substr(start, i - start));
    }
  }
  return out;
}

std::vector<std::string_view> split_on(std::string_view s, char sep, bool top_level_only)
{
  std::vector<std::string_view> out;
  int depth = 0;
  size_t start = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '(') {
      ++depth;
    } else if (s[i] == ')' && depth > 0) {
      --depth;
    } else if (s[i] == sep && (depth == 0 || !top_level_only)) {
      out.push_back(s.substr(start, i - start));
      start = i + 1;
    }
  }
  out.push_back(s.substr(start));
  return out;
}

std::string join_words(const std::vector<std::string_view> & words)
{
  std::string out;
  for (const auto w : words) {
    if (!out.empty()) {
      out += ' ';
    }
    out += w;
  }
  return out;
}

bool contains_word(std::string_view upper, std::string_view word)
{
  size_t pos = upper.find(word);
  while (pos != std::string_view::npos) {
    const bool left_ok = pos == 0 || !text::is_ident_char(uc(upper[pos - 1]));
    const size_t end = pos + word.size();
    const bool right_ok = end >= upper.size() || !text::is_ident_char(uc(upper[end]));
    if (left_ok && right_ok) {
      return true;
    }
    pos = upper.find(word, pos + 1);
  }
  return false;
}

std::optional<int64_t> parse_integer(std::string_view s)
{
  s = text::trim(s);
  int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
    return std::nullopt;
  }
  return value;
}

std::string_view strip_terminator(std::string_view s)
{
  s = text::trim(s);
  while (!s.empty() && s.back() == ';') {
    s.remove_suffix(1);
  }
  return text::trim(s);
}

template <typename T>
void upsert_by_name(std::vector<T> & items, T value)
{
  const auto it = std::find_if(items.begin(), items.end(), [&](const T & existing) {
    return text::iequals(existing.name, value.name);
  });
  if (it != items.end()) {
    *it = std::move(value);
  } else {
    items.push_back(std::move(value));
  }
}

// ============================================================================
// Line predicates (input: trimmed, uppercased line)
// ============================================================================

bool starts_with_keyword(std::string_view upper, std::string_view kw)
{
  return LineCursor(upper).keyword(kw);
}

/// `name : KW ...`
bool is_labelled(std::string_view upper, std::string_view kw)
{
  LineCursor c(upper);
  return c.identifier() && c.consume(':') && c.keyword(kw);
}

bool is_module_header(std::string_view upper)
{
  if (starts_with_keyword(upper, "MODULE")) {
    return true;
  }
  LineCursor spec(upper);
  if (spec.keyword("SPEC")) {
    return spec.keyword("MODULE");
  }
  LineCursor labelled(upper);
  if (!labelled.identifier() || !labelled.consume(':')) {
    return false;
  }
  labelled.keyword("SPEC");
  return labelled.keyword("MODULE");
}

bool is_mode_header(std::string_view upper)
{
  return starts_with_keyword(upper, "NEWMODE") || starts_with_keyword(upper, "SYNMODE");
}

bool is_dcl(std::string_view upper) { return starts_with_keyword(upper, "DCL"); }
bool is_syn(std::string_view upper) { return starts_with_keyword(upper, "SYN"); }
bool is_proc_header(std::string_view upper) { return is_labelled(upper, "PROC"); }
bool is_process_header(std::string_view upper) { return is_labelled(upper, "PROCESS"); }
bool is_signal(std::string_view upper) { return starts_with_keyword(upper, "SIGNAL"); }
bool is_grant(std::string_view upper) { return starts_with_keyword(upper, "GRANT"); }
bool is_seize(std::string_view upper) { return starts_with_keyword(upper, "SEIZE"); }

bool opens_nested_construct(std::string_view upper)
{
  // Same module forms the module rule accepts, so nested modules balance.
  return is_labelled(upper, "PROC") || is_labelled(upper, "PROCESS") || is_module_header(upper) ||
         is_labelled(upper, "REGION");
}

// ============================================================================
// Scanner
// ============================================================================

struct LineView
{
  size_t index = 0;    ///< 0-based
  uint32_t line = 0;   ///< 1-based
  std::string_view text;  ///< Cleaned line, untrimmed
  std::string upper;      ///< Trimmed and uppercased
};

class Scanner
{
public:
  Scanner(std::string_view cleaned_text, DiagnosticBag * diags)
  : lines_(syntax::split_lines(cleaned_text)), diags_(diags)
  {
    if (diags_ != nullptr) {
      sources_.emplace(std::string(cleaned_text));
    }
  }

  SymbolTable run()
  {
    for (size_t i = 0; i < lines_.size(); ++i) {
      const auto line_no = static_cast<uint32_t>(i + 1);
      scopes_.leave_before(line_no);

      const std::string_view trimmed = text::trim(lines_[i]);
      if (trimmed.empty()) {
        continue;
      }
      const LineView lv{i, line_no, lines_[i], text::to_upper(trimmed)};

      for (const auto & rule : k_rules) {
        if (!rule.matches(lv.upper)) {
          continue;
        }
        if (!(this->*rule.extract)(lv)) {
          report_malformed(lv, rule.what);
        }
        break;
      }
    }
    return std::move(table_);
  }

private:
  struct Rule
  {
    std::string_view what;
    bool (*matches)(std::string_view upper);
    bool (Scanner::*extract)(const LineView & lv);
  };

  static const std::array<Rule, 9> k_rules;

  // --------------------------------------------------------------------------
  // Extractors
  // --------------------------------------------------------------------------

  bool read_module(const LineView & lv)
  {
    LineCursor c(lv.text);
    bool is_spec = false;
    std::optional<std::string_view> name;
    if (c.keyword("SPEC")) {
      is_spec = true;
      if (!c.keyword("MODULE")) {
        return false;
      }
      name = c.identifier();
    } else if (c.keyword("MODULE")) {
      name = c.identifier();
    } else {
      name = c.identifier();
      if (!name || !c.consume(':')) {
        return false;
      }
      is_spec = c.keyword("SPEC");
      if (!c.keyword("MODULE")) {
        return false;
      }
    }
    if (!name) {
      return false;
    }

    Module mod;
    mod.name = std::string(*name);
    mod.is_spec = is_spec;
    mod.line = lv.line;
    const auto end = find_construct_end(lines_, lv.index);
    mod.line_end = end.value_or(lv.line);
    if (!end) {
      report_unterminated(lv, "module", mod.name);
    }

    // An unterminated module still qualifies everything below it.
    const auto last_line = end.value_or(static_cast<uint32_t>(lines_.size()));
    scopes_.push(ScopeFrame{mod.name, ScopeKind::Module, last_line});
    table_.add_module(std::move(mod));
    return true;
  }

  bool read_mode(const LineView & lv)
  {
    LineCursor c(lv.text);
    ModeDefinition mode;
    if (c.keyword("SYNMODE")) {
      mode.is_synmode = true;
    } else if (!c.keyword("NEWMODE")) {
      return false;
    }
    const auto name = c.identifier();
    if (!name || !c.consume('=')) {
      return false;
    }
    const std::string_view rhs = strip_terminator(c.rest());
    if (rhs.empty()) {
      return false;
    }

    mode.name = std::string(*name);
    mode.definition = std::string(rhs);
    mode.base = infer_mode_kind(rhs);
    mode.line = lv.line;
    read_mode_shape(rhs, mode);

    if (scopes_.in_body()) {
      attach_local_mode(mode);
    }
    table_.add_mode(std::move(mode));
    return true;
  }

  void read_mode_shape(std::string_view rhs, ModeDefinition & mode)
  {
    if (LineCursor c(rhs); c.keyword("SET")) {
      if (const auto values = c.parenthesized()) {
        for (const auto v : split_on(*values, ',', true)) {
          const auto value = text::trim(v);
          if (!value.empty()) {
            mode.set_values.emplace_back(value);
          }
        }
      }
      return;
    }

    if (LineCursor c(rhs); c.keyword("RANGE")) {
      if (const auto bounds = c.parenthesized()) {
        const auto colon = bounds->find(':');
        if (colon != std::string_view::npos) {
          const auto lo = parse_integer(bounds->substr(0, colon));
          const auto hi = parse_integer(bounds->substr(colon + 1));
          if (lo && hi) {
            mode.range_low = lo;
            mode.range_high = hi;
          }
        }
      }
      return;
    }

    if (LineCursor c(rhs); c.keyword("STRUCT")) {
      if (const auto fields = c.parenthesized()) {
        // Every comma separates fields; first word is the name, last the mode.
        for (const auto fragment : split_on(*fields, ',', false)) {
          const auto words = split_words(fragment);
          if (words.size() < 2) {
            continue;
          }
          Declaration field;
          field.name = std::string(words.front());
          field.mode = mode_kind_from_name(words.back());
          if (!is_builtin_mode_name(words.back())) {
            field.mode_name = std::string(words.back());
          }
          field.line = mode.line;
          field.scope = mode.name;
          upsert_by_name(mode.struct_fields, std::move(field));
        }
      }
      return;
    }

    if (LineCursor c(rhs); c.keyword("ARRAY")) {
      if (c.parenthesized()) {
        const auto words = split_words(c.rest());
        if (!words.empty()) {
          mode.element_mode = std::string(words.back());
        }
      }
      return;
    }

    if (LineCursor c(rhs); c.keyword("REF")) {
      if (const auto target = c.identifier()) {
        mode.ref_mode = std::string(*target);
      }
    }
  }

  bool read_dcl(const LineView & lv)
  {
    LineCursor c(lv.text);
    if (!c.keyword("DCL")) {
      return false;
    }
    const auto name = c.identifier();
    if (!name || !c.at_space()) {
      return false;
    }

    Declaration decl;
    std::vector<std::string_view> mode_words;
    for (const auto w : split_words(c.take_until(":;"))) {
      if (text::iequals(w, "STATIC")) {
        decl.is_static = true;
      } else if (text::iequals(w, "DYNAMIC")) {
        decl.is_dynamic = true;
      } else if (text::iequals(w, "LOC")) {
        decl.is_loc = true;
      } else if (text::iequals(w, "READ")) {
        decl.is_read = true;
      } else {
        mode_words.push_back(w);
      }
    }
    if (mode_words.empty()) {
      return false;
    }
    const std::string mode_text = join_words(mode_words);

    if (c.looking_at(":=")) {
      c.consume(':');
      c.consume('=');
      const auto init = text::trim(c.take_until(";"));
      if (!init.empty()) {
        decl.initial_value = std::string(init);
      }
    }

    decl.name = std::string(*name);
    decl.mode = mode_kind_from_name(mode_text);
    if (!is_builtin_mode_name(mode_text)) {
      decl.mode_name = mode_text;
    }
    decl.line = lv.line;
    decl.column_start = static_cast<uint32_t>(c.offset_of(*name));
    decl.column_end = decl.column_start + static_cast<uint32_t>(name->size());
    decl.scope = std::string(scopes_.current_scope());

    const bool body_local = scopes_.in_body();
    if (body_local) {
      attach_local_declaration(decl);
    }
    const ScopeFrame * owner = body_local ? scopes_.innermost(ScopeKind::Module) : nullptr;
    table_.add_declaration(
      std::move(decl), body_local, owner != nullptr ? std::string_view(owner->name) : "");
    return true;
  }

  bool read_syn(const LineView & lv)
  {
    LineCursor c(lv.text);
    if (!c.keyword("SYN")) {
      return false;
    }
    const auto name = c.identifier();
    if (!name) {
      return false;
    }
    Synonym syn;
    if (c.peek() != '=') {
      const auto mode = c.identifier();
      if (!mode) {
        return false;
      }
      syn.mode_name = std::string(*mode);
    }
    if (!c.consume('=')) {
      return false;
    }
    const auto value = text::trim(c.take_until(";"));
    if (value.empty()) {
      return false;
    }
    syn.name = std::string(*name);
    syn.value = std::string(value);
    syn.line = lv.line;
    table_.add_synonym(std::move(syn));
    return true;
  }

  bool read_proc(const LineView & lv)
  {
    LineCursor c(lv.text);
    const auto name = c.identifier();
    if (!name || !c.consume(':') || !c.keyword("PROC")) {
      return false;
    }

    Procedure proc;
    proc.name = std::string(*name);
    proc.line = lv.line;
    if (const auto params = c.parenthesized()) {
      proc.parameters = parse_parameter_list(*params);
    }
    if (c.keyword("RETURNS")) {
      if (const auto ret = c.parenthesized()) {
        const auto mode = text::trim(*ret);
        if (!mode.empty()) {
          proc.returns = std::string(mode);
        }
      }
    }
    proc.is_general = contains_word(lv.upper, "GENERAL");
    proc.is_inline = contains_word(lv.upper, "INLINE");
    proc.is_recursive = contains_word(lv.upper, "RECURSIVE");

    const auto end = find_construct_end(lines_, lv.index);
    proc.line_end = end.value_or(lv.line);
    if (!end) {
      report_unterminated(lv, "procedure", proc.name);
    }

    scopes_.push(ScopeFrame{proc.name, ScopeKind::Procedure, proc.line_end});
    table_.add_procedure(std::move(proc));
    return true;
  }

  bool read_process(const LineView & lv)
  {
    LineCursor c(lv.text);
    const auto name = c.identifier();
    if (!name || !c.consume(':') || !c.keyword("PROCESS")) {
      return false;
    }

    Process proc;
    proc.name = std::string(*name);
    proc.line = lv.line;
    if (const auto params = c.parenthesized()) {
      proc.parameters = parse_parameter_list(*params);
    }

    const auto end = find_construct_end(lines_, lv.index);
    proc.line_end = end.value_or(lv.line);
    if (!end) {
      report_unterminated(lv, "process", proc.name);
    }

    scopes_.push(ScopeFrame{proc.name, ScopeKind::Process, proc.line_end});
    table_.add_process(std::move(proc));
    return true;
  }

  bool read_signal(const LineView & lv)
  {
    LineCursor c(lv.text);
    if (!c.keyword("SIGNAL")) {
      return false;
    }
    const auto name = c.identifier();
    if (!name) {
      return false;
    }

    Signal sig;
    sig.name = std::string(*name);
    sig.line = lv.line;
    if (const auto params = c.parenthesized()) {
      for (const auto entry : split_on(*params, ',', true)) {
        const auto words = split_words(entry);
        if (words.size() >= 2) {
          sig.parameters.push_back(
            Parameter{std::string(words.front()), std::string(words.back()), ParamDirection::In});
        }
      }
    }
    table_.add_signal(std::move(sig));
    return true;
  }

  bool read_grant(const LineView & lv) { return read_visibility(lv, "GRANT"); }

  bool read_seize(const LineView & lv) { return read_visibility(lv, "SEIZE"); }

  bool read_visibility(const LineView & lv, std::string_view kw)
  {
    LineCursor c(lv.text);
    if (!c.keyword(kw)) {
      return false;
    }
    std::vector<std::string> names;
    for (const auto entry : split_on(c.take_until(";"), ',', true)) {
      LineCursor item(entry);
      if (const auto n = item.identifier()) {
        names.emplace_back(*n);
      }
    }
    if (names.empty()) {
      return false;
    }

    const ScopeFrame * frame = scopes_.innermost(ScopeKind::Module);
    Module * mod = frame != nullptr ? table_.find_module_mut(frame->name) : nullptr;
    if (mod == nullptr) {
      return true;
    }
    auto & list = (kw == "GRANT") ? mod->granted : mod->seized;
    list.insert(list.end(), names.begin(), names.end());
    return true;
  }

  // --------------------------------------------------------------------------
  // Body-local bookkeeping
  // --------------------------------------------------------------------------

  void attach_local_declaration(const Declaration & decl)
  {
    const ScopeFrame * frame = scopes_.innermost();
    if (frame->kind == ScopeKind::Procedure) {
      if (Procedure * p = table_.find_procedure_mut(frame->name)) {
        upsert_by_name(p->local_declarations, decl);
      }
    } else if (frame->kind == ScopeKind::Process) {
      if (Process * p = table_.find_process_mut(frame->name)) {
        upsert_by_name(p->local_declarations, decl);
      }
    }
  }

  void attach_local_mode(const ModeDefinition & mode)
  {
    const ScopeFrame * frame = scopes_.innermost();
    if (frame->kind == ScopeKind::Procedure) {
      if (Procedure * p = table_.find_procedure_mut(frame->name)) {
        upsert_by_name(p->local_modes, mode);
      }
    } else if (frame->kind == ScopeKind::Process) {
      if (Process * p = table_.find_process_mut(frame->name)) {
        upsert_by_name(p->local_modes, mode);
      }
    }
  }

  // --------------------------------------------------------------------------
  // Diagnostics
  // --------------------------------------------------------------------------

  void report_malformed(const LineView & lv, std::string_view what)
  {
    if (diags_ == nullptr) {
      return;
    }
    diags_
      ->report_hint(
        sources_->get_line_content_range(static_cast<uint32_t>(lv.index)),
        std::string(what) + " line could not be read and was skipped", "not recognized")
      .with_code("H001");
  }

  void report_unterminated(const LineView & lv, std::string_view what, const std::string & name)
  {
    if (diags_ == nullptr) {
      return;
    }
    DiagnosticBuilder builder = diags_->report_warning(
      sources_->get_line_content_range(static_cast<uint32_t>(lv.index)),
      std::string(what) + " '" + name + "' has no matching END", "opened here");
    builder.with_code("W001").with_help("add `END " + name + ";` to close the body");

    // The enclosing module loses its END to the open body.
    const ScopeFrame * frame = scopes_.innermost(ScopeKind::Module);
    const Module * outer = frame != nullptr ? table_.find_module(frame->name) : nullptr;
    if (outer != nullptr && outer->line > 0) {
      builder.with_secondary_label(
        sources_->get_line_content_range(outer->line - 1), "inside module '" + outer->name + "'");
    }
  }

  std::vector<std::string_view> lines_;
  DiagnosticBag * diags_ = nullptr;
  std::optional<SourceManager> sources_;
  ScopeContext scopes_;
  SymbolTable table_;
};

const std::array<Scanner::Rule, 9> Scanner::k_rules = {{
  {"MODULE", &is_module_header, &Scanner::read_module},
  {"NEWMODE", &is_mode_header, &Scanner::read_mode},
  {"DCL", &is_dcl, &Scanner::read_dcl},
  {"SYN", &is_syn, &Scanner::read_syn},
  {"PROC", &is_proc_header, &Scanner::read_proc},
  {"PROCESS", &is_process_header, &Scanner::read_process},
  {"SIGNAL", &is_signal, &Scanner::read_signal},
  {"GRANT", &is_grant, &Scanner::read_grant},
  {"SEIZE", &is_seize, &Scanner::read_seize},
}};

}  // namespace

// ============================================================================
// ScopeContext
// ============================================================================

void ScopeContext::leave_before(uint32_t line)
{
  std::erase_if(frames_, [line](const ScopeFrame & f) { return f.last_line < line; });
}

const ScopeFrame * ScopeContext::innermost(ScopeKind kind) const noexcept
{
  for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
    if (it->kind == kind) {
      return &*it;
    }
  }
  return nullptr;
}

std::string_view ScopeContext::current_scope() const noexcept
{
  return frames_.empty() ? k_global_scope : std::string_view(frames_.back().name);
}

bool ScopeContext::in_body() const noexcept
{
  return !frames_.empty() && frames_.back().kind != ScopeKind::Module;
}

// ============================================================================
// Entry points
// ============================================================================

SymbolTable scan_declarations(std::string_view cleaned_text, DiagnosticBag * diags)
{
  Scanner scanner(cleaned_text, diags);
  return scanner.run();
}

SymbolTable parse_document(std::string_view raw_text, DiagnosticBag * diags)
{
  const std::string cleaned = syntax::strip_comments(raw_text);
  return scan_declarations(cleaned, diags);
}

std::vector<Parameter> parse_parameter_list(std::string_view text)
{
  std::vector<Parameter> params;
  for (const auto entry : split_on(text, ',', true)) {
    const auto words = split_words(entry);

    ParamDirection dir = ParamDirection::In;
    const auto has = [&](std::string_view kw) {
      return std::any_of(
        words.begin(), words.end(), [&](std::string_view w) { return text::iequals(w, kw); });
    };
    if (has("INOUT")) {
      dir = ParamDirection::InOut;
    } else if (has("OUT")) {
      dir = ParamDirection::Out;
    }

    std::vector<std::string_view> rest;
    for (const auto w : words) {
      if (!text::iequals(w, "INOUT") && !text::iequals(w, "OUT") && !text::iequals(w, "IN")) {
        rest.push_back(w);
      }
    }
    if (rest.empty()) {
      continue;
    }
    Parameter p;
    p.name = std::string(rest.front());
    p.mode = rest.size() >= 2 ? std::string(rest.back()) : std::string("UNKNOWN");
    p.direction = dir;
    params.push_back(std::move(p));
  }
  return params;
}

std::optional<uint32_t> find_construct_end(
  const std::vector<std::string_view> & lines, size_t header_index)
{
  int depth = 1;
  for (size_t i = header_index + 1; i < lines.size(); ++i) {
    const std::string upper = text::to_upper(text::trim(lines[i]));
    if (opens_nested_construct(upper) || starts_with_keyword(upper, "BEGIN")) {
      ++depth;
    } else if (starts_with_keyword(upper, "END")) {
      if (--depth == 0) {
        return static_cast<uint32_t>(i + 1);
      }
    }
  }
  return std::nullopt;
}

}  // namespace chill
