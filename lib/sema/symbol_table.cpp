// chill/sema/symbol_table.cpp - Symbol table implementation
#include "chill/sema/symbol_table.hpp"

#include <algorithm>
#include <utility>

#include "chill/basic/text.hpp"

namespace chill
{
namespace
{

const Declaration * find_in_locals(
  const std::vector<Declaration> & locals, std::string_view name)
{
  const auto it = std::find_if(locals.begin(), locals.end(), [&](const Declaration & d) {
    return text::iequals(d.name, name);
  });
  return it != locals.end() ? &*it : nullptr;
}

std::string qualified_key(std::string_view scope, std::string_view name)
{
  std::string key = text::to_upper(scope);
  key += '.';
  key += text::to_upper(name);
  return key;
}

}  // namespace

std::string_view to_string(ParamDirection dir) noexcept
{
  switch (dir) {
    case ParamDirection::In:
      return "IN";
    case ParamDirection::Out:
      return "OUT";
    case ParamDirection::InOut:
      return "INOUT";
  }
  return "IN";
}

std::string format_parameters(const std::vector<Parameter> & params, bool with_direction)
{
  std::string out;
  for (size_t i = 0; i < params.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += params[i].name;
    out += ' ';
    if (with_direction) {
      out += to_string(params[i].direction);
      out += ' ';
    }
    out += params[i].mode;
  }
  return out;
}

std::string_view to_string(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Declaration:
      return "Declaration";
    case SymbolKind::Mode:
      return "Mode";
    case SymbolKind::Procedure:
      return "Procedure";
    case SymbolKind::Process:
      return "Process";
    case SymbolKind::Synonym:
      return "Synonym";
    case SymbolKind::Module:
      return "Module";
    case SymbolKind::Signal:
      return "Signal";
  }
  return "Declaration";
}

SymbolKind symbol_kind_of(const SymbolRef & ref) noexcept
{
  return static_cast<SymbolKind>(ref.index());
}

const std::string & symbol_name(const SymbolRef & ref) noexcept
{
  return std::visit([](const auto * entity) -> const std::string & { return entity->name; }, ref);
}

const Declaration * Procedure::find_local_declaration(std::string_view name) const
{
  return find_in_locals(local_declarations, name);
}

const Declaration * Process::find_local_declaration(std::string_view name) const
{
  return find_in_locals(local_declarations, name);
}

// ============================================================================
// Ordered storage
// ============================================================================

template <typename T>
void SymbolTable::Ordered<T>::upsert(std::string key, T value)
{
  auto it = index.find(key);
  if (it != index.end()) {
    items[it->second] = std::move(value);
    return;
  }
  index.emplace(std::move(key), items.size());
  items.push_back(std::move(value));
}

template <typename T>
const T * SymbolTable::Ordered<T>::find(std::string_view name) const
{
  const auto it = index.find(text::to_upper(name));
  return it != index.end() ? &items[it->second] : nullptr;
}

template <typename T>
T * SymbolTable::Ordered<T>::find(std::string_view name)
{
  const auto it = index.find(text::to_upper(name));
  return it != index.end() ? &items[it->second] : nullptr;
}

// ============================================================================
// Population
// ============================================================================

void SymbolTable::add_declaration(
  Declaration decl, bool body_local, std::string_view enclosing_module)
{
  auto & items = declarations_.items;
  auto & index = declarations_.index;
  std::string bare = text::to_upper(decl.name);
  std::string key = qualified_key(decl.scope, decl.name);
  std::string module_key =
    (body_local && !enclosing_module.empty()) ? qualified_key(enclosing_module, decl.name) : "";

  // The qualified key may be an alias held by a body-local declaration.
  size_t slot = items.size();
  const auto it = index.find(key);
  if (it != index.end() && text::iequals(items[it->second].scope, decl.scope)) {
    slot = it->second;
    items[slot] = std::move(decl);
  } else {
    index[std::move(key)] = slot;
    items.push_back(std::move(decl));
  }

  if (!module_key.empty()) {
    index.try_emplace(std::move(module_key), slot);
  }
  if (body_local) {
    index.try_emplace(std::move(bare), slot);
  } else {
    index[std::move(bare)] = slot;
  }
}

void SymbolTable::add_mode(ModeDefinition mode)
{
  std::string key = text::to_upper(mode.name);
  modes_.upsert(std::move(key), std::move(mode));
}

void SymbolTable::add_synonym(Synonym syn)
{
  std::string key = text::to_upper(syn.name);
  synonyms_.upsert(std::move(key), std::move(syn));
}

void SymbolTable::add_procedure(Procedure proc)
{
  std::string key = text::to_upper(proc.name);
  procedures_.upsert(std::move(key), std::move(proc));
}

void SymbolTable::add_process(Process proc)
{
  std::string key = text::to_upper(proc.name);
  processes_.upsert(std::move(key), std::move(proc));
}

void SymbolTable::add_module(Module mod)
{
  std::string key = text::to_upper(mod.name);
  modules_.upsert(std::move(key), std::move(mod));
}

void SymbolTable::add_signal(Signal sig)
{
  std::string key = text::to_upper(sig.name);
  signals_.upsert(std::move(key), std::move(sig));
}

Procedure * SymbolTable::find_procedure_mut(std::string_view name)
{
  return procedures_.find(name);
}

Process * SymbolTable::find_process_mut(std::string_view name) { return processes_.find(name); }

Module * SymbolTable::find_module_mut(std::string_view name) { return modules_.find(name); }

// ============================================================================
// Lookup
// ============================================================================

const Declaration * SymbolTable::find_declaration(
  std::string_view name, std::string_view scope) const
{
  if (!scope.empty()) {
    const auto it = declarations_.index.find(qualified_key(scope, name));
    if (it != declarations_.index.end()) {
      return &declarations_.items[it->second];
    }
  }
  // Either a bare name or an explicit "qualifier.name" key.
  return declarations_.find(name);
}

const ModeDefinition * SymbolTable::find_mode(std::string_view name) const
{
  return modes_.find(name);
}

const Procedure * SymbolTable::find_procedure(std::string_view name) const
{
  return procedures_.find(name);
}

const Process * SymbolTable::find_process(std::string_view name) const
{
  return processes_.find(name);
}

const Synonym * SymbolTable::find_synonym(std::string_view name) const
{
  return synonyms_.find(name);
}

const Module * SymbolTable::find_module(std::string_view name) const
{
  return modules_.find(name);
}

const Signal * SymbolTable::find_signal(std::string_view name) const
{
  return signals_.find(name);
}

std::optional<SymbolRef> SymbolTable::find_any(std::string_view name) const
{
  if (const auto * d = find_declaration(name)) return SymbolRef{d};
  if (const auto * m = find_mode(name)) return SymbolRef{m};
  if (const auto * p = find_procedure(name)) return SymbolRef{p};
  if (const auto * p = find_process(name)) return SymbolRef{p};
  if (const auto * s = find_synonym(name)) return SymbolRef{s};
  if (const auto * s = find_signal(name)) return SymbolRef{s};
  if (const auto * m = find_module(name)) return SymbolRef{m};
  return std::nullopt;
}

// ============================================================================
// Enumeration
// ============================================================================

namespace
{

template <typename T>
void append_names(const std::vector<T> & items, std::vector<std::string> & out)
{
  for (const auto & item : items) {
    out.push_back(item.name);
  }
}

}  // namespace

std::vector<std::string> SymbolTable::names(SymbolKind kind) const
{
  std::vector<std::string> out;
  switch (kind) {
    case SymbolKind::Declaration:
      for (size_t i = 0; i < declarations_.items.size(); ++i) {
        const auto & d = declarations_.items[i];
        const auto it = declarations_.index.find(text::to_upper(d.name));
        if (it != declarations_.index.end() && it->second == i) {
          out.push_back(d.name);
        }
      }
      break;
    case SymbolKind::Mode:
      append_names(modes_.items, out);
      break;
    case SymbolKind::Procedure:
      append_names(procedures_.items, out);
      break;
    case SymbolKind::Process:
      append_names(processes_.items, out);
      break;
    case SymbolKind::Synonym:
      append_names(synonyms_.items, out);
      break;
    case SymbolKind::Module:
      append_names(modules_.items, out);
      break;
    case SymbolKind::Signal:
      append_names(signals_.items, out);
      break;
  }
  return out;
}

std::vector<OutlineSymbol> SymbolTable::all_symbols() const
{
  std::vector<OutlineSymbol> out;

  auto push = [&](const std::string & name, SymbolKind kind, uint32_t line, uint32_t line_end,
                  std::string detail) {
    OutlineSymbol s;
    s.name = name;
    s.kind = kind;
    s.line = line;
    s.line_end = std::max(line, line_end);
    s.detail = std::move(detail);
    out.push_back(std::move(s));
  };

  for (const auto & m : modules_.items) {
    push(m.name, SymbolKind::Module, m.line, m.line_end, m.is_spec ? "SPEC MODULE" : "MODULE");
  }
  for (const auto & m : modes_.items) {
    std::string detail = m.is_synmode ? "SYNMODE " : "NEWMODE ";
    detail += to_string(m.base);
    push(m.name, SymbolKind::Mode, m.line, m.line, std::move(detail));
  }
  for (size_t i = 0; i < declarations_.items.size(); ++i) {
    const auto & d = declarations_.items[i];
    const auto it = declarations_.index.find(text::to_upper(d.name));
    if (it == declarations_.index.end() || it->second != i) {
      continue;  // shadowed in the bare-name slot
    }
    push(d.name, SymbolKind::Declaration, d.line, d.line, "DCL " + std::string(to_string(d.mode)));
    out.back().column_start = d.column_start;
    out.back().column_end = d.column_end;
  }
  for (const auto & s : synonyms_.items) {
    push(s.name, SymbolKind::Synonym, s.line, s.line, "SYN = " + s.value);
  }
  for (const auto & p : procedures_.items) {
    push(
      p.name, SymbolKind::Procedure, p.line, p.line_end,
      "PROC(" + format_parameters(p.parameters, false) + ")");
  }
  for (const auto & p : processes_.items) {
    push(p.name, SymbolKind::Process, p.line, p.line_end, "PROCESS");
  }
  for (const auto & s : signals_.items) {
    push(s.name, SymbolKind::Signal, s.line, s.line, "SIGNAL");
  }

  std::stable_sort(out.begin(), out.end(), [](const OutlineSymbol & a, const OutlineSymbol & b) {
    return a.line < b.line;
  });
  return out;
}

size_t SymbolTable::size() const noexcept
{
  return declarations_.items.size() + modes_.items.size() + procedures_.items.size() +
         processes_.items.size() + synonyms_.items.size() + modules_.items.size() +
         signals_.items.size();
}

}  // namespace chill
