#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "chill/basic/text.hpp"
#include "chill/lsp/queries.hpp"
#include "chill/sema/declaration_scanner.hpp"
#include "chill/syntax/keywords.hpp"

using namespace chill;
using namespace chill::lsp;

namespace
{

const char * k_source = R"(m: MODULE
  DCL counter INT := 0;
  DCL count_total counter_mode;
  NEWMODE colour = SET(red, amber, green);
  NEWMODE counter_mode = RANGE(0:99);
  SYN cmax = 5;
  c: PROC(a INT, b OUT BOOL) RETURNS(INT);
  END c;
END m;
)";

std::vector<std::string> labels(const std::vector<CompletionItem> & items)
{
  std::vector<std::string> out;
  out.reserve(items.size());
  for (const auto & item : items) {
    out.push_back(item.label);
  }
  return out;
}

}  // namespace

// ============================================================================
// Completion
// ============================================================================

TEST(LspCompletion, PrefixIsTheIdentifierBeforeTheCursor)
{
  EXPECT_EQ(completion_prefix("  DCL cou", 9), "cou");
  EXPECT_EQ(completion_prefix("  DCL cou", 7), "c");
  EXPECT_EQ(completion_prefix("x := (a_b", 9), "a_b");
  EXPECT_EQ(completion_prefix("x := ", 5), "");
  EXPECT_EQ(completion_prefix("abc", 100), "abc");
}

TEST(LspCompletion, DocumentNamesInGroupOrder)
{
  const auto model = parse_document(k_source);
  CompletionOptions options;
  options.keywords = false;
  options.predefined = false;

  const auto items = complete(model, "  x := co", 9, options);
  ASSERT_EQ(items.size(), 4U);
  EXPECT_EQ(items[0].label, "counter");
  EXPECT_EQ(items[0].kind, CompletionKind::Declaration);
  EXPECT_EQ(items[0].detail, "DCL INT");
  EXPECT_EQ(items[1].label, "count_total");
  EXPECT_EQ(items[1].kind, CompletionKind::Declaration);
  EXPECT_EQ(items[2].label, "colour");
  EXPECT_EQ(items[2].kind, CompletionKind::Mode);
  EXPECT_EQ(items[2].detail, "NEWMODE SET");
  EXPECT_EQ(items[3].label, "counter_mode");
  EXPECT_EQ(items[3].kind, CompletionKind::Mode);
}

TEST(LspCompletion, ProceduresAndSynonymsCarryDetails)
{
  const auto model = parse_document(k_source);
  CompletionOptions options;
  options.keywords = false;
  options.predefined = false;

  const auto items = complete(model, "C", 1, options);
  ASSERT_FALSE(items.empty());
  EXPECT_EQ(items.back().label, "cmax");
  EXPECT_EQ(items.back().kind, CompletionKind::Synonym);
  EXPECT_EQ(items.back().detail, "SYN = 5");

  const auto names = labels(items);
  const auto proc = std::find(names.begin(), names.end(), "c");
  ASSERT_NE(proc, names.end());
  const auto & proc_item = items[static_cast<size_t>(proc - names.begin())];
  EXPECT_EQ(proc_item.kind, CompletionKind::Procedure);
  EXPECT_EQ(proc_item.detail, "PROC(a INT, b BOOL)");
}

TEST(LspCompletion, PrefixLawHolds)
{
  const auto model = parse_document(k_source);
  const auto items = complete(model, "co", 2);

  for (const auto & item : items) {
    EXPECT_TRUE(text::istarts_with(item.label, "co")) << item.label;
  }

  // Every matching keyword, predefined name and document name is offered.
  size_t expected = 0;
  for (const auto kw : syntax::k_reserved_words) {
    expected += text::istarts_with(kw, "CO") ? 1 : 0;
  }
  for (const auto name : syntax::k_predefined_names) {
    expected += text::istarts_with(name, "CO") ? 1 : 0;
  }
  expected += 4;  // counter, count_total, colour, counter_mode
  EXPECT_EQ(items.size(), expected);

  // Groups never interleave.
  for (size_t i = 1; i < items.size(); ++i) {
    EXPECT_LE(static_cast<int>(items[i - 1].kind), static_cast<int>(items[i].kind));
  }
}

TEST(LspCompletion, EmptyPrefixOffersEverything)
{
  const SymbolTable empty;
  const auto items = complete(empty, "", 0);
  EXPECT_EQ(items.size(), syntax::k_reserved_words.size() + syntax::k_predefined_names.size());
  ASSERT_FALSE(items.empty());
  EXPECT_EQ(items.front().kind, CompletionKind::Keyword);
  EXPECT_EQ(items.back().kind, CompletionKind::Predefined);
}

TEST(LspCompletion, OptionsFilterKeywordGroups)
{
  const SymbolTable empty;
  CompletionOptions options;
  options.keywords = false;

  const auto items = complete(empty, "IN", 2, options);
  for (const auto & item : items) {
    EXPECT_EQ(item.kind, CompletionKind::Predefined);
  }
  const auto names = labels(items);
  EXPECT_NE(std::find(names.begin(), names.end(), "INT"), names.end());
}

TEST(LspCompletion, ProtocolKinds)
{
  EXPECT_EQ(protocol_kind(CompletionKind::Keyword), 14);
  EXPECT_EQ(protocol_kind(CompletionKind::Declaration), 6);
  EXPECT_EQ(protocol_kind(CompletionKind::Synonym), 21);
  EXPECT_EQ(protocol_kind(SymbolKind::Module), 2);
  EXPECT_EQ(protocol_kind(SymbolKind::Procedure), 12);
  EXPECT_EQ(protocol_kind(SymbolKind::Signal), 24);
  EXPECT_EQ(to_string(CompletionKind::Mode), "Mode");
}

// ============================================================================
// Hover
// ============================================================================

TEST(LspHover, ReservedWordWithoutAnyDocument)
{
  const SymbolTable empty;
  const auto md = hover(empty, "MODULE");
  ASSERT_TRUE(md.has_value());
  EXPECT_EQ(
    *md,
    "**MODULE** - CHILL reserved word\n\n"
    "Defines a module - the basic unit of CHILL program structure");

  // Case of the word is kept in the heading.
  const auto lower = hover(empty, "module");
  ASSERT_TRUE(lower.has_value());
  EXPECT_NE(lower->find("**module**"), std::string::npos);
}

TEST(LspHover, PredefinedName)
{
  const SymbolTable empty;
  const auto md = hover(empty, "INT");
  ASSERT_TRUE(md.has_value());
  EXPECT_EQ(*md, "**INT** - CHILL predefined name\n\nInteger mode");
}

TEST(LspHover, DocumentEntities)
{
  const auto model = parse_document(k_source);

  const auto counter = hover(model, "counter");
  ASSERT_TRUE(counter.has_value());
  EXPECT_EQ(*counter, "**counter** - DCL INT\n\nInitial value: 0");

  const auto total = hover(model, "count_total");
  ASSERT_TRUE(total.has_value());
  EXPECT_EQ(*total, "**count_total** - DCL USER (counter_mode)");

  const auto colour = hover(model, "COLOUR");
  ASSERT_TRUE(colour.has_value());
  EXPECT_EQ(*colour, "**COLOUR** - NEWMODE SET\n\nValues: red, amber, green");

  const auto range = hover(model, "counter_mode");
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(*range, "**counter_mode** - NEWMODE RANGE\n\nRange: 0:99");

  const auto proc = hover(model, "c");
  ASSERT_TRUE(proc.has_value());
  EXPECT_EQ(*proc, "**c** - PROC(a IN INT, b OUT BOOL) RETURNS(INT)");

  const auto syn = hover(model, "cmax");
  ASSERT_TRUE(syn.has_value());
  EXPECT_EQ(*syn, "**cmax** - SYN = 5");
}

TEST(LspHover, UnknownWordHasNoInformation)
{
  const auto model = parse_document(k_source);
  EXPECT_FALSE(hover(model, "nowhere").has_value());
  EXPECT_FALSE(hover(model, "").has_value());
}

// ============================================================================
// Definition / references
// ============================================================================

TEST(LspDefinition, DeclarationSiteHasColumns)
{
  const auto model = parse_document(k_source);

  const auto site = find_definition(model, "counter");
  ASSERT_TRUE(site.has_value());
  EXPECT_EQ(symbol_kind_of(site->symbol), SymbolKind::Declaration);
  EXPECT_EQ(site->line, 1U);
  EXPECT_EQ(site->column_start, 6U);
  EXPECT_EQ(site->column_end, 13U);
}

TEST(LspDefinition, OtherEntitiesResolveToTheirLine)
{
  const auto model = parse_document(k_source);

  const auto proc = find_definition(model, "C");
  ASSERT_TRUE(proc.has_value());
  EXPECT_EQ(symbol_kind_of(proc->symbol), SymbolKind::Procedure);
  EXPECT_EQ(proc->line, 6U);
  EXPECT_EQ(proc->column_end, 0U);

  const auto mod = find_definition(model, "m");
  ASSERT_TRUE(mod.has_value());
  EXPECT_EQ(symbol_kind_of(mod->symbol), SymbolKind::Module);
  EXPECT_EQ(mod->line, 0U);

  EXPECT_FALSE(find_definition(model, "nowhere").has_value());
}

TEST(LspReferences, WholeWordAndCaseInsensitive)
{
  const auto spans = find_references("x := Count + accounting;", "count");
  ASSERT_EQ(spans.size(), 1U);
  EXPECT_EQ(spans[0], (TextSpan{0, 5, 10}));
}

TEST(LspReferences, SpansAcrossLines)
{
  const auto spans = find_references(k_source, "counter");
  // DCL counter, not counter_mode
  ASSERT_EQ(spans.size(), 1U);
  EXPECT_EQ(spans[0].line, 1U);
  EXPECT_EQ(spans[0].column_start, 6U);

  const auto modes = find_references(k_source, "COUNTER_MODE");
  ASSERT_EQ(modes.size(), 2U);
  EXPECT_EQ(modes[0].line, 2U);
  EXPECT_EQ(modes[1].line, 4U);

  EXPECT_TRUE(find_references(k_source, "").empty());
}

TEST(LspReferences, AdjacentOccurrences)
{
  const auto spans = find_references("a+a a", "a");
  ASSERT_EQ(spans.size(), 3U);
  EXPECT_EQ(spans[0].column_start, 0U);
  EXPECT_EQ(spans[1].column_start, 2U);
  EXPECT_EQ(spans[2].column_start, 4U);
}

// ============================================================================
// Words / outline
// ============================================================================

TEST(LspWordAt, EitherSideOfTheCursor)
{
  EXPECT_EQ(word_at("DCL counter INT;", 4), "counter");
  EXPECT_EQ(word_at("DCL counter INT;", 11), "counter");
  EXPECT_EQ(word_at("DCL counter INT;", 7), "counter");
  EXPECT_FALSE(word_at("a  := b", 2).has_value());
  EXPECT_EQ(word_at("abc", 50), "abc");
}

TEST(LspDocumentSymbols, OutlineFollowsSourceLines)
{
  const auto model = parse_document(k_source);
  const auto symbols = document_symbols(model);

  ASSERT_FALSE(symbols.empty());
  EXPECT_EQ(symbols.front().name, "m");
  EXPECT_EQ(symbols.front().kind, SymbolKind::Module);
  EXPECT_EQ(symbols.front().line_end, 9U);
  for (size_t i = 1; i < symbols.size(); ++i) {
    EXPECT_LE(symbols[i - 1].line, symbols[i].line);
  }
}
