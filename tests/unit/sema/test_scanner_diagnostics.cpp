#include <gtest/gtest.h>

#include <string>

#include "chill/basic/diagnostic.hpp"
#include "chill/basic/source_manager.hpp"
#include "chill/sema/declaration_scanner.hpp"

using namespace chill;

namespace
{

struct ScanResult
{
  SymbolTable table;
  DiagnosticBag diags;
};

ScanResult scan(const std::string & src)
{
  ScanResult result;
  result.table = scan_declarations(src, &result.diags);
  return result;
}

}  // namespace

TEST(SemaScannerDiagnostics, WellFormedSourceIsQuiet)
{
  const auto result = scan(
    "m: MODULE\n"
    "  DCL x INT;\n"
    "  p: PROC();\n"
    "  END p;\n"
    "END m;\n");

  EXPECT_TRUE(result.diags.empty());
  EXPECT_EQ(result.table.size(), 3U);
}

TEST(SemaScannerDiagnostics, UnterminatedProcedureWarns)
{
  const std::string src =
    "DCL a INT;\n"
    "p: PROC();\n"
    "  DCL b INT;\n";
  const auto result = scan(src);

  ASSERT_EQ(result.diags.size(), 1U);
  const auto & d = result.diags.all().front();
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, "W001");
  EXPECT_EQ(d.message, "procedure 'p' has no matching END");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "add `END p;` to close the body");
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "opened here");

  const SourceManager sm(src);
  const auto full = sm.get_full_range(d.primary_range());
  EXPECT_EQ(full.start_line, 2U);
  EXPECT_EQ(full.start_column, 1U);
  EXPECT_EQ(full.start_byte, 11U);
  EXPECT_EQ(full.end_byte, 21U);
  EXPECT_TRUE(result.diags.has_warnings());
  EXPECT_FALSE(result.diags.has_errors());
}

TEST(SemaScannerDiagnostics, UnterminatedModuleStillScopesItsBody)
{
  const auto result = scan(
    "m: MODULE\n"
    "  DCL x INT;\n");

  ASSERT_EQ(result.diags.size(), 1U);
  EXPECT_EQ(result.diags.all().front().message, "module 'm' has no matching END");

  const auto * mod = result.table.find_module("m");
  ASSERT_NE(mod, nullptr);
  EXPECT_EQ(mod->line_end, mod->line);

  const auto * x = result.table.find_declaration("x");
  ASSERT_NE(x, nullptr);
  EXPECT_EQ(x->scope, "m");
}

TEST(SemaScannerDiagnostics, UnterminatedProcessWarns)
{
  const auto result = scan("worker: PROCESS();\n");

  ASSERT_EQ(result.diags.size(), 1U);
  EXPECT_EQ(result.diags.all().front().message, "process 'worker' has no matching END");
}

TEST(SemaScannerDiagnostics, UnterminatedBodyPointsAtEnclosingModule)
{
  const std::string src =
    "m: MODULE\n"
    "  p: PROC();\n";
  const auto result = scan(src);

  ASSERT_EQ(result.diags.size(), 2U);
  const auto & module_warning = result.diags.all()[0];
  EXPECT_EQ(module_warning.message, "module 'm' has no matching END");
  EXPECT_EQ(module_warning.labels.size(), 1U);

  const auto & proc_warning = result.diags.all()[1];
  EXPECT_EQ(proc_warning.message, "procedure 'p' has no matching END");
  ASSERT_EQ(proc_warning.labels.size(), 2U);
  EXPECT_EQ(proc_warning.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(proc_warning.labels[1].message, "inside module 'm'");

  const SourceManager sm(src);
  const auto full = sm.get_full_range(proc_warning.labels[1].range);
  EXPECT_EQ(full.start_line, 1U);
  EXPECT_EQ(full.start_column, 1U);
  EXPECT_EQ(full.end_column, 10U);
}

TEST(SemaScannerDiagnostics, UnreadableLinesGiveHints)
{
  const std::string src =
    "DCL a, b INT;\n"
    "  NEWMODE broken;\n"
    "SYN nothing;\n";
  const auto result = scan(src);

  ASSERT_EQ(result.diags.size(), 3U);
  const auto & all = result.diags.all();

  EXPECT_EQ(all[0].severity, Severity::Hint);
  EXPECT_EQ(all[0].code, "H001");
  EXPECT_EQ(all[0].message, "DCL line could not be read and was skipped");
  ASSERT_NE(all[0].primary_label(), nullptr);
  EXPECT_EQ(all[0].primary_label()->message, "not recognized");

  EXPECT_EQ(all[1].message, "NEWMODE line could not be read and was skipped");
  EXPECT_EQ(all[2].message, "SYN line could not be read and was skipped");

  // The range skips leading indentation.
  const SourceManager sm(src);
  const auto full = sm.get_full_range(all[1].primary_range());
  EXPECT_EQ(full.start_line, 2U);
  EXPECT_EQ(full.start_column, 3U);

  EXPECT_FALSE(result.diags.has_warnings());
  EXPECT_TRUE(result.table.empty());
}

TEST(SemaScannerDiagnostics, OtherStatementsAreNotReported)
{
  const auto result = scan(
    "IF x > 0 THEN\n"
    "  x := x - 1;\n"
    "FI;\n");

  EXPECT_TRUE(result.diags.empty());
}

TEST(SemaScannerDiagnostics, ScanWithoutBagProducesSameTable)
{
  const std::string src = "p: PROC(a INT);\nDCL a, b INT;\nDCL c BOOL;\n";
  const auto with_bag = scan(src);
  const auto without_bag = scan_declarations(src);

  EXPECT_EQ(with_bag.table.size(), without_bag.size());
  EXPECT_EQ(with_bag.diags.size(), 2U);
}
