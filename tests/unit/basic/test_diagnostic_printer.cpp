#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "chill/basic/diagnostic.hpp"
#include "chill/basic/diagnostic_printer.hpp"
#include "chill/basic/source_manager.hpp"
#include "chill/sema/declaration_scanner.hpp"

using namespace chill;

namespace
{

std::string render(const std::string & src)
{
  DiagnosticBag diags;
  (void)scan_declarations(src, &diags);

  std::ostringstream out;
  DiagnosticPrinter printer(out, /*use_color=*/false);
  printer.print_all(diags, SourceManager(src));
  return out.str();
}

}  // namespace

TEST(BasicDiagnosticPrinter, UnterminatedProcedure)
{
  const std::string out = render("p: PROC();\n");

  EXPECT_EQ(
    out,
    "warning[W001]: procedure 'p' has no matching END\n"
    "  --> <input>:1:1\n"
    "      |\n"
    "    1 | p: PROC();\n"
    "      | ^^^^^^^^^^ opened here\n"
    "      |\n"
    "   = help: add `END p;` to close the body\n"
    "\n");
}

TEST(BasicDiagnosticPrinter, SecondaryLabelUsesDashes)
{
  const std::string out = render("m: MODULE\n  p: PROC();\n");

  const std::string expected_proc =
    "warning[W001]: procedure 'p' has no matching END\n"
    "  --> <input>:2:3\n"
    "      |\n"
    "    2 |   p: PROC();\n"
    "      |   ^^^^^^^^^^ opened here\n"
    "    1 | m: MODULE\n"
    "      | --------- inside module 'm'\n"
    "      |\n"
    "   = help: add `END p;` to close the body\n"
    "\n";
  EXPECT_NE(out.find(expected_proc), std::string::npos) << out;
}

TEST(BasicDiagnosticPrinter, HintsPointAtIndentedContent)
{
  const std::string out = render("DCL a INT;\n  DCL ;\n");

  EXPECT_NE(out.find("hint[H001]: DCL line could not be read and was skipped\n"), std::string::npos);
  EXPECT_NE(out.find("  --> <input>:2:3\n"), std::string::npos);
  EXPECT_NE(out.find("    2 |   DCL ;\n"), std::string::npos);
  EXPECT_NE(out.find("      |   ^^^^^ not recognized\n"), std::string::npos);
  EXPECT_EQ(out.find("help:"), std::string::npos);
}

TEST(BasicDiagnosticPrinter, SortedByLocation)
{
  DiagnosticBag diags;
  const SourceManager sm("first\nsecond\n");
  diags.report_warning(sm.get_line_content_range(1), "late");
  diags.report_error(sm.get_line_content_range(0), "early").with_code("E9");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, sm);

  const std::string text = out.str();
  const auto early = text.find("error[E9]: early");
  const auto late = text.find("warning: late");
  ASSERT_NE(early, std::string::npos);
  ASSERT_NE(late, std::string::npos);
  EXPECT_LT(early, late);
}

TEST(BasicDiagnosticPrinter, NothingToPrint)
{
  EXPECT_EQ(render("DCL a INT;\n"), "");
}
