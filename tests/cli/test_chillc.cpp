// test_chillc.cpp - CLI integration tests for the chillc subcommands

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

#include <sys/wait.h>

namespace fs = std::filesystem;

#ifndef CHILL_CLI_PATH
#define CHILL_CLI_PATH "chillc"
#endif

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

struct CliResult
{
  int exit_code = 0;
  std::string out;
  std::string err;
};

/// Run `chillc <args>` inside `dir`, capturing both streams.
CliResult run_cli(const fs::path & dir, const std::string & args)
{
  const fs::path out_path = dir / "stdout.txt";
  const fs::path err_path = dir / "stderr.txt";
  const std::string cmd = "cd " + shell_quote(dir.string()) + " && " +
                          shell_quote(CHILL_CLI_PATH) + " " + args + " > " +
                          shell_quote(out_path.string()) + " 2> " + shell_quote(err_path.string());

  CliResult result;
  const int rc = std::system(cmd.c_str());
  if (rc == -1) {
    result.exit_code = 127;
  } else if (WIFEXITED(rc)) {
    result.exit_code = WEXITSTATUS(rc);
  } else {
    result.exit_code = 128;
  }
  result.out = read_all(out_path);
  result.err = read_all(err_path);
  return result;
}

const char * k_unterminated = "p: PROC();\n  DCL a INT;\n";

const char * k_counter = R"(m: MODULE
  DCL counter INT := 0;  -- running total
  bump: PROC(step INT);
    counter := counter + step;
  END bump;
END m;
)";

}  // namespace

TEST(CliChillcTest, CheckAcceptsCleanSource)
{
  const fs::path dir = make_temp_dir("chillc_check_ok");
  write_all(dir / "main.chl", k_counter);

  const auto r = run_cli(dir, "check main.chl --no-color");
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_EQ(r.out, "main.chl: OK\n");
  EXPECT_TRUE(r.err.empty()) << r.err;
}

TEST(CliChillcTest, CheckReportsWarningsWithoutFailing)
{
  const fs::path dir = make_temp_dir("chillc_check_warn");
  write_all(dir / "main.chl", k_unterminated);

  const auto r = run_cli(dir, "check main.chl --no-color");
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_NE(r.err.find("warning[W001]: procedure 'p' has no matching END"), std::string::npos)
    << r.err;
  EXPECT_NE(r.err.find("  --> main.chl:1:1"), std::string::npos) << r.err;
}

TEST(CliChillcTest, WerrorTurnsWarningsIntoFailure)
{
  const fs::path dir = make_temp_dir("chillc_check_werror");
  write_all(dir / "main.chl", k_unterminated);

  const auto r = run_cli(dir, "check main.chl --werror --no-color");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("W001"), std::string::npos) << r.err;
  EXPECT_TRUE(r.out.empty()) << r.out;
}

TEST(CliChillcTest, ProjectConfigSilencesDiagnostics)
{
  const fs::path dir = make_temp_dir("chillc_check_config");
  write_all(dir / "chill.yaml", "diagnostics:\n  enabled: false\n");
  fs::create_directories(dir / "src");
  write_all(dir / "src" / "main.chl", k_unterminated);

  const auto r = run_cli(dir, "check src/main.chl --werror --no-color");
  EXPECT_EQ(r.exit_code, 0) << r.err;
  EXPECT_EQ(r.err.find("W001"), std::string::npos) << r.err;
}

TEST(CliChillcTest, InvalidProjectConfigFailsCheck)
{
  const fs::path dir = make_temp_dir("chillc_check_bad_config");
  write_all(dir / "chill.yaml", "server:\n  log_level: loud\n");
  write_all(dir / "main.chl", k_counter);

  const auto r = run_cli(dir, "check main.chl");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("invalid server.log_level: 'loud'"), std::string::npos) << r.err;
}

TEST(CliChillcTest, CheckMissingFile)
{
  const fs::path dir = make_temp_dir("chillc_check_missing");

  const auto r = run_cli(dir, "check nowhere.chl");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("error: file not found: "), std::string::npos) << r.err;
}

TEST(CliChillcTest, HoverPrintsMarkdown)
{
  const fs::path dir = make_temp_dir("chillc_hover");
  write_all(dir / "main.chl", k_counter);

  const auto decl = run_cli(dir, "hover main.chl counter");
  EXPECT_EQ(decl.exit_code, 0) << decl.err;
  EXPECT_EQ(decl.out, "**counter** - DCL INT\n\nInitial value: 0\n");

  const auto proc = run_cli(dir, "hover main.chl BUMP");
  EXPECT_EQ(proc.exit_code, 0) << proc.err;
  EXPECT_EQ(proc.out, "**BUMP** - PROC(step IN INT)\n");

  const auto unknown = run_cli(dir, "hover main.chl nowhere");
  EXPECT_EQ(unknown.exit_code, 1);
  EXPECT_NE(unknown.err.find("no information for 'nowhere'"), std::string::npos);
}

TEST(CliChillcTest, SymbolsListsTheOutline)
{
  const fs::path dir = make_temp_dir("chillc_symbols");
  write_all(dir / "main.chl", k_counter);

  const auto r = run_cli(dir, "symbols main.chl");
  EXPECT_EQ(r.exit_code, 0) << r.err;

  const auto module_row = r.out.find("Module");
  const auto counter_row = r.out.find("counter");
  const auto proc_row = r.out.find("PROC(step INT)");
  ASSERT_NE(module_row, std::string::npos) << r.out;
  ASSERT_NE(counter_row, std::string::npos) << r.out;
  ASSERT_NE(proc_row, std::string::npos) << r.out;
  EXPECT_LT(module_row, counter_row);
  EXPECT_LT(counter_row, proc_row);
}

TEST(CliChillcTest, InitWritesConfigOnce)
{
  const fs::path dir = make_temp_dir("chillc_init");

  const auto first = run_cli(dir, "init");
  EXPECT_EQ(first.exit_code, 0) << first.err;
  ASSERT_TRUE(fs::exists(dir / "chill.yaml"));
  const std::string written = read_all(dir / "chill.yaml");
  EXPECT_NE(written.find("diagnostics:\n  enabled: true\n"), std::string::npos);

  const auto second = run_cli(dir, "init");
  EXPECT_EQ(second.exit_code, 1);
  EXPECT_NE(second.err.find("error: file already exists: "), std::string::npos) << second.err;
  EXPECT_EQ(read_all(dir / "chill.yaml"), written);
}

TEST(CliChillcTest, UnknownCommand)
{
  const fs::path dir = make_temp_dir("chillc_unknown");

  const auto r = run_cli(dir, "frobnicate");
  EXPECT_EQ(r.exit_code, 1);
  EXPECT_NE(r.err.find("error: unknown command 'frobnicate'"), std::string::npos) << r.err;
}
