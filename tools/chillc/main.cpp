// chillc - CHILL source checker command line interface
//
// Usage:
//   chillc check <file.chl> [--werror] [--no-color]
//   chillc symbols <file.chl>
//   chillc hover <file.chl> <name>
//   chillc init
//
#include <fmt/core.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "chill/basic/diagnostic_printer.hpp"
#include "chill/lsp/queries.hpp"
#include "chill/project/project_config.hpp"
#include "chill/sema/declaration_scanner.hpp"
#include "chill/syntax/comment_stripper.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "CHILL source checker v1.0.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check <file>             Report unterminated bodies and unreadable declarations\n"
            << "  symbols <file>           Print the document outline\n"
            << "  hover <file> <name>      Describe a name as the editor hover would\n"
            << "  init                     Write a default chill.yaml in the current directory\n\n"
            << "Options:\n"
            << "  --werror                 Treat warnings as errors (check)\n"
            << "  --no-color               Disable colored output\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  bool werror = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--werror") {
      args.werror = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else {
      args.positional.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Input
// ============================================================================

struct LoadedFile
{
  fs::path path;
  std::string text;
};

std::optional<LoadedFile> load_input(const CommandArgs & args, const char * usage)
{
  if (args.positional.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: " << usage << "\n";
    return std::nullopt;
  }

  const fs::path input_path = fs::absolute(args.positional.front());
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return std::nullopt;
  }

  std::ifstream file(input_path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return std::nullopt;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return LoadedFile{input_path, buffer.str()};
}

/// chill.yaml above the input file, or defaults when there is none.
std::optional<chill::ProjectConfig> load_config(const fs::path & input_path, bool verbose)
{
  const auto config_path = chill::find_project_config(input_path);
  if (!config_path) {
    return chill::ProjectConfig{};
  }

  auto result = chill::load_project_config(*config_path);
  if (!result.success) {
    std::cerr << "error: " << config_path->string() << ": " << result.error << "\n";
    return std::nullopt;
  }
  if (verbose) {
    std::cerr << "Using configuration: " << config_path->string() << "\n";
  }
  return std::move(result.config);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  const auto input = load_input(args, "chillc check <file.chl> [--werror]");
  if (!input) {
    return 1;
  }
  const auto config = load_config(input->path, args.verbose);
  if (!config) {
    return 1;
  }

  if (args.verbose) {
    std::cerr << "Checking: " << input->path.string() << "\n";
  }

  // Diagnostics are reported against the comment-free text (same line numbers).
  const chill::SourceManager source(input->path, chill::syntax::strip_comments(input->text));
  chill::DiagnosticBag diags;
  const auto model = chill::scan_declarations(source.get_source(), &diags);

  if (config->diagnostics.enabled && !diags.empty()) {
    const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
    chill::DiagnosticPrinter printer(std::cerr, use_color);
    printer.print_all(diags, source);
  }

  if (args.verbose) {
    std::cerr << "Found " << model.size() << " declarations\n";
  }

  if (args.werror && config->diagnostics.enabled && diags.has_warnings()) {
    return 1;
  }

  std::cout << args.positional.front() << ": OK\n";
  return 0;
}

int cmd_symbols(const CommandArgs & args)
{
  const auto input = load_input(args, "chillc symbols <file.chl>");
  if (!input) {
    return 1;
  }

  const auto model = chill::parse_document(input->text);
  for (const auto & sym : chill::lsp::document_symbols(model)) {
    const std::string lines = sym.line_end > sym.line
                                ? fmt::format("{}-{}", sym.line, sym.line_end)
                                : fmt::format("{}", sym.line);
    fmt::print("{:>9}  {:<11} {:<24} {}\n", lines, chill::to_string(sym.kind), sym.name, sym.detail);
  }
  return 0;
}

int cmd_hover(const CommandArgs & args)
{
  if (args.positional.size() < 2) {
    std::cerr << "error: name required\n";
    std::cerr << "usage: chillc hover <file.chl> <name>\n";
    return 1;
  }

  const auto input = load_input(args, "chillc hover <file.chl> <name>");
  if (!input) {
    return 1;
  }

  const auto model = chill::parse_document(input->text);
  const auto text = chill::lsp::hover(model, args.positional[1]);
  if (!text) {
    std::cerr << "no information for '" << args.positional[1] << "'\n";
    return 1;
  }
  std::cout << *text << "\n";
  return 0;
}

int cmd_init()
{
  const fs::path config_path = fs::current_path() / chill::k_project_config_file_name;

  if (fs::exists(config_path)) {
    std::cerr << "error: file already exists: " << config_path.string() << "\n";
    return 1;
  }

  std::ofstream config(config_path);
  if (!config.is_open()) {
    std::cerr << "error: failed to create file: " << config_path.string() << "\n";
    return 1;
  }
  config << "completion:\n"
         << "  keywords: true\n"
         << "  predefined: true\n\n"
         << "diagnostics:\n"
         << "  enabled: true\n\n"
         << "server:\n"
         << "  log_level: error\n";
  config.close();

  std::cout << "Created " << config_path.string() << "\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  try {
    const CommandArgs args = parse_args(argc, argv);

    if (args.show_help) {
      print_usage(argv[0]);
      return 0;
    }

    if (args.command == "check") {
      return cmd_check(args);
    }

    if (args.command == "symbols") {
      return cmd_symbols(args);
    }

    if (args.command == "hover") {
      return cmd_hover(args);
    }

    if (args.command == "init") {
      return cmd_init();
    }

    std::cerr << "error: unknown command '" << args.command << "'\n";
    print_usage(argv[0]);
    return 1;
  } catch (const std::exception & e) {
    std::cerr << "chillc: fatal error: " << e.what() << "\n";
    return 1;
  }
}
