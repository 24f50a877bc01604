// CHILL LSP server (stdio JSON-RPC)
//
// This is a thin wrapper around chill::lsp::Workspace (serverless APIs).
// It owns the transport, position encoding and chill.yaml settings.
//
// Usage:
//   chill_lsp_server [--verbose] [--log-level error|info|debug]
//
#include <algorithm>
#include <chill/basic/text.hpp>
#include <chill/lsp/lsp.hpp>
#include <chill/project/project_config.hpp>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

using nlohmann::json;

namespace
{

constexpr const char * k_server_name = "CHILL Language Server";
constexpr const char * k_server_version = "1.0.0";

// JSON-RPC error codes
constexpr int k_parse_error = -32700;
constexpr int k_invalid_request = -32600;
constexpr int k_method_not_found = -32601;
constexpr int k_internal_error = -32603;

// ============================================================================
// Logging (stderr only; stdout carries the protocol)
// ============================================================================

class Logger
{
public:
  void set_level(chill::LogLevel level) { level_ = level; }
  [[nodiscard]] chill::LogLevel level() const { return level_; }

  template <typename... Args>
  void log(chill::LogLevel level, fmt::format_string<Args...> format, Args &&... args) const
  {
    if (static_cast<int>(level) > static_cast<int>(level_)) {
      return;
    }
    fmt::print(
      stderr, "[chill_lsp_server] {}: {}\n", chill::to_string(level),
      fmt::format(format, std::forward<Args>(args)...));
  }

private:
  chill::LogLevel level_ = chill::LogLevel::Error;
};

Logger g_log;

// ============================================================================
// Documents and positions
// ============================================================================

struct DocState
{
  std::string uri;
  std::string text;
  std::vector<uint32_t> line_offsets;  // byte offsets of each line start
};

std::vector<uint32_t> build_line_offsets(std::string_view text)
{
  std::vector<uint32_t> offsets;
  offsets.push_back(0);
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      offsets.push_back(static_cast<uint32_t>(i + 1));
    }
  }
  return offsets;
}

int hex_to_int(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string url_decode(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '%' && i + 2 < s.size()) {
      const int hi = hex_to_int(s[i + 1]);
      const int lo = hex_to_int(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

std::optional<std::string> file_uri_to_path(std::string_view uri)
{
  // Local file URIs only (file:///abs/path).
  if (!chill::text::starts_with(uri, "file:")) {
    return std::nullopt;
  }

  std::string_view rest = uri.substr(std::string_view("file:").size());
  if (chill::text::starts_with(rest, "///")) {
    rest = rest.substr(2);  // keep one leading slash
  } else if (chill::text::starts_with(rest, "//")) {
    return std::nullopt;
  }
  return url_decode(rest);
}

int lsp_severity(std::string_view s)
{
  // LSP DiagnosticSeverity:
  // 1 Error, 2 Warning, 3 Information, 4 Hint
  if (s == "Error") return 1;
  if (s == "Warning") return 2;
  if (s == "Info") return 3;
  if (s == "Hint") return 4;
  return 3;
}

json empty_lsp_range()
{
  return json{
    {"start", json{{"line", 0}, {"character", 0}}},
    {"end", json{{"line", 0}, {"character", 0}}}};
}

/// Line/column conversion for ranges on the comment-free text (diagnostics).
json to_lsp_range_from_full_range(const json & fr)
{
  // FullSourceRange uses 1-indexed line/column; LSP uses 0-indexed.
  const int sl = std::max(0, fr.value("startLine", 1) - 1);
  const int sc = std::max(0, fr.value("startColumn", 1) - 1);
  const int el = std::max(0, fr.value("endLine", 1) - 1);
  const int ec = std::max(0, fr.value("endColumn", 1) - 1);

  return json{
    {"start", json{{"line", sl}, {"character", sc}}},
    {"end", json{{"line", el}, {"character", ec}}},
  };
}

std::optional<uint32_t> utf8_position_to_byte_offset(
  const DocState & doc, uint32_t line, uint32_t character)
{
  if (doc.line_offsets.empty()) {
    return std::nullopt;
  }
  if (line >= doc.line_offsets.size()) {
    return static_cast<uint32_t>(doc.text.size());
  }

  const uint32_t line_start = doc.line_offsets[line];
  const uint32_t next_line_start = (line + 1 < doc.line_offsets.size())
                                     ? doc.line_offsets[line + 1]
                                     : static_cast<uint32_t>(doc.text.size());

  const uint32_t line_len = (next_line_start >= line_start) ? (next_line_start - line_start) : 0;
  return line_start + std::min<uint32_t>(character, line_len);
}

std::optional<uint32_t> utf16_position_to_byte_offset(
  const DocState & doc, uint32_t line, uint32_t character)
{
  if (doc.line_offsets.empty()) {
    return std::nullopt;
  }
  if (line >= doc.line_offsets.size()) {
    return static_cast<uint32_t>(doc.text.size());
  }

  const uint32_t line_start = doc.line_offsets[line];
  const uint32_t next_line_start = (line + 1 < doc.line_offsets.size())
                                     ? doc.line_offsets[line + 1]
                                     : static_cast<uint32_t>(doc.text.size());

  const std::string_view slice =
    std::string_view(doc.text).substr(line_start, next_line_start - line_start);

  uint32_t utf16_units = 0;
  uint32_t byte_index = 0;

  while (byte_index < slice.size() && utf16_units < character) {
    const auto c0 = static_cast<unsigned char>(slice[byte_index]);

    // Length of the UTF-8 sequence and the UTF-16 units it encodes to.
    uint32_t nbytes = 1;
    uint32_t units = 1;
    if ((c0 & 0xE0) == 0xC0) {
      nbytes = 2;
    } else if ((c0 & 0xF0) == 0xE0) {
      nbytes = 3;
    } else if ((c0 & 0xF8) == 0xF0) {
      nbytes = 4;
      units = 2;
    }
    if (byte_index + nbytes > slice.size() || utf16_units + units > character) {
      break;
    }
    utf16_units += units;
    byte_index += nbytes;
  }

  return line_start + byte_index;
}

uint32_t utf16_units_between(std::string_view s)
{
  uint32_t units = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    const auto c = static_cast<unsigned char>(s[i]);
    if ((c & 0xC0) == 0x80) {
      continue;  // continuation byte
    }
    units += (c & 0xF8) == 0xF0 ? 2U : 1U;
  }
  return units;
}

// ============================================================================
// Transport
// ============================================================================

void write_message(const json & msg)
{
  const std::string body = msg.dump();
  std::cout << "Content-Length: " << body.size() << "\r\n\r\n";
  std::cout << body;
  std::cout.flush();
}

struct IncomingMessage
{
  json body;
  bool parse_error = false;
};

std::optional<IncomingMessage> read_message()
{
  std::string line;
  size_t content_length = 0;
  bool saw_length = false;

  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }

    const std::string_view sv(line);
    if (chill::text::starts_with(sv, "Content-Length:")) {
      const std::string_view rest = sv.substr(std::string_view("Content-Length:").size());
      content_length = static_cast<size_t>(std::strtoul(std::string(rest).c_str(), nullptr, 10));
      saw_length = true;
    }
  }

  if (!saw_length || content_length == 0) {
    return std::nullopt;
  }

  std::string body(content_length, '\0');
  std::cin.read(body.data(), static_cast<std::streamsize>(content_length));
  if (std::cin.gcount() != static_cast<std::streamsize>(content_length)) {
    return std::nullopt;
  }

  IncomingMessage msg;
  try {
    msg.body = json::parse(body);
  } catch (const json::parse_error & e) {
    g_log.log(chill::LogLevel::Error, "malformed message body: {}", e.what());
    msg.parse_error = true;
  }
  return msg;
}

// ============================================================================
// Command line
// ============================================================================

void print_usage(const char * program_name)
{
  fmt::print(
    stderr,
    "{} v{}\n\n"
    "Usage: {} [options]\n\n"
    "Options:\n"
    "  -v, --verbose            Log requests and configuration (same as --log-level debug)\n"
    "  --log-level <level>      error | info | debug (overrides chill.yaml)\n"
    "  -h, --help               Show this help message\n",
    k_server_name, k_server_version, program_name);
}

struct ServerArgs
{
  std::optional<chill::LogLevel> log_level;
  bool show_help = false;
  std::string error;
};

ServerArgs parse_args(int argc, char * argv[])
{
  ServerArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.log_level = chill::LogLevel::Debug;
    } else if (arg == "--log-level") {
      if (i + 1 >= argc) {
        args.error = "--log-level requires a value";
        return args;
      }
      const auto level = chill::parse_log_level(argv[++i]);
      if (!level) {
        args.error = fmt::format("invalid log level: '{}'", argv[i]);
        return args;
      }
      args.log_level = *level;
    } else {
      args.error = fmt::format("unknown option: {}", arg);
      return args;
    }
  }
  return args;
}

}  // namespace

int main(int argc, char * argv[])
{
  try {
    const ServerArgs args = parse_args(argc, argv);
    if (args.show_help) {
      print_usage(argv[0]);
      return 0;
    }
    if (!args.error.empty()) {
      fmt::print(stderr, "chill_lsp_server: error: {}\n", args.error);
      print_usage(argv[0]);
      return 2;
    }
    if (args.log_level) {
      g_log.set_level(*args.log_level);
    }

    chill::lsp::Workspace ws;

    std::unordered_map<std::string, DocState> docs;
    std::string negotiated_position_encoding = "utf-16";
    bool diagnostics_enabled = true;

    auto apply_config = [&](const std::filesystem::path & root) {
      const auto config_path = chill::find_project_config(root);
      if (!config_path) {
        g_log.log(chill::LogLevel::Info, "no {} found above {}", chill::k_project_config_file_name,
                  root.string());
        return;
      }
      const auto loaded = chill::load_project_config(*config_path);
      if (!loaded.success) {
        g_log.log(chill::LogLevel::Error, "{}: {}", config_path->string(), loaded.error);
        return;
      }
      const auto & cfg = loaded.config;
      ws.set_completion_options(
        chill::lsp::CompletionOptions{cfg.completion.keywords, cfg.completion.predefined});
      diagnostics_enabled = cfg.diagnostics.enabled;
      ws.set_diagnostics_enabled(diagnostics_enabled);
      if (!args.log_level) {
        g_log.set_level(cfg.server.log_level);
      }
      g_log.log(chill::LogLevel::Info, "loaded {}", config_path->string());
    };

    auto upsert_doc = [&](const std::string & uri, std::string text) -> DocState & {
      auto & d = docs[uri];
      d.uri = uri;
      d.text = std::move(text);
      d.line_offsets = build_line_offsets(d.text);
      ws.set_document(uri, d.text);
      return d;
    };

    auto publish_diagnostics = [&](const DocState & doc) {
      json lsp_diags = json::array();
      if (diagnostics_enabled) {
        const json dj = json::parse(ws.diagnostics_json(doc.uri));
        for (const auto & it : dj["items"]) {
          json d0;
          d0["message"] = it.value("message", "");
          d0["severity"] = lsp_severity(it.value("severity", "Info"));
          d0["source"] = it.value("source", "chill");
          if (it.contains("code") && it["code"].is_string()) {
            d0["code"] = it["code"];
          }
          if (it.contains("range") && it["range"].is_object()) {
            d0["range"] = to_lsp_range_from_full_range(it["range"]);
          } else {
            d0["range"] = empty_lsp_range();
          }
          lsp_diags.push_back(std::move(d0));
        }
      }

      json notif;
      notif["jsonrpc"] = "2.0";
      notif["method"] = "textDocument/publishDiagnostics";
      notif["params"] = json{{"uri", doc.uri}, {"diagnostics", lsp_diags}};
      write_message(notif);
    };

    auto pos_to_byte_offset = [&](const DocState & doc, const json & pos) -> uint32_t {
      const auto line = pos.value<uint32_t>("line", 0U);
      const auto character = pos.value<uint32_t>("character", 0U);

      if (negotiated_position_encoding == "utf-16") {
        return utf16_position_to_byte_offset(doc, line, character).value_or(0);
      }
      return utf8_position_to_byte_offset(doc, line, character).value_or(0);
    };

    auto byte_offset_to_lsp_position = [&](const DocState & doc, uint32_t byte_offset) -> json {
      byte_offset = std::min<uint32_t>(byte_offset, static_cast<uint32_t>(doc.text.size()));
      size_t line = 0;
      while (line + 1 < doc.line_offsets.size() && doc.line_offsets[line + 1] <= byte_offset) {
        ++line;
      }
      const uint32_t line_start = doc.line_offsets[line];
      uint32_t character = byte_offset - line_start;
      if (negotiated_position_encoding == "utf-16") {
        character =
          utf16_units_between(std::string_view(doc.text).substr(line_start, character));
      }
      return json{{"line", line}, {"character", character}};
    };

    auto byte_range_to_lsp_range = [&](const DocState & doc, uint32_t sb, uint32_t eb) -> json {
      return json{
        {"start", byte_offset_to_lsp_position(doc, sb)},
        {"end", byte_offset_to_lsp_position(doc, eb)},
      };
    };

    // Ranges on the document's own text carry byte offsets; convert those so
    // the negotiated encoding applies.
    auto full_range_to_lsp_range = [&](const DocState & doc, const json & fr) -> json {
      if (!fr.is_object() || !fr.contains("startByte") || !fr.contains("endByte")) {
        return empty_lsp_range();
      }
      return byte_range_to_lsp_range(
        doc, fr.value<uint32_t>("startByte", 0U), fr.value<uint32_t>("endByte", 0U));
    };

    auto respond = [&](const json & id, const json & result) {
      json resp;
      resp["jsonrpc"] = "2.0";
      resp["id"] = id;
      resp["result"] = result;
      write_message(resp);
    };

    auto respond_error = [&](const json & id, int code, std::string message) {
      json resp;
      resp["jsonrpc"] = "2.0";
      resp["id"] = id;
      resp["error"] = json{{"code", code}, {"message", std::move(message)}};
      write_message(resp);
    };

    // Returns false when the server should stop.
    auto handle = [&](const json & msg) -> bool {
      const std::string method = msg.value("method", "");
      const bool is_request = msg.contains("id");
      const json params = msg.value("params", json::object());

      g_log.log(chill::LogLevel::Debug, "<- {}", method.empty() ? "(response)" : method);

      if (method == "initialize" && is_request) {
        // An omitted list means utf-16 only.
        negotiated_position_encoding = "utf-16";
        const json caps_in = params.value("capabilities", json::object());
        const json general = caps_in.value("general", json::object());
        if (general.contains("positionEncodings") && general["positionEncodings"].is_array()) {
          for (const auto & e : general["positionEncodings"]) {
            if (e.is_string() && e.get<std::string>() == "utf-8") {
              negotiated_position_encoding = "utf-8";
            }
          }
        }

        // Project settings: rootUri wins over the deprecated rootPath.
        std::optional<std::string> root;
        if (params.contains("rootUri") && params["rootUri"].is_string()) {
          root = file_uri_to_path(params["rootUri"].get<std::string>());
        }
        if (!root && params.contains("rootPath") && params["rootPath"].is_string()) {
          root = params["rootPath"].get<std::string>();
        }
        if (root && !root->empty()) {
          apply_config(*root);
        }

        json caps;
        caps["positionEncoding"] = negotiated_position_encoding;
        caps["textDocumentSync"] = json{{"openClose", true}, {"change", 1}};  // Full sync
        caps["completionProvider"] =
          json{{"resolveProvider", false}, {"triggerCharacters", json::array({" ", ".", "(", ":"})}};
        caps["hoverProvider"] = true;
        caps["definitionProvider"] = true;
        caps["referencesProvider"] = true;
        caps["documentSymbolProvider"] = true;

        respond(
          msg["id"], json{
                       {"capabilities", caps},
                       {"serverInfo", json{{"name", k_server_name}, {"version", k_server_version}}},
                     });
        return true;
      }

      if (method == "initialized") {
        return true;
      }

      if (method == "shutdown" && is_request) {
        respond(msg["id"], json());
        return true;
      }

      if (method == "exit") {
        return false;
      }

      if (method == "textDocument/didOpen") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        if (!uri.empty()) {
          publish_diagnostics(upsert_doc(uri, td.value("text", "")));
        }
        return true;
      }

      if (method == "textDocument/didChange") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        if (uri.empty()) {
          return true;
        }

        // Full sync: the last change carries the current text
        const auto changes = params.value("contentChanges", json::array());
        if (!changes.is_array() || changes.empty()) {
          return true;
        }
        const auto & last = changes.back();
        if (!last.is_object() || !last.contains("text") || !last["text"].is_string()) {
          return true;
        }

        publish_diagnostics(upsert_doc(uri, last["text"].get<std::string>()));
        return true;
      }

      if (method == "textDocument/didClose") {
        const auto td = params.value("textDocument", json::object());
        const std::string uri = td.value("uri", "");
        if (!uri.empty()) {
          ws.remove_document(uri);
          docs.erase(uri);

          json notif;
          notif["jsonrpc"] = "2.0";
          notif["method"] = "textDocument/publishDiagnostics";
          notif["params"] = json{{"uri", uri}, {"diagnostics", json::array()}};
          write_message(notif);
        }
        return true;
      }

      if (!is_request) {
        return true;
      }

      const auto td = params.value("textDocument", json::object());
      const std::string uri = td.value("uri", "");
      const auto pos = params.value("position", json::object());
      const auto doc_it = docs.find(uri);
      const DocState * doc = doc_it != docs.end() ? &doc_it->second : nullptr;

      if (method == "textDocument/completion") {
        json items = json::array();
        if (doc != nullptr) {
          const json cj = json::parse(ws.completion_json(uri, pos_to_byte_offset(*doc, pos)));
          for (const auto & it0 : cj["items"]) {
            const std::string label = it0.value("label", "");
            json item;
            item["label"] = label;
            item["kind"] = it0.value("lspKind", 1);
            item["detail"] = it0.value("detail", "");
            item["sortText"] = it0.value("sortText", "");

            // textEdit: replaceRange is in bytes (absolute)
            const auto & rr = it0["replaceRange"];
            item["textEdit"] = json{
              {"range", byte_range_to_lsp_range(
                          *doc, rr.value<uint32_t>("startByte", 0U), rr.value<uint32_t>("endByte", 0U))},
              {"newText", it0.value("insertText", label)},
            };
            items.push_back(std::move(item));
          }
        }
        respond(msg["id"], json{{"isIncomplete", false}, {"items", items}});
        return true;
      }

      if (method == "textDocument/hover") {
        if (doc == nullptr) {
          respond(msg["id"], nullptr);
          return true;
        }
        const json hj = json::parse(ws.hover_json(uri, pos_to_byte_offset(*doc, pos)));
        if (!hj["contents"].is_string()) {
          respond(msg["id"], nullptr);
          return true;
        }

        json out;
        out["contents"] = json{{"kind", "markdown"}, {"value", hj["contents"]}};
        if (hj.contains("range") && hj["range"].is_object()) {
          out["range"] = full_range_to_lsp_range(*doc, hj["range"]);
        }
        respond(msg["id"], out);
        return true;
      }

      if (method == "textDocument/definition" || method == "textDocument/references") {
        json locs = json::array();
        if (doc != nullptr) {
          const uint32_t off = pos_to_byte_offset(*doc, pos);
          const json lj = json::parse(
            method == "textDocument/definition" ? ws.definition_json(uri, off)
                                                : ws.references_json(uri, off));
          for (const auto & loc : lj["locations"]) {
            json out;
            out["uri"] = loc.value("uri", uri);
            out["range"] = full_range_to_lsp_range(*doc, loc["range"]);
            locs.push_back(std::move(out));
          }
        }
        if (method == "textDocument/definition" && locs.empty()) {
          respond(msg["id"], nullptr);
        } else {
          respond(msg["id"], locs);
        }
        return true;
      }

      if (method == "textDocument/documentSymbol") {
        json out = json::array();
        if (doc == nullptr) {
          respond(msg["id"], out);
          return true;
        }
        const json sj = json::parse(ws.document_symbols_json(uri));
        for (const auto & s0 : sj["symbols"]) {
          json ds;
          ds["name"] = s0.value("name", "");
          ds["kind"] = s0.value("lspKind", 13);
          ds["detail"] = s0.value("detail", "");
          ds["range"] = full_range_to_lsp_range(*doc, s0["range"]);
          ds["selectionRange"] = full_range_to_lsp_range(*doc, s0["selectionRange"]);
          ds["children"] = json::array();
          out.push_back(std::move(ds));
        }
        respond(msg["id"], out);
        return true;
      }

      respond_error(msg["id"], k_method_not_found, "Method not found");
      return true;
    };

    bool running = true;
    while (running) {
      const auto incoming = read_message();
      if (!incoming) {
        if (!std::cin.good()) {
          break;
        }
        continue;
      }

      if (incoming->parse_error) {
        respond_error(nullptr, k_parse_error, "Parse error");
        continue;
      }

      const json & msg = incoming->body;
      if (!msg.is_object()) {
        respond_error(nullptr, k_invalid_request, "Invalid Request");
        continue;
      }
      try {
        running = handle(msg);
      } catch (const std::exception & e) {
        g_log.log(chill::LogLevel::Error, "{}: {}", msg.value("method", ""), e.what());
        if (msg.contains("id")) {
          respond_error(msg["id"], k_internal_error, e.what());
        }
      }
    }

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "chill_lsp_server: fatal error: " << e.what() << "\n";
    return 1;
  }
}
