// chill/project/project_config.hpp - Project configuration (chill.yaml)
//
// Parses and validates chill.yaml. Shared by the CLI and the language server.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace chill
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class LogLevel : uint8_t {
  Error,
  Info,
  Debug,
};

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

/// Parse "error" | "info" | "debug" (case-insensitive).
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

/**
 * Completion section.
 */
struct CompletionConfig
{
  /// Offer reserved words
  bool keywords = true;

  /// Offer predefined names
  bool predefined = true;
};

struct DiagnosticsConfig
{
  /// Publish scanner diagnostics
  bool enabled = true;
};

struct ServerConfig
{
  LogLevel log_level = LogLevel::Error;
};

/**
 * Complete project configuration (chill.yaml).
 */
struct ProjectConfig
{
  CompletionConfig completion;
  DiagnosticsConfig diagnostics;
  ServerConfig server;

  /// Directory containing chill.yaml
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a chill.yaml file.
 *
 * Missing sections and keys keep their defaults.
 *
 * @param config_path Path to chill.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Same as load_project_config() for YAML text already in memory.
[[nodiscard]] ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & project_root = {});

/**
 * Find chill.yaml by searching upward from a directory (or a file's
 * directory) to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "chill.yaml";

}  // namespace chill
