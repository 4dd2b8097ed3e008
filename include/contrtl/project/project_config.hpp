// contrtl/project/project_config.hpp - crtl.yaml project files
//
//   package:  { name: adder, version: 0.1.0 }
//   compiler:
//     entry_points: [src/main.crtl]
//     output_dir: generated
//     emit: serialized        # or json
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace contrtl
{

/// Artifact written per entry point in build mode.
enum class EmitFormat : uint8_t {
  Serialized,  ///< canonical contRTL text, `<stem>.crtl.out`
  Json,        ///< nlohmann::json dump, `<stem>.json`
};

[[nodiscard]] std::string_view to_string(EmitFormat format) noexcept;

[[nodiscard]] std::optional<EmitFormat> parse_emit_format(std::string_view text) noexcept;

/// The `compiler:` map. Paths are relative to the project root.
struct CompilerConfig
{
  std::vector<std::filesystem::path> entry_points;
  std::filesystem::path output_dir = "generated";

  EmitFormat emit = EmitFormat::Serialized;
};

struct PackageConfig
{
  std::string name;
  std::string version;
};

struct ProjectConfig
{
  PackageConfig package;
  CompilerConfig compiler;
  std::filesystem::path project_root;  ///< directory holding crtl.yaml
};

/// Either a config or the first problem found in the file.
struct ConfigLoadResult
{
  ProjectConfig config;
  bool success = false;
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
    return r;
  }
};

/**
 * Read and validate `config_path`. Unknown keys are ignored; a key of the
 * wrong shape (e.g. `entry_points` not a list) fails the load.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Search for crtl.yaml from start_dir upward to the filesystem root.
 * A file path starts the search at its parent directory.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Render a default crtl.yaml for `crtlc init`.
[[nodiscard]] std::string default_project_config(std::string_view package_name);

inline constexpr const char * k_project_config_file_name = "crtl.yaml";

}  // namespace contrtl
