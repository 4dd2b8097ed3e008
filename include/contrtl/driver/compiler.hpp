// contrtl/driver/compiler.hpp - Compiler driver
//
// Single entry point for the front-end pipeline.
// Used by the CLI and by integration tests.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "contrtl/basic/diagnostic.hpp"
#include "contrtl/project/project_config.hpp"
#include "contrtl/syntax/frontend.hpp"

namespace contrtl
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Grammar and transform only
  Build,  ///< Also write the serialized circuit
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  CompileMode mode = CompileMode::Build;

  /// Output directory for generated files (overrides project config)
  std::optional<std::filesystem::path> output_dir;

  /// Output format (overrides project config)
  std::optional<EmitFormat> emit;

  bool verbose = false;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether every unit transformed without errors
  bool success = false;

  /// Driver diagnostics with no source attached (missing files, I/O)
  DiagnosticBag diagnostics;

  /// One unit per source read; each carries its own diagnostics
  std::vector<std::unique_ptr<ParsedUnit>> units;

  /// Generated files (only populated for Build mode)
  std::vector<std::filesystem::path> generated_files;

  [[nodiscard]] bool has_errors() const noexcept;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Runs the pipeline for each source: read, grammar, transform, and in Build
 * mode write one artifact per source.
 *
 * Every unit gets its own AstContext and SymbolContext. Units never share
 * state, so separate compiles may run on separate threads.
 */
class Compiler
{
public:
  [[nodiscard]] static CompileResult compile_single_file(
    const std::filesystem::path & file, const CompileOptions & options);

  /**
   * Compile every entry point named in a crtl.yaml.
   *
   * @param config Project configuration
   * @param options Compile options (may override config settings)
   */
  [[nodiscard]] static CompileResult compile_project(
    const ProjectConfig & config, const CompileOptions & options);

  /// Read a whole file; nullopt if it cannot be opened.
  [[nodiscard]] static std::optional<std::string> read_file(const std::filesystem::path & file);

  /// Artifact path for `source` in `output_dir`.
  [[nodiscard]] static std::filesystem::path output_path_for(
    const std::filesystem::path & source, const std::filesystem::path & output_dir,
    EmitFormat emit);

private:
  /// Parse and transform one file; appends the unit to result.units.
  static ParsedUnit * compile_unit(const std::filesystem::path & file, CompileResult & result);

  static bool write_output(
    const ParsedUnit & unit, const std::filesystem::path & output_path, EmitFormat emit,
    DiagnosticBag & diags);
};

}  // namespace contrtl
