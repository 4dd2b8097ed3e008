// contrtl/basic/diagnostic.hpp - Diagnostics for the grammar, transformer and driver
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "contrtl/basic/source_manager.hpp"

namespace contrtl
{

// ============================================================================
// Codes
// ============================================================================

/// Stable diagnostic codes. The numeric value is printed as `E<value>`.
enum class DiagCode : uint16_t {
  // Grammar
  SyntaxError = 1001,
  InvalidLiteral = 1002,

  // Tree transformation
  DuplicateDefinition = 2001,
  UnknownModule = 2002,
  ArityMismatch = 2003,
  MalformedTree = 2004,
  MissingOutput = 2005,
  MisplacedResult = 2006,

  // Driver
  SourceUnreadable = 3001,
  OutputUnwritable = 3002,
  NoEntryPoints = 3003,
};

/// "E2001" for DiagCode::DuplicateDefinition.
[[nodiscard]] std::string code_name(DiagCode code);

[[nodiscard]] std::string_view to_string(DiagCode code) noexcept;

// ============================================================================
// Diagnostic
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
};

enum class LabelStyle : uint8_t {
  Primary,
  Secondary,
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;
  std::string message;
  std::vector<Label> labels;
  std::optional<std::string> help_message;

  /// The first primary label; the first label when none is primary.
  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

/**
 * Adds code, secondary labels and help to a diagnostic under construction.
 * The diagnostic lands in its bag when the builder goes out of scope.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;
  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(DiagCode code);
  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag * bag_;
  Diagnostic diagnostic_;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  /// Error with a code and a primary label at `range`.
  DiagnosticBuilder report(
    DiagCode code, SourceRange range, std::string message, std::string label_message = "");

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] size_t error_count() const;

  /// First diagnostic carrying `code`, or nullptr.
  [[nodiscard]] const Diagnostic * find(std::string_view code) const noexcept;
  [[nodiscard]] const Diagnostic * find(DiagCode code) const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace contrtl
