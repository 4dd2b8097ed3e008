// contrtl/basic/diagnostic.cpp - Diagnostic codes, builder and bag
#include "contrtl/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace contrtl
{

std::string code_name(DiagCode code) { return "E" + std::to_string(static_cast<int>(code)); }

std::string_view to_string(DiagCode code) noexcept
{
  switch (code) {
    case DiagCode::SyntaxError:
      return "SyntaxError";
    case DiagCode::InvalidLiteral:
      return "InvalidLiteral";
    case DiagCode::DuplicateDefinition:
      return "DuplicateDefinition";
    case DiagCode::UnknownModule:
      return "UnknownModule";
    case DiagCode::ArityMismatch:
      return "ArityMismatch";
    case DiagCode::MalformedTree:
      return "MalformedTree";
    case DiagCode::MissingOutput:
      return "MissingOutput";
    case DiagCode::MisplacedResult:
      return "MisplacedResult";
    case DiagCode::SourceUnreadable:
      return "SourceUnreadable";
    case DiagCode::OutputUnwritable:
      return "OutputUnwritable";
    case DiagCode::NoEntryPoints:
      return "NoEntryPoints";
  }
  return "Unknown";
}

const Label * Diagnostic::primary_label() const noexcept
{
  const auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  if (it != labels.end()) return &*it;
  return labels.empty() ? nullptr : &labels.front();
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  return l ? l->range : SourceRange{};
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(&bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(std::exchange(other.bag_, nullptr)), diagnostic_(std::move(other.diagnostic_))
{
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (bag_) bag_->add(std::move(diagnostic_));
}

DiagnosticBuilder & DiagnosticBuilder::with_code(DiagCode code)
{
  diagnostic_.code = code_name(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), LabelStyle::Secondary});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

namespace
{

Diagnostic make_diagnostic(
  Severity severity, SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return d;
}

}  // namespace

DiagnosticBuilder DiagnosticBag::report(
  DiagCode code, SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d =
    make_diagnostic(Severity::Error, range, std::move(message), std::move(label_message));
  d.code = code_name(code);
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(
  SourceRange range, std::string message, std::string label_message)
{
  return {
    *this, make_diagnostic(Severity::Error, range, std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  SourceRange range, std::string message, std::string label_message)
{
  return {
    *this,
    make_diagnostic(Severity::Warning, range, std::move(message), std::move(label_message))};
}

bool DiagnosticBag::has_errors() const { return error_count() > 0; }

size_t DiagnosticBag::error_count() const
{
  return static_cast<size_t>(
    std::count_if(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
      return d.severity == Severity::Error;
    }));
}

const Diagnostic * DiagnosticBag::find(std::string_view code) const noexcept
{
  const auto matches = [code](const Diagnostic & d) { return d.code == code; };
  const auto it = std::find_if(diagnostics_.begin(), diagnostics_.end(), matches);
  return it == diagnostics_.end() ? nullptr : &*it;
}

const Diagnostic * DiagnosticBag::find(DiagCode code) const { return find(code_name(code)); }

}  // namespace contrtl
