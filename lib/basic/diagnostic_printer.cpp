// contrtl/basic/diagnostic_printer.cpp - Terminal rendering of diagnostics
//
// fmt lays out the gutter; rang colors it when the stream is a terminal.
//
#include "contrtl/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace contrtl
{

namespace
{

constexpr std::string_view k_gutter = "      |";

std::string_view severity_name(Severity severity)
{
  return severity == Severity::Warning ? "warning" : "error";
}

rang::fg severity_color(Severity severity)
{
  return severity == Severity::Warning ? rang::fg::yellow : rang::fg::red;
}

/// Tabs widen to four columns in both the echoed line and the underline.
std::string expand_tabs(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c == '\t') {
      out += "    ";
    } else {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color) : os_(os)
{
  rang::setControlMode(use_color ? rang::control::Force : rang::control::Off);
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile & source)
{
  header(diag);

  const LineSpan where = source.locate(diag.primary_range());
  if (!where.is_valid()) {
    return;
  }

  os_ << rang::fg::cyan << rang::style::bold << "  -->" << rang::style::reset << rang::fg::reset;
  fmt::print(os_, " {}:{}:{}\n", source.display_name(), where.begin.line, where.begin.column);
  gutter();

  for (const auto & label : diag.labels) {
    snippet(label, source);
  }

  if (diag.help_message) {
    gutter();
    os_ << rang::fg::cyan << rang::style::bold << "   =" << rang::style::reset << rang::fg::reset;
    fmt::print(os_, " help: {}\n", *diag.help_message);
  }
  os_ << "\n";
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceFile & source)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_range().get_begin() < b->primary_range().get_begin();
  });

  for (const auto * d : ordered) {
    print(*d, source);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags, const SourceFile & source)
{
  const size_t errors = diags.error_count();
  if (errors == 0) {
    return;
  }
  os_ << rang::style::bold << severity_color(Severity::Error) << "error" << rang::fg::reset;
  fmt::print(
    os_, ": `{}` failed with {} error{}", source.display_name(), errors, errors == 1 ? "" : "s");
  os_ << rang::style::reset << "\n";
}

void DiagnosticPrinter::header(const Diagnostic & diag)
{
  os_ << rang::style::bold << severity_color(diag.severity) << severity_name(diag.severity);
  if (!diag.code.empty()) {
    fmt::print(os_, "[{}]", diag.code);
  }
  os_ << rang::fg::reset;
  fmt::print(os_, ": {}", diag.message);
  os_ << rang::style::reset << "\n";
}

void DiagnosticPrinter::snippet(const Label & label, const SourceFile & source)
{
  const LineSpan span = source.locate(label.range);
  const std::string_view line = source.line_text(span.begin.line);
  if (!span.is_valid() || line.empty()) {
    return;
  }

  // Multi-line ranges are underlined on their first line only.
  const uint32_t width = (span.single_line() && span.end.column > span.begin.column)
                           ? span.end.column - span.begin.column
                           : 1;
  const std::string_view lead =
    line.substr(0, std::min<size_t>(span.begin.column - 1, line.size()));
  const std::string pad(expand_tabs(lead).size(), ' ');

  os_ << rang::fg::cyan;
  fmt::print(os_, " {:>4} ", span.begin.line);
  os_ << rang::fg::reset;
  fmt::print(os_, "| {}\n", expand_tabs(line));

  const bool primary = label.style == LabelStyle::Primary;
  gutter(false);
  os_ << ' ' << pad << (primary ? rang::fg::red : rang::fg::cyan) << rang::style::bold;
  os_ << std::string(width, primary ? '^' : '-');
  if (!label.message.empty()) {
    os_ << ' ' << label.message;
  }
  os_ << rang::style::reset << rang::fg::reset << "\n";
}

void DiagnosticPrinter::gutter(bool end_line)
{
  os_ << rang::fg::cyan << rang::style::bold << k_gutter << rang::style::reset << rang::fg::reset;
  if (end_line) {
    os_ << "\n";
  }
}

}  // namespace contrtl
