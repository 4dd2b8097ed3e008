// contrtl/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
#pragma once

#include <iosfwd>
#include <string_view>

#include "contrtl/basic/diagnostic.hpp"
#include "contrtl/basic/source_manager.hpp"

namespace contrtl
{

/**
 * Renders diagnostics with the offending source lines underneath:
 *
 *   error[E2003]: module `add2` expects 2 arguments, found 1
 *     --> adder.crtl:2:5
 *      |
 *    2 | y = add2(0)
 *      |     ^^^^^^^ expected 2 arguments
 *    1 | add2 = mod(a, b) { a xor b }
 *      |        -------------------- module defined here
 *
 * Primary labels are underlined with `^`, secondary ones with `-`.
 * Diagnostics without a location (driver errors) print the header only.
 */
class DiagnosticPrinter
{
public:
  /// `use_color` switches rang output for the whole process.
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceFile & source);

  /// Every diagnostic of the bag, in source order.
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

  /// "error: `adder.crtl` failed with 2 errors"; prints nothing for a clean bag.
  void print_summary(const DiagnosticBag & diags, const SourceFile & source);

private:
  void header(const Diagnostic & diag);
  void snippet(const Label & label, const SourceFile & source);
  void gutter(bool end_line = true);

  std::ostream & os_;
};

}  // namespace contrtl
