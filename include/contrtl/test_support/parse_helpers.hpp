// contrtl/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// Single-call pipeline for tests: source text in, ParsedUnit out.
//
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "contrtl/ast/ast.hpp"
#include "contrtl/ast/serializer.hpp"
#include "contrtl/basic/diagnostic.hpp"
#include "contrtl/syntax/frontend.hpp"

namespace contrtl::test_support
{

[[nodiscard]] inline std::unique_ptr<ParsedUnit> parse(std::string src)
{
  return parse_source(std::move(src), "<test>.crtl");
}

/// Code of the first error, or empty when the unit has none.
[[nodiscard]] inline std::string first_error_code(const ParsedUnit & unit)
{
  for (const auto & d : unit.diags) {
    if (d.severity == Severity::Error) return d.code;
  }
  return {};
}

/// serialize(parse(src)); empty string if the source does not transform.
[[nodiscard]] inline std::string reformat(std::string src)
{
  auto unit = parse(std::move(src));
  return unit->ok() ? serialize(unit->circuit) : std::string{};
}

}  // namespace contrtl::test_support
