// contrtl/driver/compiler.cpp - Compiler driver implementation
//
#include "contrtl/driver/compiler.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include "contrtl/ast/json_visitor.hpp"
#include "contrtl/ast/serializer.hpp"

namespace contrtl
{

bool CompileResult::has_errors() const noexcept
{
  if (diagnostics.has_errors()) return true;
  for (const auto & unit : units) {
    if (!unit->ok()) return true;
  }
  return false;
}

std::optional<std::string> Compiler::read_file(const std::filesystem::path & file)
{
  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::filesystem::path Compiler::output_path_for(
  const std::filesystem::path & source, const std::filesystem::path & output_dir,
  EmitFormat emit)
{
  const std::string stem = source.stem().string();
  return output_dir / (emit == EmitFormat::Json ? stem + ".json" : stem + ".crtl.out");
}

ParsedUnit * Compiler::compile_unit(const std::filesystem::path & file, CompileResult & result)
{
  auto text = read_file(file);
  if (!text) {
    result.diagnostics.report(
      DiagCode::SourceUnreadable, SourceRange{}, "cannot read source file: " + file.string());
    return nullptr;
  }

  result.units.push_back(parse_source(std::move(*text), file));
  return result.units.back().get();
}

CompileResult Compiler::compile_single_file(
  const std::filesystem::path & file, const CompileOptions & options)
{
  CompileResult result;

  namespace fs = std::filesystem;

  if (!fs::exists(file)) {
    result.diagnostics.report(
      DiagCode::SourceUnreadable, SourceRange{}, "file not found: " + file.string());
    return result;
  }

  if (options.verbose) {
    std::cerr << "Compiling " << file.string() << "\n";
  }

  ParsedUnit * unit = compile_unit(file, result);
  if (!unit || !unit->ok()) {
    return result;
  }

  if (options.mode == CompileMode::Build) {
    const EmitFormat emit = options.emit.value_or(EmitFormat::Serialized);
    const fs::path output_dir = options.output_dir.value_or(file.parent_path());
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
      result.diagnostics.report(
        DiagCode::OutputUnwritable, SourceRange{},
        "cannot create output directory " + output_dir.string() + ": " + ec.message());
      return result;
    }

    const fs::path output_path = output_path_for(file, output_dir, emit);
    if (!write_output(*unit, output_path, emit, result.diagnostics)) {
      return result;
    }
    result.generated_files.push_back(output_path);
  }

  result.success = !result.has_errors();
  return result;
}

CompileResult Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  CompileResult result;

  namespace fs = std::filesystem;

  if (config.compiler.entry_points.empty()) {
    result.diagnostics.report(
      DiagCode::NoEntryPoints, SourceRange{}, "no entry points defined in project configuration");
    return result;
  }

  const EmitFormat emit = options.emit.value_or(config.compiler.emit);
  const fs::path output_dir =
    options.output_dir.value_or(config.project_root / config.compiler.output_dir);
  if (options.mode == CompileMode::Build) {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
      result.diagnostics.report(
        DiagCode::OutputUnwritable, SourceRange{},
        "cannot create output directory " + output_dir.string() + ": " + ec.message());
      return result;
    }
  }

  // Entry points are independent; a failing one does not stop the others.
  for (const auto & entry_rel : config.compiler.entry_points) {
    const fs::path entry_path = config.project_root / entry_rel;

    if (!fs::exists(entry_path)) {
      result.diagnostics.report(
        DiagCode::SourceUnreadable, SourceRange{}, "entry point not found: " + entry_path.string());
      continue;
    }

    if (options.verbose) {
      std::cerr << "Compiling " << entry_path.string() << "\n";
    }

    ParsedUnit * unit = compile_unit(entry_path, result);
    if (!unit || !unit->ok() || options.mode != CompileMode::Build) {
      continue;
    }

    const fs::path output_path = output_path_for(entry_path, output_dir, emit);
    if (write_output(*unit, output_path, emit, result.diagnostics)) {
      result.generated_files.push_back(output_path);
    }
  }

  result.success = !result.has_errors();
  return result;
}

bool Compiler::write_output(
  const ParsedUnit & unit, const std::filesystem::path & output_path, EmitFormat emit,
  DiagnosticBag & diags)
{
  std::ofstream out(output_path);
  if (!out.is_open()) {
    diags.report(
      DiagCode::OutputUnwritable, SourceRange{},
      "failed to open output file: " + output_path.string());
    return false;
  }

  if (emit == EmitFormat::Json) {
    out << to_json(unit.circuit).dump(2) << "\n";
  } else {
    out << serialize(unit.circuit);
  }
  return true;
}

}  // namespace contrtl
