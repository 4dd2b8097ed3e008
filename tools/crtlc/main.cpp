// crtlc - contRTL front-end command line interface
//
//   crtlc build [file.crtl | --project] [-o dir] [--emit serialized|json]
//   crtlc check [file.crtl | --project]
//   crtlc fmt <file.crtl> [-o file]
//   crtlc init <project-name>
//
#include <unistd.h>

#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "contrtl/ast/serializer.hpp"
#include "contrtl/basic/diagnostic_printer.hpp"
#include "contrtl/driver/compiler.hpp"
#include "contrtl/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

struct Invocation
{
  std::string_view command;
  std::string positional;
  std::string output;
  std::optional<contrtl::EmitFormat> emit;
  bool project = false;
  bool verbose = false;
  bool help = false;
};

using Handler = int (*)(const Invocation &);

struct Command
{
  std::string_view name;
  std::string_view synopsis;
  Handler run;
};

int cmd_build(const Invocation & inv);
int cmd_check(const Invocation & inv);
int cmd_fmt(const Invocation & inv);
int cmd_init(const Invocation & inv);

constexpr std::array<Command, 4> k_commands = {{
  {"build", "build [file.crtl]    transform a file or project and write the circuit", cmd_build},
  {"check", "check [file.crtl]    parse and resolve only", cmd_check},
  {"fmt", "fmt <file.crtl>      print the canonical serialization", cmd_fmt},
  {"init", "init <name>          create a project skeleton", cmd_init},
}};

void usage(std::ostream & os)
{
  os << "usage: crtlc <command> [options]\n\ncommands:\n";
  for (const auto & c : k_commands) {
    os << "  " << c.synopsis << "\n";
  }
  os << "\noptions:\n"
     << "  -o, --output <path>  output directory (build) or file (fmt)\n"
     << "  --project            use the nearest crtl.yaml even when a file is given\n"
     << "  --emit <format>      serialized | json\n"
     << "  -v, --verbose        progress on stderr\n"
     << "  -h, --help           this text\n";
}

/// Parses argv; prints the problem and returns nullopt on bad usage.
std::optional<Invocation> parse_invocation(int argc, char * argv[])
{
  Invocation inv;
  if (argc < 2) {
    inv.help = true;
    return inv;
  }
  inv.command = argv[1];
  if (inv.command == "-h" || inv.command == "--help") {
    inv.help = true;
    return inv;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string_view arg = argv[i];
    const auto value = [&]() -> const char * { return i + 1 < argc ? argv[++i] : nullptr; };

    if (arg == "-o" || arg == "--output" || arg == "--emit") {
      const char * v = value();
      if (!v) {
        std::cerr << "error: " << arg << " needs a value\n";
        return std::nullopt;
      }
      if (arg == "--emit") {
        inv.emit = contrtl::parse_emit_format(v);
        if (!inv.emit) {
          std::cerr << "error: unknown emit format '" << v << "'\n";
          return std::nullopt;
        }
      } else {
        inv.output = v;
      }
    } else if (arg == "--project") {
      inv.project = true;
    } else if (arg == "-v" || arg == "--verbose") {
      inv.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      inv.help = true;
    } else if (!arg.empty() && arg.front() == '-') {
      std::cerr << "error: unknown option '" << arg << "'\n";
      return std::nullopt;
    } else if (inv.positional.empty()) {
      inv.positional = std::string(arg);
    } else {
      std::cerr << "error: unexpected argument '" << arg << "'\n";
      return std::nullopt;
    }
  }
  return inv;
}

void report(const contrtl::CompileResult & result)
{
  contrtl::DiagnosticPrinter printer(std::cerr, isatty(fileno(stderr)) != 0);
  printer.print_all(result.diagnostics, contrtl::SourceFile{});
  for (const auto & unit : result.units) {
    printer.print_all(unit->diags, unit->source);
    printer.print_summary(unit->diags, unit->source);
  }
}

/// Runs the driver on the named file, or on the project around the working directory.
std::optional<contrtl::CompileResult> compile(
  const Invocation & inv, const contrtl::CompileOptions & options)
{
  if (!inv.project && !inv.positional.empty()) {
    return contrtl::Compiler::compile_single_file(fs::absolute(inv.positional), options);
  }

  const auto config_path = contrtl::find_project_config(fs::current_path());
  if (!config_path) {
    std::cerr << "error: no " << contrtl::k_project_config_file_name
              << " in the current directory or its parents\n";
    return std::nullopt;
  }
  const auto loaded = contrtl::load_project_config(*config_path);
  if (!loaded.success) {
    std::cerr << "error: " << loaded.error << "\n";
    return std::nullopt;
  }
  if (options.verbose) {
    std::cerr << "Project " << loaded.config.package.name << " (" << config_path->string()
              << ")\n";
  }
  return contrtl::Compiler::compile_project(loaded.config, options);
}

contrtl::CompileOptions options_for(const Invocation & inv, contrtl::CompileMode mode)
{
  contrtl::CompileOptions options;
  options.mode = mode;
  options.verbose = inv.verbose;
  options.emit = inv.emit;
  if (!inv.output.empty()) {
    options.output_dir = fs::path(inv.output);
  }
  return options;
}

int cmd_build(const Invocation & inv)
{
  const auto result = compile(inv, options_for(inv, contrtl::CompileMode::Build));
  if (!result) return 1;
  report(*result);
  for (const auto & file : result->generated_files) {
    std::cerr << "wrote " << file.string() << "\n";
  }
  return result->success ? 0 : 1;
}

int cmd_check(const Invocation & inv)
{
  const auto result = compile(inv, options_for(inv, contrtl::CompileMode::Check));
  if (!result) return 1;
  report(*result);
  if (!result->success) return 1;
  for (const auto & unit : result->units) {
    std::cout << unit->source.display_name() << ": OK\n";
  }
  return 0;
}

int cmd_fmt(const Invocation & inv)
{
  if (inv.positional.empty()) {
    std::cerr << "error: crtlc fmt needs a source file\n";
    return 1;
  }
  const auto result = contrtl::Compiler::compile_single_file(
    fs::absolute(inv.positional), options_for(inv, contrtl::CompileMode::Check));
  report(result);
  if (!result.success) return 1;

  const std::string text = contrtl::serialize(result.units.front()->circuit);
  if (inv.output.empty()) {
    std::cout << text;
    return 0;
  }
  std::ofstream out(inv.output);
  if (!(out << text)) {
    std::cerr << "error: cannot write " << inv.output << "\n";
    return 1;
  }
  return 0;
}

constexpr std::string_view k_sample_source =
  "// Half adder with a registered carry\n"
  "half = mod(a, b) [req 1; ens res eq (a xor b)] {\n"
  "  out a xor b\n"
  "}\n"
  "\n"
  "c -> 0, x and y\n"
  "s = half(x, y)\n"
  "assert s eq (x xor y)\n";

int cmd_init(const Invocation & inv)
{
  if (inv.positional.empty()) {
    std::cerr << "error: crtlc init needs a project name\n";
    return 1;
  }
  const fs::path root = fs::current_path() / inv.positional;
  if (fs::exists(root)) {
    std::cerr << "error: " << root.string() << " already exists\n";
    return 1;
  }

  std::error_code ec;
  fs::create_directories(root / "src", ec);
  if (ec) {
    std::cerr << "error: cannot create " << root.string() << ": " << ec.message() << "\n";
    return 1;
  }
  std::ofstream config(root / contrtl::k_project_config_file_name);
  std::ofstream sample(root / "src" / "main.crtl");
  config << contrtl::default_project_config(inv.positional);
  sample << k_sample_source;
  if (!config || !sample) {
    std::cerr << "error: cannot write project files under " << root.string() << "\n";
    return 1;
  }

  std::cout << "created " << root.string() << "\n"
            << "  cd " << inv.positional << " && crtlc build\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const auto inv = parse_invocation(argc, argv);
  if (!inv) {
    usage(std::cerr);
    return 2;
  }
  if (inv->help) {
    usage(std::cout);
    return 0;
  }

  for (const auto & c : k_commands) {
    if (c.name == inv->command) {
      return c.run(*inv);
    }
  }
  std::cerr << "error: unknown command '" << inv->command << "'\n";
  usage(std::cerr);
  return 2;
}
