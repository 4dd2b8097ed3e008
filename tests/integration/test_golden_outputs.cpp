#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "contrtl/ast/ast_equal.hpp"
#include "contrtl/ast/serializer.hpp"
#include "contrtl/driver/compiler.hpp"
#include "contrtl/test_support/parse_helpers.hpp"

using namespace contrtl;

namespace
{

std::string read_file(const std::filesystem::path & p)
{
  std::ifstream in(p, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("failed to open file: " + p.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_file(const std::filesystem::path & p, const std::string & content)
{
  std::filesystem::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary);
  out << content;
}

std::string normalize_text(std::string s)
{
  s.erase(std::remove(s.begin(), s.end(), '\r'), s.end());
  while (!s.empty() && s.back() == '\n') s.pop_back();
  return s;
}

std::filesystem::path get_this_dir() { return std::filesystem::absolute(__FILE__).parent_path(); }

std::filesystem::path inputs_dir() { return get_this_dir() / "golden" / "inputs"; }
std::filesystem::path expected_dir() { return get_this_dir() / "golden" / "expected"; }
std::filesystem::path errors_dir() { return get_this_dir() / "golden" / "errors"; }

std::vector<std::filesystem::path> list_crtl_files(const std::filesystem::path & dir)
{
  std::vector<std::filesystem::path> files;
  for (const auto & ent : std::filesystem::directory_iterator(dir)) {
    if (!ent.is_regular_file()) continue;
    if (ent.path().extension() == ".crtl") {
      files.push_back(ent.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

void print_diagnostics(const CompileResult & res)
{
  for (const auto & d : res.diagnostics) {
    std::cerr << d.message << "\n";
  }
  for (const auto & unit : res.units) {
    for (const auto & d : unit->diags) {
      std::cerr << unit->source.display_name() << ": [" << d.code << "] " << d.message << "\n";
    }
  }
}

bool should_update_golden()
{
  const char * v = std::getenv("CONTRTL_UPDATE_GOLDEN");
  return v != nullptr && *v != '\0' && std::string_view(v) != "0";
}

std::filesystem::path scratch_dir(std::string_view name)
{
  const auto dir = std::filesystem::temp_directory_path() / "contrtl_integration" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void run_one(const std::filesystem::path & crtl_file, const std::filesystem::path & out_dir)
{
  const std::string stem = crtl_file.stem().string();

  CompileOptions opts;
  opts.mode = CompileMode::Build;
  opts.output_dir = out_dir;

  const CompileResult res = Compiler::compile_single_file(crtl_file, opts);
  if (!res.success) {
    print_diagnostics(res);
    FAIL() << "Compilation failed for: " << crtl_file.string();
    return;
  }

  ASSERT_EQ(res.generated_files.size(), 1U);
  const std::filesystem::path produced_path = out_dir / (stem + ".crtl.out");
  EXPECT_EQ(res.generated_files.front(), produced_path);
  const std::string produced = normalize_text(read_file(produced_path));

  const std::filesystem::path expected_path = expected_dir() / (stem + ".crtl.out");
  if (should_update_golden()) {
    write_file(expected_path, produced + "\n");
    std::cerr << "[golden updated] " << stem << "\n";
    return;
  }

  EXPECT_EQ(normalize_text(read_file(expected_path)), produced) << "golden mismatch: " << stem;

  // The written form must transform back into the same circuit.
  auto reparsed = test_support::parse(read_file(produced_path));
  ASSERT_TRUE(reparsed->ok()) << "serialized output does not re-parse: " << stem;
  EXPECT_TRUE(structurally_equal(res.units.front()->circuit, reparsed->circuit)) << stem;
}

}  // namespace

TEST(IntegrationGolden, MatchesGoldenOutputs)
{
  const auto dir = inputs_dir();
  ASSERT_TRUE(std::filesystem::exists(dir)) << "Inputs directory missing: " << dir;

  const auto files = list_crtl_files(dir);
  ASSERT_FALSE(files.empty()) << "No .crtl inputs found in: " << dir;

  const auto out_dir = scratch_dir("golden");
  for (const auto & f : files) {
    SCOPED_TRACE(std::string("input=") + f.string());
    run_one(f, out_dir);
  }
}

TEST(IntegrationErrors, ReportsTransformErrorsPerFile)
{
  const std::vector<std::pair<std::string, std::string>> cases = {
    {"arity.crtl", "E2003"},
    {"duplicate.crtl", "E2001"},
    {"unknown.crtl", "E2002"},
    {"syntax.crtl", "E1001"},
  };

  CompileOptions opts;
  opts.mode = CompileMode::Check;

  for (const auto & [file, code] : cases) {
    SCOPED_TRACE(file);
    const CompileResult res = Compiler::compile_single_file(errors_dir() / file, opts);
    EXPECT_FALSE(res.success);
    EXPECT_TRUE(res.generated_files.empty());
    ASSERT_EQ(res.units.size(), 1U);
    EXPECT_EQ(res.units.front()->circuit, nullptr);
    EXPECT_NE(res.units.front()->diags.find(code), nullptr);
  }
}

TEST(IntegrationErrors, MissingFile)
{
  CompileOptions opts;
  opts.mode = CompileMode::Check;
  const CompileResult res = Compiler::compile_single_file(errors_dir() / "absent.crtl", opts);
  EXPECT_FALSE(res.success);
  EXPECT_TRUE(res.units.empty());
  EXPECT_NE(res.diagnostics.find(DiagCode::SourceUnreadable), nullptr);
}

TEST(IntegrationErrors, OutputDirectoryBlockedByFile)
{
  const auto root = scratch_dir("blocked");
  write_file(root / "blocker", "not a directory\n");

  CompileOptions opts;
  opts.mode = CompileMode::Build;
  opts.output_dir = root / "blocker" / "out";
  const CompileResult res = Compiler::compile_single_file(inputs_dir() / "adder.crtl", opts);
  EXPECT_FALSE(res.success);
  EXPECT_TRUE(res.generated_files.empty());
  const Diagnostic * d = res.diagnostics.find(DiagCode::OutputUnwritable);
  ASSERT_NE(d, nullptr);
  EXPECT_NE(d->message.find("cannot create output directory"), std::string::npos);
}

TEST(IntegrationProject, BuildsEveryEntryPointAsJson)
{
  const auto root = scratch_dir("project");
  std::filesystem::create_directories(root / "src");
  std::filesystem::copy_file(inputs_dir() / "adder.crtl", root / "src" / "adder.crtl");
  std::filesystem::copy_file(inputs_dir() / "counter.crtl", root / "src" / "counter.crtl");
  write_file(
    root / k_project_config_file_name,
    "package: { name: demo, version: 0.1.0 }\n"
    "compiler:\n"
    "  entry_points: [src/adder.crtl, src/counter.crtl]\n"
    "  output_dir: build\n"
    "  emit: json\n");

  const ConfigLoadResult cfg = load_project_config(root / k_project_config_file_name);
  ASSERT_TRUE(cfg.success) << cfg.error;

  CompileOptions opts;
  opts.mode = CompileMode::Build;
  const CompileResult res = Compiler::compile_project(cfg.config, opts);
  if (!res.success) print_diagnostics(res);
  ASSERT_TRUE(res.success);
  ASSERT_EQ(res.generated_files.size(), 2U);
  EXPECT_EQ(res.generated_files[0].filename(), "adder.json");
  EXPECT_EQ(res.generated_files[0].parent_path().filename(), "build");

  const std::string json = read_file(res.generated_files[1]);
  EXPECT_NE(json.find("\"type\": \"Circuit\""), std::string::npos);
  EXPECT_NE(json.find("\"name\": \"en\""), std::string::npos);
}

TEST(IntegrationProject, FailingEntryPointDoesNotStopOthers)
{
  const auto root = scratch_dir("partial");
  std::filesystem::copy_file(inputs_dir() / "pipeline.crtl", root / "pipeline.crtl");
  std::filesystem::copy_file(errors_dir() / "arity.crtl", root / "arity.crtl");

  ProjectConfig config;
  config.project_root = root;
  config.compiler.entry_points = {"arity.crtl", "missing.crtl", "pipeline.crtl"};

  CompileOptions opts;
  opts.mode = CompileMode::Build;
  const CompileResult res = Compiler::compile_project(config, opts);
  EXPECT_FALSE(res.success);
  ASSERT_EQ(res.generated_files.size(), 1U);
  EXPECT_EQ(res.generated_files[0].filename(), "pipeline.crtl.out");
  EXPECT_EQ(res.units.size(), 2U);
  EXPECT_NE(res.diagnostics.find(DiagCode::SourceUnreadable), nullptr);
}

TEST(IntegrationProject, EmptyEntryPoints)
{
  ProjectConfig config;
  config.project_root = scratch_dir("empty");
  const CompileResult res = Compiler::compile_project(config, CompileOptions{});
  EXPECT_FALSE(res.success);
  ASSERT_NE(res.diagnostics.find(DiagCode::NoEntryPoints), nullptr);
  EXPECT_NE(res.diagnostics.all().front().message.find("no entry points"), std::string::npos);
}

TEST(IntegrationConcurrency, IndependentUnitsOnSeparateThreads)
{
  const std::string text = read_file(inputs_dir() / "pipeline.crtl");
  const std::string expected = read_file(expected_dir() / "pipeline.crtl.out");

  constexpr size_t k_threads = 8;
  std::vector<std::string> outputs(k_threads);
  std::vector<std::thread> workers;
  workers.reserve(k_threads);
  for (size_t i = 0; i < k_threads; ++i) {
    workers.emplace_back([&text, &outputs, i] {
      auto unit = parse_source(text, "pipeline.crtl");
      if (unit->ok()) outputs[i] = serialize(unit->circuit);
    });
  }
  for (auto & w : workers) w.join();

  for (const auto & out : outputs) {
    EXPECT_EQ(normalize_text(out), normalize_text(expected));
  }
}
