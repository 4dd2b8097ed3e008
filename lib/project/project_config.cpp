// contrtl/project/project_config.cpp - Project configuration implementation
//
#include "contrtl/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace contrtl
{

namespace
{

/// Read an optional scalar; a non-scalar value is a load error.
bool read_scalar(
  const YAML::Node & parent, const char * key, const char * where, std::string & out,
  std::string & error)
{
  const YAML::Node node = parent[key];
  if (!node) return true;
  if (!node.IsScalar()) {
    error = std::string(where) + "." + key + " must be a string";
    return false;
  }
  out = node.as<std::string>();
  return true;
}

}  // namespace

std::string_view to_string(EmitFormat format) noexcept
{
  switch (format) {
    case EmitFormat::Serialized:
      return "serialized";
    case EmitFormat::Json:
      return "json";
  }
  return "";
}

std::optional<EmitFormat> parse_emit_format(std::string_view text) noexcept
{
  if (text == "serialized") return EmitFormat::Serialized;
  if (text == "json") return EmitFormat::Json;
  return std::nullopt;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  if (root && !root.IsNull() && !root.IsMap()) {
    return ConfigLoadResult::fail("top level of " + config_path.filename().string() +
                                  " must be a map");
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();
  std::string error;

  try {
    if (const YAML::Node pkg = root["package"]) {
      if (!pkg.IsMap()) return ConfigLoadResult::fail("package must be a map");
      if (
        !read_scalar(pkg, "name", "package", config.package.name, error) ||
        !read_scalar(pkg, "version", "package", config.package.version, error)) {
        return ConfigLoadResult::fail(error);
      }
    }

    if (const YAML::Node comp = root["compiler"]) {
      if (!comp.IsMap()) return ConfigLoadResult::fail("compiler must be a map");

      if (const YAML::Node eps = comp["entry_points"]) {
        if (!eps.IsSequence()) {
          return ConfigLoadResult::fail("compiler.entry_points must be a list");
        }
        for (const auto & ep : eps) {
          config.compiler.entry_points.emplace_back(ep.as<std::string>());
        }
      }

      std::string output_dir;
      if (!read_scalar(comp, "output_dir", "compiler", output_dir, error)) {
        return ConfigLoadResult::fail(error);
      }
      if (!output_dir.empty()) config.compiler.output_dir = output_dir;

      std::string emit;
      if (!read_scalar(comp, "emit", "compiler", emit, error)) {
        return ConfigLoadResult::fail(error);
      }
      if (!emit.empty()) {
        const auto format = parse_emit_format(emit);
        if (!format) {
          return ConfigLoadResult::fail(
            "invalid compiler.emit: '" + emit + "' (must be 'serialized' or 'json')");
        }
        config.compiler.emit = *format;
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string default_project_config(std::string_view package_name)
{
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "package" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << std::string(package_name);
  out << YAML::Key << "version" << YAML::Value << "0.1.0";
  out << YAML::EndMap;
  out << YAML::Key << "compiler" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "entry_points" << YAML::Value << YAML::BeginSeq << "src/main.crtl"
      << YAML::EndSeq;
  out << YAML::Key << "output_dir" << YAML::Value << "generated";
  out << YAML::Key << "emit" << YAML::Value << "serialized";
  out << YAML::EndMap;
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

}  // namespace contrtl
