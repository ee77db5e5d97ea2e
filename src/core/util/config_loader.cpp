// src/core/util/config_loader.cpp
#include "fsink/core/util/config_loader.hpp"

#include <filesystem>
#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

namespace fsink {
namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }
static bool is_scalar(const YAML::Node& n) { return n && n.IsScalar(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

// YAML booleans plus the 0/1 spelling older configs use.
static Result<bool> parse_bool(const YAML::Node& n, const std::string& key) {
  if (!is_scalar(n)) return Result<bool>::err(Status::invalid_argument(key + " must be a boolean"));
  const auto s = n.as<std::string>();
  if (s == "1") return Result<bool>::ok(true);
  if (s == "0") return Result<bool>::ok(false);
  bool b = false;
  if (!YAML::convert<bool>::decode(n, b)) {
    return Result<bool>::err(Status::invalid_argument(key + " must be a boolean, got '" + s + "'"));
  }
  return Result<bool>::ok(b);
}

static Result<Level> parse_level_node(const YAML::Node& n, const std::string& key) {
  if (!is_scalar(n)) return Result<Level>::err(Status::invalid_argument(key + " must be a string"));
  auto l = parse_level(n.as<std::string>());
  if (!l.ok()) return Result<Level>::err(Status::invalid_argument(key + ": " + l.status().message()));
  return l;
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path) {
  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (is_map(root) && root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }

    root.remove("includes");
  }

  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static Status apply_file_section(const YAML::Node& f, SinkConfig& out) {
  maybe_set(f, "filename", out.filename);

  // Kept as text; numeric values (O_APPEND) arrive as their digits.
  if (f["mode"]) {
    if (!is_scalar(f["mode"])) return Status::invalid_argument("file.mode must be a scalar");
    out.mode = f["mode"].as<std::string>();
    // A bare `mode: >` parses as an empty folded scalar.
    if (out.mode->empty()) {
      return Status::invalid_argument("file.mode is empty (quote '>' and '>>' in YAML)");
    }
  }

  if (f["autoflush"]) {
    auto b = parse_bool(f["autoflush"], "file.autoflush");
    if (!b.ok()) return b.status();
    out.autoflush = *b;
  }
  if (f["close_after_write"]) {
    auto b = parse_bool(f["close_after_write"], "file.close_after_write");
    if (!b.ok()) return b.status();
    out.close_after_write = *b;
  }
  return Status::ok_status();
}

static Status apply_root(const YAML::Node& y, AppConfig& cfg) {
  maybe_set(y, "name", cfg.output.name);

  if (y["min_level"]) {
    auto l = parse_level_node(y["min_level"], "min_level");
    if (!l.ok()) return l.status();
    cfg.output.min_level = *l;
  }
  if (y["max_level"]) {
    auto l = parse_level_node(y["max_level"], "max_level");
    if (!l.ok()) return l.status();
    cfg.output.max_level = *l;
  }
  if (y["default_level"]) {
    auto l = parse_level_node(y["default_level"], "default_level");
    if (!l.ok()) return l.status();
    cfg.default_level = *l;
  }

  if (y["file"]) {
    if (!is_map(y["file"])) return Status::invalid_argument("file must be a YAML map");
    FSINK_RETURN_IF_ERROR(apply_file_section(y["file"], cfg.output.sink));
  }
  return Status::ok_status();
}

Result<AppConfig> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  auto yaml_r = load_with_includes(path);
  if (!yaml_r.ok()) return Result<AppConfig>::err(yaml_r.status());
  const YAML::Node y = yaml_r.take_value();

  if (!is_map(y)) {
    return Result<AppConfig>::err(Status::invalid_argument("config root must be a YAML map: " + path_str));
  }

  AppConfig cfg;  // defaults

  try {
    const Status st = apply_root(y, cfg);
    if (!st.ok()) return Result<AppConfig>::err(st);
  } catch (const YAML::Exception& e) {
    return Result<AppConfig>::err(Status::parse_error("bad value in " + path_str + ": " + e.what()));
  }

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<AppConfig>::err(s);

  return Result<AppConfig>::ok(cfg);
}

}  // namespace fsink
