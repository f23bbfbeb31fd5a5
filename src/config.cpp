// config.cpp
// ------------------------------------------------------------------
// YAML pipeline configuration: typed loaders for the `inputs`,
// `merge`, `slice`, `filter`, `composite`, `distances` and `output`
// sections, plus dotted command-line overrides.
// ------------------------------------------------------------------

#include "config.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace gbcore {

// ------------------ small helpers ------------------
static bool ieq(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  return true;
}

static inline const char* node_type(const YAML::Node& n) {
  if (!n) return "Undefined";
  if (n.IsNull()) return "Null";
  if (n.IsScalar()) return "Scalar";
  if (n.IsSequence()) return "Sequence";
  if (n.IsMap()) return "Map";
  return "Unknown";
}

static inline std::string rebase_to_yaml_dir(const std::string& p, const std::string& yaml_dir) {
  namespace fs = std::filesystem;
  if (p.empty() || yaml_dir.empty()) return p;
  fs::path P(p);
  if (P.is_absolute()) return p;
  return (fs::path(yaml_dir) / P).string();
}

static IndexList load_indices(const YAML::Node& n, const char* what) {
  if (!n || n.IsNull()) return std::nullopt;
  if (!n.IsSequence())
    throw std::runtime_error(std::string("slice.") + what + " must be a list of 1-based indices, got " + node_type(n));
  return n.as<std::vector<int>>();
}

static char load_delimiter(const YAML::Node& n) {
  if (!n || n.IsNull()) return 0;
  const std::string s = n.as<std::string>();
  if (ieq(s, "tab"))   return '\t';
  if (ieq(s, "comma")) return ',';
  if (s.size() != 1) throw std::runtime_error("inputs.delimiter must be a single character, 'tab' or 'comma'");
  return s[0];
}

YAML::Node parse_scalar_to_yaml(const std::string& v) {
  YAML::Node out;
  if (ieq(v, "true"))  { out = true;  return out; }
  if (ieq(v, "false")) { out = false; return out; }
  if (ieq(v, "null"))  { out = YAML::Node(); return out; }
  // flow collections, e.g. slice.entries=[1,2,5]
  if (!v.empty() && (v.front() == '[' || v.front() == '{')) return YAML::Load(v);
  char* end = nullptr;
  long val_i = std::strtol(v.c_str(), &end, 10);
  if (!v.empty() && end && *end == '\0') { out = static_cast<int>(val_i); return out; }
  end = nullptr;
  double val_d = std::strtod(v.c_str(), &end);
  if (!v.empty() && end && *end == '\0') { out = val_d; return out; }
  out = v;
  return out;
}

// a.b\.c -> {"a", "b.c"}
static std::vector<std::string> key_path(const std::string& dotted) {
  std::vector<std::string> keys(1);
  for (size_t i = 0; i < dotted.size(); ++i) {
    if (dotted[i] == '\\' && i + 1 < dotted.size()) keys.back() += dotted[++i];
    else if (dotted[i] == '.') keys.emplace_back();
    else keys.back() += dotted[i];
  }
  return keys;
}

void yaml_set_dotted(YAML::Node& root, const std::string& dotted, const YAML::Node& value) {
  const std::vector<std::string> keys = key_path(dotted);
  const std::string& leaf = keys.back();

  YAML::Node section = root;
  std::string where;
  for (size_t d = 0; d + 1 < keys.size(); ++d) {
    where += (d ? "." : "") + keys[d];
    YAML::Node child = section[keys[d]];
    if (child && !child.IsNull() && !child.IsMap())
      throw std::runtime_error("override " + dotted + ": '" + where + "' is a " + node_type(child) +
                               ", not a section");
    if (!child || child.IsNull()) section[keys[d]] = YAML::Node(YAML::NodeType::Map);
    section.reset(section[keys[d]]);
  }

  // a whole top-level section can only be swapped for another map
  if (keys.size() == 1 && !value.IsMap() && section[leaf] && section[leaf].IsMap())
    throw std::runtime_error("override " + dotted + ": '" + leaf + "' is a section; set '" + leaf +
                             ".<key>=...' instead");
  section[leaf] = value;
}

bool apply_override(YAML::Node& root, const std::string& kv) {
  auto pos = kv.find('=');
  if (pos == std::string::npos) return false;
  yaml_set_dotted(root, kv.substr(0, pos), parse_scalar_to_yaml(kv.substr(pos + 1)));
  return true;
}

// ------------------ YAML loaders ------------------
PipelineConfig load_cfg(const YAML::Node& y) {
  PipelineConfig c;
  if (y["kind"]) c.kind = y["kind"].as<std::string>();
  if (y["verbose"]) c.verbose = y["verbose"].as<bool>();
  if (y["inputs"]) c.delimiter = load_delimiter(y["inputs"]["delimiter"]);

  if (const auto m = y["merge"]) {
    if (m["conflict_resolution"]) c.merge.conflict_resolution = m["conflict_resolution"].as<std::vector<double>>();
    if (m["verbose"]) c.merge.verbose = m["verbose"].as<bool>();
  }

  if (const auto s = y["slice"]) {
    c.slice_entries = load_indices(s["entries"], "entries");
    c.slice_features = load_indices(s["features"], "features");
  }

  if (y["filter"]) c.filter = y["filter"].as<bool>();

  if (const auto cs = y["composite"]) {
    if (!cs.IsSequence())
      throw std::runtime_error(std::string("composite must be a list of {name, formula}, got ") + node_type(cs));
    for (const auto& item : cs) {
      if (!item["name"] || !item["formula"])
        throw std::runtime_error("each composite item needs 'name' and 'formula'");
      c.composites.push_back({item["name"].as<std::string>(), item["formula"].as<std::string>()});
    }
  }

  if (const auto d = y["distances"]) {
    c.run_distances = true;
    if (d.IsScalar()) {
      c.run_distances = d.as<bool>();
    } else {
      if (d["metrics"]) c.distances.metrics = d["metrics"].as<std::vector<std::string>>();
      if (d["standardise"]) c.distances.standardise = d["standardise"].as<bool>();
      if (d["verbose"]) c.distances.verbose = d["verbose"].as<bool>();
    }
  }
  return c;
}

Paths load_paths(const YAML::Node& y, const std::string& yaml_dir) {
  Paths p;
  const auto in = y["inputs"];
  if (!in || !in.IsMap())
    throw std::runtime_error(std::string("Could not find an 'inputs' map in the YAML root (found ") +
                             node_type(in) + ").");

  auto as_str = [](const YAML::Node& n, const char* k) -> std::string {
    return n && n[k] ? n[k].as<std::string>() : std::string();
  };
  p.table      = as_str(in, "table");
  p.mask       = as_str(in, "mask");
  p.other      = as_str(in, "other");
  p.other_mask = as_str(in, "other_mask");
  p.out_prefix = as_str(y["output"], "prefix");

  for (std::string* s : {&p.table, &p.mask, &p.other, &p.other_mask, &p.out_prefix})
    *s = rebase_to_yaml_dir(*s, yaml_dir);
  return p;
}

} // namespace gbcore
