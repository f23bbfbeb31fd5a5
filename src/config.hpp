#pragma once
#include "pipeline.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace gbcore {

// "true"/"false"/"null", integers and doubles become typed scalars, "[..]"/"{..}" flow
// collections are parsed as YAML; anything else is a string.
YAML::Node parse_scalar_to_yaml(const std::string& v);

// Sets root[a][b][c] for "a.b.c" ("\." is a literal dot), creating maps on the way.
// Refuses to replace a map with a scalar or to descend through a non-map.
void yaml_set_dotted(YAML::Node& root, const std::string& dotted, const YAML::Node& value);

// "key.path=value"; returns false (and leaves root alone) when there is no '='.
bool apply_override(YAML::Node& root, const std::string& kv);

PipelineConfig load_cfg(const YAML::Node& y);

// Relative paths are resolved against `yaml_dir`.
Paths load_paths(const YAML::Node& y, const std::string& yaml_dir = "");

} // namespace gbcore
