/**
 * @file settings_loader.cpp
 * @brief YAML settings loader implementation.
 * @author Watosn
 */

#include "ridgelift/config/settings_loader.hpp"

#include <cmath>
#include <optional>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace ridgelift::config {
namespace {

enum class Range : unsigned char { Any, NonNegative, Positive };

bool in_range(double value, Range range) {
  if (!std::isfinite(value)) {
    return false;
  }
  switch (range) {
    case Range::Any: return true;
    case Range::NonNegative: return value >= 0.0;
    case Range::Positive: return value > 0.0;
  }
  return false;
}

template <typename T>
std::optional<T> convert(const YAML::Node& node) {
  try {
    return node.as<T>();
  } catch (const YAML::BadConversion&) {
    return std::nullopt;
  }
}

class SectionReader {
 public:
  SectionReader(const YAML::Node& section, SettingsLoadResult& out) : section_(section), out_(out) {}

  void read_double(const char* key, double& value, Range range) {
    const YAML::Node node = section_[key];
    if (!node) {
      return;
    }
    const auto parsed = convert<double>(node);
    if (parsed.has_value() && in_range(*parsed, range)) {
      value = *parsed;
      return;
    }
    reject(key, node);
  }

  void read_int(const char* key, int& value, Range range) {
    const YAML::Node node = section_[key];
    if (!node) {
      return;
    }
    const auto parsed = convert<int>(node);
    if (parsed.has_value() && in_range(static_cast<double>(*parsed), range)) {
      value = *parsed;
      return;
    }
    reject(key, node);
  }

  void read_bool(const char* key, bool& value) {
    const YAML::Node node = section_[key];
    if (!node) {
      return;
    }
    const auto parsed = convert<bool>(node);
    if (parsed.has_value()) {
      value = *parsed;
      return;
    }
    reject(key, node);
  }

 private:
  void reject(const char* key, const YAML::Node& node) {
    const std::string text = node.IsScalar() ? node.Scalar() : std::string("<non-scalar>");
    spdlog::warn("ridgelift setting '{}' has invalid value '{}'; keeping default", key, text);
    out_.rejected_keys.emplace_back(key);
  }

  const YAML::Node& section_;
  SettingsLoadResult& out_;
};

SettingsLoadResult parse_root(const YAML::Node& root, const ridgelift::lift::LiftConfig& defaults) {
  if (!root || !root.IsMap()) {
    spdlog::warn("ridgelift settings document has no top-level map; using defaults");
    return SettingsLoadResult{.config = defaults};
  }
  const YAML::Node section = root[kSettingsSection];
  if (!section) {
    spdlog::warn("ridgelift settings missing '{}' section; using defaults", kSettingsSection);
    return SettingsLoadResult{.config = defaults};
  }
  return parse_settings(section, defaults);
}

}  // namespace

SettingsLoadResult parse_settings(const YAML::Node& section, const ridgelift::lift::LiftConfig& defaults) {
  SettingsLoadResult out{.config = defaults};
  if (!section || !section.IsMap()) {
    spdlog::warn("ridgelift settings section is not a map; using defaults");
    return out;
  }
  out.section_found = true;

  auto& c = out.config;
  SectionReader r(section, out);
  r.read_double("probeDistance", c.probe_distance_m, Range::Positive);
  r.read_double("liftMultiplier", c.lift_multiplier, Range::Any);
  r.read_double("maxCeiling", c.max_ceiling_m, Range::NonNegative);
  r.read_double("rampHeight", c.ramp_height_m, Range::NonNegative);
  r.read_double("smoothingSpeed", c.smoothing_speed_per_s, Range::Positive);
  r.read_double("lowAltCutoff", c.low_alt_cutoff_m, Range::NonNegative);
  r.read_bool("debugMode", c.debug_mode);

  r.read_double("groundBuffer", c.ground_buffer_m, Range::NonNegative);
  r.read_double("maxVerticalRatio", c.max_vertical_ratio, Range::NonNegative);
  r.read_double("minWindSpeed", c.min_wind_speed_mps, Range::NonNegative);
  r.read_double("absoluteCeiling", c.absolute_ceiling_m, Range::NonNegative);
  r.read_double("proximityRadius", c.proximity_radius_m, Range::NonNegative);
  r.read_int("updateIntervalTicks", c.update_interval_ticks, Range::Positive);
  r.read_double("statusInterval", c.status_interval_s, Range::Positive);
  r.read_double("statusMinSpeed", c.status_min_speed_mps, Range::NonNegative);
  return out;
}

SettingsLoadResult load_settings_text(const std::string& yaml_text, const ridgelift::lift::LiftConfig& defaults) {
  try {
    return parse_root(YAML::Load(yaml_text), defaults);
  } catch (const YAML::Exception& ex) {
    spdlog::warn("failed to parse ridgelift settings: {}; using defaults", ex.what());
    return SettingsLoadResult{.config = defaults};
  }
}

SettingsLoadResult load_settings_file(const std::filesystem::path& path, const ridgelift::lift::LiftConfig& defaults) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    spdlog::warn("ridgelift settings file not found: {}; using defaults", path.string());
    return SettingsLoadResult{.config = defaults};
  }
  try {
    return parse_root(YAML::LoadFile(path.string()), defaults);
  } catch (const YAML::Exception& ex) {
    spdlog::warn("failed to load ridgelift settings from {}: {}; using defaults", path.string(), ex.what());
    return SettingsLoadResult{.config = defaults};
  }
}

}  // namespace ridgelift::config
