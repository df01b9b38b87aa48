/**
 * @file settings_loader.hpp
 * @brief YAML settings loader for ridge-lift configuration.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "ridgelift/lift/lift_config.hpp"

namespace YAML {
class Node;
}

namespace ridgelift::config {

/**
 * @brief Name of the top-level settings map.
 */
inline constexpr const char* kSettingsSection = "ridgelift_settings";

/**
 * @brief Loaded configuration plus the options that fell back to defaults.
 */
struct SettingsLoadResult {
  ridgelift::lift::LiftConfig config{};
  std::vector<std::string> rejected_keys{};
  bool section_found{};
};

/**
 * @brief Overlay the options present in a settings map onto the defaults.
 *
 * Malformed or out-of-range values keep the default and are reported in `rejected_keys`.
 */
[[nodiscard]] SettingsLoadResult parse_settings(const YAML::Node& section,
                                                const ridgelift::lift::LiftConfig& defaults = {});

/**
 * @brief Parse settings from YAML text containing a `ridgelift_settings` map.
 */
[[nodiscard]] SettingsLoadResult load_settings_text(const std::string& yaml_text,
                                                    const ridgelift::lift::LiftConfig& defaults = {});

/**
 * @brief Load settings from a YAML file; a missing or unreadable file yields the defaults.
 */
[[nodiscard]] SettingsLoadResult load_settings_file(const std::filesystem::path& path,
                                                    const ridgelift::lift::LiftConfig& defaults = {});

}  // namespace ridgelift::config
