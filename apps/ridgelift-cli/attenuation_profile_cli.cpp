/**
 * @file attenuation_profile_cli.cpp
 * @brief AGL sweep of the ridge-lift attenuation factors.
 * @author Watosn
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "ridgelift/config/settings_loader.hpp"
#include "ridgelift/lift/attenuation.hpp"

int main(int argc, char** argv) {
  if (argc < 2 || argc > 6) {
    spdlog::error("usage: attenuation_profile_cli <output_csv> [settings_yaml] [agl_min_m] [agl_max_m] [samples]");
    return 1;
  }

  const std::filesystem::path out_csv = argv[1];
  const double agl_min_m = (argc >= 4) ? std::atof(argv[3]) : 0.0;
  const double agl_max_m = (argc >= 5) ? std::atof(argv[4]) : 3000.0;
  const int samples = (argc >= 6) ? std::atoi(argv[5]) : 301;
  if (!(agl_min_m >= 0.0) || !(agl_max_m > agl_min_m) || samples < 2) {
    spdlog::error("invalid sweep parameters: require agl_min>=0, agl_max>agl_min, samples>=2");
    return 2;
  }

  ridgelift::lift::LiftConfig config{};
  if (argc >= 3) {
    config = ridgelift::config::load_settings_file(argv[2]).config;
  }
  const auto bands = ridgelift::lift::bands_from_config(config);

  std::ofstream out(out_csv);
  if (!out) {
    spdlog::error("failed to open output csv: {}", out_csv.string());
    return 3;
  }

  out << "agl_m,low_factor,high_factor,combined\n";
  for (int i = 0; i < samples; ++i) {
    const double u = static_cast<double>(i) / static_cast<double>(samples - 1);
    const double agl = agl_min_m + (agl_max_m - agl_min_m) * u;
    const auto att = ridgelift::lift::attenuate(1.0, agl, bands);
    out << fmt::format("{:.3f},{:.6f},{:.6f},{:.6f}\n", agl, att.low_factor, att.high_factor, att.vertical_speed_mps);
  }

  spdlog::info("wrote attenuation profile: {}", out_csv.string());
  return 0;
}
