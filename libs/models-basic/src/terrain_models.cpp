/**
 * @file terrain_models.cpp
 * @brief Terrain model implementations.
 * @author Watosn
 */

#include "ridgelift/models/terrain_models.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace ridgelift::models {
namespace {

constexpr double kFullTurnDeg = 360.0;
constexpr double kWrapTolDeg = 1e-9;

// Strip comments and flatten the file into one token stream.
std::istringstream read_tokens(std::ifstream& in) {
  std::ostringstream body;
  std::string line;
  while (std::getline(in, line)) {
    const auto hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }
    body << line << '\n';
  }
  return std::istringstream(body.str());
}

}  // namespace

std::unique_ptr<GridTerrainModel> GridTerrainModel::Create(const Config& config, Eigen::MatrixXd elevations_m) {
  if (elevations_m.rows() < 2 || elevations_m.cols() < 2) {
    return nullptr;
  }
  if (!(config.lat_max_deg > config.lat_min_deg) || !(config.lon_max_deg > config.lon_min_deg) ||
      !(config.frame.radius_m > 0.0)) {
    return nullptr;
  }
  if (!elevations_m.allFinite()) {
    return nullptr;
  }
  auto ptr = std::unique_ptr<GridTerrainModel>(new GridTerrainModel(config, std::move(elevations_m)));
  ptr->wraps_longitude_ = std::abs((config.lon_max_deg - config.lon_min_deg) - kFullTurnDeg) < kWrapTolDeg;
  return ptr;
}

std::unique_ptr<GridTerrainModel> GridTerrainModel::Load(const std::filesystem::path& grid_file,
                                                         const ridgelift::core::SphericalFrame& frame) {
  std::ifstream in(grid_file);
  if (!in) {
    return nullptr;
  }
  auto tokens = read_tokens(in);

  long rows = 0;
  long cols = 0;
  Config config{.frame = frame};
  if (!(tokens >> rows >> cols >> config.lat_min_deg >> config.lat_max_deg >> config.lon_min_deg >> config.lon_max_deg)) {
    return nullptr;
  }
  if (rows < 2 || cols < 2) {
    return nullptr;
  }

  Eigen::MatrixXd elevations = Eigen::MatrixXd::Zero(rows, cols);
  for (long i = 0; i < rows; ++i) {
    for (long j = 0; j < cols; ++j) {
      double value = 0.0;
      if (!(tokens >> value)) {
        return nullptr;
      }
      elevations(i, j) = value;
    }
  }
  return Create(config, std::move(elevations));
}

double GridTerrainModel::elevation_m(double lat_deg, double lon_deg) const {
  if (!std::isfinite(lat_deg) || !std::isfinite(lon_deg)) {
    return 0.0;
  }
  const auto rows = elevations_.rows();
  const auto cols = elevations_.cols();
  const double lat_step = (config_.lat_max_deg - config_.lat_min_deg) / static_cast<double>(rows - 1);
  const double lon_step = (config_.lon_max_deg - config_.lon_min_deg) / static_cast<double>(cols - 1);

  double lon = lon_deg;
  if (wraps_longitude_) {
    lon = config_.lon_min_deg + std::fmod(lon - config_.lon_min_deg, kFullTurnDeg);
    if (lon < config_.lon_min_deg) {
      lon += kFullTurnDeg;
    }
  }
  const double fy = std::clamp((lat_deg - config_.lat_min_deg) / lat_step, 0.0, static_cast<double>(rows - 1));
  const double fx = std::clamp((lon - config_.lon_min_deg) / lon_step, 0.0, static_cast<double>(cols - 1));

  const auto i0 = static_cast<Eigen::Index>(std::floor(fy));
  const auto j0 = static_cast<Eigen::Index>(std::floor(fx));
  const auto i1 = std::min<Eigen::Index>(i0 + 1, rows - 1);
  const auto j1 = std::min<Eigen::Index>(j0 + 1, cols - 1);
  const double ty = fy - static_cast<double>(i0);
  const double tx = fx - static_cast<double>(j0);

  const double v0 = elevations_(i0, j0) + (elevations_(i0, j1) - elevations_(i0, j0)) * tx;
  const double v1 = elevations_(i1, j0) + (elevations_(i1, j1) - elevations_(i1, j0)) * tx;
  return v0 + (v1 - v0) * ty;
}

double BellRidgeTerrainModel::elevation_m(double lat_deg, double lon_deg) const {
  if (!(config_.half_width_m > 0.0)) {
    return config_.base_height_m;
  }
  const double dlon = ridgelift::core::wrap_longitude_deg(lon_deg - config_.axis_lon_deg);
  const double x = frame().radius_m * std::cos(lat_deg * ridgelift::core::constants::kDegToRad) * dlon *
                   ridgelift::core::constants::kDegToRad;
  const double u = x / config_.half_width_m;
  return config_.base_height_m + config_.peak_height_m / (1.0 + u * u);
}

}  // namespace ridgelift::models
