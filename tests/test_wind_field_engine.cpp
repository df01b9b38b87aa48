/**
 * @file test_wind_field_engine.cpp
 * @brief Per-vehicle state machine, recompute decimation and provider query tests.
 * @author Watosn
 */

#include <cmath>
#include <optional>

#include <spdlog/spdlog.h>

#include "ridgelift/lift/wind_field_engine.hpp"
#include "test_fakes.hpp"

int main() {
  using namespace ridgelift;
  using ridgelift::testing::approx;
  using ridgelift::testing::make_context;

  lift::LiftConfig cfg{};
  cfg.probe_distance_m = 500.0;
  cfg.ramp_height_m = 1500.0;

  const auto ramp = ridgelift::testing::make_linear_ramp(100.0, 0.1);
  const core::BodyContext body{.name = "Testbody", .has_atmosphere = true, .terrain = &ramp};
  const core::BodyContext other_body{.name = "Otherbody", .has_atmosphere = true, .terrain = &ramp};
  ridgelift::testing::FixedAmbient ambient(core::Vec3{10.0, 0.0, 0.0});
  lift::WindFieldEngine engine(ambient, cfg);

  if (engine.provider_id() != "RidgeLift") {
    spdlog::error("unexpected provider id");
    return 1;
  }

  const auto ctx = make_context(1, &body, core::Vec3{0.0, 0.0, 1100.0}, 1100.0);
  constexpr double dt = 0.02;

  // Target is recomputed on every fifth tick only; smoothing runs before the recompute.
  for (int i = 0; i < 4; ++i) {
    engine.tick(ctx, dt);
  }
  const auto* s = engine.state(1);
  if (s == nullptr || !s->active || ambient.calls() != 0 || !core::is_zero(s->target_mps) || s->tick_counter != 4) {
    spdlog::error("first four ticks should not recompute the target");
    return 2;
  }
  engine.tick(ctx, dt);
  if (ambient.calls() != 1 || !approx(s->target_mps, core::Vec3{0.0, 0.0, 2.0}, 1e-9) || !core::is_zero(s->smoothed_mps) ||
      s->tick_counter != 0 || engine.last_result(1) == nullptr) {
    spdlog::error("fifth tick should recompute the target: calls={} z={}", ambient.calls(), s->target_mps.z);
    return 3;
  }
  for (int i = 0; i < 10; ++i) {
    engine.tick(ctx, dt);
  }
  if (ambient.calls() != 3) {
    spdlog::error("expected three recomputes after fifteen ticks, got {}", ambient.calls());
    return 4;
  }

  // Smoothed vector converges monotonically toward the held target.
  double gap = core::norm(s->target_mps - s->smoothed_mps);
  for (int i = 0; i < 300; ++i) {
    engine.tick(ctx, dt);
    const double next = core::norm(s->target_mps - s->smoothed_mps);
    if (next > gap) {
      spdlog::error("smoothed vector diverged at tick {}", i);
      return 5;
    }
    gap = next;
  }
  if (!approx(s->smoothed_mps, core::Vec3{0.0, 0.0, 2.0}, 1e-6) || !approx(s->last_slope, 0.1)) {
    spdlog::error("smoothed vector should converge to 2 m/s: z={}", s->smoothed_mps.z);
    return 6;
  }

  // Direct query for the tracked vehicle returns its own vector.
  const core::WindQuery own{.body = &body, .consumer = core::VehicleId{1}, .position_m = ctx.position_m};
  if (!approx(engine.wind_at(own), s->smoothed_mps)) {
    spdlog::error("own-vehicle query mismatch");
    return 7;
  }

  // Proximity query for an untracked consumer.
  const core::WindQuery nearby{.body = &body, .consumer = core::VehicleId{7}, .position_m = core::Vec3{1500.0, 0.0, 1100.0}};
  const core::WindQuery distant{.body = &body, .consumer = std::nullopt, .position_m = core::Vec3{2500.0, 0.0, 1100.0}};
  const core::WindQuery edge{.body = &body, .consumer = std::nullopt, .position_m = core::Vec3{2000.0, 0.0, 1100.0}};
  const core::WindQuery elsewhere{.body = &other_body, .consumer = std::nullopt, .position_m = ctx.position_m};
  if (!approx(engine.wind_at(nearby), s->smoothed_mps) || !core::is_zero(engine.wind_at(distant)) ||
      !core::is_zero(engine.wind_at(edge)) || !core::is_zero(engine.wind_at(elsewhere))) {
    spdlog::error("proximity query mismatch");
    return 8;
  }
  const core::WindQuery bodiless{.body = nullptr, .consumer = std::nullopt, .position_m = ctx.position_m};
  if (!core::is_zero(engine.wind_at(bodiless))) {
    spdlog::error("query without a body should match no vehicle");
    return 16;
  }

  // Invalid context zeroes the vehicle, repeatedly.
  auto not_ready = ctx;
  not_ready.world_ready = false;
  for (int i = 0; i < 3; ++i) {
    engine.tick(not_ready, dt);
    if (s->active || !core::is_zero(s->smoothed_mps) || !core::is_zero(s->target_mps) || !core::is_zero(engine.wind_at(own))) {
      spdlog::error("inactive vehicle should hold zero wind");
      return 9;
    }
  }
  const int calls_inactive = ambient.calls();
  auto missing = ctx;
  missing.vehicle_present = false;
  engine.tick(missing, dt);
  auto bodiless_ctx = ctx;
  bodiless_ctx.body = nullptr;
  engine.tick(bodiless_ctx, dt);
  if (ambient.calls() != calls_inactive || s->active || !core::is_zero(engine.wind_at(nearby))) {
    spdlog::error("missing vehicle or body must not evaluate");
    return 10;
  }

  // Resumes from zero once valid again.
  for (int i = 0; i < 5; ++i) {
    engine.tick(ctx, dt);
  }
  if (!s->active || !(s->smoothed_mps.z >= 0.0) || !(s->smoothed_mps.z < 2.0) || !(ambient.calls() > calls_inactive)) {
    spdlog::error("vehicle did not resume cleanly");
    return 11;
  }

  // Two vehicles: untracked consumers get the nearest active one.
  const auto ctx2 = make_context(2, &body, core::Vec3{1000.0, 0.0, 1100.0}, 1100.0);
  ambient.set_wind(core::Vec3{-10.0, 0.0, 0.0});
  for (int i = 0; i < 400; ++i) {
    engine.tick(ctx2, dt);
  }
  ambient.set_wind(core::Vec3{10.0, 0.0, 0.0});
  for (int i = 0; i < 400; ++i) {
    engine.tick(ctx, dt);
  }
  const auto* s2 = engine.state(2);
  if (s2 == nullptr || !(s2->smoothed_mps.z < 0.0) || !(s->smoothed_mps.z > 0.0)) {
    spdlog::error("two-vehicle setup failed");
    return 12;
  }
  const core::WindQuery closer_to_2{.body = &body, .consumer = std::nullopt, .position_m = core::Vec3{900.0, 0.0, 1100.0}};
  const core::WindQuery closer_to_1{.body = &body, .consumer = std::nullopt, .position_m = core::Vec3{100.0, 0.0, 1100.0}};
  const core::WindQuery as_vehicle_2{.body = &body, .consumer = core::VehicleId{2}, .position_m = core::Vec3{0.0, 0.0, 1100.0}};
  if (!approx(engine.wind_at(closer_to_2), s2->smoothed_mps) || !approx(engine.wind_at(closer_to_1), s->smoothed_mps) ||
      !approx(engine.wind_at(as_vehicle_2), s2->smoothed_mps)) {
    spdlog::error("multi-vehicle query mismatch");
    return 13;
  }

  // Vehicle 2 drops out; vehicle 1 keeps its lift and now serves vehicle 2's neighbourhood.
  engine.deactivate_all_except({1});
  if (s2->active || !core::is_zero(s2->smoothed_mps) || !s->active || core::is_zero(s->smoothed_mps) ||
      !approx(engine.wind_at(closer_to_2), s->smoothed_mps)) {
    spdlog::error("deactivate_all_except should only zero absent vehicles");
    return 17;
  }

  engine.deactivate_all();
  if (s->active || s2->active || !core::is_zero(engine.wind_at(closer_to_1))) {
    spdlog::error("deactivate_all should zero every vehicle");
    return 14;
  }

  if (!engine.remove(2) || engine.remove(2) || engine.state(2) != nullptr || engine.states().size() != 1U) {
    spdlog::error("remove bookkeeping mismatch");
    return 15;
  }

  return 0;
}
