/**
 * @file provider_registration.hpp
 * @brief Bounded-retry registration of a wind provider with a registry that may appear late.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <functional>
#include <utility>

#include "ridgelift/core/interfaces.hpp"

namespace ridgelift::registry {

/**
 * @brief Observable registration state.
 */
enum class RegistrationStatus : std::uint8_t { Pending, Registered, Failed, Deregistered };

/**
 * @brief Retry schedule: first attempt immediately, then `initial_interval_s * backoff_factor^k`, capped.
 */
struct RetryPolicy {
  int max_attempts{8};
  double initial_interval_s{0.5};
  double backoff_factor{2.0};
  double max_interval_s{8.0};
};

/**
 * @brief Drives provider registration from the host tick.
 *
 * The registry is resolved through `locator` on every attempt; a null result means it is not available yet.
 * Destruction deregisters a registered provider.
 */
class ProviderRegistration {
 public:
  using RegistryLocator = std::function<ridgelift::core::IWindRegistry*()>;

  ProviderRegistration(const ridgelift::core::IWindProvider& provider, RegistryLocator locator, RetryPolicy policy = {})
      : provider_(provider), locator_(std::move(locator)), policy_(policy) {}
  ~ProviderRegistration();

  ProviderRegistration(const ProviderRegistration&) = delete;
  ProviderRegistration& operator=(const ProviderRegistration&) = delete;

  /**
   * @brief Advance the retry clock and attempt registration when due.
   * @param dt_s Elapsed host time since the previous call.
   * @return Status after this call.
   */
  RegistrationStatus update(double dt_s);

  /**
   * @brief Deregister now if registered; no further attempts are made.
   */
  void deregister();

  [[nodiscard]] RegistrationStatus status() const { return status_; }
  [[nodiscard]] int attempts() const { return attempts_; }
  /**
   * @brief Seconds until the next attempt while pending.
   */
  [[nodiscard]] double next_attempt_in_s() const { return wait_s_; }

 private:
  bool try_register();
  [[nodiscard]] double interval_after(int attempts) const;

  const ridgelift::core::IWindProvider& provider_;
  RegistryLocator locator_;
  RetryPolicy policy_{};
  RegistrationStatus status_{RegistrationStatus::Pending};
  int attempts_{};
  double wait_s_{};
};

}  // namespace ridgelift::registry
