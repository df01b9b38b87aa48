/**
 * @file provider_registration.cpp
 * @brief Provider registration retry implementation.
 * @author Watosn
 */

#include "ridgelift/registry/provider_registration.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace ridgelift::registry {

ProviderRegistration::~ProviderRegistration() { deregister(); }

double ProviderRegistration::interval_after(int attempts) const {
  const double exponent = static_cast<double>(std::max(0, attempts - 1));
  const double interval = policy_.initial_interval_s * std::pow(std::max(1.0, policy_.backoff_factor), exponent);
  if (!std::isfinite(interval)) {
    return policy_.max_interval_s;
  }
  return std::min(interval, policy_.max_interval_s);
}

bool ProviderRegistration::try_register() {
  ++attempts_;
  auto* registry = locator_ ? locator_() : nullptr;
  if (registry == nullptr) {
    return false;
  }
  if (!registry->register_provider(&provider_)) {
    spdlog::warn("wind registry rejected provider '{}'", provider_.provider_id());
    return false;
  }
  return true;
}

RegistrationStatus ProviderRegistration::update(double dt_s) {
  if (status_ != RegistrationStatus::Pending) {
    return status_;
  }
  if (std::isfinite(dt_s) && dt_s > 0.0) {
    wait_s_ -= dt_s;
  }
  if (wait_s_ > 0.0) {
    return status_;
  }

  if (try_register()) {
    status_ = RegistrationStatus::Registered;
    spdlog::info("registered wind provider '{}' after {} attempt(s)", provider_.provider_id(), attempts_);
    return status_;
  }
  if (attempts_ >= policy_.max_attempts) {
    status_ = RegistrationStatus::Failed;
    spdlog::error("wind provider '{}' not registered after {} attempts", provider_.provider_id(), attempts_);
    return status_;
  }
  wait_s_ = interval_after(attempts_);
  return status_;
}

void ProviderRegistration::deregister() {
  if (status_ == RegistrationStatus::Registered) {
    // The registry may have been torn down first; only deregister from a live one.
    auto* registry = locator_ ? locator_() : nullptr;
    if (registry != nullptr && !registry->deregister_provider(provider_.provider_id())) {
      spdlog::warn("wind provider '{}' was already absent from the registry", provider_.provider_id());
    }
  }
  status_ = RegistrationStatus::Deregistered;
}

}  // namespace ridgelift::registry
