#include "config_validation.hpp"

#include <cmath>
#include <string>

#include "internal/config/config_defaults.hpp"
#include "internal/util/errors.hpp"

namespace trustnet::config {

using trustnet::util::ConfigurationError;

void ValidateInputConfig(const InputConfig& cfg) {
  if (MinRating(cfg) > MaxRating(cfg)) {
    throw ConfigurationError("input.min_rating must not exceed input.max_rating");
  }
  if (cfg.has_reference_time() && cfg.reference_time() < 0) {
    throw ConfigurationError("input.reference_time must be a non-negative Unix timestamp");
  }
}

void ValidateSentinelConfig(const SentinelConfig& cfg) {
  if (cfg.budget() <= 0) {
    throw ConfigurationError("sentinel.budget must be a positive integer, got " + std::to_string(cfg.budget()));
  }
  if (!std::isfinite(cfg.coverage_threshold()) || cfg.coverage_threshold() < 0.0) {
    throw ConfigurationError("sentinel.coverage_threshold must be a non-negative number");
  }
}

void ValidateMaintenanceConfig(const MaintenanceConfig& cfg) {
  if (!std::isfinite(cfg.time_budget_minutes()) || cfg.time_budget_minutes() <= 0.0) {
    throw ConfigurationError("maintenance.time_budget_minutes must be positive, got " + std::to_string(cfg.time_budget_minutes()));
  }
  if (!std::isfinite(MinDormancyDays(cfg)) || MinDormancyDays(cfg) < 0.0) {
    throw ConfigurationError("maintenance.min_dormancy_days must be non-negative");
  }

  switch (DecayModel(cfg)) {
    case VALUE_MODEL_LOG_URGENCY:
    case VALUE_MODEL_LINEAR_URGENCY:
    case VALUE_MODEL_FLAT:
      break;
    case VALUE_MODEL_EXPONENTIAL_DECAY:
      if (!std::isfinite(cfg.decay_half_life_days()) || cfg.decay_half_life_days() <= 0.0) {
        throw ConfigurationError("maintenance.decay_half_life_days must be positive for VALUE_MODEL_EXPONENTIAL_DECAY");
      }
      break;
    default:
      throw ConfigurationError("maintenance.decay_model is not a known value model");
  }

  switch (Cost(cfg)) {
    case COST_MODEL_UNIFORM:
      if (!std::isfinite(CostMinutes(cfg)) || CostMinutes(cfg) <= 0.0) {
        throw ConfigurationError("maintenance.cost_minutes must be positive");
      }
      break;
    case COST_MODEL_RANDOM_UNIFORM:
      if (CostMinMinutes(cfg) == 0 || CostMinMinutes(cfg) > CostMaxMinutes(cfg)) {
        throw ConfigurationError("maintenance.cost_min_minutes must be positive and not exceed cost_max_minutes");
      }
      break;
    case COST_MODEL_DEGREE_PROPORTIONAL:
      if (!std::isfinite(CostMinutes(cfg)) || CostMinutes(cfg) <= 0.0) {
        throw ConfigurationError("maintenance.cost_minutes must be positive");
      }
      if (!std::isfinite(cfg.cost_per_edge_minutes()) || cfg.cost_per_edge_minutes() < 0.0) {
        throw ConfigurationError("maintenance.cost_per_edge_minutes must be non-negative");
      }
      break;
    default:
      throw ConfigurationError("maintenance.cost_model is not a known cost model");
  }
}

void ValidateConfig(const RuntimeConfig& config) {
  ValidateInputConfig(config.input());
  ValidateSentinelConfig(config.sentinel());
  ValidateMaintenanceConfig(config.maintenance());

  switch (Backend(config.solver())) {
    case SOLVER_BACKEND_BRANCH_AND_BOUND:
    case SOLVER_BACKEND_NONE:
      break;
    default:
      throw ConfigurationError("solver.backend is not a known backend");
  }
}

} // namespace trustnet::config
