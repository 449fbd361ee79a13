#pragma once

#include <chrono>
#include <cstdint>

#include "config/config.pb.h"

namespace trustnet::config {

/*
  Effective values for optional / unspecified config fields.

  Components read their settings through these helpers so that every default
  lives in one place.
*/

inline constexpr std::int32_t  kDefaultMinRating          = -10;
inline constexpr std::int32_t  kDefaultMaxRating          = 10;
inline constexpr std::uint32_t kDefaultSolverTimeLimitMs  = 60000;
inline constexpr double        kDefaultMinDormancyDays    = 30.0;
inline constexpr double        kDefaultCostMinutes        = 30.0;
inline constexpr std::uint32_t kDefaultCostMinMinutes     = 15;
inline constexpr std::uint32_t kDefaultCostMaxMinutes     = 120;
inline constexpr std::uint64_t kDefaultCostSeed           = 42;
inline constexpr std::uint32_t kDefaultMaxSwapRounds      = 64;
inline constexpr std::uint32_t kDefaultFocusTopTalent     = 100;
inline constexpr std::uint32_t kDefaultFocusNeighborLimit = 10;

using namespace trustnet::runtime::config;

inline std::int32_t MinRating(const InputConfig& cfg) {
  return cfg.has_min_rating() ? cfg.min_rating() : kDefaultMinRating;
}

inline std::int32_t MaxRating(const InputConfig& cfg) {
  return cfg.has_max_rating() ? cfg.max_rating() : kDefaultMaxRating;
}

inline EdgeAggregation Aggregation(const InputConfig& cfg) {
  return cfg.edge_aggregation() == EDGE_AGGREGATION_UNSPECIFIED ? EDGE_AGGREGATION_RETAIN_EVENTS : cfg.edge_aggregation();
}

inline std::chrono::milliseconds SolverTimeLimit(const SolverConfig& cfg) {
  return std::chrono::milliseconds(cfg.has_time_limit_ms() ? cfg.time_limit_ms() : kDefaultSolverTimeLimitMs);
}

inline SolverBackend Backend(const SolverConfig& cfg) {
  return cfg.backend() == SOLVER_BACKEND_UNSPECIFIED ? SOLVER_BACKEND_BRANCH_AND_BOUND : cfg.backend();
}

inline double MinDormancyDays(const MaintenanceConfig& cfg) {
  return cfg.has_min_dormancy_days() ? cfg.min_dormancy_days() : kDefaultMinDormancyDays;
}

inline ValueModel DecayModel(const MaintenanceConfig& cfg) {
  return cfg.decay_model() == VALUE_MODEL_UNSPECIFIED ? VALUE_MODEL_LOG_URGENCY : cfg.decay_model();
}

inline CostModel Cost(const MaintenanceConfig& cfg) {
  return cfg.cost_model() == COST_MODEL_UNSPECIFIED ? COST_MODEL_RANDOM_UNIFORM : cfg.cost_model();
}

inline double CostMinutes(const MaintenanceConfig& cfg) {
  return cfg.has_cost_minutes() ? cfg.cost_minutes() : kDefaultCostMinutes;
}

inline std::uint32_t CostMinMinutes(const MaintenanceConfig& cfg) {
  return cfg.has_cost_min_minutes() ? cfg.cost_min_minutes() : kDefaultCostMinMinutes;
}

inline std::uint32_t CostMaxMinutes(const MaintenanceConfig& cfg) {
  return cfg.has_cost_max_minutes() ? cfg.cost_max_minutes() : kDefaultCostMaxMinutes;
}

inline std::uint64_t CostSeed(const MaintenanceConfig& cfg) {
  return cfg.has_cost_seed() ? cfg.cost_seed() : kDefaultCostSeed;
}

inline std::uint32_t MaxSwapRounds(const MaintenanceConfig& cfg) {
  return cfg.has_max_swap_rounds() ? cfg.max_swap_rounds() : kDefaultMaxSwapRounds;
}

inline SentinelSource GroupSource(const OutputConfig& cfg) {
  return cfg.sentinel_source() == SENTINEL_SOURCE_UNSPECIFIED ? SENTINEL_SOURCE_EXACT : cfg.sentinel_source();
}

inline MaintenanceOrder Order(const OutputConfig& cfg) {
  return cfg.maintenance_order() == MAINTENANCE_ORDER_UNSPECIFIED ? MAINTENANCE_ORDER_DAYS_DORMANT : cfg.maintenance_order();
}

inline GraphScope Scope(const OutputConfig& cfg) {
  return cfg.graph_scope() == GRAPH_SCOPE_UNSPECIFIED ? GRAPH_SCOPE_FULL : cfg.graph_scope();
}

inline std::uint32_t FocusTopTalent(const OutputConfig& cfg) {
  return cfg.has_focus_top_talent() ? cfg.focus_top_talent() : kDefaultFocusTopTalent;
}

inline std::uint32_t FocusNeighborLimit(const OutputConfig& cfg) {
  return cfg.has_focus_neighbor_limit() ? cfg.focus_neighbor_limit() : kDefaultFocusNeighborLimit;
}

} // namespace trustnet::config
