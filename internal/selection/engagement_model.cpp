#include "engagement_model.hpp"

#include <cmath>
#include <random>
#include <utility>

#include "internal/config/config_defaults.hpp"
#include "internal/config/config_validation.hpp"
#include "internal/util/time.hpp"

namespace trustnet::selection {

using namespace trustnet::runtime::config;

EngagementModel::EngagementModel(MaintenanceConfig config) : config_(std::move(config)) {
  config::ValidateMaintenanceConfig(config_);
}

double EngagementModel::Value(double score, std::uint32_t degree, std::int64_t days_dormant) const {
  const double network_value = score * std::sqrt(static_cast<double>(degree));
  const double days          = static_cast<double>(days_dormant);

  switch (config::DecayModel(config_)) {
    case VALUE_MODEL_LINEAR_URGENCY:
      return days * network_value;
    case VALUE_MODEL_EXPONENTIAL_DECAY:
      return network_value * std::exp2(-days / config_.decay_half_life_days());
    case VALUE_MODEL_FLAT:
      return network_value;
    case VALUE_MODEL_LOG_URGENCY:
    default:
      return std::log(days + 1.0) * network_value;
  }
}

std::map<model::NodeId, double> EngagementModel::Costs(const model::NetworkModel& network) const {
  std::map<model::NodeId, double> costs;

  switch (config::Cost(config_)) {
    case COST_MODEL_UNIFORM:
      for (model::NodeId id : network.AllNodeIds()) costs.emplace(id, config::CostMinutes(config_));
      break;
    case COST_MODEL_DEGREE_PROPORTIONAL:
      for (model::NodeId id : network.AllNodeIds()) {
        costs.emplace(id, config::CostMinutes(config_) + config_.cost_per_edge_minutes() * static_cast<double>(network.Degree(id)));
      }
      break;
    case COST_MODEL_RANDOM_UNIFORM:
    default: {
      std::mt19937_64                              engine(config::CostSeed(config_));
      std::uniform_int_distribution<std::uint32_t> draw(config::CostMinMinutes(config_), config::CostMaxMinutes(config_));
      for (model::NodeId id : network.AllNodeIds()) costs.emplace(id, static_cast<double>(draw(engine)));
      break;
    }
  }
  return costs;
}

std::vector<MaintenanceCandidate> EngagementModel::Candidates(const model::NetworkModel& network) const {
  const auto   costs        = Costs(network);
  const double min_dormancy = config::MinDormancyDays(config_);

  std::vector<MaintenanceCandidate> candidates;
  for (model::NodeId id : network.AllNodeIds()) {
    const std::int64_t  days   = util::WholeDays(network.Dormancy(id));
    const std::uint32_t degree = network.Degree(id);
    const double        score  = network.Score(id);
    if (static_cast<double>(days) <= min_dormancy || degree == 0 || score <= 0.0) continue;

    MaintenanceCandidate candidate;
    candidate.id           = id;
    candidate.value        = Value(score, degree, days);
    candidate.cost         = costs.at(id);
    candidate.days_dormant = days;
    candidate.degree       = degree;
    candidate.score        = score;
    candidates.push_back(candidate);
  }
  return candidates;
}

} // namespace trustnet::selection
