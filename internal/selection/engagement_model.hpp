#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/network_model.hpp"

namespace trustnet::selection {

struct MaintenanceCandidate {
  model::NodeId id{0};
  double        value{0.0};
  double        cost{0.0};
  std::int64_t  days_dormant{0};
  std::uint32_t degree{0};
  double        score{0.0};
};

/*
  Re-engagement value and cost of dormant relationships.

  Value models (d = whole days dormant, s = score, g = degree):
    LOG_URGENCY        ln(d + 1) * s * sqrt(g)
    LINEAR_URGENCY     d * s * sqrt(g)
    EXPONENTIAL_DECAY  s * sqrt(g) * 2^(-d / half_life)
    FLAT               s * sqrt(g)

  Cost models (minutes):
    UNIFORM              cost_minutes
    RANDOM_UNIFORM       integer draw in [cost_min, cost_max], seeded, one draw
                         per node in ascending id order
    DEGREE_PROPORTIONAL  cost_minutes + cost_per_edge_minutes * g
*/
class EngagementModel {
 public:
  explicit EngagementModel(trustnet::runtime::config::MaintenanceConfig config);

  double Value(double score, std::uint32_t degree, std::int64_t days_dormant) const;

  // Cost of every node in the network, keyed by id.
  std::map<model::NodeId, double> Costs(const model::NetworkModel& network) const;

  // Nodes dormant longer than the minimum with positive degree and score, ascending id.
  std::vector<MaintenanceCandidate> Candidates(const model::NetworkModel& network) const;

 private:
  trustnet::runtime::config::MaintenanceConfig config_;
};

} // namespace trustnet::selection
