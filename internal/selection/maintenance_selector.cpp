#include "maintenance_selector.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

#include "internal/config/config_defaults.hpp"
#include "internal/observability/logging.hpp"
#include "internal/selection/knapsack_solver.hpp"

namespace trustnet::selection {

using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

const MaintenanceCandidate* MaintenanceSelection::Find(model::NodeId id) const {
  auto it = std::lower_bound(candidates.begin(), candidates.end(), id, [](const auto& c, model::NodeId v) { return c.id < v; });
  if (it == candidates.end() || it->id != id) return nullptr;
  return &*it;
}

MaintenanceSelector::MaintenanceSelector(trustnet::runtime::config::MaintenanceConfig config,
                                         trustnet::runtime::config::SolverConfig solver_config,
                                         solver::IntegerProgramBackendPtr backend)
    : config_(std::move(config)),
      solver_config_(std::move(solver_config)),
      backend_(std::move(backend)),
      engagement_(config_) {
}

MaintenanceSelection MaintenanceSelector::Select(const model::NetworkModel& network) const {
  MaintenanceSelection selection;
  selection.candidates = engagement_.Candidates(network);

  KnapsackInstance instance;
  instance.budget = config_.time_budget_minutes();
  instance.items.reserve(selection.candidates.size());
  for (const auto& candidate : selection.candidates) {
    instance.items.push_back(KnapsackItem{candidate.id, candidate.value, candidate.cost});
  }

  TRUSTNET_LOG_INFO("Selecting maintenance contacts",
                    {DoubleField("time_budget_minutes", instance.budget), DoubleField("min_dormancy_days", config::MinDormancyDays(config_)),
                     IntField("candidates", static_cast<std::int64_t>(instance.items.size()))});

  const auto rounds     = config::MaxSwapRounds(config_);
  selection.exact       = ExactKnapsackSolver(backend_, config::SolverTimeLimit(solver_config_), rounds).Solve(instance);
  selection.approximate = RatioGreedyKnapsackSolver(rounds).Solve(instance);

  for (const auto* result : {&selection.exact, &selection.approximate}) {
    TRUSTNET_LOG_INFO("Maintenance method finished",
                      {StringField("method", result->method), IntField("selected", static_cast<std::int64_t>(result->selected.size())),
                       DoubleField("value", result->objective), DoubleField("budget_used", result->budget_used),
                       DoubleField("runtime_sec", result->runtime_sec), StringField("provenance", ProvenanceName(result->provenance)),
                       BoolField("fallback", result->IsFallback())});
  }

  return selection;
}

} // namespace trustnet::selection
