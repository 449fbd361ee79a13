#include "sentinel_selector.hpp"

#include <cstdint>
#include <utility>

#include "internal/config/config_defaults.hpp"
#include "internal/config/config_validation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/selection/coverage_solver.hpp"

namespace trustnet::selection {

using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

SentinelSelector::SentinelSelector(trustnet::runtime::config::SentinelConfig config,
                                   trustnet::runtime::config::SolverConfig solver_config,
                                   solver::IntegerProgramBackendPtr backend)
    : config_(std::move(config)),
      solver_config_(std::move(solver_config)),
      backend_(std::move(backend)) {
  config::ValidateSentinelConfig(config_);
}

SentinelSelection SentinelSelector::Select(const model::NetworkModel& network) const {
  const auto instance = CoverageInstance::FromNetwork(network, config_.coverage_threshold(), static_cast<std::size_t>(config_.budget()));

  SentinelSelection selection;
  selection.candidate_count = instance.Candidates().size();
  selection.talent_count    = instance.TalentCount();

  TRUSTNET_LOG_INFO("Selecting sentinels",
                    {IntField("budget", config_.budget()), DoubleField("coverage_threshold", config_.coverage_threshold()),
                     IntField("candidates", static_cast<std::int64_t>(selection.candidate_count)),
                     IntField("talents", static_cast<std::int64_t>(selection.talent_count))});

  selection.exact  = ExactCoverageSolver(backend_, config::SolverTimeLimit(solver_config_)).Solve(instance);
  selection.greedy = GreedyCoverageSolver{}.Solve(instance);
  selection.naive  = NaiveDegreeSolver{}.Solve(instance);

  for (const auto* result : {&selection.exact, &selection.greedy, &selection.naive}) {
    TRUSTNET_LOG_INFO("Sentinel method finished",
                      {StringField("method", result->method), IntField("selected", static_cast<std::int64_t>(result->selected.size())),
                       DoubleField("coverage", result->objective), DoubleField("runtime_sec", result->runtime_sec),
                       StringField("provenance", ProvenanceName(result->provenance)), BoolField("fallback", result->IsFallback())});
  }

  return selection;
}

} // namespace trustnet::selection
