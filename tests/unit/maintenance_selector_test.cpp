#include "internal/selection/maintenance_selector.hpp"

#include <cassert>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/builder/network_builder.hpp"
#include "internal/selection/engagement_model.hpp"
#include "internal/selection/knapsack_solver.hpp"
#include "internal/solver/branch_and_bound_backend.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace trustnet::runtime::config;
using namespace std::chrono_literals;
using trustnet::model::Edge;
using trustnet::model::NetworkModel;
using trustnet::model::NodeId;
using trustnet::selection::EngagementModel;
using trustnet::selection::ExactKnapsackSolver;
using trustnet::selection::KnapsackInstance;
using trustnet::selection::KnapsackItem;
using trustnet::selection::MaintenanceSelector;
using trustnet::selection::Provenance;
using trustnet::selection::RatioGreedyKnapsackSolver;

constexpr std::int64_t kDay = trustnet::util::kSecondsPerDay;
constexpr NodeId       kX   = 1;
constexpr NodeId       kY   = 2;
constexpr NodeId       kZ   = 3;

trustnet::solver::IntegerProgramBackendPtr Backend() {
  return std::make_shared<trustnet::solver::BranchAndBoundBackend>();
}

SolverConfig Solver(std::uint32_t time_limit_ms) {
  SolverConfig config;
  config.set_time_limit_ms(time_limit_ms);
  return config;
}

/*
  reference time = day 100
    1 -> 2  rating  4  day 0    node 2: score 4, degree 1, 100 days dormant
    3 -> 4  rating  6  day 20   node 4: score 6, degree 2,  80 days dormant
    4 -> 5  rating -2  day 0    node 5: negative score
*/
std::shared_ptr<const NetworkModel> DormantNetwork() {
  InputConfig input;
  input.set_reference_time(100 * kDay);
  trustnet::builder::NetworkBuilder builder(input);
  builder.AddEndorsement(Edge{1, 2, 4, 0});
  builder.AddEndorsement(Edge{3, 4, 6, 20 * kDay});
  builder.AddEndorsement(Edge{4, 5, -2, 0});
  return builder.Build();
}

MaintenanceConfig Maintenance(double budget) {
  MaintenanceConfig config;
  config.set_time_budget_minutes(budget);
  config.set_cost_model(COST_MODEL_UNIFORM);
  config.set_cost_minutes(30);
  return config;
}

std::vector<KnapsackItem> PseudoRandomItems(std::size_t count) {
  std::vector<KnapsackItem> items;
  std::uint32_t             state = 2024;
  for (std::size_t i = 0; i < count; ++i) {
    state          = state * 1664525u + 1013904223u;
    const double v = 1.0 + static_cast<double>((state >> 8) % 1000) / 10.0;
    state          = state * 1664525u + 1013904223u;
    const double c = 15.0 + static_cast<double>((state >> 8) % 106);
    items.push_back(KnapsackItem{static_cast<NodeId>(i + 1), v, c});
  }
  return items;
}

double BruteForce(const KnapsackInstance& instance) {
  double best = 0.0;
  for (std::uint32_t mask = 0; mask < (1u << instance.items.size()); ++mask) {
    double value = 0.0;
    double cost  = 0.0;
    for (std::size_t i = 0; i < instance.items.size(); ++i) {
      if (mask & (1u << i)) {
        value += instance.items[i].value;
        cost += instance.items[i].cost;
      }
    }
    if (cost <= instance.budget + 1e-9) best = std::max(best, value);
  }
  return best;
}

// ----------------------------------------------------------------------------
// Knapsack solvers
// ----------------------------------------------------------------------------

void TestKnapsackExample() {
  KnapsackInstance instance{{{kX, 10, 5}, {kY, 8, 5}, {kZ, 3, 5}}, 10};

  auto exact = ExactKnapsackSolver(Backend(), 10000ms, 64).Solve(instance);
  assert(exact.provenance == Provenance::kExact);
  assert((exact.selected == std::vector<NodeId>{kX, kY}));
  assert(exact.objective == 18.0);
  assert(exact.budget_used == 10.0);

  auto approximate = RatioGreedyKnapsackSolver(64).Solve(instance);
  assert((approximate.selected == std::vector<NodeId>{kX, kY}));
  assert(approximate.objective == 18.0);
}

void TestRatioTiesPreferHigherValue() {
  KnapsackInstance instance{{{7, 2, 1}, {8, 4, 2}}, 2};
  auto             result = RatioGreedyKnapsackSolver(0).Solve(instance);
  assert((result.selected == std::vector<NodeId>{8}));
  assert(result.objective == 4.0);
}

void TestBestSingleItemGuard() {
  KnapsackInstance instance{{{1, 3, 1}, {2, 10, 10}}, 10};

  auto no_swaps = RatioGreedyKnapsackSolver(0).Solve(instance);
  assert((no_swaps.selected == std::vector<NodeId>{2}));
  assert(no_swaps.objective == 10.0);
}

void TestSwapImprovesGreedy() {
  // Ratio order takes 1 and 2 (value 7); swapping 1 for 3 reaches 7.5.
  KnapsackInstance instance{{{1, 6, 5}, {2, 1, 1}, {3, 6.5, 6}}, 10};

  auto without = RatioGreedyKnapsackSolver(0).Solve(instance);
  assert(without.objective == 7.0);

  auto with = RatioGreedyKnapsackSolver(64).Solve(instance);
  assert(with.objective == 7.5);
  assert((with.selected == std::vector<NodeId>{3, 2}));
  assert(with.budget_used <= 10.0);
}

void TestExactBeatsLocalSearch() {
  KnapsackInstance instance{{{1, 10, 6}, {2, 3, 3}, {3, 8, 5}, {4, 8, 5}}, 10};

  auto approximate = RatioGreedyKnapsackSolver(64).Solve(instance);
  assert(approximate.objective == 13.0);

  auto exact = ExactKnapsackSolver(Backend(), 10000ms, 64).Solve(instance);
  assert(exact.provenance == Provenance::kExact);
  assert((exact.selected == std::vector<NodeId>{3, 4}));
  assert(exact.objective == 16.0);
}

void TestExactMatchesBruteForceAndDominatesApproximate() {
  const auto items = PseudoRandomItems(16);
  for (double budget : {0.0, 40.0, 150.0, 400.0, 3000.0}) {
    KnapsackInstance instance{items, budget};
    auto             exact       = ExactKnapsackSolver(Backend(), 20000ms, 64).Solve(instance);
    auto             approximate = RatioGreedyKnapsackSolver(64).Solve(instance);

    assert(exact.provenance == Provenance::kExact);
    assert(std::abs(exact.objective - BruteForce(instance)) < 1e-6);
    assert(exact.objective >= approximate.objective);
    assert(exact.budget_used <= budget + 1e-9);
    assert(approximate.budget_used <= budget + 1e-9);
  }
}

void TestBudgetHoldsWhenEverythingIsValuable() {
  KnapsackInstance instance{{{1, 100, 40}, {2, 90, 40}, {3, 80, 40}, {4, 70, 40}}, 100};
  auto             exact       = ExactKnapsackSolver(Backend(), 10000ms, 64).Solve(instance);
  auto             approximate = RatioGreedyKnapsackSolver(64).Solve(instance);
  assert(exact.selected.size() == 2);
  assert(exact.budget_used == 80.0);
  assert(approximate.budget_used <= 100.0);
}

void TestZeroTimeLimitFallsBack() {
  KnapsackInstance instance{{{kX, 10, 5}, {kY, 8, 5}, {kZ, 3, 5}}, 10};
  auto             exact = ExactKnapsackSolver(Backend(), 0ms, 64).Solve(instance);
  assert(exact.IsFallback());
  assert(exact.method == "ip");
  assert((exact.selected == std::vector<NodeId>{kX, kY}));
  assert(exact.fallback_reason.rfind("time_limit", 0) == 0);
}

// ----------------------------------------------------------------------------
// Engagement model
// ----------------------------------------------------------------------------

void TestValueModels() {
  auto config = Maintenance(60);

  config.set_decay_model(VALUE_MODEL_LOG_URGENCY);
  assert(std::abs(EngagementModel(config).Value(4.0, 4, 99) - std::log(100.0) * 8.0) < 1e-12);

  config.set_decay_model(VALUE_MODEL_LINEAR_URGENCY);
  assert(std::abs(EngagementModel(config).Value(4.0, 4, 99) - 99.0 * 8.0) < 1e-12);

  config.set_decay_model(VALUE_MODEL_EXPONENTIAL_DECAY);
  config.set_decay_half_life_days(50.0);
  assert(std::abs(EngagementModel(config).Value(4.0, 4, 100) - 2.0) < 1e-12);

  config.set_decay_model(VALUE_MODEL_FLAT);
  assert(std::abs(EngagementModel(config).Value(4.0, 4, 100) - 8.0) < 1e-12);
}

void TestCandidatesFilterByDormancyScoreAndDegree() {
  auto network = DormantNetwork();

  auto config = Maintenance(60);
  auto all    = EngagementModel(config).Candidates(*network);
  assert(all.size() == 2);
  assert(all[0].id == 2 && all[0].days_dormant == 100 && all[0].degree == 1 && all[0].score == 4.0);
  assert(all[1].id == 4 && all[1].days_dormant == 80 && all[1].degree == 2);
  assert(all[0].cost == 30.0);

  config.set_min_dormancy_days(85);
  auto strict = EngagementModel(config).Candidates(*network);
  assert(strict.size() == 1 && strict[0].id == 2);

  config.set_min_dormancy_days(100);
  assert(EngagementModel(config).Candidates(*network).empty());
}

void TestCostModels() {
  auto network = DormantNetwork();

  MaintenanceConfig random;
  random.set_time_budget_minutes(60);
  random.set_cost_model(COST_MODEL_RANDOM_UNIFORM);
  random.set_cost_min_minutes(15);
  random.set_cost_max_minutes(120);
  random.set_cost_seed(7);
  auto first  = EngagementModel(random).Costs(*network);
  auto second = EngagementModel(random).Costs(*network);
  assert(first == second);
  assert(first.size() == network->NodeCount());
  for (const auto& [id, cost] : first) {
    assert(cost >= 15.0 && cost <= 120.0);
    assert(cost == std::floor(cost));
  }

  MaintenanceConfig proportional;
  proportional.set_time_budget_minutes(60);
  proportional.set_cost_model(COST_MODEL_DEGREE_PROPORTIONAL);
  proportional.set_cost_minutes(10);
  proportional.set_cost_per_edge_minutes(2.5);
  auto costs = EngagementModel(proportional).Costs(*network);
  assert(costs.at(4) == 15.0);
  assert(costs.at(2) == 12.5);
}

// ----------------------------------------------------------------------------
// Selector
// ----------------------------------------------------------------------------

void TestSelectorPicksWithinBudget() {
  auto network = DormantNetwork();

  MaintenanceSelector selector(Maintenance(45), Solver(10000), Backend());
  auto                selection = selector.Select(*network);

  assert(selection.candidates.size() == 2);
  assert(selection.exact.selected.size() == 1);
  assert(selection.exact.budget_used <= 45.0);
  assert(selection.approximate.budget_used <= 45.0);
  assert(selection.exact.objective >= selection.approximate.objective);

  // node 4: ln(81) * 6 * sqrt(2) beats node 2: ln(101) * 4
  assert(selection.exact.selected.front() == 4);
  assert(selection.Find(4) != nullptr);
  assert(selection.Find(5) == nullptr);
}

void TestSelectorIsIdempotent() {
  auto network = DormantNetwork();

  MaintenanceConfig config = Maintenance(60);
  config.set_cost_model(COST_MODEL_RANDOM_UNIFORM);
  MaintenanceSelector selector(config, Solver(10000), Backend());

  auto first  = selector.Select(*network);
  auto second = selector.Select(*network);
  assert(first.exact.selected == second.exact.selected);
  assert(first.approximate.selected == second.approximate.selected);
  assert(first.exact.objective == second.exact.objective);
}

void TestNonPositiveBudgetIsRejected() {
  for (double budget : {0.0, -30.0}) {
    bool threw = false;
    try {
      MaintenanceSelector selector(Maintenance(budget), Solver(10000), Backend());
    } catch (const trustnet::util::ConfigurationError&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestKnapsackExample();
  TestRatioTiesPreferHigherValue();
  TestBestSingleItemGuard();
  TestSwapImprovesGreedy();
  TestExactBeatsLocalSearch();
  TestExactMatchesBruteForceAndDominatesApproximate();
  TestBudgetHoldsWhenEverythingIsValuable();
  TestZeroTimeLimitFallsBack();
  TestValueModels();
  TestCandidatesFilterByDormancyScoreAndDegree();
  TestCostModels();
  TestSelectorPicksWithinBudget();
  TestSelectorIsIdempotent();
  TestNonPositiveBudgetIsRejected();

  std::cout << "trustnet_unit_maintenance_selector: pass\n";
  return 0;
}
