#include "knapsack_solver.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/solver/binary_program.hpp"
#include "internal/solver/timed_solve.hpp"
#include "internal/util/time.hpp"

namespace trustnet::selection {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr double kTolerance = 1e-9;

void Summarize(const KnapsackInstance& instance, const std::vector<std::size_t>& picked, SelectionResult* result) {
  double value = 0.0;
  double cost  = 0.0;
  result->selected.clear();
  for (std::size_t i : picked) {
    value += instance.items[i].value;
    cost += instance.items[i].cost;
    result->selected.push_back(instance.items[i].id);
  }
  result->objective   = RoundObjective(value);
  result->budget_used = cost;
}

} // namespace

// ----------------------------------------------------------------------------
// Ratio greedy
// ----------------------------------------------------------------------------

RatioGreedyKnapsackSolver::RatioGreedyKnapsackSolver(std::uint32_t max_swap_rounds) : max_swap_rounds_(max_swap_rounds) {
}

SelectionResult RatioGreedyKnapsackSolver::Solve(const KnapsackInstance& instance) const {
  const auto  started = util::SteadyClock::now();
  const auto& items   = instance.items;
  const auto  budget  = instance.budget;

  std::vector<std::size_t> rank(items.size());
  for (std::size_t i = 0; i < rank.size(); ++i) rank[i] = i;
  std::sort(rank.begin(), rank.end(), [&](std::size_t a, std::size_t b) {
    const double lhs = items[a].value * items[b].cost;
    const double rhs = items[b].value * items[a].cost;
    if (lhs != rhs) return lhs > rhs;
    if (items[a].value != items[b].value) return items[a].value > items[b].value;
    return items[a].id < items[b].id;
  });

  std::vector<std::uint8_t> in(items.size(), 0);
  double                    used  = 0.0;
  double                    value = 0.0;
  for (std::size_t i : rank) {
    if (used + items[i].cost <= budget + kTolerance) {
      in[i] = 1;
      used += items[i].cost;
      value += items[i].value;
    }
  }

  for (std::uint32_t round = 0; round < max_swap_rounds_; ++round) {
    double      best_delta = kTolerance;
    std::size_t best_out   = items.size();
    std::size_t best_in    = items.size();

    for (std::size_t j : rank) {
      if (in[j]) continue;
      if (used + items[j].cost <= budget + kTolerance && items[j].value > best_delta) {
        best_delta = items[j].value;
        best_out   = items.size();
        best_in    = j;
      }
      for (std::size_t i : rank) {
        if (!in[i]) continue;
        if (used - items[i].cost + items[j].cost > budget + kTolerance) continue;
        const double delta = items[j].value - items[i].value;
        if (delta > best_delta) {
          best_delta = delta;
          best_out   = i;
          best_in    = j;
        }
      }
    }
    if (best_in == items.size()) break;

    if (best_out != items.size()) {
      in[best_out] = 0;
      used -= items[best_out].cost;
      value -= items[best_out].value;
    }
    in[best_in] = 1;
    used += items[best_in].cost;
    value += items[best_in].value;
  }

  std::size_t best_single = items.size();
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (items[i].cost > budget + kTolerance) continue;
    if (best_single == items.size() || items[i].value > items[best_single].value ||
        (items[i].value == items[best_single].value && items[i].id < items[best_single].id)) {
      best_single = i;
    }
  }

  std::vector<std::size_t> picked;
  if (best_single != items.size() && items[best_single].value > value + kTolerance) {
    picked.push_back(best_single);
  } else {
    for (std::size_t i : rank) {
      if (in[i]) picked.push_back(i);
    }
  }

  SelectionResult result;
  result.method     = "ratio_greedy";
  result.provenance = Provenance::kApproximate;
  Summarize(instance, picked, &result);
  result.runtime_sec = util::SecondsSince(started);
  return result;
}

// ----------------------------------------------------------------------------
// Exact
// ----------------------------------------------------------------------------

ExactKnapsackSolver::ExactKnapsackSolver(solver::IntegerProgramBackendPtr backend, std::chrono::milliseconds time_limit,
                                         std::uint32_t max_swap_rounds)
    : backend_(std::move(backend)),
      time_limit_(time_limit),
      max_swap_rounds_(max_swap_rounds) {
}

SelectionResult ExactKnapsackSolver::Solve(const KnapsackInstance& instance) const {
  const auto started = util::SteadyClock::now();

  SelectionResult approximate = RatioGreedyKnapsackSolver(max_swap_rounds_).Solve(instance);

  std::vector<std::size_t> by_id(instance.items.size());
  for (std::size_t i = 0; i < by_id.size(); ++i) by_id[i] = i;
  std::sort(by_id.begin(), by_id.end(), [&](std::size_t a, std::size_t b) { return instance.items[a].id < instance.items[b].id; });

  solver::BinaryProgram           program("maintenance_knapsack");
  std::vector<solver::LinearTerm> budget_row;
  for (std::size_t i : by_id) {
    const auto& item = instance.items[i];
    const auto  x    = program.AddVariable("x_" + std::to_string(item.id), item.value);
    budget_row.push_back(solver::LinearTerm{x, item.cost});
  }
  program.AddLessEqual("time_budget", std::move(budget_row), instance.budget);

  std::vector<std::uint8_t> warm_start(program.VariableCount(), 0);
  for (std::size_t x = 0; x < by_id.size(); ++x) {
    const auto id = instance.items[by_id[x]].id;
    warm_start[x] = std::find(approximate.selected.begin(), approximate.selected.end(), id) != approximate.selected.end() ? 1 : 0;
  }

  const auto outcome = solver::TimedSolve(backend_, program, time_limit_, &warm_start);

  if (!outcome.Optimal()) {
    const std::string reason = std::string(solver::SolveStatusName(outcome.status)) + (outcome.detail.empty() ? "" : ": " + outcome.detail);
    TRUSTNET_LOG_WARN("Exact maintenance solve fell back to ratio greedy",
                      {StringField("status", solver::SolveStatusName(outcome.status)), StringField("detail", outcome.detail)});
    auto fallback        = MarkFallback(std::move(approximate), "ip", reason);
    fallback.runtime_sec = util::SecondsSince(started);
    return fallback;
  }

  std::vector<std::size_t> picked;
  for (std::size_t x = 0; x < by_id.size(); ++x) {
    if (outcome.values[x]) picked.push_back(by_id[x]);
  }

  SelectionResult result;
  result.method     = "ip";
  result.provenance = Provenance::kExact;
  Summarize(instance, picked, &result);
  result.runtime_sec = util::SecondsSince(started);

  TRUSTNET_LOG_DEBUG("Exact maintenance solve finished",
                     {IntField("nodes_explored", static_cast<std::int64_t>(outcome.nodes_explored)), DoubleField("value", result.objective),
                      DoubleField("runtime_sec", result.runtime_sec)});
  return result;
}

} // namespace trustnet::selection
