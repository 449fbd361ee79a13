#include "coverage_solver.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/solver/binary_program.hpp"
#include "internal/solver/timed_solve.hpp"
#include "internal/util/time.hpp"

namespace trustnet::selection {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

CoverageInstance::CoverageInstance(std::vector<CoverageCandidate> candidates, std::size_t budget)
    : candidates_(std::move(candidates)),
      budget_(budget) {
  std::sort(candidates_.begin(), candidates_.end(), [](const auto& a, const auto& b) { return a.id < b.id; });

  for (const auto& candidate : candidates_) {
    talents_.insert(talents_.end(), candidate.coverage.begin(), candidate.coverage.end());
  }
  std::sort(talents_.begin(), talents_.end());
  talents_.erase(std::unique(talents_.begin(), talents_.end()), talents_.end());

  std::unordered_map<model::NodeId, std::uint32_t> talent_index;
  talent_index.reserve(talents_.size());
  for (std::size_t t = 0; t < talents_.size(); ++t) {
    talent_index.emplace(talents_[t], static_cast<std::uint32_t>(t));
  }

  covers_.reserve(candidates_.size());
  for (const auto& candidate : candidates_) {
    std::vector<std::uint32_t> covers;
    covers.reserve(candidate.coverage.size());
    for (model::NodeId talent : candidate.coverage) covers.push_back(talent_index.at(talent));
    std::sort(covers.begin(), covers.end());
    covers.erase(std::unique(covers.begin(), covers.end()), covers.end());
    covers_.push_back(std::move(covers));
  }
}

CoverageInstance CoverageInstance::FromNetwork(const model::NetworkModel& network, double threshold, std::size_t budget) {
  std::vector<CoverageCandidate> candidates;
  for (model::NodeId id : network.AllNodeIds()) {
    const auto& coverage = network.Coverage(id, threshold);
    if (coverage.empty()) continue;
    candidates.push_back(CoverageCandidate{id, network.Degree(id), coverage});
  }
  return CoverageInstance(std::move(candidates), budget);
}

std::size_t CoverageInstance::UnionCoverage(const std::vector<model::NodeId>& ids) const {
  std::vector<std::uint8_t> covered(talents_.size(), 0);
  std::size_t               total = 0;
  for (model::NodeId id : ids) {
    auto it = std::lower_bound(candidates_.begin(), candidates_.end(), id, [](const auto& c, model::NodeId v) { return c.id < v; });
    if (it == candidates_.end() || it->id != id) continue;
    for (std::uint32_t t : covers_[static_cast<std::size_t>(it - candidates_.begin())]) {
      if (!covered[t]) {
        covered[t] = 1;
        ++total;
      }
    }
  }
  return total;
}

// ----------------------------------------------------------------------------
// Greedy
// ----------------------------------------------------------------------------

SelectionResult GreedyCoverageSolver::Solve(const CoverageInstance& instance) const {
  const auto started = util::SteadyClock::now();

  const auto&               candidates = instance.Candidates();
  std::vector<std::uint8_t> covered(instance.TalentCount(), 0);
  std::vector<std::uint8_t> picked(candidates.size(), 0);

  SelectionResult result;
  result.method     = "greedy";
  result.provenance = Provenance::kApproximate;

  std::size_t total = 0;
  while (result.selected.size() < instance.Budget()) {
    std::size_t best      = candidates.size();
    std::size_t best_gain = 0;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
      if (picked[i]) continue;
      const auto& covers = instance.Covers(i);
      if (covers.size() <= best_gain) continue;
      std::size_t gain = 0;
      for (std::uint32_t t : covers) gain += covered[t] ? 0 : 1;
      if (gain > best_gain) {
        best      = i;
        best_gain = gain;
      }
    }
    if (best == candidates.size()) break;

    picked[best] = 1;
    for (std::uint32_t t : instance.Covers(best)) covered[t] = 1;
    total += best_gain;
    result.selected.push_back(candidates[best].id);
  }

  result.objective   = RoundObjective(static_cast<double>(total));
  result.budget_used = static_cast<double>(result.selected.size());
  result.runtime_sec = util::SecondsSince(started);
  return result;
}

// ----------------------------------------------------------------------------
// Naive
// ----------------------------------------------------------------------------

SelectionResult NaiveDegreeSolver::Solve(const CoverageInstance& instance) const {
  const auto started = util::SteadyClock::now();

  std::vector<const CoverageCandidate*> ranked;
  ranked.reserve(instance.Candidates().size());
  for (const auto& candidate : instance.Candidates()) ranked.push_back(&candidate);
  std::sort(ranked.begin(), ranked.end(), [](const CoverageCandidate* a, const CoverageCandidate* b) {
    if (a->degree != b->degree) return a->degree > b->degree;
    return a->id < b->id;
  });

  SelectionResult result;
  result.method     = "naive";
  result.provenance = Provenance::kApproximate;
  for (std::size_t i = 0; i < ranked.size() && i < instance.Budget(); ++i) {
    result.selected.push_back(ranked[i]->id);
  }

  result.objective   = RoundObjective(static_cast<double>(instance.UnionCoverage(result.selected)));
  result.budget_used = static_cast<double>(result.selected.size());
  result.runtime_sec = util::SecondsSince(started);
  return result;
}

// ----------------------------------------------------------------------------
// Exact
// ----------------------------------------------------------------------------

ExactCoverageSolver::ExactCoverageSolver(solver::IntegerProgramBackendPtr backend, std::chrono::milliseconds time_limit)
    : backend_(std::move(backend)),
      time_limit_(time_limit) {
}

SelectionResult ExactCoverageSolver::Solve(const CoverageInstance& instance) const {
  const auto started = util::SteadyClock::now();

  SelectionResult greedy = GreedyCoverageSolver{}.Solve(instance);

  const auto&       candidates = instance.Candidates();
  solver::BinaryProgram program("max_coverage");

  std::vector<solver::LinearTerm> budget_row;
  for (const auto& candidate : candidates) {
    const auto x = program.AddVariable("x_" + std::to_string(candidate.id), 0.0);
    budget_row.push_back(solver::LinearTerm{x, 1.0});
  }

  std::vector<std::vector<solver::LinearTerm>> cover_rows(instance.TalentCount());
  for (std::size_t t = 0; t < instance.TalentCount(); ++t) {
    const auto y = program.AddVariable("y_" + std::to_string(instance.TalentId(t)), 1.0);
    cover_rows[t].push_back(solver::LinearTerm{y, 1.0});
  }
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    for (std::uint32_t t : instance.Covers(i)) cover_rows[t].push_back(solver::LinearTerm{i, -1.0});
  }

  program.AddLessEqual("budget", std::move(budget_row), static_cast<double>(instance.Budget()));
  for (std::size_t t = 0; t < cover_rows.size(); ++t) {
    program.AddLessEqual("cover_" + std::to_string(instance.TalentId(t)), std::move(cover_rows[t]), 0.0);
  }

  std::vector<std::uint8_t> warm_start(program.VariableCount(), 0);
  for (model::NodeId id : greedy.selected) {
    auto it = std::lower_bound(candidates.begin(), candidates.end(), id, [](const auto& c, model::NodeId v) { return c.id < v; });
    const auto i  = static_cast<std::size_t>(it - candidates.begin());
    warm_start[i] = 1;
    for (std::uint32_t t : instance.Covers(i)) warm_start[candidates.size() + t] = 1;
  }

  const auto outcome = solver::TimedSolve(backend_, program, time_limit_, &warm_start);

  if (!outcome.Optimal()) {
    const std::string reason = std::string(solver::SolveStatusName(outcome.status)) + (outcome.detail.empty() ? "" : ": " + outcome.detail);
    TRUSTNET_LOG_WARN("Exact sentinel solve fell back to greedy",
                      {StringField("status", solver::SolveStatusName(outcome.status)), StringField("detail", outcome.detail)});
    auto fallback        = MarkFallback(std::move(greedy), "ip", reason);
    fallback.runtime_sec = util::SecondsSince(started);
    return fallback;
  }

  SelectionResult result;
  result.method     = "ip";
  result.provenance = Provenance::kExact;
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    if (outcome.values[i]) result.selected.push_back(candidates[i].id);
  }
  result.objective   = RoundObjective(static_cast<double>(instance.UnionCoverage(result.selected)));
  result.budget_used = static_cast<double>(result.selected.size());
  result.runtime_sec = util::SecondsSince(started);

  TRUSTNET_LOG_DEBUG("Exact sentinel solve finished",
                     {IntField("nodes_explored", static_cast<std::int64_t>(outcome.nodes_explored)), DoubleField("coverage", result.objective),
                      DoubleField("runtime_sec", result.runtime_sec)});
  return result;
}

} // namespace trustnet::selection
