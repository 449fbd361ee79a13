#include "branch_and_bound_backend.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace trustnet::solver {

namespace {

constexpr double        kEpsilon            = 1e-9;
constexpr std::uint64_t kLimitCheckInterval = 256;

/*
  Program split into decision variables (branched on) and implied variables
  ("heads") that are worth their objective once any premise is selected.
*/
struct Structure {
  std::vector<std::size_t>                                   decision_vars;
  std::vector<double>                                        decision_objective;
  std::vector<std::vector<std::pair<std::size_t, double>>>  decision_rows;
  std::vector<std::vector<std::size_t>>                      decision_heads;

  std::vector<std::size_t> head_vars;
  std::vector<double>      head_objective;

  std::vector<double>              row_rhs;
  std::vector<std::vector<double>> row_weights; // [row][decision]
};

struct Analysis {
  SolveStatus status{SolveStatus::kOptimal};
  std::string detail;
  Structure   structure;
};

Analysis Reject(SolveStatus status, std::string detail) {
  Analysis analysis;
  analysis.status = status;
  analysis.detail = std::move(detail);
  return analysis;
}

bool IsImplication(const std::map<std::size_t, double>& terms, double rhs, std::size_t* head) {
  if (std::abs(rhs) > kEpsilon) return false;
  std::size_t positives = 0;
  for (const auto& [var, coef] : terms) {
    if (std::abs(coef - 1.0) <= kEpsilon) {
      ++positives;
      *head = var;
    } else if (std::abs(coef + 1.0) > kEpsilon) {
      return false;
    }
  }
  return positives == 1;
}

Analysis Analyze(const BinaryProgram& program) {
  const std::size_t n = program.VariableCount();

  for (std::size_t i = 0; i < n; ++i) {
    const double c = program.Objective(i);
    if (!std::isfinite(c) || c < 0.0) {
      return Reject(SolveStatus::kUnsupported, "objective coefficient of " + program.VariableName(i) + " is negative or not finite");
    }
  }

  struct Packing {
    std::map<std::size_t, double> terms;
    double                        rhs;
  };
  std::vector<Packing>                  packing;
  std::vector<std::vector<std::size_t>> premises_of(n);
  std::vector<std::uint32_t>            head_rows(n, 0);
  std::vector<std::uint32_t>            premise_uses(n, 0);
  std::vector<std::uint32_t>            packing_uses(n, 0);

  for (const auto& constraint : program.Constraints()) {
    if (!std::isfinite(constraint.rhs)) {
      return Reject(SolveStatus::kUnsupported, "constraint " + constraint.name + " has a non-finite right-hand side");
    }

    std::map<std::size_t, double> terms;
    for (const auto& term : constraint.terms) {
      if (!std::isfinite(term.coefficient)) {
        return Reject(SolveStatus::kUnsupported, "constraint " + constraint.name + " has a non-finite coefficient");
      }
      terms[term.variable] += term.coefficient;
    }
    for (auto it = terms.begin(); it != terms.end();) {
      it = std::abs(it->second) <= kEpsilon ? terms.erase(it) : std::next(it);
    }

    const bool all_non_negative = std::all_of(terms.begin(), terms.end(), [](const auto& t) { return t.second >= 0.0; });
    if (all_non_negative) {
      if (constraint.rhs < -kEpsilon) {
        return Reject(SolveStatus::kInfeasible, "constraint " + constraint.name + " cannot be satisfied");
      }
      for (const auto& [var, coef] : terms) ++packing_uses[var];
      packing.push_back(Packing{std::move(terms), constraint.rhs});
      continue;
    }

    std::size_t head = 0;
    if (!IsImplication(terms, constraint.rhs, &head)) {
      return Reject(SolveStatus::kUnsupported, "constraint " + constraint.name + " is neither a packing nor an implication row");
    }
    ++head_rows[head];
    for (const auto& [var, coef] : terms) {
      if (var == head) continue;
      premises_of[head].push_back(var);
      ++premise_uses[var];
    }
  }

  Analysis analysis;
  Structure& s = analysis.structure;

  std::vector<std::size_t> decision_slot(n, n);
  std::vector<std::size_t> head_slot(n, n);
  for (std::size_t i = 0; i < n; ++i) {
    if (head_rows[i] == 0) {
      decision_slot[i] = s.decision_vars.size();
      s.decision_vars.push_back(i);
      s.decision_objective.push_back(program.Objective(i));
      continue;
    }
    if (head_rows[i] > 1 || premise_uses[i] > 0 || packing_uses[i] > 0) {
      return Reject(SolveStatus::kUnsupported, "implied variable " + program.VariableName(i) + " appears in more than its own implication row");
    }
    head_slot[i] = s.head_vars.size();
    s.head_vars.push_back(i);
    s.head_objective.push_back(program.Objective(i));
  }

  const std::size_t decisions = s.decision_vars.size();
  s.decision_rows.resize(decisions);
  s.decision_heads.resize(decisions);

  for (std::size_t h = 0; h < n; ++h) {
    if (head_slot[h] == n) continue;
    for (std::size_t premise : premises_of[h]) {
      s.decision_heads[decision_slot[premise]].push_back(head_slot[h]);
    }
  }

  for (std::size_t r = 0; r < packing.size(); ++r) {
    s.row_rhs.push_back(packing[r].rhs);
    s.row_weights.emplace_back(decisions, 0.0);
    for (const auto& [var, coef] : packing[r].terms) {
      const std::size_t d = decision_slot[var];
      s.row_weights[r][d] = coef;
      s.decision_rows[d].emplace_back(r, coef);
    }
  }

  return analysis;
}

// ----------------------------------------------------------------------------
// Search
// ----------------------------------------------------------------------------

class Search {
 public:
  Search(const Structure& structure, const SolveLimits& limits)
      : s_(structure),
        limits_(limits),
        chosen_(structure.decision_vars.size(), 0),
        head_hits_(structure.head_vars.size(), 0),
        residual_(structure.row_rhs),
        best_(structure.decision_vars.size(), 0) {
    order_.resize(s_.decision_vars.size());
    std::vector<double> root_gain(order_.size());
    for (std::size_t d = 0; d < order_.size(); ++d) {
      order_[d]    = d;
      root_gain[d] = Gain(d);
    }
    std::sort(order_.begin(), order_.end(), [&](std::size_t a, std::size_t b) {
      if (root_gain[a] != root_gain[b]) return root_gain[a] > root_gain[b];
      return a < b;
    });
  }

  void Seed(const std::vector<std::uint8_t>& program_values) {
    std::vector<std::size_t> picked;
    bool                     feasible = true;
    for (std::size_t d = 0; d < s_.decision_vars.size(); ++d) {
      if (!program_values[s_.decision_vars[d]]) continue;
      if (!Fits(d)) {
        feasible = false;
        break;
      }
      Select(d);
      picked.push_back(d);
    }
    if (feasible) Record();
    for (auto it = picked.rbegin(); it != picked.rend(); ++it) Deselect(*it);
  }

  // False when stopped by the deadline or the cancel flag.
  bool Run() {
    if (LimitReached()) return false;
    Explore(0);
    return !stopped_;
  }

  std::vector<std::uint8_t> BestValues(std::size_t variable_count) const {
    std::vector<std::uint8_t> values(variable_count, 0);
    std::vector<std::uint32_t> hits(s_.head_vars.size(), 0);
    for (std::size_t d = 0; d < best_.size(); ++d) {
      if (!best_[d]) continue;
      values[s_.decision_vars[d]] = 1;
      for (std::size_t h : s_.decision_heads[d]) ++hits[h];
    }
    for (std::size_t h = 0; h < hits.size(); ++h) {
      if (hits[h] > 0) values[s_.head_vars[h]] = 1;
    }
    return values;
  }

  std::uint64_t Nodes() const {
    return nodes_;
  }

 private:
  double Gain(std::size_t d) const {
    double gain = s_.decision_objective[d];
    for (std::size_t h : s_.decision_heads[d]) {
      if (head_hits_[h] == 0) gain += s_.head_objective[h];
    }
    return gain;
  }

  bool Fits(std::size_t d) const {
    for (const auto& [row, coef] : s_.decision_rows[d]) {
      if (coef > residual_[row] + kEpsilon) return false;
    }
    return true;
  }

  void Select(std::size_t d) {
    chosen_[d] = 1;
    value_ += s_.decision_objective[d];
    for (std::size_t h : s_.decision_heads[d]) {
      if (head_hits_[h]++ == 0) value_ += s_.head_objective[h];
    }
    for (const auto& [row, coef] : s_.decision_rows[d]) residual_[row] -= coef;
  }

  void Deselect(std::size_t d) {
    chosen_[d] = 0;
    value_ -= s_.decision_objective[d];
    for (std::size_t h : s_.decision_heads[d]) {
      if (--head_hits_[h] == 0) value_ -= s_.head_objective[h];
    }
    for (const auto& [row, coef] : s_.decision_rows[d]) residual_[row] += coef;
  }

  void Record() {
    if (value_ > best_value_ + kEpsilon) {
      best_value_ = value_;
      best_       = chosen_;
    }
  }

  bool LimitReached() const {
    if (limits_.cancelled != nullptr && limits_.cancelled->load(std::memory_order_relaxed)) return true;
    return std::chrono::steady_clock::now() >= limits_.deadline;
  }

  // Current objective plus an optimistic completion over order_[depth..].
  double Bound(std::size_t depth) {
    free_.clear();
    double total = 0.0;
    for (std::size_t i = depth; i < order_.size(); ++i) {
      const std::size_t d = order_[i];
      const double      g = Gain(d);
      if (g <= kEpsilon) continue;
      free_.emplace_back(d, g);
      total += g;
    }
    if (free_.empty()) return value_;

    double bound = value_ + total;
    for (std::size_t r = 0; r < s_.row_rhs.size(); ++r) {
      const auto& weights = s_.row_weights[r];
      double      capacity = residual_[r];
      double      unconstrained = 0.0;

      items_.clear();
      for (const auto& [d, g] : free_) {
        const double w = weights[d];
        if (w <= kEpsilon) {
          unconstrained += g;
        } else if (w <= capacity + kEpsilon) {
          items_.emplace_back(g, w);
        }
      }
      std::sort(items_.begin(), items_.end(), [](const auto& a, const auto& b) { return a.first * b.second > b.first * a.second; });

      double packed = 0.0;
      for (const auto& [g, w] : items_) {
        if (w <= capacity + kEpsilon) {
          packed += g;
          capacity -= w;
        } else {
          packed += g * (capacity / w);
          break;
        }
      }
      bound = std::min(bound, value_ + unconstrained + packed);
    }
    return bound;
  }

  void Explore(std::size_t depth) {
    ++nodes_;
    if (nodes_ % kLimitCheckInterval == 0 && LimitReached()) stopped_ = true;
    if (stopped_) return;

    Record();
    if (depth == order_.size()) return;
    if (Bound(depth) <= best_value_ + kEpsilon) return;

    const std::size_t d = order_[depth];
    if (Gain(d) > kEpsilon && Fits(d)) {
      Select(d);
      Explore(depth + 1);
      Deselect(d);
      if (stopped_) return;
    }
    Explore(depth + 1);
  }

  const Structure&   s_;
  const SolveLimits& limits_;

  std::vector<std::size_t>   order_;
  std::vector<std::uint8_t>  chosen_;
  std::vector<std::uint32_t> head_hits_;
  std::vector<double>        residual_;
  double                     value_{0.0};

  std::vector<std::uint8_t> best_;
  double                    best_value_{0.0};

  std::uint64_t nodes_{0};
  bool          stopped_{false};

  std::vector<std::pair<std::size_t, double>> free_;
  std::vector<std::pair<double, double>>      items_;
};

} // namespace

SolveOutcome BranchAndBoundBackend::Solve(const BinaryProgram& program, const SolveLimits& limits) {
  SolveOutcome outcome;

  Analysis analysis = Analyze(program);
  if (analysis.status != SolveStatus::kOptimal) {
    outcome.status = analysis.status;
    outcome.detail = std::move(analysis.detail);
    return outcome;
  }

  Search search(analysis.structure, limits);
  if (limits.warm_start != nullptr && limits.warm_start->size() == program.VariableCount()) {
    search.Seed(*limits.warm_start);
  }

  const bool finished = search.Run();

  outcome.values         = search.BestValues(program.VariableCount());
  outcome.objective      = program.Evaluate(outcome.values);
  outcome.nodes_explored = search.Nodes();
  if (finished) {
    outcome.status = SolveStatus::kOptimal;
  } else {
    outcome.status = SolveStatus::kTimeLimit;
    outcome.detail = "search stopped after " + std::to_string(search.Nodes()) + " nodes";
  }
  return outcome;
}

} // namespace trustnet::solver
