#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

#include "internal/model/types.hpp"
#include "internal/selection/selection_result.hpp"
#include "internal/solver/ip_backend.hpp"

namespace trustnet::selection {

struct KnapsackItem {
  model::NodeId id{0};
  double        value{0.0};
  double        cost{0.0};
};

struct KnapsackInstance {
  std::vector<KnapsackItem> items;
  double                    budget{0.0};
};

class KnapsackSolver {
 public:
  virtual ~KnapsackSolver() = default;

  virtual SelectionResult Solve(const KnapsackInstance& instance) const = 0;
};

/*
  Ratio greedy: items sorted by value/cost desc, then value desc, then id asc,
  accepted while they fit. Followed by at most `max_swap_rounds` rounds of the
  best single add or 1-for-1 swap, and finally compared with the best single
  item. Ids are reported in ratio order.
*/
class RatioGreedyKnapsackSolver final : public KnapsackSolver {
 public:
  explicit RatioGreedyKnapsackSolver(std::uint32_t max_swap_rounds);

  SelectionResult Solve(const KnapsackInstance& instance) const override;

 private:
  std::uint32_t max_swap_rounds_;
};

/*
  0/1 knapsack program (max sum v_i x_i, sum c_i x_i <= T) warm-started from
  the ratio greedy result, which it also falls back to. Ids ascend.
*/
class ExactKnapsackSolver final : public KnapsackSolver {
 public:
  ExactKnapsackSolver(solver::IntegerProgramBackendPtr backend, std::chrono::milliseconds time_limit, std::uint32_t max_swap_rounds);

  SelectionResult Solve(const KnapsackInstance& instance) const override;

 private:
  solver::IntegerProgramBackendPtr backend_;
  std::chrono::milliseconds        time_limit_;
  std::uint32_t                    max_swap_rounds_;
};

} // namespace trustnet::selection
