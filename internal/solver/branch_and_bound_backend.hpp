#pragma once

#include <string_view>

#include "internal/solver/ip_backend.hpp"

namespace trustnet::solver {

/*
  Depth-first branch and bound for 0/1 maximization programs of the shape
  produced by the selectors:

    objective   every coefficient >= 0
    packing     sum(a_i * x_i) <= b        with a_i >= 0
    implication y - sum(x_i) <= 0          y appears in no other row

  Implied variables are never branched on; they switch on as soon as one of
  their premises is selected. The bound at each node is the current objective
  plus the tightest fractional-knapsack relaxation of the remaining gains over
  the packing rows.

  Anything outside this shape is reported as kUnsupported. The search checks
  SolveLimits every few hundred nodes and returns kTimeLimit with the best
  incumbent found so far when it is stopped.
*/
class BranchAndBoundBackend final : public IntegerProgramBackend {
 public:
  std::string_view Name() const override {
    return "branch_and_bound";
  }

  SolveOutcome Solve(const BinaryProgram& program, const SolveLimits& limits) override;
};

} // namespace trustnet::solver
