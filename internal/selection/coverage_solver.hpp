#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "internal/model/network_model.hpp"
#include "internal/selection/selection_result.hpp"
#include "internal/solver/ip_backend.hpp"

namespace trustnet::selection {

struct CoverageCandidate {
  model::NodeId      id{0};
  std::uint32_t      degree{0};
  model::CoverageSet coverage;
};

/*
  Maximum Coverage instance.

  Candidates are kept in ascending id order; talents are re-indexed densely so
  the solvers work on small integer sets.
*/
class CoverageInstance {
 public:
  CoverageInstance(std::vector<CoverageCandidate> candidates, std::size_t budget);

  // Every node with a non-empty coverage set at `threshold`.
  static CoverageInstance FromNetwork(const model::NetworkModel& network, double threshold, std::size_t budget);

  std::size_t Budget() const {
    return budget_;
  }

  const std::vector<CoverageCandidate>& Candidates() const {
    return candidates_;
  }

  std::size_t TalentCount() const {
    return talents_.size();
  }

  model::NodeId TalentId(std::size_t talent) const {
    return talents_[talent];
  }

  // Dense talent indices covered by candidate `index`.
  const std::vector<std::uint32_t>& Covers(std::size_t index) const {
    return covers_[index];
  }

  // Size of the union of the coverage sets of `ids`. Unknown ids cover nothing.
  std::size_t UnionCoverage(const std::vector<model::NodeId>& ids) const;

 private:
  std::vector<CoverageCandidate>          candidates_;
  std::size_t                             budget_;
  std::vector<model::NodeId>              talents_;
  std::vector<std::vector<std::uint32_t>> covers_;
};

class CoverageSolver {
 public:
  virtual ~CoverageSolver() = default;

  virtual SelectionResult Solve(const CoverageInstance& instance) const = 0;
};

/*
  Maximal marginal gain. Ties go to the lowest id; stops at the budget or when
  no candidate adds coverage. Ids are reported in pick order.
*/
class GreedyCoverageSolver final : public CoverageSolver {
 public:
  SelectionResult Solve(const CoverageInstance& instance) const override;
};

// Top-K by degree, ties to the lowest id. Comparison baseline only.
class NaiveDegreeSolver final : public CoverageSolver {
 public:
  SelectionResult Solve(const CoverageInstance& instance) const override;
};

/*
  Integer program:

    max  sum_t y_t
    s.t. sum_i x_i <= K
         y_t - sum_{i covers t} x_i <= 0

  warm-started from the greedy solution. Any non-optimal solve returns the
  greedy ids marked as a fallback. Ids are reported ascending.
*/
class ExactCoverageSolver final : public CoverageSolver {
 public:
  ExactCoverageSolver(solver::IntegerProgramBackendPtr backend, std::chrono::milliseconds time_limit);

  SelectionResult Solve(const CoverageInstance& instance) const override;

 private:
  solver::IntegerProgramBackendPtr backend_;
  std::chrono::milliseconds        time_limit_;
};

} // namespace trustnet::selection
