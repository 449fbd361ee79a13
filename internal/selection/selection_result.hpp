#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/types.hpp"

namespace trustnet::selection {

enum class Provenance {
  kExact,
  kApproximate,
  // Exact method requested but the backend gave up; the ids come from the approximate method.
  kApproximateFallback,
};

std::string_view ProvenanceName(Provenance provenance);

/*
  Output of one selection method. Immutable once returned by a solver.
*/
struct SelectionResult {
  std::string                method;
  std::vector<model::NodeId> selected;

  // Coverage count or total value, rounded by RoundObjective.
  double objective{0.0};

  // Sentinel count or maintenance minutes.
  double budget_used{0.0};

  Provenance  provenance{Provenance::kApproximate};
  std::string fallback_reason;
  double      runtime_sec{0.0};

  bool IsFallback() const {
    return provenance == Provenance::kApproximateFallback;
  }
};

// Fixed 1e-6 grid for reported objective values.
double RoundObjective(double value);

SelectionResult MarkFallback(SelectionResult approximate, std::string method, std::string reason);

} // namespace trustnet::selection
