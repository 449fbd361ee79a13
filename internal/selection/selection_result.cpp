#include "selection_result.hpp"

#include <cmath>
#include <utility>

namespace trustnet::selection {

std::string_view ProvenanceName(Provenance provenance) {
  switch (provenance) {
    case Provenance::kExact:
      return "exact";
    case Provenance::kApproximate:
      return "approximate";
    case Provenance::kApproximateFallback:
      return "approximate_fallback";
  }
  return "approximate";
}

double RoundObjective(double value) {
  return std::round(value * 1e6) / 1e6;
}

SelectionResult MarkFallback(SelectionResult approximate, std::string method, std::string reason) {
  approximate.method          = std::move(method);
  approximate.provenance      = Provenance::kApproximateFallback;
  approximate.fallback_reason = std::move(reason);
  return approximate;
}

} // namespace trustnet::selection
