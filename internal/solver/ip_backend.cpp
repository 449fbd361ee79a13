#include "ip_backend.hpp"

namespace trustnet::solver {

std::string_view SolveStatusName(SolveStatus status) {
  switch (status) {
    case SolveStatus::kOptimal:
      return "optimal";
    case SolveStatus::kInfeasible:
      return "infeasible";
    case SolveStatus::kTimeLimit:
      return "time_limit";
    case SolveStatus::kUnsupported:
      return "unsupported";
    case SolveStatus::kUnavailable:
      return "unavailable";
    case SolveStatus::kError:
      return "error";
  }
  return "error";
}

} // namespace trustnet::solver
