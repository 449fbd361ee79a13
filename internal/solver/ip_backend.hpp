#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/solver/binary_program.hpp"

namespace trustnet::solver {

enum class SolveStatus {
  kOptimal,
  kInfeasible,
  kTimeLimit,
  kUnsupported,
  kUnavailable,
  kError,
};

std::string_view SolveStatusName(SolveStatus status);

struct SolveLimits {
  std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::time_point::max()};

  // Set by the caller to stop a running search early.
  const std::atomic<bool>* cancelled{nullptr};

  // Optional MIP start, one entry per program variable.
  const std::vector<std::uint8_t>* warm_start{nullptr};
};

struct SolveOutcome {
  SolveStatus status{SolveStatus::kError};

  // One entry per program variable. Filled for kOptimal; may hold the best
  // incumbent for kTimeLimit.
  std::vector<std::uint8_t> values;
  double                    objective{0.0};

  std::uint64_t nodes_explored{0};
  std::string   detail;

  bool Optimal() const {
    return status == SolveStatus::kOptimal;
  }
};

/*
  Integer-programming backend abstraction.

  The selectors only ever talk to this interface. A backend must honour
  SolveLimits cooperatively and report problems through SolveStatus; callers
  treat anything but kOptimal as "use the approximate result".
*/
class IntegerProgramBackend {
 public:
  virtual ~IntegerProgramBackend() = default;

  virtual std::string_view Name() const = 0;

  virtual SolveOutcome Solve(const BinaryProgram& program, const SolveLimits& limits) = 0;
};

using IntegerProgramBackendPtr = std::shared_ptr<IntegerProgramBackend>;

} // namespace trustnet::solver
