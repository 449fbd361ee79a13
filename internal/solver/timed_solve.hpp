#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

#include "internal/solver/ip_backend.hpp"

namespace trustnet::solver {

/*
  Runs one backend call under a wall-clock limit.

    backend == nullptr  -> kUnavailable
    time_limit <= 0     -> kTimeLimit, the backend is not called
    limit expires       -> cancel flag raised, kTimeLimit returned at once
    backend throws      -> kError carrying the exception message

  The call runs on a worker thread that shares ownership of the backend and
  of a copy of the program. The worker is joined before returning, including
  after a cancellation the backend honours within the grace period. A backend
  that keeps running past that is logged and its worker detached; it winds
  down on its own and touches nothing of the caller's. There is no retry.
*/
SolveOutcome TimedSolve(const IntegerProgramBackendPtr& backend,
                        const BinaryProgram& program,
                        std::chrono::milliseconds time_limit,
                        const std::vector<std::uint8_t>* warm_start = nullptr);

} // namespace trustnet::solver
