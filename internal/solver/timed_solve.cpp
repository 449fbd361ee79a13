#include "timed_solve.hpp"

#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"

namespace trustnet::solver {

namespace {

// Wait past the deadline before cancelling, and again for the worker to stop.
constexpr std::chrono::milliseconds kCancelGrace{250};

struct SolveJob {
  explicit SolveJob(const BinaryProgram& p) : program(p) {
  }

  BinaryProgram                            program;
  std::optional<std::vector<std::uint8_t>> warm_start;
  std::atomic<bool>                        cancelled{false};
  SolveLimits                              limits;
};

SolveOutcome Status(SolveStatus status, std::string detail) {
  SolveOutcome outcome;
  outcome.status = status;
  outcome.detail = std::move(detail);
  return outcome;
}

} // namespace

SolveOutcome TimedSolve(const IntegerProgramBackendPtr& backend,
                        const BinaryProgram& program,
                        std::chrono::milliseconds time_limit,
                        const std::vector<std::uint8_t>* warm_start) {
  if (!backend) {
    return Status(SolveStatus::kUnavailable, "no integer-programming backend configured");
  }
  if (time_limit <= std::chrono::milliseconds::zero()) {
    return Status(SolveStatus::kTimeLimit, "time limit is zero");
  }

  auto job = std::make_shared<SolveJob>(program);
  if (warm_start != nullptr) job->warm_start = *warm_start;
  job->limits.deadline   = std::chrono::steady_clock::now() + time_limit;
  job->limits.cancelled  = &job->cancelled;
  job->limits.warm_start = job->warm_start ? &*job->warm_start : nullptr;

  std::promise<SolveOutcome> promise;
  auto                       future = promise.get_future();

  std::thread worker([backend, job, promise = std::move(promise)]() mutable {
    try {
      promise.set_value(backend->Solve(job->program, job->limits));
    } catch (...) {
      promise.set_exception(std::current_exception());
    }
  });

  if (future.wait_for(time_limit + kCancelGrace) != std::future_status::ready) {
    job->cancelled.store(true);
    if (future.wait_for(kCancelGrace) == std::future_status::ready) {
      worker.join();
    } else {
      TRUSTNET_LOG_WARN("Solver backend ignored cancellation, abandoning its worker thread",
                        {observability::StringField("backend", backend->Name()), observability::IntField("time_limit_ms", time_limit.count())});
      worker.detach();
    }
    return Status(SolveStatus::kTimeLimit, std::string(backend->Name()) + " did not finish within " + std::to_string(time_limit.count()) + " ms");
  }
  worker.join();

  try {
    return future.get();
  } catch (const std::exception& e) {
    return Status(SolveStatus::kError, e.what());
  }
}

} // namespace trustnet::solver
