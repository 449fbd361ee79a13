#include "backend_factory.hpp"

#include <memory>
#include <string>

#include "internal/config/config_defaults.hpp"
#include "internal/solver/branch_and_bound_backend.hpp"
#include "internal/util/errors.hpp"

namespace trustnet::solver {

IntegerProgramBackendPtr BackendFactory::Build(const trustnet::runtime::config::SolverConfig& cfg) {
  using namespace trustnet::runtime::config;

  switch (config::Backend(cfg)) {
    case SOLVER_BACKEND_BRANCH_AND_BOUND:
      return std::make_shared<BranchAndBoundBackend>();
    case SOLVER_BACKEND_NONE:
      return nullptr;
    default:
      throw util::ConfigurationError("unknown solver backend " + std::to_string(static_cast<int>(cfg.backend())));
  }
}

} // namespace trustnet::solver
