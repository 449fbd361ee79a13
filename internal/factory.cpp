#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/config/config_validation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/solver/backend_factory.hpp"

namespace trustnet::factory {

/*
    Build full application dependency graph
*/
Application Build(const trustnet::runtime::config::RuntimeConfig& config) {
  trustnet::config::ValidateConfig(config);

  Application app;

  // ------------------------------------------------------------------
  // Integer-programming backend
  // ------------------------------------------------------------------
  app.backend = solver::BackendFactory::Build(config.solver());
  if (app.backend) {
    TRUSTNET_LOG_INFO("Exact solver enabled", {observability::StringField("backend", app.backend->Name())});
  } else {
    TRUSTNET_LOG_WARN("No exact solver configured, exact selections will fall back to approximate methods");
  }

  // ------------------------------------------------------------------
  // Selectors
  // ------------------------------------------------------------------
  app.sentinel_selector    = std::make_shared<selection::SentinelSelector>(config.sentinel(), config.solver(), app.backend);
  app.maintenance_selector = std::make_shared<selection::MaintenanceSelector>(config.maintenance(), config.solver(), app.backend);

  // ------------------------------------------------------------------
  // Export
  // ------------------------------------------------------------------
  app.exporter = std::make_shared<exporter::ResultExporter>(config.output());

  return app;
}

} // namespace trustnet::factory
