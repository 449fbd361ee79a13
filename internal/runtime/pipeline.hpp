#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/builder/network_builder.hpp"
#include "internal/export/result_exporter.hpp"
#include "internal/factory.hpp"
#include "internal/model/network_model.hpp"
#include "internal/selection/maintenance_selector.hpp"
#include "internal/selection/role_map.hpp"
#include "internal/selection/sentinel_selector.hpp"

namespace trustnet::runtime {

struct PipelineResult {
  std::shared_ptr<const model::NetworkModel> network;
  builder::IngestReport                      ingest;

  selection::SentinelSelection    sentinels;
  selection::MaintenanceSelection maintenance;
  selection::RoleMap              roles;

  exporter::ExportDocuments documents;
};

/*
  Single-pass batch run:

    input files -> NetworkBuilder -> NetworkModel
                -> { SentinelSelector, MaintenanceSelector }
                -> RoleMap -> ResultExporter

  The two selectors read the same immutable snapshot and run concurrently
  when parallel_selection is set; results are the same either way.
*/
class Pipeline {
 public:
  Pipeline(trustnet::runtime::config::RuntimeConfig config, factory::Application app);

  // Reads the records file (required) and the identity file (optional).
  std::shared_ptr<const model::NetworkModel> LoadNetwork(builder::IngestReport* report) const;

  // Selection, role assignment and rendering. Writes nothing.
  PipelineResult Optimize(std::shared_ptr<const model::NetworkModel> network) const;

  // LoadNetwork + Optimize + export + run summary.
  PipelineResult Run() const;

 private:
  trustnet::runtime::config::RuntimeConfig config_;
  factory::Application                     app_;
};

} // namespace trustnet::runtime
