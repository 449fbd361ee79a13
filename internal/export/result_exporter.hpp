#pragma once

#include <set>
#include <string>

#include "config/config.pb.h"
#include "internal/model/network_model.hpp"
#include "internal/selection/maintenance_selector.hpp"
#include "internal/selection/role_map.hpp"
#include "internal/selection/sentinel_selector.hpp"

namespace trustnet::exporter {

inline constexpr const char* kGraphVizFile          = "graph_viz.json";
inline constexpr const char* kSentinelResultsFile    = "sentinel_results.json";
inline constexpr const char* kMaintenanceResultsFile = "maintenance_results.json";

struct ExportDocuments {
  std::string graph_viz;
  std::string sentinel_results;
  std::string maintenance_results;
};

/*
  Result Exporter.

  Render() is a pure function of the snapshot, both selections and the role
  map; it performs no selection logic. Write() hands the documents to an
  ArtifactWriter rooted at output.output_dir.

  graph_viz.json
    { nodes: [{ id, group?, val, degree, metadata? }], links: [{ source, target }] }
    group is one of sentinel_ip, maintenance, sentinel_maintenance, or
    sentinel_greedy in place of sentinel_ip when output.sentinel_source is
    GREEDY. Consumers that only know sentinel_ip should keep the default
    EXACT source.
  sentinel_results.json
    { ip|greedy|naive: { sentinels, coverage, runtime_sec, provenance, fallback_reason? }, comparison, ... }
  maintenance_results.json
    { selected_nodes: [{ id, weight, value, days_dormant, degree, talent_score, metadata? }], total_value, ... }

  Object keys are emitted in sorted order.
*/
class ResultExporter {
 public:
  explicit ResultExporter(trustnet::runtime::config::OutputConfig config);

  ExportDocuments Render(const model::NetworkModel& network,
                         const selection::SentinelSelection& sentinels,
                         const selection::MaintenanceSelection& maintenance,
                         const selection::RoleMap& roles) const;

  void Write(const ExportDocuments& documents) const;

  // Sentinel result that drives node groups: exact or greedy per output.sentinel_source.
  const selection::SelectionResult& GroupSentinels(const selection::SentinelSelection& sentinels) const;

  // Node ids present in graph_viz.json for the configured graph scope, ascending.
  std::set<model::NodeId> ExportedNodes(const model::NetworkModel& network,
                                        const selection::SentinelSelection& sentinels,
                                        const selection::MaintenanceSelection& maintenance) const;

 private:
  trustnet::runtime::config::OutputConfig config_;
};

} // namespace trustnet::exporter
