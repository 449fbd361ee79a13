#include "pipeline.hpp"

#include <cstdint>
#include <future>
#include <utility>

#include "internal/ingest/csv_reader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace trustnet::runtime {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

Pipeline::Pipeline(trustnet::runtime::config::RuntimeConfig config, factory::Application app)
    : config_(std::move(config)),
      app_(std::move(app)) {
}

std::shared_ptr<const model::NetworkModel> Pipeline::LoadNetwork(builder::IngestReport* report) const {
  const auto& input = config_.input();
  if (input.records_path().empty()) {
    throw util::ConfigurationError("input.records_path is required");
  }

  builder::NetworkBuilder network_builder(input);
  network_builder.AddAll(ingest::ReadEndorsements(input.records_path(), input.records_have_header()));

  if (!input.identities_path().empty()) {
    try {
      network_builder.AddIdentities(ingest::ReadIdentities(input.identities_path()));
    } catch (const util::InputError& e) {
      TRUSTNET_LOG_WARN("Identity source unreadable, continuing without display metadata", {StringField("error", e.what())});
    }
  }

  auto network = network_builder.Build();
  if (report != nullptr) *report = network_builder.Report();
  return network;
}

PipelineResult Pipeline::Optimize(std::shared_ptr<const model::NetworkModel> network) const {
  PipelineResult result;
  result.network = std::move(network);
  const auto& snapshot = *result.network;

  if (config_.parallel_selection()) {
    auto sentinels   = std::async(std::launch::async, [&] { return app_.sentinel_selector->Select(snapshot); });
    auto maintenance = std::async(std::launch::async, [&] { return app_.maintenance_selector->Select(snapshot); });
    result.sentinels   = sentinels.get();
    result.maintenance = maintenance.get();
  } else {
    result.sentinels   = app_.sentinel_selector->Select(snapshot);
    result.maintenance = app_.maintenance_selector->Select(snapshot);
  }

  result.roles.Assign(app_.exporter->GroupSentinels(result.sentinels).selected, result.maintenance.exact.selected);
  result.documents = app_.exporter->Render(snapshot, result.sentinels, result.maintenance, result.roles);
  return result;
}

PipelineResult Pipeline::Run() const {
  const auto started = util::SteadyClock::now();

  builder::IngestReport report;
  auto                  network = LoadNetwork(&report);

  PipelineResult result = Optimize(std::move(network));
  result.ingest         = report;

  app_.exporter->Write(result.documents);

  const auto& sentinels   = result.sentinels;
  const auto& maintenance = result.maintenance.exact;
  TRUSTNET_LOG_INFO("Run summary",
                    {IntField("nodes", static_cast<std::int64_t>(result.network->NodeCount())),
                     IntField("edges", static_cast<std::int64_t>(result.network->EdgeCount())),
                     IntField("skipped_records", static_cast<std::int64_t>(report.Skipped())),
                     DoubleField("ip_coverage", sentinels.exact.objective), DoubleField("ip_runtime_sec", sentinels.exact.runtime_sec),
                     DoubleField("greedy_coverage", sentinels.greedy.objective),
                     DoubleField("greedy_runtime_sec", sentinels.greedy.runtime_sec),
                     DoubleField("naive_coverage", sentinels.naive.objective),
                     IntField("maintenance_selected", static_cast<std::int64_t>(maintenance.selected.size())),
                     DoubleField("maintenance_value", maintenance.objective), DoubleField("maintenance_budget_used", maintenance.budget_used),
                     IntField("role_sentinel_maintenance", static_cast<std::int64_t>(result.roles.Count(selection::Role::kSentinelMaintenance))),
                     DoubleField("runtime_sec", util::SecondsSince(started))});
  return result;
}

} // namespace trustnet::runtime
