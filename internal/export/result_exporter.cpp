#include "result_exporter.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/type_resolver.h>
#include <google/protobuf/util/type_resolver_util.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/config/config_defaults.hpp"
#include "internal/export/artifact_writer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace trustnet::exporter {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;
using namespace trustnet::runtime::config;

namespace {

constexpr std::string_view kTypeUrlPrefix = "type.googleapis.com";

// ----------------------------------------------------------------------------
// google.protobuf.Value builders
// ----------------------------------------------------------------------------

Value Number(double number) {
  Value out;
  out.set_number_value(number);
  return out;
}

Value Text(std::string_view text) {
  Value out;
  out.set_string_value(std::string(text));
  return out;
}

Value IdList(const std::vector<model::NodeId>& ids) {
  Value out;
  auto* list = out.mutable_list_value();
  for (model::NodeId id : ids) *list->add_values() = Number(static_cast<double>(id));
  return out;
}

Value ObjectValue(Struct object) {
  Value out;
  *out.mutable_struct_value() = std::move(object);
  return out;
}

void Set(Struct* object, const std::string& key, Value value) {
  (*object->mutable_fields())[key] = std::move(value);
}

Value Metadata(const model::IdentityMetadata& identity) {
  Struct object;
  Set(&object, "name", Text(identity.name));
  Set(&object, "job", Text(identity.job));
  Set(&object, "email", Text(identity.email));
  Set(&object, "phone", Text(identity.phone));
  return ObjectValue(std::move(object));
}

/*
  Protobuf JSON with map keys in sorted order: the Value is serialized
  deterministically and converted through the type resolver.
*/
std::string ToJson(const Value& document, bool pretty) {
  std::string binary;
  {
    google::protobuf::io::StringOutputStream stream(&binary);
    google::protobuf::io::CodedOutputStream  coded(&stream);
    coded.SetSerializationDeterministic(true);
    if (!document.SerializeToCodedStream(&coded)) {
      throw util::ExportError("failed to serialize export document");
    }
  }

  std::unique_ptr<google::protobuf::util::TypeResolver> resolver(
      google::protobuf::util::NewTypeResolverForDescriptorPool(std::string(kTypeUrlPrefix), google::protobuf::DescriptorPool::generated_pool()));

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = pretty;

  std::string json;
  const auto  status = google::protobuf::util::BinaryToJsonString(
      resolver.get(), std::string(kTypeUrlPrefix) + "/" + Value::descriptor()->full_name(), binary, &json, options);
  if (!status.ok()) {
    throw util::ExportError("failed to encode export document: " + status.ToString());
  }
  return json;
}

Value MethodBlock(const selection::SelectionResult& result) {
  Struct block;
  Set(&block, "sentinels", IdList(result.selected));
  Set(&block, "coverage", Number(result.objective));
  Set(&block, "runtime_sec", Number(selection::RoundObjective(result.runtime_sec)));
  Set(&block, "provenance", Text(selection::ProvenanceName(result.provenance)));
  if (result.IsFallback()) Set(&block, "fallback_reason", Text(result.fallback_reason));
  return ObjectValue(std::move(block));
}

double Percent(double part, double whole) {
  return whole > 0.0 ? selection::RoundObjective(part / whole * 100.0) : 0.0;
}

std::string_view GroupName(selection::Role role, SentinelSource source) {
  switch (role) {
    case selection::Role::kSentinelMaintenance:
      return "sentinel_maintenance";
    case selection::Role::kSentinel:
      return source == SENTINEL_SOURCE_GREEDY ? "sentinel_greedy" : "sentinel_ip";
    case selection::Role::kMaintenance:
      return "maintenance";
    case selection::Role::kNone:
      break;
  }
  return {};
}

} // namespace

ResultExporter::ResultExporter(OutputConfig config) : config_(std::move(config)) {
}

const selection::SelectionResult& ResultExporter::GroupSentinels(const selection::SentinelSelection& sentinels) const {
  return config::GroupSource(config_) == SENTINEL_SOURCE_GREEDY ? sentinels.greedy : sentinels.exact;
}

std::set<model::NodeId> ResultExporter::ExportedNodes(const model::NetworkModel& network,
                                                      const selection::SentinelSelection& sentinels,
                                                      const selection::MaintenanceSelection& maintenance) const {
  const auto& all = network.AllNodeIds();
  if (config::Scope(config_) == GRAPH_SCOPE_FULL) {
    return std::set<model::NodeId>(all.begin(), all.end());
  }

  std::set<model::NodeId> nodes;
  for (const auto* result : {&sentinels.exact, &sentinels.greedy, &sentinels.naive, &maintenance.exact, &maintenance.approximate}) {
    nodes.insert(result->selected.begin(), result->selected.end());
  }

  std::vector<model::NodeId> by_score(all.begin(), all.end());
  std::stable_sort(by_score.begin(), by_score.end(), [&](model::NodeId a, model::NodeId b) { return network.Score(a) > network.Score(b); });

  const std::size_t top       = std::min<std::size_t>(config::FocusTopTalent(config_), by_score.size());
  const std::size_t neighbors = config::FocusNeighborLimit(config_);
  for (std::size_t i = 0; i < top; ++i) {
    nodes.insert(by_score[i]);
    const auto adjacent = network.Neighbors(by_score[i]);
    for (std::size_t j = 0; j < adjacent.size() && j < neighbors; ++j) nodes.insert(adjacent[j]);
  }
  return nodes;
}

ExportDocuments ResultExporter::Render(const model::NetworkModel& network,
                                       const selection::SentinelSelection& sentinels,
                                       const selection::MaintenanceSelection& maintenance,
                                       const selection::RoleMap& roles) const {
  const bool pretty = config_.pretty();
  ExportDocuments documents;

  // ------------------------------------------------------------------
  // graph_viz.json
  // ------------------------------------------------------------------
  {
    const auto           exported = ExportedNodes(network, sentinels, maintenance);
    const SentinelSource source   = config::GroupSource(config_);

    Value nodes;
    auto* node_list = nodes.mutable_list_value();
    for (model::NodeId id : exported) {
      const auto& node = network.GetNode(id);
      Struct      entry;
      Set(&entry, "id", Number(static_cast<double>(id)));
      const auto group = GroupName(roles.Get(id), source);
      if (!group.empty()) Set(&entry, "group", Text(group));
      Set(&entry, "val", Number(selection::RoundObjective(node.score)));
      Set(&entry, "degree", Number(static_cast<double>(node.degree)));
      if (node.identity) Set(&entry, "metadata", Metadata(*node.identity));
      *node_list->add_values() = ObjectValue(std::move(entry));
    }

    std::set<std::pair<model::NodeId, model::NodeId>> pairs;
    for (const auto& edge : network.Edges()) {
      if (exported.count(edge.source) && exported.count(edge.target)) pairs.emplace(edge.source, edge.target);
    }

    Value links;
    auto* link_list = links.mutable_list_value();
    for (const auto& [source_id, target_id] : pairs) {
      Struct link;
      Set(&link, "source", Number(static_cast<double>(source_id)));
      Set(&link, "target", Number(static_cast<double>(target_id)));
      *link_list->add_values() = ObjectValue(std::move(link));
    }

    Struct graph;
    Set(&graph, "nodes", std::move(nodes));
    Set(&graph, "links", std::move(links));
    documents.graph_viz = ToJson(ObjectValue(std::move(graph)), pretty);
  }

  // ------------------------------------------------------------------
  // sentinel_results.json
  // ------------------------------------------------------------------
  {
    const double exact  = sentinels.exact.objective;
    const double greedy = sentinels.greedy.objective;
    const double naive  = sentinels.naive.objective;

    Struct comparison;
    Set(&comparison, "greedy_vs_optimal_pct", Number(Percent(greedy, exact)));
    Set(&comparison, "naive_vs_optimal_pct", Number(Percent(naive, exact)));
    Set(&comparison, "ip_improvement_over_naive_pct", Number(naive > 0.0 ? Percent(exact - naive, naive) : 0.0));
    Set(&comparison, "greedy_speedup_factor",
        Number(sentinels.greedy.runtime_sec > 0.0 ? selection::RoundObjective(sentinels.exact.runtime_sec / sentinels.greedy.runtime_sec) : 0.0));

    Struct results;
    Set(&results, "ip", MethodBlock(sentinels.exact));
    Set(&results, "greedy", MethodBlock(sentinels.greedy));
    Set(&results, "naive", MethodBlock(sentinels.naive));
    Set(&results, "comparison", ObjectValue(std::move(comparison)));
    Set(&results, "candidates", Number(static_cast<double>(sentinels.candidate_count)));
    Set(&results, "talents", Number(static_cast<double>(sentinels.talent_count)));
    documents.sentinel_results = ToJson(ObjectValue(std::move(results)), pretty);
  }

  // ------------------------------------------------------------------
  // maintenance_results.json
  // ------------------------------------------------------------------
  {
    const auto& chosen = maintenance.exact;

    std::vector<const selection::MaintenanceCandidate*> selected;
    for (model::NodeId id : chosen.selected) {
      const auto* candidate = maintenance.Find(id);
      if (candidate == nullptr) {
        throw util::ExportError("maintenance selection references non-candidate node " + std::to_string(id));
      }
      selected.push_back(candidate);
    }

    if (config::Order(config_) == MAINTENANCE_ORDER_VALUE) {
      std::sort(selected.begin(), selected.end(), [](const auto* a, const auto* b) {
        if (a->value != b->value) return a->value > b->value;
        return a->id < b->id;
      });
    } else {
      std::sort(selected.begin(), selected.end(), [](const auto* a, const auto* b) {
        if (a->days_dormant != b->days_dormant) return a->days_dormant > b->days_dormant;
        return a->id < b->id;
      });
    }

    Value        selected_nodes;
    auto*        selected_list = selected_nodes.mutable_list_value();
    std::int64_t total_days    = 0;
    for (const auto* candidate : selected) {
      const auto& node = network.GetNode(candidate->id);
      Struct      entry;
      Set(&entry, "id", Number(static_cast<double>(candidate->id)));
      Set(&entry, "weight", Number(selection::RoundObjective(candidate->cost)));
      Set(&entry, "value", Number(selection::RoundObjective(candidate->value)));
      Set(&entry, "days_dormant", Number(static_cast<double>(candidate->days_dormant)));
      Set(&entry, "degree", Number(static_cast<double>(candidate->degree)));
      Set(&entry, "talent_score", Number(selection::RoundObjective(candidate->score)));
      if (node.identity) Set(&entry, "metadata", Metadata(*node.identity));
      *selected_list->add_values() = ObjectValue(std::move(entry));
      total_days += candidate->days_dormant;
    }

    Struct approximate;
    Set(&approximate, "selected", IdList(maintenance.approximate.selected));
    Set(&approximate, "total_value", Number(maintenance.approximate.objective));
    Set(&approximate, "budget_used", Number(selection::RoundObjective(maintenance.approximate.budget_used)));
    Set(&approximate, "runtime_sec", Number(selection::RoundObjective(maintenance.approximate.runtime_sec)));

    Struct results;
    Set(&results, "selected_nodes", std::move(selected_nodes));
    Set(&results, "total_value", Number(chosen.objective));
    Set(&results, "budget_used", Number(selection::RoundObjective(chosen.budget_used)));
    Set(&results, "num_selected", Number(static_cast<double>(selected.size())));
    Set(&results, "avg_days_dormant",
        Number(selected.empty() ? 0.0 : selection::RoundObjective(static_cast<double>(total_days) / static_cast<double>(selected.size()))));
    Set(&results, "runtime_sec", Number(selection::RoundObjective(chosen.runtime_sec)));
    Set(&results, "provenance", Text(selection::ProvenanceName(chosen.provenance)));
    if (chosen.IsFallback()) Set(&results, "fallback_reason", Text(chosen.fallback_reason));
    Set(&results, "approximate", ObjectValue(std::move(approximate)));
    Set(&results, "candidates", Number(static_cast<double>(maintenance.candidates.size())));
    documents.maintenance_results = ToJson(ObjectValue(std::move(results)), pretty);
  }

  return documents;
}

void ResultExporter::Write(const ExportDocuments& documents) const {
  const auto started = util::SteadyClock::now();

  ArtifactWriter writer(config_.output_dir().empty() ? std::filesystem::path{"."} : std::filesystem::path{config_.output_dir()});
  writer.WriteAll({
      Artifact{kGraphVizFile, documents.graph_viz},
      Artifact{kSentinelResultsFile, documents.sentinel_results},
      Artifact{kMaintenanceResultsFile, documents.maintenance_results},
  });

  TRUSTNET_LOG_INFO("Export complete", {observability::StringField("output_dir", writer.OutputDir().string()),
                                        observability::DoubleField("runtime_sec", util::SecondsSince(started))});
}

} // namespace trustnet::exporter
