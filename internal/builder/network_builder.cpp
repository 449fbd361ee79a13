#include "network_builder.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "internal/config/config_defaults.hpp"
#include "internal/observability/logging.hpp"

namespace trustnet::builder {

using trustnet::model::Edge;
using trustnet::model::IdentityMetadata;
using trustnet::model::NodeId;
using trustnet::observability::IntField;

namespace {

std::string_view Trim(std::string_view value) {
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t' || value.front() == '\r')) value.remove_prefix(1);
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) value.remove_suffix(1);
  return value;
}

template <typename T>
std::optional<T> ParseInteger(std::string_view text) {
  text = Trim(text);
  if (text.empty()) return std::nullopt;
  if (text.front() == '+') text.remove_prefix(1);

  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
  return value;
}

std::string OrDefault(std::string_view value, std::string_view fallback) {
  value = Trim(value);
  return std::string(value.empty() ? fallback : value);
}

} // namespace

IdentityMetadata IdentityFromRow(const ingest::RawIdentity& row) {
  IdentityMetadata identity;

  const auto first = Trim(row.first_name);
  const auto last  = Trim(row.last_name);
  if (first.empty() && last.empty()) {
    identity.name = "Unknown";
  } else if (last.empty()) {
    identity.name = std::string(first);
  } else if (first.empty()) {
    identity.name = std::string(last);
  } else {
    identity.name = std::string(first) + " " + std::string(last);
  }

  identity.job   = OrDefault(row.job_title, "N/A");
  identity.email = OrDefault(row.email, "N/A");
  identity.phone = OrDefault(row.phone, "N/A");
  return identity;
}

NetworkBuilder::NetworkBuilder(trustnet::runtime::config::InputConfig config)
    : config_(std::move(config)), min_rating_(config::MinRating(config_)), max_rating_(config::MaxRating(config_)) {
}

RecordVerdict NetworkBuilder::Count(RecordVerdict verdict) {
  switch (verdict) {
    case RecordVerdict::kAccepted:
      ++report_.accepted;
      break;
    case RecordVerdict::kMissingField:
      ++report_.missing_field;
      break;
    case RecordVerdict::kBadId:
      ++report_.bad_id;
      break;
    case RecordVerdict::kBadRating:
      ++report_.bad_rating;
      break;
    case RecordVerdict::kBadTimestamp:
      ++report_.bad_timestamp;
      break;
    case RecordVerdict::kSelfEndorsement:
      ++report_.self_endorsement;
      break;
  }
  return verdict;
}

RecordVerdict NetworkBuilder::Add(const ingest::RawEndorsement& record) {
  if (Trim(record.source_id).empty() || Trim(record.target_id).empty() || Trim(record.rating).empty() || Trim(record.timestamp).empty()) {
    return Count(RecordVerdict::kMissingField);
  }

  auto source = ParseInteger<NodeId>(record.source_id);
  auto target = ParseInteger<NodeId>(record.target_id);
  if (!source || !target) {
    return Count(RecordVerdict::kBadId);
  }

  auto rating = ParseInteger<std::int64_t>(record.rating);
  if (!rating) {
    return Count(RecordVerdict::kBadRating);
  }

  auto timestamp = ParseInteger<std::int64_t>(record.timestamp);
  if (!timestamp) {
    return Count(RecordVerdict::kBadTimestamp);
  }

  return AddEndorsement(Edge{*source, *target, static_cast<double>(*rating), *timestamp});
}

RecordVerdict NetworkBuilder::AddEndorsement(const Edge& edge) {
  if (built_) {
    throw std::logic_error("NetworkBuilder::AddEndorsement after Build");
  }
  if (!std::isfinite(edge.weight) || edge.weight < min_rating_ || edge.weight > max_rating_) {
    return Count(RecordVerdict::kBadRating);
  }
  if (edge.timestamp < 0) {
    return Count(RecordVerdict::kBadTimestamp);
  }
  if (edge.source == edge.target) {
    return Count(RecordVerdict::kSelfEndorsement);
  }

  edges_.push_back(edge);
  return Count(RecordVerdict::kAccepted);
}

void NetworkBuilder::AddAll(const ingest::RawTable<ingest::RawEndorsement>& table) {
  report_.structurally_invalid += table.rejected_rows;
  for (const auto& row : table.rows) {
    Add(row);
  }
}

void NetworkBuilder::AddIdentity(NodeId id, IdentityMetadata identity) {
  identities_.insert_or_assign(id, std::move(identity));
}

void NetworkBuilder::AddIdentities(const ingest::RawTable<ingest::RawIdentity>& table) {
  report_.identities_skipped += table.rejected_rows;
  for (const auto& row : table.rows) {
    auto id = ParseInteger<NodeId>(row.index);
    if (!id) {
      ++report_.identities_skipped;
      continue;
    }
    AddIdentity(*id, IdentityFromRow(row));
  }
}

// ------------------------------------------------------------
// Build
// ------------------------------------------------------------

std::shared_ptr<const model::NetworkModel> NetworkBuilder::Build() {
  if (built_) {
    throw std::logic_error("NetworkBuilder::Build called twice");
  }
  built_ = true;

  struct Accumulator {
    double           rating_sum{0.0};
    std::uint32_t    ratings{0};
    std::uint32_t    in_edges{0};
    std::uint32_t    out_edges{0};
    std::int64_t     last_contact{0};
    std::set<NodeId> neighbors;
  };
  std::map<NodeId, Accumulator> nodes;

  std::int64_t latest = 0;
  for (const auto& edge : edges_) {
    auto& source = nodes[edge.source];
    auto& target = nodes[edge.target];

    target.rating_sum += edge.weight;
    ++target.ratings;

    source.neighbors.insert(edge.target);
    target.neighbors.insert(edge.source);

    source.last_contact = std::max(source.last_contact, edge.timestamp);
    target.last_contact = std::max(target.last_contact, edge.timestamp);
    latest              = std::max(latest, edge.timestamp);
  }

  std::vector<Edge> edges;
  if (config::Aggregation(config_) == trustnet::runtime::config::EDGE_AGGREGATION_MERGE_PAIRS) {
    struct PairTotals {
      double        weight_sum{0.0};
      std::uint32_t count{0};
      std::int64_t  latest{0};
    };
    std::map<std::pair<NodeId, NodeId>, PairTotals> pairs;
    for (const auto& edge : edges_) {
      auto& totals = pairs[{edge.source, edge.target}];
      totals.weight_sum += edge.weight;
      ++totals.count;
      totals.latest = std::max(totals.latest, edge.timestamp);
    }
    edges.reserve(pairs.size());
    for (const auto& [pair, totals] : pairs) {
      edges.push_back(Edge{pair.first, pair.second, totals.weight_sum / totals.count, totals.latest});
    }
  } else {
    edges = std::move(edges_);
  }
  edges_.clear();

  for (const auto& edge : edges) {
    ++nodes[edge.source].out_edges;
    ++nodes[edge.target].in_edges;
  }

  std::vector<model::Node> built;
  built.reserve(nodes.size());
  for (auto& [id, acc] : nodes) {
    model::Node node;
    node.id           = id;
    node.score        = acc.ratings > 0 ? acc.rating_sum / acc.ratings : 0.0;
    node.degree       = static_cast<std::uint32_t>(acc.neighbors.size());
    node.in_edges     = acc.in_edges;
    node.out_edges    = acc.out_edges;
    node.last_contact = acc.last_contact;

    auto identity = identities_.find(id);
    if (identity != identities_.end()) {
      node.identity = identity->second;
      ++report_.identities_attached;
    }
    built.push_back(std::move(node));
  }
  identities_.clear();

  const std::int64_t reference_time = config_.has_reference_time() ? config_.reference_time() : latest;

  TRUSTNET_LOG_INFO("Network built",
                    {IntField("nodes", static_cast<std::int64_t>(built.size())), IntField("edges", static_cast<std::int64_t>(edges.size())),
                     IntField("accepted", static_cast<std::int64_t>(report_.accepted)),
                     IntField("skipped", static_cast<std::int64_t>(report_.Skipped())),
                     IntField("identities", static_cast<std::int64_t>(report_.identities_attached)),
                     IntField("reference_time", reference_time)});

  if (report_.Skipped() > 0) {
    TRUSTNET_LOG_WARN("Skipped malformed records",
                      {IntField("missing_field", static_cast<std::int64_t>(report_.missing_field)),
                       IntField("bad_id", static_cast<std::int64_t>(report_.bad_id)),
                       IntField("bad_rating", static_cast<std::int64_t>(report_.bad_rating)),
                       IntField("bad_timestamp", static_cast<std::int64_t>(report_.bad_timestamp)),
                       IntField("self_endorsement", static_cast<std::int64_t>(report_.self_endorsement)),
                       IntField("structurally_invalid", static_cast<std::int64_t>(report_.structurally_invalid))});
  }

  return std::make_shared<const model::NetworkModel>(std::move(built), std::move(edges), reference_time);
}

} // namespace trustnet::builder
