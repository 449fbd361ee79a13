#include "network_model.hpp"

#include <algorithm>
#include <mutex>
#include <string>

#include "internal/util/errors.hpp"

namespace trustnet::model {

NetworkModel::NetworkModel(std::vector<Node> nodes, std::vector<Edge> edges, std::int64_t reference_time)
    : nodes_(std::move(nodes)), edges_(std::move(edges)), reference_time_(reference_time) {

  std::sort(nodes_.begin(), nodes_.end(), [](const Node& a, const Node& b) { return a.id < b.id; });

  ids_.reserve(nodes_.size());
  index_.reserve(nodes_.size());
  for (std::size_t i = 0; i < nodes_.size(); ++i) {
    ids_.push_back(nodes_[i].id);
    index_.emplace(nodes_[i].id, i);
  }

  outgoing_.resize(nodes_.size());
  incoming_.resize(nodes_.size());
  for (std::size_t e = 0; e < edges_.size(); ++e) {
    outgoing_[IndexOf(edges_[e].source)].push_back(e);
    incoming_[IndexOf(edges_[e].target)].push_back(e);
  }
}

std::size_t NetworkModel::IndexOf(NodeId id) const {
  auto it = index_.find(id);
  if (it == index_.end()) {
    throw util::NotFound("node " + std::to_string(id) + " is not part of the network");
  }
  return it->second;
}

bool NetworkModel::Contains(NodeId id) const {
  return index_.count(id) > 0;
}

const Node& NetworkModel::GetNode(NodeId id) const {
  return nodes_[IndexOf(id)];
}

std::uint32_t NetworkModel::Degree(NodeId id) const {
  return GetNode(id).degree;
}

double NetworkModel::Score(NodeId id) const {
  return GetNode(id).score;
}

std::int64_t NetworkModel::Dormancy(NodeId id, std::int64_t reference_time) const {
  return std::max<std::int64_t>(0, reference_time - GetNode(id).last_contact);
}

std::int64_t NetworkModel::Dormancy(NodeId id) const {
  return Dormancy(id, reference_time_);
}

const std::vector<std::size_t>& NetworkModel::OutgoingEdges(NodeId id) const {
  return outgoing_[IndexOf(id)];
}

const std::vector<std::size_t>& NetworkModel::IncomingEdges(NodeId id) const {
  return incoming_[IndexOf(id)];
}

std::vector<NodeId> NetworkModel::Neighbors(NodeId id) const {
  const auto          index = IndexOf(id);
  std::vector<NodeId> result;
  result.reserve(outgoing_[index].size() + incoming_[index].size());
  for (auto e : outgoing_[index]) result.push_back(edges_[e].target);
  for (auto e : incoming_[index]) result.push_back(edges_[e].source);
  std::sort(result.begin(), result.end());
  result.erase(std::unique(result.begin(), result.end()), result.end());
  return result;
}

// ------------------------------------------------------------
// Coverage
// ------------------------------------------------------------

CoverageSet NetworkModel::ComputeCoverage(std::size_t index, double threshold) const {
  CoverageSet covered;
  for (auto e : outgoing_[index]) {
    if (edges_[e].weight > threshold) {
      covered.push_back(edges_[e].target);
    }
  }
  std::sort(covered.begin(), covered.end());
  covered.erase(std::unique(covered.begin(), covered.end()), covered.end());
  return covered;
}

const CoverageSet& NetworkModel::Coverage(NodeId id, double threshold) const {
  const auto index = IndexOf(id);
  const auto key   = std::make_pair(id, threshold);

  {
    std::shared_lock lock(coverage_mutex_);
    auto it = coverage_cache_.find(key);
    if (it != coverage_cache_.end()) return it->second;
  }

  auto computed = ComputeCoverage(index, threshold);

  std::unique_lock lock(coverage_mutex_);
  // A concurrent reader may have inserted first; emplace keeps that entry.
  return coverage_cache_.emplace(key, std::move(computed)).first->second;
}

} // namespace trustnet::model
