#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/model/types.hpp"

namespace trustnet::model {

/*
  Immutable snapshot of the trust network.

  Built once by NetworkBuilder and shared read-only between the selectors and
  the exporter. Every accessor is const; the only internal state that changes
  after construction is the coverage memo, which is guarded and only ever
  grows.
*/
class NetworkModel {
 public:
  NetworkModel(std::vector<Node> nodes, std::vector<Edge> edges, std::int64_t reference_time);

  NetworkModel(const NetworkModel&)            = delete;
  NetworkModel& operator=(const NetworkModel&) = delete;

  // Ascending node ids.
  const std::vector<NodeId>& AllNodeIds() const {
    return ids_;
  }

  const std::vector<Edge>& Edges() const {
    return edges_;
  }

  std::size_t NodeCount() const {
    return nodes_.size();
  }

  std::size_t EdgeCount() const {
    return edges_.size();
  }

  std::int64_t ReferenceTime() const {
    return reference_time_;
  }

  bool Contains(NodeId id) const;

  // Throws util::NotFound for unknown ids.
  const Node& GetNode(NodeId id) const;

  std::uint32_t Degree(NodeId id) const;
  double        Score(NodeId id) const;

  // Seconds since last contact, clamped at zero.
  std::int64_t Dormancy(NodeId id, std::int64_t reference_time) const;
  std::int64_t Dormancy(NodeId id) const;

  // Indices into Edges() of edges leaving / entering `id`, in input order.
  const std::vector<std::size_t>& OutgoingEdges(NodeId id) const;
  const std::vector<std::size_t>& IncomingEdges(NodeId id) const;

  // Ascending distinct neighbours, either direction.
  std::vector<NodeId> Neighbors(NodeId id) const;

  /*
    Targets reached from `id` through an outgoing edge whose weight exceeds
    `threshold`.

    Memoized per (id, threshold). The returned reference stays valid for the
    lifetime of the model.
  */
  const CoverageSet& Coverage(NodeId id, double threshold) const;

 private:
  std::size_t IndexOf(NodeId id) const;
  CoverageSet ComputeCoverage(std::size_t index, double threshold) const;

  std::vector<Node>                       nodes_;
  std::vector<NodeId>                     ids_;
  std::unordered_map<NodeId, std::size_t> index_;
  std::vector<Edge>                       edges_;
  std::vector<std::vector<std::size_t>>   outgoing_;
  std::vector<std::vector<std::size_t>>   incoming_;
  std::int64_t                            reference_time_;

  mutable std::shared_mutex                                       coverage_mutex_;
  mutable std::map<std::pair<NodeId, double>, const CoverageSet> coverage_cache_;
};

} // namespace trustnet::model
