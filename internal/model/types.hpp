#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trustnet::model {

using NodeId = std::uint32_t;

// Ascending, de-duplicated talent ids.
using CoverageSet = std::vector<NodeId>;

/*
  Display metadata attached from the identity source.

  A node either carries a complete IdentityMetadata (missing columns already
  replaced by defaults) or none at all.
*/
struct IdentityMetadata {
  std::string name;
  std::string job;
  std::string email;
  std::string phone;
};

/*
  One endorsement event: source rated target with a signed weight at a Unix
  timestamp (seconds).
*/
struct Edge {
  NodeId       source{0};
  NodeId       target{0};
  double       weight{0.0};
  std::int64_t timestamp{0};
};

struct Node {
  NodeId id{0};

  // Mean rating received, 0 when the node was never rated.
  double score{0.0};

  // Distinct neighbours over incoming and outgoing edges.
  std::uint32_t degree{0};

  std::uint32_t in_edges{0};
  std::uint32_t out_edges{0};

  // Latest timestamp of any incident edge.
  std::int64_t last_contact{0};

  std::optional<IdentityMetadata> identity;
};

} // namespace trustnet::model
