#pragma once

#include <cstddef>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/types.hpp"

namespace trustnet::selection {

enum class Role {
  kNone,
  kSentinel,
  kMaintenance,
  kSentinelMaintenance,
};

std::string_view RoleName(Role role);

/*
  Post-selection role flags.

  Written exactly once, after both selectors have finished; a second Assign()
  throws std::logic_error.
*/
class RoleMap {
 public:
  void Assign(const std::vector<model::NodeId>& sentinels, const std::vector<model::NodeId>& maintenance);

  bool Assigned() const {
    return assigned_;
  }

  Role Get(model::NodeId id) const;

  std::size_t Count(Role role) const;

 private:
  bool                                    assigned_{false};
  std::unordered_map<model::NodeId, Role> roles_;
};

} // namespace trustnet::selection
