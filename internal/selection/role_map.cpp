#include "role_map.hpp"

#include <stdexcept>

namespace trustnet::selection {

std::string_view RoleName(Role role) {
  switch (role) {
    case Role::kNone:
      return "none";
    case Role::kSentinel:
      return "sentinel";
    case Role::kMaintenance:
      return "maintenance";
    case Role::kSentinelMaintenance:
      return "sentinel_maintenance";
  }
  return "none";
}

void RoleMap::Assign(const std::vector<model::NodeId>& sentinels, const std::vector<model::NodeId>& maintenance) {
  if (assigned_) throw std::logic_error("node roles are already assigned");

  for (model::NodeId id : sentinels) roles_[id] = Role::kSentinel;
  for (model::NodeId id : maintenance) {
    auto it = roles_.find(id);
    if (it == roles_.end()) {
      roles_.emplace(id, Role::kMaintenance);
    } else if (it->second == Role::kSentinel) {
      it->second = Role::kSentinelMaintenance;
    }
  }
  assigned_ = true;
}

Role RoleMap::Get(model::NodeId id) const {
  auto it = roles_.find(id);
  return it == roles_.end() ? Role::kNone : it->second;
}

std::size_t RoleMap::Count(Role role) const {
  std::size_t count = 0;
  for (const auto& [id, assigned] : roles_) {
    if (assigned == role) ++count;
  }
  return count;
}

} // namespace trustnet::selection
