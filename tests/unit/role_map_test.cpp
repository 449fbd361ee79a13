#include "internal/selection/role_map.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

using trustnet::selection::Role;
using trustnet::selection::RoleMap;
using trustnet::selection::RoleName;

void TestAssignFlagsBothRoles() {
  RoleMap roles;
  assert(!roles.Assigned());
  assert(roles.Get(1) == Role::kNone);

  roles.Assign({1, 2, 3}, {3, 4});

  assert(roles.Assigned());
  assert(roles.Get(1) == Role::kSentinel);
  assert(roles.Get(2) == Role::kSentinel);
  assert(roles.Get(3) == Role::kSentinelMaintenance);
  assert(roles.Get(4) == Role::kMaintenance);
  assert(roles.Get(5) == Role::kNone);

  assert(roles.Count(Role::kSentinel) == 2);
  assert(roles.Count(Role::kMaintenance) == 1);
  assert(roles.Count(Role::kSentinelMaintenance) == 1);
}

void TestDuplicatesCollapse() {
  RoleMap roles;
  roles.Assign({7, 7}, {8, 8, 7});
  assert(roles.Get(7) == Role::kSentinelMaintenance);
  assert(roles.Get(8) == Role::kMaintenance);
  assert(roles.Count(Role::kSentinelMaintenance) == 1);
  assert(roles.Count(Role::kMaintenance) == 1);
}

void TestEmptySelections() {
  RoleMap roles;
  roles.Assign({}, {});
  assert(roles.Assigned());
  assert(roles.Count(Role::kSentinel) == 0);
  assert(roles.Get(1) == Role::kNone);
}

void TestSecondAssignIsRejected() {
  RoleMap roles;
  roles.Assign({1}, {2});

  bool threw = false;
  try {
    roles.Assign({2}, {1});
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(roles.Get(1) == Role::kSentinel);
  assert(roles.Get(2) == Role::kMaintenance);
}

void TestNames() {
  assert(RoleName(Role::kNone) == "none");
  assert(RoleName(Role::kSentinel) == "sentinel");
  assert(RoleName(Role::kMaintenance) == "maintenance");
  assert(RoleName(Role::kSentinelMaintenance) == "sentinel_maintenance");
}

} // namespace

int main() {
  TestAssignFlagsBothRoles();
  TestDuplicatesCollapse();
  TestEmptySelections();
  TestSecondAssignIsRejected();
  TestNames();

  std::cout << "trustnet_unit_role_map: pass\n";
  return 0;
}
