#include "internal/config/config_validation.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "internal/util/errors.hpp"

namespace {

using namespace trustnet::runtime::config;
using trustnet::util::ConfigurationError;

RuntimeConfig ValidConfig() {
  RuntimeConfig config;
  config.mutable_input()->set_records_path("records.csv");
  config.mutable_sentinel()->set_budget(5);
  config.mutable_sentinel()->set_coverage_threshold(1.0);
  config.mutable_maintenance()->set_time_budget_minutes(120.0);
  return config;
}

template <typename Fn>
bool Rejects(Fn&& mutate) {
  auto config = ValidConfig();
  mutate(config);
  try {
    trustnet::config::ValidateConfig(config);
  } catch (const ConfigurationError&) {
    return true;
  }
  return false;
}

void TestValidConfigPasses() {
  trustnet::config::ValidateConfig(ValidConfig());
}

void TestNonPositiveSentinelBudgetIsRejected() {
  assert(Rejects([](RuntimeConfig& c) { c.mutable_sentinel()->set_budget(0); }));
  assert(Rejects([](RuntimeConfig& c) { c.mutable_sentinel()->set_budget(-3); }));
}

void TestNegativeCoverageThresholdIsRejected() {
  assert(Rejects([](RuntimeConfig& c) { c.mutable_sentinel()->set_coverage_threshold(-0.5); }));
  assert(Rejects([](RuntimeConfig& c) { c.mutable_sentinel()->set_coverage_threshold(std::numeric_limits<double>::quiet_NaN()); }));
}

void TestNonPositiveTimeBudgetIsRejected() {
  assert(Rejects([](RuntimeConfig& c) { c.mutable_maintenance()->set_time_budget_minutes(0.0); }));
  assert(Rejects([](RuntimeConfig& c) { c.mutable_maintenance()->set_time_budget_minutes(-10.0); }));
  assert(Rejects([](RuntimeConfig& c) { c.mutable_maintenance()->set_time_budget_minutes(std::numeric_limits<double>::infinity()); }));
}

void TestInvertedRatingScaleIsRejected() {
  assert(Rejects([](RuntimeConfig& c) {
    c.mutable_input()->set_min_rating(5);
    c.mutable_input()->set_max_rating(-5);
  }));
}

void TestValueModelParametersAreChecked() {
  assert(Rejects([](RuntimeConfig& c) { c.mutable_maintenance()->set_decay_model(VALUE_MODEL_EXPONENTIAL_DECAY); }));
  assert(!Rejects([](RuntimeConfig& c) {
    c.mutable_maintenance()->set_decay_model(VALUE_MODEL_EXPONENTIAL_DECAY);
    c.mutable_maintenance()->set_decay_half_life_days(90.0);
  }));
  assert(Rejects([](RuntimeConfig& c) { c.mutable_maintenance()->set_min_dormancy_days(-1.0); }));
}

void TestCostModelParametersAreChecked() {
  assert(Rejects([](RuntimeConfig& c) {
    c.mutable_maintenance()->set_cost_min_minutes(90);
    c.mutable_maintenance()->set_cost_max_minutes(30);
  }));
  assert(Rejects([](RuntimeConfig& c) { c.mutable_maintenance()->set_cost_min_minutes(0); }));
  assert(Rejects([](RuntimeConfig& c) {
    c.mutable_maintenance()->set_cost_model(COST_MODEL_UNIFORM);
    c.mutable_maintenance()->set_cost_minutes(0.0);
  }));
  assert(Rejects([](RuntimeConfig& c) {
    c.mutable_maintenance()->set_cost_model(COST_MODEL_DEGREE_PROPORTIONAL);
    c.mutable_maintenance()->set_cost_per_edge_minutes(-1.0);
  }));
}

void TestUnknownEnumValuesAreRejected() {
  assert(Rejects([](RuntimeConfig& c) { c.mutable_maintenance()->set_decay_model(static_cast<ValueModel>(42)); }));
  assert(Rejects([](RuntimeConfig& c) { c.mutable_solver()->set_backend(static_cast<SolverBackend>(42)); }));
}

} // namespace

int main() {
  TestValidConfigPasses();
  TestNonPositiveSentinelBudgetIsRejected();
  TestNegativeCoverageThresholdIsRejected();
  TestNonPositiveTimeBudgetIsRejected();
  TestInvertedRatingScaleIsRejected();
  TestValueModelParametersAreChecked();
  TestCostModelParametersAreChecked();
  TestUnknownEnumValuesAreRejected();

  std::cout << "trustnet_unit_config_validation: pass\n";
  return 0;
}
