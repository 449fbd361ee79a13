#include "internal/builder/network_builder.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace trustnet::runtime::config;
using trustnet::builder::NetworkBuilder;
using trustnet::builder::RecordVerdict;
using trustnet::ingest::RawEndorsement;
using trustnet::ingest::RawIdentity;
using trustnet::ingest::RawTable;
using trustnet::model::Edge;

constexpr std::int64_t kDay = trustnet::util::kSecondsPerDay;

void TestMalformedRecordsAreCountedByReason() {
  NetworkBuilder builder(InputConfig{});

  assert(builder.Add({"1", "2", "5", "100"}) == RecordVerdict::kAccepted);
  assert(builder.Add({" 2 ", "+3", "-10", "200"}) == RecordVerdict::kAccepted);
  assert(builder.Add({"1", "", "5", "100"}) == RecordVerdict::kMissingField);
  assert(builder.Add({"abc", "2", "5", "100"}) == RecordVerdict::kBadId);
  assert(builder.Add({"-1", "2", "5", "100"}) == RecordVerdict::kBadId);
  assert(builder.Add({"1", "2", "11", "100"}) == RecordVerdict::kBadRating);
  assert(builder.Add({"1", "2", "2.5", "100"}) == RecordVerdict::kBadRating);
  assert(builder.Add({"1", "2", "5", "yesterday"}) == RecordVerdict::kBadTimestamp);
  assert(builder.Add({"1", "2", "5", "-7"}) == RecordVerdict::kBadTimestamp);
  assert(builder.Add({"4", "4", "5", "100"}) == RecordVerdict::kSelfEndorsement);

  RawTable<RawEndorsement> table;
  table.rows.push_back({"3", "1", "1", "300"});
  table.rejected_rows = 2;
  builder.AddAll(table);

  const auto& report = builder.Report();
  assert(report.accepted == 3);
  assert(report.missing_field == 1);
  assert(report.bad_id == 2);
  assert(report.bad_rating == 2);
  assert(report.bad_timestamp == 2);
  assert(report.self_endorsement == 1);
  assert(report.structurally_invalid == 2);
  assert(report.Skipped() == 10);

  auto network = builder.Build();
  assert(network->NodeCount() == 3);
  assert(network->EdgeCount() == 3);
}

void TestRatingScaleComesFromConfig() {
  InputConfig config;
  config.set_min_rating(1);
  config.set_max_rating(5);
  NetworkBuilder builder(config);

  assert(builder.Add({"1", "2", "0", "10"}) == RecordVerdict::kBadRating);
  assert(builder.Add({"1", "2", "5", "10"}) == RecordVerdict::kAccepted);
  assert(builder.Add({"1", "2", "6", "10"}) == RecordVerdict::kBadRating);
}

void TestDerivedMetrics() {
  NetworkBuilder builder(InputConfig{});
  builder.AddEndorsement(Edge{1, 2, 5, 0});
  builder.AddEndorsement(Edge{1, 3, 6, 0});
  builder.AddEndorsement(Edge{2, 3, 3, 100});
  builder.AddEndorsement(Edge{2, 3, -1, 50});

  auto network = builder.Build();

  assert((network->AllNodeIds() == std::vector<trustnet::model::NodeId>{1, 2, 3}));
  assert(network->ReferenceTime() == 100);

  assert(network->Score(1) == 0.0);
  assert(network->Score(2) == 5.0);
  assert(std::abs(network->Score(3) - 8.0 / 3.0) < 1e-12);

  assert(network->Degree(1) == 2);
  assert(network->Degree(2) == 2);
  assert(network->Degree(3) == 2);

  assert(network->Dormancy(1) == 100);
  assert(network->Dormancy(3) == 0);
  assert(network->Dormancy(3, 50) == 0);
  assert(network->Dormancy(1, 100 + 40 * kDay) == 100 + 40 * kDay);

  assert(network->GetNode(2).in_edges == 1);
  assert(network->GetNode(2).out_edges == 2);
  assert(network->OutgoingEdges(2).size() == 2);
  assert(network->IncomingEdges(3).size() == 3);
  assert((network->Neighbors(2) == std::vector<trustnet::model::NodeId>{1, 3}));
}

void TestCoverageUsesStrictThresholdAndIsMemoized() {
  NetworkBuilder builder(InputConfig{});
  builder.AddEndorsement(Edge{1, 2, 5, 0});
  builder.AddEndorsement(Edge{1, 3, 1, 0});
  builder.AddEndorsement(Edge{1, 4, -3, 0});
  builder.AddEndorsement(Edge{1, 2, 7, 10});
  auto network = builder.Build();

  const auto& coverage = network->Coverage(1, 1.0);
  assert((coverage == trustnet::model::CoverageSet{2}));
  assert((network->Coverage(1, 0.5) == trustnet::model::CoverageSet{2, 3}));
  assert(network->Coverage(2, 1.0).empty());

  const auto& again = network->Coverage(1, 1.0);
  assert(&coverage == &again);
}

void TestMergePairsAveragesRatings() {
  InputConfig config;
  config.set_edge_aggregation(EDGE_AGGREGATION_MERGE_PAIRS);
  NetworkBuilder builder(config);
  builder.AddEndorsement(Edge{1, 2, 4, 10});
  builder.AddEndorsement(Edge{1, 2, 8, 30});
  builder.AddEndorsement(Edge{2, 1, 1, 20});
  auto network = builder.Build();

  assert(network->EdgeCount() == 2);
  const auto& merged = network->Edges()[network->OutgoingEdges(1).front()];
  assert(merged.target == 2);
  assert(merged.weight == 6.0);
  assert(merged.timestamp == 30);
  assert(network->Score(2) == 6.0);
}

void TestRetainEventsKeepsEveryRecord() {
  NetworkBuilder builder(InputConfig{});
  builder.AddEndorsement(Edge{1, 2, 4, 10});
  builder.AddEndorsement(Edge{1, 2, 8, 30});
  auto network = builder.Build();
  assert(network->EdgeCount() == 2);
  assert(network->Degree(1) == 1);
}

void TestExplicitReferenceTime() {
  InputConfig config;
  config.set_reference_time(100 + 90 * kDay);
  NetworkBuilder builder(config);
  builder.AddEndorsement(Edge{1, 2, 4, 100});
  auto network = builder.Build();
  assert(network->ReferenceTime() == 100 + 90 * kDay);
  assert(trustnet::util::WholeDays(network->Dormancy(2)) == 90);
}

void TestIdentitiesAreAttachedWithDefaults() {
  NetworkBuilder builder(InputConfig{});
  builder.AddEndorsement(Edge{1, 2, 4, 100});

  RawTable<RawIdentity> identities;
  identities.rows.push_back({"1", "Ada", "Moreau", "ada@example.com", "555", "Engineer"});
  identities.rows.push_back({"2", "", "", "", "", ""});
  identities.rows.push_back({"9", "Zed", "Nobody", "", "", ""});
  identities.rows.push_back({"x", "Bad", "Index", "", "", ""});
  builder.AddIdentities(identities);

  auto network = builder.Build();
  const auto& ada = network->GetNode(1).identity;
  assert(ada.has_value());
  assert(ada->name == "Ada Moreau");
  assert(ada->job == "Engineer");

  const auto& blank = network->GetNode(2).identity;
  assert(blank.has_value());
  assert(blank->name == "Unknown");
  assert(blank->email == "N/A");
  assert(blank->phone == "N/A");
  assert(blank->job == "N/A");

  assert(builder.Report().identities_attached == 2);
  assert(builder.Report().identities_skipped == 1);
  assert(!network->Contains(9));
}

void TestUnknownNodeThrowsNotFound() {
  NetworkBuilder builder(InputConfig{});
  builder.AddEndorsement(Edge{1, 2, 4, 100});
  auto network = builder.Build();

  bool threw = false;
  try {
    (void)network->GetNode(77);
  } catch (const trustnet::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestBuilderIsSingleUse() {
  NetworkBuilder builder(InputConfig{});
  builder.AddEndorsement(Edge{1, 2, 4, 100});
  (void)builder.Build();

  bool threw = false;
  try {
    (void)builder.Build();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMalformedRecordsAreCountedByReason();
  TestRatingScaleComesFromConfig();
  TestDerivedMetrics();
  TestCoverageUsesStrictThresholdAndIsMemoized();
  TestMergePairsAveragesRatings();
  TestRetainEventsKeepsEveryRecord();
  TestExplicitReferenceTime();
  TestIdentitiesAreAttachedWithDefaults();
  TestUnknownNodeThrowsNotFound();
  TestBuilderIsSingleUse();

  std::cout << "trustnet_unit_network_builder: pass\n";
  return 0;
}
