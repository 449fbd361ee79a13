#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/ingest/raw_records.hpp"
#include "internal/model/network_model.hpp"

namespace trustnet::builder {

/*
  Per-reason counts of records that did not make it into the network.
*/
struct IngestReport {
  std::uint64_t accepted{0};
  std::uint64_t missing_field{0};
  std::uint64_t bad_id{0};
  std::uint64_t bad_rating{0};
  std::uint64_t bad_timestamp{0};
  std::uint64_t self_endorsement{0};
  std::uint64_t structurally_invalid{0};

  std::uint64_t identities_attached{0};
  std::uint64_t identities_skipped{0};

  std::uint64_t Skipped() const {
    return missing_field + bad_id + bad_rating + bad_timestamp + self_endorsement + structurally_invalid;
  }
};

enum class RecordVerdict {
  kAccepted,
  kMissingField,
  kBadId,
  kBadRating,
  kBadTimestamp,
  kSelfEndorsement,
};

/*
  Turns endorsement records and an optional identity lookup into an immutable
  NetworkModel.

  Edge policy:
    RETAIN_EVENTS  every accepted record becomes its own edge (default)
    MERGE_PAIRS    records of the same directed pair collapse into one edge
                   carrying the average rating and the latest timestamp

  Node score is the mean of all ratings received, taken over the raw records
  under either policy. Malformed records are skipped and counted, never fatal.
*/
class NetworkBuilder {
 public:
  explicit NetworkBuilder(trustnet::runtime::config::InputConfig config);

  RecordVerdict Add(const ingest::RawEndorsement& record);
  void          AddAll(const ingest::RawTable<ingest::RawEndorsement>& table);

  // Accepted record already in typed form. Validated like raw input.
  RecordVerdict AddEndorsement(const model::Edge& edge);

  // Identity rows for ids that never appear in an accepted record are ignored at Build().
  void AddIdentity(model::NodeId id, model::IdentityMetadata identity);
  void AddIdentities(const ingest::RawTable<ingest::RawIdentity>& table);

  const IngestReport& Report() const {
    return report_;
  }

  // Single use: the builder is drained by Build().
  std::shared_ptr<const model::NetworkModel> Build();

 private:
  RecordVerdict Count(RecordVerdict verdict);

  trustnet::runtime::config::InputConfig config_;
  std::int32_t                           min_rating_;
  std::int32_t                           max_rating_;

  std::vector<model::Edge>                         edges_;
  std::map<model::NodeId, model::IdentityMetadata> identities_;
  IngestReport                                     report_;
  bool                                             built_{false};
};

// "First Last", "Unknown" and "N/A" defaults for blank cells.
model::IdentityMetadata IdentityFromRow(const ingest::RawIdentity& row);

} // namespace trustnet::builder
