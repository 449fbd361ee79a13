#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace trustnet::ingest {

/*
  Endorsement row as it appears in the source table, before validation.
  Absent cells are empty strings.
*/
struct RawEndorsement {
  std::string source_id;
  std::string target_id;
  std::string rating;
  std::string timestamp;
};

struct RawIdentity {
  std::string index;
  std::string first_name;
  std::string last_name;
  std::string email;
  std::string phone;
  std::string job_title;
};

template <typename Row>
struct RawTable {
  std::vector<Row> rows;

  // Rows the CSV parser dropped because their column count was wrong.
  std::uint64_t rejected_rows{0};
};

} // namespace trustnet::ingest
