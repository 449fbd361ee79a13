#pragma once

#include <string>

#include "internal/ingest/raw_records.hpp"

namespace trustnet::ingest {

/*
  Tabular readers backed by Arrow's CSV reader.

  Every column is read as utf8; typing and range checks happen in the
  NetworkBuilder so that bad cells are counted per record instead of failing
  the whole file. An unreadable file throws util::InputError.
*/

// source_id,target_id,rating,timestamp
RawTable<RawEndorsement> ReadEndorsements(const std::string& path, bool has_header);

// Index,First Name,Last Name,Email,Phone,Job Title (header required, extra columns ignored)
RawTable<RawIdentity> ReadIdentities(const std::string& path);

} // namespace trustnet::ingest
