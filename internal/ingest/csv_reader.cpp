#include "csv_reader.hpp"

#include <arrow/array.h>
#include <arrow/csv/api.h>
#include <arrow/io/file.h>
#include <arrow/table.h>
#include <arrow/type.h>

#include <atomic>
#include <memory>
#include <string_view>
#include <vector>

#include "internal/util/errors.hpp"

namespace trustnet::ingest {

namespace {

template <typename T>
T Unwrap(const arrow::Result<T>& result, const std::string& path) {
  if (!result.ok()) throw util::InputError(path + ": " + result.status().ToString());
  return *result;
}

/*
  Reads `path` with every column typed as utf8. Rows with a wrong column count
  are skipped and counted.
*/
std::shared_ptr<arrow::Table> ReadStringTable(const std::string& path, const std::vector<std::string>& columns, bool has_header,
                                              bool header_names, std::uint64_t* rejected_rows) {
  auto input = Unwrap(arrow::io::ReadableFile::Open(path), path);

  auto read_options = arrow::csv::ReadOptions::Defaults();
  if (!header_names) {
    read_options.column_names = columns;
    read_options.skip_rows    = has_header ? 1 : 0;
  }

  auto rejected                      = std::make_shared<std::atomic<std::uint64_t>>(0);
  auto parse_options                 = arrow::csv::ParseOptions::Defaults();
  parse_options.invalid_row_handler = [rejected](const arrow::csv::InvalidRow&) {
    rejected->fetch_add(1);
    return arrow::csv::InvalidRowResult::Skip;
  };

  auto convert_options = arrow::csv::ConvertOptions::Defaults();
  for (const auto& column : columns) {
    convert_options.column_types[column] = arrow::utf8();
  }
  if (header_names) {
    convert_options.include_columns         = columns;
    convert_options.include_missing_columns = true;
  }
  convert_options.strings_can_be_null = false;

  auto reader = Unwrap(arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, read_options, parse_options, convert_options), path);
  auto table  = Unwrap(reader->Read(), path);

  *rejected_rows = rejected->load();
  return table;
}

/*
  Flattens one utf8 column into strings. Missing columns (null type when
  include_missing_columns kicks in) yield empty cells.
*/
std::vector<std::string> ColumnValues(const std::shared_ptr<arrow::Table>& table, const std::string& name) {
  std::vector<std::string> values(static_cast<std::size_t>(table->num_rows()));

  auto column = table->GetColumnByName(name);
  if (!column || column->type()->id() != arrow::Type::STRING) {
    return values;
  }

  std::size_t row = 0;
  for (const auto& chunk : column->chunks()) {
    auto strings = std::static_pointer_cast<arrow::StringArray>(chunk);
    for (int64_t i = 0; i < strings->length(); ++i, ++row) {
      if (strings->IsNull(i)) continue;
      const auto view = strings->GetView(i);
      values[row].assign(view.data(), view.size());
    }
  }
  return values;
}

} // namespace

RawTable<RawEndorsement> ReadEndorsements(const std::string& path, bool has_header) {
  static const std::vector<std::string> kColumns = {"source_id", "target_id", "rating", "timestamp"};

  RawTable<RawEndorsement> result;
  auto table = ReadStringTable(path, kColumns, has_header, false, &result.rejected_rows);

  auto sources    = ColumnValues(table, "source_id");
  auto targets    = ColumnValues(table, "target_id");
  auto ratings    = ColumnValues(table, "rating");
  auto timestamps = ColumnValues(table, "timestamp");

  result.rows.resize(sources.size());
  for (std::size_t i = 0; i < sources.size(); ++i) {
    result.rows[i] = RawEndorsement{std::move(sources[i]), std::move(targets[i]), std::move(ratings[i]), std::move(timestamps[i])};
  }
  return result;
}

RawTable<RawIdentity> ReadIdentities(const std::string& path) {
  static const std::vector<std::string> kColumns = {"Index", "First Name", "Last Name", "Email", "Phone", "Job Title"};

  RawTable<RawIdentity> result;
  auto table = ReadStringTable(path, kColumns, true, true, &result.rejected_rows);

  auto index      = ColumnValues(table, "Index");
  auto first_name = ColumnValues(table, "First Name");
  auto last_name  = ColumnValues(table, "Last Name");
  auto email      = ColumnValues(table, "Email");
  auto phone      = ColumnValues(table, "Phone");
  auto job_title  = ColumnValues(table, "Job Title");

  result.rows.resize(index.size());
  for (std::size_t i = 0; i < index.size(); ++i) {
    auto& row      = result.rows[i];
    row.index      = std::move(index[i]);
    row.first_name = std::move(first_name[i]);
    row.last_name  = std::move(last_name[i]);
    row.email      = std::move(email[i]);
    row.phone      = std::move(phone[i]);
    row.job_title  = std::move(job_title[i]);
  }
  return result;
}

} // namespace trustnet::ingest
