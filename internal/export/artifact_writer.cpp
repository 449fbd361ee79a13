#include "artifact_writer.hpp"

#include <arrow/io/file.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace trustnet::exporter {

namespace {

template <typename T>
T Unwrap(const arrow::Result<T>& result, const std::filesystem::path& path) {
  if (!result.ok()) throw util::ExportError(path.string() + ": " + result.status().ToString());
  return *result;
}

void Unwrap(const arrow::Status& status, const std::filesystem::path& path) {
  if (!status.ok()) throw util::ExportError(path.string() + ": " + status.ToString());
}

std::filesystem::path TempPath(const std::filesystem::path& final_path) {
  return final_path.string() + ".tmp";
}

std::filesystem::path BackupPath(const std::filesystem::path& final_path) {
  return final_path.string() + ".bak";
}

void WriteFile(const std::filesystem::path& path, const std::string& contents) {
  auto out = Unwrap(arrow::io::FileOutputStream::Open(path.string()), path);
  Unwrap(out->Write(contents.data(), static_cast<int64_t>(contents.size())), path);
  Unwrap(out->Flush(), path);
  Unwrap(out->Close(), path);
}

void RemoveFiles(const std::vector<std::filesystem::path>& paths, std::string_view what) {
  for (const auto& path : paths) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
      TRUSTNET_LOG_WARN("Failed to remove export file",
                        {observability::StringField("kind", what), observability::StringField("path", path.string()),
                         observability::StringField("error", ec.message())});
    }
  }
}

// Moves every backup of `finals` back under its final name.
void RestoreBackups(const std::vector<std::filesystem::path>& finals) {
  for (const auto& final_path : finals) {
    std::error_code ec;
    std::filesystem::rename(BackupPath(final_path), final_path, ec);
    if (ec) {
      TRUSTNET_LOG_ERROR("Failed to restore previous export file",
                         {observability::StringField("path", final_path.string()), observability::StringField("error", ec.message())});
    }
  }
}

} // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {
}

void ArtifactWriter::WriteAll(const std::vector<Artifact>& artifacts) const {
  std::error_code ec;
  std::filesystem::create_directories(output_dir_, ec);
  if (ec) {
    throw util::ExportError("cannot create output directory " + output_dir_.string() + ": " + ec.message());
  }

  // ------------------------------------------------------------------
  // Stage: write tmp files
  // ------------------------------------------------------------------
  std::vector<std::filesystem::path> staged;
  try {
    for (const auto& artifact : artifacts) {
      const auto tmp = TempPath(output_dir_ / artifact.name);
      staged.push_back(tmp);
      WriteFile(tmp, artifact.contents);
    }
  } catch (const util::ExportError&) {
    RemoveFiles(staged, "temporary");
    throw;
  }

  // ------------------------------------------------------------------
  // Backup: move a previous export aside
  // ------------------------------------------------------------------
  std::vector<std::filesystem::path> backed_up;
  for (const auto& artifact : artifacts) {
    const auto final_path = output_dir_ / artifact.name;
    if (!std::filesystem::exists(final_path, ec)) continue;

    std::filesystem::rename(final_path, BackupPath(final_path), ec);
    if (ec) {
      RestoreBackups(backed_up);
      RemoveFiles(staged, "temporary");
      throw util::ExportError("cannot back up " + final_path.string() + ": " + ec.message());
    }
    backed_up.push_back(final_path);
  }

  // ------------------------------------------------------------------
  // Finalize: rename into place, roll back on failure
  // ------------------------------------------------------------------
  for (std::size_t i = 0; i < artifacts.size(); ++i) {
    const auto final_path = output_dir_ / artifacts[i].name;
    std::filesystem::rename(staged[i], final_path, ec);
    if (ec) {
      const auto message = ec.message();

      std::vector<std::filesystem::path> finalized;
      for (std::size_t j = 0; j < i; ++j) finalized.push_back(output_dir_ / artifacts[j].name);
      RemoveFiles(finalized, "partial");
      RemoveFiles(std::vector<std::filesystem::path>(staged.begin() + static_cast<std::ptrdiff_t>(i), staged.end()), "temporary");
      RestoreBackups(backed_up);
      throw util::ExportError("cannot finalize " + final_path.string() + ": " + message);
    }
  }

  std::vector<std::filesystem::path> backups;
  for (const auto& final_path : backed_up) backups.push_back(BackupPath(final_path));
  RemoveFiles(backups, "backup");
}

} // namespace trustnet::exporter
