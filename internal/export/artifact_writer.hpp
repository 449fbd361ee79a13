#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace trustnet::exporter {

struct Artifact {
  std::string name;
  std::string contents;
};

/*
  Writes a set of text artifacts into one directory.

  Every artifact is written and closed as "<name>.tmp" before any of them is
  renamed into place. Files of a previous export are moved to "<name>.bak"
  first; if a rename into place fails, the already finalized files are
  removed and the backups restored, so the directory holds either the whole
  new export or the whole previous one. Errors throw util::ExportError.
*/
class ArtifactWriter {
 public:
  explicit ArtifactWriter(std::filesystem::path output_dir);

  void WriteAll(const std::vector<Artifact>& artifacts) const;

  const std::filesystem::path& OutputDir() const {
    return output_dir_;
  }

 private:
  std::filesystem::path output_dir_;
};

} // namespace trustnet::exporter
