#pragma once

#include <optional>
#include <vector>

#include "types.hpp"

class Scanner {
 public:
  explicit Scanner(ScanConfig config);

  // Walks every configured root, extracts one Document per qualifying file,
  // upserts them into the document store and writes the snapshot export.
  // Documents come back sorted by path.
  std::vector<Document> scan() const;

  // Enumerates regular files under the roots. Missing roots are logged and
  // skipped.
  std::vector<fs::path> discover_files() const;

  // Builds the Document for one file, or nullopt if it is not a readable
  // regular file within max_size_bytes.
  std::optional<Document> scan_file(const fs::path& path) const;

 private:
  std::optional<std::string> get_exif_date(const fs::path& path) const;
  std::string read_sample(const fs::path& path) const;

  ScanConfig m_config;
};
