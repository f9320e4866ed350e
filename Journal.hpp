#pragma once

#include <mutex>
#include <vector>

#include "types.hpp"

// Append-only JSON Lines log of executed relocations. Appends are serialized
// so entry order matches execution order; nothing is ever rewritten.
class Journal {
 public:
  explicit Journal(fs::path path);

  // Writes one line and flushes it. Throws std::runtime_error if the line
  // cannot be written.
  void append(const JournalEntry& entry);

  // All readable entries in file order. Lines that fail to parse or validate
  // (e.g. a torn final line after a crash) are logged and skipped.
  std::vector<JournalEntry> read_all() const;

  const fs::path& path() const { return m_path; }

 private:
  fs::path m_path;
  mutable std::mutex m_mutex;
};
