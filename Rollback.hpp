#pragma once

#include <cstddef>

#include "Journal.hpp"

struct RollbackSummary {
  std::size_t restored = 0;
  std::size_t skipped = 0;
  std::size_t failed = 0;
};

// Replays a journal newest-first, moving each relocated file back to its
// original path. Entries whose target is gone are skipped, so running it
// again is harmless. The journal itself is only read.
class RollbackEngine {
 public:
  explicit RollbackEngine(const Journal& journal);

  RollbackSummary run() const;

 private:
  const Journal& m_journal;
};
