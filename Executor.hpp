#pragma once

#include <vector>

#include "Journal.hpp"
#include "Planner.hpp"
#include "types.hpp"

// Renames from -> to, falling back to copy + remove across filesystems.
// Throws fs::filesystem_error on failure.
void move_file(const fs::path& from, const fs::path& to);

class Executor {
 public:
  // scanIndex supplies the content digest recorded with each entry.
  Executor(Journal& journal, TransferMode mode, const ScanIndex& scanIndex);

  // Carries out one plan and appends exactly one journal entry for it.
  JournalEntry execute(const OrganizePlan& plan) const;

  std::vector<JournalEntry> execute_all(
      const std::vector<OrganizePlan>& plans) const;

 private:
  Journal& m_journal;
  TransferMode m_mode;
  const ScanIndex& m_scanIndex;
};
