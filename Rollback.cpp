#include "Rollback.hpp"

#include "Executor.hpp"
#include "IOManager.hpp"

RollbackEngine::RollbackEngine(const Journal& journal) : m_journal(journal) {}

RollbackSummary RollbackEngine::run() const {
  RollbackSummary summary;
  auto journal = m_journal.read_all();
  if (journal.empty()) {
    IOManager::log("No journal entries found. Nothing to undo.");
    return summary;
  }

  IOManager::log("Starting undo operation...");
  for (auto it = journal.rbegin(); it != journal.rend(); ++it) {
    const JournalEntry& entry = *it;
    std::error_code ec;
    const bool relocated = entry.status == JournalStatus::MOVED ||
                           entry.status == JournalStatus::COPIED;
    if (!relocated || entry.original_path == entry.target_path ||
        !fs::exists(entry.target_path, ec)) {
      ++summary.skipped;
      continue;
    }
    // A moved file's original slot should be empty; refuse to clobber a file
    // that was created there afterwards. Copies land back on their source.
    if (entry.status == JournalStatus::MOVED &&
        fs::exists(entry.original_path, ec)) {
      ++summary.failed;
      IOManager::log(std::format("   Original path occupied, not undoing: {}",
                                 safe_path_to_string(entry.original_path)));
      continue;
    }

    IOManager::log(std::format("Undoing move: '{}' -> '{}'",
                               safe_path_to_string(entry.target_path),
                               safe_path_to_string(entry.original_path)));
    try {
      ensure_directory(entry.original_path.parent_path());
      move_file(entry.target_path, entry.original_path);
      ++summary.restored;
    } catch (const fs::filesystem_error& e) {
      ++summary.failed;
      IOManager::log(std::format("   Error undoing move: {}", e.what()));
    }
  }
  IOManager::log(std::format(
      "Undo complete. {} restored, {} skipped, {} failed.", summary.restored,
      summary.skipped, summary.failed));
  return summary;
}
