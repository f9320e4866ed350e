#include "Executor.hpp"

#include <chrono>
#include <system_error>

#include "IOManager.hpp"

namespace {
double now_seconds() {
  return std::chrono::duration<double>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void copy_preserving_time(const fs::path& from, const fs::path& to,
                          fs::copy_options options) {
  fs::copy_file(from, to, options);
  fs::last_write_time(to, fs::last_write_time(from));
}
}  // namespace

void move_file(const fs::path& from, const fs::path& to) {
  try {
    fs::rename(from, to);
  } catch (const fs::filesystem_error& e) {
    if (e.code() != std::errc::cross_device_link) throw;
    copy_preserving_time(from, to, fs::copy_options::overwrite_existing);
    fs::remove(from);
  }
}

Executor::Executor(Journal& journal, TransferMode mode,
                   const ScanIndex& scanIndex)
    : m_journal(journal), m_mode(mode), m_scanIndex(scanIndex) {}

JournalEntry Executor::execute(const OrganizePlan& plan) const {
  JournalEntry entry;
  entry.original_path = plan.source_path;
  entry.target_path = plan.target_path;
  entry.doc_id = plan.doc_id;
  entry.project_id = plan.project_id;
  entry.bucket = plan.bucket;
  if (auto it = m_scanIndex.find(plan.doc_id); it != m_scanIndex.end()) {
    entry.content_digest = it->second.content_digest;
  }

  const JournalStatus done = m_mode == TransferMode::MOVE
                                 ? JournalStatus::MOVED
                                 : JournalStatus::COPIED;
  std::error_code ec;
  if (!fs::exists(plan.source_path, ec)) {
    entry.status = JournalStatus::MISSING;
    IOManager::log(std::format("Source missing, nothing done: {}",
                               safe_path_to_string(plan.source_path)));
  } else if (plan.source_path == plan.target_path) {
    entry.status = done;
  } else if (fs::exists(plan.target_path, ec)) {
    // Never overwrite: the target appeared after planning.
    entry.status = JournalStatus::FAILED;
    IOManager::log(std::format("Target already exists, not overwriting: {}",
                               safe_path_to_string(plan.target_path)));
  } else {
    try {
      ensure_directory(plan.target_path.parent_path());
      if (m_mode == TransferMode::MOVE) {
        move_file(plan.source_path, plan.target_path);
      } else {
        copy_preserving_time(plan.source_path, plan.target_path,
                             fs::copy_options::none);
      }
      entry.status = done;
      IOManager::log(std::format("{} '{}' -> '{}'", to_string(done),
                                 safe_path_to_string(plan.source_path),
                                 safe_path_to_string(plan.target_path)));
    } catch (const fs::filesystem_error& e) {
      entry.status = JournalStatus::FAILED;
      IOManager::log(std::format("   Error relocating '{}': {}",
                                 safe_path_to_string(plan.source_path),
                                 e.what()));
    }
  }

  entry.timestamp = now_seconds();
  try {
    m_journal.append(entry);
  } catch (const std::runtime_error& e) {
    // The file may already be relocated; leave enough in the log to undo it
    // by hand.
    IOManager::log(std::format(
        "CRITICAL: {} '{}' -> '{}' (doc {}) was not journaled: {}",
        to_string(entry.status), safe_path_to_string(entry.original_path),
        safe_path_to_string(entry.target_path), entry.doc_id, e.what()));
    throw;
  }
  return entry;
}

std::vector<JournalEntry> Executor::execute_all(
    const std::vector<OrganizePlan>& plans) const {
  std::vector<JournalEntry> entries;
  entries.reserve(plans.size());
  for (const auto& plan : plans) {
    entries.push_back(execute(plan));
  }
  IOManager::log(std::format("Recorded {} journal entries in {}.",
                             entries.size(),
                             safe_path_to_string(m_journal.path())));
  return entries;
}
