#include "Journal.hpp"

#include <fstream>

#include "IOManager.hpp"

Journal::Journal(fs::path path) : m_path(std::move(path)) {}

void Journal::append(const JournalEntry& entry) {
  const std::string line =
      json(entry).dump(-1, ' ', false, json::error_handler_t::replace);

  std::scoped_lock lock(m_mutex);
  ensure_directory(m_path.parent_path());
  std::ofstream out(m_path, std::ios_base::app);
  out << line << '\n' << std::flush;
  if (!out) {
    throw std::runtime_error(std::format("Failed to append to journal '{}'",
                                         safe_path_to_string(m_path)));
  }
}

std::vector<JournalEntry> Journal::read_all() const {
  std::vector<JournalEntry> entries;
  std::scoped_lock lock(m_mutex);
  std::ifstream in(m_path);
  if (!in) {
    return entries;
  }

  std::string line;
  size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    try {
      entries.push_back(json::parse(line).get<JournalEntry>());
    } catch (const json::exception& e) {
      IOManager::log(std::format("Skipping unreadable journal line {}: {}",
                                 line_number, e.what()));
    } catch (const ValidationError& e) {
      IOManager::log(std::format("Skipping invalid journal line {}: {}",
                                 line_number, e.what()));
    }
  }
  return entries;
}
