#pragma once

#include <optional>
#include <vector>

#include "types.hpp"

struct sqlite3;

// Scan cache keyed by doc_id. One row per document; the payload column holds
// the serialized Document. Rows are never deleted here, so a document whose
// content changed leaves its previous id behind.
class DocumentStore {
 public:
  explicit DocumentStore(const fs::path& dbPath);
  ~DocumentStore();

  DocumentStore(const DocumentStore&) = delete;
  DocumentStore& operator=(const DocumentStore&) = delete;

  // Insert-or-replace inside a single transaction.
  void upsert(const std::vector<Document>& documents);

  std::vector<Document> load_all() const;
  std::optional<Document> find(const std::string& docId) const;
  std::size_t count() const;

 private:
  void execute(const char* sql) const;

  sqlite3* m_db = nullptr;
  fs::path m_path;
};
