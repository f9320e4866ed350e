#include "DocumentStore.hpp"

#include <sqlite3.h>

#include <format>
#include <stdexcept>

#include "IOManager.hpp"

namespace {
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : m_db(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::format("Failed to prepare statement: {}",
                                           sqlite3_errmsg(db)));
    }
  }
  ~Statement() {
    if (m_stmt) sqlite3_finalize(m_stmt);
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind_text(int index, const std::string& value) {
    if (sqlite3_bind_text(m_stmt, index, value.data(),
                          static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
      throw std::runtime_error(
          std::format("Failed to bind parameter: {}", sqlite3_errmsg(m_db)));
    }
  }

  // Returns true while rows are available.
  bool step() {
    const int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(
        std::format("Statement execution failed: {}", sqlite3_errmsg(m_db)));
  }

  void reset() {
    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
  }

  std::string column_text(int col) const {
    const auto* text =
        reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
    const int size = sqlite3_column_bytes(m_stmt, col);
    return text ? std::string(text, static_cast<std::size_t>(size))
                : std::string();
  }

  std::int64_t column_int64(int col) const {
    return sqlite3_column_int64(m_stmt, col);
  }

 private:
  sqlite3* m_db = nullptr;
  sqlite3_stmt* m_stmt = nullptr;
};

std::optional<Document> decode_payload(const std::string& payload) {
  try {
    return json::parse(payload).get<Document>();
  } catch (const json::exception& e) {
    IOManager::log(std::format("Skipping unreadable cache row: {}", e.what()));
  } catch (const ValidationError& e) {
    IOManager::log(std::format("Skipping invalid cache row: {}", e.what()));
  }
  return std::nullopt;
}
}  // namespace

DocumentStore::DocumentStore(const fs::path& dbPath) : m_path(dbPath) {
  ensure_directory(dbPath.parent_path());
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  if (sqlite3_open_v2(safe_path_to_string(dbPath).c_str(), &m_db, flags,
                      nullptr) != SQLITE_OK) {
    std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
    sqlite3_close(m_db);
    m_db = nullptr;
    throw std::runtime_error(std::format("Failed to open document store '{}': {}",
                                         safe_path_to_string(dbPath), error));
  }
  sqlite3_busy_timeout(m_db, 5000);
  execute(
      "CREATE TABLE IF NOT EXISTS documents ("
      " doc_id TEXT PRIMARY KEY,"
      " payload TEXT NOT NULL)");
}

DocumentStore::~DocumentStore() {
  if (m_db) {
    sqlite3_close(m_db);
  }
}

void DocumentStore::execute(const char* sql) const {
  char* errMsg = nullptr;
  if (sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
    std::string error = errMsg ? errMsg : "Unknown error";
    sqlite3_free(errMsg);
    throw std::runtime_error(std::format("SQL execution failed: {}", error));
  }
}

void DocumentStore::upsert(const std::vector<Document>& documents) {
  execute("BEGIN IMMEDIATE TRANSACTION");
  try {
    Statement stmt(m_db,
                   "INSERT OR REPLACE INTO documents (doc_id, payload) "
                   "VALUES (?, ?)");
    for (const auto& doc : documents) {
      stmt.bind_text(1, doc.doc_id);
      stmt.bind_text(2, json(doc).dump(-1, ' ', false,
                                          json::error_handler_t::replace));
      stmt.step();
      stmt.reset();
    }
    execute("COMMIT");
  } catch (const std::runtime_error&) {
    execute("ROLLBACK");
    throw;
  }
  IOManager::log(std::format("Stored {} documents in {}", documents.size(),
                             safe_path_to_string(m_path)));
}

std::vector<Document> DocumentStore::load_all() const {
  std::vector<Document> documents;
  Statement stmt(m_db, "SELECT payload FROM documents ORDER BY doc_id");
  while (stmt.step()) {
    if (auto doc = decode_payload(stmt.column_text(0))) {
      documents.push_back(std::move(*doc));
    }
  }
  return documents;
}

std::optional<Document> DocumentStore::find(const std::string& docId) const {
  Statement stmt(m_db, "SELECT payload FROM documents WHERE doc_id = ?");
  stmt.bind_text(1, docId);
  if (stmt.step()) {
    return decode_payload(stmt.column_text(0));
  }
  return std::nullopt;
}

std::size_t DocumentStore::count() const {
  Statement stmt(m_db, "SELECT COUNT(*) FROM documents");
  return stmt.step() ? static_cast<std::size_t>(stmt.column_int64(0)) : 0;
}
