#include "SqliteCredentialStore.hpp"

namespace relay {
namespace {
struct StatementCloser {
  void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
typedef std::unique_ptr<sqlite3_stmt, StatementCloser> Statement;

string columnString(sqlite3_stmt* stmt, int column) {
  const char* text = (const char*)sqlite3_column_text(stmt, column);
  if (!text) {
    return string();
  }
  return string(text, sqlite3_column_bytes(stmt, column));
}
}  // namespace

SqliteCredentialStore::SqliteCredentialStore(const string& path) : db(NULL) {
  if (path != ":memory:") {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      fs::create_directories(parent, ec);
      if (ec) {
        throw std::runtime_error("Cannot create database directory " +
                                 parent.string() + ": " + ec.message());
      }
    }
  }

  if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
    string error = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    db = NULL;
    throw std::runtime_error("Error opening database " + path + ": " + error);
  }
  // Concurrent writers from other processes wait instead of failing at once.
  sqlite3_busy_timeout(db, 5000);
  try {
    initTables();
  } catch (const std::runtime_error& e) {
    sqlite3_close(db);
    db = NULL;
    throw;
  }
  LOG(INFO) << "Database initialized: " << path;
}

SqliteCredentialStore::~SqliteCredentialStore() {
  if (db) {
    sqlite3_close(db);
    db = NULL;
  }
}

void SqliteCredentialStore::initTables() {
  exec(
      "CREATE TABLE IF NOT EXISTS users ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT,"
      "username TEXT UNIQUE NOT NULL,"
      "password_hash TEXT NOT NULL,"
      "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP)");
  exec(
      "CREATE TABLE IF NOT EXISTS messages ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT,"
      "username TEXT NOT NULL,"
      "message TEXT NOT NULL,"
      "timestamp INTEGER NOT NULL)");
}

void SqliteCredentialStore::exec(const char* sql) {
  char* err = NULL;
  if (sqlite3_exec(db, sql, NULL, NULL, &err) != SQLITE_OK) {
    string error = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw std::runtime_error("SQL error: " + error);
  }
}

sqlite3_stmt* SqliteCredentialStore::prepare(const char* sql) {
  sqlite3_stmt* stmt = NULL;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt, NULL) != SQLITE_OK) {
    throw std::runtime_error(string("SQL prepare error: ") +
                             sqlite3_errmsg(db));
  }
  return stmt;
}

CredentialStore::CreateResult SqliteCredentialStore::createCredential(
    const string& username, const string& passwordHash) {
  lock_guard<std::mutex> guard(dbMutex);
  Statement stmt(
      prepare("INSERT INTO users (username, password_hash) VALUES (?, ?)"));
  sqlite3_bind_text(stmt.get(), 1, username.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, passwordHash.c_str(), -1,
                    SQLITE_TRANSIENT);
  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    LOG(INFO) << "User registered: " << username;
    return OK;
  }
  if (rc == SQLITE_CONSTRAINT) {
    LOG(INFO) << "Registration conflict for username: " << username;
    return CONFLICT;
  }
  throw std::runtime_error(string("Insert failed: ") + sqlite3_errmsg(db));
}

bool SqliteCredentialStore::verifyCredential(const string& username,
                                             const string& passwordHash) {
  lock_guard<std::mutex> guard(dbMutex);
  Statement stmt(prepare("SELECT password_hash FROM users WHERE username = ?"));
  sqlite3_bind_text(stmt.get(), 1, username.c_str(), -1, SQLITE_TRANSIENT);
  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return false;
  }
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(string("Select failed: ") + sqlite3_errmsg(db));
  }
  const char* stored = (const char*)sqlite3_column_text(stmt.get(), 0);
  int storedLength = sqlite3_column_bytes(stmt.get(), 0);
  if (!stored || size_t(storedLength) != passwordHash.length()) {
    return false;
  }
  return sodium_memcmp(stored, passwordHash.data(), storedLength) == 0;
}

bool SqliteCredentialStore::credentialExists(const string& username) {
  lock_guard<std::mutex> guard(dbMutex);
  Statement stmt(prepare("SELECT 1 FROM users WHERE username = ?"));
  sqlite3_bind_text(stmt.get(), 1, username.c_str(), -1, SQLITE_TRANSIENT);
  int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(string("Select failed: ") + sqlite3_errmsg(db));
  }
  return rc == SQLITE_ROW;
}

void SqliteCredentialStore::appendHistory(const ChatMessage& message) {
  lock_guard<std::mutex> guard(dbMutex);
  Statement stmt(prepare(
      "INSERT INTO messages (username, message, timestamp) VALUES (?, ?, ?)"));
  sqlite3_bind_text(stmt.get(), 1, message.sender().c_str(), -1,
                    SQLITE_TRANSIENT);
  // Decoded payloads may carry NUL bytes, so the length is explicit.
  sqlite3_bind_text(stmt.get(), 2, message.text().data(),
                    int(message.text().size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 3, message.timestamp());
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error(string("Insert failed: ") + sqlite3_errmsg(db));
  }
}

vector<ChatMessage> SqliteCredentialStore::fetchHistory(int limit) {
  vector<ChatMessage> history;
  if (limit <= 0) {
    return history;
  }
  lock_guard<std::mutex> guard(dbMutex);
  Statement stmt(
      prepare("SELECT username, message, timestamp FROM messages "
              "ORDER BY id DESC LIMIT ?"));
  sqlite3_bind_int(stmt.get(), 1, limit);
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    ChatMessage message;
    message.set_sender(columnString(stmt.get(), 0));
    message.set_text(columnString(stmt.get(), 1));
    message.set_timestamp(sqlite3_column_int64(stmt.get(), 2));
    history.push_back(message);
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(string("Select failed: ") + sqlite3_errmsg(db));
  }
  std::reverse(history.begin(), history.end());
  return history;
}

int64_t SqliteCredentialStore::countRows(const char* sql) {
  lock_guard<std::mutex> guard(dbMutex);
  Statement stmt(prepare(sql));
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    throw std::runtime_error(string("Count failed: ") + sqlite3_errmsg(db));
  }
  return sqlite3_column_int64(stmt.get(), 0);
}

int64_t SqliteCredentialStore::countUsers() {
  return countRows("SELECT COUNT(*) FROM users");
}

int64_t SqliteCredentialStore::countMessages() {
  return countRows("SELECT COUNT(*) FROM messages");
}
}  // namespace relay
