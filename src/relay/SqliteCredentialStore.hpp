#ifndef __RELAY_SQLITE_CREDENTIAL_STORE__
#define __RELAY_SQLITE_CREDENTIAL_STORE__

#include <sqlite3.h>

#include "CredentialStore.hpp"

namespace relay {
/**
 * @brief CredentialStore backed by a single SQLite database file.
 *
 * Schema:
 *   users(id, username UNIQUE, password_hash, created_at)
 *   messages(id, username, message, timestamp)
 *
 * One connection is shared by all workers; a mutex serializes statements.
 */
class SqliteCredentialStore : public CredentialStore {
 public:
  /**
   * @brief Opens (creating if needed) the database at @p path. The parent
   * directory is created when missing. ":memory:" opens a private in-memory
   * database.
   * @throws std::runtime_error when the database cannot be opened.
   */
  explicit SqliteCredentialStore(const string& path);
  virtual ~SqliteCredentialStore();

  virtual CreateResult createCredential(const string& username,
                                        const string& passwordHash);
  virtual bool verifyCredential(const string& username,
                                const string& passwordHash);
  virtual bool credentialExists(const string& username);
  virtual void appendHistory(const ChatMessage& message);
  virtual vector<ChatMessage> fetchHistory(int limit);

  int64_t countUsers();
  int64_t countMessages();

 protected:
  sqlite3* db;
  std::mutex dbMutex;

  void initTables();
  void exec(const char* sql);
  sqlite3_stmt* prepare(const char* sql);
  int64_t countRows(const char* sql);
};
}  // namespace relay

#endif  // __RELAY_SQLITE_CREDENTIAL_STORE__
