#include "SqliteCredentialStore.hpp"

#include "TestHeaders.hpp"

using namespace relay;

namespace {
ChatMessage makeMessage(const string& sender, const string& text,
                        int64_t timestamp) {
  ChatMessage message;
  message.set_sender(sender);
  message.set_text(text);
  message.set_timestamp(timestamp);
  return message;
}
}  // namespace

TEST_CASE("SqliteCredentials", "[SqliteCredentialStore]") {
  SqliteCredentialStore store(":memory:");

  REQUIRE(store.createCredential("alice", "hash-a") == CredentialStore::OK);
  REQUIRE(store.createCredential("alice", "hash-b") ==
          CredentialStore::CONFLICT);

  REQUIRE(store.credentialExists("alice"));
  REQUIRE_FALSE(store.credentialExists("bob"));

  REQUIRE(store.verifyCredential("alice", "hash-a"));
  REQUIRE_FALSE(store.verifyCredential("alice", "hash-b"));
  REQUIRE_FALSE(store.verifyCredential("alice", "hash-"));
  REQUIRE_FALSE(store.verifyCredential("bob", "hash-a"));

  REQUIRE(store.countUsers() == 1);
}

TEST_CASE("SqliteHistory", "[SqliteCredentialStore]") {
  SqliteCredentialStore store(":memory:");
  REQUIRE(store.fetchHistory(10).empty());

  for (int i = 0; i < 5; i++) {
    store.appendHistory(makeMessage(i % 2 ? "bob" : "alice",
                                    "message " + to_string(i), 1000 + i));
  }
  REQUIRE(store.countMessages() == 5);

  SECTION("Most recent, oldest first") {
    auto history = store.fetchHistory(3);
    REQUIRE(history.size() == 3);
    REQUIRE(history[0].text() == "message 2");
    REQUIRE(history[1].text() == "message 3");
    REQUIRE(history[2].text() == "message 4");
    REQUIRE(history[1].sender() == "bob");
    REQUIRE(history[2].timestamp() == 1004);
  }

  SECTION("Limit larger than history") {
    REQUIRE(store.fetchHistory(100).size() == 5);
  }

  SECTION("Non-positive limit") {
    REQUIRE(store.fetchHistory(0).empty());
    REQUIRE(store.fetchHistory(-1).empty());
  }
}

TEST_CASE("SqliteHistoryKeepsEmbeddedNul", "[SqliteCredentialStore]") {
  SqliteCredentialStore store(":memory:");
  string text("before\0after", 12);
  store.appendHistory(makeMessage("alice", text, 1000));
  store.appendHistory(makeMessage("bob", "", 1001));

  auto history = store.fetchHistory(2);
  REQUIRE(history.size() == 2);
  REQUIRE(history[0].text().size() == 12);
  REQUIRE(history[0].text() == text);
  REQUIRE(history[1].text().empty());
}

TEST_CASE("SqliteFilePersists", "[SqliteCredentialStore]") {
  string tmpPath = GetTempDirectory() + string("relay_test_db_XXXXXXXX");
  string directory = string(mkdtemp(&tmpPath[0]));
  string dbPath = directory + "/nested/dir/relay.db";

  {
    SqliteCredentialStore store(dbPath);
    REQUIRE(store.createCredential("alice", "hash-a") == CredentialStore::OK);
    store.appendHistory(makeMessage("alice", "hi", 42));
  }
  REQUIRE(fs::exists(dbPath));
  {
    SqliteCredentialStore store(dbPath);
    REQUIRE(store.verifyCredential("alice", "hash-a"));
    REQUIRE(store.createCredential("alice", "hash-a") ==
            CredentialStore::CONFLICT);
    auto history = store.fetchHistory(10);
    REQUIRE(history.size() == 1);
    REQUIRE(history[0].text() == "hi");
  }

  fs::remove_all(directory);
}

TEST_CASE("SqliteConcurrentRegistration", "[SqliteCredentialStore]") {
  SqliteCredentialStore store(":memory:");
  std::atomic<int> created(0);
  vector<shared_ptr<std::thread>> threads;
  for (int i = 0; i < 8; i++) {
    threads.push_back(make_shared<std::thread>([&store, &created]() {
      if (store.createCredential("alice", "hash") == CredentialStore::OK) {
        created++;
      }
    }));
  }
  for (auto& thread : threads) {
    thread->join();
  }
  REQUIRE(created == 1);
  REQUIRE(store.countUsers() == 1);
}

TEST_CASE("SqliteUnopenable", "[SqliteCredentialStore]") {
  string tmpPath = GetTempDirectory() + string("relay_test_db_XXXXXXXX");
  string directory = string(mkdtemp(&tmpPath[0]));
  // A directory cannot be opened as a database
  REQUIRE_THROWS_AS(SqliteCredentialStore(directory), std::runtime_error);
  fs::remove_all(directory);
}
