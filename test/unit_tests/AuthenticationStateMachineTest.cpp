#include "AuthenticationStateMachine.hpp"

#include "FakeCredentialStore.hpp"
#include "TestHeaders.hpp"

using namespace relay;

namespace {
class AuthFixture {
 public:
  AuthFixture()
      : store(new FakeCredentialStore()),
        hasher(new PasswordHasher(PasswordHasher::minimal())),
        claimsAllowed(true) {}

  shared_ptr<AuthenticationStateMachine> newMachine() {
    return make_shared<AuthenticationStateMachine>(
        store, hasher, policy,
        [this](const string& username) { return live.count(username) > 0; },
        [this](const string& username) {
          if (!claimsAllowed || live.count(username)) {
            return false;
          }
          live.insert(username);
          return true;
        });
  }

  // Feeds each input in turn and returns every token the machine sent.
  vector<string> run(shared_ptr<AuthenticationStateMachine> machine,
                     const vector<string>& inputs) {
    vector<string> out = machine->start();
    for (const auto& input : inputs) {
      auto tokens = machine->handleInput(input);
      out.insert(out.end(), tokens.begin(), tokens.end());
    }
    return out;
  }

  shared_ptr<FakeCredentialStore> store;
  shared_ptr<PasswordHasher> hasher;
  AuthPolicy policy;
  set<string> live;
  bool claimsAllowed;
};
}  // namespace

TEST_CASE("RegisterReachesAuthenticated", "[AuthenticationStateMachine]") {
  AuthFixture f;
  auto machine = f.newMachine();
  REQUIRE(machine->getState() == CONNECTED);

  REQUIRE(machine->start() == vector<string>({"AUTH_REQUIRED"}));
  REQUIRE(machine->getState() == AWAIT_CHOICE);

  REQUIRE(machine->handleInput("REGISTER") ==
          vector<string>({"ENTER_USERNAME"}));
  REQUIRE(machine->getState() == AWAIT_USERNAME);

  REQUIRE(machine->handleInput("alice") == vector<string>({"ENTER_PASSWORD"}));
  REQUIRE(machine->getState() == AWAIT_PASSWORD);

  REQUIRE(machine->handleInput("pass1234") ==
          vector<string>({"AUTH_SUCCESS"}));
  REQUIRE(machine->getState() == AUTHENTICATED);
  REQUIRE(machine->isFinished());
  REQUIRE(machine->getUsername() == "alice");

  // Only the hash reaches the store, and the name was claimed
  string stored = f.store->getPasswordHash("alice");
  REQUIRE(stored == f.hasher->hash("alice", "pass1234"));
  REQUIRE(stored != "pass1234");
  REQUIRE(f.live.count("alice"));
}

TEST_CASE("LoginOutcomes", "[AuthenticationStateMachine]") {
  AuthFixture f;
  f.store->createCredential("alice", f.hasher->hash("alice", "pass1234"));

  SECTION("Correct password") {
    auto machine = f.newMachine();
    REQUIRE(f.run(machine, {"login", "alice", "pass1234"}).back() ==
            "AUTH_SUCCESS");
    REQUIRE(machine->getState() == AUTHENTICATED);
  }

  SECTION("Wrong password") {
    auto machine = f.newMachine();
    REQUIRE(f.run(machine, {"LOGIN", "alice", "wrongpass"}).back() ==
            "AUTH_FAILED");
    REQUIRE(machine->getState() == REJECTED);
    REQUIRE(f.live.empty());
  }

  SECTION("Unknown user") {
    auto machine = f.newMachine();
    REQUIRE(f.run(machine, {"LOGIN", "mallory", "pass1234"}).back() ==
            "AUTH_FAILED");
    REQUIRE(machine->getState() == REJECTED);
  }

  SECTION("Already online") {
    f.live.insert("alice");
    auto machine = f.newMachine();
    REQUIRE(f.run(machine, {"LOGIN", "alice"}).back() == "AUTH_FAILED");
    REQUIRE(machine->getState() == REJECTED);
  }

  SECTION("Lost the race for the name") {
    f.claimsAllowed = false;
    auto machine = f.newMachine();
    REQUIRE(f.run(machine, {"LOGIN", "alice", "pass1234"}).back() ==
            "AUTH_FAILED");
    REQUIRE(machine->getState() == REJECTED);
  }
}

TEST_CASE("RetriesAreBounded", "[AuthenticationStateMachine]") {
  AuthFixture f;
  f.store->createCredential("alice", f.hasher->hash("alice", "pass1234"));
  auto machine = f.newMachine();
  machine->start();

  SECTION("Unknown choices") {
    REQUIRE(machine->handleInput("HELLO") ==
            vector<string>({"AUTH_REQUIRED"}));
    REQUIRE(machine->getState() == AWAIT_CHOICE);
    REQUIRE(machine->handleInput("") == vector<string>({"AUTH_REQUIRED"}));
    REQUIRE(machine->getAttempts() == 2);
    REQUIRE(machine->handleInput("LOGOUT") ==
            vector<string>({"AUTH_FAILED"}));
    REQUIRE(machine->getState() == REJECTED);
  }

  SECTION("Short username goes back to the choice") {
    REQUIRE(machine->handleInput("REGISTER") ==
            vector<string>({"ENTER_USERNAME"}));
    REQUIRE(machine->handleInput("al") == vector<string>({"AUTH_REQUIRED"}));
    REQUIRE(machine->getState() == AWAIT_CHOICE);
    REQUIRE(machine->getAttempts() == 1);
  }

  SECTION("Registering a stored name goes back to the choice") {
    REQUIRE(machine->handleInput("REGISTER") ==
            vector<string>({"ENTER_USERNAME"}));
    REQUIRE(machine->handleInput("alice") ==
            vector<string>({"USERNAME_EXISTS", "AUTH_REQUIRED"}));
    REQUIRE(machine->getState() == AWAIT_CHOICE);
    REQUIRE(machine->getAttempts() == 1);

    // The client can still log in instead
    REQUIRE(machine->handleInput("LOGIN") ==
            vector<string>({"ENTER_USERNAME"}));
    REQUIRE(machine->handleInput("alice") ==
            vector<string>({"ENTER_PASSWORD"}));
    REQUIRE(machine->handleInput("pass1234") ==
            vector<string>({"AUTH_SUCCESS"}));
  }

  SECTION("Mixed failures share one budget") {
    machine->handleInput("NOPE");
    machine->handleInput("REGISTER");
    machine->handleInput("x");
    REQUIRE(machine->getState() == AWAIT_CHOICE);
    machine->handleInput("REGISTER");
    REQUIRE(machine->handleInput("alice") == vector<string>({"AUTH_FAILED"}));
    REQUIRE(machine->getState() == REJECTED);
  }
}

TEST_CASE("RegisterFailures", "[AuthenticationStateMachine]") {
  AuthFixture f;
  auto machine = f.newMachine();

  SECTION("Short password") {
    REQUIRE(f.run(machine, {"REGISTER", "alice", "123"}).back() ==
            "AUTH_FAILED");
    REQUIRE(f.store->getPasswordHash("alice").empty());
  }

  SECTION("Name created concurrently") {
    f.store->conflictOnCreate = true;
    REQUIRE(f.run(machine, {"REGISTER", "alice", "pass1234"}).back() ==
            "AUTH_FAILED");
  }

  SECTION("Store failure") {
    f.store->failCreate = true;
    REQUIRE(f.run(machine, {"REGISTER", "alice", "pass1234"}).back() ==
            "AUTH_FAILED");
  }

  SECTION("Lookup failure") {
    f.store->failLookups = true;
    REQUIRE(f.run(machine, {"REGISTER", "alice"}).back() == "AUTH_FAILED");
  }

  REQUIRE(machine->getState() == REJECTED);
  REQUIRE(f.live.empty());
}

TEST_CASE("InputAfterTheEndIsIgnored", "[AuthenticationStateMachine]") {
  AuthFixture f;
  auto machine = f.newMachine();
  f.run(machine, {"REGISTER", "alice", "pass1234"});
  REQUIRE(machine->getState() == AUTHENTICATED);
  REQUIRE(machine->handleInput("LOGIN").empty());
  REQUIRE(machine->getState() == AUTHENTICATED);
}

TEST_CASE("InputIsTrimmed", "[AuthenticationStateMachine]") {
  AuthFixture f;
  auto machine = f.newMachine();
  REQUIRE(f.run(machine, {" register\n", "  bob \r\n", "pass5678"}).back() ==
          "AUTH_SUCCESS");
  REQUIRE(machine->getUsername() == "bob");
  REQUIRE(f.store->getPasswordHash("bob") ==
          f.hasher->hash("bob", "pass5678"));
}

TEST_CASE("PasswordIsUsedAsSent", "[AuthenticationStateMachine]") {
  AuthFixture f;
  REQUIRE(f.run(f.newMachine(), {"REGISTER", "carol", " pass 1234 "}).back() ==
          "AUTH_SUCCESS");
  REQUIRE(f.store->getPasswordHash("carol") ==
          f.hasher->hash("carol", " pass 1234 "));
  f.live.clear();

  auto trimmed = f.newMachine();
  REQUIRE(f.run(trimmed, {"LOGIN", "carol", "pass 1234"}).back() ==
          "AUTH_FAILED");

  auto exact = f.newMachine();
  REQUIRE(f.run(exact, {"LOGIN", "carol", " pass 1234 "}).back() ==
          "AUTH_SUCCESS");
}
