#include "AuthenticationStateMachine.hpp"

namespace relay {
AuthenticationStateMachine::AuthenticationStateMachine(
    shared_ptr<CredentialStore> _store, shared_ptr<PasswordHasher> _hasher,
    const AuthPolicy& _policy, UsernamePredicate _isUsernameLive,
    UsernamePredicate _claimUsername)
    : store(_store),
      hasher(_hasher),
      policy(_policy),
      isUsernameLive(_isUsernameLive),
      claimUsername(_claimUsername),
      state(CONNECTED),
      choice(AuthChoice::NONE),
      attempts(0) {}

vector<string> AuthenticationStateMachine::start() {
  if (state != CONNECTED) {
    STFATAL << "Authentication already started";
  }
  state = AWAIT_CHOICE;
  return {TOKEN_AUTH_REQUIRED};
}

vector<string> AuthenticationStateMachine::handleInput(const string& input) {
  switch (state) {
    case AWAIT_CHOICE:
      return handleChoice(input);
    case AWAIT_USERNAME:
      return handleUsername(input);
    case AWAIT_PASSWORD:
      return handlePassword(input);
    case CONNECTED:
      STFATAL << "Got input before start()";
      break;
    default:
      VLOG(1) << "Ignoring input in terminal state " << int(state);
      break;
  }
  return {};
}

vector<string> AuthenticationStateMachine::handleChoice(const string& input) {
  choice = parseAuthChoice(input);
  if (choice == AuthChoice::NONE) {
    return retry("unknown choice");
  }
  state = AWAIT_USERNAME;
  return {TOKEN_ENTER_USERNAME};
}

vector<string> AuthenticationStateMachine::handleUsername(const string& input) {
  string candidate = trim(input);
  if (int(candidate.length()) < policy.minUsernameLength) {
    return retry("username too short");
  }
  if (isUsernameLive(candidate)) {
    return reject("username " + candidate + " is already online");
  }
  if (choice == AuthChoice::REGISTER) {
    bool exists;
    try {
      exists = store->credentialExists(candidate);
    } catch (const std::runtime_error& re) {
      return reject(string("credential lookup failed: ") + re.what());
    }
    if (exists) {
      auto tokens = retry("username " + candidate + " is already registered");
      if (state == AWAIT_CHOICE) {
        tokens.insert(tokens.begin(), TOKEN_USERNAME_EXISTS);
      }
      return tokens;
    }
  }
  username = candidate;
  state = AWAIT_PASSWORD;
  return {TOKEN_ENTER_PASSWORD};
}

vector<string> AuthenticationStateMachine::handlePassword(
    const string& password) {
  if (int(password.length()) < policy.minPasswordLength) {
    return reject("password too short");
  }
  bool accepted;
  try {
    accepted = checkPassword(password);
  } catch (const std::runtime_error& re) {
    return reject(string("credential store failed: ") + re.what());
  }
  if (!accepted) {
    return reject(choice == AuthChoice::LOGIN ? "invalid credentials"
                                              : "username already registered");
  }
  if (!claimUsername(username)) {
    return reject("username " + username + " is already online");
  }
  state = AUTHENTICATED;
  LOG(INFO) << "Authenticated " << username << " via "
            << (choice == AuthChoice::LOGIN ? TOKEN_LOGIN : TOKEN_REGISTER);
  return {TOKEN_AUTH_SUCCESS};
}

bool AuthenticationStateMachine::checkPassword(const string& password) {
  string passwordHash = hasher->hash(username, password);
  if (choice == AuthChoice::LOGIN) {
    return store->verifyCredential(username, passwordHash);
  }
  return store->createCredential(username, passwordHash) ==
         CredentialStore::OK;
}

vector<string> AuthenticationStateMachine::retry(const string& reason) {
  attempts++;
  if (attempts >= policy.maxAttempts) {
    return reject(reason + ", no attempts left");
  }
  LOG(INFO) << "Authentication retry " << attempts << "/"
            << policy.maxAttempts << ": " << reason;
  state = AWAIT_CHOICE;
  choice = AuthChoice::NONE;
  return {TOKEN_AUTH_REQUIRED};
}

vector<string> AuthenticationStateMachine::reject(const string& reason) {
  LOG(INFO) << "Authentication rejected: " << reason;
  state = REJECTED;
  return {TOKEN_AUTH_FAILED};
}
}  // namespace relay
