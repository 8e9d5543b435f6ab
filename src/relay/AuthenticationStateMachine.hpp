#ifndef __RELAY_AUTHENTICATION_STATE_MACHINE__
#define __RELAY_AUTHENTICATION_STATE_MACHINE__

#include "CredentialStore.hpp"
#include "PasswordHasher.hpp"
#include "ServerConfig.hpp"
#include "WireTokens.hpp"

namespace relay {
/**
 * @brief Drives one connection through LOGIN or REGISTER.
 *
 * The machine performs no I/O itself: start() and handleInput() return the
 * tokens to send back, in order. States advance
 * CONNECTED -> AWAIT_CHOICE -> AWAIT_USERNAME -> AWAIT_PASSWORD and end in
 * AUTHENTICATED or REJECTED. Each return to AWAIT_CHOICE counts as an attempt;
 * once AuthPolicy::maxAttempts is reached the client is rejected.
 *
 * Passwords are hashed before reaching the CredentialStore and never logged.
 */
class AuthenticationStateMachine {
 public:
  typedef std::function<bool(const string&)> UsernamePredicate;

  /**
   * @param isUsernameLive Returns true when a live session holds the name.
   * @param claimUsername Called once the credential checks pass; returns
   * false when the name could not be taken (another session got it first).
   */
  AuthenticationStateMachine(shared_ptr<CredentialStore> _store,
                             shared_ptr<PasswordHasher> _hasher,
                             const AuthPolicy& _policy,
                             UsernamePredicate _isUsernameLive,
                             UsernamePredicate _claimUsername);

  /** @brief Leaves CONNECTED and returns the auth prompt. */
  vector<string> start();

  /**
   * @brief Consumes one client frame. Input after a terminal state is ignored.
   *
   * Choice and username input is trimmed; the password is used as sent.
   */
  vector<string> handleInput(const string& input);

  AuthState getState() const { return state; }
  bool isFinished() const {
    return state == AUTHENTICATED || state == REJECTED;
  }
  /** @brief The username being authenticated; set from AWAIT_PASSWORD on. */
  const string& getUsername() const { return username; }
  int getAttempts() const { return attempts; }

 protected:
  shared_ptr<CredentialStore> store;
  shared_ptr<PasswordHasher> hasher;
  AuthPolicy policy;
  UsernamePredicate isUsernameLive;
  UsernamePredicate claimUsername;

  AuthState state;
  AuthChoice choice;
  string username;
  int attempts;

  vector<string> handleChoice(const string& input);
  vector<string> handleUsername(const string& input);
  vector<string> handlePassword(const string& password);
  bool checkPassword(const string& password);

  vector<string> retry(const string& reason);
  vector<string> reject(const string& reason);
};
}  // namespace relay

#endif  // __RELAY_AUTHENTICATION_STATE_MACHINE__
