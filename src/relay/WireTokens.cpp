#include "WireTokens.hpp"

namespace relay {
const char* const TOKEN_AUTH_REQUIRED = "AUTH_REQUIRED";
const char* const TOKEN_ENTER_USERNAME = "ENTER_USERNAME";
const char* const TOKEN_ENTER_PASSWORD = "ENTER_PASSWORD";
const char* const TOKEN_AUTH_SUCCESS = "AUTH_SUCCESS";
const char* const TOKEN_AUTH_FAILED = "AUTH_FAILED";
const char* const TOKEN_USERNAME_EXISTS = "USERNAME_EXISTS";
const char* const TOKEN_LOGIN = "LOGIN";
const char* const TOKEN_REGISTER = "REGISTER";
const char* const TOKEN_QUIT = "/QUIT";

AuthChoice parseAuthChoice(const string& input) {
  string choice = toUpper(trim(input));
  if (choice == TOKEN_LOGIN) {
    return AuthChoice::LOGIN;
  }
  if (choice == TOKEN_REGISTER) {
    return AuthChoice::REGISTER;
  }
  return AuthChoice::NONE;
}

bool isQuitCommand(const string& text) {
  return toUpper(trim(text)) == TOKEN_QUIT;
}

string formatChatLine(const ChatMessage& message) {
  return message.sender() + ": " + message.text();
}

string formatJoinNotice(const string& username) {
  return "[SERVER] " + username + " joined the chat";
}

string formatLeaveNotice(const string& username) {
  return "[SERVER] " + username + " left the chat";
}
}  // namespace relay
