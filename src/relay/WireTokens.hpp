#ifndef __RELAY_WIRE_TOKENS__
#define __RELAY_WIRE_TOKENS__

#include "Headers.hpp"

namespace relay {
// Server to client authentication prompts and results
extern const char* const TOKEN_AUTH_REQUIRED;
extern const char* const TOKEN_ENTER_USERNAME;
extern const char* const TOKEN_ENTER_PASSWORD;
extern const char* const TOKEN_AUTH_SUCCESS;
extern const char* const TOKEN_AUTH_FAILED;
// Sent ahead of AUTH_REQUIRED when REGISTER names a stored user
extern const char* const TOKEN_USERNAME_EXISTS;

// Client to server path selection
extern const char* const TOKEN_LOGIN;
extern const char* const TOKEN_REGISTER;

// Client request to end the session
extern const char* const TOKEN_QUIT;

enum class AuthChoice { NONE, LOGIN, REGISTER };

/**
 * @brief Maps a client's path selection to an AuthChoice. Surrounding
 * whitespace and letter case are ignored; anything else yields NONE.
 */
AuthChoice parseAuthChoice(const string& input);

/** @brief True when the decoded chat text asks to leave. */
bool isQuitCommand(const string& text);

/** @brief `<username>: <text>` */
string formatChatLine(const ChatMessage& message);

/** @brief `[SERVER] <username> joined the chat` */
string formatJoinNotice(const string& username);

/** @brief `[SERVER] <username> left the chat` */
string formatLeaveNotice(const string& username);
}  // namespace relay

#endif  // __RELAY_WIRE_TOKENS__
