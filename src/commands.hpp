#pragma once
#include <string>

namespace cliai {

class SessionEngine;

// Slash-command handlers for the REPL. Each returns a string result for the
// caller to print; /retry and /quit need the caller's turn loop, so they are
// reported through CommandAction instead.

enum class CommandAction { None, Retry, Quit };

struct CommandResult {
    std::string output;
    CommandAction action = CommandAction::None;
};

bool is_command(const std::string& line);

CommandResult dispatch_command(const std::string& line, SessionEngine& engine);

std::string cmd_help();
std::string cmd_info(const SessionEngine& engine);
std::string cmd_clear(SessionEngine& engine);
std::string cmd_redact(SessionEngine& engine);

// These mutate the session's profile.
std::string cmd_model(const std::string& new_model, SessionEngine& engine);
std::string cmd_system(const std::string& prompt, SessionEngine& engine);

} // namespace cliai
