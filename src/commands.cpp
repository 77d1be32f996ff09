#include "commands.hpp"
#include "error.hpp"
#include "session.hpp"
#include "util.hpp"

namespace cliai {

bool is_command(const std::string& line) {
    return !line.empty() && line[0] == '/';
}

std::string cmd_help() {
    return "Commands:\n"
           "  /help             Show this help\n"
           "  /clear            Clear conversation history\n"
           "  /model [NAME]     Show or switch the model\n"
           "  /system [PROMPT]  Show or set the system prompt\n"
           "  /retry            Re-send the last message\n"
           "  /info             Show connection details\n"
           "  /redact           Show the redaction mapping\n"
           "  /quit, /exit      Exit\n";
}

std::string cmd_info(const SessionEngine& engine) {
    const auto& p = engine.profile();
    const auto& policy = engine.gate().policy();
    std::string result = "Profile: " + p.name + "\n"
        + "Endpoint: " + p.endpoint + "\n"
        + "Model: " + p.model + "\n"
        + "API key: " + p.display_key() + "\n"
        + "Streaming: " + (p.stream ? "on" : "off") + "\n"
        + "History: " + std::to_string(engine.conversation().size()) + " messages\n"
        + "Allowlist: ";
    if (!policy.enforced) {
        result += "not enforced\n";
    } else {
        std::string hosts;
        for (const auto& h : policy.hosts) {
            if (!hosts.empty()) hosts += ", ";
            hosts += h;
        }
        result += "enforced (" + (hosts.empty() ? std::string("no hosts") : hosts) + ")\n";
    }
    return result;
}

std::string cmd_clear(SessionEngine& engine) {
    engine.clear();
    return "History cleared.";
}

std::string cmd_redact(SessionEngine& engine) {
    if (engine.interceptor().name() != "redact") {
        return "Redaction is not enabled (set interceptor.name to \"redact\").";
    }
    return engine.interceptor().describe();
}

std::string cmd_model(const std::string& new_model, SessionEngine& engine) {
    std::string model = trim(new_model);
    if (model.empty()) return "Model: " + engine.profile().model;
    try {
        engine.set_model(model);
    } catch (const ChatError& e) {
        return e.what();
    }
    return "Model set to: " + model;
}

std::string cmd_system(const std::string& prompt, SessionEngine& engine) {
    std::string p = trim(prompt);
    if (p.empty()) {
        const auto& current = engine.conversation().system_prompt();
        return current.empty() ? "No system prompt set." : "System prompt: " + current;
    }
    engine.set_system_prompt(p);
    return "System prompt set.";
}

CommandResult dispatch_command(const std::string& line, SessionEngine& engine) {
    std::string trimmed = trim(line);
    auto space = trimmed.find(' ');
    std::string name = to_lower(space == std::string::npos ? trimmed : trimmed.substr(0, space));
    std::string args = space == std::string::npos ? "" : trim(trimmed.substr(space + 1));

    if (name == "/quit" || name == "/exit") return {"", CommandAction::Quit};
    if (name == "/retry") return {"", CommandAction::Retry};
    if (name == "/help") return {cmd_help()};
    if (name == "/clear") return {cmd_clear(engine)};
    if (name == "/model") return {cmd_model(args, engine)};
    if (name == "/system") return {cmd_system(args, engine)};
    if (name == "/info") return {cmd_info(engine)};
    if (name == "/redact") return {cmd_redact(engine)};
    return {"Unknown command: " + name + " (try /help)"};
}

} // namespace cliai
