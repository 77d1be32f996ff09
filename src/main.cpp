#include "commands.hpp"
#include "config.hpp"
#include "error.hpp"
#include "http.hpp"
#include "interceptor.hpp"
#include "session.hpp"
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

static std::atomic<bool> g_interrupted{false};
static std::atomic<bool> g_turn_active{false};

// First Ctrl+C during a turn cancels it; a second one (or one at the
// prompt) exits, even if the turn is stuck connecting.
static void signal_handler(int /*sig*/) {
    if (!g_turn_active.load() || g_interrupted.exchange(true)) _exit(130);
}

static void print_usage() {
    std::cout << "Usage: cliai [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG    Send a single message and exit\n"
              << "  --profile NAME       Use a named connection profile\n"
              << "  --model NAME         Use specific model\n"
              << "  --endpoint URL       Override the endpoint base URL\n"
              << "  --no-stream          Request a single non-streamed response\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /help, /clear, /model, /system, /retry, /info, /redact, /quit\n"
              << "\n"
              << "Configuration: ~/.cliai/config.json\n"
              << "Environment variables:\n"
              << "  CLIAI_PROFILE, CLIAI_ENDPOINT, CLIAI_API_KEY, CLIAI_MODEL,\n"
              << "  CLIAI_TEMPERATURE, CLIAI_MAX_TOKENS, CLIAI_SYSTEM_PROMPT, CLIAI_STREAM,\n"
              << "  CLIAI_ALLOWED_HOSTS, CLIAI_ENFORCE_ALLOWLIST\n";
}

// Render one turn as it arrives. Ctrl+C cancels it. Returns true on Done.
static bool render_turn(cliai::TurnStream stream) {
    g_interrupted.store(false);
    g_turn_active.store(true);
    bool ok = false;
    bool cancel_sent = false;

    while (!stream.done()) {
        if (!cancel_sent && g_interrupted.load()) {
            stream.cancel();
            cancel_sent = true;
        }

        auto ev = stream.next_for(std::chrono::milliseconds(100));
        if (!ev) continue;

        if (ev->is_delta()) {
            std::cout << ev->text << std::flush;
        } else if (ev->is_done()) {
            std::cout << "\n";
            if (ev->usage) {
                std::cerr << "[tokens: " << ev->usage->prompt_tokens << " in, "
                          << ev->usage->completion_tokens << " out]\n";
            }
            ok = true;
        } else {
            if (!stream.text().empty()) std::cout << "\n";
            std::cerr << "Error [" << cliai::error_kind_name(ev->error_kind) << "]: "
                      << ev->message << "\n";
            if (ev->error_kind != cliai::ErrorKind::Cancelled &&
                ev->error_kind != cliai::ErrorKind::HostNotAllowed &&
                ev->error_kind != cliai::ErrorKind::ConfigInvalid) {
                std::cerr << "Use /retry to send the message again.\n";
            }
        }
    }

    g_turn_active.store(false);
    return ok;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string message;
    std::string profile_name;
    std::string model_name;
    std::string endpoint;
    bool no_stream = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--profile") == 0 && i + 1 < argc) {
            profile_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--endpoint") == 0 && i + 1 < argc) {
            endpoint = argv[++i];
        } else if (std::strcmp(argv[i], "--no-stream") == 0) {
            no_stream = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    cliai::http_init();
    auto config = cliai::Config::load();

    cliai::ConnectionProfile profile;
    std::unique_ptr<cliai::Interceptor> interceptor;
    try {
        profile = config.resolve_profile(profile_name);
        interceptor = cliai::InterceptorRegistry::instance().create(
            config.interceptor.name, config.interceptor);
    } catch (const cliai::ChatError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        cliai::http_cleanup();
        return 1;
    }

    // Override profile with CLI args
    if (!model_name.empty()) profile.model = model_name;
    if (!endpoint.empty()) profile.endpoint = endpoint;
    if (no_stream) profile.stream = false;

    cliai::PayloadLimits limits;
    limits.max_tokens_cap = config.limits.max_tokens_cap;
    limits.max_input_chars = config.limits.max_input_chars;

    cliai::PlatformHttpClient http_client;
    cliai::SessionEngine engine(profile, config.security, config.retry, http_client,
                                std::move(interceptor), config.stream, limits);

    std::signal(SIGINT, signal_handler);

    // Single message mode
    if (!message.empty()) {
        bool ok = render_turn(engine.send_turn(message));
        cliai::http_cleanup();
        return ok ? 0 : 1;
    }

    // Interactive REPL
    std::cout << "cliai\n"
              << "Endpoint: " << profile.endpoint
              << " | Model: " << profile.model << "\n"
              << "Type /help for commands, /quit to exit. Ctrl+C cancels a reply.\n\n";

    std::string line;
    while (true) {
        std::cout << "you> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        // Skip empty lines
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        if (cliai::is_command(line)) {
            auto result = cliai::dispatch_command(line, engine);
            if (result.action == cliai::CommandAction::Quit) break;
            if (result.action == cliai::CommandAction::Retry) {
                render_turn(engine.retry_last());
            } else if (!result.output.empty()) {
                std::cout << result.output << "\n";
            }
            continue;
        }

        render_turn(engine.send_turn(line));
        std::cout << "\n";
    }

    cliai::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
