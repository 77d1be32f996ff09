#pragma once
#include "allowlist.hpp"
#include "cancel.hpp"
#include "config.hpp"
#include "conversation.hpp"
#include "handoff_queue.hpp"
#include "http.hpp"
#include "interceptor.hpp"
#include "payload.hpp"
#include "stream_event.hpp"
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace cliai {

// Shared between a TurnStream (consumer side) and its worker thread.
struct TurnState {
    explicit TurnState(size_t capacity) : queue(capacity) {}

    BoundedQueue<StreamEvent> queue;
    CancelToken cancel;
    std::thread worker;
    std::mutex mutex; // guards on_done and the worker join
    std::function<void(const std::string& assistant_text)> on_done;
    std::string text;
    std::atomic<bool> finished{false}; // terminal event handed to the consumer

    // Consumer side: output is restored through the interceptor before it
    // is shown or committed. `pending` holds a possibly split placeholder.
    const Interceptor* restorer = nullptr;
    std::string pending;
    std::optional<StreamEvent> held; // terminal queued behind the last flush

    void request_cancel();
    void join();
};

// Pull-based, single-pass event sequence for one turn. Ends after exactly
// one terminal event (Done or Error). Destroying an unfinished stream
// cancels the turn and closes its connection.
class TurnStream {
public:
    TurnStream() = default;
    explicit TurnStream(std::shared_ptr<TurnState> state);
    ~TurnStream();

    TurnStream(TurnStream&&) noexcept = default;
    TurnStream& operator=(TurnStream&& other) noexcept;
    TurnStream(const TurnStream&) = delete;
    TurnStream& operator=(const TurnStream&) = delete;

    // Blocks for the next event; nullopt after the terminal event.
    std::optional<StreamEvent> next();

    // nullopt on timeout as well; check done() to tell them apart.
    std::optional<StreamEvent> next_for(std::chrono::milliseconds timeout);

    bool done() const { return !state_ || state_->finished; }

    // After cancel() the next event is a terminal Error(Cancelled).
    void cancel();

    // Assistant text received so far
    const std::string& text() const;

private:
    std::optional<StreamEvent> deliver(std::optional<StreamEvent> ev);
    std::string restore_delta(const std::string& text);
    StreamEvent finish(StreamEvent terminal);
    void abandon();

    std::shared_ptr<TurnState> state_;
};

// Orchestrates turns: build → intercept → gate → transport → decode, and
// commits successful exchanges to the conversation on the consumer's thread.
// One turn in flight at a time.
class SessionEngine {
public:
    SessionEngine(ConnectionProfile profile,
                  AllowlistPolicy allowlist,
                  RetryPolicy retry,
                  HttpClient& http,
                  std::unique_ptr<Interceptor> interceptor = nullptr,
                  StreamConfig stream = {},
                  PayloadLimits limits = {},
                  HostResolver resolver = resolve_host);
    ~SessionEngine();

    SessionEngine(const SessionEngine&) = delete;
    SessionEngine& operator=(const SessionEngine&) = delete;

    // Cancels and waits for any in-flight turn first.
    TurnStream send_turn(const std::string& user_text, const PayloadOverrides& overrides = {});

    // Re-sends the most recent user message. If the previous turn was
    // committed its exchange is replaced on Done; after a failed turn the
    // message is simply sent again.
    TurnStream retry_last();

    void cancel();
    bool busy() const;

    Conversation& conversation() { return conversation_; }
    const Conversation& conversation() const { return conversation_; }
    const ConnectionProfile& profile() const { return profile_; }
    const std::string& last_user_message() const { return last_user_; }

    // Throws ChatError(ConfigInvalid) while a turn is in flight.
    void set_model(const std::string& model);
    void set_system_prompt(const std::string& prompt);

    // Clears history and the retry target
    void clear();

    Interceptor& interceptor() { return *interceptor_; }
    const AllowlistGate& gate() const { return gate_; }

    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_jitter_source(JitterSource jitter) { jitter_ = std::move(jitter); }

private:
    TurnStream start_turn(const std::string& user_text,
                          const Conversation& base,
                          bool replace_last,
                          const PayloadOverrides& overrides);
    TurnStream failed_turn(const ChatError& error);
    void commit(const std::string& user_text, const std::string& assistant_text,
                bool replace_last);
    void cancel_current();
    std::vector<Header> request_headers(bool stream) const;

    ConnectionProfile profile_;
    AllowlistGate gate_;
    RetryPolicy retry_;
    HttpClient& http_;
    std::unique_ptr<Interceptor> interceptor_;
    StreamConfig stream_config_;
    PayloadBuilder builder_;
    Conversation conversation_;
    std::string last_user_;
    bool last_message_committed_ = false; // some turn for last_user_ reached Done
    std::shared_ptr<TurnState> current_;
    Sleeper sleeper_;
    JitterSource jitter_;
};

} // namespace cliai
