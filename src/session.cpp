#include "session.hpp"
#include "sse.hpp"
#include "util.hpp"
#include <iostream>

namespace cliai {

// ── TurnState ──────────────────────────────────────────────────

void TurnState::request_cancel() {
    cancel.cancel();
    queue.close();
}

void TurnState::join() {
    std::lock_guard<std::mutex> lock(mutex);
    if (worker.joinable()) worker.join();
}

// ── TurnStream ─────────────────────────────────────────────────

TurnStream::TurnStream(std::shared_ptr<TurnState> state) : state_(std::move(state)) {}

TurnStream::~TurnStream() {
    abandon();
}

TurnStream& TurnStream::operator=(TurnStream&& other) noexcept {
    if (this != &other) {
        abandon();
        state_ = std::move(other.state_);
    }
    return *this;
}

void TurnStream::abandon() {
    if (!state_) return;
    if (!state_->finished) state_->request_cancel();
    state_->join();
    state_.reset();
}

void TurnStream::cancel() {
    if (state_ && !state_->finished) state_->request_cancel();
}

const std::string& TurnStream::text() const {
    static const std::string kEmpty;
    return state_ ? state_->text : kEmpty;
}

StreamEvent TurnStream::finish(StreamEvent terminal) {
    state_->finished = true;
    state_->join();
    if (terminal.is_done()) {
        std::function<void(const std::string&)> on_done;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            on_done = std::move(state_->on_done);
            state_->on_done = nullptr;
        }
        if (on_done) on_done(state_->text);
    }
    return terminal;
}

std::string TurnStream::restore_delta(const std::string& text) {
    const Interceptor* r = state_->restorer;
    if (!r) return text;
    std::string& pending = state_->pending;
    pending += text;
    size_t keep = std::min(r->pending_suffix(pending), pending.size());
    std::string ready = pending.substr(0, pending.size() - keep);
    pending.erase(0, pending.size() - keep);
    return r->restore(ready);
}

std::optional<StreamEvent> TurnStream::deliver(std::optional<StreamEvent> ev) {
    // Anything still queued after a cancel is discarded
    if (state_->cancel.cancelled()) {
        return finish(StreamEvent::error(ErrorKind::Cancelled, "Turn cancelled"));
    }
    if (state_->held) {
        StreamEvent terminal = std::move(*state_->held);
        state_->held.reset();
        return finish(std::move(terminal));
    }
    if (!ev) {
        if (!state_->queue.closed()) return std::nullopt; // timeout
        ev = StreamEvent::error(ErrorKind::ProviderError, "Turn ended without a terminal event");
    }
    if (ev->is_delta()) {
        auto shown = StreamEvent::delta(restore_delta(ev->text));
        state_->text += shown.text;
        return shown;
    }
    if (!state_->pending.empty()) {
        // Flush the held-back tail first; the terminal follows on the next call
        auto tail = StreamEvent::delta(state_->restorer->restore(state_->pending));
        state_->pending.clear();
        state_->held = std::move(*ev);
        state_->text += tail.text;
        return tail;
    }
    return finish(std::move(*ev));
}

std::optional<StreamEvent> TurnStream::next() {
    while (!done()) {
        std::optional<StreamEvent> ev;
        if (state_->cancel.cancelled() || state_->held) {
            ev = deliver(std::nullopt);
        } else {
            ev = deliver(state_->queue.pop());
        }
        // A delta held back entirely is not an event
        if (!ev || !ev->is_delta() || !ev->text.empty()) return ev;
    }
    return std::nullopt;
}

std::optional<StreamEvent> TurnStream::next_for(std::chrono::milliseconds timeout) {
    if (done()) return std::nullopt;
    std::optional<StreamEvent> ev;
    if (state_->cancel.cancelled() || state_->held) {
        ev = deliver(std::nullopt);
    } else {
        ev = deliver(state_->queue.pop_for(timeout));
    }
    if (ev && ev->is_delta() && ev->text.empty()) return std::nullopt;
    return ev;
}

// ── SessionEngine ──────────────────────────────────────────────

SessionEngine::SessionEngine(ConnectionProfile profile,
                             AllowlistPolicy allowlist,
                             RetryPolicy retry,
                             HttpClient& http,
                             std::unique_ptr<Interceptor> interceptor,
                             StreamConfig stream,
                             PayloadLimits limits,
                             HostResolver resolver)
    : profile_(std::move(profile)),
      gate_(std::move(allowlist), std::move(resolver)),
      retry_(std::move(retry)),
      http_(http),
      interceptor_(interceptor ? std::move(interceptor)
                               : std::make_unique<IdentityInterceptor>()),
      stream_config_(stream),
      builder_(limits),
      conversation_(profile_.system_prompt) {}

SessionEngine::~SessionEngine() {
    cancel_current();
}

std::vector<Header> SessionEngine::request_headers(bool stream) const {
    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    if (!profile_.api_key.empty()) {
        headers.emplace_back("Authorization", "Bearer " + profile_.api_key);
    }
    if (stream) headers.emplace_back("Accept", "text/event-stream");
    return headers;
}

void SessionEngine::cancel_current() {
    if (!current_) return;
    {
        std::lock_guard<std::mutex> lock(current_->mutex);
        current_->on_done = nullptr;
    }
    if (!current_->finished) current_->request_cancel();
    current_->join();
    current_.reset();
}

void SessionEngine::cancel() {
    if (current_ && !current_->finished) current_->request_cancel();
}

bool SessionEngine::busy() const {
    return current_ && !current_->finished && !current_->cancel.cancelled();
}

void SessionEngine::set_model(const std::string& model) {
    if (busy()) {
        throw ChatError(ErrorKind::ConfigInvalid, "Cannot change model while a turn is in flight");
    }
    if (trim(model).empty()) {
        throw ChatError(ErrorKind::ConfigInvalid, "Model name must not be empty");
    }
    profile_.model = model;
}

void SessionEngine::set_system_prompt(const std::string& prompt) {
    profile_.system_prompt = prompt;
    conversation_.set_system_prompt(prompt);
}

void SessionEngine::clear() {
    cancel_current();
    conversation_.clear();
    last_user_.clear();
    last_message_committed_ = false;
}

TurnStream SessionEngine::failed_turn(const ChatError& error) {
    std::cerr << "[session] Turn failed before sending: " << error_kind_name(error.kind())
              << ": " << error.what() << '\n';
    auto state = std::make_shared<TurnState>(1);
    state->queue.push(StreamEvent::error(error));
    state->queue.close();
    return TurnStream(std::move(state));
}

void SessionEngine::commit(const std::string& user_text, const std::string& assistant_text,
                           bool replace_last) {
    if (replace_last && conversation_.ends_with_exchange(user_text)) {
        conversation_.pop_last_exchange();
    }
    conversation_.add_user(user_text);
    conversation_.add_assistant(assistant_text);
    last_message_committed_ = true;
}

TurnStream SessionEngine::send_turn(const std::string& user_text,
                                    const PayloadOverrides& overrides) {
    cancel_current();
    last_message_committed_ = false;
    return start_turn(user_text, conversation_, false, overrides);
}

TurnStream SessionEngine::retry_last() {
    cancel_current();
    if (last_user_.empty()) {
        return failed_turn(ChatError(ErrorKind::ConfigInvalid, "No previous message to retry"));
    }
    bool replace = last_message_committed_ && conversation_.ends_with_exchange(last_user_);
    Conversation base = conversation_;
    if (replace) base.pop_last_exchange();
    std::string user_text = last_user_;
    return start_turn(user_text, base, replace, {});
}

TurnStream SessionEngine::start_turn(const std::string& user_text,
                                     const Conversation& base,
                                     bool replace_last,
                                     const PayloadOverrides& overrides) {
    if (!trim(user_text).empty()) last_user_ = user_text;

    // Build, intercept and gate run here so that local failures never
    // reach the network.
    Payload payload;
    try {
        payload = builder_.build(profile_, base, user_text, overrides);
        try {
            payload = interceptor_->transform(std::move(payload));
        } catch (const ChatError&) {
            throw;
        } catch (const std::exception& e) {
            throw ChatError(ErrorKind::InterceptorFailed,
                            "Interceptor '" + interceptor_->name() + "' failed: " + e.what());
        }
        gate_.check(profile_.chat_url());
    } catch (const ChatError& e) {
        return failed_turn(e);
    }

    TransportRequest request;
    request.url = profile_.chat_url();
    request.body = payload.dump();
    request.headers = request_headers(payload.stream);
    request.timeout_seconds = profile_.timeout_seconds;
    request.stream = payload.stream;

    auto state = std::make_shared<TurnState>(stream_config_.queue_capacity);
    state->restorer = interceptor_.get();
    state->on_done = [this, user_text, replace_last](const std::string& text) {
        commit(user_text, text, replace_last);
    };

    DecoderOptions decoder_options{stream_config_.max_consecutive_malformed};
    Sleeper sleeper = sleeper_;
    JitterSource jitter = jitter_;
    HttpClient& http = http_;
    const AllowlistGate& gate = gate_;
    RetryPolicy retry = retry_;
    TurnState* raw = state.get();

    state->worker = std::thread([raw, request, decoder_options, sleeper, jitter,
                                 &http, &gate, retry]() {
        auto sink = [raw](const StreamEvent& ev) { return raw->queue.push(ev); };
        try {
            RetryingTransport transport(http, gate, retry);
            if (sleeper) transport.set_sleeper(sleeper);
            if (jitter) transport.set_jitter_source(jitter);

            if (request.stream) {
                StreamDecoder decoder(decoder_options);
                transport.execute(request,
                    [&](const char* data, size_t len) {
                        return decoder.feed(data, len, sink);
                    },
                    raw->cancel);
                decoder.finish(sink);
            } else {
                auto result = transport.execute(request, {}, raw->cancel);
                for (const auto& ev : decode_completion(result.body)) {
                    if (!sink(ev)) break;
                }
            }
        } catch (const ChatError& e) {
            if (e.kind() != ErrorKind::Cancelled) {
                std::string msg = e.what();
                std::cerr << "[session] Turn failed: " << error_kind_name(e.kind())
                          << ": " << msg.substr(0, msg.find('\n')) << '\n';
            }
            sink(StreamEvent::error(e));
        } catch (const std::exception& e) {
            std::cerr << "[session] Turn failed: " << e.what() << '\n';
            sink(StreamEvent::error(ErrorKind::ProviderError, e.what()));
        }
        raw->queue.close();
    });

    current_ = state;
    return TurnStream(std::move(state));
}

} // namespace cliai
