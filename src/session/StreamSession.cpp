/**
 * StreamSession.cpp - Protocol dispatch, chunk scheduling and finalization
 */

#include "lts/session/StreamSession.hpp"
#include "lts/protocol/Protocol.hpp"
#include "lts/session/ChunkProcessor.hpp"
#include "lts/session/SessionReconciler.hpp"

#include <boost/asio/post.hpp>

#include <atomic>
#include <condition_variable>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

namespace lts::session {

namespace {

std::atomic<uint64_t> g_session_counter{0};

} // anonymous namespace

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Open:       return "Open";
        case SessionState::Streaming:  return "Streaming";
        case SessionState::Finalizing: return "Finalizing";
        case SessionState::Closed:     return "Closed";
    }
    return "Unknown";
}

struct StreamSession::Impl {
    std::string id;
    std::shared_ptr<stt::TranscriptionEngine> engine;
    boost::asio::thread_pool& workers;
    SessionConfig config;
    SessionCallbacks callbacks;

    std::shared_ptr<ChunkProcessor> chunk_processor;
    SessionReconciler reconciler;

    // State
    mutable std::mutex state_mutex;
    std::condition_variable closed_cv;
    SessionState state = SessionState::Open;
    std::atomic<bool> abandoned{false};

    // Fragments and outstanding chunk tasks
    mutable std::mutex data_mutex;
    std::vector<FragmentPtr> fragments;
    std::vector<std::future<void>> tasks;
    uint64_t fragment_count = 0;

    std::thread finalizer;

    Impl(std::shared_ptr<stt::TranscriptionEngine> eng,
         std::shared_ptr<audio::AudioDecoder> decoder,
         boost::asio::thread_pool& pool,
         SessionConfig cfg)
        : id("session-" + std::to_string(++g_session_counter))
        , engine(eng)
        , workers(pool)
        , config(std::move(cfg))
        , chunk_processor(std::make_shared<ChunkProcessor>(decoder, eng, config.min_chunk_bytes))
        , reconciler(decoder, eng) {
    }

    std::string tag() const {
        return "[StreamSession " + id + "]";
    }

    void send(const std::string& frame) {
        if (abandoned) return;
        if (callbacks.onSend) {
            callbacks.onSend(frame);
        }
    }

    void setState(SessionState new_state) {
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            if (state == new_state || state == SessionState::Closed) return;
            state = new_state;
        }
        std::cout << tag() << " -> " << toString(new_state) << std::endl;

        if (new_state == SessionState::Closed) {
            closed_cv.notify_all();
        }
        if (callbacks.onStateChange) {
            callbacks.onStateChange(new_state);
        }
    }

    SessionState currentState() const {
        std::lock_guard<std::mutex> lock(state_mutex);
        return state;
    }

    void finalize() {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(data_mutex);
            pending.swap(tasks);
        }

        std::cout << tag() << " Waiting for " << pending.size() << " chunk task(s)" << std::endl;

        // Outcomes were already handled inside each task
        for (auto& task : pending) {
            try {
                task.get();
            } catch (const std::exception& e) {
                std::cerr << tag() << " Chunk task ended abnormally: " << e.what() << std::endl;
            }
        }

        if (abandoned) {
            return;
        }

        std::vector<FragmentPtr> snapshot;
        {
            std::lock_guard<std::mutex> lock(data_mutex);
            snapshot = fragments;
        }

        if (!snapshot.empty()) {
            send(protocol::makeProcessing(config.processing_message));
        }

        ReconcileResult outcome = reconciler.reconcile(std::move(snapshot));

        if (abandoned) {
            return;
        }

        if (outcome.ok()) {
            std::cout << tag() << " Final: \"" << outcome.result->text << "\"" << std::endl;
            send(protocol::makeTranscription(*outcome.result));
        } else {
            std::cerr << tag() << " " << toString(outcome.error->kind) << ": "
                      << outcome.error->message << std::endl;
            send(protocol::makeError(outcome.error->message));
        }

        setState(SessionState::Closed);
    }
};

std::shared_ptr<StreamSession> StreamSession::create(std::shared_ptr<stt::TranscriptionEngine> engine,
                                                     std::shared_ptr<audio::AudioDecoder> decoder,
                                                     boost::asio::thread_pool& workers,
                                                     SessionConfig config) {
    return std::shared_ptr<StreamSession>(
        new StreamSession(std::move(engine), std::move(decoder), workers, std::move(config)));
}

StreamSession::StreamSession(std::shared_ptr<stt::TranscriptionEngine> engine,
                             std::shared_ptr<audio::AudioDecoder> decoder,
                             boost::asio::thread_pool& workers,
                             SessionConfig config)
    : impl_(std::make_unique<Impl>(std::move(engine), std::move(decoder), workers, std::move(config))) {
}

StreamSession::~StreamSession() {
    if (impl_->finalizer.joinable()) {
        // The finalizer may drop the last reference itself
        if (impl_->finalizer.get_id() == std::this_thread::get_id()) {
            impl_->finalizer.detach();
        } else {
            impl_->finalizer.join();
        }
    }
}

void StreamSession::setCallbacks(SessionCallbacks callbacks) {
    impl_->callbacks = std::move(callbacks);
}

bool StreamSession::open() {
    if (!impl_->engine || !impl_->engine->isReady()) {
        std::cerr << impl_->tag() << " " << toString(SessionErrorKind::EngineNotReady) << std::endl;
        impl_->send(protocol::makeError("Model not initialized"));
        impl_->setState(SessionState::Closed);
        return false;
    }

    impl_->setState(SessionState::Streaming);
    return true;
}

void StreamSession::handleMessage(const std::string& frame) {
    SessionState current = impl_->currentState();
    if (current != SessionState::Streaming) {
        std::cout << impl_->tag() << " Ignoring message in state " << toString(current) << std::endl;
        return;
    }

    protocol::ParseResult parsed = protocol::parseInbound(frame);
    if (!parsed.ok()) {
        std::cerr << impl_->tag() << " " << toString(SessionErrorKind::Protocol) << ": "
                  << parsed.error << std::endl;
        impl_->send(protocol::makeError(parsed.error));
        return;
    }

    protocol::InboundMessage& message = *parsed.message;

    if (message.type == protocol::MessageType::End) {
        beginFinalizing();
        return;
    }

    auto fragment = std::make_shared<AudioFragment>();
    fragment->format = std::move(message.format);
    fragment->sample_rate = message.sample_rate;
    fragment->bytes = std::move(message.audio);

    {
        std::lock_guard<std::mutex> lock(impl_->data_mutex);
        fragment->sequence = ++impl_->fragment_count;
        impl_->fragments.push_back(fragment);
    }

    // Acknowledge before any partial for this chunk can be produced
    impl_->send(protocol::makeReceived(fragment->sequence));

    if (!impl_->chunk_processor->shouldProcess(*fragment)) {
        return;
    }

    std::weak_ptr<StreamSession> weak = shared_from_this();
    std::shared_ptr<ChunkProcessor> processor = impl_->chunk_processor;
    FragmentPtr shared_fragment = fragment;

    std::packaged_task<void()> task([weak, processor, shared_fragment]() {
        std::optional<TranscriptionResult> result = processor->process(*shared_fragment);
        if (!result) return;

        if (auto self = weak.lock()) {
            self->impl_->send(protocol::makeTranscription(*result));
        }
    });

    std::future<void> done = task.get_future();
    {
        std::lock_guard<std::mutex> lock(impl_->data_mutex);
        impl_->tasks.push_back(std::move(done));
    }
    boost::asio::post(impl_->workers, std::move(task));
}

void StreamSession::handleBinary(size_t bytes) {
    if (impl_->currentState() != SessionState::Streaming) return;

    std::cerr << impl_->tag() << " " << toString(SessionErrorKind::Protocol)
              << ": binary frame of " << bytes << " bytes" << std::endl;
    impl_->send(protocol::makeError("Binary frames are not supported; send audio_chunk JSON messages"));
}

void StreamSession::beginFinalizing() {
    impl_->setState(SessionState::Finalizing);

    auto self = shared_from_this();
    impl_->finalizer = std::thread([self]() {
        self->impl_->finalize();
    });
}

void StreamSession::abandon() {
    if (impl_->abandoned.exchange(true)) return;
    std::cout << impl_->tag() << " Client disconnected" << std::endl;
    impl_->setState(SessionState::Closed);
}

void StreamSession::waitUntilClosed() {
    std::unique_lock<std::mutex> lock(impl_->state_mutex);
    impl_->closed_cv.wait(lock, [this]() {
        return impl_->state == SessionState::Closed;
    });
}

SessionState StreamSession::state() const {
    return impl_->currentState();
}

const std::string& StreamSession::id() const {
    return impl_->id;
}

size_t StreamSession::fragmentCount() const {
    std::lock_guard<std::mutex> lock(impl_->data_mutex);
    return impl_->fragment_count;
}

} // namespace lts::session
