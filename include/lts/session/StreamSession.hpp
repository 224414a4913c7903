/**
 * StreamSession.hpp - Per-connection streaming transcription state machine
 *
 *   Open -> Streaming -> Finalizing -> Closed
 *
 * Audio chunks are acknowledged immediately and transcribed on the shared
 * worker pool. On "end" every outstanding chunk task is joined before the
 * single final transcription runs, so no partial can follow the final.
 */

#pragma once

#include "lts/audio/AudioDecoder.hpp"
#include "lts/stt/TranscriptionEngine.hpp"

#include <boost/asio/thread_pool.hpp>

#include <functional>
#include <memory>
#include <string>

namespace lts::session {

enum class SessionState {
    Open,
    Streaming,
    Finalizing,
    Closed
};

const char* toString(SessionState state);

struct SessionConfig {
    size_t min_chunk_bytes = 1000;
    std::string processing_message = "Processing final audio...";
};

struct SessionCallbacks {
    // Outbound frame; also called from worker threads
    std::function<void(const std::string&)> onSend;
    std::function<void(SessionState)> onStateChange;
};

class StreamSession : public std::enable_shared_from_this<StreamSession> {
public:
    /**
     * Sessions must be owned by a shared_ptr; chunk tasks and the
     * finalizer thread hold references to them.
     */
    static std::shared_ptr<StreamSession> create(std::shared_ptr<stt::TranscriptionEngine> engine,
                                                 std::shared_ptr<audio::AudioDecoder> decoder,
                                                 boost::asio::thread_pool& workers,
                                                 SessionConfig config = {});
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    void setCallbacks(SessionCallbacks callbacks);

    /**
     * Verify the engine and enter Streaming.
     * @return false if the engine is not ready (an error was sent, state is Closed)
     */
    bool open();

    /** Dispatch one inbound text frame. Only acts in Streaming. */
    void handleMessage(const std::string& frame);

    /** Binary frames are not part of the protocol. */
    void handleBinary(size_t bytes);

    /**
     * Transport went away. Nothing more is sent and the final pass is skipped.
     */
    void abandon();

    /** Block until the session is Closed. */
    void waitUntilClosed();

    SessionState state() const;
    const std::string& id() const;
    size_t fragmentCount() const;

private:
    StreamSession(std::shared_ptr<stt::TranscriptionEngine> engine,
                  std::shared_ptr<audio::AudioDecoder> decoder,
                  boost::asio::thread_pool& workers,
                  SessionConfig config);

    void beginFinalizing();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lts::session
