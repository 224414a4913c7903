/**
 * WebSocketServer.hpp - Streaming transcription endpoint (Boost.Beast)
 *
 * One StreamSession per accepted connection. Message dispatch runs on
 * the server's io threads; transcription runs on the shared worker pool.
 */

#pragma once

#include "lts/audio/AudioDecoder.hpp"
#include "lts/session/StreamSession.hpp"
#include "lts/stt/TranscriptionEngine.hpp"

#include <boost/asio/thread_pool.hpp>

#include <memory>
#include <string>

namespace lts::server {

struct WebSocketConfig {
    std::string host = "0.0.0.0";
    int port = 8002;  // 0 picks a free port
    int io_threads = 1;
};

class WebSocketServer {
public:
    WebSocketServer(std::shared_ptr<stt::TranscriptionEngine> engine,
                    std::shared_ptr<audio::AudioDecoder> decoder,
                    boost::asio::thread_pool& workers,
                    session::SessionConfig session_config,
                    WebSocketConfig config);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /** Bind, listen and start the io threads. */
    bool start();
    void stop();

    bool isRunning() const;

    /** Bound port (useful when configured with port 0). */
    int port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lts::server
