/**
 * HttpApi.hpp - One-shot REST transcription endpoint (cpp-httplib)
 *
 *   POST /api/transcribe   whole recording in, final text out
 *   GET  /health           engine readiness
 */

#pragma once

#include "lts/audio/AudioDecoder.hpp"
#include "lts/stt/TranscriptionEngine.hpp"

#include <memory>
#include <string>

namespace lts::server {

class HttpApi {
public:
    HttpApi(std::shared_ptr<stt::TranscriptionEngine> engine,
            std::shared_ptr<audio::AudioDecoder> decoder);
    ~HttpApi();

    HttpApi(const HttpApi&) = delete;
    HttpApi& operator=(const HttpApi&) = delete;

    /**
     * Bind and serve on a background thread.
     * @param port 0 binds to any free port (see port())
     */
    bool start(const std::string& host, int port);
    void stop();

    bool isRunning() const;
    int port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lts::server
