/**
 * HttpApi.cpp - REST endpoint on cpp-httplib
 *
 * Runs the same decode + transcribe path as the final pass of a streaming
 * session, without chunking. httplib handlers run on its own thread pool.
 */

#include "lts/server/HttpApi.hpp"
#include "lts/protocol/Protocol.hpp"
#include "lts/session/ChunkProcessor.hpp"

#include <atomic>
#include <iostream>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lts::server {

namespace {
constexpr const char* JSON_TYPE = "application/json";
constexpr const char* MODEL_NOT_INITIALIZED = "Model not initialized";
}

struct HttpApi::Impl {
    std::shared_ptr<stt::TranscriptionEngine> engine;
    std::shared_ptr<audio::AudioDecoder> decoder;

    httplib::Server server;
    std::thread thread;
    std::atomic<bool> running{false};
    int bound_port = 0;

    Impl(std::shared_ptr<stt::TranscriptionEngine> eng, std::shared_ptr<audio::AudioDecoder> dec)
        : engine(std::move(eng))
        , decoder(std::move(dec)) {
        server.Post("/api/transcribe", [this](const httplib::Request& req, httplib::Response& res) {
            handleTranscribe(req, res);
        });
        server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            handleHealth(res);
        });
    }

    bool engineReady() const {
        return engine && engine->isReady();
    }

    void handleTranscribe(const httplib::Request& req, httplib::Response& res) {
        if (!engineReady()) {
            res.status = 503;
            res.set_content(json{{"detail", MODEL_NOT_INITIALIZED}}.dump(), JSON_TYPE);
            return;
        }

        auto parsed = protocol::parseTranscribeRequest(req.body);
        if (!parsed.ok()) {
            std::cerr << "[HttpApi] Bad request: " << parsed.error << std::endl;
            res.status = 400;
            res.set_content(json{{"detail", parsed.error}}.dump(), JSON_TYPE);
            return;
        }

        const auto& request = *parsed.request;
        std::cout << "[HttpApi] Transcribe request: " << request.audio.size()
                  << " bytes (" << request.format << ")" << std::endl;

        auto decoded = decoder->decode(request.audio, request.format);
        if (!decoded.ok()) {
            std::cerr << "[HttpApi] Decode failed: " << decoded.error->message() << std::endl;
            res.set_content(protocol::makeTranscribeFailure(
                                "Audio processing failed: " + decoded.error->message()),
                            JSON_TYPE);
            return;
        }

        try {
            auto text = session::trim(engine->transcribe(decoded.pcm));
            res.set_content(protocol::makeTranscribeSuccess(text), JSON_TYPE);
        } catch (const std::exception& e) {
            std::cerr << "[HttpApi] Transcription failed: " << e.what() << std::endl;
            res.set_content(protocol::makeTranscribeFailure(e.what()), JSON_TYPE);
        }
    }

    void handleHealth(httplib::Response& res) {
        const bool ready = engineReady();
        json body = {
            {"status", ready ? "ok" : "unavailable"},
            {"model", engine ? engine->getModelInfo() : std::string()}
        };
        res.set_content(body.dump(), JSON_TYPE);
    }
};

HttpApi::HttpApi(std::shared_ptr<stt::TranscriptionEngine> engine,
                 std::shared_ptr<audio::AudioDecoder> decoder)
    : impl_(std::make_unique<Impl>(std::move(engine), std::move(decoder))) {
}

HttpApi::~HttpApi() {
    stop();
}

bool HttpApi::start(const std::string& host, int port) {
    if (impl_->running) return true;

    if (port == 0) {
        impl_->bound_port = impl_->server.bind_to_any_port(host);
        if (impl_->bound_port <= 0) {
            std::cerr << "[HttpApi] Failed to bind " << host << std::endl;
            return false;
        }
    } else {
        if (!impl_->server.bind_to_port(host, port)) {
            std::cerr << "[HttpApi] Failed to bind " << host << ":" << port << std::endl;
            return false;
        }
        impl_->bound_port = port;
    }

    impl_->running = true;
    impl_->thread = std::thread([this]() {
        if (!impl_->server.listen_after_bind()) {
            std::cerr << "[HttpApi] Server loop exited with error" << std::endl;
        }
    });
    impl_->server.wait_until_ready();

    std::cout << "[HttpApi] Listening on http://" << host << ":" << impl_->bound_port << std::endl;
    return true;
}

void HttpApi::stop() {
    if (!impl_->running.exchange(false)) return;

    impl_->server.stop();
    if (impl_->thread.joinable()) {
        impl_->thread.join();
    }
    std::cout << "[HttpApi] Stopped" << std::endl;
}

bool HttpApi::isRunning() const {
    return impl_->running;
}

int HttpApi::port() const {
    return impl_->bound_port;
}

} // namespace lts::server
