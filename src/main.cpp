/**
 * Live Transcription Server (LTS) - Main Entry Point
 *
 * Streams browser audio over WebSocket to a whisper.cpp engine and serves
 * one-shot transcriptions over HTTP.
 */

#include "lts/audio/AudioDecoder.hpp"
#include "lts/core/Config.hpp"
#include "lts/server/HttpApi.hpp"
#include "lts/server/WebSocketServer.hpp"
#include "lts/stt/WhisperEngine.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

std::atomic<bool> g_running{true};

void signalHandler(int /*signal*/) {
    g_running = false;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << R"(
    ╔═══════════════════════════════════════════════╗
    ║     LIVE TRANSCRIPTION SERVER (LTS) v0.1.0    ║
    ║    Streaming speech-to-text with whisper.cpp  ║
    ╚═══════════════════════════════════════════════╝
    )" << std::endl;

    const auto defaults = lts::ServerConfig::defaults();
    auto config = defaults;
    std::string error;

    switch (lts::parseArgs(argc, argv, config, error)) {
        case lts::ParseStatus::Help:
            lts::printUsage(argv[0], defaults);
            return 0;
        case lts::ParseStatus::Error:
            std::cerr << "[LTS] " << error << std::endl;
            lts::printUsage(argv[0], defaults);
            return 2;
        case lts::ParseStatus::Ok:
            break;
    }

    std::cout << "[LTS] Initializing..." << std::endl;

    auto engine = std::make_shared<lts::stt::WhisperEngine>(config.whisper);
    if (!engine->isReady()) {
        std::cerr << "[LTS] Failed to load model: " << config.whisper.model_path << std::endl;
        return 1;
    }
    std::cout << "[LTS] Model: " << engine->getModelInfo() << std::endl;

    auto decoder = lts::audio::AudioDecoder::createDefault(config.decoder);

    boost::asio::thread_pool workers(static_cast<size_t>(config.worker_threads));

    lts::server::HttpApi http(engine, decoder);
    if (config.enable_http && !http.start(config.host, config.http_port)) {
        std::cerr << "[LTS] Failed to start HTTP API" << std::endl;
        workers.join();
        return 1;
    }

    lts::server::WebSocketServer ws(engine, decoder, workers, config.session,
                                    {config.host, config.ws_port, config.io_threads});
    if (!ws.start()) {
        std::cerr << "[LTS] Failed to start WebSocket server" << std::endl;
        http.stop();
        workers.join();
        return 1;
    }

    std::cout << "[LTS] Ready" << std::endl;

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[LTS] Shutting down..." << std::endl;
    ws.stop();
    http.stop();
    workers.join();

    std::cout << "[LTS] Goodbye!" << std::endl;
    return 0;
}
