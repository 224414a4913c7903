/**
 * Config.hpp - Server configuration
 *
 * Sources, later wins: defaults, JSON file (--config), command-line flags.
 */

#pragma once

#include "lts/audio/AudioDecoder.hpp"
#include "lts/session/StreamSession.hpp"
#include "lts/stt/WhisperEngine.hpp"

#include <string>

namespace lts {

struct ServerConfig {
    stt::WhisperConfig whisper;
    audio::DecoderConfig decoder;
    session::SessionConfig session;

    std::string host = "0.0.0.0";
    int ws_port = 8002;
    int http_port = 8001;
    int io_threads = 1;
    int worker_threads = 2;
    bool enable_http = true;

    /** Built-in defaults, with the temp dir taken from TMPDIR. */
    static ServerConfig defaults();
};

enum class ParseStatus {
    Ok,
    Help,   // -h/--help given
    Error
};

/**
 * Overlay a JSON config file onto config. Unknown keys are ignored.
 * @return false with error set if the file is unreadable or a value has the wrong type
 */
bool loadConfigFile(const std::string& path, ServerConfig& config, std::string& error);

/** Same as loadConfigFile, from an in-memory document. */
bool applyConfigJson(const std::string& text, ServerConfig& config, std::string& error);

/**
 * Apply --config (if any) and then every other flag.
 */
ParseStatus parseArgs(int argc, char** argv, ServerConfig& config, std::string& error);

/** Range checks shared by the file and flag paths. Empty string when valid. */
std::string validate(const ServerConfig& config);

void printUsage(const char* prog, const ServerConfig& defaults);

} // namespace lts
