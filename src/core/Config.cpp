/**
 * Config.cpp - JSON config file and command-line flags
 */

#include "lts/core/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lts {

namespace {

bool parseInt(const std::string& text, int& out) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Reads key into out when present; type errors propagate as json exceptions
template <typename T>
void readKey(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->template get<T>();
    }
}

// Byte counts: a negative number would wrap around in size_t
void readByteCount(const json& j, const char* key, size_t& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_number_unsigned()) {
        throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
    }
    out = it->get<size_t>();
}

} // anonymous namespace

ServerConfig ServerConfig::defaults() {
    ServerConfig config;
    const char* tmp = std::getenv("TMPDIR");
    config.decoder.temp_dir = (tmp && *tmp) ? tmp : "/tmp";
    return config;
}

bool applyConfigJson(const std::string& text, ServerConfig& config, std::string& error) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        error = std::string("invalid JSON: ") + e.what();
        return false;
    }

    if (!j.is_object()) {
        error = "config root must be a JSON object";
        return false;
    }

    try {
        readKey(j, "model", config.whisper.model_path);
        readKey(j, "language", config.whisper.language);
        readKey(j, "threads", config.whisper.n_threads);
        readKey(j, "use_gpu", config.whisper.use_gpu);

        readKey(j, "host", config.host);
        readKey(j, "ws_port", config.ws_port);
        readKey(j, "http_port", config.http_port);
        readKey(j, "io_threads", config.io_threads);
        readKey(j, "workers", config.worker_threads);
        readKey(j, "enable_http", config.enable_http);

        readByteCount(j, "min_input_bytes", config.decoder.min_input_bytes);
        readKey(j, "ffmpeg", config.decoder.ffmpeg_path);
        readKey(j, "ffmpeg_timeout_ms", config.decoder.ffmpeg_timeout_ms);
        readKey(j, "temp_dir", config.decoder.temp_dir);

        if (auto it = j.find("strategies"); it != j.end() && it->is_object()) {
            readKey(*it, "library", config.decoder.enable_library);
            readKey(*it, "process", config.decoder.enable_process);
            readKey(*it, "direct", config.decoder.enable_direct);
        }

        readByteCount(j, "min_chunk_bytes", config.session.min_chunk_bytes);
        readKey(j, "processing_message", config.session.processing_message);
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    } catch (const std::invalid_argument& e) {
        error = e.what();
        return false;
    }

    error = validate(config);
    return error.empty();
}

bool loadConfigFile(const std::string& path, ServerConfig& config, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot read config file: " + path;
        return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    if (!applyConfigJson(buffer.str(), config, error)) {
        error = path + ": " + error;
        return false;
    }

    std::cout << "[Config] Loaded " << path << std::endl;
    return true;
}

ParseStatus parseArgs(int argc, char** argv, ServerConfig& config, std::string& error) {
    // Config file first so that flags override it regardless of position
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                error = "missing value for --config";
                return ParseStatus::Error;
            }
            if (!loadConfigFile(argv[++i], config, error)) {
                return ParseStatus::Error;
            }
        }
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            return ParseStatus::Help;
        }
        if (arg == "--no-http") {
            config.enable_http = false;
            continue;
        }

        if (i + 1 >= argc) {
            error = "missing value for " + arg;
            return ParseStatus::Error;
        }
        std::string value = argv[++i];

        int number = 0;
        auto needInt = [&]() {
            if (!parseInt(value, number)) {
                error = "invalid integer for " + arg + ": " + value;
                return false;
            }
            return true;
        };

        if (arg == "--config") {
            // handled above
        } else if (arg == "-m" || arg == "--model") {
            config.whisper.model_path = value;
        } else if (arg == "-l" || arg == "--language") {
            config.whisper.language = value;
        } else if (arg == "-t" || arg == "--threads") {
            if (!needInt()) return ParseStatus::Error;
            config.whisper.n_threads = number;
        } else if (arg == "--host") {
            config.host = value;
        } else if (arg == "--ws-port") {
            if (!needInt()) return ParseStatus::Error;
            config.ws_port = number;
        } else if (arg == "--http-port") {
            if (!needInt()) return ParseStatus::Error;
            config.http_port = number;
        } else if (arg == "--io-threads") {
            if (!needInt()) return ParseStatus::Error;
            config.io_threads = number;
        } else if (arg == "--workers") {
            if (!needInt()) return ParseStatus::Error;
            config.worker_threads = number;
        } else if (arg == "--ffmpeg") {
            config.decoder.ffmpeg_path = value;
        } else if (arg == "--ffmpeg-timeout-ms") {
            if (!needInt()) return ParseStatus::Error;
            config.decoder.ffmpeg_timeout_ms = number;
        } else if (arg == "--min-chunk-bytes") {
            if (!needInt()) return ParseStatus::Error;
            if (number < 0) {
                error = "--min-chunk-bytes must not be negative";
                return ParseStatus::Error;
            }
            config.session.min_chunk_bytes = static_cast<size_t>(number);
        } else {
            error = "unknown argument: " + arg;
            return ParseStatus::Error;
        }
    }

    error = validate(config);
    return error.empty() ? ParseStatus::Ok : ParseStatus::Error;
}

std::string validate(const ServerConfig& config) {
    auto validPort = [](int port) { return port >= 0 && port <= 65535; };

    if (config.whisper.model_path.empty()) return "model path is empty";
    if (config.whisper.n_threads < 1) return "threads must be at least 1";
    if (!validPort(config.ws_port)) return "ws port out of range: " + std::to_string(config.ws_port);
    if (!validPort(config.http_port)) return "http port out of range: " + std::to_string(config.http_port);
    if (config.io_threads < 1) return "io threads must be at least 1";
    if (config.worker_threads < 1) return "workers must be at least 1";
    if (config.decoder.ffmpeg_timeout_ms <= 0) return "ffmpeg timeout must be positive";
    if (!config.decoder.enable_library && !config.decoder.enable_process && !config.decoder.enable_direct) {
        return "at least one decode strategy must be enabled";
    }
    return {};
}

void printUsage(const char* prog, const ServerConfig& defaults) {
    std::cerr << "\n"
              << "usage: " << prog << " [options]\n"
              << "\n"
              << "options:\n"
              << "  -h,       --help                show this help message and exit\n"
              << "            --config PATH         JSON config file (flags override it)\n"
              << "  -m FNAME, --model FNAME         [" << defaults.whisper.model_path << "] whisper model path\n"
              << "  -l LANG,  --language LANG       [" << defaults.whisper.language << "] spoken language\n"
              << "  -t N,     --threads N           [" << defaults.whisper.n_threads << "] whisper threads\n"
              << "            --host HOST           [" << defaults.host << "] bind address\n"
              << "            --ws-port N           [" << defaults.ws_port << "] WebSocket port\n"
              << "            --http-port N         [" << defaults.http_port << "] HTTP port\n"
              << "            --io-threads N        [" << defaults.io_threads << "] WebSocket io threads\n"
              << "            --workers N           [" << defaults.worker_threads << "] transcription workers\n"
              << "            --ffmpeg PATH         [" << defaults.decoder.ffmpeg_path << "] ffmpeg executable\n"
              << "            --ffmpeg-timeout-ms N [" << defaults.decoder.ffmpeg_timeout_ms << "] ffmpeg timeout\n"
              << "            --min-chunk-bytes N   [" << defaults.session.min_chunk_bytes << "] partial transcription threshold\n"
              << "            --no-http             disable the HTTP API\n"
              << std::endl;
}

} // namespace lts
