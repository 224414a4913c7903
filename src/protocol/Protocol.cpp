/**
 * Protocol.cpp - nlohmann::json encoding of client frames
 */

#include "lts/protocol/Protocol.hpp"
#include "lts/core/Base64.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lts::protocol {

namespace {

ParseResult parseError(std::string error) {
    ParseResult result;
    result.error = std::move(error);
    return result;
}

} // anonymous namespace

ParseResult parseInbound(const std::string& frame) {
    json msg;
    try {
        msg = json::parse(frame);
    } catch (const json::parse_error& e) {
        return parseError(std::string("Invalid JSON: ") + e.what());
    }

    if (!msg.is_object()) {
        return parseError("Invalid message: expected a JSON object");
    }

    auto type_it = msg.find("type");
    if (type_it == msg.end() || !type_it->is_string()) {
        return parseError("Invalid message: missing \"type\"");
    }

    const std::string type = type_it->get<std::string>();

    if (type == "end") {
        InboundMessage message;
        message.type = MessageType::End;
        return ParseResult{message, ""};
    }

    if (type != "audio_chunk") {
        return parseError("Unknown message type: " + type);
    }

    InboundMessage message;
    message.type = MessageType::AudioChunk;

    try {
        auto data_it = msg.find("data");
        if (data_it == msg.end() || !data_it->is_string()) {
            return parseError("Failed to decode audio chunk: missing \"data\"");
        }
        message.format = msg.value("format", std::string("webm"));
        message.sample_rate = msg.value("sample_rate", CANONICAL_SAMPLE_RATE);

        if (!decodeBase64(data_it->get_ref<const std::string&>(), message.audio)) {
            return parseError("Failed to decode audio chunk: invalid base64");
        }
    } catch (const json::type_error& e) {
        return parseError(std::string("Failed to decode audio chunk: ") + e.what());
    }

    return ParseResult{std::move(message), ""};
}

std::string makeReceived(uint64_t chunk) {
    return json{{"status", "received"}, {"chunk", chunk}}.dump();
}

std::string makeTranscription(const TranscriptionResult& result) {
    json msg = {
        {"status", "transcription"},
        {"text", result.text},
        {"is_final", result.is_final}
    };
    if (!result.is_final && result.chunk) {
        msg["chunk"] = *result.chunk;
    }
    return msg.dump();
}

std::string makeProcessing(const std::string& message) {
    return json{{"status", "processing"}, {"message", message}}.dump();
}

std::string makeError(const std::string& error) {
    return json{{"status", "error"}, {"error", error}}.dump();
}

TranscribeRequestResult parseTranscribeRequest(const std::string& body) {
    TranscribeRequestResult result;

    json req;
    try {
        req = json::parse(body);
    } catch (const json::parse_error& e) {
        result.error = std::string("Invalid JSON: ") + e.what();
        return result;
    }

    if (!req.is_object()) {
        result.error = "Request body must be a JSON object";
        return result;
    }

    auto data_it = req.find("audio_data");
    if (data_it == req.end() || !data_it->is_string()) {
        result.error = "Missing \"audio_data\"";
        return result;
    }

    TranscribeRequest request;
    try {
        request.sample_rate = req.value("sample_rate", CANONICAL_SAMPLE_RATE);
        request.format = req.value("format", std::string("wav"));
    } catch (const json::type_error& e) {
        result.error = std::string("Invalid field: ") + e.what();
        return result;
    }

    if (!decodeBase64(data_it->get_ref<const std::string&>(), request.audio)) {
        result.error = "Invalid base64 in \"audio_data\"";
        return result;
    }

    result.request = std::move(request);
    return result;
}

std::string makeTranscribeSuccess(const std::string& text) {
    return json{{"text", text}, {"status", "success"}, {"error", nullptr}}.dump();
}

std::string makeTranscribeFailure(const std::string& error) {
    return json{{"text", ""}, {"status", "error"}, {"error", error}}.dump();
}

} // namespace lts::protocol
