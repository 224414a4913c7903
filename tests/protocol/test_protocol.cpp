/**
 * test_protocol.cpp - Inbound frame parsing and outbound frame shapes
 */

#include "lts/core/Base64.hpp"
#include "lts/protocol/Protocol.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace lts;
using namespace lts::protocol;

static bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

void test_parse_audio_chunk() {
    std::vector<uint8_t> payload = {1, 2, 3, 4, 5};
    json frame = {{"type", "audio_chunk"}, {"data", encodeBase64(payload)},
                  {"format", "ogg"}, {"sample_rate", 16000}};

    ParseResult parsed = parseInbound(frame.dump());
    assert(parsed.ok());
    assert(parsed.message->type == MessageType::AudioChunk);
    assert(parsed.message->audio == payload);
    assert(parsed.message->format == "ogg");
    assert(parsed.message->sample_rate == 16000);

    // Defaults
    parsed = parseInbound(json{{"type", "audio_chunk"}, {"data", "AAAA"}}.dump());
    assert(parsed.ok());
    assert(parsed.message->format == "webm");
    assert(parsed.message->sample_rate == 48000);
    assert(parsed.message->audio.size() == 3);

    std::cout << "[PASS] test_parse_audio_chunk" << std::endl;
}

void test_parse_end() {
    ParseResult parsed = parseInbound(R"({"type":"end"})");
    assert(parsed.ok());
    assert(parsed.message->type == MessageType::End);

    std::cout << "[PASS] test_parse_end" << std::endl;
}

void test_parse_errors() {
    ParseResult parsed = parseInbound("{not json");
    assert(!parsed.ok());
    assert(startsWith(parsed.error, "Invalid JSON"));

    parsed = parseInbound("[1,2,3]");
    assert(!parsed.ok());
    assert(startsWith(parsed.error, "Invalid message"));

    parsed = parseInbound(R"({"data":"AAAA"})");
    assert(!parsed.ok());
    assert(startsWith(parsed.error, "Invalid message"));

    parsed = parseInbound(R"({"type":"pause"})");
    assert(!parsed.ok());
    assert(parsed.error == "Unknown message type: pause");

    parsed = parseInbound(R"({"type":"audio_chunk"})");
    assert(!parsed.ok());
    assert(startsWith(parsed.error, "Failed to decode audio chunk"));

    parsed = parseInbound(R"({"type":"audio_chunk","data":"%%%%"})");
    assert(!parsed.ok());
    assert(parsed.error == "Failed to decode audio chunk: invalid base64");

    parsed = parseInbound(R"({"type":"audio_chunk","data":"AAAA","sample_rate":"fast"})");
    assert(!parsed.ok());
    assert(startsWith(parsed.error, "Failed to decode audio chunk"));

    std::cout << "[PASS] test_parse_errors" << std::endl;
}

void test_outbound_frames() {
    json received = json::parse(makeReceived(7));
    assert(received["status"] == "received");
    assert(received["chunk"] == 7);

    TranscriptionResult partial;
    partial.text = "hello";
    partial.is_final = false;
    partial.chunk = 3;
    json p = json::parse(makeTranscription(partial));
    assert(p["status"] == "transcription");
    assert(p["text"] == "hello");
    assert(p["is_final"] == false);
    assert(p["chunk"] == 3);

    TranscriptionResult final_result;
    final_result.text = "hello world";
    final_result.is_final = true;
    json f = json::parse(makeTranscription(final_result));
    assert(f["is_final"] == true);
    assert(!f.contains("chunk"));

    json processing = json::parse(makeProcessing("Processing final audio..."));
    assert(processing["status"] == "processing");
    assert(processing["message"] == "Processing final audio...");

    json error = json::parse(makeError("No audio data received"));
    assert(error["status"] == "error");
    assert(error["error"] == "No audio data received");

    std::cout << "[PASS] test_outbound_frames" << std::endl;
}

void test_transcribe_request() {
    json body = {{"audio_data", encodeBase64(std::vector<uint8_t>{9, 8, 7})}};
    TranscribeRequestResult parsed = parseTranscribeRequest(body.dump());
    assert(parsed.ok());
    assert(parsed.request->audio.size() == 3);
    assert(parsed.request->format == "wav");
    assert(parsed.request->sample_rate == 48000);

    assert(!parseTranscribeRequest("nope").ok());
    assert(!parseTranscribeRequest(R"({"format":"wav"})").ok());
    assert(!parseTranscribeRequest(R"({"audio_data":"abc"})").ok());

    json success = json::parse(makeTranscribeSuccess("hi"));
    assert(success["text"] == "hi");
    assert(success["status"] == "success");
    assert(success["error"].is_null());

    json failure = json::parse(makeTranscribeFailure("bad audio"));
    assert(failure["text"] == "");
    assert(failure["status"] == "error");
    assert(failure["error"] == "bad audio");

    std::cout << "[PASS] test_transcribe_request" << std::endl;
}

int main() {
    std::cout << "=== Protocol Tests ===" << std::endl;

    test_parse_audio_chunk();
    test_parse_end();
    test_parse_errors();
    test_outbound_frames();
    test_transcribe_request();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
