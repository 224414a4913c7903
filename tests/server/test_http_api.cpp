/**
 * test_http_api.cpp - One-shot REST endpoint
 */

#include "lts/core/Base64.hpp"
#include "lts/server/HttpApi.hpp"
#include "support/TestFakes.hpp"

#include <cassert>
#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace lts;

std::string requestBody(const std::vector<uint8_t>& audio) {
    return json{{"audio_data", encodeBase64(audio)}, {"sample_rate", 48000}, {"format", "wav"}}.dump();
}

void test_transcribe_success() {
    auto engine = std::make_shared<test::MarkerEngine>();
    server::HttpApi api(engine, test::rawDecoder());
    assert(api.start("127.0.0.1", 0));
    assert(api.port() > 0);

    httplib::Client client("127.0.0.1", api.port());
    auto res = client.Post("/api/transcribe", requestBody(test::markerPayload(9, 2000)), "application/json");
    assert(res);
    assert(res->status == 200);

    json body = json::parse(res->body);
    assert(body["status"] == "success");
    assert(body["text"] == "9");
    assert(body["error"].is_null());

    api.stop();
    std::cout << "[PASS] test_transcribe_success" << std::endl;
}

void test_transcribe_failures() {
    auto engine = std::make_shared<test::MarkerEngine>();
    server::HttpApi api(engine, test::rawDecoder());
    assert(api.start("127.0.0.1", 0));

    httplib::Client client("127.0.0.1", api.port());

    // Undecodable audio is reported in the body
    auto res = client.Post("/api/transcribe", requestBody(std::vector<uint8_t>(20, 1)), "application/json");
    assert(res && res->status == 200);
    json body = json::parse(res->body);
    assert(body["status"] == "error");
    assert(body["text"] == "");
    assert(body["error"].get<std::string>().rfind("Audio processing failed: ", 0) == 0);

    // Engine failure
    engine->fail = true;
    res = client.Post("/api/transcribe", requestBody(test::markerPayload(9, 2000)), "application/json");
    assert(res && res->status == 200);
    body = json::parse(res->body);
    assert(body["status"] == "error");
    assert(body["error"] == "engine exploded");
    engine->fail = false;

    // Malformed request
    res = client.Post("/api/transcribe", "{oops", "application/json");
    assert(res && res->status == 400);

    api.stop();
    std::cout << "[PASS] test_transcribe_failures" << std::endl;
}

void test_engine_not_ready() {
    auto engine = std::make_shared<test::MarkerEngine>(false);
    server::HttpApi api(engine, test::rawDecoder());
    assert(api.start("127.0.0.1", 0));

    httplib::Client client("127.0.0.1", api.port());
    auto res = client.Post("/api/transcribe", requestBody(test::markerPayload(9, 2000)), "application/json");
    assert(res && res->status == 503);
    assert(json::parse(res->body)["detail"] == "Model not initialized");

    res = client.Get("/health");
    assert(res && res->status == 200);
    assert(json::parse(res->body)["status"] == "unavailable");

    api.stop();
    std::cout << "[PASS] test_engine_not_ready" << std::endl;
}

void test_health() {
    auto engine = std::make_shared<test::MarkerEngine>();
    server::HttpApi api(engine, test::rawDecoder());
    assert(api.start("127.0.0.1", 0));

    httplib::Client client("127.0.0.1", api.port());
    auto res = client.Get("/health");
    assert(res && res->status == 200);

    json body = json::parse(res->body);
    assert(body["status"] == "ok");
    assert(body["model"] == "marker-engine");

    api.stop();
    assert(!api.isRunning());
    std::cout << "[PASS] test_health" << std::endl;
}

int main() {
    std::cout << "=== HttpApi Tests ===" << std::endl;

    test_transcribe_success();
    test_transcribe_failures();
    test_engine_not_ready();
    test_health();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
