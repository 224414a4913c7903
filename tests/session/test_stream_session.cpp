/**
 * test_stream_session.cpp - Session state machine against fake components
 */

#include "lts/core/Base64.hpp"
#include "lts/session/StreamSession.hpp"
#include "support/TestFakes.hpp"

#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace lts;
using namespace lts::session;

// Records everything a session sends, from any thread
struct Recorder {
    std::mutex mutex;
    std::vector<json> frames;
    std::vector<SessionState> states;

    SessionCallbacks callbacks() {
        return {
            [this](const std::string& frame) {
                std::lock_guard<std::mutex> lock(mutex);
                frames.push_back(json::parse(frame));
            },
            [this](SessionState state) {
                std::lock_guard<std::mutex> lock(mutex);
                states.push_back(state);
            }
        };
    }

    std::vector<json> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return frames;
    }

    size_t count(const std::string& status) {
        size_t n = 0;
        for (const auto& f : snapshot()) {
            if (f["status"] == status) ++n;
        }
        return n;
    }
};

std::string chunkFrame(int16_t marker, size_t bytes) {
    return json{{"type", "audio_chunk"}, {"data", encodeBase64(test::markerPayload(marker, bytes))}}.dump();
}

const std::string END_FRAME = R"({"type":"end"})";

struct Fixture {
    boost::asio::thread_pool workers{2};
    std::shared_ptr<test::MarkerEngine> engine;
    std::shared_ptr<StreamSession> session;
    Recorder recorder;

    explicit Fixture(bool ready = true)
        : engine(std::make_shared<test::MarkerEngine>(ready)) {
        session = StreamSession::create(engine, test::rawDecoder(), workers);
        session->setCallbacks(recorder.callbacks());
    }

    ~Fixture() {
        workers.join();
    }
};

void test_streaming_scenario() {
    Fixture fx;
    assert(fx.session->open());
    assert(fx.session->state() == SessionState::Streaming);

    fx.session->handleMessage(chunkFrame(1, 500));    // Below threshold, no partial
    fx.session->handleMessage(chunkFrame(2, 2500));
    fx.session->handleMessage(chunkFrame(3, 2500));
    fx.session->handleMessage(END_FRAME);
    fx.session->waitUntilClosed();

    auto frames = fx.recorder.snapshot();

    // Acks carry the sequence number, in order
    std::vector<int> acks;
    for (const auto& f : frames) {
        if (f["status"] == "received") acks.push_back(f["chunk"].get<int>());
    }
    assert((acks == std::vector<int>{1, 2, 3}));

    // Partials for chunks 2 and 3 only
    std::vector<int> partial_chunks;
    for (const auto& f : frames) {
        if (f["status"] == "transcription" && f["is_final"] == false) {
            partial_chunks.push_back(f["chunk"].get<int>());
            assert(f["text"] == std::to_string(f["chunk"].get<int>()));
        }
    }
    std::sort(partial_chunks.begin(), partial_chunks.end());
    assert((partial_chunks == std::vector<int>{2, 3}));

    // processing, then the final as the very last frame
    assert(fx.recorder.count("processing") == 1);
    assert(fx.recorder.count("error") == 0);
    const json& last = frames.back();
    assert(last["status"] == "transcription");
    assert(last["is_final"] == true);
    assert(last["text"] == "1 2 3");
    assert(!last.contains("chunk"));
    assert(frames[frames.size() - 2]["status"] == "processing");

    assert(fx.engine->calls == 3);
    assert(fx.session->fragmentCount() == 3);
    assert((fx.recorder.states == std::vector<SessionState>{
        SessionState::Streaming, SessionState::Finalizing, SessionState::Closed}));

    std::cout << "[PASS] test_streaming_scenario" << std::endl;
}

void test_end_without_audio() {
    Fixture fx;
    assert(fx.session->open());

    fx.session->handleMessage(END_FRAME);
    fx.session->waitUntilClosed();

    auto frames = fx.recorder.snapshot();
    assert(frames.size() == 1);
    assert(frames[0]["status"] == "error");
    assert(frames[0]["error"] == "No audio data received");
    assert(fx.recorder.count("transcription") == 0);
    assert(fx.recorder.count("processing") == 0);

    std::cout << "[PASS] test_end_without_audio" << std::endl;
}

void test_malformed_frame_mid_stream() {
    Fixture fx;
    assert(fx.session->open());

    fx.session->handleMessage(chunkFrame(1, 400));
    fx.session->handleMessage("{this is not json");
    assert(fx.session->state() == SessionState::Streaming);
    fx.session->handleMessage(R"({"type":"audio_chunk","data":"!!!!"})");
    assert(fx.session->fragmentCount() == 1);
    fx.session->handleMessage(chunkFrame(2, 400));
    fx.session->handleMessage(END_FRAME);
    fx.session->waitUntilClosed();

    auto frames = fx.recorder.snapshot();
    assert(fx.recorder.count("error") == 2);
    assert(frames[1]["status"] == "error");
    assert(frames[2]["status"] == "error");
    assert(frames[3]["status"] == "received");
    assert(frames[3]["chunk"] == 2);
    assert(frames.back()["is_final"] == true);
    assert(frames.back()["text"] == "1 2");

    std::cout << "[PASS] test_malformed_frame_mid_stream" << std::endl;
}

void test_unknown_type_and_binary() {
    Fixture fx;
    assert(fx.session->open());

    fx.session->handleMessage(R"({"type":"pause"})");
    fx.session->handleBinary(128);
    assert(fx.session->state() == SessionState::Streaming);
    assert(fx.recorder.count("error") == 2);

    fx.session->abandon();
    std::cout << "[PASS] test_unknown_type_and_binary" << std::endl;
}

void test_engine_not_ready() {
    Fixture fx(false);
    assert(!fx.session->open());
    assert(fx.session->state() == SessionState::Closed);

    auto frames = fx.recorder.snapshot();
    assert(frames.size() == 1);
    assert(frames[0]["error"] == "Model not initialized");

    // Nothing is accepted afterwards
    fx.session->handleMessage(chunkFrame(1, 2000));
    assert(fx.recorder.snapshot().size() == 1);

    std::cout << "[PASS] test_engine_not_ready" << std::endl;
}

void test_messages_after_end_ignored() {
    Fixture fx;
    assert(fx.session->open());

    fx.session->handleMessage(chunkFrame(1, 400));
    fx.session->handleMessage(END_FRAME);
    fx.session->handleMessage(chunkFrame(2, 400));
    fx.session->handleMessage(END_FRAME);
    fx.session->waitUntilClosed();

    assert(fx.session->fragmentCount() == 1);
    assert(fx.recorder.count("received") == 1);
    size_t finals = 0;
    for (const auto& f : fx.recorder.snapshot()) {
        if (f["status"] == "transcription" && f["is_final"] == true) ++finals;
    }
    assert(finals == 1);

    std::cout << "[PASS] test_messages_after_end_ignored" << std::endl;
}

void test_partials_out_of_order() {
    Fixture fx;
    fx.engine->setDelay(1, 300);    // First chunk finishes last
    assert(fx.session->open());

    fx.session->handleMessage(chunkFrame(1, 2000));
    fx.session->handleMessage(chunkFrame(2, 2000));
    fx.session->handleMessage(END_FRAME);
    fx.session->waitUntilClosed();

    std::vector<int> partial_order;
    for (const auto& f : fx.recorder.snapshot()) {
        if (f["status"] == "transcription" && f["is_final"] == false) {
            partial_order.push_back(f["chunk"].get<int>());
        }
    }
    assert((partial_order == std::vector<int>{2, 1}));

    // Final still follows sequence order and comes after every partial
    auto frames = fx.recorder.snapshot();
    assert(frames.back()["is_final"] == true);
    assert(frames.back()["text"] == "1 2");

    std::cout << "[PASS] test_partials_out_of_order" << std::endl;
}

void test_final_pass_failure() {
    Fixture fx;
    assert(fx.session->open());

    // 50 bytes in total is below the decoder minimum
    fx.session->handleMessage(chunkFrame(1, 50));
    fx.session->handleMessage(END_FRAME);
    fx.session->waitUntilClosed();

    auto frames = fx.recorder.snapshot();
    assert(frames.back()["status"] == "error");
    assert(frames.back()["error"].get<std::string>().rfind("Audio processing failed: ", 0) == 0);
    assert(fx.recorder.count("processing") == 1);
    assert(fx.recorder.count("transcription") == 0);

    std::cout << "[PASS] test_final_pass_failure" << std::endl;
}

void test_abandon_while_streaming() {
    Fixture fx;
    fx.engine->setDelay(1, 200);
    assert(fx.session->open());

    fx.session->handleMessage(chunkFrame(1, 2000));
    fx.session->abandon();
    assert(fx.session->state() == SessionState::Closed);
    fx.session->waitUntilClosed();

    // The in-flight partial completes but is never delivered
    fx.workers.join();
    assert(fx.engine->calls == 1);
    assert(fx.recorder.count("received") == 1);
    assert(fx.recorder.count("transcription") == 0);

    std::cout << "[PASS] test_abandon_while_streaming" << std::endl;
}

void test_abandon_while_finalizing() {
    Fixture fx;
    fx.engine->setDelay(1, 200);
    assert(fx.session->open());

    fx.session->handleMessage(chunkFrame(1, 2000));
    fx.session->handleMessage(END_FRAME);
    assert(fx.session->state() == SessionState::Finalizing);
    fx.session->abandon();

    fx.workers.join();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // Final pass never ran
    assert(fx.engine->calls == 1);
    assert(fx.recorder.count("processing") == 0);
    assert(fx.recorder.count("transcription") == 0);

    std::cout << "[PASS] test_abandon_while_finalizing" << std::endl;
}

void test_session_ids_unique() {
    boost::asio::thread_pool workers(1);
    auto engine = std::make_shared<test::MarkerEngine>();
    auto a = StreamSession::create(engine, test::rawDecoder(), workers);
    auto b = StreamSession::create(engine, test::rawDecoder(), workers);
    assert(a->id() != b->id());
    assert(a->id().rfind("session-", 0) == 0);
    assert(a->state() == SessionState::Open);
    workers.join();

    std::cout << "[PASS] test_session_ids_unique" << std::endl;
}

int main() {
    std::cout << "=== StreamSession Tests ===" << std::endl;

    test_streaming_scenario();
    test_end_without_audio();
    test_malformed_frame_mid_stream();
    test_unknown_type_and_binary();
    test_engine_not_ready();
    test_messages_after_end_ignored();
    test_partials_out_of_order();
    test_final_pass_failure();
    test_abandon_while_streaming();
    test_abandon_while_finalizing();
    test_session_ids_unique();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
