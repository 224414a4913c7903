/**
 * test_session_reconciler.cpp - Final pass ordering and error surfacing
 */

#include "lts/session/SessionReconciler.hpp"
#include "support/TestFakes.hpp"

#include <cassert>
#include <iostream>

using namespace lts;
using namespace lts::session;

FragmentPtr makeFragment(uint64_t sequence, int16_t marker, size_t bytes) {
    auto fragment = std::make_shared<AudioFragment>();
    fragment->sequence = sequence;
    fragment->bytes = test::markerPayload(marker, bytes);
    return fragment;
}

void test_concatenation_order() {
    // Handed over out of order; joined by sequence
    std::vector<FragmentPtr> fragments = {
        makeFragment(3, 30, 4),
        makeFragment(1, 10, 4),
        makeFragment(2, 20, 2),
    };

    auto stream = SessionReconciler::concatenate(fragments);
    assert(stream.size() == 10);

    auto expected = test::markerPayload(10, 4);
    auto second = test::markerPayload(20, 2);
    auto third = test::markerPayload(30, 4);
    expected.insert(expected.end(), second.begin(), second.end());
    expected.insert(expected.end(), third.begin(), third.end());
    assert(stream == expected);

    std::cout << "[PASS] test_concatenation_order" << std::endl;
}

void test_final_result() {
    auto engine = std::make_shared<test::MarkerEngine>();
    SessionReconciler reconciler(test::rawDecoder(), engine);

    ReconcileResult outcome = reconciler.reconcile({
        makeFragment(2, 2, 600),
        makeFragment(3, 3, 600),
        makeFragment(1, 1, 600),
    });

    assert(outcome.ok());
    assert(outcome.result->text == "1 2 3");
    assert(outcome.result->is_final);
    assert(!outcome.result->chunk);

    std::cout << "[PASS] test_final_result" << std::endl;
}

void test_empty_audio() {
    auto engine = std::make_shared<test::MarkerEngine>();
    SessionReconciler reconciler(test::rawDecoder(), engine);

    ReconcileResult outcome = reconciler.reconcile({});
    assert(!outcome.ok());
    assert(outcome.error->kind == SessionErrorKind::EmptyAudio);
    assert(outcome.error->message == "No audio data received");
    assert(engine->calls == 0);

    std::cout << "[PASS] test_empty_audio" << std::endl;
}

void test_final_pass_failures() {
    auto engine = std::make_shared<test::MarkerEngine>();
    SessionReconciler reconciler(test::rawDecoder(), engine);

    // Total below the decoder minimum
    ReconcileResult outcome = reconciler.reconcile({makeFragment(1, 1, 40)});
    assert(!outcome.ok());
    assert(outcome.error->kind == SessionErrorKind::FinalPassFailed);
    assert(outcome.error->message.rfind("Audio processing failed: ", 0) == 0);

    engine->fail = true;
    outcome = reconciler.reconcile({makeFragment(1, 1, 400)});
    assert(!outcome.ok());
    assert(outcome.error->kind == SessionErrorKind::FinalPassFailed);
    assert(outcome.error->message == "Audio processing failed: engine exploded");

    std::cout << "[PASS] test_final_pass_failures" << std::endl;
}

int main() {
    std::cout << "=== SessionReconciler Tests ===" << std::endl;

    test_concatenation_order();
    test_final_result();
    test_empty_audio();
    test_final_pass_failures();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
