/**
 * Session coordinator fan-out and end-to-end agent scenarios:
 * - One request per listener whose language differs from the speaker's.
 * - A failing or slow listener does not cost the others their result.
 * - Same-language sessions never call the translation service.
 * - Agents never translate or replay their own (or synthesized) speech.
 * - Stopping an agent takes it out of routing and fan-out first.
 *
 * Run from build dir: ./test_session_coordinator
 */

#include "session.h"
#include "session_coordinator.h"
#include "translation_agent.h"
#include "test_support.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <thread>

using namespace polyglot;
using namespace polyglot::testing;

namespace {

Segment make_segment(const std::string& id, const std::string& speaker, const std::string& text,
                     Language language) {
    Segment segment;
    segment.segment_id = id;
    segment.speaker_id = speaker;
    segment.text = text;
    segment.source_language = language;
    segment.created_at = Clock::now();
    segment.is_final = true;
    segment.confidence = 0.95f;
    return segment;
}

Config test_config() {
    Config config;
    config.buffer.max_delay_ms = 500;
    config.buffer.poll_interval_ms = 50;
    config.translation.timeout_ms = 1000;
    return config;
}

AgentProfile profile(const std::string& id, Language language) {
    AgentProfile p;
    p.participant_id = id;
    p.language = language;
    return p;
}

RecognizerEvent final_event(const std::string& text, float confidence) {
    RecognizerEvent e;
    e.kind = RecognizerEventKind::Final;
    e.text = text;
    e.confidence = confidence;
    return e;
}

RecognizerEvent interim_event(const std::string& text, float confidence) {
    RecognizerEvent e;
    e.kind = RecognizerEventKind::Interim;
    e.text = text;
    e.confidence = confidence;
    return e;
}

/// Start both agents and introduce them to each other
void introduce(TranslationAgent& a, TranslationAgent& b) {
    a.on_remote_participant_joined(b.profile().participant_id, b.profile().language);
    b.on_remote_participant_joined(a.profile().participant_id, a.profile().language);
}

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- Coordinator: only other-language listeners get a request ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        SessionCoordinator coordinator(translator, 1000);
        TranslationPreferences formal;
        formal.formal_tone = true;
        coordinator.add_agent("x", Language::English, TranslationPreferences());
        coordinator.add_agent("y", Language::Spanish, formal);
        coordinator.add_agent("z", Language::French, TranslationPreferences());
        coordinator.add_agent("w", Language::English, TranslationPreferences());
        ASSERT(coordinator.agent_count() == 4);

        Segment segment = make_segment("seg-1", "x", "hello", Language::English);
        auto results = coordinator.coordinate("x", segment);
        ASSERT(results.size() == 2);
        ASSERT(results.count("y") && results["y"].translated_text == "hola");
        ASSERT(results.count("z") && results["z"].translated_text == "bonjour");
        ASSERT(!results.count("w"));
        ASSERT(!results.count("x"));
        ASSERT(translator->calls_made.load() == 2);
        ASSERT(translator->preferences_for(Language::Spanish).formal_tone);
        ASSERT(results["y"].segment_id == "seg-1");
        ASSERT(results["y"].speaker_id == "x");
        ASSERT(results["y"].listener_id == "y");
        ASSERT(results["y"].original_text == "hello");
        ASSERT(results["y"].target_language == Language::Spanish);

        FanOutResult fan = coordinator.fan_out(segment);
        ASSERT(fan.requested == 2 && fan.results.size() == 2);

        CoordinatorStats stats = coordinator.get_stats();
        ASSERT(stats.requests_issued == 4);
        ASSERT(stats.requests_succeeded == 4);

        ASSERT(coordinator.remove_agent("z"));
        ASSERT(!coordinator.remove_agent("z"));
        ASSERT(coordinator.coordinate("x", segment).size() == 1);
    }

    // --- Partial failure: listener A's error does not cost listener B ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        translator->fail_for(Language::French);
        SessionCoordinator coordinator(translator, 1000);
        coordinator.add_agent("x", Language::English, TranslationPreferences());
        coordinator.add_agent("y", Language::Spanish, TranslationPreferences());
        coordinator.add_agent("z", Language::French, TranslationPreferences());

        FanOutResult fan = coordinator.fan_out(make_segment("seg-2", "x", "hello", Language::English));
        ASSERT(fan.requested == 2);
        ASSERT(fan.results.size() == 1);
        ASSERT(fan.results.count("y") == 1);
        ASSERT(coordinator.get_stats().requests_failed == 1);
    }

    // --- A slow listener is cut off at the request timeout ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        translator->delay_for(Language::French, 800);
        SessionCoordinator coordinator(translator, 150);
        coordinator.add_agent("x", Language::English, TranslationPreferences());
        coordinator.add_agent("y", Language::Spanish, TranslationPreferences());
        coordinator.add_agent("z", Language::French, TranslationPreferences());

        auto start = Clock::now();
        auto results = coordinator.coordinate("x", make_segment("seg-3", "x", "hello", Language::English));
        int64_t elapsed = ms_since(start);
        ASSERT(results.size() == 1 && results.count("y"));
        ASSERT(elapsed < 500);
        ASSERT(coordinator.get_stats().requests_timed_out == 1);
    }

    // --- Latencies are per request: a fast listener does not inherit a slow one's time ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        translator->delay_for(Language::French, 300);
        SessionCoordinator coordinator(translator, 1000);
        coordinator.add_agent("a-speaker", Language::English, TranslationPreferences());
        coordinator.add_agent("b-fr", Language::French, TranslationPreferences());
        coordinator.add_agent("c-es", Language::Spanish, TranslationPreferences());

        auto results = coordinator.coordinate("a-speaker",
                                              make_segment("seg-lat", "a-speaker", "hello", Language::English));
        ASSERT(results.size() == 2);
        ASSERT(results["b-fr"].translation_latency_ms >= 250);
        ASSERT(results["c-es"].translation_latency_ms < 100);
        ASSERT(results["c-es"].total_latency_ms < 100);
        ASSERT(results["b-fr"].total_latency_ms >= results["b-fr"].translation_latency_ms);
    }

    // --- Requests beyond the pool size wait; ones still queued at the deadline are never sent ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        translator->delay_for(Language::Spanish, 400);
        SessionCoordinator coordinator(translator, 200, 1);
        coordinator.add_agent("x", Language::English, TranslationPreferences());
        coordinator.add_agent("y", Language::Spanish, TranslationPreferences());
        coordinator.add_agent("z", Language::French, TranslationPreferences());

        auto results = coordinator.coordinate("x", make_segment("seg-q", "x", "hello", Language::English));
        ASSERT(results.empty());
        ASSERT(coordinator.get_stats().requests_timed_out == 2);
        sleep_ms(400);
        ASSERT(translator->calls_made.load() == 1);
    }

    // --- Same language: no translation request ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        SessionCoordinator coordinator(translator, 1000);
        coordinator.add_agent("x", Language::English, TranslationPreferences());
        coordinator.add_agent("y", Language::English, TranslationPreferences());
        FanOutResult fan = coordinator.fan_out(make_segment("seg-4", "x", "hello", Language::English));
        ASSERT(fan.requested == 0 && fan.results.empty());
        ASSERT(translator->calls_made.load() == 0);
    }

    // --- Scenario: same language session ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        auto transport = std::make_shared<RecordingTransport>();
        auto tts = std::make_shared<FakeTTS>();
        SessionRegistry registry(test_config(), translator, transport);
        auto session = registry.join("room");
        registry.join("room");

        TranslationAgent x(profile("x", Language::English), tts);
        TranslationAgent y(profile("y", Language::English), tts);
        ASSERT(x.start(session).is_ok());
        ASSERT(y.start(session).is_ok());
        introduce(x, y);

        y.on_speaking_started("x");
        y.on_recognizer_event("x", "x/microphone", final_event("hello", 0.95f));
        x.on_recognizer_event("x", "x/microphone", final_event("hello", 0.95f));

        auto config = session->routing().get_config("y");
        ASSERT(config && config->hear_original.count("x") == 1);
        ASSERT(transport->audible("y", "x"));
        ASSERT(wait_for([&] { return session->buffer().get_stats().segments_dispatched == 1; }, 500));
        sleep_ms(100);
        ASSERT(translator->calls_made.load() == 0);
        ASSERT(transport->plays_to("y").empty());

        y.on_speaking_stopped("x");
        ASSERT(!transport->audible("y", "x"));

        x.stop();
        y.stop();
        registry.leave("room");
        registry.leave("room");
        ASSERT(registry.session_count() == 0);
    }

    // --- Scenario: different language, fast path ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        auto transport = std::make_shared<RecordingTransport>();
        auto tts = std::make_shared<FakeTTS>();
        SessionRegistry registry(test_config(), translator, transport);
        auto session = registry.join("room");

        TranslationAgent x(profile("x", Language::English), tts);
        TranslationAgent y(profile("y", Language::Spanish), tts);
        ASSERT(x.start(session).is_ok());
        ASSERT(y.start(session).is_ok());
        ASSERT(!y.start(session).is_ok());
        introduce(x, y);

        y.on_speaking_started("x");
        auto start = Clock::now();
        // Every agent hears the recognizer; only the adapter owner feeds it in
        x.on_recognizer_event("x", "x/microphone", final_event("hello", 0.95f));
        y.on_recognizer_event("x", "x/microphone", final_event("hello", 0.95f));

        ASSERT(wait_for([&] { return transport->plays_to("y").size() == 1; }, 1000));
        ASSERT(ms_since(start) < 500);
        auto spoken = tts->spoken();
        ASSERT(spoken.size() == 1 && spoken[0] == "hola");
        ASSERT(tts->voices().size() == 1 && tts->voices()[0] == "lucia");
        ASSERT(transport->plays_to("y")[0].stream_id == y.output_stream_id());
        ASSERT(translator->calls_made.load() == 1);

        auto config = session->routing().get_config("y");
        ASSERT(config && config->mute.count("x") == 1);
        ASSERT(config && config->hear_original.count("x") == 0);
        ASSERT(!transport->audible("y", "x"));
        ASSERT(transport->plays_to("x").empty());

        // Reply the other way
        y.on_speaking_started("y");
        x.on_recognizer_event("y", "y/microphone", final_event("hola", 0.9f));
        ASSERT(wait_for([&] { return transport->plays_to("x").size() == 1; }, 1000));

        nlohmann::json stats = y.stats();
        ASSERT(stats["translations_played"] == 1);
        ASSERT(stats["language"] == "es");

        x.stop();
        y.stop();
        registry.leave("room");
    }

    // --- Scenario: timeout path, no final ever arrives ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        auto transport = std::make_shared<RecordingTransport>();
        auto tts = std::make_shared<FakeTTS>();
        SessionRegistry registry(test_config(), translator, transport);
        auto session = registry.join("room");

        TranslationAgent x(profile("x", Language::English), tts);
        TranslationAgent y(profile("y", Language::Spanish), tts);
        x.start(session);
        y.start(session);
        introduce(x, y);

        auto start = Clock::now();
        y.on_recognizer_event("x", "x/microphone", interim_event("good", 0.5f));
        y.on_recognizer_event("x", "x/microphone", interim_event("good morning", 0.5f));
        sleep_ms(200);
        ASSERT(translator->calls_made.load() == 0);

        ASSERT(wait_for([&] { return transport->plays_to("y").size() == 1; }, 1500));
        int64_t elapsed = ms_since(start);
        ASSERT(elapsed >= 450);
        ASSERT(elapsed < 500 + 400);
        auto spoken = tts->spoken();
        ASSERT(spoken.size() == 1 && spoken[0] == "buenos dias");
        ASSERT(session->buffer().get_stats().segments_forced == 1);

        x.stop();
        y.stop();
        registry.leave("room");
    }

    // --- Scenario: mid-session join ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        auto transport = std::make_shared<RecordingTransport>();
        auto tts = std::make_shared<FakeTTS>();
        SessionRegistry registry(test_config(), translator, transport);
        auto session = registry.join("room");

        TranslationAgent x(profile("x", Language::English), tts);
        TranslationAgent y(profile("y", Language::Spanish), tts);
        x.start(session);
        y.start(session);
        introduce(x, y);

        TranslationAgent z(profile("z", Language::French), tts);
        ASSERT(registry.join("room") == session);
        z.start(session);
        introduce(x, z);
        introduce(y, z);

        auto xc = session->routing().get_config("x");
        auto yc = session->routing().get_config("y");
        auto zc = session->routing().get_config("z");
        ASSERT(xc && xc->hear_translated.count("z") == 1);
        ASSERT(yc && yc->hear_translated.count("z") == 1);
        ASSERT(zc && zc->hear_translated.count("x") == 1 && zc->hear_translated.count("y") == 1);

        // x is recognized once even though y and z both hold its adapter
        ASSERT(session->has_adapter("x"));
        y.on_recognizer_event("x", "x/microphone", final_event("hello", 0.95f));
        z.on_recognizer_event("x", "x/microphone", final_event("hello", 0.95f));
        ASSERT(wait_for([&] {
            return transport->plays_to("y").size() == 1 && transport->plays_to("z").size() == 1;
        }, 1000));
        sleep_ms(100);
        ASSERT(translator->calls_made.load() == 2);

        // When y leaves, z takes over recognizing x
        y.stop();
        x.on_remote_participant_left("y");
        z.on_remote_participant_left("y");
        ASSERT(!session->coordinator().has_agent("y"));
        ASSERT(!session->routing().is_registered("y"));
        ASSERT(session->has_adapter("x"));
        ASSERT(!session->has_adapter("y"));

        z.on_recognizer_event("x", "x/microphone", final_event("hello", 0.95f));
        ASSERT(wait_for([&] { return transport->plays_to("z").size() == 2; }, 1000));
        ASSERT(transport->plays_to("y").size() == 1);

        x.stop();
        z.stop();
        registry.leave("room");
        registry.leave("room");
        ASSERT(registry.session_count() == 0);
    }

    // --- Feedback loop and self-translation are silent no-ops ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        auto transport = std::make_shared<RecordingTransport>();
        auto tts = std::make_shared<FakeTTS>();
        SessionRegistry registry(test_config(), translator, transport);
        auto session = registry.join("room");

        TranslationAgent x(profile("x", Language::English), tts);
        TranslationAgent y(profile("y", Language::Spanish), tts);
        x.start(session);
        y.start(session);
        introduce(x, y);
        ASSERT(session->is_synthesized_stream(y.output_stream_id()));

        // y's synthesized Spanish picked up on x's side is never recognized
        x.on_recognizer_event("y", y.output_stream_id(), final_event("hola", 0.99f));
        // An agent never recognizes its own participant
        x.on_recognizer_event("x", "x/microphone", final_event("hello", 0.99f));
        sleep_ms(700);
        ASSERT(session->buffer().get_stats().segments_submitted == 0);
        ASSERT(translator->calls_made.load() == 0);

        // Results about one's own speech are never played
        TranslationResult own;
        own.segment_id = "own";
        own.speaker_id = "y";
        own.listener_id = "y";
        own.translated_text = "hola";
        own.target_language = Language::Spanish;
        y.deliver(own);

        // Results addressed to someone else are not played either
        TranslationResult other = own;
        other.speaker_id = "x";
        other.listener_id = "x";
        y.deliver(other);

        ASSERT(y.wait_for_playback(500));
        ASSERT(transport->plays_to("y").empty());
        ASSERT(y.stats()["translations_dropped"] == 2);
        ASSERT(x.stats()["feedback_events_dropped"] == 2);

        x.stop();
        y.stop();
        registry.leave("room");
    }

    // --- Translation failure: silence, never the raw stream ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        translator->fail_for(Language::Spanish);
        auto transport = std::make_shared<RecordingTransport>();
        auto tts = std::make_shared<FakeTTS>();
        SessionRegistry registry(test_config(), translator, transport);
        auto session = registry.join("room");

        TranslationAgent x(profile("x", Language::English), tts);
        TranslationAgent y(profile("y", Language::Spanish), tts);
        x.start(session);
        y.start(session);
        introduce(x, y);

        y.on_speaking_started("x");
        y.on_recognizer_event("x", "x/microphone", final_event("hello", 0.95f));
        ASSERT(wait_for([&] { return session->buffer().get_stats().translations_failed == 1; }, 1000));
        ASSERT(transport->plays_to("y").empty());
        ASSERT(!transport->audible("y", "x"));

        x.stop();
        y.stop();
        registry.leave("room");
    }

    // --- Paused translated route: result dropped ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        auto transport = std::make_shared<RecordingTransport>();
        auto tts = std::make_shared<FakeTTS>();
        SessionRegistry registry(test_config(), translator, transport);
        auto session = registry.join("room");

        TranslationAgent x(profile("x", Language::English), tts);
        TranslationAgent y(profile("y", Language::Spanish), tts);
        x.start(session);
        y.start(session);
        introduce(x, y);

        ASSERT(session->routing().disable_route(make_route_id("x", "y", StreamType::Translated)));
        y.on_recognizer_event("x", "x/microphone", final_event("hello", 0.95f));
        ASSERT(wait_for([&] { return y.stats()["translations_dropped"] == 1; }, 1000));
        ASSERT(transport->plays_to("y").empty());

        x.stop();
        y.stop();
        registry.leave("room");
    }

    // --- Waiting for playback while the agent stops keeps the playback queue alive ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        auto transport = std::make_shared<RecordingTransport>();
        auto tts = std::make_shared<FakeTTS>();
        SessionRegistry registry(test_config(), translator, transport);
        auto session = registry.join("room");

        for (int round = 0; round < 30; ++round) {
            TranslationAgent x(profile("x", Language::English), tts);
            TranslationAgent y(profile("y", Language::Spanish), tts);
            x.start(session);
            y.start(session);
            introduce(x, y);

            TranslationResult result;
            result.segment_id = "round-" + std::to_string(round);
            result.speaker_id = "x";
            result.listener_id = "y";
            result.original_text = "hello";
            result.translated_text = "hola";
            result.source_language = Language::English;
            result.target_language = Language::Spanish;
            y.deliver(result);

            std::atomic<bool> drained{false};
            std::thread waiter([&] { drained = y.wait_for_playback(0); });
            y.stop();
            waiter.join();
            ASSERT(drained.load());
            ASSERT(y.wait_for_playback(0));
            x.stop();
        }
        ASSERT(transport->plays_to("y").size() == 30);
        registry.leave("room");
    }

    // --- Stopped agent: out of routing and fan-out, late speech goes nowhere ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        auto transport = std::make_shared<RecordingTransport>();
        auto tts = std::make_shared<FakeTTS>();
        SessionRegistry registry(test_config(), translator, transport);
        auto session = registry.join("room");

        TranslationAgent x(profile("x", Language::English), tts);
        TranslationAgent y(profile("y", Language::Spanish), tts);
        TranslationAgent z(profile("z", Language::French), tts);
        x.start(session);
        y.start(session);
        z.start(session);
        introduce(x, y);
        introduce(x, z);
        introduce(y, z);

        y.stop();
        ASSERT(!y.is_running());
        ASSERT(!session->coordinator().has_agent("y"));
        ASSERT(!session->routing().is_registered("y"));
        ASSERT(!session->buffer().has_listener("y"));

        z.on_recognizer_event("x", "x/microphone", final_event("hello", 0.95f));
        ASSERT(wait_for([&] { return transport->plays_to("z").size() == 1; }, 1000));
        sleep_ms(100);
        ASSERT(transport->plays_to("y").empty());
        ASSERT(translator->calls_made.load() == 1);

        x.stop();
        z.stop();
        registry.leave("room");
    }

    // --- Registry lifecycle ---
    {
        auto translator = std::make_shared<FakeTranslator>();
        auto transport = std::make_shared<RecordingTransport>();
        SessionRegistry registry(test_config(), translator, transport);
        auto a = registry.join("a");
        auto b = registry.join("b");
        ASSERT(a != b);
        ASSERT(registry.session_count() == 2);
        ASSERT(registry.find("a") == a);
        ASSERT(registry.leave("a"));
        ASSERT(!registry.find("a"));
        ASSERT(!registry.leave("a"));
        ASSERT(registry.leave("b"));
        ASSERT(registry.session_count() == 0);
    }

    // --- Every pipeline stage of a translated segment leaves a trace line ---
    {
        const std::string log_path = "test_session_trace.txt";
        std::remove(log_path.c_str());
        Logger::shutdown();
        Logger::initialize(LogLevel::INFO, log_path);

        auto translator = std::make_shared<FakeTranslator>();
        auto transport = std::make_shared<RecordingTransport>();
        auto tts = std::make_shared<FakeTTS>();
        SessionRegistry registry(test_config(), translator, transport);
        auto session = registry.join("room");

        TranslationAgent x(profile("x", Language::English), tts);
        TranslationAgent y(profile("y", Language::Spanish), tts);
        x.start(session);
        y.start(session);
        introduce(x, y);

        y.on_recognizer_event("x", "x/microphone", final_event("hello", 0.95f));
        ASSERT(wait_for([&] { return transport->plays_to("y").size() == 1; }, 1000));
        ASSERT(y.wait_for_playback(500));

        x.stop();
        y.stop();
        registry.leave("room");
        Logger::shutdown();
        Logger::initialize(LogLevel::WARN);

        std::ifstream in(log_path);
        std::stringstream contents;
        contents << in.rdbuf();
        std::string text = contents.str();
        for (const char* stage : {"submit", "dispatch", "translate", "complete", "deliver", "play"}) {
            ASSERT(text.find(std::string("stage=") + stage + " ") != std::string::npos);
        }
        std::remove(log_path.c_str());
    }

    return finish("session coordinator");
}
