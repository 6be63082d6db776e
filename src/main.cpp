#include "core/config.h"
#include "logger.h"
#include "session.h"
#include "translation_agent.h"
#include "translation/http_translation_service.h"
#include "tts/tts_interface.h"
#include "transport/audio_transport.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>

using json = nlohmann::json;

namespace polyglot {

namespace {

std::atomic<bool> g_interrupted(false);

void signal_handler(int) {
    g_interrupted = true;
}

/**
 * @brief Transport that only logs what it would do
 */
class LoggingTransport : public transport::IAudioTransport {
public:
    VoidResult play(const std::string& participant_id, const std::string& stream_id,
                    const AudioBuffer& audio) override {
        LOG_INFO("[Transport] play " + std::to_string(audio.size()) + " samples to " +
                 participant_id + " on " + stream_id);
        return VoidResult();
    }

    void set_original_audible(const std::string& listener_id, const std::string& source_id,
                              bool audible) override {
        LOG_DEBUG("[Transport] " + source_id + " -> " + listener_id + (audible ? " audible" : " muted"));
    }
};

/**
 * @brief Synthesizer stand-in: silence sized like the spoken text
 */
class SilentSynthesizer : public tts::ITTS {
public:
    tts::SynthResult synth(const std::string& text, Language language,
                           const std::string& voice) override {
        tts::SynthResult result;
        result.audio.assign(text.size() * SAMPLES_PER_CHAR, 0);
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.requests++;
        LOG_TTS(std::string(language_code(language)) + "/" + voice + ": \"" + text + "\"");
        return result;
    }

    bool is_ready() const override { return true; }

    tts::Stats get_stats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        tts::Stats stats = stats_;
        stats.engine_ready = true;
        return stats;
    }

private:
    static constexpr size_t SAMPLES_PER_CHAR = 960;   // ~60ms at 16kHz

    mutable std::mutex mutex_;
    tts::Stats stats_;
};

RecognizerEventKind parse_event_kind(const std::string& name) {
    if (name == "final") return RecognizerEventKind::Final;
    if (name == "speech_started") return RecognizerEventKind::SpeechStarted;
    if (name == "utterance_end") return RecognizerEventKind::UtteranceEnd;
    if (name == "error") return RecognizerEventKind::Error;
    if (name == "disconnected") return RecognizerEventKind::Disconnected;
    return RecognizerEventKind::Interim;
}

/**
 * @brief Drives one session from a JSON-lines event script
 */
class ScriptReplay {
public:
    ScriptReplay(SessionRegistry& registry, std::shared_ptr<tts::ITTS> tts,
                 const std::string& session_id)
        : registry_(registry), tts_(std::move(tts)), session_id_(session_id) {}

    ~ScriptReplay() {
        for (auto& entry : agents_) {
            entry.second->stop();
        }
        for (size_t i = 0; i < participants_.size(); ++i) {
            registry_.leave(session_id_);
        }
    }

    VoidResult apply(const json& event) {
        std::string type = event.value("type", "");
        if (type == "join") return join(event);
        if (type == "leave") return leave(event);
        if (type == "speaking_started" || type == "speaking_stopped") {
            std::string participant = event.value("participant", "");
            for (auto& entry : agents_) {
                if (type == "speaking_started") {
                    entry.second->on_speaking_started(participant);
                } else {
                    entry.second->on_speaking_stopped(participant);
                }
            }
            return VoidResult();
        }
        if (type == "recognizer") return recognize(event);
        if (type == "sleep") {
            std::this_thread::sleep_for(std::chrono::milliseconds(event.value("ms", 0)));
            return VoidResult();
        }
        return make_parse_error("Unknown event type '" + type + "'");
    }

    json report() const {
        json report;
        if (std::shared_ptr<Session> session = registry_.find(session_id_)) {
            report["session"] = session->describe();
        }
        json agents = json::array();
        for (const auto& entry : agents_) {
            agents.push_back(entry.second->stats());
        }
        report["agents"] = agents;
        return report;
    }

    void drain(int timeout_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        for (auto& entry : agents_) {
            entry.second->wait_for_playback(timeout_ms);
        }
    }

private:
    VoidResult join(const json& event) {
        std::string participant = event.value("participant", "");
        Language language = language_from_code(event.value("language", ""));
        if (participant.empty() || language == Language::Unknown) {
            return make_parse_error("join needs a participant and a supported language");
        }
        if (participants_.count(participant)) {
            return make_error(ErrorType::InvalidState, participant + " already joined");
        }

        std::shared_ptr<Session> session = registry_.join(session_id_);
        for (auto& entry : agents_) {
            entry.second->on_remote_participant_joined(participant, language);
        }

        if (event.value("agent", true)) {
            AgentProfile profile;
            profile.participant_id = participant;
            profile.language = language;
            profile.preferences.formal_tone = event.value("formal_tone", false);
            profile.preferences.preserve_emotion = event.value("preserve_emotion", true);
            profile.preferences.voice = event.value("voice", "");

            auto agent = std::make_unique<TranslationAgent>(profile, tts_);
            VoidResult started = agent->start(session);
            if (started.is_error()) {
                registry_.leave(session_id_);
                return started;
            }
            for (const auto& existing : participants_) {
                agent->on_remote_participant_joined(existing.first, existing.second);
            }
            agents_.emplace(participant, std::move(agent));
        } else {
            session->set_participant_language(participant, language);
        }

        participants_[participant] = language;
        return VoidResult();
    }

    VoidResult leave(const json& event) {
        std::string participant = event.value("participant", "");
        if (participants_.erase(participant) == 0) {
            return make_error(ErrorType::InvalidState, participant + " is not in the session");
        }

        auto it = agents_.find(participant);
        if (it != agents_.end()) {
            it->second->stop();
            agents_.erase(it);
        } else if (std::shared_ptr<Session> session = registry_.find(session_id_)) {
            session->remove_participant(participant);
        }
        for (auto& entry : agents_) {
            entry.second->on_remote_participant_left(participant);
        }
        registry_.leave(session_id_);
        return VoidResult();
    }

    VoidResult recognize(const json& event) {
        std::string participant = event.value("participant", "");
        if (!participants_.count(participant)) {
            return make_error(ErrorType::InvalidState, "recognizer event for unknown " + participant);
        }

        RecognizerEvent recognized;
        recognized.kind = parse_event_kind(event.value("kind", "interim"));
        recognized.text = event.value("text", "");
        recognized.confidence = event.value("confidence", 0.0f);
        std::string stream_id = event.value("stream", participant + "/microphone");

        for (auto& entry : agents_) {
            entry.second->on_recognizer_event(participant, stream_id, recognized);
        }
        return VoidResult();
    }

    SessionRegistry& registry_;
    std::shared_ptr<tts::ITTS> tts_;
    std::string session_id_;

    std::map<std::string, Language> participants_;
    std::map<std::string, std::unique_ptr<TranslationAgent>> agents_;
};

} // anonymous namespace

} // namespace polyglot

int main(int argc, char* argv[]) {
    polyglot::Logger::initialize(polyglot::LogLevel::INFO);

    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <script.jsonl> [session_id]" << std::endl;
        return 2;
    }

    polyglot::Result<polyglot::Config> loaded = polyglot::Config::load(argv[1]);
    if (loaded.is_error()) {
        polyglot::Logger::error(loaded.error().describe());
        polyglot::Logger::shutdown();
        return 1;
    }
    polyglot::Config config = loaded.value();

    polyglot::Logger::shutdown();
    polyglot::Logger::initialize(polyglot::parse_log_level(config.log_level), config.log_file);

    std::ifstream script(argv[2]);
    if (!script.is_open()) {
        polyglot::Logger::error(std::string("Failed to open script: ") + argv[2]);
        polyglot::Logger::shutdown();
        return 1;
    }

    std::signal(SIGINT, polyglot::signal_handler);
    std::signal(SIGTERM, polyglot::signal_handler);

    auto translator = std::make_shared<polyglot::translation::HttpTranslationService>(config.translation);
    auto transport = std::make_shared<polyglot::LoggingTransport>();
    auto tts = std::make_shared<polyglot::SilentSynthesizer>();

    int exit_code = 0;
    {
        polyglot::SessionRegistry registry(config, translator, transport);
        polyglot::ScriptReplay replay(registry, tts, argc > 3 ? argv[3] : "default");

        std::string line;
        size_t line_number = 0;
        while (!polyglot::g_interrupted && std::getline(script, line)) {
            line_number++;
            if (line.find_first_not_of(" \t\r") == std::string::npos || line[0] == '#') {
                continue;
            }

            polyglot::VoidResult applied;
            try {
                applied = replay.apply(json::parse(line));
            } catch (const json::exception& e) {
                applied = polyglot::make_parse_error(e.what());
            }
            if (applied.is_error()) {
                polyglot::Logger::error("Script line " + std::to_string(line_number) + ": " +
                                        applied.error().describe());
                exit_code = 1;
                break;
            }
        }

        // Let the last segments hit max-delay, translate and play
        replay.drain(config.buffer.max_delay_ms + config.translation.timeout_ms);
        std::cout << replay.report().dump(2) << std::endl;
    }

    polyglot::Logger::shutdown();
    return exit_code;
}
