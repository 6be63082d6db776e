#include "translation_agent.h"
#include "session.h"
#include "task_pool.h"
#include "tts/tts_interface.h"
#include "logger.h"
#include "utils.h"
#include <atomic>
#include <map>
#include <mutex>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace polyglot {

class TranslationAgent::Impl : public std::enable_shared_from_this<Impl> {
public:
    Impl(const AgentProfile& profile, std::shared_ptr<tts::ITTS> tts)
        : profile_(profile)
        , tts_(std::move(tts))
        , running_(false)
        , played_(0)
        , dropped_(0)
        , synthesis_failures_(0)
        , feedback_dropped_(0) {
        voice_ = select_voice(profile_.language, profile_.preferences.voice);
    }

    ~Impl() {
        stop();
    }

    VoidResult start(std::shared_ptr<Session> session) {
        if (!session) {
            return make_error(ErrorType::InvalidState, "No session given");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return make_error(ErrorType::InvalidState,
                              "Agent for " + profile_.participant_id + " is already running");
        }

        session_ = std::move(session);
        playback_ = std::make_shared<TaskPool>("playback-" + profile_.participant_id, 1);

        session_->mark_synthesized_stream(output_stream_id());

        std::weak_ptr<Impl> weak = shared_from_this();
        session_->attach_agent(profile_.participant_id, profile_.language, profile_.preferences,
                               [weak](const TranslationResult& result) {
                                   if (auto self = weak.lock()) {
                                       self->deliver(result);
                                   }
                               });

        running_ = true;
        LOG_AGENT("Agent for " + profile_.participant_id + " (" +
                  language_code(profile_.language) + ", voice " + voice_ +
                  ") joined session " + session_->id());
        return VoidResult();
    }

    void stop() {
        std::shared_ptr<Session> session;
        std::map<std::string, Language> remotes;
        std::shared_ptr<TaskPool> playback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return;
            }
            running_ = false;
            session = std::move(session_);
            remotes.swap(remotes_);
            playback = std::move(playback_);
        }

        session->detach_agent(profile_.participant_id);
        for (const auto& remote : remotes) {
            session->release_adapter(remote.first, profile_.participant_id);
        }

        playback->shutdown();
        playback->wait_for_completion();
        playback.reset();

        LOG_AGENT("Agent for " + profile_.participant_id + " left session " + session->id());
    }

    bool is_running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    void on_remote_participant_joined(const std::string& participant_id, Language language) {
        if (participant_id == profile_.participant_id) {
            return;
        }
        std::shared_ptr<Session> session = current_session();
        if (!session) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            remotes_[participant_id] = language;
        }
        session->set_participant_language(participant_id, language);
        session->acquire_adapter(participant_id, language, profile_.participant_id);
        LOG_AGENT(profile_.participant_id + " sees " + participant_id + " (" + language_code(language) + ")");
    }

    void on_remote_participant_left(const std::string& participant_id) {
        std::shared_ptr<Session> session = current_session();
        if (!session) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (remotes_.erase(participant_id) == 0) {
                return;
            }
        }
        session->release_adapter(participant_id, profile_.participant_id);
        session->remove_participant(participant_id);
        LOG_AGENT(profile_.participant_id + " lost " + participant_id);
    }

    void deliver(const TranslationResult& result) {
        std::shared_ptr<Session> session;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return;
            }
            session = session_;
        }

        if (result.listener_id != profile_.participant_id) {
            dropped_++;
            LOG_DEBUG("Result for " + result.listener_id + " delivered to " + profile_.participant_id);
            return;
        }
        if (result.speaker_id == profile_.participant_id) {
            // Own speech coming back: nothing to play
            dropped_++;
            return;
        }
        if (!session->routing().is_translation_route_active(result.speaker_id, profile_.participant_id)) {
            dropped_++;
            LOG_AGENT("Translated route " + result.speaker_id + " -> " + profile_.participant_id +
                      " inactive, dropping " + result.segment_id);
            return;
        }

        std::ostringstream toss;
        toss << "listener=" << profile_.participant_id << " latency_ms=" << result.total_latency_ms
             << " text=\"" << utils::snippet(result.translated_text) << "\"";
        LOG_TRACE(result.segment_id, "deliver", toss.str());

        std::weak_ptr<Impl> weak = shared_from_this();
        bool queued = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (playback_) {
                queued = playback_->submit([weak, session, result]() {
                    if (auto self = weak.lock()) {
                        self->play(*session, result);
                    }
                });
            }
        }
        if (!queued) {
            dropped_++;
        }
    }

    void on_speaking_started(const std::string& participant_id) {
        if (std::shared_ptr<Session> session = current_session()) {
            session->speaking_started(participant_id);
        }
    }

    void on_speaking_stopped(const std::string& participant_id) {
        if (std::shared_ptr<Session> session = current_session()) {
            session->speaking_stopped(participant_id);
        }
    }

    void on_recognizer_event(const std::string& participant_id, const std::string& stream_id,
                             const RecognizerEvent& event) {
        std::shared_ptr<Session> session = current_session();
        if (!session) {
            return;
        }

        // Synthesized speech, ours or another agent's, is never recognized
        if (participant_id == profile_.participant_id || session->is_synthesized_stream(stream_id)) {
            feedback_dropped_++;
            return;
        }

        std::shared_ptr<StreamingTranscriptAdapter> adapter =
            session->adapter_for(participant_id, profile_.participant_id);
        if (!adapter) {
            // Unknown speaker, or another agent owns this speaker's recognition
            return;
        }
        adapter->handle(event);
    }

    std::string output_stream_id() const {
        return profile_.participant_id + "/interpretation";
    }

    const AgentProfile& profile() const { return profile_; }

    std::vector<std::string> remote_participants() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        for (const auto& remote : remotes_) {
            ids.push_back(remote.first);
        }
        return ids;
    }

    bool wait_for_playback(int timeout_ms) {
        std::shared_ptr<TaskPool> playback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            playback = playback_;
        }
        if (!playback) {
            return true;
        }
        return playback->wait_for_completion(timeout_ms);
    }

    json stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        json remotes = json::object();
        for (const auto& remote : remotes_) {
            remotes[remote.first] = language_code(remote.second);
        }
        return {
            {"participant_id", profile_.participant_id},
            {"language", language_code(profile_.language)},
            {"voice", voice_},
            {"running", running_},
            {"remote_participants", remotes},
            {"translations_played", played_.load()},
            {"translations_dropped", dropped_.load()},
            {"synthesis_failures", synthesis_failures_.load()},
            {"feedback_events_dropped", feedback_dropped_.load()}
        };
    }

private:
    std::shared_ptr<Session> current_session() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_ ? session_ : nullptr;
    }

    void play(Session& session, const TranslationResult& result) {
        if (!tts_) {
            dropped_++;
            return;
        }

        tts::SynthResult synth = tts_->synth(result.translated_text, result.target_language, voice_);
        if (!synth.ok()) {
            synthesis_failures_++;
            LOG_ERROR("Synthesis failed for " + result.segment_id + ": " + synth.error);
            return;
        }

        std::shared_ptr<transport::IAudioTransport> transport = session.transport();
        if (!transport) {
            dropped_++;
            return;
        }

        VoidResult played = transport->play(profile_.participant_id, output_stream_id(), synth.audio);
        if (played.is_error()) {
            dropped_++;
            LOG_ERROR("Playback failed for " + result.segment_id + ": " + played.error().describe());
            return;
        }

        played_++;
        {
            std::ostringstream toss;
            toss << "listener=" << profile_.participant_id << " stream=" << output_stream_id()
                 << " samples=" << synth.audio.size();
            LOG_TRACE(result.segment_id, "play", toss.str());
        }
        std::ostringstream oss;
        oss << "Played " << result.segment_id << " to " << profile_.participant_id
            << " (" << synth.audio.size() << " samples, synth " << synth.synthesis_ms << "ms)";
        LOG_TTS(oss.str());
    }

    AgentProfile profile_;
    std::shared_ptr<tts::ITTS> tts_;
    std::string voice_;

    mutable std::mutex mutex_;
    bool running_;
    std::shared_ptr<Session> session_;
    std::shared_ptr<TaskPool> playback_;   ///< Shared so a waiter keeps it alive across stop()
    std::map<std::string, Language> remotes_;

    std::atomic<size_t> played_;
    std::atomic<size_t> dropped_;
    std::atomic<size_t> synthesis_failures_;
    std::atomic<size_t> feedback_dropped_;
};

TranslationAgent::TranslationAgent(const AgentProfile& profile, std::shared_ptr<tts::ITTS> tts)
    : pimpl_(std::make_shared<Impl>(profile, std::move(tts))) {}

TranslationAgent::~TranslationAgent() {
    pimpl_->stop();
}

VoidResult TranslationAgent::start(std::shared_ptr<Session> session) {
    return pimpl_->start(std::move(session));
}

void TranslationAgent::stop() {
    pimpl_->stop();
}

bool TranslationAgent::is_running() const {
    return pimpl_->is_running();
}

void TranslationAgent::on_remote_participant_joined(const std::string& participant_id, Language language) {
    pimpl_->on_remote_participant_joined(participant_id, language);
}

void TranslationAgent::on_remote_participant_left(const std::string& participant_id) {
    pimpl_->on_remote_participant_left(participant_id);
}

void TranslationAgent::deliver(const TranslationResult& result) {
    pimpl_->deliver(result);
}

void TranslationAgent::on_speaking_started(const std::string& participant_id) {
    pimpl_->on_speaking_started(participant_id);
}

void TranslationAgent::on_speaking_stopped(const std::string& participant_id) {
    pimpl_->on_speaking_stopped(participant_id);
}

void TranslationAgent::on_recognizer_event(const std::string& participant_id,
                                           const std::string& stream_id,
                                           const RecognizerEvent& event) {
    pimpl_->on_recognizer_event(participant_id, stream_id, event);
}

std::string TranslationAgent::output_stream_id() const {
    return pimpl_->output_stream_id();
}

const AgentProfile& TranslationAgent::profile() const {
    return pimpl_->profile();
}

std::vector<std::string> TranslationAgent::remote_participants() const {
    return pimpl_->remote_participants();
}

bool TranslationAgent::wait_for_playback(int timeout_ms) {
    return pimpl_->wait_for_playback(timeout_ms);
}

json TranslationAgent::stats() const {
    return pimpl_->stats();
}

} // namespace polyglot
