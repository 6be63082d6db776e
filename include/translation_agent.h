#pragma once

#include "core/types.h"
#include "transcript_adapter.h"
#include "errors.h"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace polyglot {

class Session;

namespace tts {
class ITTS;
}

/**
 * @brief Who an agent interprets for
 */
struct AgentProfile {
    std::string participant_id;
    Language language = Language::Unknown;
    TranslationPreferences preferences;
};

/**
 * @brief Per-user translation agent
 *
 * Interprets a session for one participant. Remote participants it learns
 * about get a transcript adapter in the session; translations addressed to
 * this participant are synthesized and played on the agent's own
 * single-worker queue. The agent's outbound stream is marked as synthesized
 * in the session, and anything arriving on it is never recognized.
 */
class TranslationAgent {
public:
    /**
     * @brief Construct agent for a participant
     * @param profile Participant, language and preferences
     * @param tts Speech synthesizer (may be shared between agents)
     */
    TranslationAgent(const AgentProfile& profile, std::shared_ptr<tts::ITTS> tts);

    /**
     * @brief Destructor - stops the agent if still running
     */
    ~TranslationAgent();

    // Non-copyable
    TranslationAgent(const TranslationAgent&) = delete;
    TranslationAgent& operator=(const TranslationAgent&) = delete;

    /**
     * @brief Join a session
     * @return InvalidState error if already running
     */
    VoidResult start(std::shared_ptr<Session> session);

    /**
     * @brief Leave the session
     *
     * Unregisters from routing, the coordinator and the buffer before the
     * playback queue and adapters are released; results still in flight are
     * discarded.
     */
    void stop();

    bool is_running() const;

    void on_remote_participant_joined(const std::string& participant_id, Language language);
    void on_remote_participant_left(const std::string& participant_id);

    /**
     * @brief Accept a finished translation for playback
     *
     * Drops results when stopped, when addressed elsewhere, when they are
     * this participant's own speech, or when the translated route is paused.
     * Never falls back to the raw stream.
     */
    void deliver(const TranslationResult& result);

    void on_speaking_started(const std::string& participant_id);
    void on_speaking_stopped(const std::string& participant_id);

    /**
     * @brief Recognizer output for participant_id heard on stream_id
     */
    void on_recognizer_event(const std::string& participant_id,
                             const std::string& stream_id,
                             const RecognizerEvent& event);

    /// Stream id this agent plays synthesized speech on
    std::string output_stream_id() const;

    const AgentProfile& profile() const;
    std::vector<std::string> remote_participants() const;

    /**
     * @brief Wait until queued playback finishes (0 = no limit)
     */
    bool wait_for_playback(int timeout_ms = 0);

    nlohmann::json stats() const;

private:
    // Shared so buffer callbacks still in flight after stop() see a live object
    class Impl;
    std::shared_ptr<Impl> pimpl_;
};

} // namespace polyglot
