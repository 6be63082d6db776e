#pragma once

#include "audio_routing.h"
#include "core/config.h"
#include "session_coordinator.h"
#include "transcript_adapter.h"
#include "translation_buffer.h"
#include "transport/audio_transport.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace polyglot {

/**
 * @brief Everything the agents of one call share
 *
 * Owns the routing policy, the translation buffer and its coordinator, one
 * transcript adapter per remote speaker and the set of stream ids carrying
 * synthesized speech. Agents reach all of it through the Session handle they
 * were started with; nothing here is process-global.
 *
 * Adapters are reference-counted by the agents that asked for them. The
 * first holder owns the adapter: only its recognizer events are fed in, so
 * each speaker is recognized once however many agents listen.
 */
class Session {
public:
    Session(const std::string& session_id,
            const Config& config,
            std::shared_ptr<translation::ITranslationService> translator,
            std::shared_ptr<transport::IAudioTransport> transport);
    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return session_id_; }
    const Config& config() const { return config_; }

    AudioRoutingPolicy& routing() { return routing_; }
    const AudioRoutingPolicy& routing() const { return routing_; }
    SessionCoordinator& coordinator() { return coordinator_; }
    TranslationBuffer& buffer() { return *buffer_; }
    std::shared_ptr<transport::IAudioTransport> transport() const { return transport_; }

    /**
     * @brief Attach a listening agent: routing, coordinator and buffer listener
     */
    void attach_agent(const std::string& participant_id, Language language,
                      const TranslationPreferences& preferences,
                      TranslationCallback callback);

    /**
     * @brief Detach an agent, routing and coordinator first
     */
    void detach_agent(const std::string& participant_id);

    size_t agent_count() const;

    /**
     * @brief Record a participant's language (registers it with routing)
     */
    void set_participant_language(const std::string& participant_id, Language language);
    void remove_participant(const std::string& participant_id);
    std::optional<Language> participant_language(const std::string& participant_id) const;

    /**
     * @brief Take a reference on speaker's adapter, creating it on first use
     */
    void acquire_adapter(const std::string& speaker_id, Language language,
                         const std::string& holder_id);

    /**
     * @brief Drop holder's reference; the adapter goes away with the last one
     */
    void release_adapter(const std::string& speaker_id, const std::string& holder_id);

    bool has_adapter(const std::string& speaker_id) const;

    /**
     * @brief The speaker's adapter if holder_id currently owns it, else null
     */
    std::shared_ptr<StreamingTranscriptAdapter> adapter_for(const std::string& speaker_id,
                                                            const std::string& holder_id) const;

    bool speaking_started(const std::string& participant_id);
    void speaking_stopped(const std::string& participant_id);
    std::optional<std::string> current_speaker() const;

    void mark_synthesized_stream(const std::string& stream_id);
    bool is_synthesized_stream(const std::string& stream_id) const;

    /**
     * @brief Routing table, buffer and coordinator counters as JSON
     */
    nlohmann::json describe() const;

private:
    struct AdapterEntry {
        std::shared_ptr<StreamingTranscriptAdapter> adapter;
        std::vector<std::string> holders;   ///< front() owns the adapter
    };

    std::string session_id_;
    Config config_;
    std::shared_ptr<transport::IAudioTransport> transport_;

    AudioRoutingPolicy routing_;
    SessionCoordinator coordinator_;
    std::unique_ptr<TranslationBuffer> buffer_;   // After coordinator_: stopped and destroyed first

    mutable std::mutex mutex_;
    std::set<std::string> agents_;
    std::map<std::string, Language> languages_;
    std::map<std::string, AdapterEntry> adapters_;
    std::set<std::string> synthesized_streams_;
};

/**
 * @brief Creates a Session for the first member of a call and drops it after the last
 */
class SessionRegistry {
public:
    SessionRegistry(const Config& config,
                    std::shared_ptr<translation::ITranslationService> translator,
                    std::shared_ptr<transport::IAudioTransport> transport);

    // Non-copyable
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Get (or create) the session and count one more member
     */
    std::shared_ptr<Session> join(const std::string& session_id);

    /**
     * @brief Count one member out; the session is released with the last
     * @return false if the session is unknown
     */
    bool leave(const std::string& session_id);

    std::shared_ptr<Session> find(const std::string& session_id) const;
    size_t session_count() const;

private:
    struct Entry {
        std::shared_ptr<Session> session;
        size_t members = 0;
    };

    Config config_;
    std::shared_ptr<translation::ITranslationService> translator_;
    std::shared_ptr<transport::IAudioTransport> transport_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> sessions_;
};

} // namespace polyglot
