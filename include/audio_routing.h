#pragma once

#include "language.h"
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
 * @brief What one listener hears from every other participant
 *
 * Every other participant is in exactly one of hear_original and
 * hear_translated. A translated source is also in mute: its raw stream is
 * never played to this listener, only the synthesized rendering.
 */
struct ParticipantAudioConfig {
    std::string participant_id;
    Language native_language = Language::Unknown;
    std::set<std::string> hear_original;
    std::set<std::string> hear_translated;
    std::set<std::string> mute;
};

enum class StreamType {
    Original,
    Translated
};

const char* stream_type_name(StreamType type);

/**
 * @brief Materialized (source -> target) edge of the routing table
 *
 * Regenerated on every recompute; only `active` changes in between
 * (pause/resume through enable_route/disable_route).
 */
struct AudioRoute {
    std::string route_id;   ///< "<source>-><target>:<original|translated>"
    std::string source_id;
    std::string target_id;
    Language source_language = Language::Unknown;
    Language target_language = Language::Unknown;
    StreamType stream_type = StreamType::Original;
    bool active = true;
};

std::string make_route_id(const std::string& source_id, const std::string& target_id,
                          StreamType type);

/**
 * @brief Transport-side receiver of mute decisions
 *
 * Called with the policy lock held: implementations must not call back into
 * the policy.
 */
class AudioControlSink {
public:
    virtual ~AudioControlSink() = default;

    /**
     * @brief Make source's raw stream audible (or not) to listener
     */
    virtual void set_original_audible(const std::string& listener_id,
                                      const std::string& source_id,
                                      bool audible) = 0;
};

/**
 * @brief Session-wide routing table
 *
 * Any change to the roster, a language or the current speaker rebuilds the
 * whole table from the roster snapshot and pushes every pair to the control
 * sink. Nothing is patched incrementally.
 *
 * A source's original stream is audible to a listener only when the two
 * share a language, the source is the current speaker and the route is not
 * paused. Sources in another language stay muted regardless of speaker.
 */
class AudioRoutingPolicy {
public:
    AudioRoutingPolicy();
    explicit AudioRoutingPolicy(std::shared_ptr<AudioControlSink> sink);

    // Non-copyable
    AudioRoutingPolicy(const AudioRoutingPolicy&) = delete;
    AudioRoutingPolicy& operator=(const AudioRoutingPolicy&) = delete;

    /**
     * @brief Add a participant, or change the language of a known one
     */
    void register_participant(const std::string& participant_id, Language language);

    /**
     * @brief Remove a participant; clears the current speaker if it was them
     * @return false if the participant was not registered
     */
    bool unregister_participant(const std::string& participant_id);

    bool is_registered(const std::string& participant_id) const;
    std::vector<std::string> participants() const;

    /**
     * @brief Set (or clear, with nullopt) the current speaker
     * @return false if the speaker is not registered (no change)
     */
    bool set_current_speaker(const std::optional<std::string>& participant_id);
    void clear_current_speaker();
    std::optional<std::string> current_speaker() const;

    std::optional<ParticipantAudioConfig> get_config(const std::string& participant_id) const;

    std::vector<AudioRoute> routes() const;

    /**
     * @brief Active routes delivering audio to participant_id
     */
    std::vector<AudioRoute> active_routes_for(const std::string& participant_id) const;

    /**
     * @brief Resume a paused route
     * @return false if no such route exists
     */
    bool enable_route(const std::string& route_id);

    /**
     * @brief Pause a route; survives recomputation while the route exists
     * @return false if no such route exists
     */
    bool disable_route(const std::string& route_id);

    /**
     * @brief True if target should hear source's translated rendering
     */
    bool is_translation_route_active(const std::string& source_id,
                                     const std::string& target_id) const;

    bool is_original_audible(const std::string& listener_id,
                             const std::string& source_id) const;

    /**
     * @brief Diagnostics dump: participants, configs, routes, current speaker
     */
    nlohmann::json routing_info() const;

private:
    void recompute_locked();
    void apply_locked();
    bool original_audible_locked(const std::string& listener_id,
                                 const std::string& source_id) const;

    mutable std::mutex mutex_;
    std::shared_ptr<AudioControlSink> sink_;

    std::map<std::string, Language> languages_;
    std::optional<std::string> current_speaker_;

    std::map<std::string, ParticipantAudioConfig> configs_;
    std::map<std::string, AudioRoute> routes_;
    std::set<std::string> paused_routes_;
    std::set<std::pair<std::string, std::string>> applied_pairs_;
};

} // namespace polyglot
