#pragma once

#include "core/constants.h"
#include "core/types.h"
#include "translation_buffer.h"
#include "translation/translation_interface.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace polyglot {

class TaskPool;

/**
 * @brief A listening agent as the coordinator sees it
 */
struct ListenerInfo {
    std::string participant_id;
    Language language = Language::Unknown;
    TranslationPreferences preferences;
};

/**
 * @brief Fan-out counters
 */
struct CoordinatorStats {
    size_t segments_coordinated = 0;
    size_t requests_issued = 0;
    size_t requests_succeeded = 0;
    size_t requests_failed = 0;
    size_t requests_timed_out = 0;
};

/**
 * @brief Fans one speaker's segment out to every agent that needs a translation
 *
 * One request per listener whose language differs from the segment's source
 * language, all issued at once on a bounded request pool. Each is waited on
 * until request_timeout_ms after the batch started; a request that errors or
 * misses the deadline is absent from the result map, and one still queued at
 * the deadline is never sent. Latencies are measured per request, from when
 * its worker picked it up to when the service answered.
 * The agent table lock is only held to take a snapshot.
 */
class SessionCoordinator {
public:
    SessionCoordinator(std::shared_ptr<translation::ITranslationService> service,
                       int request_timeout_ms,
                       size_t request_workers = constants::translation::REQUEST_WORKERS);
    ~SessionCoordinator();

    // Non-copyable
    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    /**
     * @brief Add or update a listening agent
     */
    void add_agent(const std::string& participant_id, Language language,
                   const TranslationPreferences& preferences);

    /**
     * @brief Remove an agent; its in-flight requests finish and are discarded
     * @return false if the agent was not known
     */
    bool remove_agent(const std::string& participant_id);

    bool has_agent(const std::string& participant_id) const;
    size_t agent_count() const;
    std::vector<ListenerInfo> agents() const;

    /**
     * @brief Translate segment for every other agent with a different language
     * @return Successful translations keyed by listener id
     */
    std::map<std::string, TranslationResult> coordinate(const std::string& speaker_id,
                                                        const Segment& segment);

    /**
     * @brief Dispatch handler for the translation buffer
     *
     * Same as coordinate(segment.speaker_id, segment), plus how many
     * listeners were asked.
     */
    FanOutResult fan_out(const Segment& segment);

    CoordinatorStats get_stats() const;

private:
    FanOutResult run(const std::string& speaker_id, const Segment& segment);

    std::shared_ptr<translation::ITranslationService> service_;
    int request_timeout_ms_;
    std::unique_ptr<TaskPool> request_pool_;

    mutable std::mutex mutex_;
    std::map<std::string, ListenerInfo> agents_;
    CoordinatorStats stats_;
};

} // namespace polyglot
