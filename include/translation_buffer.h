#pragma once

#include "core/types.h"
#include "core/config.h"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace polyglot {

/**
 * @brief What one dispatch produced
 *
 * `requested` counts the listeners a translation was attempted for; a
 * listener whose translation failed is absent from `results`.
 */
struct FanOutResult {
    std::map<std::string, TranslationResult> results;
    size_t requested = 0;
};

/// Turns a ready segment into per-listener translations (the session coordinator)
using DispatchHandler = std::function<FanOutResult(const Segment&)>;

/**
 * @brief Buffer performance counters
 */
struct BufferStats {
    size_t segments_submitted = 0;
    size_t segments_dispatched = 0;
    size_t segments_forced = 0;        ///< Dispatched by the max-delay sweep
    size_t translations_completed = 0;
    size_t translations_failed = 0;
    double avg_latency_ms = 0.0;
    int64_t max_latency_ms = 0;
    size_t pending_segments = 0;
    int target_delay_ms = 0;
};

/**
 * @brief Session-wide queue of in-flight transcript segments
 *
 * Owns the segment lifecycle. A segment becomes ready when it is final or its
 * confidence is above the threshold; a segment that never becomes ready is
 * force-dispatched once it is max_delay_ms old. Dispatch flips the segment to
 * Translating exactly once, hands it to the dispatch handler on a worker
 * pool, and delivers each resulting translation to the registered listener
 * it is addressed to. Listener failures are isolated from one another.
 *
 * Finished segments are dropped cleanup_grace_ms after completion.
 */
class TranslationBuffer {
public:
    TranslationBuffer(const config::BufferConfig& config, DispatchHandler handler);
    ~TranslationBuffer();

    // Non-copyable
    TranslationBuffer(const TranslationBuffer&) = delete;
    TranslationBuffer& operator=(const TranslationBuffer&) = delete;

    /**
     * @brief Start the background drain/timeout loop
     */
    void start();

    /**
     * @brief Stop the loop and wait for in-flight dispatches
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Create or merge a segment by id
     * @return false if the update was rejected (empty text, missing ids,
     *         or the segment already left Pending). A segment id stays
     *         closed after its segment is cleaned up.
     */
    bool submit(const SegmentUpdate& update);

    /**
     * @brief Register the callback receiving translations addressed to listener_id
     *
     * Re-registering an id replaces its callback.
     */
    void register_listener(const std::string& listener_id, TranslationCallback callback);

    /**
     * @brief Remove a listener; blocks while a delivery to it is in progress
     *
     * Must not be called from inside that listener's callback.
     */
    void unregister_listener(const std::string& listener_id);

    bool has_listener(const std::string& listener_id) const;

    /**
     * @brief Snapshot of a segment still held by the buffer
     */
    std::optional<Segment> get_segment(const std::string& segment_id) const;

    BufferStats get_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace polyglot
