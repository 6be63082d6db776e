#pragma once

/**
 * @file types.h
 * @brief Core type definitions for the Polyglot interpretation core
 *
 * Segments, translation results and the callback shapes that connect the
 * buffer, the coordinator and the per-user agents.
 */

#include "language.h"
#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <functional>
#include <optional>

namespace polyglot {

// =============================================================================
// Audio Types
// =============================================================================

/// Raw audio sample (16-bit signed PCM)
using Sample = int16_t;

/// Variable-length audio buffer (synthesized speech)
using AudioBuffer = std::vector<Sample>;

// =============================================================================
// Timing Types
// =============================================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

/// Milliseconds elapsed since a time point
inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

/// Milliseconds between two time points
inline int64_t ms_between(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<Duration>(to - from).count();
}

/// Current monotonic timestamp in milliseconds (for ids and logging)
inline int64_t now_ms() {
    return std::chrono::duration_cast<Duration>(
        Clock::now().time_since_epoch()).count();
}

// =============================================================================
// Segment Types
// =============================================================================

/// Lifecycle of a segment; each arrow is taken at most once
/// Pending -> Translating -> Completed | Failed
enum class SegmentState {
    Pending,
    Translating,
    Completed,
    Failed
};

const char* segment_state_name(SegmentState state);

/**
 * @brief Proposed change to a segment, as produced by a transcript adapter
 *
 * The buffer creates the segment on the first update for an id and merges
 * text/confidence/finality on later ones while the segment is Pending.
 */
struct SegmentUpdate {
    std::string segment_id;
    std::string speaker_id;
    std::string text;
    Language source_language = Language::Unknown;
    bool is_final = false;
    float confidence = 0.0f;
};

/**
 * @brief One recognized, possibly still evolving span of a speaker's utterance
 */
struct Segment {
    std::string segment_id;
    std::string speaker_id;
    std::string text;
    Language source_language = Language::Unknown;
    TimePoint created_at;
    bool is_final = false;
    float confidence = 0.0f;
    SegmentState state = SegmentState::Pending;
    std::optional<TimePoint> translation_started_at;
    std::optional<TimePoint> translation_completed_at;

    int64_t age_ms() const { return ms_since(created_at); }
};

// =============================================================================
// Translation Types
// =============================================================================

/// Per-listener style preferences passed to the translation service
struct TranslationPreferences {
    bool formal_tone = false;
    bool preserve_emotion = true;
    std::string voice;   ///< Preferred synthesis voice (empty = language default)
};

/**
 * @brief Output of translating one segment for one listener
 *
 * Created once per (segment, listener); immutable after creation.
 */
struct TranslationResult {
    std::string segment_id;
    std::string speaker_id;
    std::string listener_id;
    std::string original_text;
    std::string translated_text;
    Language source_language = Language::Unknown;
    Language target_language = Language::Unknown;
    int64_t translation_latency_ms = 0;   ///< translation start -> result
    int64_t total_latency_ms = 0;         ///< segment creation -> result
};

// =============================================================================
// Callback Types
// =============================================================================

/// Receives finished translations addressed to one listener
using TranslationCallback = std::function<void(const TranslationResult&)>;

/// Receives normalized segment updates (implemented by the buffer)
using SegmentSink = std::function<bool(const SegmentUpdate&)>;

} // namespace polyglot
