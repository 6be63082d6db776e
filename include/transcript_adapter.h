#pragma once

#include "core/types.h"
#include "core/config.h"
#include <memory>
#include <string>

namespace polyglot {

/**
 * @brief Kinds of events a streaming speech recognizer emits
 */
enum class RecognizerEventKind {
    Interim,        ///< Partial hypothesis, may still change
    Final,          ///< Recognizer committed the hypothesis
    SpeechStarted,
    UtteranceEnd,   ///< Recognizer detected the end of an utterance
    Error,          ///< Malformed event or recognizer-side error
    Disconnected
};

const char* recognizer_event_kind_name(RecognizerEventKind kind);

/**
 * @brief Strongly typed recognizer event
 */
struct RecognizerEvent {
    RecognizerEventKind kind = RecognizerEventKind::Interim;
    std::string text;
    float confidence = 0.0f;
    TimePoint timestamp = Clock::now();
};

/**
 * @brief Snapshot of the utterance an adapter is currently building
 */
struct CurrentSegmentInfo {
    std::string segment_id;
    std::string text;
    bool has_content = false;
};

/**
 * @brief Normalizes one speaker's recognizer stream into segment updates
 *
 * The speaker id and language are fixed at construction, so every update the
 * adapter forwards carries a populated speaker identity. A new segment id is
 * started after each final, after an utterance end, when the gap between two
 * events exceeds utterance_gap_ms, and after a recognizer error or disconnect
 * (the partial segment is dropped in that case). A silence gap forwards the
 * pending text as final before closing the segment.
 *
 * If the sink refuses an update for a segment it already accepted text for,
 * the segment was dispatched early; the rest of the utterance continues under
 * a new segment id without the words already dispatched.
 */
class StreamingTranscriptAdapter {
public:
    StreamingTranscriptAdapter(const std::string& speaker_id,
                               Language language,
                               const config::TranscriptConfig& config,
                               SegmentSink sink);
    ~StreamingTranscriptAdapter();

    // Non-copyable
    StreamingTranscriptAdapter(const StreamingTranscriptAdapter&) = delete;
    StreamingTranscriptAdapter& operator=(const StreamingTranscriptAdapter&) = delete;

    /**
     * @brief Feed one recognizer event
     */
    void handle(const RecognizerEvent& event);

    void on_interim(const std::string& text, float confidence);
    void on_final(const std::string& text, float confidence);

    CurrentSegmentInfo current_segment() const;

    const std::string& speaker_id() const;
    Language language() const;

    /// Number of updates accepted by the sink
    size_t updates_forwarded() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace polyglot
