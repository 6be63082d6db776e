#include "transcript_adapter.h"
#include "logger.h"
#include "utils.h"
#include <mutex>
#include <sstream>

namespace polyglot {

const char* recognizer_event_kind_name(RecognizerEventKind kind) {
    switch (kind) {
        case RecognizerEventKind::Interim: return "interim";
        case RecognizerEventKind::Final: return "final";
        case RecognizerEventKind::SpeechStarted: return "speech_started";
        case RecognizerEventKind::UtteranceEnd: return "utterance_end";
        case RecognizerEventKind::Error: return "error";
        case RecognizerEventKind::Disconnected: return "disconnected";
        default: return "unknown";
    }
}

class StreamingTranscriptAdapter::Impl {
public:
    Impl(const std::string& speaker_id, Language language,
         const config::TranscriptConfig& config, SegmentSink sink)
        : speaker_id_(speaker_id)
        , language_(language)
        , config_(config)
        , sink_(std::move(sink))
        , sequence_(0)
        , last_confidence_(0.0f)
        , has_last_event_(false)
        , forwarded_(0) {
        segment_id_ = next_segment_id();
        LOG_STT("Adapter for " + speaker_id_ + " (" + language_code(language_) + ") ready");
    }

    void handle(const RecognizerEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);

        switch (event.kind) {
            case RecognizerEventKind::Interim:
            case RecognizerEventKind::Final:
                handle_transcript(event);
                break;

            case RecognizerEventKind::SpeechStarted:
                check_gap(event.timestamp);
                mark(event.timestamp);
                break;

            case RecognizerEventKind::UtteranceEnd:
                if (!text_.empty()) {
                    forward(text_, last_confidence_, true);
                }
                roll_over();
                mark(event.timestamp);
                break;

            case RecognizerEventKind::Error:
            case RecognizerEventKind::Disconnected:
                if (!text_.empty()) {
                    LOG_WARN("Recognizer " + std::string(recognizer_event_kind_name(event.kind)) +
                             " for " + speaker_id_ + ", dropping partial segment " + segment_id_);
                }
                roll_over();
                has_last_event_ = false;
                break;
        }
    }

    CurrentSegmentInfo current_segment() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CurrentSegmentInfo info;
        info.segment_id = segment_id_;
        info.text = text_;
        info.has_content = !text_.empty();
        return info;
    }

    const std::string& speaker_id() const { return speaker_id_; }
    Language language() const { return language_; }

    size_t updates_forwarded() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return forwarded_;
    }

private:
    void handle_transcript(const RecognizerEvent& event) {
        std::string text = utils::collapse_whitespace(event.text);
        bool is_final = event.kind == RecognizerEventKind::Final;

        check_gap(event.timestamp);
        mark(event.timestamp);

        if (text.empty()) {
            // An empty final still closes the utterance
            if (is_final) {
                if (!text_.empty()) {
                    forward(text_, last_confidence_, true);
                }
                roll_over();
            }
            return;
        }

        text_ = text;
        last_confidence_ = event.confidence;

        if (is_final) {
            forward(text_, event.confidence, true);
            roll_over();
            return;
        }

        if (!config_.enable_interim_results) {
            return;
        }
        if (event.confidence < config_.min_interim_confidence) {
            LOG_STT("Holding low-confidence interim for " + segment_id_);
            return;
        }
        forward(text_, event.confidence, false);
    }

    /// A silence gap ends the utterance in progress as if the recognizer had finalized it
    void check_gap(TimePoint timestamp) {
        if (!has_last_event_ || text_.empty()) {
            return;
        }
        if (ms_between(last_event_at_, timestamp) > config_.utterance_gap_ms) {
            LOG_STT("Silence gap for " + speaker_id_ + ", closing " + segment_id_);
            forward(text_, last_confidence_, true);
            roll_over();
        }
    }

    void mark(TimePoint timestamp) {
        last_event_at_ = timestamp;
        has_last_event_ = true;
    }

    /**
     * Forward the recognizer hypothesis for the current segment. The buffer
     * refuses updates once it has dispatched a segment; speech that keeps
     * arriving after that continues under a fresh segment id, minus the
     * words that were already dispatched.
     */
    void forward(const std::string& text, float confidence, bool is_final) {
        std::string body = uncommitted(text);
        if (body.empty()) {
            return;
        }
        bool accepted = submit(body, confidence, is_final);

        if (!accepted && !accepted_text_.empty()) {
            LOG_STT("Segment " + segment_id_ + " already dispatched, continuing " + speaker_id_ +
                    " on a new segment");
            committed_text_ = accepted_text_;
            accepted_text_.clear();
            segment_id_ = next_segment_id();
            body = uncommitted(text);
            if (body.empty()) {
                return;
            }
            accepted = submit(body, confidence, is_final);
        }
        if (accepted) {
            accepted_text_ = text;
        }
    }

    bool submit(const std::string& body, float confidence, bool is_final) {
        SegmentUpdate update;
        update.segment_id = segment_id_;
        update.speaker_id = speaker_id_;
        update.text = body;
        update.source_language = language_;
        update.is_final = is_final;
        update.confidence = confidence;

        bool accepted = false;
        try {
            accepted = sink_ && sink_(update);
        } catch (const std::exception& e) {
            LOG_ERROR("Segment sink failed for " + segment_id_ + ": " + e.what());
        }
        if (accepted) {
            forwarded_++;
        }

        std::ostringstream oss;
        oss << (is_final ? "final" : "interim") << " " << segment_id_
            << " conf=" << confidence << " accepted=" << accepted
            << " \"" << utils::snippet(body) << "\"";
        LOG_STT(oss.str());
        return accepted;
    }

    /// Hypothesis text past the words already handed to a dispatched segment
    std::string uncommitted(const std::string& text) const {
        if (committed_text_.empty() || text.compare(0, committed_text_.size(), committed_text_) != 0) {
            return text;
        }
        if (text.size() > committed_text_.size() && text[committed_text_.size()] != ' ') {
            return text;
        }
        return utils::trim_copy(text.substr(committed_text_.size()));
    }

    void roll_over() {
        text_.clear();
        committed_text_.clear();
        accepted_text_.clear();
        last_confidence_ = 0.0f;
        segment_id_ = next_segment_id();
    }

    std::string next_segment_id() {
        return speaker_id_ + "-" + std::to_string(now_ms()) + "-" + std::to_string(++sequence_);
    }

    const std::string speaker_id_;
    const Language language_;
    config::TranscriptConfig config_;
    SegmentSink sink_;

    mutable std::mutex mutex_;
    uint64_t sequence_;
    std::string segment_id_;
    std::string text_;
    std::string committed_text_;    ///< Dispatched under an earlier id this utterance
    std::string accepted_text_;     ///< Last hypothesis the buffer took for segment_id_
    float last_confidence_;
    TimePoint last_event_at_;
    bool has_last_event_;
    size_t forwarded_;
};

StreamingTranscriptAdapter::StreamingTranscriptAdapter(const std::string& speaker_id,
                                                       Language language,
                                                       const config::TranscriptConfig& config,
                                                       SegmentSink sink)
    : pimpl_(std::make_unique<Impl>(speaker_id, language, config, std::move(sink))) {}

StreamingTranscriptAdapter::~StreamingTranscriptAdapter() = default;

void StreamingTranscriptAdapter::handle(const RecognizerEvent& event) {
    pimpl_->handle(event);
}

void StreamingTranscriptAdapter::on_interim(const std::string& text, float confidence) {
    RecognizerEvent event;
    event.kind = RecognizerEventKind::Interim;
    event.text = text;
    event.confidence = confidence;
    pimpl_->handle(event);
}

void StreamingTranscriptAdapter::on_final(const std::string& text, float confidence) {
    RecognizerEvent event;
    event.kind = RecognizerEventKind::Final;
    event.text = text;
    event.confidence = confidence;
    pimpl_->handle(event);
}

CurrentSegmentInfo StreamingTranscriptAdapter::current_segment() const {
    return pimpl_->current_segment();
}

const std::string& StreamingTranscriptAdapter::speaker_id() const {
    return pimpl_->speaker_id();
}

Language StreamingTranscriptAdapter::language() const {
    return pimpl_->language();
}

size_t StreamingTranscriptAdapter::updates_forwarded() const {
    return pimpl_->updates_forwarded();
}

} // namespace polyglot
