#include "session_coordinator.h"
#include "task_pool.h"
#include "logger.h"
#include <future>
#include <sstream>

namespace polyglot {

namespace {

/// What a request worker hands back: the translation and when it ran
struct RequestOutcome {
    Result<std::string> translated;
    TimePoint started_at;
    TimePoint finished_at;
};

struct PendingRequest {
    ListenerInfo listener;
    std::future<RequestOutcome> future;
};

} // anonymous namespace

SessionCoordinator::SessionCoordinator(std::shared_ptr<translation::ITranslationService> service,
                                       int request_timeout_ms, size_t request_workers)
    : service_(std::move(service))
    , request_timeout_ms_(request_timeout_ms)
    , request_pool_(std::make_unique<TaskPool>("translate", request_workers)) {}

SessionCoordinator::~SessionCoordinator() = default;

void SessionCoordinator::add_agent(const std::string& participant_id, Language language,
                                   const TranslationPreferences& preferences) {
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerInfo info;
    info.participant_id = participant_id;
    info.language = language;
    info.preferences = preferences;
    agents_[participant_id] = info;
    LOG_COORD("Agent " + participant_id + " (" + language_code(language) + ") added, " +
              std::to_string(agents_.size()) + " in session");
}

bool SessionCoordinator::remove_agent(const std::string& participant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (agents_.erase(participant_id) == 0) {
        return false;
    }
    LOG_COORD("Agent " + participant_id + " removed, " + std::to_string(agents_.size()) + " in session");
    return true;
}

bool SessionCoordinator::has_agent(const std::string& participant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.count(participant_id) > 0;
}

size_t SessionCoordinator::agent_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.size();
}

std::vector<ListenerInfo> SessionCoordinator::agents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ListenerInfo> result;
    for (const auto& entry : agents_) {
        result.push_back(entry.second);
    }
    return result;
}

std::map<std::string, TranslationResult> SessionCoordinator::coordinate(const std::string& speaker_id,
                                                                        const Segment& segment) {
    return run(speaker_id, segment).results;
}

FanOutResult SessionCoordinator::fan_out(const Segment& segment) {
    return run(segment.speaker_id, segment);
}

CoordinatorStats SessionCoordinator::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

FanOutResult SessionCoordinator::run(const std::string& speaker_id, const Segment& segment) {
    FanOutResult fan_out;

    std::vector<ListenerInfo> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : agents_) {
            const ListenerInfo& listener = entry.second;
            if (listener.participant_id != speaker_id && listener.language != segment.source_language) {
                targets.push_back(listener);
            }
        }
        stats_.segments_coordinated++;
        stats_.requests_issued += targets.size();
    }

    fan_out.requested = targets.size();
    if (targets.empty()) {
        LOG_COORD("No listener needs a translation of " + segment.segment_id);
        return fan_out;
    }
    if (!service_) {
        LOG_ERROR("No translation service configured, dropping " + segment.segment_id);
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.requests_failed += targets.size();
        return fan_out;
    }

    TimePoint batch_start = Clock::now();
    TimePoint deadline = batch_start + Duration(request_timeout_ms_);

    // Workers own copies of everything they read; a request still running
    // after the deadline only delays the pool's shutdown
    std::vector<PendingRequest> pending;
    for (const auto& listener : targets) {
        auto promise = std::make_shared<std::promise<RequestOutcome>>();
        PendingRequest request;
        request.listener = listener;
        request.future = promise->get_future();

        std::shared_ptr<translation::ITranslationService> service = service_;
        std::string text = segment.text;
        Language source = segment.source_language;
        bool queued = request_pool_->submit([service, promise, text, source, listener, deadline]() {
            TimePoint started_at = Clock::now();
            if (started_at >= deadline) {
                promise->set_value(RequestOutcome{make_timeout_error("Request expired in queue"),
                                                  started_at, started_at});
                return;
            }
            Result<std::string> translated = make_provider_error("No translation");
            try {
                translated = service->translate(text, source, listener.language, listener.preferences);
            } catch (const std::exception& e) {
                translated = make_provider_error(std::string("translate threw: ") + e.what());
            }
            promise->set_value(RequestOutcome{std::move(translated), started_at, Clock::now()});
        });
        if (!queued) {
            TimePoint now = Clock::now();
            promise->set_value(RequestOutcome{make_error(ErrorType::InvalidState, "Request pool stopped"),
                                              now, now});
        }

        pending.push_back(std::move(request));
    }

    size_t succeeded = 0;
    size_t failed = 0;
    size_t timed_out = 0;

    for (auto& request : pending) {
        const std::string& listener_id = request.listener.participant_id;

        if (request.future.wait_until(deadline) != std::future_status::ready) {
            timed_out++;
            LOG_WARN("Translation for " + listener_id + " of " + segment.segment_id +
                     " missed the " + std::to_string(request_timeout_ms_) + "ms deadline");
            continue;
        }

        RequestOutcome outcome = request.future.get();
        int64_t latency_ms = ms_between(outcome.started_at, outcome.finished_at);
        {
            std::ostringstream toss;
            toss << "listener=" << listener_id << " target=" << language_code(request.listener.language)
                 << " ok=" << outcome.translated.is_ok() << " latency_ms=" << latency_ms;
            LOG_TRACE(segment.segment_id, "translate", toss.str());
        }
        if (outcome.translated.is_error()) {
            failed++;
            LOG_WARN("Translation for " + listener_id + " of " + segment.segment_id + " failed: " +
                     outcome.translated.error().describe());
            continue;
        }

        TranslationResult result;
        result.segment_id = segment.segment_id;
        result.speaker_id = speaker_id;
        result.listener_id = listener_id;
        result.original_text = segment.text;
        result.translated_text = outcome.translated.value();
        result.source_language = segment.source_language;
        result.target_language = request.listener.language;
        result.translation_latency_ms = latency_ms;
        result.total_latency_ms = ms_between(segment.created_at, outcome.finished_at);
        fan_out.results.emplace(listener_id, std::move(result));
        succeeded++;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.requests_succeeded += succeeded;
        stats_.requests_failed += failed;
        stats_.requests_timed_out += timed_out;
    }

    std::ostringstream oss;
    oss << "Segment " << segment.segment_id << ": " << succeeded << "/" << targets.size()
        << " translations in " << ms_since(batch_start) << "ms";
    LOG_COORD(oss.str());

    return fan_out;
}

} // namespace polyglot
