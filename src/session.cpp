#include "session.h"
#include "logger.h"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace polyglot {

// =============================================================================
// Session
// =============================================================================

Session::Session(const std::string& session_id,
                 const Config& config,
                 std::shared_ptr<translation::ITranslationService> translator,
                 std::shared_ptr<transport::IAudioTransport> transport)
    : session_id_(session_id)
    , config_(config)
    , transport_(transport)
    , routing_(transport)
    , coordinator_(std::move(translator), config.translation.timeout_ms) {
    buffer_ = std::make_unique<TranslationBuffer>(
        config_.buffer,
        [this](const Segment& segment) { return coordinator_.fan_out(segment); });
    buffer_->start();
    LOG_INFO("Session " + session_id_ + " created");
}

Session::~Session() {
    buffer_->stop();
    LOG_INFO("Session " + session_id_ + " closed");
}

void Session::attach_agent(const std::string& participant_id, Language language,
                           const TranslationPreferences& preferences,
                           TranslationCallback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        agents_.insert(participant_id);
        languages_[participant_id] = language;
    }
    routing_.register_participant(participant_id, language);
    buffer_->register_listener(participant_id, std::move(callback));
    coordinator_.add_agent(participant_id, language, preferences);
}

void Session::detach_agent(const std::string& participant_id) {
    // Routing and coordinator first, so no new work is addressed to the agent;
    // in-flight results then find no listener and are discarded
    routing_.unregister_participant(participant_id);
    coordinator_.remove_agent(participant_id);
    buffer_->unregister_listener(participant_id);

    std::lock_guard<std::mutex> lock(mutex_);
    agents_.erase(participant_id);
    languages_.erase(participant_id);
}

size_t Session::agent_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.size();
}

void Session::set_participant_language(const std::string& participant_id, Language language) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        languages_[participant_id] = language;
    }
    routing_.register_participant(participant_id, language);
}

void Session::remove_participant(const std::string& participant_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        languages_.erase(participant_id);
    }
    routing_.unregister_participant(participant_id);
}

std::optional<Language> Session::participant_language(const std::string& participant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = languages_.find(participant_id);
    if (it == languages_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Session::acquire_adapter(const std::string& speaker_id, Language language,
                              const std::string& holder_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    AdapterEntry& entry = adapters_[speaker_id];
    if (!entry.adapter) {
        entry.adapter = std::make_shared<StreamingTranscriptAdapter>(
            speaker_id, language, config_.transcript,
            [this](const SegmentUpdate& update) { return buffer_->submit(update); });
        LOG_INFO("Recognition for " + speaker_id + " started by " + holder_id);
    }
    if (std::find(entry.holders.begin(), entry.holders.end(), holder_id) == entry.holders.end()) {
        entry.holders.push_back(holder_id);
    }
}

void Session::release_adapter(const std::string& speaker_id, const std::string& holder_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = adapters_.find(speaker_id);
    if (it == adapters_.end()) {
        return;
    }
    auto& holders = it->second.holders;
    holders.erase(std::remove(holders.begin(), holders.end(), holder_id), holders.end());
    if (holders.empty()) {
        adapters_.erase(it);
        LOG_INFO("Recognition for " + speaker_id + " stopped");
    }
}

bool Session::has_adapter(const std::string& speaker_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adapters_.count(speaker_id) > 0;
}

std::shared_ptr<StreamingTranscriptAdapter> Session::adapter_for(const std::string& speaker_id,
                                                                 const std::string& holder_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = adapters_.find(speaker_id);
    if (it == adapters_.end() || it->second.holders.empty() ||
        it->second.holders.front() != holder_id) {
        return nullptr;
    }
    return it->second.adapter;
}

bool Session::speaking_started(const std::string& participant_id) {
    return routing_.set_current_speaker(participant_id);
}

void Session::speaking_stopped(const std::string& participant_id) {
    std::optional<std::string> current = routing_.current_speaker();
    if (current && *current == participant_id) {
        routing_.clear_current_speaker();
    }
}

std::optional<std::string> Session::current_speaker() const {
    return routing_.current_speaker();
}

void Session::mark_synthesized_stream(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    synthesized_streams_.insert(stream_id);
}

bool Session::is_synthesized_stream(const std::string& stream_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return synthesized_streams_.count(stream_id) > 0;
}

json Session::describe() const {
    json info;
    info["session_id"] = session_id_;
    info["routing"] = routing_.routing_info();

    BufferStats buffer = buffer_->get_stats();
    info["buffer"] = {
        {"segments_submitted", buffer.segments_submitted},
        {"segments_dispatched", buffer.segments_dispatched},
        {"segments_forced", buffer.segments_forced},
        {"translations_completed", buffer.translations_completed},
        {"translations_failed", buffer.translations_failed},
        {"avg_latency_ms", buffer.avg_latency_ms},
        {"max_latency_ms", buffer.max_latency_ms},
        {"pending_segments", buffer.pending_segments},
        {"target_delay_ms", buffer.target_delay_ms}
    };

    CoordinatorStats coord = coordinator_.get_stats();
    info["coordinator"] = {
        {"segments_coordinated", coord.segments_coordinated},
        {"requests_issued", coord.requests_issued},
        {"requests_succeeded", coord.requests_succeeded},
        {"requests_failed", coord.requests_failed},
        {"requests_timed_out", coord.requests_timed_out}
    };

    std::lock_guard<std::mutex> lock(mutex_);
    json adapters = json::object();
    for (const auto& entry : adapters_) {
        adapters[entry.first] = {
            {"owner", entry.second.holders.empty() ? std::string() : entry.second.holders.front()},
            {"holders", entry.second.holders.size()}
        };
    }
    info["adapters"] = adapters;
    info["agents"] = agents_;
    return info;
}

// =============================================================================
// SessionRegistry
// =============================================================================

SessionRegistry::SessionRegistry(const Config& config,
                                 std::shared_ptr<translation::ITranslationService> translator,
                                 std::shared_ptr<transport::IAudioTransport> transport)
    : config_(config), translator_(std::move(translator)), transport_(std::move(transport)) {}

std::shared_ptr<Session> SessionRegistry::join(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = sessions_[session_id];
    if (!entry.session) {
        entry.session = std::make_shared<Session>(session_id, config_, translator_, transport_);
    }
    entry.members++;
    return entry.session;
}

bool SessionRegistry::leave(const std::string& session_id) {
    std::shared_ptr<Session> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        if (--it->second.members == 0) {
            released = std::move(it->second.session);
            sessions_.erase(it);
        }
    }
    // Session teardown joins the buffer loop; keep it outside the registry lock
    released.reset();
    return true;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second.session;
}

size_t SessionRegistry::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace polyglot
