#include "audio_routing.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace polyglot {

const char* stream_type_name(StreamType type) {
    switch (type) {
        case StreamType::Original: return "original";
        case StreamType::Translated: return "translated";
        default: return "unknown";
    }
}

std::string make_route_id(const std::string& source_id, const std::string& target_id,
                          StreamType type) {
    return source_id + "->" + target_id + ":" + stream_type_name(type);
}

AudioRoutingPolicy::AudioRoutingPolicy() = default;

AudioRoutingPolicy::AudioRoutingPolicy(std::shared_ptr<AudioControlSink> sink)
    : sink_(std::move(sink)) {}

void AudioRoutingPolicy::register_participant(const std::string& participant_id, Language language) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = languages_.find(participant_id);
    if (it != languages_.end() && it->second == language) {
        return;
    }
    languages_[participant_id] = language;
    LOG_ROUTING("Registered " + participant_id + " (" + language_code(language) + ")");
    recompute_locked();
}

bool AudioRoutingPolicy::unregister_participant(const std::string& participant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (languages_.erase(participant_id) == 0) {
        return false;
    }
    if (current_speaker_ && *current_speaker_ == participant_id) {
        current_speaker_.reset();
    }
    LOG_ROUTING("Unregistered " + participant_id);
    recompute_locked();
    return true;
}

bool AudioRoutingPolicy::is_registered(const std::string& participant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return languages_.count(participant_id) > 0;
}

std::vector<std::string> AudioRoutingPolicy::participants() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : languages_) {
        ids.push_back(entry.first);
    }
    return ids;
}

bool AudioRoutingPolicy::set_current_speaker(const std::optional<std::string>& participant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (participant_id && languages_.count(*participant_id) == 0) {
        LOG_WARN("Ignoring current speaker " + *participant_id + ": not registered");
        return false;
    }
    if (current_speaker_ == participant_id) {
        return true;
    }
    current_speaker_ = participant_id;
    LOG_ROUTING("Current speaker: " + (current_speaker_ ? *current_speaker_ : std::string("none")));
    apply_locked();
    return true;
}

void AudioRoutingPolicy::clear_current_speaker() {
    set_current_speaker(std::nullopt);
}

std::optional<std::string> AudioRoutingPolicy::current_speaker() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_speaker_;
}

std::optional<ParticipantAudioConfig> AudioRoutingPolicy::get_config(const std::string& participant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(participant_id);
    if (it == configs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AudioRoute> AudioRoutingPolicy::routes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AudioRoute> result;
    for (const auto& entry : routes_) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<AudioRoute> AudioRoutingPolicy::active_routes_for(const std::string& participant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AudioRoute> result;
    for (const auto& entry : routes_) {
        const AudioRoute& route = entry.second;
        if (route.target_id == participant_id && route.active) {
            result.push_back(route);
        }
    }
    return result;
}

bool AudioRoutingPolicy::enable_route(const std::string& route_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routes_.find(route_id);
    if (it == routes_.end()) {
        return false;
    }
    paused_routes_.erase(route_id);
    it->second.active = true;
    LOG_ROUTING("Route resumed: " + route_id);
    apply_locked();
    return true;
}

bool AudioRoutingPolicy::disable_route(const std::string& route_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routes_.find(route_id);
    if (it == routes_.end()) {
        return false;
    }
    paused_routes_.insert(route_id);
    it->second.active = false;
    LOG_ROUTING("Route paused: " + route_id);
    apply_locked();
    return true;
}

bool AudioRoutingPolicy::is_translation_route_active(const std::string& source_id,
                                                     const std::string& target_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routes_.find(make_route_id(source_id, target_id, StreamType::Translated));
    return it != routes_.end() && it->second.active;
}

bool AudioRoutingPolicy::is_original_audible(const std::string& listener_id,
                                             const std::string& source_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return original_audible_locked(listener_id, source_id);
}

json AudioRoutingPolicy::routing_info() const {
    std::lock_guard<std::mutex> lock(mutex_);

    json info;
    info["current_speaker"] = current_speaker_ ? json(*current_speaker_) : json(nullptr);

    json participants = json::object();
    for (const auto& entry : languages_) {
        participants[entry.first] = language_code(entry.second);
    }
    info["participants"] = participants;

    json configs = json::object();
    for (const auto& entry : configs_) {
        const ParticipantAudioConfig& config = entry.second;
        configs[entry.first] = {
            {"native_language", language_code(config.native_language)},
            {"hear_original", config.hear_original},
            {"hear_translated", config.hear_translated},
            {"mute", config.mute}
        };
    }
    info["configs"] = configs;

    json routes = json::array();
    for (const auto& entry : routes_) {
        const AudioRoute& route = entry.second;
        routes.push_back({
            {"route_id", route.route_id},
            {"source", route.source_id},
            {"target", route.target_id},
            {"source_language", language_code(route.source_language)},
            {"target_language", language_code(route.target_language)},
            {"stream_type", stream_type_name(route.stream_type)},
            {"active", route.active}
        });
    }
    info["routes"] = routes;
    return info;
}

void AudioRoutingPolicy::recompute_locked() {
    std::map<std::string, ParticipantAudioConfig> configs;
    std::map<std::string, AudioRoute> routes;

    for (const auto& listener : languages_) {
        ParticipantAudioConfig config;
        config.participant_id = listener.first;
        config.native_language = listener.second;

        for (const auto& source : languages_) {
            if (source.first == listener.first) {
                continue;
            }

            AudioRoute route;
            route.source_id = source.first;
            route.target_id = listener.first;
            route.source_language = source.second;
            route.target_language = listener.second;

            if (source.second == listener.second) {
                config.hear_original.insert(source.first);
                route.stream_type = StreamType::Original;
            } else {
                config.hear_translated.insert(source.first);
                config.mute.insert(source.first);
                route.stream_type = StreamType::Translated;
            }

            route.route_id = make_route_id(route.source_id, route.target_id, route.stream_type);
            route.active = paused_routes_.count(route.route_id) == 0;
            routes.emplace(route.route_id, route);
        }

        configs.emplace(listener.first, std::move(config));
    }

    // Pause marks for routes that no longer exist are stale
    for (auto it = paused_routes_.begin(); it != paused_routes_.end();) {
        if (routes.count(*it) == 0) {
            it = paused_routes_.erase(it);
        } else {
            ++it;
        }
    }

    configs_ = std::move(configs);
    routes_ = std::move(routes);

    LOG_ROUTING("Recomputed routing for " + std::to_string(configs_.size()) +
                " participants, " + std::to_string(routes_.size()) + " routes");
    apply_locked();
}

void AudioRoutingPolicy::apply_locked() {
    std::set<std::pair<std::string, std::string>> pairs;
    for (const auto& entry : routes_) {
        pairs.emplace(entry.second.target_id, entry.second.source_id);
    }

    if (!sink_) {
        applied_pairs_ = std::move(pairs);
        return;
    }

    // Pairs that disappeared with a departed participant go silent first
    for (const auto& pair : applied_pairs_) {
        if (pairs.count(pair) == 0) {
            sink_->set_original_audible(pair.first, pair.second, false);
        }
    }
    for (const auto& pair : pairs) {
        sink_->set_original_audible(pair.first, pair.second,
                                    original_audible_locked(pair.first, pair.second));
    }
    applied_pairs_ = std::move(pairs);
}

bool AudioRoutingPolicy::original_audible_locked(const std::string& listener_id,
                                                 const std::string& source_id) const {
    if (!current_speaker_ || *current_speaker_ != source_id) {
        return false;
    }
    auto config = configs_.find(listener_id);
    if (config == configs_.end() || config->second.hear_original.count(source_id) == 0) {
        return false;
    }
    auto route = routes_.find(make_route_id(source_id, listener_id, StreamType::Original));
    return route != routes_.end() && route->second.active;
}

} // namespace polyglot
