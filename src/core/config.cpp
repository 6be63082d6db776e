/**
 * @file config.cpp
 * @brief Configuration loading and validation
 */

#include "core/config.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace polyglot {
namespace config {

// =============================================================================
// JSON Serialization Helpers
// =============================================================================

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

BufferConfig parse_buffer_config(const json& j) {
    BufferConfig config;
    if (!j.contains("buffer")) return config;

    const auto& buffer = j["buffer"];
    config.max_delay_ms = get_or_default(buffer, "max_delay_ms", config.max_delay_ms);
    config.confidence_threshold = get_or_default(buffer, "confidence_threshold", config.confidence_threshold);
    config.poll_interval_ms = get_or_default(buffer, "poll_interval_ms", config.poll_interval_ms);
    config.cleanup_grace_ms = get_or_default(buffer, "cleanup_grace_ms", config.cleanup_grace_ms);
    config.dispatch_workers = get_or_default(buffer, "dispatch_workers", config.dispatch_workers);
    return config;
}

TranscriptConfig parse_transcript_config(const json& j) {
    TranscriptConfig config;
    if (!j.contains("transcript")) return config;

    const auto& transcript = j["transcript"];
    config.enable_interim_results = get_or_default(transcript, "enable_interim_results", config.enable_interim_results);
    config.utterance_gap_ms = get_or_default(transcript, "utterance_gap_ms", config.utterance_gap_ms);
    config.min_interim_confidence = get_or_default(transcript, "min_interim_confidence", config.min_interim_confidence);
    return config;
}

TranslationConfig parse_translation_config(const json& j) {
    TranslationConfig config;
    if (!j.contains("translation")) return config;

    const auto& translation = j["translation"];
    config.endpoint = get_or_default(translation, "endpoint", config.endpoint);
    config.model_name = get_or_default(translation, "model_name", config.model_name);
    config.timeout_ms = get_or_default(translation, "timeout_ms", config.timeout_ms);
    config.connect_timeout_ms = get_or_default(translation, "connect_timeout_ms", config.connect_timeout_ms);
    config.temperature = get_or_default(translation, "temperature", config.temperature);
    config.api_key_env = get_or_default(translation, "api_key_env", config.api_key_env);
    return config;
}

json buffer_config_to_json(const BufferConfig& config) {
    return {
        {"max_delay_ms", config.max_delay_ms},
        {"confidence_threshold", config.confidence_threshold},
        {"poll_interval_ms", config.poll_interval_ms},
        {"cleanup_grace_ms", config.cleanup_grace_ms},
        {"dispatch_workers", config.dispatch_workers}
    };
}

json transcript_config_to_json(const TranscriptConfig& config) {
    return {
        {"enable_interim_results", config.enable_interim_results},
        {"utterance_gap_ms", config.utterance_gap_ms},
        {"min_interim_confidence", config.min_interim_confidence}
    };
}

json translation_config_to_json(const TranslationConfig& config) {
    return {
        {"endpoint", config.endpoint},
        {"model_name", config.model_name},
        {"timeout_ms", config.timeout_ms},
        {"connect_timeout_ms", config.connect_timeout_ms},
        {"temperature", config.temperature},
        {"api_key_env", config.api_key_env}
    };
}

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

/// Parse a whole environment value; partial or malformed numbers leave target untouched
template<typename T, typename Parse>
void override_number(const char* name, T& target, Parse parse) {
    const char* value = env_or_null(name);
    if (!value) {
        return;
    }
    std::string text(value);
    try {
        size_t consumed = 0;
        T parsed = parse(text, &consumed);
        if (consumed != text.size()) {
            Logger::warn(std::string("Ignoring malformed ") + name + "=" + text);
            return;
        }
        target = parsed;
    } catch (const std::exception& e) {
        Logger::warn(std::string("Ignoring malformed ") + name + "=" + text + " (" + e.what() + ")");
    }
}

} // anonymous namespace

// =============================================================================
// InterpreterConfig Implementation
// =============================================================================

Result<InterpreterConfig> InterpreterConfig::from_json(const json& j) {
    try {
        if (!j.is_object()) {
            return make_parse_error("Config root must be a JSON object");
        }

        InterpreterConfig config;
        config.buffer = parse_buffer_config(j);
        config.transcript = parse_transcript_config(j);
        config.translation = parse_translation_config(j);
        config.log_level = get_or_default(j, "log_level", config.log_level);
        config.log_file = get_or_default(j, "log_file", config.log_file);
        return config;

    } catch (const json::exception& e) {
        return make_parse_error(std::string("JSON type error: ") + e.what());
    }
}

Result<InterpreterConfig> InterpreterConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_io_error("Failed to open config file: " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::exception& e) {
        return make_parse_error(std::string("JSON parse error: ") + e.what());
    }

    Result<InterpreterConfig> parsed = from_json(j);
    if (parsed.is_error()) {
        return parsed.error();
    }

    InterpreterConfig config = parsed.value();
    config.apply_env_overrides();

    std::string validation_error = config.validate();
    if (!validation_error.empty()) {
        return make_error(ErrorType::InvalidState, "Config validation failed: " + validation_error);
    }

    Logger::info("Configuration loaded from: " + path);
    return config;
}

json InterpreterConfig::to_json() const {
    json j;
    j["buffer"] = buffer_config_to_json(buffer);
    j["transcript"] = transcript_config_to_json(transcript);
    j["translation"] = translation_config_to_json(translation);
    j["log_level"] = log_level;
    j["log_file"] = log_file;
    return j;
}

VoidResult InterpreterConfig::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return make_io_error("Failed to open file for writing: " + path);
    }

    file << to_json().dump(2);
    Logger::info("Configuration saved to: " + path);
    return VoidResult();
}

InterpreterConfig InterpreterConfig::defaults() {
    return InterpreterConfig{};  // All defaults are set in struct definitions
}

void InterpreterConfig::apply_env_overrides() {
    override_number("POLYGLOT_MAX_DELAY_MS", buffer.max_delay_ms,
                    [](const std::string& text, size_t* pos) { return std::stoi(text, pos); });
    override_number("POLYGLOT_CONFIDENCE_THRESHOLD", buffer.confidence_threshold,
                    [](const std::string& text, size_t* pos) { return std::stof(text, pos); });
    if (const char* v = env_or_null("POLYGLOT_TRANSLATION_ENDPOINT")) {
        translation.endpoint = v;
    }
    if (const char* v = env_or_null("POLYGLOT_LOG_LEVEL")) {
        log_level = v;
    }
}

std::string InterpreterConfig::validate() const {
    std::ostringstream errors;

    // Validate buffer
    if (buffer.max_delay_ms <= 0) {
        errors << "buffer.max_delay_ms must be positive; ";
    }
    if (buffer.confidence_threshold <= 0.0f || buffer.confidence_threshold > 1.0f) {
        errors << "buffer.confidence_threshold must be in (0, 1]; ";
    }
    if (buffer.poll_interval_ms <= 0 || buffer.poll_interval_ms > buffer.max_delay_ms) {
        errors << "buffer.poll_interval_ms must be in (0, max_delay_ms]; ";
    }
    if (buffer.dispatch_workers < 1) {
        errors << "buffer.dispatch_workers must be at least 1; ";
    }

    // Validate translation
    if (translation.endpoint.empty()) {
        errors << "translation.endpoint is required; ";
    }
    if (translation.timeout_ms <= 0) {
        errors << "translation.timeout_ms must be positive; ";
    }

    return errors.str();
}

} // namespace config
} // namespace polyglot
