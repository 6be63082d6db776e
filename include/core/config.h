#pragma once

/**
 * @file config.h
 * @brief Unified configuration system
 *
 * Configuration for the interpretation core. It supports:
 * - JSON file loading
 * - Environment variable overrides
 * - Default values
 * - Validation
 */

#include "errors.h"
#include "core/constants.h"
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace polyglot {
namespace config {

// =============================================================================
// Component Configurations
// =============================================================================

/**
 * @brief Translation buffer configuration
 */
struct BufferConfig {
    int max_delay_ms = constants::buffer::MAX_DELAY_MS;
    float confidence_threshold = constants::buffer::HIGH_CONFIDENCE_THRESHOLD;
    int poll_interval_ms = constants::buffer::POLL_INTERVAL_MS;
    int cleanup_grace_ms = constants::buffer::CLEANUP_GRACE_MS;
    size_t dispatch_workers = constants::buffer::DISPATCH_WORKERS;
};

/**
 * @brief Streaming transcript adapter configuration
 */
struct TranscriptConfig {
    bool enable_interim_results = true;
    int utterance_gap_ms = constants::transcript::UTTERANCE_GAP_MS;
    float min_interim_confidence = constants::transcript::MIN_INTERIM_CONFIDENCE;
};

/**
 * @brief Translation service configuration
 */
struct TranslationConfig {
    std::string endpoint = "http://localhost:11434/api/chat";
    std::string model_name = "qwen2.5:7b";
    int timeout_ms = constants::translation::DEFAULT_TIMEOUT_MS;
    int connect_timeout_ms = constants::translation::CONNECT_TIMEOUT_MS;
    float temperature = constants::translation::DEFAULT_TEMPERATURE;
    std::string api_key_env;  // Empty = no Authorization header
};

// =============================================================================
// Main Configuration
// =============================================================================

/**
 * @brief Complete interpreter configuration
 */
struct InterpreterConfig {
    BufferConfig buffer;
    TranscriptConfig transcript;
    TranslationConfig translation;

    std::string log_level = "info";
    std::string log_file;

    /**
     * @brief Load configuration from JSON file, then apply environment overrides
     * @param path Path to JSON config file
     * @return Loaded config or error
     */
    static Result<InterpreterConfig> load(const std::string& path);

    /**
     * @brief Parse configuration from an already-parsed JSON document
     */
    static Result<InterpreterConfig> from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    /**
     * @brief Save configuration to JSON file
     */
    VoidResult save(const std::string& path) const;

    static InterpreterConfig defaults();

    /**
     * @brief Override fields from POLYGLOT_* environment variables
     */
    void apply_env_overrides();

    /**
     * @brief Validate configuration
     * @return Error message if invalid, empty if valid
     */
    std::string validate() const;
};

} // namespace config

// Convenience alias
using Config = config::InterpreterConfig;

} // namespace polyglot
