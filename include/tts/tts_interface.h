#pragma once

/**
 * @file tts_interface.h
 * @brief Text-to-Speech interface
 *
 * Defines the abstract interface an agent uses to voice translations.
 * This allows swapping TTS backends (cloud voices, local engines, fakes).
 */

#include "core/types.h"
#include "errors.h"
#include <string>

namespace polyglot {
namespace tts {

/**
 * @brief TTS synthesis result
 */
struct SynthResult {
    AudioBuffer audio;
    int64_t synthesis_ms = 0;
    std::string error;

    bool ok() const { return error.empty() && !audio.empty(); }
};

/**
 * @brief TTS engine statistics
 */
struct Stats {
    size_t requests = 0;
    size_t failures = 0;
    int64_t avg_synthesis_ms = 0;
    bool engine_ready = false;
};

/**
 * @brief Abstract TTS interface
 *
 * One instance may be shared by every agent in a process; implementations
 * must tolerate concurrent synth() calls.
 */
class ITTS {
public:
    virtual ~ITTS() = default;

    /**
     * @brief Synthesize text to audio
     * @param text Text to synthesize
     * @param language Language the text is in
     * @param voice Voice name (see select_voice)
     * @return Audio buffer or error
     */
    virtual SynthResult synth(const std::string& text, Language language,
                              const std::string& voice) = 0;

    /**
     * @brief Check if engine is ready
     */
    virtual bool is_ready() const = 0;

    /**
     * @brief Get engine statistics
     */
    virtual Stats get_stats() const = 0;
};

} // namespace tts
} // namespace polyglot
