#pragma once

/**
 * @file translation_interface.h
 * @brief Text translation interface
 *
 * Defines the abstract interface the session coordinator calls once per
 * (segment, listener). This allows swapping translation backends (local
 * Ollama model, hosted LLM APIs, test fakes).
 */

#include "core/types.h"
#include "errors.h"
#include <string>

namespace polyglot {
namespace translation {

/**
 * @brief Abstract translation interface
 *
 * Implementations must be safe to call from several threads at once: the
 * coordinator issues the requests for one segment concurrently.
 */
class ITranslationService {
public:
    virtual ~ITranslationService() = default;

    /**
     * @brief Translate text between two languages
     * @param text Source text (already normalized)
     * @param source Language the text is in
     * @param target Language to translate into
     * @param preferences Listener's tone and emotion preferences
     * @return Translated text or error (network, timeout, provider, parse)
     */
    virtual Result<std::string> translate(const std::string& text,
                                          Language source,
                                          Language target,
                                          const TranslationPreferences& preferences) = 0;

    /**
     * @brief Check if the service can take requests
     */
    virtual bool is_ready() const = 0;
};

/**
 * @brief System prompt instructing a chat model to translate source -> target
 *
 * Tone follows preferences.formal_tone ("formal and professional" or
 * "natural and conversational"); preserve_emotion selects between keeping
 * the emotional intensity and favouring clarity.
 */
std::string build_translation_prompt(Language source, Language target,
                                     const TranslationPreferences& preferences);

} // namespace translation
} // namespace polyglot
