#pragma once

#include <string>
#include <vector>

namespace polyglot {

/**
 * @brief Spoken languages a participant can be registered with
 */
enum class Language {
    English,
    Spanish,
    French,
    Igbo,
    Yoruba,
    Hausa,
    Unknown
};

/**
 * @brief Per-language recognizer and voice settings
 *
 * One row per language; agents, adapters and the translation prompt look
 * everything language-specific up here.
 */
struct LanguageProfile {
    Language language;
    const char* code;              ///< ISO 639-1 code ("en")
    const char* display_name;      ///< Name used in translation prompts ("English")
    const char* recognizer_locale; ///< Locale passed to the speech recognizer ("en-US")
    const char* default_voice;     ///< Voice used when the listener has no preference
};

/// Look up the profile row; Unknown returns a row with empty strings
const LanguageProfile& language_profile(Language language);

/// Parse "en", "EN", "en-US", "es_MX" ...; anything unrecognized is Unknown
Language language_from_code(const std::string& code);

const char* language_code(Language language);
const char* language_name(Language language);

/// All supported languages (Unknown excluded)
std::vector<Language> supported_languages();

/// Voice for a listener: explicit preference wins, otherwise the language default
std::string select_voice(Language language, const std::string& preferred_voice);

} // namespace polyglot
