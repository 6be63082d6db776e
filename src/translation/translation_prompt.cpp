#include "translation/translation_interface.h"
#include <sstream>

namespace polyglot {
namespace translation {

std::string build_translation_prompt(Language source, Language target,
                                     const TranslationPreferences& preferences) {
    const char* tone = preferences.formal_tone
        ? "formal and professional"
        : "natural and conversational";
    const char* emotion = preferences.preserve_emotion
        ? "preserve the emotional tone and intensity"
        : "maintain clarity";

    std::ostringstream prompt;
    prompt << "You are an expert real-time interpreter. Translate the user's speech from "
           << language_name(source) << " to " << language_name(target) << ".\n\n"
           << "Guidelines:\n"
           << "- Keep the translation " << tone << "\n"
           << "- " << emotion << "\n"
           << "- Keep it appropriate to the cultural context\n"
           << "- Preserve the speaker's intent and meaning\n"
           << "- Keep the length close to the original\n"
           << "- Render informal speech with natural colloquialisms in "
           << language_name(target) << "\n\n"
           << "Respond ONLY with the translated text, no explanations.";
    return prompt.str();
}

} // namespace translation
} // namespace polyglot
