#include "language.h"
#include "utils.h"

namespace polyglot {

namespace {

const LanguageProfile kProfiles[] = {
    {Language::English, "en", "English", "en-US", "lucy"},
    {Language::Spanish, "es", "Spanish", "es-US", "lucia"},
    {Language::French,  "fr", "French",  "fr-FR", "amelie"},
    {Language::Igbo,    "ig", "Igbo",    "ig-NG", "amara"},
    {Language::Yoruba,  "yo", "Yoruba",  "yo-NG", "funmi"},
    {Language::Hausa,   "ha", "Hausa",   "ha-NG", "zainab"},
};

const LanguageProfile kUnknownProfile = {Language::Unknown, "", "", "", ""};

} // anonymous namespace

const LanguageProfile& language_profile(Language language) {
    for (const auto& profile : kProfiles) {
        if (profile.language == language) {
            return profile;
        }
    }
    return kUnknownProfile;
}

Language language_from_code(const std::string& code) {
    std::string lower = utils::normalize_copy(utils::trim_copy(code));
    std::string::size_type sep = lower.find_first_of("-_");
    if (sep != std::string::npos) {
        lower = lower.substr(0, sep);
    }
    for (const auto& profile : kProfiles) {
        if (lower == profile.code) {
            return profile.language;
        }
    }
    return Language::Unknown;
}

const char* language_code(Language language) {
    return language_profile(language).code;
}

const char* language_name(Language language) {
    return language_profile(language).display_name;
}

std::vector<Language> supported_languages() {
    std::vector<Language> out;
    for (const auto& profile : kProfiles) {
        out.push_back(profile.language);
    }
    return out;
}

std::string select_voice(Language language, const std::string& preferred_voice) {
    if (!utils::is_empty_or_whitespace(preferred_voice)) {
        return utils::trim_copy(preferred_voice);
    }
    return language_profile(language).default_voice;
}

} // namespace polyglot
