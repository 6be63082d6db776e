#pragma once

#include "translation/translation_interface.h"
#include "core/config.h"
#include <memory>

namespace polyglot {
namespace translation {

/**
 * @brief Translation through a chat-completion HTTP endpoint
 *
 * Posts a system prompt (see build_translation_prompt) plus the text as the
 * user message. Understands Ollama /api/chat responses ("message.content")
 * and OpenAI-compatible ones ("choices[0].message.content").
 *
 * Error mapping: transport failure -> NetworkError, curl timeout -> Timeout,
 * HTTP status >= 400 or empty content -> ProviderError, unreadable body ->
 * ParseError.
 */
class HttpTranslationService : public ITranslationService {
public:
    explicit HttpTranslationService(const config::TranslationConfig& config);
    ~HttpTranslationService() override;

    // Non-copyable
    HttpTranslationService(const HttpTranslationService&) = delete;
    HttpTranslationService& operator=(const HttpTranslationService&) = delete;

    Result<std::string> translate(const std::string& text,
                                  Language source,
                                  Language target,
                                  const TranslationPreferences& preferences) override;

    bool is_ready() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace translation
} // namespace polyglot
