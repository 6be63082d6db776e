#include "translation/http_translation_service.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <sstream>

using json = nlohmann::json;

namespace polyglot {
namespace translation {

class HttpTranslationService::Impl {
public:
    Impl(const config::TranslationConfig& config) : config_(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);

        if (!config_.api_key_env.empty()) {
            const char* key = std::getenv(config_.api_key_env.c_str());
            if (key != nullptr && *key != '\0') {
                auth_header_ = std::string("Authorization: Bearer ") + key;
            } else {
                Logger::warn("Translation API key variable " + config_.api_key_env + " is not set");
            }
        }

        LOG_TRANSLATE("Using " + config_.model_name + " at " + config_.endpoint);
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<std::string> translate(const std::string& text, Language source, Language target,
                                  const TranslationPreferences& preferences) {
        if (source == target || utils::is_empty_or_whitespace(text)) {
            return std::string(text);
        }

        json request;
        request["model"] = config_.model_name;
        request["messages"] = json::array({
            {{"role", "system"}, {"content", build_translation_prompt(source, target, preferences)}},
            {{"role", "user"}, {"content", text}}
        });
        request["temperature"] = config_.temperature;
        request["stream"] = false;

        std::string request_json = request.dump();
        std::string response_buffer;
        long http_status = 0;

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_network_error("Failed to initialize CURL");
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        if (!auth_header_.empty()) {
            headers = curl_slist_append(headers, auth_header_.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Required for timeouts on worker threads

        auto start = Clock::now();
        CURLcode res = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        std::ostringstream oss;
        oss << language_code(source) << "->" << language_code(target)
            << " curl=" << res << " status=" << http_status << " in " << ms_since(start) << "ms";
        LOG_TRANSLATE(oss.str());

        if (res == CURLE_OPERATION_TIMEDOUT) {
            return make_timeout_error("Translation request timed out after " +
                                      std::to_string(config_.timeout_ms) + "ms");
        }
        if (res != CURLE_OK) {
            return make_network_error(curl_easy_strerror(res));
        }
        if (http_status >= 400) {
            return make_provider_error("HTTP " + std::to_string(http_status) + ": " +
                                       utils::snippet(response_buffer, 200));
        }

        return parse_response(response_buffer);
    }

    bool is_ready() const {
        return !config_.endpoint.empty();
    }

private:
    Result<std::string> parse_response(const std::string& body) {
        std::string content;
        try {
            json response_json = json::parse(body);

            if (response_json.contains("message") && response_json["message"].contains("content")) {
                // Ollama /api/chat
                content = response_json["message"]["content"].get<std::string>();
            } else if (response_json.contains("choices") && response_json["choices"].is_array() &&
                       !response_json["choices"].empty()) {
                // OpenAI-compatible /v1/chat/completions
                content = response_json["choices"][0]["message"]["content"].get<std::string>();
            } else {
                LOG_DEBUG(std::string("Response without content: ") + body);
                return make_parse_error("No message content in response");
            }
        } catch (const json::exception& e) {
            return make_parse_error(std::string("JSON parse error: ") + e.what());
        }

        std::string cleaned = clean_response(content);
        if (cleaned.empty()) {
            return make_provider_error("Empty translation");
        }
        return cleaned;
    }

    /// Chat models sometimes wrap the answer in quotes or add newlines
    static std::string clean_response(const std::string& response) {
        std::string cleaned = utils::collapse_whitespace(response);
        if (cleaned.size() >= 2 && cleaned.front() == '"' && cleaned.back() == '"') {
            cleaned = utils::trim_copy(cleaned.substr(1, cleaned.size() - 2));
        }
        return cleaned;
    }

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
        std::string* buffer = static_cast<std::string*>(userp);
        size_t total_size = size * nmemb;
        buffer->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    config::TranslationConfig config_;
    std::string auth_header_;
};

HttpTranslationService::HttpTranslationService(const config::TranslationConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

HttpTranslationService::~HttpTranslationService() = default;

Result<std::string> HttpTranslationService::translate(const std::string& text,
                                                      Language source,
                                                      Language target,
                                                      const TranslationPreferences& preferences) {
    return pimpl_->translate(text, source, target, preferences);
}

bool HttpTranslationService::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace translation
} // namespace polyglot
