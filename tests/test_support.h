/**
 * Shared helpers for the test executables: the ASSERT counter, polling
 * waits and in-memory fakes for the translation service, synthesizer and
 * audio transport.
 */

#pragma once

#include "core/types.h"
#include "logger.h"
#include "translation/translation_interface.h"
#include "transport/audio_transport.h"
#include "tts/tts_interface.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace polyglot {
namespace testing {

/// Poll pred every 5ms until it holds or timeout_ms passes
inline bool wait_for(const std::function<bool()>& pred, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

inline void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

inline int finish(const char* suite) {
    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All " << suite << " tests passed.\n";
    return 0;
}

/**
 * Dictionary translator. Unknown phrases come back as "[<code>] text".
 */
class FakeTranslator : public translation::ITranslationService {
public:
    FakeTranslator() {
        dictionary_[{"hello", Language::Spanish}] = "hola";
        dictionary_[{"hello", Language::French}] = "bonjour";
        dictionary_[{"good morning", Language::Spanish}] = "buenos dias";
        dictionary_[{"hola", Language::English}] = "hello";
    }

    Result<std::string> translate(const std::string& text, Language source, Language target,
                                  const TranslationPreferences& preferences) override {
        int delay = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back({text, target});
            last_preferences_[target] = preferences;
            if (delays_.count(target)) delay = delays_[target];
        }
        calls_made++;

        if (delay > 0) {
            sleep_ms(delay);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_.count(target)) {
            return make_provider_error("provider unavailable for " + std::string(language_code(target)));
        }
        if (source == target) {
            return text;
        }
        auto it = dictionary_.find({text, target});
        if (it != dictionary_.end()) {
            return it->second;
        }
        return "[" + std::string(language_code(target)) + "] " + text;
    }

    bool is_ready() const override { return true; }

    void fail_for(Language target) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.insert(target);
    }

    void delay_for(Language target, int ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        delays_[target] = ms;
    }

    std::vector<std::pair<std::string, Language>> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    TranslationPreferences preferences_for(Language target) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_preferences_.find(target);
        return it == last_preferences_.end() ? TranslationPreferences() : it->second;
    }

    std::atomic<int> calls_made{0};

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, Language>, std::string> dictionary_;
    std::set<Language> failing_;
    std::map<Language, int> delays_;
    std::vector<std::pair<std::string, Language>> calls_;
    std::map<Language, TranslationPreferences> last_preferences_;
};

/**
 * Synthesizer that records the text it was asked to voice
 */
class FakeTTS : public tts::ITTS {
public:
    tts::SynthResult synth(const std::string& text, Language language,
                           const std::string& voice) override {
        tts::SynthResult result;
        std::lock_guard<std::mutex> lock(mutex_);
        spoken_.push_back(text);
        voices_.push_back(voice);
        (void)language;
        if (fail_) {
            result.error = "synthesis failed";
            return result;
        }
        result.audio.assign(text.size() + 1, 1);
        return result;
    }

    bool is_ready() const override { return true; }

    tts::Stats get_stats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        tts::Stats stats;
        stats.requests = spoken_.size();
        stats.engine_ready = true;
        return stats;
    }

    std::vector<std::string> spoken() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spoken_;
    }

    std::vector<std::string> voices() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return voices_;
    }

    void set_fail(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> spoken_;
    std::vector<std::string> voices_;
    bool fail_ = false;
};

/**
 * Transport that records playback and the last audibility of every pair
 */
class RecordingTransport : public transport::IAudioTransport {
public:
    struct Playback {
        std::string participant_id;
        std::string stream_id;
        size_t samples;
    };

    VoidResult play(const std::string& participant_id, const std::string& stream_id,
                    const AudioBuffer& audio) override {
        std::lock_guard<std::mutex> lock(mutex_);
        plays_.push_back({participant_id, stream_id, audio.size()});
        return VoidResult();
    }

    void set_original_audible(const std::string& listener_id, const std::string& source_id,
                              bool audible) override {
        std::lock_guard<std::mutex> lock(mutex_);
        audible_[{listener_id, source_id}] = audible;
    }

    std::vector<Playback> plays_to(const std::string& participant_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Playback> result;
        for (const auto& play : plays_) {
            if (play.participant_id == participant_id) {
                result.push_back(play);
            }
        }
        return result;
    }

    /// Last value pushed for (listener, source); false if never pushed
    bool audible(const std::string& listener_id, const std::string& source_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = audible_.find({listener_id, source_id});
        return it != audible_.end() && it->second;
    }

    bool was_pushed(const std::string& listener_id, const std::string& source_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return audible_.count({listener_id, source_id}) > 0;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Playback> plays_;
    std::map<std::pair<std::string, std::string>, bool> audible_;
};

} // namespace testing
} // namespace polyglot
