#include "translation_buffer.h"
#include "task_pool.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>
#include <vector>

namespace polyglot {

class TranslationBuffer::Impl {
public:
    Impl(const config::BufferConfig& config, DispatchHandler handler)
        : config_(config), handler_(std::move(handler)), running_(false) {
        if (config_.poll_interval_ms <= 0 || config_.poll_interval_ms > config_.max_delay_ms) {
            config_.poll_interval_ms = config_.max_delay_ms;
        }
        stats_.target_delay_ms = config_.max_delay_ms;

        std::ostringstream oss;
        oss << "TranslationBuffer initialized with " << config_.max_delay_ms
            << "ms max delay, threshold " << config_.confidence_threshold;
        LOG_INFO(oss.str());
    }

    ~Impl() {
        stop();
    }

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        if (!dispatch_pool_) {
            dispatch_pool_ = std::make_unique<TaskPool>("dispatch", config_.dispatch_workers);
        }
        running_ = true;
        loop_thread_ = std::thread(&Impl::loop, this);
        LOG_INFO("TranslationBuffer started");
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return;
            }
            running_ = false;
        }
        cv_.notify_all();
        if (loop_thread_.joinable()) {
            loop_thread_.join();
        }
        if (dispatch_pool_) {
            dispatch_pool_->wait_for_completion();
        }
        LOG_INFO("TranslationBuffer stopped");
    }

    bool is_running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    bool submit(const SegmentUpdate& update) {
        if (update.segment_id.empty() || update.speaker_id.empty()) {
            LOG_WARN("Rejected segment update without segment or speaker id");
            return false;
        }

        std::string text = utils::collapse_whitespace(update.text);
        if (text.empty()) {
            return false;
        }

        bool ready = update.is_final || update.confidence > config_.confidence_threshold;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (retired_.count(update.segment_id) > 0) {
                LOG_BUFFER("Ignored update for retired segment " + update.segment_id);
                return false;
            }
            auto it = segments_.find(update.segment_id);
            if (it != segments_.end()) {
                Segment& existing = it->second;
                if (existing.state != SegmentState::Pending) {
                    LOG_BUFFER("Ignored update for " + update.segment_id + " in state " +
                               segment_state_name(existing.state));
                    return false;
                }
                if (existing.speaker_id != update.speaker_id) {
                    LOG_WARN("Rejected update for " + update.segment_id + ": speaker " +
                             update.speaker_id + " does not own it");
                    return false;
                }
                existing.text = text;
                existing.is_final = update.is_final;
                existing.confidence = update.confidence;
                LOG_BUFFER("Updated segment " + update.segment_id + ": " + utils::snippet(text));
            } else {
                Segment segment;
                segment.segment_id = update.segment_id;
                segment.speaker_id = update.speaker_id;
                segment.text = text;
                segment.source_language = update.source_language;
                segment.created_at = Clock::now();
                segment.is_final = update.is_final;
                segment.confidence = update.confidence;
                segments_.emplace(update.segment_id, std::move(segment));
                LOG_BUFFER("Added segment " + update.segment_id + ": " + utils::snippet(text));
            }
            stats_.segments_submitted++;

            if (ready && queued_.insert(update.segment_id).second) {
                dispatch_queue_.push_back(update.segment_id);
            }
        }

        {
            std::ostringstream toss;
            toss << "speaker=" << update.speaker_id << " final=" << update.is_final
                 << " confidence=" << update.confidence << " ready=" << ready;
            LOG_TRACE(update.segment_id, "submit", toss.str());
        }

        if (ready) {
            cv_.notify_one();
        }
        return true;
    }

    void register_listener(const std::string& listener_id, TranslationCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_[listener_id] = std::move(callback);
        LOG_BUFFER("Listener registered: " + listener_id);
    }

    /// Returns once no delivery to listener_id is in progress
    void unregister_listener(const std::string& listener_id) {
        std::unique_lock<std::mutex> lock(mutex_);
        listeners_.erase(listener_id);
        delivery_cv_.wait(lock, [this, &listener_id] {
            return delivering_.count(listener_id) == 0;
        });
        LOG_BUFFER("Listener unregistered: " + listener_id);
    }

    bool has_listener(const std::string& listener_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.count(listener_id) > 0;
    }

    std::optional<Segment> get_segment(const std::string& segment_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = segments_.find(segment_id);
        if (it == segments_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    BufferStats get_stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        BufferStats stats = stats_;
        stats.pending_segments = 0;
        for (const auto& entry : segments_) {
            if (entry.second.state == SegmentState::Pending) {
                stats.pending_segments++;
            }
        }
        return stats;
    }

private:
    void loop() {
        LOG_BUFFER("Segment processing loop started");

        std::unique_lock<std::mutex> lock(mutex_);
        while (running_) {
            cv_.wait_until(lock, next_wakeup(), [this] {
                return !dispatch_queue_.empty() || !running_;
            });
            if (!running_) {
                break;
            }

            std::vector<Segment> to_dispatch;
            TimePoint now = Clock::now();

            // Ready segments, in the order they became ready
            while (!dispatch_queue_.empty()) {
                std::string id = dispatch_queue_.front();
                dispatch_queue_.pop_front();
                queued_.erase(id);
                auto it = segments_.find(id);
                if (it != segments_.end() && begin_translation(it->second, now)) {
                    to_dispatch.push_back(it->second);
                }
            }

            // Overdue segments the recognizer never finalized
            for (auto& entry : segments_) {
                Segment& segment = entry.second;
                if (segment.state == SegmentState::Pending &&
                    now >= segment.created_at + Duration(config_.max_delay_ms) &&
                    begin_translation(segment, now)) {
                    stats_.segments_forced++;
                    LOG_BUFFER("Force-dispatching overdue segment " + segment.segment_id);
                    to_dispatch.push_back(segment);
                }
            }

            cleanup_finished(now);

            lock.unlock();
            for (auto& segment : to_dispatch) {
                bool queued = dispatch_pool_->submit([this, segment]() { run_dispatch(segment); });
                if (!queued) {
                    finish(segment.segment_id, SegmentState::Failed);
                }
            }
            lock.lock();
        }

        LOG_BUFFER("Segment processing loop exited");
    }

    /// Earliest of the next poll tick and the next pending deadline
    TimePoint next_wakeup() const {
        TimePoint wakeup = Clock::now() + Duration(config_.poll_interval_ms);
        for (const auto& entry : segments_) {
            const Segment& segment = entry.second;
            if (segment.state == SegmentState::Pending) {
                wakeup = std::min(wakeup, segment.created_at + Duration(config_.max_delay_ms));
            }
        }
        return wakeup;
    }

    /// Pending -> Translating; the only place this transition happens
    bool begin_translation(Segment& segment, TimePoint now) {
        if (segment.state != SegmentState::Pending) {
            return false;
        }
        segment.state = SegmentState::Translating;
        segment.translation_started_at = now;
        stats_.segments_dispatched++;
        return true;
    }

    void cleanup_finished(TimePoint now) {
        for (auto it = segments_.begin(); it != segments_.end();) {
            const Segment& segment = it->second;
            bool finished = segment.state == SegmentState::Completed ||
                            segment.state == SegmentState::Failed;
            if (finished && segment.translation_completed_at &&
                now >= *segment.translation_completed_at + Duration(config_.cleanup_grace_ms)) {
                LOG_BUFFER("Cleaned up segment " + it->first);
                retire(it->first);
                it = segments_.erase(it);
            } else {
                ++it;
            }
        }
    }

    /// Cleaned-up ids stay closed; the oldest are forgotten past RETIRED_IDS_KEPT
    void retire(const std::string& segment_id) {
        if (!retired_.insert(segment_id).second) {
            return;
        }
        retired_order_.push_back(segment_id);
        while (retired_order_.size() > constants::buffer::RETIRED_IDS_KEPT) {
            retired_.erase(retired_order_.front());
            retired_order_.pop_front();
        }
    }

    void run_dispatch(const Segment& segment) {
        {
            std::ostringstream toss;
            toss << "age_ms=" << segment.age_ms() << " text=\"" << utils::snippet(segment.text) << "\"";
            LOG_TRACE(segment.segment_id, "dispatch", toss.str());
        }

        FanOutResult fan_out;
        bool handler_ok = true;
        try {
            fan_out = handler_(segment);
        } catch (const std::exception& e) {
            LOG_ERROR("Dispatch handler failed for " + segment.segment_id + ": " + e.what());
            handler_ok = false;
        }

        size_t delivered = 0;
        size_t failed = fan_out.requested > fan_out.results.size()
            ? fan_out.requested - fan_out.results.size() : 0;
        std::vector<int64_t> latencies;

        for (const auto& entry : fan_out.results) {
            const std::string& listener_id = entry.first;
            const TranslationResult& result = entry.second;

            if (listener_id == segment.speaker_id) {
                LOG_BUFFER("Skipping self-delivery to " + listener_id);
                continue;
            }
            TranslationCallback callback = begin_delivery(listener_id);
            if (!callback) {
                LOG_BUFFER("No listener " + listener_id + " for " + segment.segment_id + ", discarding");
                continue;
            }
            try {
                callback(result);
                delivered++;
                latencies.push_back(result.total_latency_ms);
            } catch (const std::exception& e) {
                failed++;
                LOG_ERROR("Listener " + listener_id + " failed on " + segment.segment_id + ": " + e.what());
            }
            end_delivery(listener_id);
        }

        bool succeeded = handler_ok && (fan_out.requested == 0 || delivered > 0);
        if (!succeeded) {
            LOG_WARN("Segment " + segment.segment_id + " failed: no listener received a translation");
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (int64_t latency : latencies) {
                stats_.translations_completed++;
                size_t n = stats_.translations_completed;
                stats_.avg_latency_ms = (stats_.avg_latency_ms * (n - 1) + latency) / n;
                stats_.max_latency_ms = std::max(stats_.max_latency_ms, latency);
            }
            stats_.translations_failed += failed;
        }

        finish(segment.segment_id, succeeded ? SegmentState::Completed : SegmentState::Failed);

        std::ostringstream toss;
        toss << "requested=" << fan_out.requested << " delivered=" << delivered
             << " state=" << (succeeded ? "completed" : "failed");
        LOG_TRACE(segment.segment_id, "complete", toss.str());
    }

    TranslationCallback begin_delivery(const std::string& listener_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = listeners_.find(listener_id);
        if (it == listeners_.end() || !it->second) {
            return nullptr;
        }
        delivering_[listener_id]++;
        return it->second;
    }

    void end_delivery(const std::string& listener_id) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = delivering_.find(listener_id);
            if (it != delivering_.end() && --it->second == 0) {
                delivering_.erase(it);
            }
        }
        delivery_cv_.notify_all();
    }

    void finish(const std::string& segment_id, SegmentState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = segments_.find(segment_id);
        if (it == segments_.end()) {
            return;
        }
        it->second.state = state;
        it->second.translation_completed_at = Clock::now();
    }

    config::BufferConfig config_;
    DispatchHandler handler_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_;
    std::thread loop_thread_;
    std::unique_ptr<TaskPool> dispatch_pool_;

    std::map<std::string, Segment> segments_;
    std::deque<std::string> dispatch_queue_;
    std::set<std::string> queued_;
    std::set<std::string> retired_;
    std::deque<std::string> retired_order_;
    std::map<std::string, TranslationCallback> listeners_;
    std::map<std::string, size_t> delivering_;
    std::condition_variable delivery_cv_;
    BufferStats stats_;
};

TranslationBuffer::TranslationBuffer(const config::BufferConfig& config, DispatchHandler handler)
    : pimpl_(std::make_unique<Impl>(config, std::move(handler))) {}

TranslationBuffer::~TranslationBuffer() = default;

void TranslationBuffer::start() {
    pimpl_->start();
}

void TranslationBuffer::stop() {
    pimpl_->stop();
}

bool TranslationBuffer::is_running() const {
    return pimpl_->is_running();
}

bool TranslationBuffer::submit(const SegmentUpdate& update) {
    return pimpl_->submit(update);
}

void TranslationBuffer::register_listener(const std::string& listener_id, TranslationCallback callback) {
    pimpl_->register_listener(listener_id, std::move(callback));
}

void TranslationBuffer::unregister_listener(const std::string& listener_id) {
    pimpl_->unregister_listener(listener_id);
}

bool TranslationBuffer::has_listener(const std::string& listener_id) const {
    return pimpl_->has_listener(listener_id);
}

std::optional<Segment> TranslationBuffer::get_segment(const std::string& segment_id) const {
    return pimpl_->get_segment(segment_id);
}

BufferStats TranslationBuffer::get_stats() const {
    return pimpl_->get_stats();
}

} // namespace polyglot
