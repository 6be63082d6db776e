#include "logger.h"
#include "utils.h"
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace polyglot {

namespace {

const char* level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/// "[Component] message", or the bare message when untagged
std::string format_line(const char* component, const std::string& message) {
    if (component == nullptr || *component == '\0') {
        return message;
    }
    return std::string("[") + component + "] " + message;
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = utils::normalize_copy(utils::trim_copy(name));
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file)
        : min_level_(min_level) {
        if (!output_file.empty()) {
            file_stream_.open(output_file, std::ios::app);
            if (!file_stream_.is_open()) {
                std::cerr << "Warning: Failed to open log file: " << output_file << std::endl;
            }
        }
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= min_level_;
    }

    void write(LogLevel level, const char* component, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::ostringstream oss;
        oss << "[" << level_string(level) << "] "
            << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << " " << format_line(component, message);
        std::string line = oss.str();

        (level >= LogLevel::ERROR ? std::cerr : std::cout) << line << std::endl;
        if (file_stream_.is_open()) {
            file_stream_ << line << std::endl;
        }
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

private:
    mutable std::mutex mutex_;
    LogLevel min_level_;
    std::ofstream file_stream_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>(min_level, output_file);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

bool Logger::enabled(LogLevel level) {
    return !impl_ || impl_->enabled(level);
}

void Logger::write(LogLevel level, const char* component, const std::string& message) {
    if (impl_) {
        impl_->write(level, component, message);
        return;
    }
    (level >= LogLevel::ERROR ? std::cerr : std::cout) << format_line(component, message) << std::endl;
}

void Logger::debug(const std::string& message) {
    write(LogLevel::DEBUG, nullptr, message);
}

void Logger::info(const std::string& message) {
    write(LogLevel::INFO, nullptr, message);
}

void Logger::warn(const std::string& message) {
    write(LogLevel::WARN, nullptr, message);
}

void Logger::error(const std::string& message) {
    write(LogLevel::ERROR, nullptr, message);
}

void Logger::set_level(LogLevel level) {
    if (impl_) {
        impl_->set_level(level);
    }
}

LogLevel Logger::get_level() {
    return impl_ ? impl_->get_level() : LogLevel::INFO;
}

} // namespace polyglot
