#pragma once
#include "sigkeep/logging/logger.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sigkeep::test_helpers {

class CapturingLogSink : public logging::ILogSink {
public:
    struct Entry {
        logging::LogLevel level;
        std::string component;
        std::string message;
    };

    void Write(const logging::LogLevel level, const std::string_view component,
               const std::string_view message) override {
        std::lock_guard lock(mutex_);
        entries_.push_back(Entry{level, std::string(component), std::string(message)});
    }

    [[nodiscard]] std::vector<Entry> Entries() const {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    [[nodiscard]] bool Contains(const std::string_view fragment) const {
        std::lock_guard lock(mutex_);
        return std::any_of(entries_.begin(), entries_.end(), [&](const Entry& entry) {
            return entry.message.find(fragment) != std::string::npos;
        });
    }

    [[nodiscard]] size_t CountAtLevel(const logging::LogLevel level) const {
        std::lock_guard lock(mutex_);
        return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(), [&](const Entry& entry) {
            return entry.level == level;
        }));
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

/**
 * Installs a capturing sink for the scope of a test and restores stderr afterwards.
 */
class ScopedLogCapture {
public:
    explicit ScopedLogCapture(const logging::LogLevel level = logging::LogLevel::Trace)
        : sink_(std::make_shared<CapturingLogSink>())
        , previous_level_(logging::Logger::GetLevel()) {
        logging::Logger::SetSink(sink_);
        logging::Logger::SetLevel(level);
    }
    ~ScopedLogCapture() {
        logging::Logger::SetSink(nullptr);
        logging::Logger::SetLevel(previous_level_);
    }
    ScopedLogCapture(const ScopedLogCapture&) = delete;
    ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

    [[nodiscard]] CapturingLogSink& Sink() noexcept {
        return *sink_;
    }

private:
    std::shared_ptr<CapturingLogSink> sink_;
    logging::LogLevel previous_level_;
};

}
