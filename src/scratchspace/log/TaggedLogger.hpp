#pragma once
#ifdef SS_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace SS {

// Which lines a TaggedLogger keeps. A line is dropped if any of its tags is skipped, or if
// onlyTags is non-empty and none of its tags is listed there.
struct LogFilter {
    bool                  enabled = false;
    std::set<std::string> skipTags{"Function Called"};
    std::set<std::string> onlyTags;

    // SCRATCHSPACE_LOG (truthy enables), SCRATCHSPACE_LOG_SKIP_TAGS and SCRATCHSPACE_LOG_ONLY_TAGS
    // (comma separated, whitespace trimmed).
    static auto fromEnvironment() -> LogFilter;

    [[nodiscard]] auto accepts(std::set<std::string> const& tags) const -> bool;
};

/**
 * Asynchronous tagged logger. Lines are filtered on the calling thread and written to
 * stderr by a worker thread in the order they were queued.
 */
class TaggedLogger {
public:
    explicit TaggedLogger(LogFilter filter = LogFilter::fromEnvironment());
    ~TaggedLogger();

    TaggedLogger(TaggedLogger const&)            = delete;
    TaggedLogger& operator=(TaggedLogger const&) = delete;

    template <typename... Tags>
    auto log_impl(std::string message, std::source_location const& location, Tags&&... tags) -> void;

    [[nodiscard]] auto enabled() const noexcept -> bool { return this->enabled_.load(std::memory_order_relaxed); }
    auto setEnabled(bool enabled) -> void { this->enabled_.store(enabled, std::memory_order_relaxed); }
    auto setThreadName(std::string name) -> void;
    // Blocks until every line queued so far has been written.
    auto flush() -> void;

    // Held while a line is written to std::cerr.
    static std::mutex outputMutex;

private:
    struct Line {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    auto enqueue(Line line) -> void;
    auto run() -> void;
    auto currentThreadName() -> std::string;
    static auto write(Line const& line) -> void;

    LogFilter const   filter;
    std::atomic<bool> enabled_;

    std::mutex              queueMutex;
    std::condition_variable wake;
    std::condition_variable drained;
    std::deque<Line>        pending;
    std::size_t             inFlight = 0;
    bool                    stopping = false;

    std::mutex                                       threadNamesMutex;
    std::unordered_map<std::thread::id, std::string> threadNames;
    int                                              nextThreadNumber = 0;

    std::thread worker;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(std::string message, std::source_location const& location, Tags&&... tags) -> void {
    if (!this->enabled())
        return;
    std::set<std::string> tagSet{std::string(std::forward<Tags>(tags))...};
    if (!this->filter.accepts(tagSet))
        return;
    this->enqueue(Line{.timestamp  = std::chrono::system_clock::now(),
                       .tags       = std::move(tagSet),
                       .message    = std::move(message),
                       .threadName = this->currentThreadName(),
                       .location   = location});
}

void set_thread_name(std::string name);
void set_logging_enabled(bool enabled);

} // namespace SS

// The message expression is only evaluated when the global logger is enabled.
#define ss_log(message, ...)                                                                        \
    do {                                                                                            \
        if (::SS::logger().enabled())                                                               \
            ::SS::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__);     \
    } while (false)

#else
#define ss_log(message, ...) ((void)0)
#endif // SS_LOG_DEBUG
