#pragma once
#ifdef GB_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <thread>

namespace GB {

// Which tag sets reach the sink. An empty allow-list admits every tag.
struct LogFilter {
    std::set<std::string> allow;
    std::set<std::string> skip{"Scanner", "Testcase"};

    [[nodiscard]] auto accepts(std::set<std::string> const& tags) const -> bool;

    /**
     * Environment overrides:
     * - GROUPBY_LOG_TAGS: comma separated allow-list; every tag of a line must be in it
     * - GROUPBY_LOG_SKIP: comma separated tags added to the skip list
     * - GROUPBY_LOG_VERBOSE: drop the built-in skip list
     */
    static auto fromEnvironment() -> LogFilter;
};

/**
 * Tagged logger used by the gb_log macro.
 *
 * By convention the first tag names the component ("Watcher", "Resolver")
 * and an optional "Error" or "Warning" tag raises the level. Lines are queued
 * by the caller and formatted and written by a worker thread, so logging from
 * inside a build never blocks on the sink.
 *
 * Output is off unless GROUPBY_LOG is set to a true value or
 * setLoggingEnabled(true) is called.
 */
class TaggedLogger {
public:
    using Sink = std::function<void(std::string const& line)>;

    struct Entry {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           thread;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(TaggedLogger const&)            = delete;
    TaggedLogger& operator=(TaggedLogger const&) = delete;

    template <typename... Tags>
    auto log(std::string message, std::source_location const& location, Tags&&... tags) -> void;

    auto setThreadName(std::string name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    [[nodiscard]] auto loggingEnabled() const -> bool { return this->enabled_.load(std::memory_order_relaxed); }
    auto setFilter(LogFilter filter) -> void;
    // Replaces the stderr sink; an empty function restores it.
    auto setSink(Sink sink) -> void;
    // Blocks until every queued line has been handed to the sink.
    auto flush() -> void;

    static auto format(Entry const& entry) -> std::string;

    // Held while writing to stderr; take it to interleave other console output.
    static std::mutex outputMutex;

private:
    auto enqueue(Entry entry) -> void;
    auto run() -> void;
    auto threadName() -> std::string;

    std::mutex              queueMutex_;
    std::condition_variable wake_;
    std::condition_variable drained_;
    std::deque<Entry>       queue_;
    bool                    writing_ = false;
    bool                    stopping_ = false;
    std::atomic<bool>       enabled_{false};

    mutable std::mutex sinkMutex_;
    LogFilter          filter_;
    Sink               sink_;

    std::mutex                             threadsMutex_;
    std::map<std::thread::id, std::string> threads_;
    int                                    nextThread_ = 0;

    std::thread worker_;
};

auto logger() -> TaggedLogger&;

template <typename... Tags>
auto TaggedLogger::log(std::string message, std::source_location const& location, Tags&&... tags) -> void {
    if (!this->loggingEnabled())
        return;
    this->enqueue(Entry{std::chrono::system_clock::now(), {std::string(std::forward<Tags>(tags))...}, std::move(message), this->threadName(), location});
}

#define gb_log(message, ...) ::GB::logger().log(message, std::source_location::current(), ##__VA_ARGS__)

auto set_thread_name(std::string name) -> void;
auto set_logging_enabled(bool enabled) -> void;

} // namespace GB

#else
#define gb_log(message, ...) ((void)0)
#endif // GB_LOG_DEBUG
