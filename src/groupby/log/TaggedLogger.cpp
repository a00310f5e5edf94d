#ifdef GB_LOG_DEBUG
#include "TaggedLogger.hpp"

#include "util/Slugify.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace GB {

namespace {

auto envEnabled(char const* name) -> bool {
    char const* raw = std::getenv(name);
    if (!raw)
        return false;
    std::string value{raw};
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "1" || value == "true" || value == "on" || value == "yes";
}

auto envTags(char const* name) -> std::set<std::string> {
    char const* raw = std::getenv(name);
    if (!raw)
        return {};
    auto items = split_strip(raw, ",");
    return {items.begin(), items.end()};
}

auto levelOf(std::set<std::string> const& tags) -> char const* {
    if (tags.contains("Error") || tags.contains("ERROR"))
        return "ERROR";
    if (tags.contains("Warning"))
        return "WARN ";
    return "DEBUG";
}

} // namespace

std::mutex TaggedLogger::outputMutex;

auto LogFilter::accepts(std::set<std::string> const& tags) const -> bool {
    if (!this->allow.empty() && std::any_of(tags.begin(), tags.end(), [&](auto const& tag) { return !this->allow.contains(tag); }))
        return false;
    return std::none_of(tags.begin(), tags.end(), [&](auto const& tag) { return this->skip.contains(tag); });
}

auto LogFilter::fromEnvironment() -> LogFilter {
    LogFilter filter;
    if (envEnabled("GROUPBY_LOG_VERBOSE"))
        filter.skip.clear();
    for (auto& tag : envTags("GROUPBY_LOG_SKIP"))
        filter.skip.insert(tag);
    filter.allow = envTags("GROUPBY_LOG_TAGS");
    return filter;
}

auto logger() -> TaggedLogger& {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger()
    : enabled_(envEnabled("GROUPBY_LOG")), filter_(LogFilter::fromEnvironment()) {
    this->worker_ = std::thread(&TaggedLogger::run, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex_);
        this->stopping_ = true;
    }
    this->wake_.notify_one();
    if (this->worker_.joinable())
        this->worker_.join();
}

auto TaggedLogger::setThreadName(std::string name) -> void {
    std::lock_guard<std::mutex> lock(this->threadsMutex_);
    this->threads_.insert_or_assign(std::this_thread::get_id(), std::move(name));
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    this->enabled_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::setFilter(LogFilter filter) -> void {
    std::lock_guard<std::mutex> lock(this->sinkMutex_);
    this->filter_ = std::move(filter);
}

auto TaggedLogger::setSink(Sink sink) -> void {
    std::lock_guard<std::mutex> lock(this->sinkMutex_);
    this->sink_ = std::move(sink);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex_);
    this->drained_.wait(lock, [this] { return this->queue_.empty() && !this->writing_; });
}

auto TaggedLogger::enqueue(Entry entry) -> void {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex_);
        this->queue_.push_back(std::move(entry));
    }
    this->wake_.notify_one();
}

auto TaggedLogger::run() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex_);
    while (true) {
        this->wake_.wait(lock, [this] { return !this->queue_.empty() || this->stopping_; });
        if (this->queue_.empty() && this->stopping_)
            return;
        auto entry = std::move(this->queue_.front());
        this->queue_.pop_front();
        this->writing_ = true;
        lock.unlock();
        {
            std::lock_guard<std::mutex> sinkLock(this->sinkMutex_);
            if (this->filter_.accepts(entry.tags)) {
                auto line = format(entry);
                if (this->sink_) {
                    this->sink_(line);
                } else {
                    std::lock_guard<std::mutex> outLock(outputMutex);
                    std::cerr << line << std::flush;
                }
            }
        }
        lock.lock();
        this->writing_ = false;
        if (this->queue_.empty())
            this->drained_.notify_all();
    }
}

auto TaggedLogger::format(Entry const& entry) -> std::string {
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(entry.timestamp.time_since_epoch()) % 1000;
    auto const time   = std::chrono::system_clock::to_time_t(entry.timestamp);
    std::tm    local{};
    localtime_r(&time, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ' << levelOf(entry.tags) << ' ';
    for (auto const& tag : entry.tags)
        out << '[' << tag << ']';
    out << " (" << entry.thread << ") " << entry.message;
    out << "  " << std::filesystem::path(entry.location.file_name()).filename().string() << ':' << entry.location.line() << '\n';
    return out.str();
}

auto TaggedLogger::threadName() -> std::string {
    std::lock_guard<std::mutex> lock(this->threadsMutex_);
    auto [it, inserted] = this->threads_.try_emplace(std::this_thread::get_id());
    if (inserted)
        it->second = "Thread " + std::to_string(this->nextThread_++);
    return it->second;
}

auto set_thread_name(std::string name) -> void {
    logger().setThreadName(std::move(name));
}

auto set_logging_enabled(bool enabled) -> void {
    logger().setLoggingEnabled(enabled);
}

} // namespace GB
#endif // GB_LOG_DEBUG
