#ifdef SS_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace SS {

namespace {

auto isTruthy(char const* value) -> bool {
    if (value == nullptr || *value == '\0')
        return false;
    std::string lowered{value};
    for (auto& c : lowered)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lowered != "0" && lowered != "false" && lowered != "off" && lowered != "no";
}

auto splitTags(char const* value) -> std::set<std::string> {
    std::set<std::string> tags;
    if (value == nullptr)
        return tags;
    std::string_view remaining{value};
    while (!remaining.empty()) {
        auto const comma = remaining.find(',');
        auto       token = remaining.substr(0, comma);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front())))
            token.remove_prefix(1);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back())))
            token.remove_suffix(1);
        if (!token.empty())
            tags.emplace(token);
        if (comma == std::string_view::npos)
            break;
        remaining.remove_prefix(comma + 1);
    }
    return tags;
}

// "log/TaggedLogger.cpp" rather than the full build path.
auto shortPath(char const* file) -> std::string {
    std::filesystem::path path{file};
    if (!path.has_parent_path())
        return path.filename().string();
    return (path.parent_path().filename() / path.filename()).string();
}

} // namespace

auto LogFilter::fromEnvironment() -> LogFilter {
    LogFilter filter;
    filter.enabled = isTruthy(std::getenv("SCRATCHSPACE_LOG"));
    filter.skipTags.merge(splitTags(std::getenv("SCRATCHSPACE_LOG_SKIP_TAGS")));
    filter.onlyTags = splitTags(std::getenv("SCRATCHSPACE_LOG_ONLY_TAGS"));
    return filter;
}

auto LogFilter::accepts(std::set<std::string> const& tags) const -> bool {
    bool listed = this->onlyTags.empty();
    for (auto const& tag : tags) {
        if (this->skipTags.contains(tag))
            return false;
        listed = listed || this->onlyTags.contains(tag);
    }
    return listed;
}

std::mutex TaggedLogger::outputMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger(LogFilter filter)
    : filter(std::move(filter)), enabled_(this->filter.enabled) {
    this->worker = std::thread(&TaggedLogger::run, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard lock(this->queueMutex);
        this->stopping = true;
    }
    this->wake.notify_one();
    if (this->worker.joinable())
        this->worker.join();
}

auto TaggedLogger::setThreadName(std::string name) -> void {
    std::lock_guard lock(this->threadNamesMutex);
    this->threadNames[std::this_thread::get_id()] = std::move(name);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock lock(this->queueMutex);
    this->drained.wait(lock, [this] { return this->pending.empty() && this->inFlight == 0; });
}

auto TaggedLogger::enqueue(Line line) -> void {
    {
        std::lock_guard lock(this->queueMutex);
        this->pending.push_back(std::move(line));
    }
    this->wake.notify_one();
}

auto TaggedLogger::run() -> void {
    std::unique_lock lock(this->queueMutex);
    while (true) {
        this->wake.wait(lock, [this] { return !this->pending.empty() || this->stopping; });
        if (this->pending.empty())
            return;

        std::deque<Line> batch;
        batch.swap(this->pending);
        this->inFlight = batch.size();
        lock.unlock();
        for (auto const& line : batch)
            write(line);
        lock.lock();
        this->inFlight = 0;
        this->drained.notify_all();
    }
}

auto TaggedLogger::currentThreadName() -> std::string {
    std::lock_guard lock(this->threadNamesMutex);
    auto [it, inserted] = this->threadNames.try_emplace(std::this_thread::get_id());
    if (inserted)
        it->second = "Thread " + std::to_string(this->nextThreadNumber++);
    return it->second;
}

auto TaggedLogger::write(Line const& line) -> void {
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(line.timestamp.time_since_epoch()) % 1000;
    auto const time   = std::chrono::system_clock::to_time_t(line.timestamp);
    std::tm    local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    for (auto const& tag : line.tags)
        oss << '[' << tag << ']';
    oss << " [" << line.threadName << "] " << shortPath(line.location.file_name()) << ':' << line.location.line()
        << ' ' << line.message << '\n';

    std::lock_guard lock(outputMutex);
    std::cerr << oss.str() << std::flush;
}

void set_thread_name(std::string name) {
    logger().setThreadName(std::move(name));
}

void set_logging_enabled(bool enabled) {
    logger().setEnabled(enabled);
}

} // namespace SS
#endif // SS_LOG_DEBUG
