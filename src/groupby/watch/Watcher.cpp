#include "Watcher.hpp"

#include "group/Aggregator.hpp"
#include "log/TaggedLogger.hpp"
#include "path/UrlUtils.hpp"

namespace GB {

auto watcherStateName(WatcherState state) -> std::string_view {
    switch (state) {
    case WatcherState::Unbuilt:
        return "unbuilt";
    case WatcherState::Building:
        return "building";
    case WatcherState::Built:
        return "built";
    case WatcherState::Stale:
        return "stale";
    }
    return "unbuilt";
}

Watcher::Watcher(ContentTree const& tree,
                 std::shared_ptr<Config const> config,
                 bool preBuild,
                 std::shared_ptr<ExpressionEvaluator const> evaluator,
                 SlugifyFn slugifyFn)
    : id_(makeId(config->attribute, config->root)),
      tree_(tree),
      config_(std::move(config)),
      preBuild_(preBuild),
      evaluator_(evaluator ? std::move(evaluator) : defaultEvaluator()),
      slugify_(std::move(slugifyFn)) {}

auto Watcher::makeId(std::string_view attribute, std::string_view root) -> std::string {
    return std::string(attribute) + "@" + normalize_path(root);
}

auto Watcher::setGrouping(std::shared_ptr<GroupingCallback> callback, bool flatten) -> void {
    {
        std::lock_guard<std::mutex> lock(this->buildMutex_);
        this->callback_ = std::move(callback);
        this->flatten_  = flatten;
    }
    this->invalidate();
}

auto Watcher::setGrouping(FunctionGrouping::ProduceFn produce, FunctionGrouping::ResolvedFn resolved, bool flatten) -> void {
    this->setGrouping(std::make_shared<FunctionGrouping>(std::move(produce), std::move(resolved)), flatten);
}

auto Watcher::currentIfBuilt() const -> Snapshot {
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    if (this->state_ == WatcherState::Built)
        return this->snapshot_;
    return nullptr;
}

auto Watcher::groups() -> Expected<Snapshot> {
    if (auto current = this->currentIfBuilt())
        return current;
    std::lock_guard<std::mutex> lock(this->buildMutex_);
    // Whoever held the gate before us may have just published.
    if (auto current = this->currentIfBuilt())
        return current;
    return this->build();
}

auto Watcher::rebuild() -> Expected<Snapshot> {
    std::lock_guard<std::mutex> lock(this->buildMutex_);
    this->invalidate();
    return this->build();
}

auto Watcher::build() -> Expected<Snapshot> {
    auto const      epoch = this->epoch_.load();
    WatcherState    previous = WatcherState::Unbuilt;
    {
        std::lock_guard<std::mutex> lock(this->stateMutex_);
        previous     = this->state_;
        this->state_ = WatcherState::Building;
    }
    gb_log("Building '" + this->id_ + "' (was " + std::string(watcherStateName(previous)) + ")", "Watcher");

    if (!this->config_->enabled) {
        std::lock_guard<std::mutex> lock(this->stateMutex_);
        this->snapshot_     = std::make_shared<GroupMap const>();
        this->dependencies_ = this->config_->dependencies;
        this->scanned_.clear();
        this->lastError_.reset();
        this->state_ = this->epoch_.load() == epoch ? WatcherState::Built : WatcherState::Stale;
        ++this->buildCount_;
        return this->snapshot_;
    }

    if (!this->callback_)
        this->callback_ = makeSplitGrouping(this->config_->split);

    Aggregator aggregator{this->tree_, this->config_, *this->evaluator_, this->slugify_};
    auto       result = aggregator.aggregate(*this->callback_, this->flatten_);

    std::lock_guard<std::mutex> lock(this->stateMutex_);
    if (!result) {
        this->lastError_ = result.error();
        this->state_     = this->snapshot_ ? WatcherState::Stale : WatcherState::Unbuilt;
        gb_log("Build of '" + this->id_ + "' failed: " + describeError(result.error()), "Watcher", "Error");
        return std::unexpected(result.error());
    }
    this->snapshot_     = std::make_shared<GroupMap const>(std::move(result->groups));
    this->dependencies_ = std::move(result->dependencies);
    this->scanned_      = std::move(result->scannedRecords);
    this->lastError_.reset();
    this->state_ = this->epoch_.load() == epoch ? WatcherState::Built : WatcherState::Stale;
    ++this->buildCount_;
    return this->snapshot_;
}

auto Watcher::cached() const -> Snapshot {
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    return this->snapshot_;
}

auto Watcher::state() const -> WatcherState {
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    return this->state_;
}

auto Watcher::lastError() const -> std::optional<Error> {
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    return this->lastError_;
}

auto Watcher::dependsOn(std::string_view identifier) const -> bool {
    if (identifier.empty())
        return false;
    if (this->config_->dependencies.contains(std::string(identifier)) || identifier == this->config_->templateName)
        return true;
    if (identifier.front() == '/' && is_within(identifier, this->config_->root))
        return true;
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    return this->dependencies_.contains(std::string(identifier));
}

auto Watcher::dependencies() const -> std::set<std::string> {
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    auto deps = this->dependencies_;
    deps.insert(this->config_->dependencies.begin(), this->config_->dependencies.end());
    if (!this->config_->templateName.empty())
        deps.insert(this->config_->templateName);
    return deps;
}

auto Watcher::scannedRecords() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    return this->scanned_;
}

auto Watcher::invalidate() -> void {
    ++this->epoch_;
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    if (this->state_ == WatcherState::Built)
        this->state_ = WatcherState::Stale;
}

auto Watcher::notifyChange(std::string_view identifier) -> bool {
    if (!this->dependsOn(identifier))
        return false;
    gb_log("'" + std::string(identifier) + "' changed, '" + this->id_ + "' is stale", "Watcher");
    this->invalidate();
    return true;
}

} // namespace GB
