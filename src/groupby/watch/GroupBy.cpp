#include "GroupBy.hpp"

#include "group/Grouping.hpp"
#include "log/TaggedLogger.hpp"
#include "path/UrlUtils.hpp"

namespace GB {

GroupBy::GroupBy(ContentTree& tree)
    : tree_(tree), evaluator_(defaultEvaluator()) {
    this->subscription_ = this->tree_.subscribe([this](std::string const& path) { this->notifyChange(path); });
}

GroupBy::~GroupBy() {
    this->tree_.unsubscribe(this->subscription_);
}

auto GroupBy::addWatcher(std::string attribute, Config config, bool preBuild) -> Expected<WatcherPtr> {
    if (attribute.empty())
        return std::unexpected(Error{Error::Code::ConfigError, "attribute name must not be empty"});
    config.rebind(std::move(attribute));
    config.root = normalize_path(config.root);
    return this->registerConfig(std::move(config), preBuild);
}

auto GroupBy::addWatcher(std::string attribute, nlohmann::json const& section, bool preBuild) -> Expected<WatcherPtr> {
    auto config = Config::fromJson(std::move(attribute), section);
    if (!config)
        return std::unexpected(config.error());
    return this->registerConfig(std::move(*config), preBuild);
}

auto GroupBy::addWatcher(std::string attribute, std::filesystem::path const& configFile, bool preBuild) -> Expected<WatcherPtr> {
    auto config = Config::fromFile(std::move(attribute), configFile);
    if (!config)
        return std::unexpected(config.error());
    return this->registerConfig(std::move(*config), preBuild);
}

auto GroupBy::registerConfig(Config config, bool preBuild) -> Expected<WatcherPtr> {
    auto evaluator = this->evaluator();
    if (auto ok = config.validate(*evaluator); !ok)
        return std::unexpected(ok.error());

    SlugifyFn slugifyFn;
    {
        std::lock_guard<std::mutex> lock(this->orderMutex_);
        slugifyFn = this->slugify_;
    }
    auto watcher = std::make_shared<Watcher>(this->tree_, std::make_shared<Config const>(std::move(config)), preBuild, std::move(evaluator), std::move(slugifyFn));

    std::lock_guard<std::mutex> lock(this->orderMutex_);
    auto [it, inserted] = this->registry_.try_emplace(watcher->id(), watcher);
    if (!inserted) {
        gb_log("Rejected second watcher for " + watcher->id(), "GroupBy", "Warning");
        return std::unexpected(Error{Error::Code::AlreadyRegistered, "a watcher for " + watcher->id() + " is already registered"});
    }
    this->order_.push_back(watcher);
    gb_log("Registered watcher " + watcher->id() + (preBuild ? " (pre-build)" : ""), "GroupBy");
    return watcher;
}

auto GroupBy::loadQuickConfig(nlohmann::json const& document) -> Expected<std::vector<WatcherPtr>> {
    if (!document.is_object())
        return std::unexpected(Error{Error::Code::ConfigError, "quick config must be a mapping of attribute sections"});
    std::vector<WatcherPtr> added;
    for (auto const& [attribute, section] : document.items()) {
        if (!section.is_object())
            continue;
        auto watcher = this->addWatcher(attribute, section);
        if (!watcher)
            return std::unexpected(watcher.error());
        (*watcher)->setGrouping(makeSplitGrouping((*watcher)->config().split));
        added.push_back(std::move(*watcher));
    }
    return added;
}

auto GroupBy::loadQuickConfig(std::filesystem::path const& file) -> Expected<std::vector<WatcherPtr>> {
    auto document = loadConfigFile(file);
    if (!document)
        return std::unexpected(document.error());
    std::vector<WatcherPtr> added;
    for (auto const& [attribute, section] : document->items()) {
        if (!section.is_object())
            continue;
        auto config = Config::fromJson(attribute, section);
        if (!config)
            return std::unexpected(config.error());
        config->dependencies.insert(file.string());
        auto watcher = this->registerConfig(std::move(*config), false);
        if (!watcher)
            return std::unexpected(watcher.error());
        (*watcher)->setGrouping(makeSplitGrouping((*watcher)->config().split));
        added.push_back(std::move(*watcher));
    }
    return added;
}

auto GroupBy::watcher(std::string_view attribute, std::string_view root) const -> WatcherPtr {
    WatcherPtr found;
    this->registry_.if_contains(Watcher::makeId(attribute, root), [&](auto const& kv) { found = kv.second; });
    return found;
}

auto GroupBy::watchers() const -> std::vector<WatcherPtr> {
    std::lock_guard<std::mutex> lock(this->orderMutex_);
    return this->order_;
}

auto GroupBy::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->orderMutex_);
    return this->order_.size();
}

auto GroupBy::reset() -> void {
    std::lock_guard<std::mutex> lock(this->orderMutex_);
    this->registry_.clear();
    this->order_.clear();
}

auto GroupBy::beginTraversal() -> Expected<void> {
    for (auto const& watcher : this->watchers()) {
        if (!watcher->preBuild())
            continue;
        if (auto built = watcher->rebuild(); !built)
            return std::unexpected(built.error());
    }
    return {};
}

auto GroupBy::beforeRender() -> Expected<void> {
    for (auto const& watcher : this->watchers()) {
        if (!watcher->preBuild())
            continue;
        if (auto built = watcher->groups(); !built)
            return std::unexpected(built.error());
    }
    return {};
}

auto GroupBy::notifyChange(std::string_view identifier) -> std::size_t {
    std::size_t invalidated = 0;
    for (auto const& watcher : this->watchers()) {
        if (watcher->notifyChange(identifier))
            ++invalidated;
    }
    return invalidated;
}

auto GroupBy::dependencies() const -> std::set<std::string> {
    std::set<std::string> deps;
    for (auto const& watcher : this->watchers()) {
        auto own = watcher->dependencies();
        deps.insert(own.begin(), own.end());
    }
    return deps;
}

auto GroupBy::setEvaluator(std::shared_ptr<ExpressionEvaluator const> evaluator) -> void {
    std::lock_guard<std::mutex> lock(this->orderMutex_);
    this->evaluator_ = evaluator ? std::move(evaluator) : defaultEvaluator();
}

auto GroupBy::evaluator() const -> std::shared_ptr<ExpressionEvaluator const> {
    std::lock_guard<std::mutex> lock(this->orderMutex_);
    return this->evaluator_;
}

auto GroupBy::setSlugify(SlugifyFn slugifyFn) -> void {
    std::lock_guard<std::mutex> lock(this->orderMutex_);
    this->slugify_ = std::move(slugifyFn);
}

} // namespace GB
