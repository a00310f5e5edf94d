#pragma once
#include "config/Config.hpp"
#include "content/ContentTree.hpp"
#include "core/Error.hpp"
#include "expr/Expression.hpp"
#include "group/GroupBySource.hpp"
#include "group/Grouping.hpp"
#include "util/Slugify.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace GB {

enum class WatcherState {
    Unbuilt,
    Building,
    Built,
    Stale
};

auto watcherStateName(WatcherState state) -> std::string_view;

/**
 * Binds one attribute under one root to a config and a grouping callback and
 * caches the groups of the last successful build.
 *
 * Builds happen on access only and at most one runs at a time per watcher;
 * concurrent readers wait for it and then share its result. Readers always
 * see a complete mapping: the previous one until the next build is published.
 * A change reported while a build runs leaves the watcher Stale afterwards.
 */
class Watcher {
public:
    using Snapshot = std::shared_ptr<GroupMap const>;

    Watcher(ContentTree const& tree,
            std::shared_ptr<Config const> config,
            bool preBuild,
            std::shared_ptr<ExpressionEvaluator const> evaluator,
            SlugifyFn slugifyFn = {});

    Watcher(Watcher const&)            = delete;
    Watcher& operator=(Watcher const&) = delete;

    // "<attribute>@<root>"
    static auto makeId(std::string_view attribute, std::string_view root) -> std::string;

    [[nodiscard]] auto id() const -> std::string const& { return this->id_; }
    [[nodiscard]] auto attribute() const -> std::string const& { return this->config_->attribute; }
    [[nodiscard]] auto root() const -> std::string const& { return this->config_->root; }
    [[nodiscard]] auto config() const -> Config const& { return *this->config_; }
    [[nodiscard]] auto configPtr() const -> std::shared_ptr<Config const> const& { return this->config_; }
    [[nodiscard]] auto preBuild() const -> bool { return this->preBuild_; }
    [[nodiscard]] auto flatten() const -> bool { return this->flatten_.load(); }

    // Replaces the callback and invalidates the cache. Without a callback the
    // watcher splits string values on the config's `split`.
    auto setGrouping(std::shared_ptr<GroupingCallback> callback, bool flatten = true) -> void;
    auto setGrouping(FunctionGrouping::ProduceFn produce, FunctionGrouping::ResolvedFn resolved = {}, bool flatten = true) -> void;

    // The current groups, building first if the cache is Unbuilt or Stale.
    auto groups() -> Expected<Snapshot>;
    // Invalidate, then build.
    auto rebuild() -> Expected<Snapshot>;
    // Last published mapping without building; null before the first success.
    [[nodiscard]] auto cached() const -> Snapshot;

    [[nodiscard]] auto state() const -> WatcherState;
    [[nodiscard]] auto buildCount() const -> std::size_t { return this->buildCount_.load(); }
    [[nodiscard]] auto lastError() const -> std::optional<Error>;

    // Config dependencies, the template, every record of the last scan, and
    // any record path at or beneath the root.
    [[nodiscard]] auto dependsOn(std::string_view identifier) const -> bool;
    [[nodiscard]] auto dependencies() const -> std::set<std::string>;
    // Records walked by the last successful build, pre-order.
    [[nodiscard]] auto scannedRecords() const -> std::vector<std::string>;

    auto invalidate() -> void;
    // Invalidates if `identifier` is a dependency; returns whether it was.
    auto notifyChange(std::string_view identifier) -> bool;

private:
    auto build() -> Expected<Snapshot>;
    auto currentIfBuilt() const -> Snapshot;

    std::string                                id_;
    ContentTree const&                         tree_;
    std::shared_ptr<Config const>              config_;
    bool                                       preBuild_;
    std::shared_ptr<ExpressionEvaluator const> evaluator_;
    SlugifyFn                                  slugify_;

    // Held for the whole build and while swapping the callback.
    std::mutex                        buildMutex_;
    std::shared_ptr<GroupingCallback> callback_;
    std::atomic<bool>                 flatten_{true};

    // Guards everything readers see.
    mutable std::mutex       stateMutex_;
    WatcherState             state_ = WatcherState::Unbuilt;
    Snapshot                 snapshot_;
    std::set<std::string>    dependencies_;
    std::vector<std::string> scanned_;
    std::optional<Error>     lastError_;

    std::atomic<std::uint64_t> epoch_{0};
    std::atomic<std::size_t>   buildCount_{0};
};

} // namespace GB
