#pragma once
#include "config/Config.hpp"
#include "content/ContentTree.hpp"
#include "core/Error.hpp"
#include "expr/Expression.hpp"
#include "util/Slugify.hpp"
#include "util/TransparentString.hpp"
#include "watch/Watcher.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <parallel_hashmap/phmap.h>

namespace GB {

/**
 * Registry of the watchers of one build invocation.
 *
 * Watchers are keyed by (attribute, root); registering the same pair twice is
 * rejected with Error::Code::AlreadyRegistered until reset() starts a new
 * invocation. The registry listens to the content tree and forwards every
 * change to the watchers that depend on it.
 */
class GroupBy {
public:
    using WatcherPtr = std::shared_ptr<Watcher>;

    explicit GroupBy(ContentTree& tree);
    ~GroupBy();

    GroupBy(GroupBy const&)            = delete;
    GroupBy& operator=(GroupBy const&) = delete;

    auto addWatcher(std::string attribute, Config config, bool preBuild = false) -> Expected<WatcherPtr>;
    auto addWatcher(std::string attribute, nlohmann::json const& section, bool preBuild = false) -> Expected<WatcherPtr>;
    auto addWatcher(std::string attribute, std::filesystem::path const& configFile, bool preBuild = false) -> Expected<WatcherPtr>;

    /**
     * One watcher per top-level object section, grouped with the split
     * callback. Sections are registered in key order; the first failure stops
     * the load and is returned, earlier sections stay registered.
     */
    auto loadQuickConfig(nlohmann::json const& document) -> Expected<std::vector<WatcherPtr>>;
    // Same for a file; the file becomes a dependency of every watcher it defines.
    auto loadQuickConfig(std::filesystem::path const& file) -> Expected<std::vector<WatcherPtr>>;

    [[nodiscard]] auto watcher(std::string_view attribute, std::string_view root = "/") const -> WatcherPtr;
    // Registration order.
    [[nodiscard]] auto watchers() const -> std::vector<WatcherPtr>;
    [[nodiscard]] auto size() const -> std::size_t;

    // Drops every watcher.
    auto reset() -> void;

    // Start of a content traversal: every preBuild watcher is rebuilt.
    auto beginTraversal() -> Expected<void>;
    // Before a record is rendered: preBuild watchers are built if needed.
    auto beforeRender() -> Expected<void>;

    // Forwards a change to dependent watchers; returns how many were invalidated.
    auto notifyChange(std::string_view identifier) -> std::size_t;
    [[nodiscard]] auto dependencies() const -> std::set<std::string>;

    [[nodiscard]] auto tree() const -> ContentTree& { return this->tree_; }
    // Used by watchers registered afterwards.
    auto setEvaluator(std::shared_ptr<ExpressionEvaluator const> evaluator) -> void;
    [[nodiscard]] auto evaluator() const -> std::shared_ptr<ExpressionEvaluator const>;
    auto setSlugify(SlugifyFn slugifyFn) -> void;

private:
    using Registry = phmap::parallel_node_hash_map<
            std::string,
            WatcherPtr,
            TransparentStringHash,
            std::equal_to<>,
            std::allocator<std::pair<const std::string, WatcherPtr>>,
            4,
            std::mutex>;

    auto registerConfig(Config config, bool preBuild) -> Expected<WatcherPtr>;

    ContentTree& tree_;
    std::size_t  subscription_ = 0;
    Registry     registry_;

    mutable std::mutex                         orderMutex_;
    std::vector<WatcherPtr>                    order_;
    std::shared_ptr<ExpressionEvaluator const> evaluator_;
    SlugifyFn                                  slugify_;
};

} // namespace GB
