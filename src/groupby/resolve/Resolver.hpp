#pragma once
#include "core/Error.hpp"
#include "group/GroupBySource.hpp"
#include "watch/GroupBy.hpp"
#include "watch/Watcher.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace GB {

// A group, or one of its pages, found by URL or virtual path.
struct ResolvedNode {
    std::shared_ptr<Watcher>     watcher;
    Watcher::Snapshot            snapshot; // keeps the group's build alive
    GroupMap::GroupPtr           group;
    std::size_t                  pageNum = 1;

    [[nodiscard]] auto page() const -> GroupPage { return GroupPage{this->group, this->pageNum}; }
    [[nodiscard]] auto urlPath() const -> std::optional<std::string> { return this->group->pageUrl(this->pageNum); }
    // "<root>@groupby/<attribute>/<key>" plus "/<page>" past the first page.
    [[nodiscard]] auto virtualPath() const -> std::string;
};

// The host's set of addressable virtual nodes, reconciled by Resolver::prune().
class VirtualNodeRegistry {
public:
    virtual ~VirtualNodeRegistry() = default;
    virtual auto expose(std::string const& url, std::string const& virtualPath) -> void = 0;
    virtual auto retract(std::string const& url) -> void = 0;
    [[nodiscard]] virtual auto exposed() const -> std::vector<std::string> = 0;
};

class InMemoryNodeRegistry final : public VirtualNodeRegistry {
public:
    auto expose(std::string const& url, std::string const& virtualPath) -> void override;
    auto retract(std::string const& url) -> void override;
    [[nodiscard]] auto exposed() const -> std::vector<std::string> override;

    [[nodiscard]] auto contains(std::string_view url) const -> bool;
    [[nodiscard]] auto virtualPathOf(std::string_view url) const -> std::optional<std::string>;

private:
    mutable std::mutex                                mutex_;
    std::map<std::string, std::string, std::less<>>   nodes_;
};

/**
 * URL <-> group mapping over every watcher of a registry.
 *
 * The per-watcher URL table is rebuilt wholesale whenever the watcher
 * publishes a new build. When two watchers claim the same URL, the one
 * registered first keeps it.
 */
class Resolver {
public:
    explicit Resolver(GroupBy& groupBy);

    // Canonical URL of a group or page. Builds the watchers whose root and
    // slug prefix can contain the URL. A watcher whose build fails is skipped;
    // its error is returned only when no other watcher has the URL, else NotFound.
    auto resolve(std::string_view url) -> Expected<ResolvedNode>;
    // "<record>@groupby/<attribute>/<key>[/<page>]"
    auto resolveVirtualPath(std::string_view path) -> Expected<ResolvedNode>;

    /**
     * Builds every watcher and recomputes the URL -> virtual path mapping.
     * A watcher whose build fails keeps contributing its previous mapping;
     * its error is returned in the list.
     */
    auto sync() -> std::vector<Error>;
    // sync(), then retract every exposed URL not in the mapping and expose
    // the current ones. Returns the number of retracted URLs.
    auto prune(VirtualNodeRegistry& registry) -> std::size_t;

    // Mapping of the last sync(), URL -> virtual path.
    [[nodiscard]] auto mapping() const -> std::map<std::string, std::string>;
    // Number of per-watcher URL tables held; sync() drops those of unregistered watchers.
    [[nodiscard]] auto tableCount() const -> std::size_t;

private:
    struct Table {
        Watcher::Snapshot                                                           snapshot;
        std::map<std::string, std::pair<std::size_t, std::size_t>, std::less<>>     urls; // url -> (group, page)
    };

    auto mayContain(Watcher const& watcher, std::string_view url) const -> bool;
    auto tableFor(Watcher const& watcher, Watcher::Snapshot const& snapshot) -> Table const&;

    GroupBy& groupBy_;

    mutable std::mutex                  mutex_;
    std::map<std::string, Table>        tables_; // watcher id -> table
    std::map<std::string, std::string>  mapping_;
};

} // namespace GB
