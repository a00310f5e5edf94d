#include "Resolver.hpp"

#include "log/TaggedLogger.hpp"
#include "path/UrlUtils.hpp"

#include <algorithm>
#include <charconv>

namespace GB {

auto ResolvedNode::virtualPath() const -> std::string {
    auto path = this->group->path();
    if (this->pageNum > 1)
        path += "/" + std::to_string(this->pageNum);
    return path;
}

auto InMemoryNodeRegistry::expose(std::string const& url, std::string const& virtualPath) -> void {
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->nodes_.insert_or_assign(url, virtualPath);
}

auto InMemoryNodeRegistry::retract(std::string const& url) -> void {
    std::lock_guard<std::mutex> lock(this->mutex_);
    if (auto it = this->nodes_.find(url); it != this->nodes_.end())
        this->nodes_.erase(it);
}

auto InMemoryNodeRegistry::exposed() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(this->mutex_);
    std::vector<std::string>    urls;
    urls.reserve(this->nodes_.size());
    for (auto const& [url, _] : this->nodes_)
        urls.push_back(url);
    return urls;
}

auto InMemoryNodeRegistry::contains(std::string_view url) const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->nodes_.find(url) != this->nodes_.end();
}

auto InMemoryNodeRegistry::virtualPathOf(std::string_view url) const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(this->mutex_);
    auto                        it = this->nodes_.find(url);
    if (it == this->nodes_.end())
        return std::nullopt;
    return it->second;
}

Resolver::Resolver(GroupBy& groupBy)
    : groupBy_(groupBy) {}

auto Resolver::mayContain(Watcher const& watcher, std::string_view url) const -> bool {
    auto const& config = watcher.config();
    if (!config.slug || !is_within(url, config.root))
        return false;
    if (!config.isSlugTemplate())
        return true;
    // Literal slug text before the key is a fixed prefix of every group URL.
    auto slug = *config.slug;
    for (auto pos = slug.find("{attrib}"); pos != std::string::npos; pos = slug.find("{attrib}"))
        slug.replace(pos, 8, config.attribute);
    auto const keyPos = slug.find("{key}");
    if (keyPos == std::string::npos)
        return true;
    auto prefix = build_url({config.root, std::string_view(slug).substr(0, keyPos)});
    if (keyPos > 0 && slug[keyPos - 1] == '/' && prefix.back() != '/')
        prefix.push_back('/');
    return url.starts_with(prefix);
}

auto Resolver::tableFor(Watcher const& watcher, Watcher::Snapshot const& snapshot) -> Table const& {
    auto& table = this->tables_[watcher.id()];
    if (table.snapshot == snapshot)
        return table;
    table.snapshot = snapshot;
    table.urls.clear();
    auto const& groups = snapshot->groups();
    for (std::size_t i = 0; i < groups.size(); ++i) {
        auto const pages = groups[i]->pageCount();
        for (std::size_t page = 1; page <= pages; ++page) {
            if (auto url = groups[i]->pageUrl(page))
                table.urls.emplace(*url, std::make_pair(i, page));
        }
    }
    return table;
}

auto Resolver::resolve(std::string_view urlIn) -> Expected<ResolvedNode> {
    auto const           url = canonical_url(urlIn);
    std::optional<Error> failure;
    for (auto const& watcher : this->groupBy_.watchers()) {
        if (!this->mayContain(*watcher, url))
            continue;
        auto snapshot = watcher->groups();
        if (!snapshot) {
            gb_log("Skipping " + watcher->id() + " while resolving " + url + ": " + describeError(snapshot.error()), "Resolver", "Error");
            if (!failure)
                failure = snapshot.error();
            continue;
        }

        std::lock_guard<std::mutex> lock(this->mutex_);
        auto const&                 table = this->tableFor(*watcher, *snapshot);
        if (auto it = table.urls.find(url); it != table.urls.end()) {
            auto const [index, page] = it->second;
            return ResolvedNode{watcher, *snapshot, (*snapshot)->groups()[index], page};
        }
    }
    if (failure)
        return std::unexpected(*failure);
    return std::unexpected(Error{Error::Code::NotFound, "no group at " + url});
}

auto Resolver::resolveVirtualPath(std::string_view path) -> Expected<ResolvedNode> {
    auto const tag = path.find(VirtualPathTag);
    if (tag == std::string_view::npos)
        return std::unexpected(Error{Error::Code::InvalidPath, "not a group path: " + std::string(path)});
    auto const root  = normalize_path(path.substr(0, tag));
    auto const parts = split_path(path.substr(tag + VirtualPathTag.size()));
    if (parts.size() < 2 || parts.size() > 3)
        return std::unexpected(Error{Error::Code::InvalidPath, "expected <record>@groupby/<attribute>/<key>[/<page>]: " + std::string(path)});

    std::size_t pageNum = 1;
    if (parts.size() == 3) {
        auto const& text = parts[2];
        auto [ptr, ec]   = std::from_chars(text.data(), text.data() + text.size(), pageNum);
        if (ec != std::errc{} || ptr != text.data() + text.size() || pageNum == 0)
            return std::unexpected(Error{Error::Code::InvalidPath, "invalid page number '" + text + "' in " + std::string(path)});
    }

    auto watcher = this->groupBy_.watcher(parts[0], root);
    if (!watcher)
        return std::unexpected(Error{Error::Code::NotFound, "no watcher for " + Watcher::makeId(parts[0], root)});
    auto snapshot = watcher->groups();
    if (!snapshot)
        return std::unexpected(snapshot.error());
    auto group = (*snapshot)->find(parts[1]);
    if (!group)
        return std::unexpected(Error{Error::Code::NotFound, "no group '" + parts[1] + "' for " + watcher->id()});
    if (auto page = group->page(pageNum); !page)
        return std::unexpected(page.error());
    return ResolvedNode{watcher, *snapshot, group, pageNum};
}

auto Resolver::sync() -> std::vector<Error> {
    std::vector<Error>                 failures;
    std::map<std::string, std::string> mapping;
    std::map<std::string, std::string> owners;
    auto const                         watchers = this->groupBy_.watchers();
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        std::erase_if(this->tables_, [&](auto const& entry) {
            return std::none_of(watchers.begin(), watchers.end(), [&](auto const& watcher) { return watcher->id() == entry.first; });
        });
    }
    for (auto const& watcher : watchers) {
        auto snapshot = watcher->groups();
        if (!snapshot) {
            failures.push_back(snapshot.error());
            gb_log("Keeping previous URLs of " + watcher->id() + ": " + describeError(snapshot.error()), "Resolver", "Error");
            auto previous = watcher->cached();
            if (!previous)
                continue;
            snapshot = previous;
        }

        std::lock_guard<std::mutex> lock(this->mutex_);
        auto const&                 table  = this->tableFor(*watcher, *snapshot);
        auto const&                 groups = (*snapshot)->groups();
        for (auto const& [url, location] : table.urls) {
            auto const& [index, page] = location;
            if (auto owner = owners.find(url); owner != owners.end()) {
                gb_log(url + " of " + watcher->id() + " is already taken by " + owner->second, "Resolver", "Warning");
                continue;
            }
            owners.emplace(url, watcher->id());
            mapping.emplace(url, ResolvedNode{watcher, *snapshot, groups[index], page}.virtualPath());
        }
    }
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->mapping_ = std::move(mapping);
    return failures;
}

auto Resolver::prune(VirtualNodeRegistry& registry) -> std::size_t {
    this->sync();
    auto const  current   = this->mapping();
    std::size_t retracted = 0;
    for (auto const& url : registry.exposed()) {
        if (current.contains(url))
            continue;
        registry.retract(url);
        ++retracted;
    }
    for (auto const& [url, virtualPath] : current)
        registry.expose(url, virtualPath);
    gb_log("Pruned " + std::to_string(retracted) + " stale group URLs", "Resolver");
    return retracted;
}

auto Resolver::mapping() const -> std::map<std::string, std::string> {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->mapping_;
}

auto Resolver::tableCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->tables_.size();
}

} // namespace GB
