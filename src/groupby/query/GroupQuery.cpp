#include "GroupQuery.hpp"

#include "log/TaggedLogger.hpp"
#include "path/UrlUtils.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>

namespace GB {

GroupQuery::GroupQuery(GroupBy& groupBy)
    : groupBy_(groupBy) {}

auto GroupQuery::matches(GroupBySource const& group, std::string const& recordPath, QueryOptions const& options) const -> bool {
    if (!options.fields && !options.flows)
        return true;
    for (auto const& child : group.children()) {
        if (child.record->path() != recordPath)
            continue;
        for (auto const& occurrence : child.occurrences) {
            if (options.fields && !options.fields->contains(occurrence.fieldKey))
                continue;
            if (options.flows && (!occurrence.flowKey || !options.flows->contains(*occurrence.flowKey)))
                continue;
            return true;
        }
    }
    return false;
}

auto GroupQuery::sortGroups(std::vector<GroupPtr>& groups, std::vector<OrderKey> const& order) const -> Expected<void> {
    auto const evaluator = this->groupBy_.evaluator();
    // Sort values are computed once per group; field expressions may be costly.
    std::vector<std::pair<GroupPtr, std::vector<Value>>> keyed;
    keyed.reserve(groups.size());
    for (auto const& group : groups) {
        std::vector<Value> values;
        values.reserve(order.size());
        for (auto const& key : order) {
            auto value = group->lookup(key.field, *evaluator);
            if (!value) {
                if (value.error().code != Error::Code::NotFound)
                    return std::unexpected(value.error());
                values.emplace_back();
                continue;
            }
            values.push_back(std::move(*value));
        }
        keyed.emplace_back(group, std::move(values));
    }
    std::stable_sort(keyed.begin(), keyed.end(), [&](auto const& a, auto const& b) {
        for (std::size_t i = 0; i < order.size(); ++i) {
            auto const cmp = compareValues(a.second[i], b.second[i]);
            if (cmp != 0)
                return order[i].descending ? cmp > 0 : cmp < 0;
        }
        return false;
    });
    for (std::size_t i = 0; i < keyed.size(); ++i)
        groups[i] = std::move(keyed[i].first);
    return {};
}

auto GroupQuery::query(std::string_view parentPath, QueryOptions const& options) -> Expected<std::vector<GroupPtr>> {
    std::vector<OrderKey> order;
    if (options.orderBy) {
        auto parsed = parseOrderBy(*options.orderBy);
        if (!parsed)
            return std::unexpected(parsed.error());
        order = std::move(*parsed);
    }

    std::vector<std::shared_ptr<GroupMap const>> maps;
    for (auto const& watcher : this->groupBy_.watchers()) {
        if (options.keys && !options.keys->contains(watcher->attribute()))
            continue;
        auto snapshot = watcher->groups();
        if (!snapshot)
            return std::unexpected(snapshot.error());
        maps.push_back(std::move(*snapshot));
        if (options.recorder) {
            for (auto const& dep : watcher->config().dependencies)
                options.recorder(dep);
        }
    }

    auto& tree = this->groupBy_.tree();
    std::vector<GroupPtr>                      result;
    std::unordered_set<GroupBySource const*>   seen;
    std::deque<std::string>                    pending{normalize_path(parentPath)};
    while (!pending.empty()) {
        auto path = std::move(pending.front());
        pending.pop_front();
        if (!tree.contains(path))
            continue;
        if (options.recorder)
            options.recorder(path);
        if (options.recursive) {
            for (auto const& child : tree.children(path))
                pending.push_back(child->path());
        }
        for (auto const& map : maps) {
            for (auto const& group : map->referencing(path)) {
                if (seen.contains(group.get()) || !this->matches(*group, path, options))
                    continue;
                seen.insert(group.get());
                result.push_back(group);
            }
        }
    }

    if (!order.empty()) {
        if (auto ok = this->sortGroups(result, order); !ok)
            return std::unexpected(ok.error());
    }
    gb_log("Query under " + std::string(parentPath) + " found " + std::to_string(result.size()) + " groups", "GroupQuery");
    return result;
}

} // namespace GB
