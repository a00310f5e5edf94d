#pragma once
#include "config/Config.hpp"
#include "core/Error.hpp"
#include "group/GroupBySource.hpp"
#include "watch/GroupBy.hpp"

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace GB {

struct QueryOptions {
    // Attributes to consider; all registered watchers when unset.
    std::optional<std::set<std::string>> keys;
    // Only occurrences in one of these record fields.
    std::optional<std::set<std::string>> fields;
    // Only occurrences in one of these flow block fields.
    std::optional<std::set<std::string>> flows;
    bool                                 recursive = false;
    // "key", "key_obj", "attribute", "url_path", "count", or any field or
    // attribute of the group; a leading '-' reverses. Comma separated.
    std::optional<std::string> orderBy;
    // Receives every visited record path and every config dependency.
    std::function<void(std::string const&)> recorder;
};

/**
 * Groups referencing a record, or any record beneath it.
 *
 * Builds the watchers it needs, walks breadth-first from the parent record
 * and collects the groups with a child occurrence on each visited record.
 * The result holds each group once, in first-seen order unless sorted.
 */
class GroupQuery {
public:
    using GroupPtr = GroupMap::GroupPtr;

    explicit GroupQuery(GroupBy& groupBy);

    auto query(std::string_view parentPath, QueryOptions const& options = {}) -> Expected<std::vector<GroupPtr>>;

private:
    auto matches(GroupBySource const& group, std::string const& recordPath, QueryOptions const& options) const -> bool;
    auto sortGroups(std::vector<GroupPtr>& groups, std::vector<OrderKey> const& order) const -> Expected<void>;

    GroupBy& groupBy_;
};

} // namespace GB
