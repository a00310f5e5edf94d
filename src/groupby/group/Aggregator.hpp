#pragma once
#include "config/Config.hpp"
#include "content/ContentTree.hpp"
#include "core/Error.hpp"
#include "expr/Expression.hpp"
#include "group/GroupBySource.hpp"
#include "group/Grouping.hpp"
#include "util/Slugify.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace GB {

struct AggregateResult {
    GroupMap                 groups;
    std::set<std::string>    dependencies;   // config dependencies, template, scanned record sources
    std::vector<std::string> scannedRecords; // pre-order
    std::size_t              occurrences         = 0;
    std::size_t              callbackInvocations = 0;
};

/**
 * One full build of one (attribute, root): scanner -> callback -> key
 * resolver -> merge, then per group: order children, compute the slug and
 * fold groups sharing a slug into the first one.
 *
 * Nothing is shared with other builds; an error leaves no partial result.
 */
class Aggregator {
public:
    Aggregator(ContentTree const& tree, std::shared_ptr<Config const> config, ExpressionEvaluator const& evaluator, SlugifyFn slugifyFn = {});

    auto aggregate(GroupingCallback& callback, bool flatten = true) -> Expected<AggregateResult>;

    // Slug of a group; nullopt when the config makes groups non-addressable.
    auto computeSlug(GroupBySource const& group) const -> Expected<std::optional<std::string>>;

private:
    using GroupPtr = std::shared_ptr<GroupBySource>;

    auto handleOccurrence(GroupingCallback& callback, FieldOccurrence& occurrence, AggregateResult& result) -> Expected<void>;
    auto substituteSlug(std::string const& key) const -> std::string;
    auto sortChildren(GroupBySource& group) const -> void;
    auto mergeInto(GroupBySource& target, GroupBySource& source) const -> void;
    auto finish(AggregateResult& result) -> Expected<void>;

    ContentTree const&            tree_;
    std::shared_ptr<Config const> config_;
    ExpressionEvaluator const&    evaluator_;
    SlugifyFn                     slugify_;

    std::vector<GroupPtr>                           groups_;
    std::map<std::string, std::size_t, std::less<>> byKey_;
};

} // namespace GB
