#pragma once
#include "config/Config.hpp"
#include "content/Record.hpp"
#include "content/Value.hpp"
#include "core/Error.hpp"
#include "expr/Expression.hpp"
#include "scan/FieldOccurrence.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace GB {

// Prefix of virtual paths: "<root>@groupby/<attribute>/<key>[/<page>]".
inline constexpr std::string_view VirtualPathTag = "@groupby";

struct GroupChild {
    std::shared_ptr<Record>   record;
    std::vector<Value>        keyObjs;     // raw key objects the record yielded for this group
    std::vector<FieldKeyPath> occurrences; // where each of them was found, same order
    std::vector<Value>        extras;      // per-child values attached by the grouping callback
};

class GroupBySource;

// One page of a group. Page numbers are 1-based.
struct GroupPage {
    std::shared_ptr<GroupBySource const> source;
    std::size_t                          pageNum = 1;

    [[nodiscard]] auto children() const -> std::span<GroupChild const>;
    [[nodiscard]] auto urlPath() const -> std::optional<std::string>;
    [[nodiscard]] auto slug() const -> std::optional<std::string>;
    [[nodiscard]] auto pageCount() const -> std::size_t;
    [[nodiscard]] auto hasPrev() const -> bool { return this->pageNum > 1; }
    [[nodiscard]] auto hasNext() const -> bool { return this->pageNum < this->pageCount(); }
};

/**
 * The materialized cluster for one (attribute, root, key).
 *
 * Instances are created and filled by the Aggregator; once a build has been
 * published they are immutable and shared read-only between threads. Declared
 * fields are evaluated on every access.
 */
class GroupBySource : public std::enable_shared_from_this<GroupBySource> {
public:
    GroupBySource(std::shared_ptr<Config const> config, std::string key, Value keyObj);

    [[nodiscard]] auto attribute() const -> std::string const& { return this->config_->attribute; }
    [[nodiscard]] auto key() const -> std::string const& { return this->key_; }
    [[nodiscard]] auto keyObj() const -> Value const& { return this->keyObj_; }
    // Keys merged into this group because they produced the same slug.
    [[nodiscard]] auto aliasKeys() const -> std::vector<std::string> const& { return this->aliases_; }
    [[nodiscard]] auto slug() const -> std::optional<std::string> const& { return this->slug_; }
    // Root joined with the slug, "/index.html" folded to "/"; null when not addressable.
    [[nodiscard]] auto urlPath() const -> std::optional<std::string>;
    // "<root>@groupby/<attribute>/<key>"
    [[nodiscard]] auto path() const -> std::string;
    [[nodiscard]] auto templateName() const -> std::string const& { return this->config_->templateName; }
    [[nodiscard]] auto config() const -> Config const& { return *this->config_; }
    [[nodiscard]] auto configPtr() const -> std::shared_ptr<Config const> const& { return this->config_; }

    [[nodiscard]] auto children() const -> std::vector<GroupChild> const& { return this->children_; }
    [[nodiscard]] auto childCount() const -> std::size_t { return this->children_.size(); }
    [[nodiscard]] auto firstChild() const -> std::shared_ptr<Record>;
    [[nodiscard]] auto firstExtra() const -> std::optional<Value>;
    [[nodiscard]] auto hasChild(std::string_view recordPath) const -> bool;

    // Values attached through GroupHandle::setAttribute during the build.
    [[nodiscard]] auto attributeValue(std::string_view name) const -> std::optional<Value>;
    [[nodiscard]] auto attributes() const -> std::map<std::string, Value, std::less<>> const& { return this->attributes_; }

    // Declared field, evaluated now. NotFound if the config declares no such field.
    auto field(std::string_view name, ExpressionEvaluator const& evaluator) const -> Expected<Value>;
    // Any name the expression scope knows: built-ins, attributes, declared fields.
    auto lookup(std::string_view name, ExpressionEvaluator const& evaluator) const -> Expected<Value>;

    [[nodiscard]] auto pageCount() const -> std::size_t;
    auto page(std::size_t pageNum) const -> Expected<GroupPage>;
    [[nodiscard]] auto pageSlug(std::size_t pageNum) const -> std::optional<std::string>;
    [[nodiscard]] auto pageUrl(std::size_t pageNum) const -> std::optional<std::string>;
    [[nodiscard]] auto pageChildren(std::size_t pageNum) const -> std::span<GroupChild const>;

    // Context with `this` = this group, `record` = the root record (if any) and `config`.
    auto makeContext(ExprObject const& self, ExprObject const& config) const -> ExprContext;

private:
    friend class Aggregator;
    friend class GroupHandle;

    std::shared_ptr<Config const>              config_;
    std::string                                key_;
    Value                                      keyObj_;
    std::vector<std::string>                   aliases_;
    std::optional<std::string>                 slug_;
    std::vector<GroupChild>                    children_;
    std::map<std::string, std::size_t, std::less<>> childIndex_;
    std::map<std::string, Value, std::less<>>  attributes_;
    std::shared_ptr<Record>                    anchor_;
};

// Expression view of a group: key, key_obj, attribute, slug, url_path, path,
// template, count, children, first_child, first_extra, then attributes and fields.
class GroupScope final : public ExprObject {
public:
    GroupScope(GroupBySource const& group, ExpressionEvaluator const& evaluator)
        : group_(group), evaluator_(evaluator) {}
    auto lookup(std::string_view name) const -> Expected<Value> override {
        return this->group_.lookup(name, this->evaluator_);
    }

private:
    GroupBySource const&       group_;
    ExpressionEvaluator const& evaluator_;
};

/**
 * Result of one build: final key -> group, in first-seen order. Alias keys
 * (merged by slug) resolve to the surviving group. Also indexes which groups
 * reference a record.
 */
class GroupMap {
public:
    using GroupPtr = std::shared_ptr<GroupBySource const>;

    [[nodiscard]] auto size() const -> std::size_t { return this->groups_.size(); }
    [[nodiscard]] auto empty() const -> bool { return this->groups_.empty(); }
    [[nodiscard]] auto begin() const { return this->groups_.begin(); }
    [[nodiscard]] auto end() const { return this->groups_.end(); }
    [[nodiscard]] auto groups() const -> std::vector<GroupPtr> const& { return this->groups_; }

    // MissingKey if no group has (or aliases) this key.
    auto at(std::string_view key) const -> Expected<GroupPtr>;
    [[nodiscard]] auto find(std::string_view key) const -> GroupPtr;
    [[nodiscard]] auto contains(std::string_view key) const -> bool { return this->find(key) != nullptr; }
    [[nodiscard]] auto keys() const -> std::vector<std::string>;

    // Groups with a child occurrence on `recordPath`, in group order.
    [[nodiscard]] auto referencing(std::string_view recordPath) const -> std::vector<GroupPtr>;

private:
    friend class Aggregator;

    std::vector<GroupPtr>                                        groups_;
    std::map<std::string, std::size_t, std::less<>>              index_;
    std::map<std::string, std::vector<std::size_t>, std::less<>> backrefs_;
};

} // namespace GB
