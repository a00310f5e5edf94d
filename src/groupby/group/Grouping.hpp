#pragma once
#include "content/Value.hpp"
#include "core/Error.hpp"
#include "group/GroupBySource.hpp"
#include "scan/FieldOccurrence.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace GB {

// One key produced by a grouping callback, optionally with a per-child extra value.
struct KeyYield {
    KeyYield(Value keyObj)
        : keyObj(std::move(keyObj)) {}
    KeyYield(std::string keyObj)
        : keyObj(std::move(keyObj)) {}
    KeyYield(char const* keyObj)
        : keyObj(std::string(keyObj)) {}
    KeyYield(Value keyObj, Value extra)
        : keyObj(std::move(keyObj)), extra(std::move(extra)) {}

    Value                keyObj;
    std::optional<Value> extra;
};

/**
 * Handle on the group a key was just merged into. Valid only inside
 * GroupingCallback::onResolved; the group is not finalized yet, so children
 * ordering and pagination are not available.
 */
class GroupHandle {
public:
    GroupHandle(GroupBySource& group, GroupChild& child, std::optional<std::string> urlPath)
        : group_(group), child_(child), urlPath_(std::move(urlPath)) {}

    [[nodiscard]] auto key() const -> std::string const& { return this->group_.key_; }
    [[nodiscard]] auto keyObj() const -> Value const& { return this->group_.keyObj_; }
    // Known up front only when the slug is a "{key}" template.
    [[nodiscard]] auto urlPath() const -> std::optional<std::string> const& { return this->urlPath_; }

    auto setAttribute(std::string name, Value value) -> void { this->group_.attributes_.insert_or_assign(std::move(name), std::move(value)); }
    auto addExtra(Value value) -> void { this->child_.extras.push_back(std::move(value)); }

private:
    GroupBySource&             group_;
    GroupChild&                child_;
    std::optional<std::string> urlPath_;
};

/**
 * Two-phase grouping callback.
 *
 * produceKeys() returns the raw key objects of one occurrence (zero keys: the
 * occurrence joins no group). Each key is resolved and merged right away and
 * onResolved() is called for it before the next key is processed, so the
 * callback can rewrite the occurrence's record using the final key.
 *
 * Both run on the building thread only. Returning an error, or throwing a
 * std::exception, fails the whole build with Error::Code::CallbackError.
 */
class GroupingCallback {
public:
    virtual ~GroupingCallback() = default;

    virtual auto produceKeys(FieldOccurrence const& occurrence) -> Expected<std::vector<KeyYield>> = 0;
    virtual auto onResolved(FieldOccurrence& occurrence, KeyYield const& yielded, GroupHandle& group) -> Expected<void> {
        (void)occurrence;
        (void)yielded;
        (void)group;
        return {};
    }
    // Called once after the last occurrence of a build.
    virtual auto onBuildFinished() -> void {}
};

class FunctionGrouping final : public GroupingCallback {
public:
    using ProduceFn  = std::function<Expected<std::vector<KeyYield>>(FieldOccurrence const&)>;
    using ResolvedFn = std::function<Expected<void>(FieldOccurrence&, KeyYield const&, GroupHandle&)>;

    explicit FunctionGrouping(ProduceFn produce, ResolvedFn resolved = {})
        : produce_(std::move(produce)), resolved_(std::move(resolved)) {}

    auto produceKeys(FieldOccurrence const& occurrence) -> Expected<std::vector<KeyYield>> override;
    auto onResolved(FieldOccurrence& occurrence, KeyYield const& yielded, GroupHandle& group) -> Expected<void> override;

private:
    ProduceFn  produce_;
    ResolvedFn resolved_;
};

/**
 * Default callback used by quick config sections:
 * - non-empty strings are split on `split` (whitespace stripped) or yielded whole
 * - booleans and numbers yield themselves
 * - string lists yield each entry
 * - empty values yield a single null key
 */
auto makeSplitGrouping(std::optional<std::string> split) -> std::shared_ptr<GroupingCallback>;

} // namespace GB
