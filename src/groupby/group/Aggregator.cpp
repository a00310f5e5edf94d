#include "Aggregator.hpp"

#include "key/KeyResolver.hpp"
#include "log/TaggedLogger.hpp"
#include "path/UrlUtils.hpp"
#include "scan/Scanner.hpp"

#include <algorithm>
#include <exception>

namespace GB {

namespace {

auto replaceAll(std::string text, std::string_view token, std::string_view replacement) -> std::string {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), replacement);
        pos += replacement.size();
    }
    return text;
}

// Slugs without an extension in their last component name a directory.
auto directorySlug(std::string slug) -> std::string {
    if (slug.empty() || slug.back() == '/')
        return slug;
    auto const lastSlash = slug.rfind('/');
    auto const lastDot   = slug.rfind('.');
    if (lastDot == std::string::npos || (lastSlash != std::string::npos && lastDot < lastSlash))
        slug.push_back('/');
    return slug;
}

auto callbackError(std::string const& attribute, std::string_view stage, std::string_view what) -> Error {
    return Error{Error::Code::CallbackError, "grouping callback of '" + attribute + "' failed in " + std::string(stage) + ": " + std::string(what)};
}

} // namespace

Aggregator::Aggregator(ContentTree const& tree, std::shared_ptr<Config const> config, ExpressionEvaluator const& evaluator, SlugifyFn slugifyFn)
    : tree_(tree), config_(std::move(config)), evaluator_(evaluator), slugify_(slugifyFn ? std::move(slugifyFn) : SlugifyFn{&slugify}) {}

auto Aggregator::aggregate(GroupingCallback& callback, bool flatten) -> Expected<AggregateResult> {
    this->groups_.clear();
    this->byKey_.clear();

    AggregateResult result;
    Scanner         scanner{this->tree_, this->config_->attribute, flatten};
    auto            scanned = scanner.scan(this->config_->root, [&](FieldOccurrence& occurrence) -> Expected<void> {
        ++result.occurrences;
        return this->handleOccurrence(callback, occurrence, result);
    });
    if (!scanned) {
        gb_log("Build of '" + this->config_->attribute + "' failed: " + describeError(scanned.error()), "Aggregator", "Error");
        return std::unexpected(scanned.error());
    }
    try {
        callback.onBuildFinished();
    } catch (std::exception const& e) {
        return std::unexpected(callbackError(this->config_->attribute, "onBuildFinished", e.what()));
    }

    result.scannedRecords = scanner.visitedRecords();
    for (auto const& dep : this->config_->dependencies)
        result.dependencies.insert(dep);
    if (!this->config_->templateName.empty())
        result.dependencies.insert(this->config_->templateName);
    for (auto const& path : result.scannedRecords) {
        if (auto record = this->tree_.get(path)) {
            for (auto& source : record->sourceFilenames())
                result.dependencies.insert(std::move(source));
        }
    }

    if (auto ok = this->finish(result); !ok)
        return std::unexpected(ok.error());
    return result;
}

auto Aggregator::handleOccurrence(GroupingCallback& callback, FieldOccurrence& occurrence, AggregateResult& result) -> Expected<void> {
    ++result.callbackInvocations;
    Expected<std::vector<KeyYield>> produced = std::vector<KeyYield>{};
    try {
        produced = callback.produceKeys(occurrence);
    } catch (std::exception const& e) {
        return std::unexpected(callbackError(this->config_->attribute, occurrence.record->path(), e.what()));
    }
    if (!produced) {
        if (produced.error().code == Error::Code::CallbackError || produced.error().code == Error::Code::InvalidYield)
            return std::unexpected(produced.error());
        return std::unexpected(callbackError(this->config_->attribute, occurrence.record->path(), describeError(produced.error())));
    }

    KeyResolver resolver{*this->config_, this->evaluator_, this->slugify_};
    for (auto const& yielded : *produced) {
        auto resolved = resolver.resolve(yielded.keyObj, &occurrence);
        if (!resolved)
            return std::unexpected(resolved.error());

        GroupPtr group;
        if (auto it = this->byKey_.find(resolved->key); it != this->byKey_.end()) {
            group = this->groups_[it->second];
        } else {
            group = std::make_shared<GroupBySource>(this->config_, resolved->key, std::move(resolved->keyObj));
            this->byKey_.emplace(resolved->key, this->groups_.size());
            this->groups_.push_back(group);
        }

        auto const& recordPath = occurrence.record->path();
        auto        childIt    = group->childIndex_.find(recordPath);
        if (childIt == group->childIndex_.end()) {
            childIt = group->childIndex_.emplace(recordPath, group->children_.size()).first;
            group->children_.push_back(GroupChild{occurrence.record, {}, {}, {}});
        }
        auto& child = group->children_[childIt->second];
        child.keyObjs.push_back(yielded.keyObj);
        child.occurrences.push_back(occurrence.key);
        if (yielded.extra)
            child.extras.push_back(*yielded.extra);

        std::optional<std::string> urlPath;
        if (this->config_->isSlugTemplate())
            urlPath = canonical_url(build_url({this->config_->root, this->substituteSlug(group->key_)}));
        GroupHandle handle{*group, child, std::move(urlPath)};
        try {
            if (auto ok = callback.onResolved(occurrence, yielded, handle); !ok) {
                if (ok.error().code == Error::Code::CallbackError)
                    return std::unexpected(ok.error());
                return std::unexpected(callbackError(this->config_->attribute, recordPath, describeError(ok.error())));
            }
        } catch (std::exception const& e) {
            return std::unexpected(callbackError(this->config_->attribute, recordPath, e.what()));
        }
    }
    return {};
}

auto Aggregator::substituteSlug(std::string const& key) const -> std::string {
    auto slug = replaceAll(*this->config_->slug, "{key}", key);
    slug      = replaceAll(std::move(slug), "{attrib}", this->config_->attribute);
    return directorySlug(std::move(slug));
}

auto Aggregator::computeSlug(GroupBySource const& group) const -> Expected<std::optional<std::string>> {
    if (!this->config_->slug)
        return std::optional<std::string>{};
    if (this->config_->isSlugTemplate())
        return std::optional<std::string>{this->substituteSlug(group.key())};

    GroupScope  self{group, this->evaluator_};
    ConfigScope config{*this->config_};
    auto        context = group.makeContext(self, config);
    std::optional<RecordScope> anchor;
    if (group.anchor_) {
        anchor.emplace(*group.anchor_);
        context.record = &*anchor;
    }
    auto value = this->evaluator_.evaluate(*this->config_->slug, context);
    if (!value)
        return std::unexpected(configError(this->config_->attribute, "slug", *this->config_->slug, describeError(value.error())));
    if (!isScalar(*value))
        return std::unexpected(configError(this->config_->attribute, "slug", *this->config_->slug,
                                           "evaluates to a " + std::string(valueTypeName(*value))));
    auto text = std::string(strip(toString(*value)));
    if (text.empty())
        return std::optional<std::string>{};
    return std::optional<std::string>{directorySlug(std::move(text))};
}

auto Aggregator::sortChildren(GroupBySource& group) const -> void {
    auto const& orderBy = this->config_->orderBy;
    if (!orderBy.empty()) {
        std::stable_sort(group.children_.begin(), group.children_.end(), [&](GroupChild const& a, GroupChild const& b) {
            for (auto const& order : orderBy) {
                // Missing values sort as null, before everything else.
                auto const cmp = compareValues(a.record->field(order.field), b.record->field(order.field));
                if (cmp != 0)
                    return order.descending ? cmp > 0 : cmp < 0;
            }
            return false;
        });
    }
    group.childIndex_.clear();
    for (std::size_t i = 0; i < group.children_.size(); ++i)
        group.childIndex_.emplace(group.children_[i].record->path(), i);
}

auto Aggregator::mergeInto(GroupBySource& target, GroupBySource& source) const -> void {
    target.aliases_.push_back(source.key_);
    for (auto const& alias : source.aliases_)
        target.aliases_.push_back(alias);
    for (auto& child : source.children_) {
        auto it = target.childIndex_.find(child.record->path());
        if (it == target.childIndex_.end()) {
            target.childIndex_.emplace(child.record->path(), target.children_.size());
            target.children_.push_back(std::move(child));
            continue;
        }
        auto& existing = target.children_[it->second];
        existing.keyObjs.insert(existing.keyObjs.end(), child.keyObjs.begin(), child.keyObjs.end());
        existing.occurrences.insert(existing.occurrences.end(), child.occurrences.begin(), child.occurrences.end());
        existing.extras.insert(existing.extras.end(), child.extras.begin(), child.extras.end());
    }
    for (auto& [name, value] : source.attributes_)
        target.attributes_.emplace(name, value);
}

auto Aggregator::finish(AggregateResult& result) -> Expected<void> {
    auto anchor = this->tree_.get(this->config_->root);
    for (auto& group : this->groups_) {
        group->anchor_ = anchor;
        this->sortChildren(*group);
    }

    std::vector<GroupPtr>                           survivors;
    std::map<std::string, std::size_t, std::less<>> bySlug;
    std::set<std::size_t>                           merged;
    for (auto& group : this->groups_) {
        auto slug = this->computeSlug(*group);
        if (!slug)
            return std::unexpected(slug.error());
        group->slug_ = std::move(*slug);
        if (group->slug_) {
            if (auto it = bySlug.find(*group->slug_); it != bySlug.end()) {
                gb_log("Key '" + group->key_ + "' of '" + this->config_->attribute + "' reuses slug " + *group->slug_ + " of '" + survivors[it->second]->key_ + "'", "Aggregator", "Warning");
                this->mergeInto(*survivors[it->second], *group);
                merged.insert(it->second);
                continue;
            }
            bySlug.emplace(*group->slug_, survivors.size());
        }
        survivors.push_back(group);
    }
    for (auto idx : merged)
        this->sortChildren(*survivors[idx]);

    auto& map = result.groups;
    for (std::size_t i = 0; i < survivors.size(); ++i) {
        auto const& group = survivors[i];
        map.groups_.push_back(group);
        map.index_.emplace(group->key_, i);
        for (auto const& alias : group->aliases_)
            map.index_.emplace(alias, i);
        for (auto const& child : group->children_) {
            auto& refs = map.backrefs_[child.record->path()];
            if (refs.empty() || refs.back() != i)
                refs.push_back(i);
        }
    }
    gb_log("Built " + std::to_string(map.size()) + " groups for '" + this->config_->attribute + "' under " + this->config_->root, "Aggregator");
    return {};
}

} // namespace GB
