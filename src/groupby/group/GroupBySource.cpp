#include "GroupBySource.hpp"

#include "group/Pagination.hpp"
#include "path/UrlUtils.hpp"

#include <algorithm>

namespace GB {

namespace {

constexpr int MaxFieldDepth = 16;

thread_local int fieldDepth = 0;

struct DepthGuard {
    DepthGuard() { ++fieldDepth; }
    ~DepthGuard() { --fieldDepth; }
};

} // namespace

auto GroupPage::children() const -> std::span<GroupChild const> {
    return this->source->pageChildren(this->pageNum);
}

auto GroupPage::urlPath() const -> std::optional<std::string> {
    return this->source->pageUrl(this->pageNum);
}

auto GroupPage::slug() const -> std::optional<std::string> {
    return this->source->pageSlug(this->pageNum);
}

auto GroupPage::pageCount() const -> std::size_t {
    return this->source->pageCount();
}

GroupBySource::GroupBySource(std::shared_ptr<Config const> config, std::string key, Value keyObj)
    : config_(std::move(config)), key_(std::move(key)), keyObj_(std::move(keyObj)) {}

auto GroupBySource::urlPath() const -> std::optional<std::string> {
    return this->pageUrl(1);
}

auto GroupBySource::path() const -> std::string {
    auto base = this->config_->root == "/" ? std::string{} : this->config_->root;
    return base + std::string(VirtualPathTag) + "/" + this->config_->attribute + "/" + this->key_;
}

auto GroupBySource::firstChild() const -> std::shared_ptr<Record> {
    if (this->children_.empty())
        return nullptr;
    return this->children_.front().record;
}

auto GroupBySource::firstExtra() const -> std::optional<Value> {
    if (this->children_.empty() || this->children_.front().extras.empty())
        return std::nullopt;
    return this->children_.front().extras.front();
}

auto GroupBySource::hasChild(std::string_view recordPath) const -> bool {
    return this->childIndex_.contains(recordPath);
}

auto GroupBySource::attributeValue(std::string_view name) const -> std::optional<Value> {
    auto it = this->attributes_.find(name);
    if (it == this->attributes_.end())
        return std::nullopt;
    return it->second;
}

auto GroupBySource::makeContext(ExprObject const& self, ExprObject const& config) const -> ExprContext {
    ExprContext context;
    context.self   = &self;
    context.config = &config;
    return context;
}

auto GroupBySource::field(std::string_view name, ExpressionEvaluator const& evaluator) const -> Expected<Value> {
    auto const* expr = this->config_->field(name);
    if (!expr)
        return std::unexpected(Error{Error::Code::NotFound, "group '" + this->key_ + "' has no field '" + std::string(name) + "'"});
    if (fieldDepth >= MaxFieldDepth)
        return std::unexpected(Error{Error::Code::ExpressionError, "recursive evaluation of field '" + std::string(name) + "'"});
    DepthGuard  guard;
    GroupScope  self{*this, evaluator};
    ConfigScope config{*this->config_};
    auto        context = this->makeContext(self, config);
    std::optional<RecordScope> anchor;
    if (this->anchor_) {
        anchor.emplace(*this->anchor_);
        context.record = &*anchor;
    }
    return expr->evaluate(context, evaluator);
}

auto GroupBySource::lookup(std::string_view name, ExpressionEvaluator const& evaluator) const -> Expected<Value> {
    if (name == "key")
        return Value{this->key_};
    if (name == "key_obj")
        return this->keyObj_;
    if (name == "attribute")
        return Value{this->config_->attribute};
    if (name == "slug")
        return this->slug_ ? Value{*this->slug_} : Value{};
    if (name == "url_path") {
        auto url = this->urlPath();
        return url ? Value{*url} : Value{};
    }
    if (name == "path")
        return Value{this->path()};
    if (name == "template")
        return Value{this->config_->templateName};
    if (name == "count")
        return Value{static_cast<std::int64_t>(this->children_.size())};
    if (name == "children") {
        std::vector<std::string> paths;
        paths.reserve(this->children_.size());
        for (auto const& child : this->children_)
            paths.push_back(child.record->path());
        return Value{std::move(paths)};
    }
    if (name == "first_child") {
        auto first = this->firstChild();
        return first ? Value{first->path()} : Value{};
    }
    if (name == "first_extra")
        return this->firstExtra().value_or(Value{});
    if (auto attr = this->attributeValue(name))
        return *attr;
    if (this->config_->field(name))
        return this->field(name, evaluator);
    return std::unexpected(Error{Error::Code::NotFound, "group '" + this->key_ + "' has no attribute '" + std::string(name) + "'"});
}

auto GroupBySource::pageCount() const -> std::size_t {
    if (!this->config_->pagination.enabled)
        return 1;
    return GB::pageCount(this->children_.size(), this->config_->pagination.perPage);
}

auto GroupBySource::page(std::size_t pageNum) const -> Expected<GroupPage> {
    if (pageNum < 1 || pageNum > this->pageCount())
        return std::unexpected(Error{Error::Code::NotFound,
                                     "group '" + this->key_ + "' has no page " + std::to_string(pageNum)});
    return GroupPage{this->shared_from_this(), pageNum};
}

auto GroupBySource::pageSlug(std::size_t pageNum) const -> std::optional<std::string> {
    if (!this->slug_ || pageNum < 1 || pageNum > this->pageCount())
        return std::nullopt;
    return paginatedSlug(*this->slug_, pageNum, this->config_->pagination.urlSuffix);
}

auto GroupBySource::pageUrl(std::size_t pageNum) const -> std::optional<std::string> {
    auto slug = this->pageSlug(pageNum);
    if (!slug)
        return std::nullopt;
    return canonical_url(build_url({this->config_->root, *slug}));
}

auto GroupBySource::pageChildren(std::size_t pageNum) const -> std::span<GroupChild const> {
    std::span<GroupChild const> all{this->children_};
    if (!this->config_->pagination.enabled)
        return pageNum == 1 ? all : std::span<GroupChild const>{};
    auto const perPage = this->config_->pagination.perPage;
    auto const start   = (pageNum - 1) * perPage;
    if (pageNum < 1 || start >= all.size())
        return {};
    return all.subspan(start, std::min(perPage, all.size() - start));
}

auto GroupMap::at(std::string_view key) const -> Expected<GroupPtr> {
    auto group = this->find(key);
    if (!group)
        return std::unexpected(Error{Error::Code::MissingKey, "no group with key '" + std::string(key) + "'"});
    return group;
}

auto GroupMap::find(std::string_view key) const -> GroupPtr {
    auto it = this->index_.find(key);
    if (it == this->index_.end())
        return nullptr;
    return this->groups_[it->second];
}

auto GroupMap::keys() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(this->groups_.size());
    for (auto const& group : this->groups_)
        out.push_back(group->key());
    return out;
}

auto GroupMap::referencing(std::string_view recordPath) const -> std::vector<GroupPtr> {
    std::vector<GroupPtr> out;
    auto                  it = this->backrefs_.find(recordPath);
    if (it == this->backrefs_.end())
        return out;
    out.reserve(it->second.size());
    for (auto idx : it->second)
        out.push_back(this->groups_[idx]);
    return out;
}

} // namespace GB
