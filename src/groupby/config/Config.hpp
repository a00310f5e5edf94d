#pragma once
#include "core/Error.hpp"
#include "expr/Expression.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace GB {

struct PaginationConfig {
    bool        enabled   = false;
    std::size_t perPage   = 20;
    std::string urlSuffix = "page";
};

struct OrderKey {
    std::string field;
    bool        descending = false;

    bool operator==(OrderKey const&) const = default;
};

// "-date, title" -> {date desc, title asc}. Names must be [A-Za-z0-9_]+.
auto parseOrderBy(std::string_view text) -> Expected<std::vector<OrderKey>>;

/**
 * Settings of one watched attribute.
 *
 * JSON layout (all keys optional):
 *   {
 *     "root": "/blog", "slug": "tag/{key}/", "template": "tag.html",
 *     "split": ",", "enabled": true, "key_obj_fn": "...", "replace_none_key": "untagged",
 *     "fields":     {"title": "'Tag: ' ~ this.key_obj"},
 *     "key_map":    {"Blog": "News"},
 *     "children":   {"order_by": "-date, title"},
 *     "pagination": {"enabled": true, "per_page": 5, "url_suffix": "page"},
 *     "dependencies": ["templates/tag.html"]
 *   }
 *
 * A null "slug" makes the groups non-addressable. Strings in "fields" are
 * expressions; other JSON scalars are literals.
 */
struct Config {
    std::string                                     attribute;
    std::string                                     root = "/";
    std::optional<std::string>                      slug;
    std::string                                     templateName;
    std::optional<std::string>                      split;
    bool                                            enabled = true;
    std::optional<std::string>                      keyObjFn;
    std::optional<std::string>                      replaceNoneKey;
    std::vector<std::pair<std::string, FieldExpr>>  fields;
    std::map<std::string, std::string, std::less<>> keyMap;
    std::vector<OrderKey>                           orderBy;
    PaginationConfig                                pagination;
    std::set<std::string>                           dependencies;

    // Defaults: slug "<attribute>/{key}/index.html", template "groupby-<attribute>.html".
    static auto make(std::string attribute) -> Config;
    static auto fromJson(std::string attribute, nlohmann::json const& section) -> Expected<Config>;
    // Reads the section named `attribute` from a JSON config file and records the file as a dependency.
    static auto fromFile(std::string attribute, std::filesystem::path const& file) -> Expected<Config>;

    // Renames the attribute. Slug and template still at the old attribute's
    // defaults (or unset on an unnamed Config) follow the new name.
    auto rebind(std::string attribute) -> void;

    // Syntax check of every expression (key_obj_fn, non-"{key}" slug, field expressions).
    auto validate(ExpressionEvaluator const& evaluator) const -> Expected<void>;

    [[nodiscard]] auto field(std::string_view name) const -> FieldExpr const*;
    [[nodiscard]] auto isSlugTemplate() const -> bool;
};

auto loadConfigFile(std::filesystem::path const& file) -> Expected<nlohmann::json>;

// Read-only projection of a Config for expressions (`config.root`, `config.dependencies`, ...).
class ConfigScope final : public ExprObject {
public:
    explicit ConfigScope(Config const& config)
        : config_(config) {}
    auto lookup(std::string_view name) const -> Expected<Value> override;

private:
    Config const& config_;
};

auto configError(std::string_view attribute, std::string_view field, std::string_view value, std::string_view reason) -> Error;

} // namespace GB
