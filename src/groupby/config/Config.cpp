#include "Config.hpp"

#include "content/Schema.hpp"
#include "log/TaggedLogger.hpp"
#include "path/UrlUtils.hpp"
#include "util/Slugify.hpp"

#include <cctype>
#include <charconv>
#include <fstream>

namespace GB {

namespace {

using json = nlohmann::json;

auto readString(std::string_view attribute, json const& section, char const* key, std::optional<std::string>& out) -> Expected<void> {
    auto it = section.find(key);
    if (it == section.end())
        return {};
    if (it->is_null()) {
        out.reset();
        return {};
    }
    if (!it->is_string())
        return std::unexpected(configError(attribute, key, it->dump(), "expected a string"));
    out = it->get<std::string>();
    return {};
}

auto readBool(std::string_view attribute, json const& value, std::string_view key) -> Expected<bool> {
    if (value.is_boolean())
        return value.get<bool>();
    if (value.is_string()) {
        if (auto parsed = boolFromString(value.get<std::string>()))
            return *parsed;
    }
    return std::unexpected(configError(attribute, key, value.dump(), "expected a boolean"));
}

auto readPositive(std::string_view attribute, json const& value, std::string_view key) -> Expected<std::size_t> {
    if (value.is_number_integer() && value.get<std::int64_t>() > 0)
        return static_cast<std::size_t>(value.get<std::int64_t>());
    if (value.is_string()) {
        auto const  text   = value.get<std::string>();
        std::size_t parsed = 0;
        auto [end, ec]     = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec == std::errc{} && end == text.data() + text.size() && parsed > 0)
            return parsed;
    }
    return std::unexpected(configError(attribute, key, value.dump(), "expected a positive integer"));
}

auto literalFromJson(json const& value) -> std::optional<Value> {
    if (value.is_null())
        return Value{};
    if (value.is_boolean())
        return Value{value.get<bool>()};
    if (value.is_number_integer())
        return Value{value.get<std::int64_t>()};
    if (value.is_number_float())
        return Value{value.get<double>()};
    if (value.is_array()) {
        std::vector<std::string> items;
        for (auto const& item : value) {
            if (!item.is_string())
                return std::nullopt;
            items.push_back(item.get<std::string>());
        }
        return Value{std::move(items)};
    }
    return std::nullopt;
}

} // namespace

auto configError(std::string_view attribute, std::string_view field, std::string_view value, std::string_view reason) -> Error {
    std::string message = "invalid config for [";
    message.append(attribute).append(".").append(field).append("] = \"").append(value).append("\": ").append(reason);
    gb_log(message, "Config", "ERROR");
    return Error{Error::Code::ConfigError, std::move(message)};
}

auto parseOrderBy(std::string_view text) -> Expected<std::vector<OrderKey>> {
    std::vector<OrderKey> keys;
    for (auto const& item : split_strip(text, ",")) {
        OrderKey         key;
        std::string_view name = item;
        if (name.front() == '-' || name.front() == '+') {
            key.descending = name.front() == '-';
            name.remove_prefix(1);
        }
        if (name.empty())
            return std::unexpected(Error{Error::Code::ConfigError, "empty order_by key in '" + std::string(text) + "'"});
        for (unsigned char ch : name) {
            if (!std::isalnum(ch) && ch != '_')
                return std::unexpected(Error{Error::Code::ConfigError, "invalid order_by key '" + item + "'"});
        }
        key.field = std::string(name);
        keys.push_back(std::move(key));
    }
    return keys;
}

auto Config::make(std::string attribute) -> Config {
    Config config;
    config.slug         = attribute + "/{key}/index.html";
    config.templateName = "groupby-" + attribute + ".html";
    config.attribute    = std::move(attribute);
    return config;
}

auto Config::rebind(std::string attribute) -> void {
    auto const previous = Config::make(this->attribute);
    auto const next     = Config::make(attribute);
    if (this->slug == previous.slug || (this->attribute.empty() && !this->slug))
        this->slug = next.slug;
    if (this->templateName == previous.templateName || this->templateName.empty())
        this->templateName = next.templateName;
    this->attribute = std::move(attribute);
}

auto Config::fromJson(std::string attribute, json const& section) -> Expected<Config> {
    if (attribute.empty())
        return std::unexpected(Error{Error::Code::ConfigError, "attribute name must not be empty"});
    auto config = Config::make(attribute);
    if (section.is_null())
        return config;
    if (!section.is_object())
        return std::unexpected(configError(attribute, "", section.dump(), "expected a mapping"));

    std::optional<std::string> root;
    std::optional<std::string> templateName;
    for (auto const& [key, target] : {std::pair<char const*, std::optional<std::string>*>{"root", &root},
                                      {"template", &templateName},
                                      {"split", &config.split},
                                      {"key_obj_fn", &config.keyObjFn},
                                      {"replace_none_key", &config.replaceNoneKey}}) {
        if (auto ok = readString(attribute, section, key, *target); !ok)
            return std::unexpected(ok.error());
    }
    if (auto ok = readString(attribute, section, "slug", config.slug); !ok)
        return std::unexpected(ok.error());
    if (config.slug && config.slug->empty())
        config.slug.reset();
    if (root)
        config.root = normalize_path(*root);
    if (templateName && !templateName->empty())
        config.templateName = *templateName;
    if (config.split && config.split->empty())
        config.split.reset();

    if (auto it = section.find("enabled"); it != section.end()) {
        auto enabled = readBool(attribute, *it, "enabled");
        if (!enabled)
            return std::unexpected(enabled.error());
        config.enabled = *enabled;
    }

    if (auto it = section.find("fields"); it != section.end() && !it->is_null()) {
        if (!it->is_object())
            return std::unexpected(configError(attribute, "fields", it->dump(), "expected a mapping"));
        for (auto const& [name, value] : it->items()) {
            if (value.is_string()) {
                config.fields.emplace_back(name, FieldExpr::expression(value.get<std::string>()));
            } else if (auto literal = literalFromJson(value)) {
                config.fields.emplace_back(name, FieldExpr::literal(std::move(*literal)));
            } else {
                return std::unexpected(configError(attribute, "fields." + name, value.dump(), "unsupported field value"));
            }
        }
    }

    if (auto it = section.find("key_map"); it != section.end() && !it->is_null()) {
        if (!it->is_object())
            return std::unexpected(configError(attribute, "key_map", it->dump(), "expected a mapping"));
        for (auto const& [from, to] : it->items()) {
            if (!to.is_string())
                return std::unexpected(configError(attribute, "key_map." + from, to.dump(), "expected a string"));
            config.keyMap.insert_or_assign(from, to.get<std::string>());
        }
    }

    if (auto it = section.find("children"); it != section.end() && !it->is_null()) {
        if (!it->is_object())
            return std::unexpected(configError(attribute, "children", it->dump(), "expected a mapping"));
        if (auto ob = it->find("order_by"); ob != it->end() && !ob->is_null()) {
            std::string joined;
            if (ob->is_string()) {
                joined = ob->get<std::string>();
            } else if (ob->is_array()) {
                for (auto const& item : *ob) {
                    if (!item.is_string())
                        return std::unexpected(configError(attribute, "children.order_by", ob->dump(), "expected strings"));
                    if (!joined.empty())
                        joined += ',';
                    joined += item.get<std::string>();
                }
            } else {
                return std::unexpected(configError(attribute, "children.order_by", ob->dump(), "expected a string or list"));
            }
            auto keys = parseOrderBy(joined);
            if (!keys)
                return std::unexpected(configError(attribute, "children.order_by", joined, *keys.error().message));
            config.orderBy = std::move(*keys);
        }
    }

    if (auto it = section.find("pagination"); it != section.end() && !it->is_null()) {
        if (!it->is_object())
            return std::unexpected(configError(attribute, "pagination", it->dump(), "expected a mapping"));
        if (auto en = it->find("enabled"); en != it->end() && !en->is_null()) {
            auto enabled = readBool(attribute, *en, "pagination.enabled");
            if (!enabled)
                return std::unexpected(enabled.error());
            config.pagination.enabled = *enabled;
        }
        if (auto pp = it->find("per_page"); pp != it->end() && !pp->is_null()) {
            auto perPage = readPositive(attribute, *pp, "pagination.per_page");
            if (!perPage)
                return std::unexpected(perPage.error());
            config.pagination.perPage = *perPage;
        }
        if (auto us = it->find("url_suffix"); us != it->end() && !us->is_null()) {
            if (!us->is_string() || us->get<std::string>().empty() || us->get<std::string>().find('/') != std::string::npos)
                return std::unexpected(configError(attribute, "pagination.url_suffix", us->dump(), "expected a non-empty path segment"));
            config.pagination.urlSuffix = us->get<std::string>();
        }
    }

    if (auto it = section.find("dependencies"); it != section.end() && !it->is_null()) {
        if (!it->is_array())
            return std::unexpected(configError(attribute, "dependencies", it->dump(), "expected a list"));
        for (auto const& dep : *it) {
            if (!dep.is_string())
                return std::unexpected(configError(attribute, "dependencies", dep.dump(), "expected a string"));
            config.dependencies.insert(dep.get<std::string>());
        }
    }
    return config;
}

auto loadConfigFile(std::filesystem::path const& file) -> Expected<json> {
    std::ifstream stream(file);
    if (!stream)
        return std::unexpected(Error{Error::Code::IoError, "cannot open config file " + file.string()});
    auto parsed = json::parse(stream, nullptr, false);
    if (parsed.is_discarded())
        return std::unexpected(Error{Error::Code::ConfigError, "malformed JSON in " + file.string()});
    if (!parsed.is_object())
        return std::unexpected(Error{Error::Code::ConfigError, "config file " + file.string() + " must hold a mapping"});
    return parsed;
}

auto Config::fromFile(std::string attribute, std::filesystem::path const& file) -> Expected<Config> {
    auto document = loadConfigFile(file);
    if (!document)
        return std::unexpected(document.error());
    json section;
    if (auto it = document->find(attribute); it != document->end())
        section = *it;
    auto config = Config::fromJson(std::move(attribute), section);
    if (config)
        config->dependencies.insert(file.string());
    return config;
}

auto Config::validate(ExpressionEvaluator const& evaluator) const -> Expected<void> {
    if (this->keyObjFn) {
        if (auto ok = evaluator.validate(*this->keyObjFn); !ok)
            return std::unexpected(configError(this->attribute, "key_obj_fn", *this->keyObjFn, *ok.error().message));
    }
    if (this->slug && !this->isSlugTemplate()) {
        if (auto ok = evaluator.validate(*this->slug); !ok)
            return std::unexpected(configError(this->attribute, "slug", *this->slug, *ok.error().message));
    }
    for (auto const& [name, expr] : this->fields) {
        if (!expr.isExpression())
            continue;
        if (auto ok = evaluator.validate(expr.source()); !ok)
            return std::unexpected(configError(this->attribute, "fields." + name, expr.source(), *ok.error().message));
    }
    return {};
}

auto Config::field(std::string_view name) const -> FieldExpr const* {
    for (auto const& [key, expr] : this->fields) {
        if (key == name)
            return &expr;
    }
    return nullptr;
}

auto Config::isSlugTemplate() const -> bool {
    return this->slug && (this->slug->find("{key}") != std::string::npos || this->slug->find("{attrib}") != std::string::npos);
}

auto ConfigScope::lookup(std::string_view name) const -> Expected<Value> {
    auto const& c = this->config_;
    if (name == "key" || name == "attribute")
        return Value{c.attribute};
    if (name == "root")
        return Value{c.root};
    if (name == "slug")
        return c.slug ? Value{*c.slug} : Value{};
    if (name == "template")
        return Value{c.templateName};
    if (name == "split")
        return c.split ? Value{*c.split} : Value{};
    if (name == "enabled")
        return Value{c.enabled};
    if (name == "replace_none_key")
        return c.replaceNoneKey ? Value{*c.replaceNoneKey} : Value{};
    if (name == "per_page")
        return Value{static_cast<std::int64_t>(c.pagination.perPage)};
    if (name == "dependencies")
        return Value{std::vector<std::string>(c.dependencies.begin(), c.dependencies.end())};
    return std::unexpected(Error{Error::Code::NotFound, "config has no attribute '" + std::string(name) + "'"});
}

} // namespace GB
