#pragma once

#include "content/ContentTree.hpp"
#include "content/Record.hpp"
#include "content/Schema.hpp"
#include "content/Value.hpp"

#include <doctest/doctest.h>

#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace GB::test {

inline auto flagged(std::string name, FieldType type, std::string attribute) -> FieldDef {
    FieldDef field;
    field.name = std::move(name);
    field.type = type;
    field.options.emplace(std::move(attribute), "true");
    return field;
}

inline auto plain(std::string name, FieldType type = FieldType::Text) -> FieldDef {
    FieldDef field;
    field.name = std::move(name);
    field.type = type;
    return field;
}

inline auto strings(std::initializer_list<char const*> items) -> Value {
    std::vector<std::string> out;
    for (auto const* item : items)
        out.emplace_back(item);
    return Value{std::move(out)};
}

inline auto text(char const* value) -> Value {
    return Value{std::string(value)};
}

inline auto flow(std::vector<FlowBlock> blocks) -> Value {
    auto f    = std::make_shared<Flow>();
    f->blocks = std::move(blocks);
    return Value{std::move(f)};
}

/**
 * Schema used across the suites:
 *   page       title
 *   blog-post  title, date, tags (strings, #tags), category (#category),
 *              body (flow of "text" and "gallery" blocks)
 *   text block body, labels (#labels)
 *   gallery    caption
 */
inline auto makeBlogSchema() -> std::shared_ptr<Schema> {
    auto schema = std::make_shared<Schema>();
    schema->addFlowBlock(FlowBlockModel{"text", {plain("body", FieldType::Markdown), flagged("labels", FieldType::Text, "labels")}});
    schema->addFlowBlock(FlowBlockModel{"gallery", {plain("caption")}});
    schema->addModel(Model{"page", {plain("title")}});
    schema->addModel(Model{"blog-post",
                           {plain("title"),
                            plain("date"),
                            flagged("tags", FieldType::Strings, "tags"),
                            flagged("category", FieldType::Text, "category"),
                            plain("body", FieldType::Flow)}});
    return schema;
}

// "/" and "/blog" pages over the blog schema; posts are added per test.
struct BlogSite {
    BlogSite()
        : tree(makeBlogSchema()) {
        this->add("/", "page", {{"title", text("Home")}});
        this->add("/blog", "page", {{"title", text("Blog")}});
    }

    auto add(std::string path, std::string model, Record::Fields fields) -> std::shared_ptr<Record> {
        auto record = std::make_shared<Record>(std::move(path), std::move(model), std::move(fields));
        auto added  = this->tree.add(record);
        REQUIRE(added.has_value());
        return record;
    }

    auto post(std::string path, Record::Fields fields) -> std::shared_ptr<Record> {
        return this->add(std::move(path), "blog-post", std::move(fields));
    }

    ContentTree tree;
};

} // namespace GB::test
