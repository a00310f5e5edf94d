#include "group/Aggregator.hpp"
#include "../GroupByTestHelper.hpp"

#include <doctest/doctest.h>

#include <stdexcept>

using namespace GB;
using namespace GB::test;

namespace {

auto tagsUnderBlog() -> Config {
    auto config = Config::make("tags");
    config.root = "/blog";
    config.slug = "tags/{key}/index.html";
    return config;
}

auto aggregate(ContentTree const& tree, Config config, GroupingCallback& callback, bool flatten = true) -> Expected<AggregateResult> {
    Aggregator aggregator{tree, std::make_shared<Config const>(std::move(config)), *defaultEvaluator()};
    return aggregator.aggregate(callback, flatten);
}

auto aggregate(ContentTree const& tree, Config config) -> Expected<AggregateResult> {
    auto callback = makeSplitGrouping(config.split);
    return aggregate(tree, std::move(config), *callback);
}

auto childPaths(GroupBySource const& group) -> std::vector<std::string> {
    std::vector<std::string> paths;
    for (auto const& child : group.children())
        paths.push_back(child.record->path());
    return paths;
}

} // namespace

TEST_SUITE_BEGIN("group.aggregator");

TEST_CASE("tags under a root") {
    BlogSite site;
    site.post("/blog/p1", {{"title", text("One")}, {"tags", strings({"Awesome", "rust"})}});
    site.post("/blog/p2", {{"title", text("Two")}, {"tags", strings({"awesome"})}});

    auto result = aggregate(site.tree, tagsUnderBlog());
    REQUIRE(result.has_value());
    auto const& groups = result->groups;
    CHECK((groups.keys() == std::vector<std::string>{"awesome", "rust"}));

    auto awesome = groups.at("awesome");
    REQUIRE(awesome.has_value());
    CHECK((*awesome)->keyObj() == text("Awesome"));
    CHECK((*awesome)->urlPath() == "/blog/tags/awesome/");
    CHECK((*awesome)->slug() == "tags/awesome/index.html");
    CHECK((*awesome)->path() == "/blog@groupby/tags/awesome");
    CHECK((childPaths(**awesome) == std::vector<std::string>{"/blog/p1", "/blog/p2"}));
    CHECK((*awesome)->children()[1].keyObjs == std::vector<Value>{text("awesome")});

    auto rust = groups.find("rust");
    REQUIRE(rust != nullptr);
    CHECK(rust->childCount() == 1);
    CHECK(rust->urlPath() == "/blog/tags/rust/");

    CHECK(groups.at("missing").error().code == Error::Code::MissingKey);
    CHECK(groups.referencing("/blog/p1").size() == 2);
    CHECK(groups.referencing("/blog/p2").size() == 1);
    CHECK(groups.referencing("/blog").empty());

    CHECK(result->occurrences == 2);
    CHECK(result->callbackInvocations == 2);
    CHECK((result->scannedRecords == std::vector<std::string>{"/blog", "/blog/p1", "/blog/p2"}));
    CHECK(result->dependencies.contains("groupby-tags.html"));
    CHECK(result->dependencies.contains("/blog/p1"));
    CHECK_FALSE(result->dependencies.contains("/"));
}

TEST_CASE("one child per record") {
    BlogSite site;
    site.post("/blog/p1", {{"tags", strings({"rust", "Rust", "RUST"})}});

    auto result = aggregate(site.tree, tagsUnderBlog());
    REQUIRE(result.has_value());
    REQUIRE(result->groups.size() == 1);
    auto const& child = result->groups.groups()[0]->children().at(0);
    CHECK(result->groups.groups()[0]->childCount() == 1);
    CHECK(child.keyObjs.size() == 3);
    CHECK(child.occurrences.size() == 3);
}

TEST_CASE("keys that slugify alike share a group") {
    BlogSite site;
    site.post("/blog/p1", {{"tags", strings({"C#"})}});
    site.post("/blog/p2", {{"tags", strings({"c"})}});

    auto result = aggregate(site.tree, tagsUnderBlog());
    REQUIRE(result.has_value());
    REQUIRE(result->groups.size() == 1);
    auto group = result->groups.find("c");
    REQUIRE(group != nullptr);
    CHECK(group->childCount() == 2);
    CHECK(group->keyObj() == text("C#"));
}

TEST_CASE("key_map renames keys") {
    BlogSite site;
    site.post("/blog/p1", {{"category", text("Blog")}});
    auto config = Config::make("category");
    config.keyMap.emplace("Blog", "News");

    auto result = aggregate(site.tree, config);
    REQUIRE(result.has_value());
    CHECK((result->groups.keys() == std::vector<std::string>{"news"}));
    CHECK(result->groups.find("news")->urlPath() == "/category/news/");
}

TEST_CASE("no keys, no groups") {
    BlogSite site;
    site.post("/blog/p1", {{"tags", strings({"a"})}});

    FunctionGrouping nothing{[](FieldOccurrence const&) -> Expected<std::vector<KeyYield>> { return std::vector<KeyYield>{}; }};
    auto             result = aggregate(site.tree, tagsUnderBlog(), nothing);
    REQUIRE(result.has_value());
    CHECK(result->groups.empty());
    CHECK(result->occurrences == 1);

    BlogSite bare;
    auto     empty = aggregate(bare.tree, tagsUnderBlog());
    REQUIRE(empty.has_value());
    CHECK(empty->groups.empty());
}

TEST_CASE("empty values land in the none group") {
    BlogSite site;
    site.post("/blog/p1", {});
    site.post("/blog/p2", {{"tags", strings({"x"})}});

    SUBCASE("sentinel") {
        auto result = aggregate(site.tree, tagsUnderBlog());
        REQUIRE(result.has_value());
        CHECK((result->groups.keys() == std::vector<std::string>{"none", "x"}));
    }
    SUBCASE("replace_none_key") {
        auto config           = tagsUnderBlog();
        config.replaceNoneKey = "Untagged";
        auto result           = aggregate(site.tree, config);
        REQUIRE(result.has_value());
        auto untagged = result->groups.find("untagged");
        REQUIRE(untagged != nullptr);
        CHECK(untagged->keyObj() == text("Untagged"));
        CHECK((childPaths(*untagged) == std::vector<std::string>{"/blog/p1"}));
    }
}

TEST_CASE("pagination") {
    BlogSite site;
    for (int i = 0; i < 12; ++i)
        site.post("/blog/p" + std::to_string(10 + i), {{"tags", strings({"x"})}});
    auto config                = tagsUnderBlog();
    config.pagination.enabled  = true;
    config.pagination.perPage  = 5;

    auto result = aggregate(site.tree, config);
    REQUIRE(result.has_value());
    auto group = result->groups.find("x");
    REQUIRE(group != nullptr);
    CHECK(group->pageCount() == 3);
    CHECK(group->pageChildren(1).size() == 5);
    CHECK(group->pageChildren(3).size() == 2);
    CHECK(group->pageChildren(3)[0].record->path() == "/blog/p20");
    CHECK(group->pageChildren(4).empty());
    CHECK(group->pageUrl(1) == "/blog/tags/x/");
    CHECK(group->pageUrl(2) == "/blog/tags/x/page/2/");
    CHECK_FALSE(group->pageUrl(4).has_value());

    auto page = group->page(2);
    REQUIRE(page.has_value());
    CHECK(page->hasPrev());
    CHECK(page->hasNext());
    CHECK(page->children().size() == 5);
    CHECK(page->urlPath() == "/blog/tags/x/page/2/");
    CHECK(group->page(4).error().code == Error::Code::NotFound);
    CHECK(group->page(0).error().code == Error::Code::NotFound);
}

TEST_CASE("children are ordered by order_by") {
    BlogSite site;
    site.post("/blog/a", {{"date", text("2024-01-02")}, {"title", text("B")}, {"tags", strings({"x"})}});
    site.post("/blog/b", {{"date", text("2024-03-01")}, {"tags", strings({"x"})}});
    site.post("/blog/c", {{"title", text("A")}, {"tags", strings({"x"})}});
    site.post("/blog/d", {{"date", text("2024-01-02")}, {"title", text("A")}, {"tags", strings({"x"})}});

    SUBCASE("descending with ties") {
        auto config    = tagsUnderBlog();
        config.orderBy = {OrderKey{"date", true}, OrderKey{"title", false}};
        auto result    = aggregate(site.tree, config);
        REQUIRE(result.has_value());
        CHECK((childPaths(*result->groups.find("x")) == std::vector<std::string>{"/blog/b", "/blog/d", "/blog/a", "/blog/c"}));
    }
    SUBCASE("missing values first") {
        auto config    = tagsUnderBlog();
        config.orderBy = {OrderKey{"date", false}};
        auto result    = aggregate(site.tree, config);
        REQUIRE(result.has_value());
        CHECK((childPaths(*result->groups.find("x")) == std::vector<std::string>{"/blog/c", "/blog/a", "/blog/d", "/blog/b"}));
    }
    SUBCASE("record order without order_by") {
        auto result = aggregate(site.tree, tagsUnderBlog());
        REQUIRE(result.has_value());
        CHECK((childPaths(*result->groups.find("x")) == std::vector<std::string>{"/blog/a", "/blog/b", "/blog/c", "/blog/d"}));
    }
}

TEST_CASE("slug expressions") {
    BlogSite site;
    site.post("/blog/p1", {{"tags", strings({"Rust", "Go"})}});

    SUBCASE("with an extension") {
        auto config = tagsUnderBlog();
        config.slug = "'tag-' ~ this.key ~ '.html'";
        auto result = aggregate(site.tree, config);
        REQUIRE(result.has_value());
        CHECK(result->groups.find("rust")->urlPath() == "/blog/tag-rust.html");
    }
    SUBCASE("directory slug") {
        auto config = tagsUnderBlog();
        config.slug = "'t/' ~ (record.title | lower) ~ '/' ~ this.key";
        auto result = aggregate(site.tree, config);
        REQUIRE(result.has_value());
        CHECK(result->groups.find("go")->slug() == "t/blog/go/");
        CHECK(result->groups.find("go")->urlPath() == "/blog/t/blog/go/");
    }
    SUBCASE("empty slug is not addressable") {
        auto config = tagsUnderBlog();
        config.slug = "''";
        auto result = aggregate(site.tree, config);
        REQUIRE(result.has_value());
        CHECK_FALSE(result->groups.find("rust")->urlPath().has_value());
        CHECK(result->groups.find("rust")->pageCount() == 1);
    }
    SUBCASE("null slug") {
        auto config = tagsUnderBlog();
        config.slug.reset();
        auto result = aggregate(site.tree, config);
        REQUIRE(result.has_value());
        CHECK(result->groups.size() == 2);
        CHECK_FALSE(result->groups.find("go")->slug().has_value());
    }
    SUBCASE("failing expression") {
        auto config = tagsUnderBlog();
        config.slug = "this.nothing";
        auto result = aggregate(site.tree, config);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::ConfigError);
    }
    SUBCASE("non-scalar result") {
        auto config = tagsUnderBlog();
        config.slug = "this.children";
        auto result = aggregate(site.tree, config);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::ConfigError);
    }
}

TEST_CASE("groups sharing a slug are merged into the first") {
    BlogSite site;
    site.post("/blog/p1", {{"tags", strings({"a", "b"})}});
    site.post("/blog/p2", {{"tags", strings({"c", "a"})}});
    auto config = tagsUnderBlog();
    config.slug = "'all'";

    auto result = aggregate(site.tree, config);
    REQUIRE(result.has_value());
    auto const& groups = result->groups;
    REQUIRE(groups.size() == 1);
    auto merged = groups.find("a");
    REQUIRE(merged != nullptr);
    CHECK(merged->slug() == "all/");
    CHECK((merged->aliasKeys() == std::vector<std::string>{"b", "c"}));
    CHECK(groups.at("c").value() == merged);
    CHECK((childPaths(*merged) == std::vector<std::string>{"/blog/p1", "/blog/p2"}));
    // p1 yielded "a" and "b", p2 "a" and "c".
    CHECK(merged->children()[0].keyObjs.size() == 2);
    CHECK(merged->children()[1].keyObjs.size() == 2);
    CHECK((groups.keys() == std::vector<std::string>{"a"}));
    CHECK(groups.referencing("/blog/p2").size() == 1);
}

TEST_CASE("declared fields") {
    BlogSite site;
    site.post("/blog/p1", {{"tags", strings({"Rust"})}});
    site.post("/blog/p2", {{"tags", strings({"rust"})}});
    auto config = tagsUnderBlog();
    config.fields.emplace_back("title", FieldExpr::expression("'Tag: ' ~ this.key_obj"));
    config.fields.emplace_back("weight", FieldExpr::literal(Value{std::int64_t{3}}));
    config.fields.emplace_back("heading", FieldExpr::expression("this.title ~ ' in ' ~ record.title"));
    config.fields.emplace_back("where", FieldExpr::expression("config.root"));
    config.fields.emplace_back("loop", FieldExpr::expression("this.loop"));

    auto result = aggregate(site.tree, config);
    REQUIRE(result.has_value());
    auto group     = result->groups.find("rust");
    auto evaluator = defaultEvaluator();
    REQUIRE(group != nullptr);
    CHECK(group->field("title", *evaluator).value() == text("Tag: Rust"));
    CHECK((group->field("weight", *evaluator).value() == Value{std::int64_t{3}}));
    CHECK(group->field("heading", *evaluator).value() == text("Tag: Rust in Blog"));
    CHECK(group->field("where", *evaluator).value() == text("/blog"));
    CHECK(group->field("nope", *evaluator).error().code == Error::Code::NotFound);
    CHECK_FALSE(group->field("loop", *evaluator).has_value());

    CHECK((group->lookup("count", *evaluator).value() == Value{std::int64_t{2}}));
    CHECK(group->lookup("first_child", *evaluator).value() == text("/blog/p1"));
    CHECK((group->lookup("children", *evaluator).value() == strings({"/blog/p1", "/blog/p2"})));
    CHECK(group->lookup("url_path", *evaluator).value() == text("/blog/tags/rust/"));
    CHECK((group->lookup("weight", *evaluator).value() == Value{std::int64_t{3}}));
    CHECK(isNull(group->lookup("first_extra", *evaluator).value()));
}

TEST_CASE("onResolved sees the final key") {
    BlogSite site;
    site.post("/blog/p1", {{"body", flow({FlowBlock{"text", {{"labels", text("Alpha, Beta")}}}})}});
    site.post("/blog/p2", {{"body", flow({FlowBlock{"text", {{"labels", text("alpha")}}}})}});
    auto config  = Config::make("labels");
    config.split = ",";

    std::vector<std::string> urls;
    auto                     split = makeSplitGrouping(",");
    FunctionGrouping         grouping{
            [&](FieldOccurrence const& occurrence) { return split->produceKeys(occurrence); },
            [&](FieldOccurrence& occurrence, KeyYield const& yielded, GroupHandle& group) -> Expected<void> {
                REQUIRE(group.urlPath().has_value());
                urls.push_back(*group.urlPath());
                group.setAttribute("label", yielded.keyObj);
                group.addExtra(Value{occurrence.key.fieldKey + "#" + std::to_string(*occurrence.key.flowIndex)});
                occurrence.record->setField("title", Value{"linked " + group.key()});
                return {};
            }};

    auto result = aggregate(site.tree, config, grouping);
    REQUIRE(result.has_value());
    CHECK((urls == std::vector<std::string>{"/labels/alpha/", "/labels/beta/", "/labels/alpha/"}));
    auto alpha = result->groups.find("alpha");
    REQUIRE(alpha != nullptr);
    CHECK(alpha->attributeValue("label") == text("alpha"));
    CHECK(alpha->firstExtra() == text("body#0"));
    CHECK((alpha->children()[0].occurrences[0] == FieldKeyPath{"body", 0, "labels"}));
    CHECK(site.tree.get("/blog/p2")->field("title") == text("linked alpha"));
}

TEST_CASE("extras travel with their key") {
    BlogSite site;
    site.post("/blog/p1", {{"tags", strings({"x"})}});
    FunctionGrouping grouping{[](FieldOccurrence const& occurrence) -> Expected<std::vector<KeyYield>> {
        return std::vector<KeyYield>{KeyYield{text("x"), Value{occurrence.record->path()}}};
    }};
    auto result = aggregate(site.tree, tagsUnderBlog(), grouping);
    REQUIRE(result.has_value());
    auto evaluator = defaultEvaluator();
    CHECK(result->groups.find("x")->lookup("first_extra", *evaluator).value() == text("/blog/p1"));
}

TEST_CASE("callback failures abort the build") {
    BlogSite site;
    site.post("/blog/p1", {{"tags", strings({"x"})}});

    SUBCASE("thrown exception") {
        FunctionGrouping grouping{[](FieldOccurrence const&) -> Expected<std::vector<KeyYield>> {
            throw std::runtime_error("boom");
        }};
        auto result = aggregate(site.tree, tagsUnderBlog(), grouping);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::CallbackError);
        CHECK(result.error().message->find("boom") != std::string::npos);
    }
    SUBCASE("other errors are wrapped") {
        FunctionGrouping grouping{[](FieldOccurrence const&) -> Expected<std::vector<KeyYield>> {
            return std::unexpected(Error{Error::Code::NotFound, "lost"});
        }};
        auto result = aggregate(site.tree, tagsUnderBlog(), grouping);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::CallbackError);
    }
    SUBCASE("invalid yields pass through") {
        FunctionGrouping grouping{[](FieldOccurrence const& occurrence) -> Expected<std::vector<KeyYield>> {
            return std::vector<KeyYield>{KeyYield{occurrence.field}};
        }};
        auto result = aggregate(site.tree, tagsUnderBlog(), grouping);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::InvalidYield);
    }
    SUBCASE("onResolved errors") {
        FunctionGrouping grouping{
                [](FieldOccurrence const&) -> Expected<std::vector<KeyYield>> { return std::vector<KeyYield>{"x"}; },
                [](FieldOccurrence&, KeyYield const&, GroupHandle&) -> Expected<void> {
                    return std::unexpected(Error{Error::Code::TypeMismatch, "nope"});
                }};
        auto result = aggregate(site.tree, tagsUnderBlog(), grouping);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::CallbackError);
    }
}

TEST_CASE("builds are deterministic") {
    BlogSite site;
    site.post("/blog/p1", {{"tags", strings({"b", "a"})}});
    site.post("/blog/p2", {{"tags", strings({"c", "a"})}});
    site.post("/blog/p1/sub", {{"tags", strings({"c"})}});

    auto first  = aggregate(site.tree, tagsUnderBlog());
    auto second = aggregate(site.tree, tagsUnderBlog());
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK((first->groups.keys() == std::vector<std::string>{"b", "a", "c"}));
    CHECK(first->groups.keys() == second->groups.keys());
    for (auto const& key : first->groups.keys())
        CHECK(childPaths(*first->groups.find(key)) == childPaths(*second->groups.find(key)));
    CHECK((childPaths(*first->groups.find("c")) == std::vector<std::string>{"/blog/p1/sub", "/blog/p2"}));
}

TEST_CASE("flatten off passes flows whole") {
    auto schema = std::make_shared<Schema>();
    schema->addFlowBlock(FlowBlockModel{"item", {plain("name")}});
    schema->addModel(Model{"page", {flagged("items", FieldType::Flow, "catalog")}});
    ContentTree tree{schema};
    REQUIRE(tree.add(std::make_shared<Record>("/", "page", Record::Fields{{"items", flow({FlowBlock{"item", {{"name", text("a")}}}})}})).has_value());

    std::size_t      blocks = 0;
    FunctionGrouping grouping{[&](FieldOccurrence const& occurrence) -> Expected<std::vector<KeyYield>> {
        if (auto const* f = std::get_if<std::shared_ptr<Flow>>(&occurrence.field))
            blocks += (*f)->blocks.size();
        return std::vector<KeyYield>{"all"};
    }};
    auto result = aggregate(tree, Config::make("catalog"), grouping, false);
    REQUIRE(result.has_value());
    CHECK(blocks == 1);
    CHECK((result->groups.keys() == std::vector<std::string>{"all"}));
}

TEST_SUITE_END();
