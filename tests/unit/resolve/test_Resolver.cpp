#include "resolve/Resolver.hpp"
#include "../GroupByTestHelper.hpp"

#include <doctest/doctest.h>

using namespace GB;
using namespace GB::test;
using nlohmann::json;

namespace {

struct PagedBlog {
    PagedBlog() {
        site.post("/blog/a", {{"tags", strings({"x", "y"})}});
        site.post("/blog/b", {{"tags", strings({"x"})}});
        auto added = groupBy.addWatcher("tags", json{{"root", "/blog"}, {"pagination", {{"enabled", true}, {"per_page", 1}}}});
        REQUIRE(added.has_value());
        watcher = *added;
    }

    BlogSite                 site;
    GroupBy                  groupBy{site.tree};
    std::shared_ptr<Watcher> watcher;
};

} // namespace

TEST_SUITE("resolve.resolver") {
    TEST_CASE("resolve URLs") {
        PagedBlog blog;
        Resolver  resolver{blog.groupBy};

        auto first = resolver.resolve("/blog/tags/x/");
        REQUIRE(first.has_value());
        CHECK(first->group->key() == "x");
        CHECK(first->pageNum == 1);
        CHECK(first->watcher == blog.watcher);
        CHECK(first->virtualPath() == "/blog@groupby/tags/x");
        CHECK(first->page().children().size() == 1);

        auto index = resolver.resolve("/blog/tags/x/index.html");
        REQUIRE(index.has_value());
        CHECK(index->group == first->group);

        auto second = resolver.resolve("blog/tags/x/page/2");
        REQUIRE(second.has_value());
        CHECK(second->pageNum == 2);
        CHECK(second->urlPath() == "/blog/tags/x/page/2/");
        CHECK(second->virtualPath() == "/blog@groupby/tags/x/2");
        CHECK(second->page().children()[0].record->path() == "/blog/b");

        CHECK(resolver.resolve("/blog/tags/y/page/2/").error().code == Error::Code::NotFound);
        CHECK(resolver.resolve("/blog/tags/nope/").error().code == Error::Code::NotFound);
        CHECK(resolver.resolve("/elsewhere/").error().code == Error::Code::NotFound);
        CHECK(blog.watcher->buildCount() == 1);
    }

    TEST_CASE("resolution follows rebuilds") {
        PagedBlog blog;
        Resolver  resolver{blog.groupBy};
        REQUIRE(resolver.resolve("/blog/tags/y/").has_value());

        REQUIRE(blog.site.tree.update("/blog/a", "tags", strings({"z"})).has_value());
        CHECK(resolver.resolve("/blog/tags/y/").error().code == Error::Code::NotFound);
        CHECK(resolver.resolve("/blog/tags/z/").has_value());
    }

    TEST_CASE("resolve virtual paths") {
        PagedBlog blog;
        Resolver  resolver{blog.groupBy};

        auto group = resolver.resolveVirtualPath("/blog@groupby/tags/x");
        REQUIRE(group.has_value());
        CHECK(group->group->key() == "x");
        CHECK(group->pageNum == 1);

        auto page = resolver.resolveVirtualPath("/blog@groupby/tags/x/2");
        REQUIRE(page.has_value());
        CHECK(page->pageNum == 2);
        CHECK(page->urlPath() == "/blog/tags/x/page/2/");

        CHECK(resolver.resolveVirtualPath("/blog/tags/x").error().code == Error::Code::InvalidPath);
        CHECK(resolver.resolveVirtualPath("/blog@groupby/tags").error().code == Error::Code::InvalidPath);
        CHECK(resolver.resolveVirtualPath("/blog@groupby/tags/x/2/3").error().code == Error::Code::InvalidPath);
        CHECK(resolver.resolveVirtualPath("/blog@groupby/tags/x/two").error().code == Error::Code::InvalidPath);
        CHECK(resolver.resolveVirtualPath("/blog@groupby/tags/x/0").error().code == Error::Code::InvalidPath);
        CHECK(resolver.resolveVirtualPath("/blog@groupby/tags/x/3").error().code == Error::Code::NotFound);
        CHECK(resolver.resolveVirtualPath("/blog@groupby/labels/x").error().code == Error::Code::NotFound);
        CHECK(resolver.resolveVirtualPath("/docs@groupby/tags/x").error().code == Error::Code::NotFound);
        CHECK(resolver.resolveVirtualPath("/blog@groupby/tags/nope").error().code == Error::Code::NotFound);
    }

    TEST_CASE("root watchers and merged keys") {
        BlogSite site;
        site.post("/blog/a", {{"tags", strings({"x", "y"})}});
        GroupBy groupBy{site.tree};
        REQUIRE(groupBy.addWatcher("tags", json{{"slug", "'everything'"}}).has_value());
        Resolver resolver{groupBy};

        auto merged = resolver.resolveVirtualPath("@groupby/tags/y");
        REQUIRE(merged.has_value());
        CHECK(merged->group->key() == "x");
        CHECK(merged->virtualPath() == "@groupby/tags/x");

        auto byUrl = resolver.resolve("/everything/");
        REQUIRE(byUrl.has_value());
        CHECK(byUrl->group == merged->group);
    }

    TEST_CASE("the first registered watcher owns a contested URL") {
        BlogSite site;
        site.post("/blog/a", {{"tags", strings({"x"})}, {"category", text("x")}});
        GroupBy groupBy{site.tree};
        REQUIRE(groupBy.addWatcher("tags", json{{"slug", "topics/{key}/"}}).has_value());
        REQUIRE(groupBy.addWatcher("category", json{{"slug", "topics/{key}/"}}).has_value());
        Resolver resolver{groupBy};

        auto node = resolver.resolve("/topics/x/");
        REQUIRE(node.has_value());
        CHECK(node->group->attribute() == "tags");

        CHECK(resolver.sync().empty());
        auto mapping = resolver.mapping();
        CHECK(mapping.size() == 1);
        CHECK(mapping.at("/topics/x/") == "@groupby/tags/x");
    }

    TEST_CASE("prune retracts vanished groups") {
        PagedBlog            blog;
        Resolver             resolver{blog.groupBy};
        InMemoryNodeRegistry registry;
        registry.expose("/stale/", "@groupby/old/key");

        CHECK(resolver.prune(registry) == 1);
        CHECK((registry.exposed() == std::vector<std::string>{"/blog/tags/x/", "/blog/tags/x/page/2/", "/blog/tags/y/"}));
        CHECK(registry.virtualPathOf("/blog/tags/x/page/2/") == "/blog@groupby/tags/x/2");

        SUBCASE("a key disappears") {
            REQUIRE(blog.site.tree.update("/blog/a", "tags", strings({"x"})).has_value());
            CHECK(resolver.prune(registry) == 1);
            CHECK_FALSE(registry.contains("/blog/tags/y/"));
            CHECK(registry.contains("/blog/tags/x/page/2/"));
        }
        SUBCASE("a page disappears") {
            REQUIRE(blog.site.tree.remove("/blog/b").has_value());
            CHECK(resolver.prune(registry) == 1);
            CHECK_FALSE(registry.contains("/blog/tags/x/page/2/"));
            CHECK(registry.contains("/blog/tags/x/"));
        }
        SUBCASE("the watcher is disabled") {
            blog.groupBy.reset();
            REQUIRE(blog.groupBy.addWatcher("tags", json{{"root", "/blog"}, {"enabled", false}}).has_value());
            CHECK(resolver.prune(registry) == 3);
            CHECK(registry.exposed().empty());
        }
        SUBCASE("nothing changed") {
            CHECK(resolver.prune(registry) == 0);
            CHECK(registry.exposed().size() == 3);
        }
    }

    TEST_CASE("failed builds keep their URLs") {
        PagedBlog blog;
        Resolver  resolver{blog.groupBy};
        CHECK(resolver.sync().empty());
        auto before = resolver.mapping();
        CHECK(before.size() == 3);

        blog.watcher->setGrouping([](FieldOccurrence const&) -> Expected<std::vector<KeyYield>> {
            return std::unexpected(Error{Error::Code::CallbackError, "broken"});
        });
        auto failures = resolver.sync();
        REQUIRE(failures.size() == 1);
        CHECK(failures[0].code == Error::Code::CallbackError);
        CHECK(resolver.mapping() == before);

        InMemoryNodeRegistry registry;
        CHECK(resolver.prune(registry) == 0);
        CHECK(registry.exposed().size() == 3);
    }

    TEST_CASE("a failing watcher does not hide the groups of another") {
        BlogSite site;
        site.post("/a", {{"tags", strings({"x"})}, {"category", text("news")}});
        GroupBy groupBy{site.tree};
        auto    category = groupBy.addWatcher("category", json{{"slug", "{key}/"}});
        REQUIRE(category.has_value());
        (*category)->setGrouping([](FieldOccurrence const&) -> Expected<std::vector<KeyYield>> {
            return std::unexpected(Error{Error::Code::CallbackError, "category callback broken"});
        });
        REQUIRE(groupBy.addWatcher("tags", Config::make("tags")).has_value());
        Resolver resolver{groupBy};

        auto node = resolver.resolve("/tags/x/");
        REQUIRE(node.has_value());
        CHECK(node->group->attribute() == "tags");
        CHECK(node->group->key() == "x");

        auto virtualNode = resolver.resolveVirtualPath("@groupby/tags/x");
        REQUIRE(virtualNode.has_value());
        CHECK(virtualNode->group == node->group);

        auto unowned = resolver.resolve("/news/");
        REQUIRE_FALSE(unowned.has_value());
        CHECK(unowned.error().code == Error::Code::CallbackError);
        CHECK(resolver.resolveVirtualPath("@groupby/category/news").error().code == Error::Code::CallbackError);
    }

    TEST_CASE("a callback without keys leaves nothing to resolve") {
        BlogSite site;
        site.post("/blog/a", {{"tags", strings({"x", "y"})}});
        GroupBy groupBy{site.tree};
        auto    tags = groupBy.addWatcher("tags", Config::make("tags"));
        REQUIRE(tags.has_value());
        (*tags)->setGrouping([](FieldOccurrence const&) -> Expected<std::vector<KeyYield>> { return std::vector<KeyYield>{}; });
        Resolver resolver{groupBy};

        auto groups = (*tags)->groups();
        REQUIRE(groups.has_value());
        CHECK((*groups)->empty());
        CHECK(resolver.resolve("/tags/x/").error().code == Error::Code::NotFound);
        CHECK(resolver.resolve("/tags/x/index.html").error().code == Error::Code::NotFound);
        CHECK(resolver.resolveVirtualPath("@groupby/tags/x").error().code == Error::Code::NotFound);
        CHECK(resolver.sync().empty());
        CHECK(resolver.mapping().empty());
    }

    TEST_CASE("sync forgets watchers dropped by reset") {
        PagedBlog blog;
        Resolver  resolver{blog.groupBy};
        CHECK(resolver.sync().empty());
        CHECK(resolver.tableCount() == 1);

        blog.groupBy.reset();
        REQUIRE(blog.groupBy.addWatcher("category", json{{"root", "/blog"}}).has_value());
        CHECK(resolver.sync().empty());
        CHECK(resolver.tableCount() == 1);
        for (auto const& [url, virtualPath] : resolver.mapping())
            CHECK(virtualPath.find("@groupby/category/") != std::string::npos);

        blog.groupBy.reset();
        CHECK(resolver.sync().empty());
        CHECK(resolver.tableCount() == 0);
        CHECK(resolver.mapping().empty());
    }
}
