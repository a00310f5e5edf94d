#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace GB {

// Collapse repeated slashes, force a leading slash, drop trailing slashes ("/" stays "/").
auto normalize_path(std::string_view path) -> std::string;

// True if `path` equals `root` or lies beneath it. Both are normalized first.
auto is_within(std::string_view path, std::string_view root) -> bool;

// Parent of a normalized record path, "/" for top level entries and for "/".
auto parent_path(std::string_view path) -> std::string;

// Non-empty components of a slash separated path.
auto split_path(std::string_view path) -> std::vector<std::string>;

/**
 * Join URL pieces. The result always starts with '/', inner slashes are
 * collapsed and a trailing slash on the last non-empty piece is preserved:
 *   build_url({"/blog", "tags/a/"}) == "/blog/tags/a/"
 *   build_url({"/", "feed.xml"})    == "/feed.xml"
 */
auto build_url(std::vector<std::string_view> const& pieces) -> std::string;

// Map an URL path to the artifact file it is written to: "/a/" -> "a/index.html".
auto url_to_artifact(std::string_view url) -> std::string;

// Inverse-friendly normalisation of requested paths: "/a/index.html" and "/a" both become "/a/".
auto canonical_url(std::string_view url) -> std::string;

} // namespace GB
