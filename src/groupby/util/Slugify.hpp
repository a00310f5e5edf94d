#pragma once
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace GB {

using SlugifyFn = std::function<std::string(std::string_view)>;

/**
 * Default slugify: ASCII letters are lower-cased, digits, '_' and non-ASCII
 * UTF-8 sequences are kept, every other run of ASCII characters becomes a
 * single '-'. Leading and trailing dashes are dropped, so "Latest News!" ->
 * "latest-news", "C#" -> "c" and "Café Crème" -> "café-crème".
 * May return an empty string (e.g. for "#").
 */
auto slugify(std::string_view text) -> std::string;

// Split on `delimiter`, strip surrounding whitespace, drop empty items.
auto split_strip(std::string_view text, std::string_view delimiter) -> std::vector<std::string>;

auto strip(std::string_view text) -> std::string_view;

} // namespace GB
