#include "UrlUtils.hpp"

namespace GB {

auto normalize_path(std::string_view path) -> std::string {
    std::string normalized{"/"};
    for (auto const& component : split_path(path)) {
        if (normalized.size() > 1)
            normalized.push_back('/');
        normalized.append(component);
    }
    return normalized;
}

auto is_within(std::string_view path, std::string_view root) -> bool {
    auto const p = normalize_path(path);
    auto const r = normalize_path(root);
    if (r == "/")
        return true;
    return p.starts_with(r) && (p.size() == r.size() || p[r.size()] == '/');
}

auto parent_path(std::string_view pathIn) -> std::string {
    auto const path = normalize_path(pathIn);
    auto const pos  = path.rfind('/');
    if (pos == 0 || pos == std::string::npos) {
        return "/";
    }
    return path.substr(0, pos);
}

auto split_path(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> components;
    std::size_t              start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos)
            end = path.size();
        if (end > start)
            components.emplace_back(path.substr(start, end - start));
        start = end + 1;
    }
    return components;
}

auto build_url(std::vector<std::string_view> const& pieces) -> std::string {
    std::string url{"/"};
    bool        trailing = false;
    for (auto piece : pieces) {
        if (piece.empty())
            continue;
        for (auto const& component : split_path(piece)) {
            if (url.back() != '/')
                url.push_back('/');
            url += component;
        }
        trailing = piece.back() == '/';
    }
    if (trailing && url.back() != '/')
        url.push_back('/');
    return url;
}

auto url_to_artifact(std::string_view url) -> std::string {
    auto canonical = canonical_url(url);
    if (canonical.back() == '/')
        canonical += "index.html";
    return canonical.substr(1);
}

auto canonical_url(std::string_view urlIn) -> std::string {
    static constexpr std::string_view indexSuffix = "/index.html";
    std::string                       url         = build_url({urlIn});
    if (url.size() >= indexSuffix.size() && url.compare(url.size() - indexSuffix.size(), indexSuffix.size(), indexSuffix) == 0) {
        url.erase(url.size() - indexSuffix.size() + 1);
        return url;
    }
    if (url.back() == '/')
        return url;
    auto const lastSlash = url.rfind('/');
    if (url.find('.', lastSlash) == std::string::npos)
        url.push_back('/');
    return url;
}

} // namespace GB
