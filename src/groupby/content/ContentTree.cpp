#include "ContentTree.hpp"

#include "log/TaggedLogger.hpp"
#include "path/UrlUtils.hpp"

namespace GB {

ContentTree::ContentTree(std::shared_ptr<Schema const> schema)
    : schema_(schema ? std::move(schema) : std::make_shared<Schema const>()) {}

auto ContentTree::add(std::shared_ptr<Record> record) -> Expected<void> {
    if (!record)
        return std::unexpected(Error{Error::Code::InvalidPath, "null record"});
    auto const path = record->path();
    {
        std::lock_guard<std::mutex> lock(this->structureMutex_);
        if (this->index_.contains(path))
            return std::unexpected(Error{Error::Code::AlreadyRegistered, "record already exists: " + path});
        if (path != "/") {
            auto const parent   = parent_path(path);
            bool       attached = this->index_.modify_if(parent, [&](auto& entry) { entry.second.children.push_back(path); });
            if (!attached)
                return std::unexpected(Error{Error::Code::NotFound, "parent record missing: " + parent});
        }
        this->index_.try_emplace(path, Entry{std::move(record), {}});
    }
    gb_log("ContentTree add " + path, "ContentTree");
    this->notify(path);
    return {};
}

auto ContentTree::remove(std::string_view pathIn) -> Expected<void> {
    auto const path = normalize_path(pathIn);
    {
        std::lock_guard<std::mutex> lock(this->structureMutex_);
        if (!this->index_.contains(path))
            return std::unexpected(Error{Error::Code::NotFound, "no such record: " + path});
        std::vector<std::string> doomed;
        this->collectSubtree(path, doomed);
        for (auto const& victim : doomed)
            this->index_.erase(victim);
        if (path != "/") {
            this->index_.modify_if(parent_path(path), [&](auto& entry) {
                std::erase(entry.second.children, path);
            });
        }
    }
    this->notify(path);
    return {};
}

auto ContentTree::update(std::string_view pathIn, std::string_view field, Value value) -> Expected<void> {
    auto const path   = normalize_path(pathIn);
    auto       record = this->get(path);
    if (!record)
        return std::unexpected(Error{Error::Code::NotFound, "no such record: " + path});
    record->setField(field, std::move(value));
    this->notify(path);
    return {};
}

auto ContentTree::touch(std::string const& identifier) -> void {
    this->notify(identifier);
}

auto ContentTree::get(std::string_view pathIn) const -> std::shared_ptr<Record> {
    std::shared_ptr<Record> found;
    this->index_.if_contains(normalize_path(pathIn), [&](auto const& entry) { found = entry.second.record; });
    return found;
}

auto ContentTree::contains(std::string_view pathIn) const -> bool {
    return this->index_.contains(normalize_path(pathIn));
}

auto ContentTree::children(std::string_view pathIn) const -> std::vector<std::shared_ptr<Record>> {
    std::vector<std::string> names;
    this->index_.if_contains(normalize_path(pathIn), [&](auto const& entry) { names = entry.second.children; });
    std::vector<std::shared_ptr<Record>> out;
    out.reserve(names.size());
    for (auto const& name : names) {
        if (auto child = this->get(name))
            out.push_back(std::move(child));
    }
    return out;
}

auto ContentTree::visit(std::string_view root, Visitor const& visitor) const -> void {
    auto start = this->get(root);
    if (!start)
        return;
    std::vector<std::shared_ptr<Record>> stack{std::move(start)};
    while (!stack.empty()) {
        auto record = std::move(stack.back());
        stack.pop_back();
        if (!visitor(record))
            continue;
        auto kids = this->children(record->path());
        for (auto it = kids.rbegin(); it != kids.rend(); ++it)
            stack.push_back(std::move(*it));
    }
}

auto ContentTree::subscribe(ChangeListener listener) -> std::size_t {
    auto const                  id = this->nextListenerId_.fetch_add(1);
    std::lock_guard<std::mutex> lock(this->listenersMutex_);
    this->listeners_.emplace(id, std::move(listener));
    return id;
}

auto ContentTree::unsubscribe(std::size_t id) -> void {
    std::lock_guard<std::mutex> lock(this->listenersMutex_);
    this->listeners_.erase(id);
}

auto ContentTree::notify(std::string const& path) -> void {
    std::vector<ChangeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(this->listenersMutex_);
        listeners.reserve(this->listeners_.size());
        for (auto const& entry : this->listeners_)
            listeners.push_back(entry.second);
    }
    for (auto const& listener : listeners)
        listener(path);
}

auto ContentTree::collectSubtree(std::string const& path, std::vector<std::string>& out) const -> void {
    out.push_back(path);
    std::vector<std::string> names;
    this->index_.if_contains(path, [&](auto const& entry) { names = entry.second.children; });
    for (auto const& name : names)
        this->collectSubtree(name, out);
}

} // namespace GB
