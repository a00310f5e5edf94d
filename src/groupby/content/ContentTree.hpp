#pragma once
#include "content/Record.hpp"
#include "content/Schema.hpp"
#include "core/Error.hpp"
#include "util/TransparentString.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace GB {

/**
 * In-memory host content tree.
 *
 * Records are indexed by normalized path; every record except "/" has a
 * parent that must exist when it is added. Children keep insertion order, so
 * visit() is a deterministic pre-order walk for a fixed tree.
 *
 * Source changes (add, remove, update, touch) are reported to subscribed
 * listeners with the affected path. Listeners run on the mutating thread after
 * the tree lock has been released.
 */
class ContentTree {
public:
    using ChangeListener = std::function<void(std::string const& path)>;
    // Return false to skip the record's children.
    using Visitor = std::function<bool(std::shared_ptr<Record> const&)>;

    explicit ContentTree(std::shared_ptr<Schema const> schema);

    ContentTree(ContentTree const&)            = delete;
    ContentTree& operator=(ContentTree const&) = delete;

    [[nodiscard]] auto schema() const -> Schema const& { return *this->schema_; }

    auto add(std::shared_ptr<Record> record) -> Expected<void>;
    // Removes the record and its whole subtree.
    auto remove(std::string_view path) -> Expected<void>;
    // Source edit of a single field; notifies listeners.
    auto update(std::string_view path, std::string_view field, Value value) -> Expected<void>;
    // Report an out-of-band change of `identifier` (a record path or any other file).
    auto touch(std::string const& identifier) -> void;

    [[nodiscard]] auto get(std::string_view path) const -> std::shared_ptr<Record>;
    [[nodiscard]] auto contains(std::string_view path) const -> bool;
    [[nodiscard]] auto children(std::string_view path) const -> std::vector<std::shared_ptr<Record>>;
    [[nodiscard]] auto size() const -> std::size_t { return this->index_.size(); }

    // Pre-order walk starting at `root` (inclusive). A missing root visits nothing.
    auto visit(std::string_view root, Visitor const& visitor) const -> void;

    auto subscribe(ChangeListener listener) -> std::size_t;
    auto unsubscribe(std::size_t id) -> void;

private:
    struct Entry {
        std::shared_ptr<Record>  record;
        std::vector<std::string> children;
    };

    using Index = phmap::parallel_node_hash_map<
            std::string,
            Entry,
            TransparentStringHash,
            std::equal_to<>,
            std::allocator<std::pair<const std::string, Entry>>,
            8,
            std::mutex>;

    auto notify(std::string const& path) -> void;
    auto collectSubtree(std::string const& path, std::vector<std::string>& out) const -> void;

    std::shared_ptr<Schema const> schema_;
    Index                         index_;
    // Serializes structural edits (parent/child links); lookups only use the sharded index.
    std::mutex structureMutex_;

    std::mutex                              listenersMutex_;
    std::map<std::size_t, ChangeListener>   listeners_;
    std::atomic<std::size_t>                nextListenerId_{1};
};

} // namespace GB
