#pragma once
#include "content/Value.hpp"

#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace GB {

/**
 * One content record of the host tree.
 *
 * The path and model id are fixed at construction. Field values may be read
 * and rewritten concurrently; setField() is an in-memory edit (used by
 * grouping callbacks that rewrite source text) and does not count as a source
 * change. Source changes go through ContentTree::update() so dependents are
 * notified.
 */
class Record {
public:
    using Fields = std::vector<std::pair<std::string, Value>>;

    Record(std::string path, std::string modelId, Fields fields = {});

    Record(Record const&)            = delete;
    Record& operator=(Record const&) = delete;

    [[nodiscard]] auto path() const -> std::string const& { return this->path_; }
    [[nodiscard]] auto modelId() const -> std::string const& { return this->modelId_; }

    // Null if the field is not set.
    [[nodiscard]] auto field(std::string_view name) const -> Value;
    [[nodiscard]] auto hasField(std::string_view name) const -> bool;
    [[nodiscard]] auto fieldNames() const -> std::vector<std::string>;

    auto setField(std::string_view name, Value value) -> void;

    // Identifiers of the source files backing this record, used as dependencies.
    [[nodiscard]] auto sourceFilenames() const -> std::vector<std::string>;

private:
    std::string        path_;
    std::string        modelId_;
    mutable std::mutex fieldsMutex_;
    Fields             fields_;
};

} // namespace GB
