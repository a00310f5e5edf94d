#pragma once
#include "content/ContentTree.hpp"
#include "content/Schema.hpp"
#include "core/Error.hpp"
#include "scan/FieldOccurrence.hpp"

#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace GB {

/**
 * Schema inspection for one attribute.
 *
 * A model field flagged with the attribute is "watched". A flow field that is
 * not flagged itself but admits flow blocks carrying flagged fields is
 * "block-watched": only the flagged block fields are reported, one per block.
 */
class ModelReader {
public:
    ModelReader(Schema const& schema, std::string attribute, bool flatten);

    // Occurrences of the attribute on one record, in model field order.
    [[nodiscard]] auto read(Record const& record) const -> std::vector<std::pair<FieldKeyPath, Value>>;
    [[nodiscard]] auto watchesAnything() const -> bool { return !this->models_.empty(); }
    [[nodiscard]] auto attribute() const -> std::string const& { return this->attribute_; }

private:
    enum class Mode {
        Field,
        BlocksOnly
    };

    std::string                                                 attribute_;
    bool                                                        flatten_;
    std::map<std::string, std::set<std::string>, std::less<>>   flows_;
    std::map<std::string, std::vector<std::pair<std::string, Mode>>, std::less<>> models_;
};

/**
 * Walks every record at or beneath a root in pre-order and reports each
 * occurrence of the watched attribute. Null and absent field values are
 * reported too. The scanner never derives group keys.
 */
class Scanner {
public:
    using Visitor = std::function<Expected<void>(FieldOccurrence&)>;

    Scanner(ContentTree const& tree, std::string attribute, bool flatten = true);

    // Stops at, and returns, the first visitor error.
    auto scan(std::string_view root, Visitor const& visitor) -> Expected<void>;

    // Paths of the records walked by the last scan().
    [[nodiscard]] auto visitedRecords() const -> std::vector<std::string> const& { return this->visited_; }

private:
    ContentTree const&       tree_;
    ModelReader              reader_;
    std::vector<std::string> visited_;
};

} // namespace GB
