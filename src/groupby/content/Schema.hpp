#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GB {

enum class FieldType {
    Text,
    Strings,
    Boolean,
    Integer,
    Float,
    Markdown,
    Flow
};

struct FieldDef {
    std::string                        name;
    FieldType                          type = FieldType::Text;
    std::map<std::string, std::string> options;
    // Flow fields only: allowed flow block ids, std::nullopt allows every block.
    std::optional<std::vector<std::string>> flowBlocks;

    // True if the option `attribute` is present and parses as a true boolean.
    [[nodiscard]] auto hasAttribute(std::string_view attribute) const -> bool;
};

struct Model {
    std::string           id;
    std::vector<FieldDef> fields;
};

struct FlowBlockModel {
    std::string           id;
    std::vector<FieldDef> fields;
};

/**
 * Data models and flow block models of the host content tree. A record names
 * its model by id; field option flags mark fields as carrying an attribute.
 */
class Schema {
public:
    auto addModel(Model model) -> void;
    auto addFlowBlock(FlowBlockModel block) -> void;

    [[nodiscard]] auto model(std::string_view id) const -> Model const*;
    [[nodiscard]] auto models() const -> std::map<std::string, Model, std::less<>> const& { return this->models_; }
    [[nodiscard]] auto flowBlocks() const -> std::map<std::string, FlowBlockModel, std::less<>> const& { return this->flowBlocks_; }

private:
    std::map<std::string, Model, std::less<>>          models_;
    std::map<std::string, FlowBlockModel, std::less<>> flowBlocks_;
};

// "true", "yes", "1", "on" (case-insensitive) are true.
[[nodiscard]] auto boolFromString(std::string_view value) -> std::optional<bool>;

} // namespace GB
