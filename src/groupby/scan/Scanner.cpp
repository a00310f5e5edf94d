#include "Scanner.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace GB {

ModelReader::ModelReader(Schema const& schema, std::string attribute, bool flatten)
    : attribute_(std::move(attribute)), flatten_(flatten) {
    for (auto const& [id, block] : schema.flowBlocks()) {
        std::set<std::string> flagged;
        for (auto const& field : block.fields) {
            if (field.hasAttribute(this->attribute_))
                flagged.insert(field.name);
        }
        if (!flagged.empty())
            this->flows_.emplace(id, std::move(flagged));
    }
    for (auto const& [id, model] : schema.models()) {
        std::vector<std::pair<std::string, Mode>> watched;
        for (auto const& field : model.fields) {
            if (field.hasAttribute(this->attribute_)) {
                watched.emplace_back(field.name, Mode::Field);
            } else if (field.type == FieldType::Flow && !this->flows_.empty()) {
                bool const anyBlock = !field.flowBlocks
                                      || std::any_of(field.flowBlocks->begin(), field.flowBlocks->end(), [&](auto const& b) { return this->flows_.contains(b); });
                if (anyBlock)
                    watched.emplace_back(field.name, Mode::BlocksOnly);
            }
        }
        if (!watched.empty())
            this->models_.emplace(id, std::move(watched));
    }
}

auto ModelReader::read(Record const& record) const -> std::vector<std::pair<FieldKeyPath, Value>> {
    std::vector<std::pair<FieldKeyPath, Value>> out;
    auto it = this->models_.find(record.modelId());
    if (it == this->models_.end())
        return out;
    for (auto const& [name, mode] : it->second) {
        auto value = record.field(name);
        auto const* flow = std::get_if<std::shared_ptr<Flow>>(&value);
        if (mode == Mode::Field) {
            if (this->flatten_ && flow && *flow) {
                for (std::size_t i = 0; i < (*flow)->blocks.size(); ++i) {
                    for (auto const& [blockKey, blockValue] : (*flow)->blocks[i].fields) {
                        if (blockKey.starts_with('_'))
                            continue;
                        out.emplace_back(FieldKeyPath{name, i, blockKey}, blockValue);
                    }
                }
            } else {
                out.emplace_back(FieldKeyPath{name, std::nullopt, std::nullopt}, std::move(value));
            }
            continue;
        }
        if (!flow || !*flow)
            continue;
        for (std::size_t i = 0; i < (*flow)->blocks.size(); ++i) {
            auto const& block = (*flow)->blocks[i];
            auto        flags = this->flows_.find(block.type);
            if (flags == this->flows_.end())
                continue;
            for (auto const& blockKey : flags->second) {
                auto const* blockValue = block.get(blockKey);
                out.emplace_back(FieldKeyPath{name, i, blockKey}, blockValue ? *blockValue : Value{});
            }
        }
    }
    return out;
}

Scanner::Scanner(ContentTree const& tree, std::string attribute, bool flatten)
    : tree_(tree), reader_(tree.schema(), std::move(attribute), flatten) {}

auto Scanner::scan(std::string_view root, Visitor const& visitor) -> Expected<void> {
    this->visited_.clear();
    Expected<void> status{};
    this->tree_.visit(root, [&](std::shared_ptr<Record> const& record) {
        if (!status)
            return false;
        this->visited_.push_back(record->path());
        for (auto& [key, value] : this->reader_.read(*record)) {
            FieldOccurrence occurrence{record, std::move(key), std::move(value)};
            if (auto ok = visitor(occurrence); !ok) {
                status = std::unexpected(ok.error());
                return false;
            }
        }
        return true;
    });
    gb_log("Scanned " + std::to_string(this->visited_.size()) + " records for '" + this->reader_.attribute() + "' under " + std::string(root), "Scanner");
    return status;
}

} // namespace GB
