#include "KeyResolver.hpp"

#include "log/TaggedLogger.hpp"

namespace GB {

KeyResolver::KeyResolver(Config const& config, ExpressionEvaluator const& evaluator, SlugifyFn slugifyFn)
    : config_(config), evaluator_(evaluator), slugify_(slugifyFn ? std::move(slugifyFn) : SlugifyFn{&slugify}) {}

auto KeyResolver::noneKey() const -> std::string {
    if (this->config_.replaceNoneKey && !this->config_.replaceNoneKey->empty())
        return *this->config_.replaceNoneKey;
    return std::string(NoneKeySentinel);
}

auto KeyResolver::resolve(Value const& raw, FieldOccurrence const* occurrence) const -> Expected<ResolvedKey> {
    if (!isScalar(raw))
        return std::unexpected(Error{Error::Code::InvalidYield,
                                     "unsupported key object of type " + std::string(valueTypeName(raw)) + " for attribute '" + this->config_.attribute + "'"});

    Value keyObj = raw;
    if (this->config_.keyObjFn) {
        ExprContext context;
        context.locals.emplace("X", raw);
        context.locals.emplace("key_obj", raw);
        ConfigScope                configScope{this->config_};
        std::optional<RecordScope> recordScope;
        context.config = &configScope;
        if (occurrence && occurrence->record) {
            recordScope.emplace(*occurrence->record);
            context.self   = &*recordScope;
            context.record = &*recordScope;
            context.locals.emplace("field_key", Value{occurrence->key.fieldKey});
            context.locals.emplace("flow_key", occurrence->key.flowKey ? Value{*occurrence->key.flowKey} : Value{});
        }
        auto transformed = this->evaluator_.evaluate(*this->config_.keyObjFn, context);
        if (!transformed)
            return std::unexpected(configError(this->config_.attribute, "key_obj_fn", *this->config_.keyObjFn, describeError(transformed.error())));
        if (!isScalar(*transformed))
            return std::unexpected(Error{Error::Code::InvalidYield,
                                         "key_obj_fn produced unsupported type " + std::string(valueTypeName(*transformed)) + " for attribute '" + this->config_.attribute + "'"});
        keyObj = std::move(*transformed);
    }

    if (isNull(keyObj) || strip(toString(keyObj)).empty())
        keyObj = this->noneKey();

    ResolvedKey resolved;
    resolved.key    = this->finalKey(keyObj);
    resolved.keyObj = std::move(keyObj);
    return resolved;
}

auto KeyResolver::finalKey(Value const& keyObj) const -> std::string {
    auto text = toString(keyObj);
    if (auto it = this->config_.keyMap.find(text); it != this->config_.keyMap.end())
        text = it->second;
    auto key = this->slugify_(text);
    if (key.empty()) {
        gb_log("Key '" + text + "' of attribute '" + this->config_.attribute + "' has no slug, using the none key", "KeyResolver", "Warning");
        key = this->slugify_(this->noneKey());
        if (key.empty())
            key = std::string(NoneKeySentinel);
    }
    return key;
}

} // namespace GB
