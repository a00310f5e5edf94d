#pragma once
#include "content/Value.hpp"
#include "core/Error.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace GB {

class Record;

/**
 * Named-attribute view of an object an expression can reference
 * (`this`, `record`, `config`). lookup() reports Error::Code::NotFound for
 * unknown names.
 */
class ExprObject {
public:
    virtual ~ExprObject() = default;
    virtual auto lookup(std::string_view name) const -> Expected<Value> = 0;
};

// Exposes "_path", "_model" and every field of a record.
class RecordScope final : public ExprObject {
public:
    explicit RecordScope(Record const& record)
        : record_(record) {}
    auto lookup(std::string_view name) const -> Expected<Value> override;

private:
    Record const& record_;
};

struct ExprContext {
    ExprObject const*                          self   = nullptr;
    ExprObject const*                          record = nullptr;
    ExprObject const*                          config = nullptr;
    std::map<std::string, Value, std::less<>>  locals;
};

class ExpressionEvaluator {
public:
    virtual ~ExpressionEvaluator() = default;
    virtual auto evaluate(std::string_view source, ExprContext const& context) const -> Expected<Value> = 0;
    // Syntax check only; used to reject malformed config before a build.
    virtual auto validate(std::string_view source) const -> Expected<void> = 0;
};

/**
 * Small built-in evaluator used when the host does not install its own.
 *
 * Grammar:
 *   expr    := filtered ('~' filtered)*
 *   filtered:= primary ('|' filter)*
 *   primary := 'text' | "text" | number | true | false | none
 *            | this.name | record.name | config.name | local | '(' expr ')'
 *   filter  := length | lower | upper | trim | string | first | last
 *
 * '~' concatenates string forms.
 */
class BasicExpressionEvaluator final : public ExpressionEvaluator {
public:
    auto evaluate(std::string_view source, ExprContext const& context) const -> Expected<Value> override;
    auto validate(std::string_view source) const -> Expected<void> override;
};

auto defaultEvaluator() -> std::shared_ptr<ExpressionEvaluator const>;

/**
 * Value of a declared field: a literal, an expression string handed to the
 * evaluator, or a host callable. Evaluated on every access.
 */
class FieldExpr {
public:
    using Callable = std::function<Expected<Value>(ExprContext const&)>;

    FieldExpr() = default;

    static auto literal(Value value) -> FieldExpr;
    static auto expression(std::string source) -> FieldExpr;
    static auto callable(Callable fn) -> FieldExpr;

    [[nodiscard]] auto isExpression() const -> bool;
    // Expression source, empty for literals and callables.
    [[nodiscard]] auto source() const -> std::string_view;

    auto evaluate(ExprContext const& context, ExpressionEvaluator const& evaluator) const -> Expected<Value>;

private:
    struct Source {
        std::string text;
    };
    std::variant<Value, Source, Callable> body_;
};

} // namespace GB
