#include "Expression.hpp"

#include "content/Record.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace GB {

auto RecordScope::lookup(std::string_view name) const -> Expected<Value> {
    if (name == "_path")
        return Value{this->record_.path()};
    if (name == "_model")
        return Value{this->record_.modelId()};
    if (!this->record_.hasField(name))
        return std::unexpected(Error{Error::Code::NotFound, "record has no field '" + std::string(name) + "'"});
    return this->record_.field(name);
}

namespace {

struct Token {
    enum class Kind {
        End,
        String,
        Number,
        Ident,
        Dot,
        Tilde,
        Pipe,
        LParen,
        RParen
    };
    Kind        kind = Kind::End;
    std::string text;
    Value       number;
};

struct Node {
    enum class Kind {
        Literal,
        Name,
        Concat,
        Filter
    };
    Kind                     kind = Kind::Literal;
    Value                    literal;
    std::vector<std::string> path;
    std::vector<Node>        children;
    std::string              filter;
};

auto tokenize(std::string_view source) -> Expected<std::vector<Token>> {
    std::vector<Token> tokens;
    std::size_t        i = 0;
    auto const         fail = [&](std::string const& what) {
        return std::unexpected(Error{Error::Code::ExpressionError, what + " at offset " + std::to_string(i) + " in '" + std::string(source) + "'"});
    };
    while (i < source.size()) {
        unsigned char const ch = static_cast<unsigned char>(source[i]);
        if (std::isspace(ch)) {
            ++i;
            continue;
        }
        Token token;
        if (ch == '\'' || ch == '"') {
            auto const quote = source[i++];
            token.kind       = Token::Kind::String;
            while (i < source.size() && source[i] != quote) {
                if (source[i] == '\\' && i + 1 < source.size())
                    ++i;
                token.text.push_back(source[i++]);
            }
            if (i >= source.size())
                return fail("unterminated string");
            ++i;
        } else if (std::isdigit(ch) || (ch == '-' && i + 1 < source.size() && std::isdigit(static_cast<unsigned char>(source[i + 1])))) {
            auto const start = i++;
            bool       isFloat = false;
            while (i < source.size() && (std::isdigit(static_cast<unsigned char>(source[i])) || source[i] == '.')) {
                if (source[i] == '.') {
                    if (i + 1 >= source.size() || !std::isdigit(static_cast<unsigned char>(source[i + 1])))
                        break;
                    isFloat = true;
                }
                ++i;
            }
            auto const text = source.substr(start, i - start);
            token.kind      = Token::Kind::Number;
            if (isFloat) {
                double d = 0;
                std::from_chars(text.data(), text.data() + text.size(), d);
                token.number = d;
            } else {
                std::int64_t n = 0;
                std::from_chars(text.data(), text.data() + text.size(), n);
                token.number = n;
            }
        } else if (std::isalpha(ch) || ch == '_') {
            auto const start = i;
            while (i < source.size() && (std::isalnum(static_cast<unsigned char>(source[i])) || source[i] == '_'))
                ++i;
            token.kind = Token::Kind::Ident;
            token.text = std::string(source.substr(start, i - start));
        } else {
            switch (ch) {
            case '.':
                token.kind = Token::Kind::Dot;
                break;
            case '~':
                token.kind = Token::Kind::Tilde;
                break;
            case '|':
                token.kind = Token::Kind::Pipe;
                break;
            case '(':
                token.kind = Token::Kind::LParen;
                break;
            case ')':
                token.kind = Token::Kind::RParen;
                break;
            default:
                return fail(std::string("unexpected character '") + static_cast<char>(ch) + "'");
            }
            ++i;
        }
        tokens.push_back(std::move(token));
    }
    tokens.push_back(Token{});
    return tokens;
}

class Parser {
public:
    Parser(std::string_view source, std::vector<Token> tokens)
        : source_(source), tokens_(std::move(tokens)) {}

    auto parse() -> Expected<Node> {
        auto node = this->parseConcat();
        if (!node)
            return node;
        if (this->peek().kind != Token::Kind::End)
            return this->fail("trailing input");
        return node;
    }

private:
    auto peek() const -> Token const& { return this->tokens_[this->pos_]; }
    auto next() -> Token const& { return this->tokens_[this->pos_++]; }

    auto fail(std::string const& what) const -> std::unexpected<Error> {
        return std::unexpected(Error{Error::Code::ExpressionError, what + " in '" + std::string(this->source_) + "'"});
    }

    auto parseConcat() -> Expected<Node> {
        auto first = this->parseFiltered();
        if (!first)
            return first;
        if (this->peek().kind != Token::Kind::Tilde)
            return first;
        Node concat;
        concat.kind = Node::Kind::Concat;
        concat.children.push_back(std::move(*first));
        while (this->peek().kind == Token::Kind::Tilde) {
            this->next();
            auto operand = this->parseFiltered();
            if (!operand)
                return operand;
            concat.children.push_back(std::move(*operand));
        }
        return concat;
    }

    auto parseFiltered() -> Expected<Node> {
        auto node = this->parsePrimary();
        if (!node)
            return node;
        while (this->peek().kind == Token::Kind::Pipe) {
            this->next();
            if (this->peek().kind != Token::Kind::Ident)
                return this->fail("expected filter name");
            Node filtered;
            filtered.kind   = Node::Kind::Filter;
            filtered.filter = this->next().text;
            static constexpr std::string_view known[] = {"length", "lower", "upper", "trim", "string", "first", "last"};
            if (std::find(std::begin(known), std::end(known), filtered.filter) == std::end(known))
                return this->fail("unknown filter '" + filtered.filter + "'");
            filtered.children.push_back(std::move(*node));
            *node = std::move(filtered);
        }
        return node;
    }

    auto parsePrimary() -> Expected<Node> {
        auto const& token = this->next();
        Node        node;
        switch (token.kind) {
        case Token::Kind::String:
            node.literal = token.text;
            return node;
        case Token::Kind::Number:
            node.literal = token.number;
            return node;
        case Token::Kind::LParen: {
            auto inner = this->parseConcat();
            if (!inner)
                return inner;
            if (this->next().kind != Token::Kind::RParen)
                return this->fail("expected ')'");
            return inner;
        }
        case Token::Kind::Ident:
            if (token.text == "true" || token.text == "false") {
                node.literal = token.text == "true";
                return node;
            }
            if (token.text == "none" || token.text == "None" || token.text == "null") {
                return node;
            }
            node.kind = Node::Kind::Name;
            node.path.push_back(token.text);
            while (this->peek().kind == Token::Kind::Dot) {
                this->next();
                if (this->peek().kind != Token::Kind::Ident)
                    return this->fail("expected attribute name after '.'");
                node.path.push_back(this->next().text);
            }
            return node;
        default:
            return this->fail("unexpected token");
        }
    }

    std::string_view   source_;
    std::vector<Token> tokens_;
    std::size_t        pos_ = 0;
};

auto parseExpression(std::string_view source) -> Expected<Node> {
    auto tokens = tokenize(source);
    if (!tokens)
        return std::unexpected(tokens.error());
    Parser parser{source, std::move(*tokens)};
    return parser.parse();
}

auto applyFilter(std::string const& filter, Value value) -> Expected<Value> {
    if (filter == "length") {
        if (auto const* list = std::get_if<std::vector<std::string>>(&value))
            return Value{static_cast<std::int64_t>(list->size())};
        if (auto const* flow = std::get_if<std::shared_ptr<Flow>>(&value))
            return Value{static_cast<std::int64_t>(*flow ? (*flow)->blocks.size() : 0)};
        return Value{static_cast<std::int64_t>(toString(value).size())};
    }
    if (filter == "first" || filter == "last") {
        if (auto const* list = std::get_if<std::vector<std::string>>(&value)) {
            if (list->empty())
                return Value{};
            return Value{filter == "first" ? list->front() : list->back()};
        }
        return value;
    }
    auto text = toString(value);
    if (filter == "lower") {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    } else if (filter == "upper") {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    } else if (filter == "trim") {
        auto const first = text.find_first_not_of(" \t\r\n");
        auto const last  = text.find_last_not_of(" \t\r\n");
        text             = first == std::string::npos ? std::string{} : text.substr(first, last - first + 1);
    }
    return Value{std::move(text)};
}

auto evaluateNode(Node const& node, ExprContext const& context) -> Expected<Value> {
    switch (node.kind) {
    case Node::Kind::Literal:
        return node.literal;
    case Node::Kind::Concat: {
        std::string joined;
        for (auto const& child : node.children) {
            auto part = evaluateNode(child, context);
            if (!part)
                return part;
            joined += toString(*part);
        }
        return Value{std::move(joined)};
    }
    case Node::Kind::Filter: {
        auto inner = evaluateNode(node.children.front(), context);
        if (!inner)
            return inner;
        return applyFilter(node.filter, std::move(*inner));
    }
    case Node::Kind::Name:
        break;
    }

    auto const& head = node.path.front();
    if (auto it = context.locals.find(head); it != context.locals.end()) {
        if (node.path.size() > 1)
            return std::unexpected(Error{Error::Code::ExpressionError, "cannot access attributes of '" + head + "'"});
        return it->second;
    }
    ExprObject const* object = nullptr;
    if (head == "this")
        object = context.self;
    else if (head == "record")
        object = context.record;
    else if (head == "config")
        object = context.config;
    else
        return std::unexpected(Error{Error::Code::ExpressionError, "undefined name '" + head + "'"});
    if (!object)
        return std::unexpected(Error{Error::Code::ExpressionError, "'" + head + "' is not bound here"});
    if (node.path.size() != 2)
        return std::unexpected(Error{Error::Code::ExpressionError, "expected '" + head + ".<name>'"});
    return object->lookup(node.path[1]);
}

} // namespace

auto BasicExpressionEvaluator::evaluate(std::string_view source, ExprContext const& context) const -> Expected<Value> {
    auto ast = parseExpression(source);
    if (!ast)
        return std::unexpected(ast.error());
    return evaluateNode(*ast, context);
}

auto BasicExpressionEvaluator::validate(std::string_view source) const -> Expected<void> {
    auto ast = parseExpression(source);
    if (!ast)
        return std::unexpected(ast.error());
    return {};
}

auto defaultEvaluator() -> std::shared_ptr<ExpressionEvaluator const> {
    static auto const instance = std::make_shared<BasicExpressionEvaluator const>();
    return instance;
}

auto FieldExpr::literal(Value value) -> FieldExpr {
    FieldExpr expr;
    expr.body_ = std::move(value);
    return expr;
}

auto FieldExpr::expression(std::string source) -> FieldExpr {
    FieldExpr expr;
    expr.body_ = Source{std::move(source)};
    return expr;
}

auto FieldExpr::callable(Callable fn) -> FieldExpr {
    FieldExpr expr;
    expr.body_ = std::move(fn);
    return expr;
}

auto FieldExpr::isExpression() const -> bool {
    return std::holds_alternative<Source>(this->body_);
}

auto FieldExpr::source() const -> std::string_view {
    if (auto const* src = std::get_if<Source>(&this->body_))
        return src->text;
    return {};
}

auto FieldExpr::evaluate(ExprContext const& context, ExpressionEvaluator const& evaluator) const -> Expected<Value> {
    if (auto const* value = std::get_if<Value>(&this->body_))
        return *value;
    if (auto const* src = std::get_if<Source>(&this->body_))
        return evaluator.evaluate(src->text, context);
    auto const& fn = std::get<Callable>(this->body_);
    if (!fn)
        return Value{};
    return fn(context);
}

} // namespace GB
