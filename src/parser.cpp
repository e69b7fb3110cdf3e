#include "parser.hpp"

#include <memory>
#include <utility>

namespace lox {

namespace {

// Счётчик глубины рекурсии на время вызова
class DepthGuard {
public:
    explicit DepthGuard(std::size_t& depth) : depth(depth) { ++depth; }
    ~DepthGuard() { --depth; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    std::size_t& depth;
};

template <typename Node, typename... Args>
ExprPtr makeExpr(Args&&... args) {
    return std::make_unique<Node>(std::forward<Args>(args)...);
}

} // namespace

std::string toString(const ParseError& error) {
    std::string where = error.actual.type == TokenType::Eof
                            ? "в конце"
                            : "возле '" + error.actual.lexeme + "'";
    return "[line " + std::to_string(error.line) + "] Ошибка " + where + ": ожидалось " +
           error.expected;
}

Parser::Parser(std::vector<Token> tokens) : tokens(std::move(tokens)) {
    if (this->tokens.empty() || this->tokens.back().type != TokenType::Eof) {
        std::size_t line = this->tokens.empty() ? 1 : this->tokens.back().line;
        this->tokens.push_back({TokenType::Eof, "", line, std::nullopt});
    }
}

// Запуск процесса парсинга
ParseResult Parser::parse() {
    current = 0;
    depth = 0;
    return expression();
}

const Token& Parser::peek() const {
    return tokens[current];
}

const Token& Parser::previous() const {
    return tokens[current - 1];
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::Eof;
}

bool Parser::check(TokenType type) const {
    return !isAtEnd() && peek().type == type;
}

bool Parser::match(std::initializer_list<TokenType> types) {
    for (TokenType type : types) {
        if (check(type)) {
            ++current;
            return true;
        }
    }
    return false;
}

ParseError Parser::errorAt(const Token& token, std::string expected) const {
    return ParseError{std::move(expected), token, token.line};
}

// Длинная цепочка бинарных операций растит дерево без рекурсии парсера,
// поэтому высота проверяется у каждого построенного узла
ParseResult Parser::limitHeight(ExprPtr expr, const Token& at) const {
    if (expr->height() > kMaxTreeDepth) {
        return errorAt(at, "выражение меньшей вложенности");
    }
    return expr;
}

ParseResult Parser::expression() {
    return equality();
}

// Все бинарные уровни левоассоциативны: уже построенное выражение
// становится левым операндом следующей операции
ParseResult Parser::equality() {
    ParseResult expr = comparison();
    while (expr && match({TokenType::EqualEqual, TokenType::BangEqual})) {
        Token op = previous();
        ParseResult right = comparison();
        if (!right) {
            return right;
        }
        expr = limitHeight(makeExpr<BinaryExpr>(expr.takeExpression(), op, right.takeExpression()),
                           op);
    }
    return expr;
}

ParseResult Parser::comparison() {
    ParseResult expr = term();
    while (expr && match({TokenType::Greater, TokenType::GreaterEqual, TokenType::Less,
                          TokenType::LessEqual})) {
        Token op = previous();
        ParseResult right = term();
        if (!right) {
            return right;
        }
        expr = limitHeight(makeExpr<BinaryExpr>(expr.takeExpression(), op, right.takeExpression()),
                           op);
    }
    return expr;
}

ParseResult Parser::term() {
    ParseResult expr = factor();
    while (expr && match({TokenType::Plus, TokenType::Minus})) {
        Token op = previous();
        ParseResult right = factor();
        if (!right) {
            return right;
        }
        expr = limitHeight(makeExpr<BinaryExpr>(expr.takeExpression(), op, right.takeExpression()),
                           op);
    }
    return expr;
}

ParseResult Parser::factor() {
    ParseResult expr = unary();
    while (expr && match({TokenType::Slash, TokenType::Star})) {
        Token op = previous();
        ParseResult right = unary();
        if (!right) {
            return right;
        }
        expr = limitHeight(makeExpr<BinaryExpr>(expr.takeExpression(), op, right.takeExpression()),
                           op);
    }
    return expr;
}

// Правоассоциативен: "- - 5" разбирается как (- (- 5))
ParseResult Parser::unary() {
    if (match({TokenType::Minus})) {
        Token op = previous();
        DepthGuard guard(depth);
        if (depth > kMaxNestingDepth) {
            return errorAt(op, "выражение меньшей вложенности");
        }

        ParseResult right = unary();
        if (!right) {
            return right;
        }
        return limitHeight(makeExpr<UnaryExpr>(op, right.takeExpression()), op);
    }
    return primary();
}

ParseResult Parser::primary() {
    if (match({TokenType::Number, TokenType::String})) {
        const Token& token = previous();
        if (!token.literal) {
            return errorAt(token, "литерал со значением");
        }
        return makeExpr<LiteralExpr>(*token.literal);
    }

    // Группировка скобками
    if (match({TokenType::LeftParen})) {
        DepthGuard guard(depth);
        if (depth > kMaxNestingDepth) {
            return errorAt(previous(), "выражение меньшей вложенности");
        }

        ParseResult inner = expression();
        if (!inner) {
            return inner;
        }
        if (!match({TokenType::RightParen})) {
            return errorAt(peek(), "')'");
        }
        return limitHeight(makeExpr<GroupingExpr>(inner.takeExpression()), previous());
    }

    return errorAt(peek(), "выражение");
}

ParseResult parse(std::vector<Token> tokens) {
    return Parser(std::move(tokens)).parse();
}

} // namespace lox
