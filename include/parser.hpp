#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

namespace lox {

// Максимальная глубина вложенности унарных операций и скобок
constexpr std::size_t kMaxNestingDepth = 256;

// Максимальная высота дерева, включая цепочки бинарных операций
constexpr std::size_t kMaxTreeDepth = 4096;

// Синтаксическая ошибка: что ожидалось и какой токен встретился
struct ParseError {
    std::string expected; // Описание ожидаемой конструкции ("')'", "выражение")
    Token actual;         // Токен, на котором разбор остановился
    std::size_t line;
};

// "[line 1] Ошибка в конце: ожидалось ')'"
std::string toString(const ParseError& error);

// Результат разбора: дерево или ошибка.
// Частичное дерево при ошибке не возвращается.
class ParseResult {
public:
    ParseResult(ExprPtr expr) : value(std::move(expr)) {}
    ParseResult(ParseError error) : value(std::move(error)) {}

    bool ok() const { return std::holds_alternative<ExprPtr>(value); }
    explicit operator bool() const { return ok(); }

    const Expr& expression() const { return *std::get<ExprPtr>(value); }
    const ParseError& error() const { return std::get<ParseError>(value); }

    // Забирает дерево из результата
    ExprPtr takeExpression() { return std::move(std::get<ExprPtr>(value)); }

private:
    std::variant<ExprPtr, ParseError> value;
};

// Класс синтаксического анализатора (парсера)
// Строит AST из списка токенов методом рекурсивного спуска.
// Разбирает одно выражение и не проверяет, что за ним следует EOF:
// это делает вызывающий код (см. position()).
class Parser {
public:
    // Если список не заканчивается токеном EOF, он добавляется
    explicit Parser(std::vector<Token> tokens);

    ParseResult parse();

    // Количество токенов, поглощённых последним разбором
    std::size_t position() const { return current; }

    // Токен, на котором остановился разбор
    const Token& peek() const;

private:
    std::vector<Token> tokens;
    std::size_t current = 0; // Индекс текущего токена
    std::size_t depth = 0;   // Число открытых унарных минусов и скобок

    const Token& previous() const;
    bool isAtEnd() const;
    bool check(TokenType type) const;

    // Если текущий токен одного из типов — сдвигает указатель и возвращает true
    bool match(std::initializer_list<TokenType> types);

    ParseError errorAt(const Token& token, std::string expected) const;

    // Ошибка, если дерево выше kMaxTreeDepth
    ParseResult limitHeight(ExprPtr expr, const Token& at) const;

    // --- Методы рекурсивного спуска (от низкого приоритета к высокому) ---

    // expression -> equality
    ParseResult expression();

    // equality -> comparison ( ( "==" | "!=" ) comparison )*
    ParseResult equality();

    // comparison -> term ( ( ">" | ">=" | "<" | "<=" ) term )*
    ParseResult comparison();

    // term -> factor ( ( "+" | "-" ) factor )*
    ParseResult term();

    // factor -> unary ( ( "/" | "*" ) unary )*
    ParseResult factor();

    // unary -> "-" unary | primary
    ParseResult unary();

    // primary -> NUMBER | STRING | "(" expression ")"
    ParseResult primary();
};

// Удобная обёртка: Parser(tokens).parse()
ParseResult parse(std::vector<Token> tokens);

} // namespace lox
