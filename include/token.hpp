#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace lox {

// Тип лексемы (закрытое перечисление)
enum class TokenType {
    // Односимвольные токены
    LeftParen,
    RightParen,
    LeftBrace,
    RightBrace,
    Comma,
    Dot,
    Minus,
    Plus,
    Semicolon,
    Slash,
    Star,

    // Одно- или двухсимвольные токены
    Bang,
    BangEqual,
    Equal,
    EqualEqual,
    Greater,
    GreaterEqual,
    Less,
    LessEqual,

    // Литералы
    Identifier,
    String,
    Number,

    // Ключевые слова
    And,
    Class,
    Else,
    False,
    Fun,
    For,
    If,
    Nil,
    Or,
    Print,
    Return,
    Super,
    This,
    True,
    Var,
    While,

    Eof
};

// Значение литерала: число для NUMBER, текст для STRING и IDENTIFIER
using LiteralValue = std::variant<double, std::string>;

// Лексема исходного текста.
// Создаётся лексером и больше не изменяется.
struct Token {
    TokenType type;
    std::string lexeme;                  // Точный фрагмент исходного текста
    std::size_t line;                    // Номер строки (с 1)
    std::optional<LiteralValue> literal; // Есть только у NUMBER, STRING и IDENTIFIER

    bool operator==(const Token& other) const = default;
};

// Имя типа токена в верхнем регистре ("LEFT_PAREN", "EOF" ...)
std::string_view tokenTypeName(TokenType type);

// Каноническая запись числа: кратчайшая десятичная форма без ".0"
// 123.0 -> "123", 45.67 -> "45.67"
std::string formatNumber(double value);

// Текстовая форма литерала (строки без кавычек)
std::string literalToString(const LiteralValue& value);

// Строка для отладочного вывода: "NUMBER 123 123", "PLUS + null"
std::string toString(const Token& token);

} // namespace lox
