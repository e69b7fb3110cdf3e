#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "token.hpp"

namespace lox {

// Лексическая ошибка: некорректный символ или незакрытая строка.
// Сканирование после неё продолжается.
struct LexicalError {
    std::size_t line;   // Номер строки (с 1)
    std::size_t column; // Позиция символа в строке (с 1, в символах)
    std::string message;

    bool operator==(const LexicalError& other) const = default;
};

// Форматирование в виде "[line L:C] Error: message"
std::string toString(const LexicalError& error);

// Элемент выхода лексера: токен или ошибка, в порядке исходного текста
using ScanResult = std::variant<Token, LexicalError>;

// Класс лексического анализатора (лексера)
// Преобразует исходный текст в последовательность токенов и ошибок.
// Последним элементом всегда идёт токен EOF.
class Tokenizer {
public:
    // Конструктор принимает исходный текст в UTF-8
    explicit Tokenizer(std::string sourceText);

    // Проходит весь текст один раз.
    // Ошибки не выбрасываются, а вставляются в результат.
    std::vector<ScanResult> scan();

private:
    const std::string source;  // Исходный текст
    std::size_t start = 0;     // Начало текущей лексемы (байт)
    std::size_t current = 0;   // Текущая позиция чтения (байт)
    std::size_t line = 1;      // Текущая строка
    std::size_t lineStart = 0; // Байтовое смещение начала текущей строки
    std::size_t startLine = 1; // Строка, на которой началась текущая лексема

    std::vector<ScanResult> results;

    bool isAtEnd() const;

    // Символ в текущей позиции без продвижения (0 в конце текста)
    char32_t peek() const;

    // Символ после текущего (для проверки "1.5" против "1.")
    char32_t peekNext() const;

    // Считывает один символ (кодовую точку UTF-8) и сдвигает указатель
    char32_t advance();

    // Сдвигает указатель, только если следующий символ равен expected
    bool match(char expected);

    // Разбор одной лексемы, начиная с позиции start
    void scanToken();

    void addToken(TokenType type, std::optional<LiteralValue> literal = std::nullopt);
    void addError(std::size_t errorLine, std::size_t column, std::string message);

    // Колонка (в символах, с 1) для байтового смещения в текущей строке
    std::size_t columnAt(std::size_t offset) const;

    // Переход на новую строку после считанного '\n'
    void newLine();

    void skipComment();
    void makeString();
    void makeNumber();
    void makeIdentifier();
};

// Удобная обёртка: Tokenizer(source).scan()
std::vector<ScanResult> scan(std::string source);

// Только токены (ошибки отбрасываются)
std::vector<Token> tokensOf(const std::vector<ScanResult>& results);

// Только ошибки
std::vector<LexicalError> errorsOf(const std::vector<ScanResult>& results);

} // namespace lox
