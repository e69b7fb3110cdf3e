#include "tokenizer.hpp"

#include <charconv>
#include <cmath>
#include <string_view>
#include <system_error>
#include <unordered_map>

namespace lox {

namespace {

// Таблица ключевых слов
const std::unordered_map<std::string_view, TokenType>& keywords() {
    static const std::unordered_map<std::string_view, TokenType> table = {
        {"and", TokenType::And},       {"class", TokenType::Class},
        {"else", TokenType::Else},     {"false", TokenType::False},
        {"fun", TokenType::Fun},       {"for", TokenType::For},
        {"if", TokenType::If},         {"nil", TokenType::Nil},
        {"or", TokenType::Or},         {"print", TokenType::Print},
        {"return", TokenType::Return}, {"super", TokenType::Super},
        {"this", TokenType::This},     {"true", TokenType::True},
        {"var", TokenType::Var},       {"while", TokenType::While},
    };
    return table;
}

struct DecodedChar {
    char32_t codePoint;
    std::size_t length; // Длина последовательности в байтах
};

bool isContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// Декодирование одной кодовой точки UTF-8.
// Некорректный байт считается отдельным символом, в том числе
// начало избыточной (overlong) записи, суррогата или точки за U+10FFFF.
DecodedChar decodeUtf8(const std::string& text, std::size_t offset) {
    auto lead = static_cast<unsigned char>(text[offset]);
    std::size_t length = 1;
    char32_t codePoint = lead;
    if (lead >= 0xF0 && lead <= 0xF7) {
        length = 4;
        codePoint = lead & 0x07;
    } else if (lead >= 0xE0) {
        length = lead <= 0xEF ? 3 : 1;
        codePoint = lead & 0x0F;
    } else if (lead >= 0xC0) {
        length = 2;
        codePoint = lead & 0x1F;
    }

    if (length == 1 || offset + length > text.size()) {
        return {lead, 1};
    }
    for (std::size_t i = 1; i < length; ++i) {
        auto byte = static_cast<unsigned char>(text[offset + i]);
        if (!isContinuation(byte)) {
            return {lead, 1};
        }
        codePoint = (codePoint << 6) | (byte & 0x3F);
    }

    static constexpr char32_t kMinimal[] = {0, 0, 0x80, 0x800, 0x10000};
    if (codePoint < kMinimal[length] || (codePoint >= 0xD800 && codePoint <= 0xDFFF) ||
        codePoint > 0x10FFFF) {
        return {lead, 1};
    }
    return {codePoint, length};
}

bool isDigit(char32_t ch) {
    return ch >= '0' && ch <= '9';
}

// Только ASCII-буквы начинают идентификатор
bool isAlpha(char32_t ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

bool isAlphaNumeric(char32_t ch) {
    return isAlpha(ch) || isDigit(ch) || ch == '_';
}

} // namespace

std::string toString(const LexicalError& error) {
    return "[line " + std::to_string(error.line) + ":" + std::to_string(error.column) +
           "] Error: " + error.message;
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл: start сбрасывается перед каждой лексемой
std::vector<ScanResult> Tokenizer::scan() {
    start = 0;
    current = 0;
    line = 1;
    lineStart = 0;
    results.clear();

    while (!isAtEnd()) {
        start = current;
        startLine = line;
        scanToken();
    }

    results.emplace_back(Token{TokenType::Eof, "", line, std::nullopt});
    return std::move(results);
}

bool Tokenizer::isAtEnd() const {
    return current >= source.size();
}

char32_t Tokenizer::peek() const {
    if (isAtEnd()) {
        return U'\0';
    }
    return decodeUtf8(source, current).codePoint;
}

char32_t Tokenizer::peekNext() const {
    if (isAtEnd()) {
        return U'\0';
    }
    std::size_t next = current + decodeUtf8(source, current).length;
    if (next >= source.size()) {
        return U'\0';
    }
    return decodeUtf8(source, next).codePoint;
}

char32_t Tokenizer::advance() {
    DecodedChar decoded = decodeUtf8(source, current);
    current += decoded.length;
    return decoded.codePoint;
}

bool Tokenizer::match(char expected) {
    if (isAtEnd() || source[current] != expected) {
        return false;
    }
    ++current;
    return true;
}

void Tokenizer::newLine() {
    ++line;
    lineStart = current;
}

std::size_t Tokenizer::columnAt(std::size_t offset) const {
    std::size_t column = 1;
    std::size_t position = lineStart;
    while (position < offset) {
        position += decodeUtf8(source, position).length;
        ++column;
    }
    return column;
}

void Tokenizer::addToken(TokenType type, std::optional<LiteralValue> literal) {
    results.emplace_back(
        Token{type, source.substr(start, current - start), startLine, std::move(literal)});
}

void Tokenizer::addError(std::size_t errorLine, std::size_t column, std::string message) {
    results.emplace_back(LexicalError{errorLine, column, std::move(message)});
}

void Tokenizer::scanToken() {
    char32_t ch = advance();
    switch (ch) {
    // Односимвольные токены
    case '(':
        addToken(TokenType::LeftParen);
        break;
    case ')':
        addToken(TokenType::RightParen);
        break;
    case '{':
        addToken(TokenType::LeftBrace);
        break;
    case '}':
        addToken(TokenType::RightBrace);
        break;
    case ',':
        addToken(TokenType::Comma);
        break;
    case '.':
        addToken(TokenType::Dot);
        break;
    case '-':
        addToken(TokenType::Minus);
        break;
    case '+':
        addToken(TokenType::Plus);
        break;
    case ';':
        addToken(TokenType::Semicolon);
        break;
    case '*':
        addToken(TokenType::Star);
        break;

    // Операторы, которые могут сливаться со следующим '='
    case '!':
        addToken(match('=') ? TokenType::BangEqual : TokenType::Bang);
        break;
    case '=':
        addToken(match('=') ? TokenType::EqualEqual : TokenType::Equal);
        break;
    case '<':
        addToken(match('=') ? TokenType::LessEqual : TokenType::Less);
        break;
    case '>':
        addToken(match('=') ? TokenType::GreaterEqual : TokenType::Greater);
        break;

    case '/':
        if (match('/')) {
            skipComment();
        } else {
            addToken(TokenType::Slash);
        }
        break;

    case '"':
        makeString();
        break;

    // Пробельные символы
    case ' ':
    case '\r':
    case '\t':
        break;
    case '\n':
        newLine();
        break;

    default:
        if (isDigit(ch)) {
            makeNumber();
        } else if (isAlpha(ch)) {
            makeIdentifier();
        } else {
            addError(line, columnAt(start),
                     "Неожиданный символ '" + source.substr(start, current - start) + "'");
        }
        break;
    }
}

// Комментарий до конца строки или до конца текста
void Tokenizer::skipComment() {
    while (!isAtEnd() && peek() != '\n') {
        advance();
    }
}

// Строковый литерал. Может занимать несколько строк.
void Tokenizer::makeString() {
    std::size_t quoteColumn = columnAt(start);
    while (!isAtEnd() && peek() != '"') {
        if (advance() == '\n') {
            newLine();
        }
    }

    if (isAtEnd()) {
        addError(startLine, quoteColumn, "Незакрытая строка");
        return;
    }

    advance(); // Закрывающая кавычка
    addToken(TokenType::String, source.substr(start + 1, current - start - 2));
}

// Числовой литерал: цифры, затем необязательно '.' и хотя бы одна цифра.
// Точка без цифр после неё не входит в число.
void Tokenizer::makeNumber() {
    while (isDigit(peek())) {
        advance();
    }

    if (peek() == '.' && isDigit(peekNext())) {
        advance();
        while (isDigit(peek())) {
            advance();
        }
    }

    double value = 0.0;
    const char* first = source.data() + start;
    const char* last = source.data() + current;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || !std::isfinite(value)) {
        addError(line, columnAt(start),
                 "Некорректное число '" + source.substr(start, current - start) + "'");
        return;
    }
    addToken(TokenType::Number, value);
}

void Tokenizer::makeIdentifier() {
    while (isAlphaNumeric(peek())) {
        advance();
    }

    std::string_view text(source.data() + start, current - start);
    auto keyword = keywords().find(text);
    if (keyword != keywords().end()) {
        addToken(keyword->second);
    } else {
        addToken(TokenType::Identifier, std::string(text));
    }
}

std::vector<ScanResult> scan(std::string source) {
    return Tokenizer(std::move(source)).scan();
}

std::vector<Token> tokensOf(const std::vector<ScanResult>& results) {
    std::vector<Token> tokens;
    tokens.reserve(results.size());
    for (const auto& result : results) {
        if (const auto* token = std::get_if<Token>(&result)) {
            tokens.push_back(*token);
        }
    }
    return tokens;
}

std::vector<LexicalError> errorsOf(const std::vector<ScanResult>& results) {
    std::vector<LexicalError> errors;
    for (const auto& result : results) {
        if (const auto* error = std::get_if<LexicalError>(&result)) {
            errors.push_back(*error);
        }
    }
    return errors;
}

} // namespace lox
