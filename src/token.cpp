#include "token.hpp"

#include <array>
#include <charconv>
#include <stdexcept>

namespace lox {

std::string_view tokenTypeName(TokenType type) {
    switch (type) {
    case TokenType::LeftParen:
        return "LEFT_PAREN";
    case TokenType::RightParen:
        return "RIGHT_PAREN";
    case TokenType::LeftBrace:
        return "LEFT_BRACE";
    case TokenType::RightBrace:
        return "RIGHT_BRACE";
    case TokenType::Comma:
        return "COMMA";
    case TokenType::Dot:
        return "DOT";
    case TokenType::Minus:
        return "MINUS";
    case TokenType::Plus:
        return "PLUS";
    case TokenType::Semicolon:
        return "SEMICOLON";
    case TokenType::Slash:
        return "SLASH";
    case TokenType::Star:
        return "STAR";
    case TokenType::Bang:
        return "BANG";
    case TokenType::BangEqual:
        return "BANG_EQUAL";
    case TokenType::Equal:
        return "EQUAL";
    case TokenType::EqualEqual:
        return "EQUAL_EQUAL";
    case TokenType::Greater:
        return "GREATER";
    case TokenType::GreaterEqual:
        return "GREATER_EQUAL";
    case TokenType::Less:
        return "LESS";
    case TokenType::LessEqual:
        return "LESS_EQUAL";
    case TokenType::Identifier:
        return "IDENTIFIER";
    case TokenType::String:
        return "STRING";
    case TokenType::Number:
        return "NUMBER";
    case TokenType::And:
        return "AND";
    case TokenType::Class:
        return "CLASS";
    case TokenType::Else:
        return "ELSE";
    case TokenType::False:
        return "FALSE";
    case TokenType::Fun:
        return "FUN";
    case TokenType::For:
        return "FOR";
    case TokenType::If:
        return "IF";
    case TokenType::Nil:
        return "NIL";
    case TokenType::Or:
        return "OR";
    case TokenType::Print:
        return "PRINT";
    case TokenType::Return:
        return "RETURN";
    case TokenType::Super:
        return "SUPER";
    case TokenType::This:
        return "THIS";
    case TokenType::True:
        return "TRUE";
    case TokenType::Var:
        return "VAR";
    case TokenType::While:
        return "WHILE";
    case TokenType::Eof:
        return "EOF";
    }
    return "UNKNOWN";
}

// Фиксированная запись с минимальным числом знаков, достаточным
// для точного восстановления значения (без экспоненты)
std::string formatNumber(double value) {
    // Запас под самое длинное представление: 5e-324 занимает 327 символов
    std::array<char, 512> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                   std::chars_format::fixed);
    if (ec != std::errc()) {
        throw std::runtime_error("Не удалось отформатировать число");
    }
    return std::string(buffer.data(), end);
}

std::string literalToString(const LiteralValue& value) {
    if (const auto* number = std::get_if<double>(&value)) {
        return formatNumber(*number);
    }
    return std::get<std::string>(value);
}

std::string toString(const Token& token) {
    std::string result(tokenTypeName(token.type));
    result.append(" ");
    result.append(token.lexeme);
    result.append(" ");
    result.append(token.literal ? literalToString(*token.literal) : "null");
    return result;
}

} // namespace lox
