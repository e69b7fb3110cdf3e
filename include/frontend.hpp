#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ast.hpp"
#include "parser.hpp"
#include "tokenizer.hpp"

namespace lox {

// Итог обработки одного фрагмента исходного текста
struct FrontendReport {
    std::vector<Token> tokens;               // Токены без ошибок
    std::vector<LexicalError> lexicalErrors; // Все лексические ошибки
    std::optional<ParseError> parseError;    // Первая синтаксическая ошибка
    ExprPtr tree;                            // Дерево (если разбор успешен)
    std::optional<std::string> printed;      // Каноническая печать дерева

    bool ok() const { return lexicalErrors.empty() && !parseError; }
};

// Класс-фасад над лексером и парсером.
// Объединяет этапы токенизации, разбора и печати AST.
class Frontend {
public:
    Frontend() = default;

    // Полный цикл обработки выражения:
    // 1. Токенизация, сбор всех лексических ошибок
    // 2. Разбор (только если лексических ошибок нет)
    // 3. Проверка, что после выражения нет лишних токенов
    // 4. Печать дерева
    // Пример: "1 + 2 * 3" -> "(+ 1 (* 2 3))"
    FrontendReport run(const std::string& source) const;
};

} // namespace lox
