#include "frontend.hpp"

#include "ast_printer.hpp"

namespace lox {

FrontendReport Frontend::run(const std::string& source) const {
    FrontendReport report;

    // Этап 1: Лексический анализ
    auto results = scan(source);
    report.tokens = tokensOf(results);
    report.lexicalErrors = errorsOf(results);
    if (!report.lexicalErrors.empty()) {
        return report;
    }

    // Этап 2: Синтаксический анализ
    Parser parser(report.tokens);
    ParseResult result = parser.parse();
    if (!result) {
        report.parseError = result.error();
        return report;
    }

    // Этап 3: Выражение должно занимать весь текст
    if (parser.peek().type != TokenType::Eof) {
        report.parseError = ParseError{"конец выражения", parser.peek(), parser.peek().line};
        return report;
    }

    // Этап 4: Печать
    report.tree = result.takeExpression();
    report.printed = printAst(*report.tree);
    return report;
}

} // namespace lox
