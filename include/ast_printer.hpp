#pragma once

#include <string>

#include "ast.hpp"

namespace lox {

// Печать дерева в полностью скобочной префиксной форме:
// "(+ 1 (* 2 3))", "(group ...)", "(- 5)".
// Результат не зависит от пробелов в исходном тексте.
class AstPrinter final : public ExprVisitor<std::string> {
public:
    std::string print(const Expr& expr);

    std::string visitBinary(const BinaryExpr& expr) override;
    std::string visitUnary(const UnaryExpr& expr) override;
    std::string visitGrouping(const GroupingExpr& expr) override;
    std::string visitLiteral(const LiteralExpr& expr) override;

private:
    std::string parenthesize(const std::string& name, const Expr& first);
    std::string parenthesize(const std::string& name, const Expr& first, const Expr& second);
};

// Удобная обёртка: AstPrinter().print(expr)
std::string printAst(const Expr& expr);

} // namespace lox
