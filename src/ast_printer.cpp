#include "ast_printer.hpp"

namespace lox {

std::string AstPrinter::print(const Expr& expr) {
    return expr.accept(*this);
}

std::string AstPrinter::visitBinary(const BinaryExpr& expr) {
    return parenthesize(expr.getOperator().lexeme, expr.getLeft(), expr.getRight());
}

std::string AstPrinter::visitUnary(const UnaryExpr& expr) {
    return parenthesize(expr.getOperator().lexeme, expr.getRight());
}

std::string AstPrinter::visitGrouping(const GroupingExpr& expr) {
    return parenthesize("group", expr.getInner());
}

// Числа без лишнего ".0", строки без кавычек
std::string AstPrinter::visitLiteral(const LiteralExpr& expr) {
    return literalToString(expr.getValue());
}

std::string AstPrinter::parenthesize(const std::string& name, const Expr& first) {
    std::string inner = first.accept(*this);

    std::string result;
    result.reserve(name.size() + inner.size() + 3);
    result.append("(");
    result.append(name);
    result.append(" ");
    result.append(inner);
    result.append(")");
    return result;
}

std::string AstPrinter::parenthesize(const std::string& name, const Expr& first,
                                     const Expr& second) {
    std::string left = first.accept(*this);
    std::string right = second.accept(*this);

    std::string result;
    result.reserve(name.size() + left.size() + right.size() + 4);
    result.append("(");
    result.append(name);
    result.append(" ");
    result.append(left);
    result.append(" ");
    result.append(right);
    result.append(")");
    return result;
}

std::string printAst(const Expr& expr) {
    AstPrinter printer;
    return printer.print(expr);
}

} // namespace lox
