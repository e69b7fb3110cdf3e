#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>

#include "ast.hpp"
#include "ast_printer.hpp"

namespace lox {
namespace {

Token makeOperator(TokenType type, const std::string& lexeme) {
    return Token{type, lexeme, 1, std::nullopt};
}

ExprPtr number(double value) {
    return std::make_unique<LiteralExpr>(value);
}

// Посетитель с другим типом результата: глубина дерева
class DepthVisitor final : public ExprVisitor<int> {
public:
    int visitBinary(const BinaryExpr& expr) override {
        return 1 + std::max(expr.getLeft().accept(*this), expr.getRight().accept(*this));
    }
    int visitUnary(const UnaryExpr& expr) override { return 1 + expr.getRight().accept(*this); }
    int visitGrouping(const GroupingExpr& expr) override {
        return 1 + expr.getInner().accept(*this);
    }
    int visitLiteral(const LiteralExpr&) override { return 1; }
};

// Посетитель, запоминающий, какой метод был вызван
class KindVisitor final : public ExprVisitor<ExprType> {
public:
    ExprType visitBinary(const BinaryExpr&) override { return ExprType::Binary; }
    ExprType visitUnary(const UnaryExpr&) override { return ExprType::Unary; }
    ExprType visitGrouping(const GroupingExpr&) override { return ExprType::Grouping; }
    ExprType visitLiteral(const LiteralExpr&) override { return ExprType::Literal; }
};

TEST(AstPrinterTest, PrintsNestedTree) {
    // -123 * (45.67)
    BinaryExpr expr(
        std::make_unique<UnaryExpr>(makeOperator(TokenType::Minus, "-"), number(123)),
        makeOperator(TokenType::Star, "*"),
        std::make_unique<GroupingExpr>(number(45.67)));

    EXPECT_EQ(printAst(expr), "(* (- 123) (group 45.67))");
}

TEST(AstPrinterTest, PrintsLiterals) {
    EXPECT_EQ(printAst(LiteralExpr(123.0)), "123");
    EXPECT_EQ(printAst(LiteralExpr(0.5)), "0.5");
    EXPECT_EQ(printAst(LiteralExpr(std::string("hello"))), "hello");
    EXPECT_EQ(printAst(LiteralExpr(std::string(""))), "");
}

TEST(AstPrinterTest, UsesOperatorLexeme) {
    BinaryExpr expr(number(1), makeOperator(TokenType::BangEqual, "!="), number(2));
    EXPECT_EQ(printAst(expr), "(!= 1 2)");
}

TEST(AstPrinterTest, PrintingIsIdempotent) {
    GroupingExpr expr(std::make_unique<BinaryExpr>(
        number(1), makeOperator(TokenType::Plus, "+"),
        std::make_unique<UnaryExpr>(makeOperator(TokenType::Minus, "-"), number(2))));

    AstPrinter printer;
    std::string first = printer.print(expr);
    std::string second = printer.print(expr);
    EXPECT_EQ(first, "(group (+ 1 (- 2)))");
    EXPECT_EQ(first, second);
}

TEST(ExprVisitorTest, AcceptDispatchesToMatchingMethod) {
    KindVisitor visitor;
    LiteralExpr literal(1.0);
    UnaryExpr unary(makeOperator(TokenType::Minus, "-"), number(1));
    GroupingExpr grouping(number(1));
    BinaryExpr binary(number(1), makeOperator(TokenType::Plus, "+"), number(2));

    EXPECT_EQ(literal.accept(visitor), ExprType::Literal);
    EXPECT_EQ(unary.accept(visitor), ExprType::Unary);
    EXPECT_EQ(grouping.accept(visitor), ExprType::Grouping);
    EXPECT_EQ(binary.accept(visitor), ExprType::Binary);
}

TEST(ExprVisitorTest, VisitorChoosesResultType) {
    BinaryExpr expr(number(1), makeOperator(TokenType::Plus, "+"),
                    std::make_unique<GroupingExpr>(std::make_unique<UnaryExpr>(
                        makeOperator(TokenType::Minus, "-"), number(2))));

    DepthVisitor depth;
    EXPECT_EQ(expr.accept(depth), 4);
    EXPECT_EQ(expr.height(), 4u);
}

} // namespace
} // namespace lox
