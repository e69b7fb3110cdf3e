#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>

#include "token.hpp"

namespace lox {

// Вид узла выражения (закрытый набор)
enum class ExprType {
    Binary,
    Unary,
    Grouping,
    Literal
};

class BinaryExpr;
class UnaryExpr;
class GroupingExpr;
class LiteralExpr;

// Интерфейс обхода дерева.
// Тип результата R выбирает конкретный посетитель
// (строка для печати, значение для будущего вычислителя и т.д.).
template <typename R>
class ExprVisitor {
public:
    virtual ~ExprVisitor() = default;

    virtual R visitBinary(const BinaryExpr& expr) = 0;
    virtual R visitUnary(const UnaryExpr& expr) = 0;
    virtual R visitGrouping(const GroupingExpr& expr) = 0;
    virtual R visitLiteral(const LiteralExpr& expr) = 0;
};

// Базовый класс для узла абстрактного синтаксического дерева (AST).
// Узел владеет своими потомками, дерево не содержит циклов.
class Expr {
public:
    virtual ~Expr() = default;

    virtual ExprType type() const = 0;

    // Высота поддерева: лист имеет высоту 1
    std::size_t height() const { return treeHeight; }

    // Передаёт узел в единственный подходящий метод посетителя
    template <typename R>
    R accept(ExprVisitor<R>& visitor) const;

protected:
    explicit Expr(std::size_t treeHeight) : treeHeight(treeHeight) {}

private:
    std::size_t treeHeight;
};

using ExprPtr = std::unique_ptr<Expr>;

// Бинарная операция: сравнение, равенство или арифметика
class BinaryExpr final : public Expr {
public:
    BinaryExpr(ExprPtr left, Token op, ExprPtr right)
        : Expr(1 + std::max(left->height(), right->height())),
          left(std::move(left)),
          op(std::move(op)),
          right(std::move(right)) {}

    ExprType type() const override { return ExprType::Binary; }

    const Expr& getLeft() const { return *left; }
    const Token& getOperator() const { return op; }
    const Expr& getRight() const { return *right; }

private:
    ExprPtr left;
    Token op;
    ExprPtr right;
};

// Унарная операция (префиксный минус)
class UnaryExpr final : public Expr {
public:
    UnaryExpr(Token op, ExprPtr right)
        : Expr(1 + right->height()), op(std::move(op)), right(std::move(right)) {}

    ExprType type() const override { return ExprType::Unary; }

    const Token& getOperator() const { return op; }
    const Expr& getRight() const { return *right; }

private:
    Token op;
    ExprPtr right;
};

// Выражение в скобках. Сохраняется отдельным узлом.
class GroupingExpr final : public Expr {
public:
    explicit GroupingExpr(ExprPtr inner)
        : Expr(1 + inner->height()), inner(std::move(inner)) {}

    ExprType type() const override { return ExprType::Grouping; }

    const Expr& getInner() const { return *inner; }

private:
    ExprPtr inner;
};

// Лист дерева: число или строка
class LiteralExpr final : public Expr {
public:
    explicit LiteralExpr(LiteralValue value) : Expr(1), value(std::move(value)) {}

    ExprType type() const override { return ExprType::Literal; }

    const LiteralValue& getValue() const { return value; }

private:
    LiteralValue value;
};

template <typename R>
R Expr::accept(ExprVisitor<R>& visitor) const {
    switch (type()) {
    case ExprType::Binary:
        return visitor.visitBinary(static_cast<const BinaryExpr&>(*this));
    case ExprType::Unary:
        return visitor.visitUnary(static_cast<const UnaryExpr&>(*this));
    case ExprType::Grouping:
        return visitor.visitGrouping(static_cast<const GroupingExpr&>(*this));
    case ExprType::Literal:
        break;
    }
    return visitor.visitLiteral(static_cast<const LiteralExpr&>(*this));
}

} // namespace lox
