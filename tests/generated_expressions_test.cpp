#include <gtest/gtest.h>

#include <string>

#include "ast_printer.hpp"
#include "expression_generator.hpp"
#include "frontend.hpp"
#include "tokenizer.hpp"

namespace lox {
namespace {

using test_support::ExpressionGenerator;

constexpr unsigned kSeed = 20240517;
constexpr int kIterations = 500;

int depthFor(int iteration) {
    return 1 + iteration % 6;
}

// Печать совпадает с деревом, из которого был построен исходный текст:
// приоритеты, ассоциативность и скобки восстановлены верно
TEST(GeneratedExpressionsTest, ParsedTreeMatchesGeneratedTree) {
    ExpressionGenerator generator(kSeed);
    Frontend frontend;
    for (int i = 0; i < kIterations; ++i) {
        auto tree = generator.generate(depthFor(i));
        std::string source = generator.render(*tree, false);

        FrontendReport report = frontend.run(source);
        ASSERT_TRUE(report.ok()) << "source: " << source;
        ASSERT_TRUE(report.printed.has_value());
        EXPECT_EQ(*report.printed, ExpressionGenerator::expected(*tree)) << "source: " << source;
    }
}

// Пробелы, переводы строк и комментарии не влияют на дерево
TEST(GeneratedExpressionsTest, SpacingDoesNotChangeTree) {
    ExpressionGenerator generator(kSeed + 1);
    Frontend frontend;
    for (int i = 0; i < kIterations; ++i) {
        auto tree = generator.generate(depthFor(i));
        std::string spaced = generator.render(*tree, false);
        std::string compact = generator.render(*tree, true);

        FrontendReport spacedReport = frontend.run(spaced);
        FrontendReport compactReport = frontend.run(compact);
        ASSERT_TRUE(spacedReport.ok()) << "source: " << spaced;
        ASSERT_TRUE(compactReport.ok()) << "source: " << compact;
        EXPECT_EQ(spacedReport.printed, compactReport.printed);
    }
}

TEST(GeneratedExpressionsTest, ScanningAndPrintingAreDeterministic) {
    ExpressionGenerator generator(kSeed + 2);
    for (int i = 0; i < kIterations; ++i) {
        auto tree = generator.generate(depthFor(i));
        std::string source = generator.render(*tree, false);

        auto first = scan(source);
        auto second = scan(source);
        ASSERT_EQ(first, second) << "source: " << source;

        ParseResult result = parse(tokensOf(first));
        ASSERT_TRUE(result.ok()) << "source: " << source;
        AstPrinter printer;
        EXPECT_EQ(printer.print(result.expression()), printer.print(result.expression()));
    }
}

// Внесённая ошибка всегда обнаруживается, дерево не возвращается
TEST(GeneratedExpressionsTest, InjectedErrorsAreReported) {
    ExpressionGenerator generator(kSeed + 3);
    Frontend frontend;
    for (int i = 0; i < kIterations; ++i) {
        auto tree = generator.generate(depthFor(i));
        std::string broken = generator.introduceError(generator.render(*tree, false));

        FrontendReport report = frontend.run(broken);
        EXPECT_FALSE(report.ok()) << "source: " << broken;
        EXPECT_FALSE(report.printed.has_value());
        EXPECT_EQ(report.tree, nullptr);
    }
}

} // namespace
} // namespace lox
