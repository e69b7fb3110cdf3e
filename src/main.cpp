#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "console.hpp"
#include "file_utils.hpp"
#include "frontend.hpp"
#include "tokenizer.hpp"

namespace {

// Коды завершения (sysexits.h)
constexpr int kExitOk = 0;
constexpr int kExitUsage = 64;
constexpr int kExitDataError = 65;
constexpr int kExitIoError = 74;

void printUsage() {
    std::cerr << "Использование: loxfront [tokens] [файл]\n"
              << "  без аргументов   интерактивный режим, печать дерева каждой строки\n"
              << "  <файл>           разбор файла и печать дерева\n"
              << "  tokens [файл]    вывод потока токенов\n";
}

// Поток токенов вместе с ошибками в порядке исходного текста
bool dumpTokens(const std::string& source) {
    bool ok = true;
    for (const auto& result : lox::scan(source)) {
        if (const auto* token = std::get_if<lox::Token>(&result)) {
            std::cout << lox::toString(*token) << "\n";
        } else {
            printError(lox::toString(std::get<lox::LexicalError>(result)));
            ok = false;
        }
    }
    return ok;
}

bool printTree(const lox::Frontend& frontend, const std::string& source) {
    lox::FrontendReport report = frontend.run(source);

    for (const auto& error : report.lexicalErrors) {
        printError(lox::toString(error));
    }
    if (report.parseError) {
        printError(lox::toString(*report.parseError));
    }
    if (report.printed) {
        std::cout << Color::GREEN << *report.printed << Color::RESET << "\n";
    }
    return report.ok();
}

bool runSource(const lox::Frontend& frontend, const std::string& source, bool tokensMode) {
    return tokensMode ? dumpTokens(source) : printTree(frontend, source);
}

int runFile(const std::filesystem::path& path, bool tokensMode) {
    std::string source;
    try {
        source = readSourceFile(path);
    } catch (const std::exception& ex) {
        printError(ex.what());
        return kExitIoError;
    }

    lox::Frontend frontend;
    return runSource(frontend, source, tokensMode) ? kExitOk : kExitDataError;
}

// Каждая строка разбирается отдельно, ошибка не прерывает цикл
int runPrompt(bool tokensMode) {
    printHeader();

    lox::Frontend frontend;
    std::string line;
    while (true) {
        std::cout << Color::BOLD << "> " << Color::RESET << std::flush;
        if (!std::getline(std::cin, line) || line.empty()) {
            break;
        }
        runSource(frontend, line, tokensMode);
    }

    std::cout << "\n" << Color::CYAN << "До свидания!" << Color::RESET << "\n";
    return kExitOk;
}

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    bool tokensMode = false;
    if (!args.empty() && args.front() == "tokens") {
        tokensMode = true;
        args.erase(args.begin());
    }

    if (args.size() > 1) {
        printUsage();
        return kExitUsage;
    }

    if (args.empty()) {
        return runPrompt(tokensMode);
    }
    return runFile(args.front(), tokensMode);
}
