#include "console.hpp"

#include <string>

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║    Lox: разбор выражений v1.0                             ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET;
    std::cout << Color::GRAY << "Пустая строка или Ctrl+D для выхода" << Color::RESET << "\n\n";
}

void printError(const std::string& message) {
    std::cerr << Color::RED << Color::BOLD << "✗ " << Color::RESET << Color::RED << message
              << Color::RESET << "\n";
}
