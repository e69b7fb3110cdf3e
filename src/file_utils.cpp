#include "file_utils.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

std::string readSourceFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Файл не найден: " + path.string());
    }
    if (!std::filesystem::is_regular_file(path)) {
        throw std::runtime_error("Не является файлом: " + path.string());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл: " + path.string());
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        throw std::runtime_error("Ошибка чтения файла: " + path.string());
    }
    return buffer.str();
}
