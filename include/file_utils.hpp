#pragma once

#include <filesystem>
#include <string>

// Чтение всего файла с исходным текстом.
// Выбрасывает std::runtime_error, если файл не удаётся открыть или прочитать.
std::string readSourceFile(const std::filesystem::path& path);
