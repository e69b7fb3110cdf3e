#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "file_utils.hpp"

namespace {

class ReadSourceFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory = std::filesystem::temp_directory_path() /
                    ("loxfront_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                     "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(directory);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(directory, ec);
    }

    std::filesystem::path writeFile(const std::string& name, const std::string& content) {
        std::filesystem::path path = directory / name;
        std::ofstream output(path, std::ios::binary);
        output << content;
        return path;
    }

    std::filesystem::path directory;
};

TEST_F(ReadSourceFileTest, ReadsWholeFileVerbatim) {
    const std::string content = "1 + 2\r\n// комментарий\n\"строка\"";
    auto path = writeFile("input.lox", content);
    EXPECT_EQ(readSourceFile(path), content);
}

TEST_F(ReadSourceFileTest, EmptyFileGivesEmptySource) {
    auto path = writeFile("empty.lox", "");
    EXPECT_EQ(readSourceFile(path), "");
}

TEST_F(ReadSourceFileTest, MissingFileThrows) {
    EXPECT_THROW(readSourceFile(directory / "missing.lox"), std::runtime_error);
}

TEST_F(ReadSourceFileTest, DirectoryThrows) {
    EXPECT_THROW(readSourceFile(directory), std::runtime_error);
}

} // namespace
