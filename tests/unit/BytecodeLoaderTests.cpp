// File: tests/unit/BytecodeLoaderTests.cpp
// Purpose: Unit tests for hex-text detection, hex decoding and file loading.
// Key invariants: Hex text ignores whitespace and '#' comments; raw files are
//                 returned byte for byte.
// Ownership/Lifetime: Temporary files are created and removed by each test.

#include "bytecode/BytecodeLoader.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace regvm::bytecode;

namespace
{
class TempFile
{
  public:
    TempFile(const std::string &name, const std::string &contents)
        : path_(std::filesystem::temp_directory_path() / name)
    {
        std::ofstream out(path_, std::ios::binary);
        out << contents;
    }

    ~TempFile()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const
    {
        return path_.string();
    }

  private:
    std::filesystem::path path_;
};
} // namespace

TEST(BytecodeLoader, DetectsHexText)
{
    EXPECT_TRUE(looksLikeHexText("00 fe 01\n"));
    EXPECT_TRUE(looksLikeHexText("# program\n0033 # exit\n"));
    EXPECT_FALSE(looksLikeHexText(""));
    EXPECT_FALSE(looksLikeHexText("# only a comment\n"));
    EXPECT_FALSE(looksLikeHexText(std::string("\x00\x01", 2)));
    EXPECT_FALSE(looksLikeHexText("0g"));
}

TEST(BytecodeLoader, ParsesHexWithCommentsAndWhitespace)
{
    auto r = parseHexBytecode("00 fe 03   # LOAD_NUM\n\t33\n");
    ASSERT_TRUE(r.isOk());
    EXPECT_EQ(r.value(), (std::vector<uint8_t>{0x00, 0xFE, 0x03, 0x33}));
}

TEST(BytecodeLoader, HexDigitsMayStraddleWhitespace)
{
    auto r = parseHexBytecode("0 0FE");
    ASSERT_TRUE(r.isOk());
    EXPECT_EQ(r.value(), (std::vector<uint8_t>{0x00, 0xFE}));
}

TEST(BytecodeLoader, ReportsBadHexCharacterWithLine)
{
    auto r = parseHexBytecode("00\n0z\n");
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error(), "invalid hex character 'z' on line 2");
}

TEST(BytecodeLoader, ReportsOddDigitCount)
{
    auto r = parseHexBytecode("001");
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error(), "odd number of hex digits");
}

TEST(BytecodeLoader, LoadsHexFileAutomatically)
{
    TempFile file("regvm_loader_hex.txt", "00 fe 07\n33\n");
    auto r = loadBytecodeFile(file.path());
    ASSERT_TRUE(r.isOk());
    EXPECT_EQ(r.value(), (std::vector<uint8_t>{0x00, 0xFE, 0x07, 0x33}));
}

TEST(BytecodeLoader, LoadsBinaryFileVerbatim)
{
    const std::string raw("\x00\xFE\x07\x33", 4);
    TempFile file("regvm_loader_raw.bin", raw);
    auto r = loadBytecodeFile(file.path());
    ASSERT_TRUE(r.isOk());
    EXPECT_EQ(r.value(), (std::vector<uint8_t>{0x00, 0xFE, 0x07, 0x33}));
}

TEST(BytecodeLoader, ForcedBinaryKeepsHexLookingText)
{
    TempFile file("regvm_loader_forced.bin", "33");
    auto r = loadBytecodeFile(file.path(), BytecodeFormat::Binary);
    ASSERT_TRUE(r.isOk());
    EXPECT_EQ(r.value(), (std::vector<uint8_t>{'3', '3'}));
}

TEST(BytecodeLoader, ForcedHexPrefixesErrorsWithPath)
{
    TempFile file("regvm_loader_bad.txt", "0x33");
    auto r = loadBytecodeFile(file.path(), BytecodeFormat::Hex);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error(), file.path() + ": invalid hex character 'x' on line 1");
}

TEST(BytecodeLoader, MissingFileFails)
{
    auto r = loadBytecodeFile("/nonexistent/regvm/program.bin");
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().rfind("unable to open", 0), 0u);
}
