//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/BytecodeLoader.cpp
// Purpose: Standardise how tools load bytecode files into memory.
// Key invariants: The loaded buffer contains the complete decoded stream.
// Ownership/Lifetime: The returned vector owns its bytes.
//
//===----------------------------------------------------------------------===//

#include "bytecode/BytecodeLoader.hpp"

#include <cctype>
#include <fstream>
#include <new>
#include <sstream>

namespace regvm::bytecode
{

namespace
{
constexpr auto kMaxBytecodeSize = static_cast<std::streamoff>(64ULL * 1024 * 1024);

int hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

bool isSpace(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}
} // namespace

bool looksLikeHexText(std::string_view text)
{
    bool sawDigit = false;
    bool inComment = false;
    for (char c : text)
    {
        if (inComment)
        {
            inComment = c != '\n';
            continue;
        }
        if (c == '#')
            inComment = true;
        else if (hexValue(c) >= 0)
            sawDigit = true;
        else if (!isSpace(c))
            return false;
    }
    return sawDigit;
}

ByteResult parseHexBytecode(std::string_view text)
{
    std::vector<uint8_t> bytes;
    bytes.reserve(text.size() / 2);
    int pending = -1;
    size_t line = 1;
    bool inComment = false;
    for (char c : text)
    {
        if (c == '\n')
        {
            ++line;
            inComment = false;
            continue;
        }
        if (inComment)
            continue;
        if (c == '#')
        {
            inComment = true;
            continue;
        }
        if (isSpace(c))
            continue;

        const int v = hexValue(c);
        if (v < 0)
        {
            return ByteResult::failure("invalid hex character '" + std::string(1, c) +
                                       "' on line " + std::to_string(line));
        }
        if (pending < 0)
        {
            pending = v;
        }
        else
        {
            bytes.push_back(static_cast<uint8_t>(pending * 16 + v));
            pending = -1;
        }
    }
    if (pending >= 0)
        return ByteResult::failure("odd number of hex digits");
    return ByteResult::success(std::move(bytes));
}

ByteResult loadBytecodeFile(const std::string &path, BytecodeFormat format)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return ByteResult::failure("unable to open " + path);

    in.seekg(0, std::ios::end);
    const auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    if (fileSize < 0 || fileSize > kMaxBytecodeSize)
        return ByteResult::failure("bytecode file too large: " + path + " (limit: 64 MB)");

    std::string contents;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        contents = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return ByteResult::failure("out of memory reading " + path);
    }
    if (in.bad())
        return ByteResult::failure("error reading " + path);

    const bool asHex = format == BytecodeFormat::Hex ||
                       (format == BytecodeFormat::Auto && looksLikeHexText(contents));
    if (asHex)
    {
        ByteResult decoded = parseHexBytecode(contents);
        if (!decoded)
            return ByteResult::failure(path + ": " + decoded.error());
        return decoded;
    }
    return ByteResult::success(std::vector<uint8_t>(contents.begin(), contents.end()));
}

} // namespace regvm::bytecode
