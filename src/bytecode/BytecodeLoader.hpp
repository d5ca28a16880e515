//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/BytecodeLoader.hpp
// Purpose: Read bytecode streams from disk as raw bytes or hex text.
// Key invariants: Hex text contains only hex digits, whitespace and `#`
//                 comments running to end of line; digits pair into bytes.
// Ownership/Lifetime: Returned vectors are owned by the caller.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace regvm::bytecode
{

/// @brief How a bytecode file should be decoded.
enum class BytecodeFormat
{
    Auto,   ///< Hex when the file looks like hex text, raw bytes otherwise.
    Binary, ///< Raw bytes.
    Hex,    ///< Hex text.
};

using ByteResult = support::Result<std::vector<uint8_t>>;

/// @brief Check whether @p text consists solely of hex digits, whitespace and
///        comments, with at least one digit.
bool looksLikeHexText(std::string_view text);

/// @brief Decode hex text into bytes.
/// @return Bytes, or an error naming the line of an invalid character or an
///         odd digit count.
ByteResult parseHexBytecode(std::string_view text);

/// @brief Load the bytecode stream stored at @p path.
ByteResult loadBytecodeFile(const std::string &path, BytecodeFormat format = BytecodeFormat::Auto);

} // namespace regvm::bytecode
