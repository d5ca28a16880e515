//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/VMConstants.hpp
// Purpose: Centralized constants for the register file layout and VM limits.
// Key invariants: All constants are compile-time evaluable. Reserved register
//                 indices are distinct and lie in the top of the index range.
// Ownership/Lifetime: Static constants with program lifetime.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>

namespace regvm::vm
{

/// @brief Register index type; every byte addresses a valid register.
using RegIndex = uint8_t;

/// @brief Number of registers in the register file.
constexpr size_t kNumRegisters = 256;

/// @brief Reserved register indices holding machine state.
/// @details User data may occupy every other index.  The reserved block sits
///          at the top of the range so producers can allocate user registers
///          upward from zero.
namespace reg
{
/// Cursor position into the instruction/data stream.
constexpr RegIndex kStackPtr = 255;
/// Result surfaced by a completed run.
constexpr RegIndex kReturnVal = 254;
/// Register-file snapshot taken by CALL_BCFUNC.
constexpr RegIndex kBackup = 253;
/// Host global environment root.
constexpr RegIndex kEnv = 252;
/// Host document-like root.
constexpr RegIndex kDocument = 251;
/// Void constant.
constexpr RegIndex kVoid = 250;
/// Empty-object constant.
constexpr RegIndex kEmptyObj = 249;
/// Lowest reserved index.
constexpr RegIndex kFirstReserved = kEmptyObj;
} // namespace reg

/// @brief Width in bytes of the length prefix used by strings and register arrays.
constexpr size_t kLengthPrefixBytes = 2;

/// @brief Largest payload a 16-bit length prefix can describe.
constexpr size_t kMaxPrefixedLength = 0xFFFF;

} // namespace regvm::vm
