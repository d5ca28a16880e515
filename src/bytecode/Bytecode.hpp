//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Bytecode.hpp
// Purpose: Bytecode stream format and opcode definitions.
// Key invariants: Every instruction is one opcode byte followed by a fixed,
//                 opcode-specific operand sequence. Multi-byte operands are
//                 big-endian. Opcodes are grouped by functional category.
// Ownership: Part of the bytecode subsystem; no external dependencies.
// Lifetime: Constants and inline helpers are header-only; opcodeName() is defined
//           in the corresponding .cpp translation unit.
//
//===----------------------------------------------------------------------===//
//
// This file defines the byte-addressed stream format executed by the register
// VM.  Code and inline data share one flat byte sequence; the stack-pointer
// register is the only cursor into it.
//
// Instruction Encoding:
// - [opcode:8][operand:8]...  operands are register indices or raw bytes
// - Strings:         [len_hi:8][len_lo:8][byte]*len
// - Register arrays: [len_hi:8][len_lo:8][reg:8]*len
// - Wide integers:   4 bytes, big-endian two's complement
// - Wide floats:     8 bytes, big-endian IEEE-754

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace regvm::bytecode
{

/// @brief Bytecode opcodes for the register VM.
/// @details Encoding categories:
///          - 0x00-0x0F  Data movement and literal loading
///          - 0x10-0x1F  Arithmetic
///          - 0x20-0x2F  Comparisons
///          - 0x30-0x3F  Control flow and bytecode subroutines
///          - 0x40-0x4F  Host interop
enum class BCOpcode : uint8_t
{
    // Data (0x00-0x0F)
    LOAD_NUM = 0x00,       ///< dst, imm8: reg[dst] = imm8.
    LOAD_LONG_NUM = 0x01,  ///< dst, i32: reg[dst] = signed 32-bit immediate.
    LOAD_FLOAT_NUM = 0x02, ///< dst, f64: reg[dst] = 64-bit float immediate.
    LOAD_STRING = 0x03,    ///< dst, str: reg[dst] = length-prefixed string.
    COPY = 0x04,           ///< dst, src: reg[dst] = reg[src].

    // Arithmetic (0x10-0x1F)
    ADD = 0x10, ///< dst, src: reg[dst] = reg[dst] + reg[src] (numeric or concat).
    SUB = 0x11, ///< dst, src: reg[dst] = reg[dst] - reg[src].
    MUL = 0x12, ///< dst, src: reg[dst] = reg[dst] * reg[src].
    DIV = 0x13, ///< dst, src: reg[dst] = reg[dst] / reg[src].

    // Comparisons (0x20-0x2F)
    COMP_EQ = 0x20,        ///< dst, a, b: loose equality.
    COMP_NE = 0x21,        ///< dst, a, b: loose inequality.
    COMP_STRICT_EQ = 0x22, ///< dst, a, b: strict equality.
    COMP_STRICT_NE = 0x23, ///< dst, a, b: strict inequality.
    COMP_LT = 0x24,        ///< dst, a, b: a < b.
    COMP_GT = 0x25,        ///< dst, a, b: a > b.
    COMP_LE = 0x26,        ///< dst, a, b: a <= b.
    COMP_GE = 0x27,        ///< dst, a, b: a >= b.

    // Control Flow (0x30-0x3F)
    COND_JUMP = 0x30,     ///< cond, delta: relative jump when reg[cond] is truthy.
    CALL_BCFUNC = 0x31,   ///< target8: save registers, jump to absolute target.
    RETURN_BCFUNC = 0x32, ///< Restore registers, keeping RETURN_VAL.
    EXIT = 0x33,          ///< Move the stack pointer to the end of the stream.

    // Host Interop (0x40-0x4F)
    PROPACCESS = 0x40, ///< dst, obj, prop: reg[dst] = reg[obj][reg[prop]].
    FUNC_CALL = 0x41,  ///< dst, fn, this, regs: call a host function.
    EVAL = 0x42,       ///< dst, src: evaluate host source in reg[src].
};

/// @brief Number of distinct opcode byte values.
constexpr size_t kOpcodeSpace = 256;

/// @brief Get the human-readable name for an opcode byte.
/// @details Used for trace output and diagnostics.
/// @param op Raw opcode byte.
/// @return A NUL-terminated mnemonic, or "UNKNOWN" for unassigned bytes.
const char *opcodeName(uint8_t op);

/// @brief Convenience overload for typed opcodes.
inline const char *opcodeName(BCOpcode op)
{
    return opcodeName(static_cast<uint8_t>(op));
}

/// @brief Check whether @p op names one of the defined opcodes.
bool isDefinedOpcode(uint8_t op);

/// @brief Convert an opcode to its stream byte.
inline constexpr uint8_t toByte(BCOpcode op)
{
    return static_cast<uint8_t>(op);
}

//==============================================================================
// Length-prefix Helpers
//==============================================================================

/// @brief Combine the two prefix bytes into a 16-bit big-endian length.
/// @details Both bytes always participate.  Producers that relied on the
///          prefix being evaluated as `(hi << 8) || lo` are not supported.
inline constexpr uint16_t decodeLength16(uint8_t hi, uint8_t lo)
{
    return static_cast<uint16_t>(hi * 256u + lo);
}

/// @brief Split @p length into its big-endian prefix bytes.
inline constexpr std::array<uint8_t, 2> encodeLength16(uint16_t length)
{
    return {static_cast<uint8_t>(length >> 8), static_cast<uint8_t>(length & 0xFF)};
}

} // namespace regvm::bytecode
