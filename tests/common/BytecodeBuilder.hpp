// File: tests/common/BytecodeBuilder.hpp
// Purpose: Emit bytecode streams for tests without hand-counting bytes.
// Key invariants: Every emitter appends exactly the encoding the VM decodes.
// Ownership/Lifetime: Owns the byte vector under construction.

#pragma once

#include "bytecode/Bytecode.hpp"
#include "vm/VMConstants.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace regvm::tests
{

using regvm::bytecode::BCOpcode;
using regvm::vm::RegIndex;

/// @brief Fluent bytecode emitter used by the test suites.
class BytecodeBuilder
{
  public:
    BytecodeBuilder &op(BCOpcode opcode);
    BytecodeBuilder &byte(uint8_t value);
    BytecodeBuilder &raw(std::initializer_list<uint8_t> values);

    BytecodeBuilder &loadNum(RegIndex dst, uint8_t imm);
    BytecodeBuilder &loadLong(RegIndex dst, int32_t imm);
    BytecodeBuilder &loadFloat(RegIndex dst, double imm);
    BytecodeBuilder &loadString(RegIndex dst, std::string_view text);
    BytecodeBuilder &copy(RegIndex dst, RegIndex src);

    BytecodeBuilder &add(RegIndex dst, RegIndex src);
    BytecodeBuilder &sub(RegIndex dst, RegIndex src);
    BytecodeBuilder &mul(RegIndex dst, RegIndex src);
    BytecodeBuilder &div(RegIndex dst, RegIndex src);

    /// @brief Emit one of the COMP_* opcodes.
    BytecodeBuilder &compare(BCOpcode opcode, RegIndex dst, RegIndex a, RegIndex b);

    BytecodeBuilder &condJump(RegIndex cond, RegIndex delta);
    BytecodeBuilder &call(uint8_t target);
    BytecodeBuilder &ret();
    BytecodeBuilder &exit();

    BytecodeBuilder &propAccess(RegIndex dst, RegIndex obj, RegIndex prop);
    BytecodeBuilder &funcCall(RegIndex dst,
                              RegIndex fn,
                              RegIndex self,
                              std::initializer_list<RegIndex> args);
    BytecodeBuilder &eval(RegIndex dst, RegIndex src);

    /// @brief Current stream length; the offset the next byte will occupy.
    [[nodiscard]] size_t size() const
    {
        return bytes_.size();
    }

    [[nodiscard]] const std::vector<uint8_t> &bytes() const
    {
        return bytes_;
    }

    [[nodiscard]] std::vector<uint8_t> build() const
    {
        return bytes_;
    }

  private:
    void lengthPrefix(size_t length);

    std::vector<uint8_t> bytes_;
};

} // namespace regvm::tests
