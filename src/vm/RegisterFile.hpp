//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/RegisterFile.hpp
// Purpose: Fixed-size register storage for the interpreter.
// Key invariants: Exactly kNumRegisters cells; an index is a single byte so
//                 every encodable register exists.
// Ownership/Lifetime: Owned by the VM; cells hold Values by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "regvm/vm/Value.hpp"
#include "vm/VMConstants.hpp"

#include <array>

namespace regvm::vm
{

/// @brief Indexed storage of dynamically-typed values.
class RegisterFile
{
  public:
    /// @brief Create a register file with every cell set to void.
    RegisterFile() = default;

    const Value &get(RegIndex index) const
    {
        return regs_[index];
    }

    void set(RegIndex index, Value value)
    {
        regs_[index] = std::move(value);
    }

    /// @brief Reset every cell to void.
    void clear();

    /// @brief Copy all registers into a fresh array value.
    /// @return Array of kNumRegisters elements in register order.
    [[nodiscard]] Value snapshot() const;

    /// @brief Replace all registers from a value produced by snapshot().
    /// @return False when @p saved is not an array of kNumRegisters elements;
    ///         registers are left unchanged in that case.
    bool restore(const Value &saved);

  private:
    std::array<Value, kNumRegisters> regs_{};
};

} // namespace regvm::vm
