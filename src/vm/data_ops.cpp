//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the data movement opcode handlers: immediate loads of every
// width, inline string loads and register copies.
//
//===----------------------------------------------------------------------===//

#include "vm/OpHandlers_Data.hpp"

#include "vm/VM.hpp"

namespace regvm::vm::detail::data
{

/// @brief LOAD_NUM dst, imm8.
/// @details The immediate is a raw unsigned byte, so only 0-255 are reachable;
///          wider constants use LOAD_LONG_NUM or LOAD_FLOAT_NUM.
void handleLoadNum(VM &vm)
{
    const RegIndex dst = vm.nextByte();
    const uint8_t imm = vm.nextByte();
    vm.setReg(dst, Value::number(imm));
}

/// @brief LOAD_LONG_NUM dst, i32.
void handleLoadLongNum(VM &vm)
{
    const RegIndex dst = vm.nextByte();
    const int32_t imm = vm.readInt32();
    vm.setReg(dst, Value::number(imm));
}

/// @brief LOAD_FLOAT_NUM dst, f64.
void handleLoadFloatNum(VM &vm)
{
    const RegIndex dst = vm.nextByte();
    const double imm = vm.readFloat64();
    vm.setReg(dst, Value::number(imm));
}

/// @brief LOAD_STRING dst, str.
void handleLoadString(VM &vm)
{
    const RegIndex dst = vm.nextByte();
    vm.setReg(dst, Value(vm.readString()));
}

/// @brief COPY dst, src.
/// @details Arrays and host handles are shared, not cloned.  Copying into
///          STACK_PTR acts as an absolute jump.
void handleCopy(VM &vm)
{
    const RegIndex dst = vm.nextByte();
    const RegIndex src = vm.nextByte();
    vm.setReg(dst, vm.reg(src));
}

} // namespace regvm::vm::detail::data
