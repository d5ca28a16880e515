//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the control-flow opcode handlers.  Branch targets are validated
// through VM::setStackPtr so every jump lands inside [0, streamLength].
//
// Bytecode subroutines use a single save slot: CALL_BCFUNC snapshots the whole
// register file into REG_BACKUP and RETURN_BCFUNC restores it, carrying only
// RETURN_VAL across.  The snapshot is taken after the call's operand has been
// consumed, so the saved stack pointer is the return address.  A nested call
// overwrites the slot; the outer snapshot survives only as a register inside
// the inner one.
//
//===----------------------------------------------------------------------===//

#include "vm/OpHandlers_Control.hpp"

#include "vm/VM.hpp"
#include "vm/ValueOps.hpp"

#include <string>

namespace regvm::vm::detail::control
{

/// @brief COND_JUMP cond, delta.
/// @details The delta is relative to the offset just past the operands.  The
///          delta register is only inspected when the branch is taken.
void handleCondJump(VM &vm)
{
    const RegIndex condReg = vm.nextByte();
    const RegIndex deltaReg = vm.nextByte();
    if (!isTruthy(vm.reg(condReg)))
        return;

    const Value &delta = vm.reg(deltaReg);
    if (!delta.isNumber())
    {
        vm.raise(TrapKind::TypeMismatch,
                 "jump delta is " + std::string(kindName(delta.kind())) + ", expected number");
    }
    const double base = static_cast<double>(vm.stackPtr());
    vm.setStackPtr(base + delta.asNumber());
}

/// @brief CALL_BCFUNC target8.
void handleCallBcFunc(VM &vm)
{
    const uint8_t target = vm.nextByte();
    if (target > vm.streamLength())
    {
        vm.raise(TrapKind::OutOfBounds,
                 "call target " + std::to_string(target) + " beyond " +
                     std::to_string(vm.streamLength()) + "-byte stream");
    }
    vm.setReg(reg::kBackup, vm.registers().snapshot());
    vm.setStackPtr(target);
}

/// @brief RETURN_BCFUNC.
void handleReturnBcFunc(VM &vm)
{
    Value result = vm.reg(reg::kReturnVal);
    const Value saved = vm.reg(reg::kBackup);
    if (!vm.registers().restore(saved))
    {
        vm.raise(TrapKind::TypeMismatch,
                 "return without call: REG_BACKUP holds " +
                     std::string(kindName(saved.kind())) + ", expected register snapshot");
    }
    vm.setReg(reg::kReturnVal, std::move(result));
}

/// @brief EXIT: move the cursor to the end of the stream.
void handleExit(VM &vm)
{
    vm.setStackPtr(static_cast<double>(vm.streamLength()));
}

} // namespace regvm::vm::detail::control
