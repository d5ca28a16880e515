//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the host interop opcode handlers: dynamic property reads, host
// function calls and evaluation of host source text.
//
// Host code reports failures by throwing HostError.  These handlers convert
// that into the matching trap kind; every other exception type propagates out
// of VM::run unchanged.
//
//===----------------------------------------------------------------------===//

#include "vm/OpHandlers_Host.hpp"

#include "vm/VM.hpp"
#include "vm/ValueOps.hpp"

#include <string>

namespace regvm::vm::detail::host
{

/// @brief PROPACCESS dst, obj, prop.
void handlePropAccess(VM &vm)
{
    const RegIndex dst = vm.nextByte();
    const RegIndex objReg = vm.nextByte();
    const RegIndex propReg = vm.nextByte();
    const Value &receiver = vm.reg(objReg);
    const Value &key = vm.reg(propReg);

    Value result;
    bool ok = false;
    try
    {
        ok = readProperty(receiver, key, result);
    }
    catch (const HostError &err)
    {
        vm.raise(TrapKind::HostCallFailure,
                 "reading '" + toDisplayString(key) + "': " + err.what());
    }
    if (!ok)
    {
        vm.raise(TrapKind::TypeMismatch,
                 "cannot read property '" + toDisplayString(key) + "' of " +
                     std::string(kindName(receiver.kind())));
    }
    vm.setReg(dst, std::move(result));
}

/// @brief FUNC_CALL dst, fn, this, args.
/// @details Arguments are a length-prefixed register list resolved before the
///          call.  The callee's return value is stored in @c dst.
void handleFuncCall(VM &vm)
{
    const RegIndex dst = vm.nextByte();
    const RegIndex fnReg = vm.nextByte();
    const RegIndex thisReg = vm.nextByte();
    const ValueArray args = vm.readRegisterArray();

    const Value callee = vm.reg(fnReg);
    if (!callee.isFunction())
    {
        vm.raise(TrapKind::TypeMismatch,
                 std::string(kindName(callee.kind())) + " is not callable");
    }

    Value result;
    try
    {
        result = callee.asFunction()->call(vm.reg(thisReg), args);
    }
    catch (const HostError &err)
    {
        vm.raise(TrapKind::HostCallFailure, callee.asFunction()->name() + ": " + err.what());
    }
    vm.setReg(dst, std::move(result));
}

/// @brief EVAL dst, src.
void handleEval(VM &vm)
{
    const RegIndex dst = vm.nextByte();
    const RegIndex srcReg = vm.nextByte();
    const Value &source = vm.reg(srcReg);
    if (!source.isString())
    {
        vm.raise(TrapKind::TypeMismatch,
                 "eval source is " + std::string(kindName(source.kind())) + ", expected string");
    }

    HostEvaluator *evaluator = vm.evaluator();
    if (!evaluator)
        vm.raise(TrapKind::HostEvaluationFailure, "no evaluator installed");

    Value result;
    try
    {
        result = evaluator->evaluate(source.asString());
    }
    catch (const HostError &err)
    {
        vm.raise(TrapKind::HostEvaluationFailure, err.what());
    }
    vm.setReg(dst, std::move(result));
}

} // namespace regvm::vm::detail::host
