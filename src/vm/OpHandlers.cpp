//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/OpHandlers.cpp
// Purpose: Materialise the opcode dispatch table used by the VM execution loop.
// Key invariants: Entries are indexed by opcode byte; unassigned bytes map to
//                 null and trap as UnknownOpcode.
// Ownership/Lifetime: The table is static and shared across VM instances.
//
//===----------------------------------------------------------------------===//

#include "vm/OpHandlers.hpp"

#include "bytecode/Bytecode.hpp"

namespace regvm::vm::detail
{

namespace
{
using bytecode::BCOpcode;

VM::OpcodeHandlerTable buildHandlerTable()
{
    VM::OpcodeHandlerTable table{};
    const auto bind = [&table](BCOpcode op, VM::OpcodeHandler fn)
    { table[bytecode::toByte(op)] = fn; };

    bind(BCOpcode::LOAD_NUM, &handleLoadNum);
    bind(BCOpcode::LOAD_LONG_NUM, &handleLoadLongNum);
    bind(BCOpcode::LOAD_FLOAT_NUM, &handleLoadFloatNum);
    bind(BCOpcode::LOAD_STRING, &handleLoadString);
    bind(BCOpcode::COPY, &handleCopy);

    bind(BCOpcode::ADD, &handleAdd);
    bind(BCOpcode::SUB, &handleSub);
    bind(BCOpcode::MUL, &handleMul);
    bind(BCOpcode::DIV, &handleDiv);

    bind(BCOpcode::COMP_EQ, &handleCompEq);
    bind(BCOpcode::COMP_NE, &handleCompNe);
    bind(BCOpcode::COMP_STRICT_EQ, &handleCompStrictEq);
    bind(BCOpcode::COMP_STRICT_NE, &handleCompStrictNe);
    bind(BCOpcode::COMP_LT, &handleCompLt);
    bind(BCOpcode::COMP_GT, &handleCompGt);
    bind(BCOpcode::COMP_LE, &handleCompLe);
    bind(BCOpcode::COMP_GE, &handleCompGe);

    bind(BCOpcode::COND_JUMP, &handleCondJump);
    bind(BCOpcode::CALL_BCFUNC, &handleCallBcFunc);
    bind(BCOpcode::RETURN_BCFUNC, &handleReturnBcFunc);
    bind(BCOpcode::EXIT, &handleExit);

    bind(BCOpcode::PROPACCESS, &handlePropAccess);
    bind(BCOpcode::FUNC_CALL, &handleFuncCall);
    bind(BCOpcode::EVAL, &handleEval);
    return table;
}
} // namespace

/// @brief Expose the process-wide opcode handler table.
/// @details Built on first use; later calls return the same table.
const VM::OpcodeHandlerTable &getOpcodeHandlers()
{
    static const VM::OpcodeHandlerTable table = buildHandlerTable();
    return table;
}

} // namespace regvm::vm::detail
