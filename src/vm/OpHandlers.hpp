//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/OpHandlers.hpp
// Purpose: Aggregate opcode handler category declarations for VM dispatch wiring.
// Key invariants: Provides unified access points to handler functions grouped by category.
// Ownership/Lifetime: Functions exposed through this header do not own VM resources.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/OpHandlers_Arith.hpp"
#include "vm/OpHandlers_Control.hpp"
#include "vm/OpHandlers_Data.hpp"
#include "vm/OpHandlers_Host.hpp"
#include "vm/VM.hpp"

namespace regvm::vm::detail
{
using data::handleCopy;
using data::handleLoadFloatNum;
using data::handleLoadLongNum;
using data::handleLoadNum;
using data::handleLoadString;

using arith::handleAdd;
using arith::handleCompEq;
using arith::handleCompGe;
using arith::handleCompGt;
using arith::handleCompLe;
using arith::handleCompLt;
using arith::handleCompNe;
using arith::handleCompStrictEq;
using arith::handleCompStrictNe;
using arith::handleDiv;
using arith::handleMul;
using arith::handleSub;

using control::handleCallBcFunc;
using control::handleCondJump;
using control::handleExit;
using control::handleReturnBcFunc;

using host::handleEval;
using host::handleFuncCall;
using host::handlePropAccess;

const VM::OpcodeHandlerTable &getOpcodeHandlers();

} // namespace regvm::vm::detail
