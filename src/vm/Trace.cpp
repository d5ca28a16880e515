//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trace.cpp
// Purpose: Implement deterministic tracing for VM steps.
// Key invariants: Each executed instruction produces at most one flushed line
//                 and trace emission honours @ref TraceConfig::mode.
// Ownership/Lifetime: Trace sinks emit to externally owned streams.
//
//===----------------------------------------------------------------------===//

#include "vm/Trace.hpp"

#include "bytecode/Bytecode.hpp"

#include <iostream>

namespace regvm::vm
{

/// @brief Determine whether tracing output should be emitted.
bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig c) : cfg(c) {}

/// @brief Emit `[TRACE] pc=<pc> <OPCODE>` for the instruction at @p pc.
/// @details Undefined opcode bytes are printed numerically since the step is
///          recorded before dispatch decides the byte has no handler.
void TraceSink::onStep(uint64_t pc, uint8_t opcode)
{
    if (!cfg.enabled())
        return;
    std::ostream &os = cfg.out ? *cfg.out : std::cerr;
    os << "[TRACE] pc=" << pc << ' ';
    if (bytecode::isDefinedOpcode(opcode))
        os << bytecode::opcodeName(opcode);
    else
        os << "opcode#" << static_cast<unsigned>(opcode);
    os << '\n';
    os.flush();
}

} // namespace regvm::vm
