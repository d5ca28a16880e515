//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements trap formatting for the register VM.
//
//===----------------------------------------------------------------------===//

#include "vm/Trap.hpp"

#include "bytecode/Bytecode.hpp"

namespace regvm::vm
{

/// @brief Format a trap error into a printable string.
///
/// @details Consolidates the faulting program counter, the opcode mnemonic and
///          the trap category into a concise diagnostic.  Unassigned opcode
///          bytes are rendered as "opcode#<n>" so the raw byte is visible.
///
/// @param error Trap record describing the failure.
/// @return Human-readable description of the trap.
std::string formatTrap(const VmError &error)
{
    const auto kindStr = toString(error.kind);

    std::string result;
    result.reserve(48 + error.message.size());

    result.append("Trap @pc#");
    result.append(std::to_string(error.pc));
    result.append(" (");
    if (bytecode::isDefinedOpcode(error.opcode))
        result.append(bytecode::opcodeName(error.opcode));
    else
    {
        result.append("opcode#");
        result.append(std::to_string(error.opcode));
    }
    result.append("): ");
    result.append(kindStr);
    if (!error.message.empty())
    {
        result.append(": ");
        result.append(error.message);
    }
    return result;
}

} // namespace regvm::vm
