// File: src/vm/Trap.hpp
// Purpose: Defines trap classification for VM diagnostics.
// Key invariants: Enum values map directly to trap categories used in diagnostics.
// Ownership/Lifetime: Not applicable.
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace regvm::vm
{

/// @brief Categorises fatal runtime conditions.
enum class TrapKind : int32_t
{
    UnknownOpcode = 0,         ///< No handler registered for the opcode byte.
    OutOfBounds = 1,           ///< Cursor read or jump outside the stream.
    TypeMismatch = 2,          ///< Operand of the wrong runtime kind.
    HostEvaluationFailure = 3, ///< EVAL source raised an error.
    HostCallFailure = 4,       ///< Host function reported a failure.
};

/// @brief Structured representation of a VM error record.
struct VmError
{
    TrapKind kind = TrapKind::TypeMismatch; ///< Trap classification.
    uint64_t pc = 0;                        ///< Stream offset of the faulting opcode byte.
    uint8_t opcode = 0;                     ///< Opcode byte being executed.
    std::string message;                    ///< Human-readable detail.
};

/// @brief Convert trap kind to canonical diagnostic string.
/// @param kind Enumerated trap kind.
/// @return Stable string view naming the trap category.
constexpr std::string_view toString(TrapKind kind) noexcept
{
    switch (kind)
    {
        case TrapKind::UnknownOpcode:
            return "UnknownOpcode";
        case TrapKind::OutOfBounds:
            return "OutOfBounds";
        case TrapKind::TypeMismatch:
            return "TypeMismatch";
        case TrapKind::HostEvaluationFailure:
            return "HostEvaluationFailure";
        case TrapKind::HostCallFailure:
            return "HostCallFailure";
    }
    return "TypeMismatch";
}

/// @brief Format a trap into a single diagnostic line.
/// @details Format: "Trap @pc#<pc> (<OPCODE>): <Kind>: <message>".  The
///          message part is omitted when empty.
std::string formatTrap(const VmError &error);

} // namespace regvm::vm
