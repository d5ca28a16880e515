//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/DebugLog.hpp
// Purpose: Gate verbose VM logging on the REGVM_DEBUG_VM environment flag.
// Key invariants: The flag is read once per process.
// Ownership/Lifetime: Stateless apart from the cached flag.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdlib>

namespace regvm::vm
{

/// @brief Check the environment to determine whether verbose VM logging is enabled.
/// @details Reads REGVM_DEBUG_VM once and caches the result.  Any non-empty
///          value enables logging.  Log lines go to stderr prefixed with
///          "[DEBUG][VM]".
inline bool isVmDebugLoggingEnabled() noexcept
{
    static const bool enabled = []
    {
        if (const char *flag = std::getenv("REGVM_DEBUG_VM"))
            return flag[0] != '\0';
        return false;
    }();
    return enabled;
}

} // namespace regvm::vm
