//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/regvm-run/cli.hpp
// Purpose: Option parsing and execution for the regvm-run tool.
// Key invariants: Exit codes are 0 (success), 1 (usage or load error) and
//                 2 (VM trap).
// Ownership/Lifetime: Streams are borrowed for the duration of a call.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/BytecodeLoader.hpp"
#include "vm/Trace.hpp"

#include <iosfwd>
#include <string>

namespace regvm::tools
{

/// @brief Exit status when the program ran to completion.
constexpr int kExitOk = 0;
/// @brief Exit status for bad arguments or an unloadable file.
constexpr int kExitUsage = 1;
/// @brief Exit status when execution stopped on a trap.
constexpr int kExitTrap = 2;

/// @brief Settings collected from the command line.
struct RunOptions
{
    std::string path;
    bytecode::BytecodeFormat format = bytecode::BytecodeFormat::Auto;
    vm::TraceConfig trace{};
    bool countFlag = false;
    bool opcountsFlag = false;
};

/// @brief What the caller should do after parsing.
enum class ParseOutcome
{
    Run,     ///< Options are complete; execute the file.
    Help,    ///< Print usage and exit successfully.
    Version, ///< Print the version and exit successfully.
    Error    ///< Malformed command line; a message was written.
};

/// @brief Parse @p argv (excluding the program name) into @p opts.
ParseOutcome parseArgs(int argc, char **argv, RunOptions &opts, std::ostream &err);

void printUsage(std::ostream &os);

void printVersion(std::ostream &os);

/// @brief Load and execute the file named in @p opts.
/// @details The return value is printed to @p out; console output produced
///          by the program also goes to @p out.  Diagnostics, traces and
///          statistics go to @p err.
/// @return One of kExitOk, kExitUsage or kExitTrap.
int runFile(const RunOptions &opts, std::ostream &out, std::ostream &err);

} // namespace regvm::tools
