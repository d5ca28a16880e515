//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/regvm/vm/VM.hpp
// Purpose: Declare a lightweight facade for running bytecode through the VM
//          without exposing interpreter internals.
// Invariants: Public API owns its backing VM implementation; every run starts
//             from freshly initialised registers.
// Ownership: Runner owns the bytecode copy and the VM; host roots and the
//            evaluator are shared with the caller.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "regvm/vm/Value.hpp"
#include "support/result.hpp"
#include "vm/Trace.hpp"
#include "vm/Trap.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace regvm::vm
{

/// @brief Configuration parameters for executing a bytecode stream.
struct RunConfig
{
    TraceConfig trace;                        ///< Tracing configuration.
    HostRoots roots;                          ///< Handles for ENV and DOCUMENT.
    std::shared_ptr<HostEvaluator> evaluator; ///< EVAL backend; null disables EVAL.
    /// @brief Force opcode counting on or off.
    /// @details When unset the build default and REGVM_ENABLE_OPCOUNTS decide.
    std::optional<bool> opcodeCounts;
};

/// @brief Outcome of a run: the RETURN_VAL register or the trap that stopped it.
using RunResult = support::Result<Value, VmError>;

/// @brief Lightweight facade owning a VM instance for running bytecode.
class Runner
{
  public:
    Runner(std::vector<uint8_t> bytecode, RunConfig config = {});

    ~Runner();

    Runner(const Runner &) = delete;
    Runner &operator=(const Runner &) = delete;
    Runner(Runner &&) noexcept;
    Runner &operator=(Runner &&) noexcept;

    /// @brief Initialise the VM and execute the stream to completion.
    /// @details Each call re-initialises registers, so repeated runs are
    ///          independent.
    [[nodiscard]] RunResult run();

    /// @brief Number of instructions dispatched by the most recent run.
    [[nodiscard]] uint64_t instructionCount() const;

    /// @brief Formatted diagnostic for the most recent trap, if any.
    [[nodiscard]] std::optional<std::string> lastTrapMessage() const;

    /// @brief Per-opcode execution counts accumulated across runs.
    [[nodiscard]] const std::array<uint64_t, 256> &opcodeCounts() const;

    /// @brief Reset all opcode execution counters to zero.
    void resetOpcodeCounts();

    /// @brief Return the top-N most executed opcodes and their counts.
    [[nodiscard]] std::vector<std::pair<int, uint64_t>> topOpcodes(std::size_t n) const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

/// @brief Convenience helper to run @p bytecode once with @p config.
[[nodiscard]] RunResult runBytecode(std::vector<uint8_t> bytecode, RunConfig config = {});

} // namespace regvm::vm
