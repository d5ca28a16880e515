//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
/**
 * @file
 * @brief Register-based virtual machine that executes regvm bytecode.
 *
 * Declares the interpreter core: register file, instruction cursor, operand
 * decoders and the function-table dispatch loop.  Opcode handlers live in the
 * OpHandlers_* headers and reach VM state through the public accessors below.
 *
 * @section invariants Key invariants
 * - The stack-pointer register is the only cursor into the stream; every
 *   operand read advances it.
 * - The VM does not own host objects; it holds shared references only.
 *
 * @section concurrency Concurrency model
 * Each VM instance is single-threaded.  To parallelize, create one VM per
 * thread; the dispatch table is immutable and shared.
 */
//===----------------------------------------------------------------------===//

#pragma once

#include "regvm/vm/Value.hpp"
#include "bytecode/Bytecode.hpp"
#include "vm/RegisterFile.hpp"
#include "vm/Trace.hpp"
#include "vm/Trap.hpp"
#include "vm/VMConfig.hpp"
#include "vm/VMConstants.hpp"

#include <array>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace regvm::vm
{

/// @brief Register-based bytecode interpreter.
class VM
{
  public:
    /// @brief Opcode handler signature.
    /// @details Handlers decode their own operands through the cursor and
    ///          report failures through raise(); they never return a status.
    using OpcodeHandler = void (*)(VM &);

    /// @brief Table mapping every opcode byte to its handler (or null).
    using OpcodeHandlerTable = std::array<OpcodeHandler, bytecode::kOpcodeSpace>;

    /// @brief Execution phases.
    enum class State
    {
        Ready,   ///< Stream loaded, run() not yet called.
        Running, ///< Currently executing bytecode.
        Halted,  ///< Execution completed normally.
        Trapped  ///< Execution halted due to a trap.
    };

    /// @brief Internal signal thrown by raise() and caught by the run loop.
    struct TrapSignal : std::exception
    {
        explicit TrapSignal(VmError err) : error(std::move(err)) {}

        VmError error;

        const char *what() const noexcept override;
    };

    /// @brief Construct a VM with tracing configuration and optional evaluator.
    /// @details Reads REGVM_ENABLE_OPCOUNTS and REGVM_TRACE to override the
    ///          supplied settings.
    explicit VM(TraceConfig tc = {}, std::shared_ptr<HostEvaluator> evaluator = nullptr);

    /// @brief Load @p bytecode and reset all registers.
    /// @details Seeds the reserved registers, clears every other register and
    ///          resets trap state.  Must be called again before re-running.
    void init(std::vector<uint8_t> bytecode, HostRoots roots = {});

    /// @brief Execute until the stream is exhausted or a trap occurs.
    /// @return Contents of RETURN_VAL, or empty when the run trapped.
    std::optional<Value> run();

    //===------------------------------------------------------------------===//
    // Handler-facing state access
    //===------------------------------------------------------------------===//

    RegisterFile &registers()
    {
        return regs_;
    }

    const RegisterFile &registers() const
    {
        return regs_;
    }

    const Value &reg(RegIndex index) const
    {
        return regs_.get(index);
    }

    void setReg(RegIndex index, Value value)
    {
        regs_.set(index, std::move(value));
    }

    /// @brief Length of the loaded stream in bytes.
    size_t streamLength() const
    {
        return stream_.size();
    }

    /// @brief Current stack-pointer position.
    /// @details Raises OutOfBounds when the register does not hold a
    ///          non-negative integral number.
    uint64_t stackPtr();

    /// @brief Move the cursor to @p pos.
    /// @details Raises OutOfBounds unless @p pos is an integral offset in
    ///          [0, streamLength()].
    void setStackPtr(double pos);

    //===------------------------------------------------------------------===//
    // Cursor and decoders
    //===------------------------------------------------------------------===//

    /// @brief Read the byte under the cursor and advance.
    uint8_t nextByte();

    /// @brief Read a length-prefixed byte string.
    std::string readString();

    /// @brief Read a length-prefixed list of register indices and resolve
    ///        each to its current value.
    ValueArray readRegisterArray();

    /// @brief Read a big-endian two's complement 32-bit integer.
    int32_t readInt32();

    /// @brief Read a big-endian IEEE-754 double.
    double readFloat64();

    /// @brief Abort the current instruction with a trap.
    [[noreturn]] void raise(TrapKind kind, std::string message);

    //===------------------------------------------------------------------===//
    // Host hooks
    //===------------------------------------------------------------------===//

    HostEvaluator *evaluator() const
    {
        return evaluator_.get();
    }

    void setEvaluator(std::shared_ptr<HostEvaluator> evaluator)
    {
        evaluator_ = std::move(evaluator);
    }

    //===------------------------------------------------------------------===//
    // Status and statistics
    //===------------------------------------------------------------------===//

    State state() const
    {
        return state_;
    }

    /// @brief Last recorded trap, if the most recent run trapped.
    const std::optional<VmError> &lastError() const
    {
        return lastError_;
    }

    /// @brief Formatted diagnostic for the last trap, if any.
    std::optional<std::string> lastTrapMessage() const;

    uint64_t getInstrCount() const
    {
        return instrCount_;
    }

    bool opcodeCountsEnabled() const
    {
        return enableOpcodeCounts;
    }

    void setOpcodeCountsEnabled(bool on)
    {
        enableOpcodeCounts = on;
    }

    const std::array<uint64_t, bytecode::kOpcodeSpace> &opcodeCounts() const
    {
        return opCounts_;
    }

    void resetOpcodeCounts();

    /// @brief Return the @p n most executed opcodes, highest count first.
    std::vector<std::pair<int, uint64_t>> topOpcodes(size_t n) const;

    TraceSink &tracer()
    {
        return tracer_;
    }

    /// @brief Process-wide opcode dispatch table.
    static const OpcodeHandlerTable &getOpcodeHandlers();

  private:
    /// @brief Fetch, trace and dispatch a single instruction.
    void step(const OpcodeHandlerTable &handlers);

    /// @brief Record @p error and transition to Trapped.
    void recordTrap(VmError error);

    std::vector<uint8_t> stream_; ///< Combined code/data stream.
    RegisterFile regs_;           ///< Register file.
    TraceSink tracer_;            ///< Instruction trace sink.
    std::shared_ptr<HostEvaluator> evaluator_; ///< EVAL backend; may be null.
    State state_ = State::Ready;
    std::optional<VmError> lastError_;

    uint64_t currentPc_ = 0;     ///< Offset of the executing opcode byte.
    uint8_t currentOpcode_ = 0;  ///< Executing opcode byte.
    uint64_t instrCount_ = 0;    ///< Instructions dispatched since init().

    bool enableOpcodeCounts = REGVM_VM_OPCOUNTS != 0;
    std::array<uint64_t, bytecode::kOpcodeSpace> opCounts_{};
};

} // namespace regvm::vm
