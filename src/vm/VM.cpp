//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/VM.cpp
// Purpose: Execution loop, instruction cursor, operand decoders and trap
//          recording for the register VM.
// Key invariants: A trap aborts the current instruction immediately; the loop
//                 records it and stops.  Exceptions other than TrapSignal are
//                 never intercepted.
// Ownership/Lifetime: Operates on state owned by the VM instance.
//
//===----------------------------------------------------------------------===//

#include "vm/VM.hpp"

#include "vm/DebugLog.hpp"
#include "vm/OpHandlers.hpp"
#include "vm/ValueOps.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace regvm::vm
{

const char *VM::TrapSignal::what() const noexcept
{
    return "regvm trap";
}

const VM::OpcodeHandlerTable &VM::getOpcodeHandlers()
{
    return detail::getOpcodeHandlers();
}

std::optional<Value> VM::run()
{
    if (state_ == State::Trapped)
        return std::nullopt;

    const OpcodeHandlerTable &handlers = getOpcodeHandlers();
    state_ = State::Running;
    try
    {
        while (stackPtr() < stream_.size())
            step(handlers);
    }
    catch (const TrapSignal &signal)
    {
        recordTrap(signal.error);
        return std::nullopt;
    }
    catch (...)
    {
        // Host exceptions other than HostError leave the VM unusable but are
        // the embedder's to handle.
        state_ = State::Trapped;
        throw;
    }

    state_ = State::Halted;
    if (isVmDebugLoggingEnabled())
    {
        std::fprintf(stderr,
                     "[DEBUG][VM] halted after %llu instructions\n",
                     static_cast<unsigned long long>(instrCount_));
    }
    return regs_.get(reg::kReturnVal);
}

void VM::step(const OpcodeHandlerTable &handlers)
{
    currentPc_ = stackPtr();
    currentOpcode_ = nextByte();
    ++instrCount_;
    tracer_.onStep(currentPc_, currentOpcode_);

    const OpcodeHandler handler = handlers[currentOpcode_];
    if (!handler)
    {
        char buf[48];
        std::snprintf(buf, sizeof(buf), "no handler for opcode 0x%02X", currentOpcode_);
        raise(TrapKind::UnknownOpcode, buf);
    }

    REGVM_VM_DISPATCH_BEFORE(*this, currentOpcode_);
    handler(*this);
    REGVM_VM_DISPATCH_AFTER(*this, currentOpcode_);
}

void VM::recordTrap(VmError error)
{
    state_ = State::Trapped;
    lastError_ = std::move(error);
    if (isVmDebugLoggingEnabled())
        std::fprintf(stderr, "[DEBUG][VM] %s\n", formatTrap(*lastError_).c_str());
}

void VM::raise(TrapKind kind, std::string message)
{
    VmError error;
    error.kind = kind;
    error.pc = currentPc_;
    error.opcode = currentOpcode_;
    error.message = std::move(message);
    throw TrapSignal(std::move(error));
}

std::optional<std::string> VM::lastTrapMessage() const
{
    if (!lastError_)
        return std::nullopt;
    return formatTrap(*lastError_);
}

//===----------------------------------------------------------------------===//
// Cursor
//===----------------------------------------------------------------------===//

uint64_t VM::stackPtr()
{
    const Value &sp = regs_.get(reg::kStackPtr);
    if (!sp.isNumber())
    {
        raise(TrapKind::OutOfBounds,
              "stack pointer holds " + std::string(kindName(sp.kind())) + ", expected number");
    }
    const double pos = sp.asNumber();
    if (!(pos >= 0.0) || std::trunc(pos) != pos)
    {
        raise(TrapKind::OutOfBounds,
              "stack pointer " + formatNumber(pos) + " is not a stream offset");
    }
    return static_cast<uint64_t>(pos);
}

void VM::setStackPtr(double pos)
{
    if (!(pos >= 0.0) || std::trunc(pos) != pos || pos > static_cast<double>(stream_.size()))
    {
        raise(TrapKind::OutOfBounds,
              "target " + formatNumber(pos) + " outside stream [0, " +
                  std::to_string(stream_.size()) + "]");
    }
    regs_.set(reg::kStackPtr, Value::number(pos));
}

uint8_t VM::nextByte()
{
    const uint64_t pos = stackPtr();
    if (pos >= stream_.size())
    {
        raise(TrapKind::OutOfBounds,
              "read at offset " + std::to_string(pos) + " past end of " +
                  std::to_string(stream_.size()) + "-byte stream");
    }
    regs_.set(reg::kStackPtr, Value::number(static_cast<double>(pos + 1)));
    return stream_[pos];
}

//===----------------------------------------------------------------------===//
// Decoders
//===----------------------------------------------------------------------===//

std::string VM::readString()
{
    const uint8_t hi = nextByte();
    const uint8_t lo = nextByte();
    const uint16_t length = bytecode::decodeLength16(hi, lo);
    std::string text;
    text.reserve(length);
    for (uint16_t i = 0; i < length; ++i)
        text.push_back(static_cast<char>(nextByte()));
    return text;
}

ValueArray VM::readRegisterArray()
{
    const uint8_t hi = nextByte();
    const uint8_t lo = nextByte();
    const uint16_t length = bytecode::decodeLength16(hi, lo);
    ValueArray values;
    values.reserve(length);
    for (uint16_t i = 0; i < length; ++i)
        values.push_back(regs_.get(nextByte()));
    return values;
}

int32_t VM::readInt32()
{
    uint32_t bits = 0;
    for (int i = 0; i < 4; ++i)
        bits = (bits << 8) | nextByte();
    return static_cast<int32_t>(bits);
}

double VM::readFloat64()
{
    uint64_t bits = 0;
    for (int i = 0; i < 8; ++i)
        bits = (bits << 8) | nextByte();
    double value = 0.0;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

//===----------------------------------------------------------------------===//
// Statistics
//===----------------------------------------------------------------------===//

void VM::resetOpcodeCounts()
{
    opCounts_.fill(0);
}

std::vector<std::pair<int, uint64_t>> VM::topOpcodes(size_t n) const
{
    std::vector<std::pair<int, uint64_t>> pairs;
    for (size_t i = 0; i < opCounts_.size(); ++i)
    {
        if (opCounts_[i] != 0)
            pairs.emplace_back(static_cast<int>(i), opCounts_[i]);
    }
    std::sort(pairs.begin(),
              pairs.end(),
              [](const auto &a, const auto &b)
              { return a.second != b.second ? a.second > b.second : a.first < b.first; });
    if (pairs.size() > n)
        pairs.resize(n);
    return pairs;
}

} // namespace regvm::vm
