// File: tests/vm/ControlFlowTests.cpp
// Purpose: Verify conditional jumps, bytecode calls/returns and EXIT.
// Key invariants: Jump deltas are relative to the offset after the operands;
//                 RETURN restores every register except RETURN_VAL.
// Ownership/Lifetime: Each test runs a freshly initialised VM.

#include "common/BytecodeBuilder.hpp"
#include "common/VmFixture.hpp"

#include <gtest/gtest.h>

using namespace regvm;
using regvm::bytecode::BCOpcode;
using regvm::tests::BytecodeBuilder;

namespace
{
constexpr vm::RegIndex kRet = vm::reg::kReturnVal;

class ControlFlowTest : public tests::VmFixture
{
};
} // namespace

TEST_F(ControlFlowTest, CountdownLoopSumsToFifteen)
{
    BytecodeBuilder b;
    b.loadNum(0, 5).loadNum(1, 0).loadNum(2, 1).loadLong(3, -9);
    ASSERT_EQ(b.size(), 15u);
    b.add(1, 0).sub(0, 2).condJump(0, 3);
    ASSERT_EQ(b.size(), 24u);
    b.copy(kRet, 1).exit();

    EXPECT_EQ(runNumber(b.build()), 15.0);
    EXPECT_EQ(machine.reg(0).asNumber(), 0.0);
}

TEST_F(ControlFlowTest, FalsyConditionFallsThrough)
{
    BytecodeBuilder b;
    b.loadNum(0, 0).loadNum(1, 3).condJump(0, 1).loadNum(kRet, 7);
    EXPECT_EQ(runNumber(b.build()), 7.0);
}

TEST_F(ControlFlowTest, TruthyConditionSkipsInstruction)
{
    BytecodeBuilder b;
    b.loadString(0, "yes").loadNum(1, 3).condJump(0, 1).loadNum(kRet, 7).loadNum(2, 1);
    EXPECT_EQ(runNumber(b.build()), 0.0);
    EXPECT_EQ(machine.reg(2).asNumber(), 1.0);
}

TEST_F(ControlFlowTest, FalsyConditionIgnoresDeltaKind)
{
    BytecodeBuilder b;
    b.loadString(1, "oops").condJump(0, 1).loadNum(kRet, 3);
    EXPECT_EQ(runNumber(b.build()), 3.0);
}

TEST_F(ControlFlowTest, JumpPastEndTraps)
{
    BytecodeBuilder b;
    b.loadNum(0, 1).loadNum(1, 100).condJump(0, 1);
    const vm::VmError err = runTrap(b.build());
    EXPECT_EQ(err.kind, vm::TrapKind::OutOfBounds);
    EXPECT_EQ(err.pc, 6u);
    EXPECT_EQ(err.opcode, bytecode::toByte(BCOpcode::COND_JUMP));
}

TEST_F(ControlFlowTest, JumpBeforeStartTraps)
{
    BytecodeBuilder b;
    b.loadNum(0, 1).loadLong(1, -100).condJump(0, 1);
    EXPECT_EQ(runTrap(b.build()).kind, vm::TrapKind::OutOfBounds);
}

TEST_F(ControlFlowTest, JumpToExactEndHalts)
{
    BytecodeBuilder b;
    b.loadNum(0, 1).loadNum(1, 3).condJump(0, 1).loadNum(kRet, 9);
    EXPECT_EQ(runNumber(b.build()), 0.0);
    EXPECT_EQ(machine.state(), vm::VM::State::Halted);
}

TEST_F(ControlFlowTest, NonNumberDeltaTraps)
{
    BytecodeBuilder b;
    b.loadNum(0, 1).loadString(1, "x").condJump(0, 1);
    EXPECT_EQ(runTrap(b.build()).kind, vm::TrapKind::TypeMismatch);
}

TEST_F(ControlFlowTest, CallReturnRestoresRegisters)
{
    BytecodeBuilder b;
    b.loadNum(0, 1).loadNum(1, 2).call(9).exit();
    ASSERT_EQ(b.size(), 9u);
    b.loadNum(1, 99).loadNum(kRet, 7).ret();

    EXPECT_EQ(runNumber(b.build()), 7.0);
    EXPECT_EQ(machine.reg(0).asNumber(), 1.0);
    EXPECT_EQ(machine.reg(1).asNumber(), 2.0);
    EXPECT_TRUE(machine.reg(vm::reg::kBackup).isVoid());
    EXPECT_EQ(machine.getInstrCount(), 7u);
}

TEST_F(ControlFlowTest, NestedCallsUnwindThroughCarriedBackup)
{
    BytecodeBuilder b;
    b.call(3).exit();          // 0, 2
    b.call(6).ret();           // 3, 5
    b.loadNum(kRet, 42).ret(); // 6, 9
    EXPECT_EQ(runNumber(b.build()), 42.0);
}

TEST_F(ControlFlowTest, CallTargetBeyondStreamTraps)
{
    BytecodeBuilder b;
    b.call(200);
    const vm::VmError err = runTrap(b.build());
    EXPECT_EQ(err.kind, vm::TrapKind::OutOfBounds);
    EXPECT_EQ(err.opcode, bytecode::toByte(BCOpcode::CALL_BCFUNC));
}

TEST_F(ControlFlowTest, ReturnWithoutCallTraps)
{
    BytecodeBuilder b;
    b.ret();
    const vm::VmError err = runTrap(b.build());
    EXPECT_EQ(err.kind, vm::TrapKind::TypeMismatch);
    EXPECT_NE(err.message.find("return without call"), std::string::npos);
}

TEST_F(ControlFlowTest, ExitStopsImmediately)
{
    BytecodeBuilder b;
    b.exit().loadNum(kRet, 5);
    EXPECT_EQ(runNumber(b.build()), 0.0);
    EXPECT_EQ(machine.getInstrCount(), 1u);
    EXPECT_EQ(machine.reg(vm::reg::kStackPtr).asNumber(), 4.0);
}

TEST_F(ControlFlowTest, WritingNonNumberToStackPointerTraps)
{
    BytecodeBuilder b;
    b.loadString(vm::reg::kStackPtr, "x").loadNum(kRet, 1);
    EXPECT_EQ(runTrap(b.build()).kind, vm::TrapKind::OutOfBounds);
}

TEST_F(ControlFlowTest, StackPointerPastEndHalts)
{
    BytecodeBuilder b;
    b.loadNum(vm::reg::kStackPtr, 250).loadNum(kRet, 1);
    EXPECT_EQ(runNumber(b.build()), 0.0);
}
