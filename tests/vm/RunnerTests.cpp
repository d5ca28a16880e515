// File: tests/vm/RunnerTests.cpp
// Purpose: Exercise the public Runner facade: results, traps, tracing and counters.
// Key invariants: Each run() starts from freshly seeded registers; opcode
//                 counters accumulate until reset.
// Ownership/Lifetime: Runners own their VM; tests own roots and output streams.

#include "regvm/vm/VM.hpp"

#include "common/BytecodeBuilder.hpp"
#include "host/ExprEvaluator.hpp"
#include "host/HostObjects.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>

using namespace regvm;
using regvm::bytecode::BCOpcode;
using regvm::tests::BytecodeBuilder;

namespace
{
constexpr vm::RegIndex kRet = vm::reg::kReturnVal;

std::vector<uint8_t> addProgram()
{
    BytecodeBuilder b;
    b.loadNum(0, 3).loadNum(1, 4).add(0, 1).copy(kRet, 0).exit();
    return b.build();
}
} // namespace

TEST(Runner, ReturnsValueOnSuccess)
{
    vm::RunResult result = vm::runBytecode(addProgram());
    ASSERT_TRUE(result.isOk());
    ASSERT_TRUE(result.value().isNumber());
    EXPECT_EQ(result.value().asNumber(), 7.0);
}

TEST(Runner, ReturnsErrorOnTrap)
{
    vm::Runner runner({0x00, 0x00, 0x01, 0xFF});
    vm::RunResult result = runner.run();
    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().kind, vm::TrapKind::UnknownOpcode);
    EXPECT_EQ(result.error().pc, 3u);
    EXPECT_EQ(runner.lastTrapMessage().value_or(""),
              "Trap @pc#3 (opcode#255): UnknownOpcode: no handler for opcode 0xFF");
}

TEST(Runner, EmptyProgramReturnsZero)
{
    vm::RunResult result = vm::runBytecode({});
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value().asNumber(), 0.0);
}

TEST(Runner, RerunStartsFromCleanRegisters)
{
    BytecodeBuilder b;
    b.loadNum(1, 1).add(kRet, 1).add(kRet, 1);
    vm::Runner runner(b.build());
    for (int i = 0; i < 3; ++i)
    {
        vm::RunResult result = runner.run();
        ASSERT_TRUE(result.isOk());
        EXPECT_EQ(result.value().asNumber(), 2.0);
        EXPECT_EQ(runner.instructionCount(), 3u);
    }
}

TEST(Runner, TraceWritesOneLinePerInstruction)
{
    std::ostringstream trace;
    vm::RunConfig config;
    config.trace.mode = vm::TraceConfig::Ops;
    config.trace.out = &trace;

    BytecodeBuilder b;
    b.loadNum(0, 1).exit();
    ASSERT_TRUE(vm::runBytecode(b.build(), config).isOk());
    EXPECT_EQ(trace.str(), "[TRACE] pc=0 LOAD_NUM\n[TRACE] pc=3 EXIT\n");
}

TEST(Runner, TraceEnvironmentOverride)
{
    std::ostringstream trace;
    vm::RunConfig config;
    config.trace.out = &trace;

    ::setenv("REGVM_TRACE", "ops", 1);
    vm::Runner runner({0x33}, config);
    ::unsetenv("REGVM_TRACE");

    ASSERT_TRUE(runner.run().isOk());
    EXPECT_EQ(trace.str(), "[TRACE] pc=0 EXIT\n");
}

TEST(Runner, OpcodeCountsAccumulateUntilReset)
{
    vm::RunConfig config;
    config.opcodeCounts = true;
    vm::Runner runner(addProgram(), config);

    ASSERT_TRUE(runner.run().isOk());
    ASSERT_TRUE(runner.run().isOk());
    const auto &counts = runner.opcodeCounts();
    EXPECT_EQ(counts[bytecode::toByte(BCOpcode::LOAD_NUM)], 4u);
    EXPECT_EQ(counts[bytecode::toByte(BCOpcode::ADD)], 2u);
    EXPECT_EQ(counts[bytecode::toByte(BCOpcode::EXIT)], 2u);

    const auto top = runner.topOpcodes(2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].first, bytecode::toByte(BCOpcode::LOAD_NUM));
    EXPECT_EQ(top[0].second, 4u);
    EXPECT_EQ(top[1].first, bytecode::toByte(BCOpcode::COPY));

    runner.resetOpcodeCounts();
    EXPECT_EQ(runner.opcodeCounts()[bytecode::toByte(BCOpcode::LOAD_NUM)], 0u);
    EXPECT_TRUE(runner.topOpcodes(5).empty());
}

TEST(Runner, OpcodeCountsCanBeDisabled)
{
    vm::RunConfig config;
    config.opcodeCounts = false;
    vm::Runner runner(addProgram(), config);
    ASSERT_TRUE(runner.run().isOk());
    EXPECT_EQ(runner.opcodeCounts()[bytecode::toByte(BCOpcode::LOAD_NUM)], 0u);
    EXPECT_EQ(runner.instructionCount(), 5u);
}

TEST(Runner, HostRootsAndEvaluatorAreWired)
{
    std::ostringstream out;
    auto env = host::makeDefaultEnvironment(out);
    vm::RunConfig config;
    config.roots.env = env;
    config.roots.document = host::makeDocument();
    config.evaluator = std::make_shared<host::ExprEvaluator>(env);

    BytecodeBuilder b;
    b.loadString(0, "Math.floor(7 / 2)").eval(kRet, 0);
    vm::RunResult result = vm::runBytecode(b.build(), config);
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value().asNumber(), 3.0);
}

TEST(Runner, NullRootsLeaveRegistersVoid)
{
    BytecodeBuilder b;
    b.copy(kRet, vm::reg::kEnv);
    vm::RunResult result = vm::runBytecode(b.build());
    ASSERT_TRUE(result.isOk());
    EXPECT_TRUE(result.value().isVoid());
}

TEST(Runner, MovedRunnerKeepsState)
{
    vm::Runner first(addProgram());
    vm::Runner second(std::move(first));
    vm::RunResult result = second.run();
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value().asNumber(), 7.0);
}
