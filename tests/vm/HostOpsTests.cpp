// File: tests/vm/HostOpsTests.cpp
// Purpose: Verify PROPACCESS, FUNC_CALL and EVAL against the default host bindings.
// Key invariants: HostError thrown by host code surfaces as a trap; any other
//                 exception escapes run() unchanged.
// Ownership/Lifetime: The fixture owns the environment and document roots.

#include "common/BytecodeBuilder.hpp"
#include "common/VmFixture.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace regvm;
using regvm::tests::BytecodeBuilder;

namespace
{
constexpr vm::RegIndex kRet = vm::reg::kReturnVal;
constexpr vm::RegIndex kEnv = vm::reg::kEnv;

class HostOpsTest : public tests::VmFixture
{
};

class ExplodingObject : public vm::HostObject
{
  public:
    vm::Value get(std::string_view key) const override
    {
        throw vm::HostError("getter for '" + std::string(key) + "' failed");
    }
};
} // namespace

TEST_F(HostOpsTest, ReadsNestedEnvironmentProperty)
{
    BytecodeBuilder b;
    b.loadString(0, "Math").propAccess(1, kEnv, 0).loadString(2, "PI").propAccess(kRet, 1, 2);
    EXPECT_DOUBLE_EQ(runNumber(b.build()), 3.141592653589793);
}

TEST_F(HostOpsTest, ConsoleLogWritesArguments)
{
    BytecodeBuilder b;
    b.loadString(0, "console").propAccess(1, kEnv, 0);
    b.loadString(2, "log").propAccess(3, 1, 2);
    b.loadString(4, "hi").loadNum(5, 3);
    b.funcCall(6, 3, 1, {4, 5});

    ASSERT_TRUE(run(b.build()).has_value());
    EXPECT_EQ(console.str(), "hi 3\n");
    EXPECT_TRUE(machine.reg(6).isVoid());
}

TEST_F(HostOpsTest, MathMaxOverRegisterArguments)
{
    BytecodeBuilder b;
    b.loadString(0, "Math").propAccess(1, kEnv, 0).loadString(2, "max").propAccess(3, 1, 2);
    b.loadNum(4, 2).loadNum(5, 9).loadNum(6, 4);
    b.funcCall(kRet, 3, 1, {4, 5, 6});
    EXPECT_EQ(runNumber(b.build()), 9.0);
}

TEST_F(HostOpsTest, ThisRegisterIsPassedAsReceiver)
{
    env->set("self", host::makeFunction("self",
                                        [](const vm::Value &self, const vm::ValueArray &)
                                        { return self; }));
    BytecodeBuilder b;
    b.loadString(0, "self").propAccess(1, kEnv, 0).loadString(2, "me").funcCall(kRet, 1, 2, {});
    auto result = run(b.build());
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->isString());
    EXPECT_EQ(result->asString(), "me");
}

TEST_F(HostOpsTest, CallingNonFunctionTraps)
{
    BytecodeBuilder b;
    b.loadNum(1, 4).funcCall(0, 1, vm::reg::kVoid, {});
    const vm::VmError err = runTrap(b.build());
    EXPECT_EQ(err.kind, vm::TrapKind::TypeMismatch);
    EXPECT_EQ(err.message, "number is not callable");
}

TEST_F(HostOpsTest, HostErrorBecomesHostCallFailure)
{
    env->set("fail", host::makeFunction("fail",
                                        [](const vm::Value &, const vm::ValueArray &) -> vm::Value
                                        { throw vm::HostError("boom"); }));
    BytecodeBuilder b;
    b.loadString(0, "fail").propAccess(1, kEnv, 0).funcCall(2, 1, vm::reg::kVoid, {});
    const vm::VmError err = runTrap(b.build());
    EXPECT_EQ(err.kind, vm::TrapKind::HostCallFailure);
    EXPECT_EQ(err.message, "fail: boom");
    EXPECT_EQ(err.pc, 12u);
}

TEST_F(HostOpsTest, ForeignExceptionEscapesRun)
{
    env->set("crash", host::makeFunction("crash",
                                         [](const vm::Value &, const vm::ValueArray &) -> vm::Value
                                         { throw std::logic_error("not a host error"); }));
    BytecodeBuilder b;
    b.loadString(0, "crash").propAccess(1, kEnv, 0).funcCall(2, 1, vm::reg::kVoid, {});
    EXPECT_THROW(run(b.build()), std::logic_error);
    EXPECT_EQ(machine.state(), vm::VM::State::Trapped);
    EXPECT_FALSE(machine.lastError().has_value());
}

TEST_F(HostOpsTest, StringLengthAndIndex)
{
    BytecodeBuilder b;
    b.loadString(0, "hello").loadString(1, "length").propAccess(kRet, 0, 1);
    b.loadNum(2, 1).propAccess(3, 0, 2);
    EXPECT_EQ(runNumber(b.build()), 5.0);
    ASSERT_TRUE(machine.reg(3).isString());
    EXPECT_EQ(machine.reg(3).asString(), "e");
}

TEST_F(HostOpsTest, MissingPropertyIsVoid)
{
    BytecodeBuilder b;
    b.loadString(0, "nope").propAccess(kRet, kEnv, 0).propAccess(1, vm::reg::kEmptyObj, 0);
    auto result = run(b.build());
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->isVoid());
    EXPECT_TRUE(machine.reg(1).isVoid());
}

TEST_F(HostOpsTest, PropertyOfNumberTraps)
{
    BytecodeBuilder b;
    b.loadNum(0, 1).loadString(1, "x").propAccess(2, 0, 1);
    const vm::VmError err = runTrap(b.build());
    EXPECT_EQ(err.kind, vm::TrapKind::TypeMismatch);
    EXPECT_NE(err.message.find("'x'"), std::string::npos);
}

TEST_F(HostOpsTest, ThrowingGetterTrapsAsHostCallFailure)
{
    env->set("boom", vm::Value(vm::ObjectRef(std::make_shared<ExplodingObject>())));
    BytecodeBuilder b;
    b.loadString(0, "boom").propAccess(1, kEnv, 0).propAccess(2, 1, 0);
    EXPECT_EQ(runTrap(b.build()).kind, vm::TrapKind::HostCallFailure);
}

TEST_F(HostOpsTest, DocumentWriteAppendsToBody)
{
    BytecodeBuilder b;
    b.loadString(0, "write").propAccess(1, vm::reg::kDocument, 0);
    b.loadString(2, "abc").loadNum(3, 7);
    b.funcCall(4, 1, vm::reg::kDocument, {2, 3});
    b.funcCall(4, 1, vm::reg::kDocument, {2});
    ASSERT_TRUE(run(b.build()).has_value());
    EXPECT_EQ(document->body(), "abc7abc");
}

TEST_F(HostOpsTest, ArrayResultSupportsLength)
{
    env->set("pair", host::makeFunction("pair",
                                        [](const vm::Value &, const vm::ValueArray &)
                                        {
                                            return vm::Value::array(
                                                {vm::Value::number(1), vm::Value::number(2)});
                                        }));
    BytecodeBuilder b;
    b.loadString(0, "pair").propAccess(1, kEnv, 0).funcCall(2, 1, vm::reg::kVoid, {});
    b.loadString(3, "length").propAccess(kRet, 2, 3);
    EXPECT_EQ(runNumber(b.build()), 2.0);
}

TEST_F(HostOpsTest, EvalExpressionAgainstEnvironment)
{
    BytecodeBuilder b;
    b.loadString(0, "Math.max(2, 5) * 3").eval(kRet, 0);
    EXPECT_EQ(runNumber(b.build()), 15.0);
}

TEST_F(HostOpsTest, EvalCallsHostFunctions)
{
    BytecodeBuilder b;
    b.loadString(0, "console.log('a' + 1, parseInt('0x1f'))").eval(1, 0);
    ASSERT_TRUE(run(b.build()).has_value());
    EXPECT_EQ(console.str(), "a1 31\n");
}

TEST_F(HostOpsTest, EvalParseErrorTraps)
{
    BytecodeBuilder b;
    b.loadString(0, "1 +").eval(kRet, 0);
    const vm::VmError err = runTrap(b.build());
    EXPECT_EQ(err.kind, vm::TrapKind::HostEvaluationFailure);
    EXPECT_NE(err.message.find("offset"), std::string::npos);
}

TEST_F(HostOpsTest, EvalOfLongOperatorChainTraps)
{
    std::string source = "1";
    for (int i = 0; i < 32767; ++i)
        source += "+1";
    BytecodeBuilder b;
    b.loadString(0, source).eval(kRet, 0);
    const vm::VmError err = runTrap(b.build());
    EXPECT_EQ(err.kind, vm::TrapKind::HostEvaluationFailure);
    EXPECT_NE(err.message.find("nested too deeply"), std::string::npos);
}

TEST_F(HostOpsTest, EvalWithoutEvaluatorTraps)
{
    machine.setEvaluator(nullptr);
    BytecodeBuilder b;
    b.loadString(0, "1").eval(kRet, 0);
    const vm::VmError err = runTrap(b.build());
    EXPECT_EQ(err.kind, vm::TrapKind::HostEvaluationFailure);
    EXPECT_EQ(err.message, "no evaluator installed");
}

TEST_F(HostOpsTest, EvalOfNonStringTraps)
{
    BytecodeBuilder b;
    b.loadNum(0, 1).eval(kRet, 0);
    EXPECT_EQ(runTrap(b.build()).kind, vm::TrapKind::TypeMismatch);
}
