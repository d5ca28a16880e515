// File: tests/unit/BytecodeTests.cpp
// Purpose: Unit tests for the opcode table, length-prefix helpers and handler registration.
// Key invariants: Every defined opcode has a name and a handler; no other byte does.
// Ownership/Lifetime: Tables are process-wide and immutable.

#include "bytecode/Bytecode.hpp"
#include "vm/VM.hpp"

#include <gtest/gtest.h>

#include <string_view>

using namespace regvm;
using regvm::bytecode::BCOpcode;

TEST(Bytecode, OpcodeBytesAreFixed)
{
    EXPECT_EQ(bytecode::toByte(BCOpcode::LOAD_NUM), 0x00);
    EXPECT_EQ(bytecode::toByte(BCOpcode::COPY), 0x04);
    EXPECT_EQ(bytecode::toByte(BCOpcode::ADD), 0x10);
    EXPECT_EQ(bytecode::toByte(BCOpcode::COMP_GE), 0x27);
    EXPECT_EQ(bytecode::toByte(BCOpcode::COND_JUMP), 0x30);
    EXPECT_EQ(bytecode::toByte(BCOpcode::EXIT), 0x33);
    EXPECT_EQ(bytecode::toByte(BCOpcode::PROPACCESS), 0x40);
    EXPECT_EQ(bytecode::toByte(BCOpcode::EVAL), 0x42);
}

TEST(Bytecode, NamesAndDefinedSet)
{
    EXPECT_STREQ(bytecode::opcodeName(BCOpcode::LOAD_STRING), "LOAD_STRING");
    EXPECT_STREQ(bytecode::opcodeName(BCOpcode::RETURN_BCFUNC), "RETURN_BCFUNC");
    EXPECT_STREQ(bytecode::opcodeName(uint8_t{0x99}), "UNKNOWN");

    int defined = 0;
    for (int op = 0; op < 256; ++op)
    {
        if (bytecode::isDefinedOpcode(static_cast<uint8_t>(op)))
            ++defined;
    }
    EXPECT_EQ(defined, 24);
}

TEST(Bytecode, HandlerTableMatchesDefinedOpcodes)
{
    const auto &handlers = vm::VM::getOpcodeHandlers();
    for (int op = 0; op < 256; ++op)
    {
        const bool defined = bytecode::isDefinedOpcode(static_cast<uint8_t>(op));
        EXPECT_EQ(handlers[op] != nullptr, defined) << "opcode " << op;
    }
}

TEST(Bytecode, LengthPrefixIsBigEndian)
{
    EXPECT_EQ(bytecode::decodeLength16(0x00, 0x05), 5);
    EXPECT_EQ(bytecode::decodeLength16(0x01, 0x00), 256);
    EXPECT_EQ(bytecode::decodeLength16(0x01, 0x2C), 300);
    EXPECT_EQ(bytecode::decodeLength16(0xFF, 0xFF), 65535);

    const auto enc = bytecode::encodeLength16(300);
    EXPECT_EQ(enc[0], 0x01);
    EXPECT_EQ(enc[1], 0x2C);
}
