// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.

#include "bytecode/Bytecode.hpp"

#include <string_view>

namespace regvm::bytecode
{

const char *opcodeName(uint8_t op)
{
    switch (static_cast<BCOpcode>(op))
    {
        // Data
        case BCOpcode::LOAD_NUM:
            return "LOAD_NUM";
        case BCOpcode::LOAD_LONG_NUM:
            return "LOAD_LONG_NUM";
        case BCOpcode::LOAD_FLOAT_NUM:
            return "LOAD_FLOAT_NUM";
        case BCOpcode::LOAD_STRING:
            return "LOAD_STRING";
        case BCOpcode::COPY:
            return "COPY";

        // Arithmetic
        case BCOpcode::ADD:
            return "ADD";
        case BCOpcode::SUB:
            return "SUB";
        case BCOpcode::MUL:
            return "MUL";
        case BCOpcode::DIV:
            return "DIV";

        // Comparisons
        case BCOpcode::COMP_EQ:
            return "COMP_EQ";
        case BCOpcode::COMP_NE:
            return "COMP_NE";
        case BCOpcode::COMP_STRICT_EQ:
            return "COMP_STRICT_EQ";
        case BCOpcode::COMP_STRICT_NE:
            return "COMP_STRICT_NE";
        case BCOpcode::COMP_LT:
            return "COMP_LT";
        case BCOpcode::COMP_GT:
            return "COMP_GT";
        case BCOpcode::COMP_LE:
            return "COMP_LE";
        case BCOpcode::COMP_GE:
            return "COMP_GE";

        // Control Flow
        case BCOpcode::COND_JUMP:
            return "COND_JUMP";
        case BCOpcode::CALL_BCFUNC:
            return "CALL_BCFUNC";
        case BCOpcode::RETURN_BCFUNC:
            return "RETURN_BCFUNC";
        case BCOpcode::EXIT:
            return "EXIT";

        // Host Interop
        case BCOpcode::PROPACCESS:
            return "PROPACCESS";
        case BCOpcode::FUNC_CALL:
            return "FUNC_CALL";
        case BCOpcode::EVAL:
            return "EVAL";
    }
    return "UNKNOWN";
}

bool isDefinedOpcode(uint8_t op)
{
    return std::string_view(opcodeName(op)) != "UNKNOWN";
}

} // namespace regvm::bytecode
