//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line pieces of the Value model: kind names for diagnostics and the
// default read-only behaviour of host objects.
//
//===----------------------------------------------------------------------===//

#include "regvm/vm/Value.hpp"

namespace regvm::vm
{

std::string_view kindName(Value::Kind kind) noexcept
{
    switch (kind)
    {
        case Value::Kind::Void:
            return "void";
        case Value::Kind::Number:
            return "number";
        case Value::Kind::String:
            return "string";
        case Value::Kind::Array:
            return "array";
        case Value::Kind::Object:
            return "object";
        case Value::Kind::Function:
            return "function";
    }
    return "void";
}

void HostObject::set(std::string_view key, Value)
{
    throw HostError("cannot assign property '" + std::string(key) + "' of read-only " +
                    className());
}

} // namespace regvm::vm
