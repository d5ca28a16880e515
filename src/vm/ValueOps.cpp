//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the value semantics shared by the opcode handlers and the
// built-in expression engine.  Keeping these rules in one translation unit
// guarantees that `ADD` in bytecode and `+` in evaluated source agree.
//
//===----------------------------------------------------------------------===//

#include "vm/ValueOps.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace regvm::vm
{

namespace
{
/// @brief Parse a canonical array index ("0", "17"; no sign, no leading zeros).
bool parseIndex(std::string_view text, size_t &out)
{
    if (text.empty() || (text.size() > 1 && text[0] == '0'))
        return false;
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size())
        return false;
    out = value;
    return true;
}

std::string_view trim(std::string_view s)
{
    const auto isSpace = [](char c)
    { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; };
    while (!s.empty() && isSpace(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back()))
        s.remove_suffix(1);
    return s;
}
} // namespace

bool isTruthy(const Value &v)
{
    switch (v.kind())
    {
        case Value::Kind::Void:
            return false;
        case Value::Kind::Number:
        {
            const double n = v.asNumber();
            return n != 0.0 && !std::isnan(n);
        }
        case Value::Kind::String:
            return !v.asString().empty();
        case Value::Kind::Array:
        case Value::Kind::Object:
        case Value::Kind::Function:
            return true;
    }
    return false;
}

std::string formatNumber(double n)
{
    if (std::isnan(n))
        return "NaN";
    if (std::isinf(n))
        return n < 0 ? "-Infinity" : "Infinity";
    if (n == 0.0)
        return "0";
    if (std::trunc(n) == n && std::fabs(n) < 1e21)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f", n);
        return buf;
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), n);
    if (ec != std::errc())
    {
        std::snprintf(buf, sizeof(buf), "%.17g", n);
        return buf;
    }
    return std::string(buf, ptr);
}

std::string toDisplayString(const Value &v)
{
    switch (v.kind())
    {
        case Value::Kind::Void:
            return "undefined";
        case Value::Kind::Number:
            return formatNumber(v.asNumber());
        case Value::Kind::String:
            return v.asString();
        case Value::Kind::Array:
        {
            std::string out;
            bool first = true;
            for (const Value &item : *v.asArray())
            {
                if (!first)
                    out.push_back(',');
                first = false;
                if (!item.isVoid())
                    out.append(toDisplayString(item));
            }
            return out;
        }
        case Value::Kind::Object:
            return "[object " + v.asObject()->className() + "]";
        case Value::Kind::Function:
            return "function " + v.asFunction()->name() + "() { [native code] }";
    }
    return "undefined";
}

bool toNumber(const Value &v, double &out)
{
    switch (v.kind())
    {
        case Value::Kind::Number:
            out = v.asNumber();
            return true;
        case Value::Kind::Void:
            out = std::numeric_limits<double>::quiet_NaN();
            return true;
        case Value::Kind::String:
        {
            const std::string text(trim(v.asString()));
            if (text.empty())
            {
                out = 0.0;
                return true;
            }
            char *end = nullptr;
            const double parsed = std::strtod(text.c_str(), &end);
            out = (end && *end == '\0') ? parsed : std::numeric_limits<double>::quiet_NaN();
            return true;
        }
        default:
            return false;
    }
}

bool addValues(const Value &lhs, const Value &rhs, Value &out)
{
    if (lhs.isNumber() && rhs.isNumber())
    {
        out = Value::number(lhs.asNumber() + rhs.asNumber());
        return true;
    }
    if (lhs.isString() || rhs.isString())
    {
        out = Value(toDisplayString(lhs) + toDisplayString(rhs));
        return true;
    }
    return false;
}

bool arithValues(ArithOp op, const Value &lhs, const Value &rhs, Value &out)
{
    if (!lhs.isNumber() || !rhs.isNumber())
        return false;
    const double a = lhs.asNumber();
    const double b = rhs.asNumber();
    switch (op)
    {
        case ArithOp::Sub:
            out = Value::number(a - b);
            return true;
        case ArithOp::Mul:
            out = Value::number(a * b);
            return true;
        case ArithOp::Div:
            out = Value::number(a / b);
            return true;
        case ArithOp::Mod:
            out = Value::number(std::fmod(a, b));
            return true;
    }
    return false;
}

bool strictEquals(const Value &lhs, const Value &rhs)
{
    if (lhs.kind() != rhs.kind())
        return false;
    switch (lhs.kind())
    {
        case Value::Kind::Void:
            return true;
        case Value::Kind::Number:
            return lhs.asNumber() == rhs.asNumber();
        case Value::Kind::String:
            return lhs.asString() == rhs.asString();
        case Value::Kind::Array:
            return lhs.asArray() == rhs.asArray();
        case Value::Kind::Object:
            return lhs.asObject() == rhs.asObject();
        case Value::Kind::Function:
            return lhs.asFunction() == rhs.asFunction();
    }
    return false;
}

bool looseEquals(const Value &lhs, const Value &rhs)
{
    if (lhs.kind() == rhs.kind())
        return strictEquals(lhs, rhs);

    const bool numStr = lhs.isNumber() && rhs.isString();
    const bool strNum = lhs.isString() && rhs.isNumber();
    if (numStr || strNum)
    {
        double a = 0.0;
        double b = 0.0;
        toNumber(lhs, a);
        toNumber(rhs, b);
        return a == b;
    }
    return false;
}

bool compareValues(RelOp op, const Value &lhs, const Value &rhs, bool &out)
{
    int order = 0;
    if (lhs.isNumber() && rhs.isNumber())
    {
        const double a = lhs.asNumber();
        const double b = rhs.asNumber();
        if (std::isnan(a) || std::isnan(b))
        {
            out = false;
            return true;
        }
        order = a < b ? -1 : (a > b ? 1 : 0);
    }
    else if (lhs.isString() && rhs.isString())
    {
        const int cmp = lhs.asString().compare(rhs.asString());
        order = cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }
    else
    {
        return false;
    }

    switch (op)
    {
        case RelOp::Lt:
            out = order < 0;
            break;
        case RelOp::Gt:
            out = order > 0;
            break;
        case RelOp::Le:
            out = order <= 0;
            break;
        case RelOp::Ge:
            out = order >= 0;
            break;
    }
    return true;
}

bool readProperty(const Value &receiver, const Value &key, Value &out)
{
    const std::string name = toDisplayString(key);
    switch (receiver.kind())
    {
        case Value::Kind::Object:
            out = receiver.asObject()->get(name);
            return true;
        case Value::Kind::Array:
        {
            const ValueArray &items = *receiver.asArray();
            size_t index = 0;
            if (name == "length")
                out = Value::number(static_cast<double>(items.size()));
            else if (parseIndex(name, index) && index < items.size())
                out = items[index];
            else
                out = Value();
            return true;
        }
        case Value::Kind::String:
        {
            const std::string &text = receiver.asString();
            size_t index = 0;
            if (name == "length")
                out = Value::number(static_cast<double>(text.size()));
            else if (parseIndex(name, index) && index < text.size())
                out = Value(std::string(1, text[index]));
            else
                out = Value();
            return true;
        }
        default:
            return false;
    }
}

} // namespace regvm::vm
