//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the stock host bindings: a map-backed object, a std::function
// wrapper, the document root and the default global environment.  Numeric
// built-ins follow the value conversions of vm/ValueOps.hpp so host results
// print the same way VM results do.
//
//===----------------------------------------------------------------------===//

#include "host/HostObjects.hpp"

#include "vm/ValueOps.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstdint>
#include <limits>
#include <numbers>
#include <ostream>
#include <utility>

namespace regvm::host
{

namespace
{
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

/// @brief Numeric value of argument @p index; missing or non-numeric is NaN.
double numberArg(const ValueArray &args, size_t index)
{
    if (index >= args.size())
        return kNaN;
    double out = kNaN;
    if (!vm::toNumber(args[index], out))
        return kNaN;
    return out;
}

std::string stringArg(const ValueArray &args, size_t index)
{
    if (index >= args.size())
        return "undefined";
    return vm::toDisplayString(args[index]);
}

Value unaryMath(std::string name, double (*fn)(double))
{
    return makeFunction(std::move(name),
                        [fn](const Value &, const ValueArray &args)
                        { return Value::number(fn(numberArg(args, 0))); });
}

/// @brief Math.max / Math.min: NaN if any argument is NaN.
Value extremum(std::string name, bool wantMax)
{
    return makeFunction(std::move(name),
                        [wantMax](const Value &, const ValueArray &args)
                        {
                            double best = wantMax ? -kInf : kInf;
                            for (size_t i = 0; i < args.size(); ++i)
                            {
                                const double n = numberArg(args, i);
                                if (std::isnan(n))
                                    return Value::number(kNaN);
                                if (wantMax ? n > best : n < best)
                                    best = n;
                            }
                            return Value::number(best);
                        });
}

int digitValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z')
        return c - 'A' + 10;
    return 99;
}

/// @brief Parse the leading integer of @p text in @p radix (0 = auto).
double parseInteger(std::string_view text, int radix)
{
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
        ++i;
    double sign = 1.0;
    if (i < text.size() && (text[i] == '+' || text[i] == '-'))
    {
        if (text[i] == '-')
            sign = -1.0;
        ++i;
    }
    if ((radix == 0 || radix == 16) && i + 1 < text.size() && text[i] == '0' &&
        (text[i + 1] == 'x' || text[i + 1] == 'X'))
    {
        radix = 16;
        i += 2;
    }
    if (radix == 0)
        radix = 10;
    if (radix < 2 || radix > 36)
        return kNaN;

    double value = 0.0;
    bool any = false;
    for (; i < text.size(); ++i)
    {
        const int d = digitValue(text[i]);
        if (d >= radix)
            break;
        value = value * radix + d;
        any = true;
    }
    return any ? sign * value : kNaN;
}

/// @brief Reduce a char code to 16 bits and keep the low byte.
uint8_t charCodeByte(double code)
{
    if (!std::isfinite(code))
        return 0;
    double unit = std::fmod(std::trunc(code), 65536.0);
    if (unit < 0)
        unit += 65536.0;
    return static_cast<uint8_t>(static_cast<uint32_t>(unit));
}

/// @brief Map a numeric radix argument onto parseInteger's convention.
/// @return 0 for automatic detection, -1 for a radix that yields NaN.
int radixArg(double r)
{
    if (!std::isfinite(r))
        return 0;
    const double whole = std::trunc(r);
    if (whole == 0.0)
        return 0;
    if (whole < 2.0 || whole > 36.0)
        return -1;
    return static_cast<int>(whole);
}

/// @brief Parse the longest leading decimal literal of @p text.
double parseLeadingFloat(std::string_view text)
{
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
        ++i;
    const std::string rest(text.substr(i));
    const size_t signLen = (!rest.empty() && (rest[0] == '+' || rest[0] == '-')) ? 1 : 0;
    if (rest.compare(signLen, 8, "Infinity") == 0)
        return (signLen && rest[0] == '-') ? -kInf : kInf;
    // strtod would also accept hex and "inf"; restrict to decimal digits.
    if (signLen < rest.size() && !std::isdigit(static_cast<unsigned char>(rest[signLen])) &&
        rest[signLen] != '.')
        return kNaN;
    char *end = nullptr;
    const double value = std::strtod(rest.c_str(), &end);
    if (end == rest.c_str())
        return kNaN;
    if (rest.size() > signLen + 1 && rest[signLen] == '0' &&
        (rest[signLen + 1] == 'x' || rest[signLen + 1] == 'X'))
        return (signLen && rest[0] == '-') ? -0.0 : 0.0;
    return value;
}

std::shared_ptr<PropertyObject> makeMath()
{
    auto math = std::make_shared<PropertyObject>("Math");
    math->set("PI", Value::number(std::numbers::pi));
    math->set("abs", unaryMath("abs", [](double x) { return std::fabs(x); }));
    math->set("floor", unaryMath("floor", [](double x) { return std::floor(x); }));
    math->set("ceil", unaryMath("ceil", [](double x) { return std::ceil(x); }));
    math->set("sqrt", unaryMath("sqrt", [](double x) { return std::sqrt(x); }));
    math->set("max", extremum("max", true));
    math->set("min", extremum("min", false));
    math->set("pow",
              makeFunction("pow",
                           [](const Value &, const ValueArray &args)
                           {
                               const double base = numberArg(args, 0);
                               return Value::number(std::pow(base, numberArg(args, 1)));
                           }));
    return math;
}
} // namespace

//===----------------------------------------------------------------------===//
// PropertyObject
//===----------------------------------------------------------------------===//

PropertyObject::PropertyObject(std::string className) : className_(std::move(className)) {}

Value PropertyObject::get(std::string_view key) const
{
    auto it = props_.find(key);
    if (it == props_.end())
        return Value();
    return it->second;
}

void PropertyObject::set(std::string_view key, Value value)
{
    props_.insert_or_assign(std::string(key), std::move(value));
}

bool PropertyObject::has(std::string_view key) const
{
    return props_.find(key) != props_.end();
}

//===----------------------------------------------------------------------===//
// NativeFunction
//===----------------------------------------------------------------------===//

NativeFunction::NativeFunction(std::string name, Body body)
    : name_(std::move(name)), body_(std::move(body))
{
}

Value NativeFunction::call(const Value &self, const ValueArray &args)
{
    if (!body_)
        throw HostError(name_ + " has no body");
    return body_(self, args);
}

Value makeFunction(std::string name, NativeFunction::Body body)
{
    return Value(FunctionRef(std::make_shared<NativeFunction>(std::move(name), std::move(body))));
}

//===----------------------------------------------------------------------===//
// DocumentObject
//===----------------------------------------------------------------------===//

DocumentObject::DocumentObject() : body_(std::make_shared<std::string>())
{
    std::weak_ptr<std::string> sink = body_;
    write_ = makeFunction("write",
                          [sink](const Value &, const ValueArray &args)
                          {
                              auto body = sink.lock();
                              if (!body)
                                  throw HostError("document is gone");
                              for (const Value &arg : args)
                                  body->append(vm::toDisplayString(arg));
                              return Value();
                          });
}

Value DocumentObject::get(std::string_view key) const
{
    if (key == "title")
        return Value(title_);
    if (key == "body")
        return Value(*body_);
    if (key == "write")
        return write_;
    return Value();
}

void DocumentObject::set(std::string_view key, Value value)
{
    if (key != "title")
    {
        vm::HostObject::set(key, std::move(value));
        return;
    }
    title_ = vm::toDisplayString(value);
}

//===----------------------------------------------------------------------===//
// Roots
//===----------------------------------------------------------------------===//

std::shared_ptr<PropertyObject> makeDefaultEnvironment(std::ostream &out)
{
    auto env = std::make_shared<PropertyObject>("Window");

    auto console = std::make_shared<PropertyObject>("Console");
    std::ostream *stream = &out;
    console->set("log",
                 makeFunction("log",
                              [stream](const Value &, const ValueArray &args)
                              {
                                  for (size_t i = 0; i < args.size(); ++i)
                                  {
                                      if (i)
                                          *stream << ' ';
                                      *stream << vm::toDisplayString(args[i]);
                                  }
                                  *stream << '\n';
                                  return Value();
                              }));
    env->set("console", Value(ObjectRef(console)));
    env->set("Math", Value(ObjectRef(makeMath())));

    auto string = std::make_shared<PropertyObject>("String");
    string->set("fromCharCode",
                makeFunction("fromCharCode",
                             [](const Value &, const ValueArray &args)
                             {
                                 std::string text;
                                 for (size_t i = 0; i < args.size(); ++i)
                                 {
                                     text.push_back(
                                         static_cast<char>(charCodeByte(numberArg(args, i))));
                                 }
                                 return Value(std::move(text));
                             }));
    env->set("String", Value(ObjectRef(string)));

    env->set("parseInt",
             makeFunction("parseInt",
                          [](const Value &, const ValueArray &args)
                          {
                              int radix = 0;
                              if (args.size() > 1 && !args[1].isVoid())
                                  radix = radixArg(numberArg(args, 1));
                              return Value::number(parseInteger(stringArg(args, 0), radix));
                          }));
    env->set("parseFloat",
             makeFunction("parseFloat",
                          [](const Value &, const ValueArray &args)
                          { return Value::number(parseLeadingFloat(stringArg(args, 0))); }));
    env->set("isNaN",
             makeFunction("isNaN",
                          [](const Value &, const ValueArray &args)
                          { return Value::boolean(std::isnan(numberArg(args, 0))); }));
    env->set("undefined", Value());
    env->set("NaN", Value::number(kNaN));
    env->set("Infinity", Value::number(kInf));
    return env;
}

std::shared_ptr<DocumentObject> makeDocument()
{
    return std::make_shared<DocumentObject>();
}

} // namespace regvm::host
