//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/regvm/vm/Value.hpp
// Purpose: Dynamically-typed register value and the host interop interfaces
//          through which the VM reaches objects owned by the embedder.
// Key invariants: A Value holds exactly one kind at a time. Arrays and host
//                 handles are shared references; copying a Value never deep
//                 copies them.
// Ownership/Lifetime: Host objects and functions are owned by the embedder and
//                     borrowed by the VM through shared_ptr references.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace regvm::vm
{

class Value;
class HostObject;
class HostFunction;

/// @brief Ordered sequence of values backing the Array kind.
using ValueArray = std::vector<Value>;

/// @brief Shared reference to an array; arrays have reference semantics.
using ArrayRef = std::shared_ptr<ValueArray>;

/// @brief Shared reference to a host object handle.
using ObjectRef = std::shared_ptr<HostObject>;

/// @brief Shared reference to a host callable handle.
using FunctionRef = std::shared_ptr<HostFunction>;

/// @brief Dynamically-typed register cell.
/// @details Every register and every operand seen by the opcode handlers is a
///          Value.  The kind is only checked at the point of use; handlers
///          that require a particular kind raise a TypeMismatch trap instead
///          of relying on duck typing.
class Value
{
  public:
    /// @brief Discriminates the alternatives a Value may hold.
    enum class Kind : uint8_t
    {
        Void,     ///< Empty sentinel (undefined).
        Number,   ///< IEEE-754 double.
        String,   ///< Byte string.
        Array,    ///< Shared array of values.
        Object,   ///< Host object handle.
        Function, ///< Host callable handle.
    };

    /// @brief Construct the void sentinel.
    Value() = default;

    explicit Value(double number) : data_(number) {}

    explicit Value(std::string text) : data_(std::move(text)) {}

    explicit Value(ArrayRef array) : data_(std::move(array)) {}

    explicit Value(ObjectRef object) : data_(std::move(object)) {}

    explicit Value(FunctionRef function) : data_(std::move(function)) {}

    /// @brief Build a number value.
    static Value number(double n)
    {
        return Value(n);
    }

    /// @brief Build a string value from @p text.
    static Value string(std::string_view text)
    {
        return Value(std::string(text));
    }

    /// @brief Build a fresh array value holding @p items.
    static Value array(ValueArray items = {})
    {
        return Value(std::make_shared<ValueArray>(std::move(items)));
    }

    /// @brief Build a number from a boolean (1 or 0).
    static Value boolean(bool b)
    {
        return Value(b ? 1.0 : 0.0);
    }

    [[nodiscard]] Kind kind() const noexcept
    {
        return static_cast<Kind>(data_.index());
    }

    [[nodiscard]] bool isVoid() const noexcept
    {
        return kind() == Kind::Void;
    }

    [[nodiscard]] bool isNumber() const noexcept
    {
        return kind() == Kind::Number;
    }

    [[nodiscard]] bool isString() const noexcept
    {
        return kind() == Kind::String;
    }

    [[nodiscard]] bool isArray() const noexcept
    {
        return kind() == Kind::Array;
    }

    [[nodiscard]] bool isObject() const noexcept
    {
        return kind() == Kind::Object;
    }

    [[nodiscard]] bool isFunction() const noexcept
    {
        return kind() == Kind::Function;
    }

    /// @pre isNumber()
    double asNumber() const
    {
        return std::get<double>(data_);
    }

    /// @pre isString()
    const std::string &asString() const
    {
        return std::get<std::string>(data_);
    }

    /// @pre isArray()
    const ArrayRef &asArray() const
    {
        return std::get<ArrayRef>(data_);
    }

    /// @pre isObject()
    const ObjectRef &asObject() const
    {
        return std::get<ObjectRef>(data_);
    }

    /// @pre isFunction()
    const FunctionRef &asFunction() const
    {
        return std::get<FunctionRef>(data_);
    }

  private:
    // Alternative order must match Kind.
    std::variant<std::monostate, double, std::string, ArrayRef, ObjectRef, FunctionRef> data_;
};

/// @brief Stable lowercase name for a value kind, used in diagnostics.
std::string_view kindName(Value::Kind kind) noexcept;

/// @brief Error reported by host code back into the VM.
/// @details Host functions and evaluators throw HostError (or a subclass) to
///          signal a failure the VM should surface as a trap.  Other exception
///          types are not intercepted.
class HostError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// @brief Opaque object owned by the embedder.
/// @details The VM never inspects the internal structure of a host object; it
///          only reads properties through get() when executing PROPACCESS and
///          passes the handle through registers otherwise.
class HostObject
{
  public:
    virtual ~HostObject() = default;

    /// @brief Read property @p key.
    /// @return The property value, or void when the property is absent.
    virtual Value get(std::string_view key) const = 0;

    /// @brief Write property @p key.
    /// @details Objects are read-only unless a subclass overrides this.
    /// @throws HostError when the object does not accept writes.
    virtual void set(std::string_view key, Value value);

    /// @brief Short descriptive name used when the object is printed.
    virtual std::string className() const
    {
        return "Object";
    }
};

/// @brief Callable owned by the embedder.
class HostFunction
{
  public:
    virtual ~HostFunction() = default;

    /// @brief Invoke the function.
    /// @param self Receiver binding (the value of @c this).
    /// @param args Positional arguments in call order.
    /// @return Result of the call; void when the function returns nothing.
    /// @throws HostError to report a failure to the VM.
    virtual Value call(const Value &self, const ValueArray &args) = 0;

    /// @brief Function name used when the callable is printed.
    virtual std::string name() const
    {
        return "anonymous";
    }
};

/// @brief Engine that executes host-language source for the EVAL opcode.
/// @details Installing an evaluator grants bytecode unrestricted access to
///          whatever the evaluator can reach.  Bytecode must be trusted.
class HostEvaluator
{
  public:
    virtual ~HostEvaluator() = default;

    /// @brief Evaluate @p source and return its value.
    /// @throws HostError when the source cannot be evaluated.
    virtual Value evaluate(std::string_view source) = 0;
};

/// @brief Host handles injected into the reserved ENV and DOCUMENT registers.
/// @details Either handle may be null, in which case the register holds void.
struct HostRoots
{
    ObjectRef env;      ///< Global environment root.
    ObjectRef document; ///< Document-like root.
};

} // namespace regvm::vm
