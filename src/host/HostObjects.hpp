//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/host/HostObjects.hpp
// Purpose: Ready-made host object and function types plus the default
//          environment and document roots used by tools and tests.
// Key invariants: PropertyObject is a plain string-keyed map; reading a
//                 missing key yields void.
// Ownership/Lifetime: Objects are shared through ObjectRef/FunctionRef; the
//                     default environment borrows the output stream passed to
//                     makeDefaultEnvironment, which must outlive it.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "regvm/vm/Value.hpp"

#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace regvm::host
{

using vm::FunctionRef;
using vm::HostError;
using vm::ObjectRef;
using vm::Value;
using vm::ValueArray;

/// @brief Writable host object backed by an ordered property map.
class PropertyObject : public vm::HostObject
{
  public:
    explicit PropertyObject(std::string className = "Object");

    Value get(std::string_view key) const override;

    void set(std::string_view key, Value value) override;

    std::string className() const override
    {
        return className_;
    }

    /// @brief Check whether @p key has been assigned.
    bool has(std::string_view key) const;

    /// @brief Number of assigned properties.
    size_t size() const
    {
        return props_.size();
    }

  private:
    std::string className_;
    std::map<std::string, Value, std::less<>> props_;
};

/// @brief Host function wrapping a C++ callable.
class NativeFunction : public vm::HostFunction
{
  public:
    using Body = std::function<Value(const Value &self, const ValueArray &args)>;

    NativeFunction(std::string name, Body body);

    Value call(const Value &self, const ValueArray &args) override;

    std::string name() const override
    {
        return name_;
    }

  private:
    std::string name_;
    Body body_;
};

/// @brief Wrap @p body as a function value named @p name.
Value makeFunction(std::string name, NativeFunction::Body body);

/// @brief Document-like root with a writable title and an append-only body.
class DocumentObject : public vm::HostObject
{
  public:
    DocumentObject();

    /// @details Exposes @c title, @c body and the @c write function.
    Value get(std::string_view key) const override;

    /// @details Only @c title is writable.
    void set(std::string_view key, Value value) override;

    std::string className() const override
    {
        return "Document";
    }

    const std::string &title() const
    {
        return title_;
    }

    const std::string &body() const
    {
        return *body_;
    }

  private:
    std::string title_;
    std::shared_ptr<std::string> body_; ///< Shared with the write function.
    Value write_;
};

/// @brief Build the default global environment.
/// @details Exposes console.log (writing to @p out), Math, String.fromCharCode,
///          parseInt, parseFloat and isNaN.
std::shared_ptr<PropertyObject> makeDefaultEnvironment(std::ostream &out);

/// @brief Build a fresh document root.
std::shared_ptr<DocumentObject> makeDocument();

} // namespace regvm::host
