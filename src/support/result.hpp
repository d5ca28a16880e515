//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/result.hpp
// Purpose: Value-or-error return type used by the loader and the Runner facade.
// Key invariants: Exactly one of value or error is engaged.
// Ownership/Lifetime: Result owns whichever payload it holds.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <utility>
#include <variant>

namespace regvm::support
{

/// @brief Disambiguates the success constructor when T and E are convertible.
struct SuccessTag
{
};

/// @brief Disambiguates the failure constructor when T and E are convertible.
struct ErrorTag
{
};

inline constexpr SuccessTag kSuccessTag{};
inline constexpr ErrorTag kErrorTag{};

/// @brief Holds either a @p T produced by a successful operation or an @p E
///        describing why it failed.
/// @details Callers test with isOk() (or a boolean context) before touching
///          value() or error(); accessing the disengaged side is undefined.
template <typename T, typename E = std::string> class Result
{
  public:
    template <typename U = T>
    Result(SuccessTag, U &&value) : storage_(std::in_place_index<0>, std::forward<U>(value))
    {
    }

    Result(ErrorTag, E error) : storage_(std::in_place_index<1>, std::move(error)) {}

    template <typename U = T> static Result success(U &&value)
    {
        return Result(kSuccessTag, std::forward<U>(value));
    }

    static Result failure(E error)
    {
        return Result(kErrorTag, std::move(error));
    }

    [[nodiscard]] bool isOk() const
    {
        return storage_.index() == 0;
    }

    explicit operator bool() const
    {
        return isOk();
    }

    /// @pre isOk()
    T &value()
    {
        return std::get<0>(storage_);
    }

    /// @pre isOk()
    const T &value() const
    {
        return std::get<0>(storage_);
    }

    /// @pre !isOk()
    const E &error() const
    {
        return std::get<1>(storage_);
    }

  private:
    // Index 0 holds the value, index 1 the error; T and E may be the same type.
    std::variant<T, E> storage_;
};

} // namespace regvm::support
