//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/Function.hpp
// Purpose: Callable objects stored in function tables and bound as module
//          imports.
// Key invariants: Identity is object identity. Only typed functions carry a
//                 FuncType and are accepted as table entries.
// Ownership/Lifetime: Functions are shared through FunctionPtr; a typed
//                     function keeps its target alive.
// Links: docs/table-manager.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "wasm/ValType.hpp"

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace funtab::wasm
{

class Function;

using FunctionPtr = std::shared_ptr<Function>;

/// @brief Host callback invoked with the call's arguments.
/// @details Returns the produced values; void callbacks return an empty vector.
using HostCallback = std::function<std::vector<Value>(std::span<const Value> args)>;

/**
 * @brief Abstract callable unit.
 *
 * Two kinds exist. Host functions wrap an arbitrary embedder callback and carry
 * no type information, so a table cannot store them directly. Typed functions
 * carry a FuncType, check every call against it and forward to a target.
 */
class Function
{
  public:
    enum class Kind
    {
        Host,
        Typed
    };

    virtual ~Function() = default;

    /// @brief Discriminator for the concrete subclass.
    Kind kind() const noexcept
    {
        return kind_;
    }

    /// @brief Debug name used in diagnostics.
    const std::string &name() const noexcept
    {
        return name_;
    }

    /// @brief Function type, or nullptr for untyped host functions.
    virtual const FuncType *type() const noexcept = 0;

    /// @brief Invoke the function.
    virtual support::Expected<std::vector<Value>> call(std::span<const Value> args) const = 0;

  protected:
    Function(Kind kind, std::string name) : kind_(kind), name_(std::move(name)) {}

  private:
    Kind kind_;
    std::string name_;
};

/// @brief Untyped embedder callback. Not insertable into a table as-is.
/// @details Calling one without a callback is a ContractViolation.
class HostFunction final : public Function
{
  public:
    HostFunction(std::string name, HostCallback callback);

    const FuncType *type() const noexcept override
    {
        return nullptr;
    }

    support::Expected<std::vector<Value>> call(std::span<const Value> args) const override;

  private:
    HostCallback callback_;
};

/// @brief Function with a fixed type that forwards to a target function.
/// @details Arguments must match the parameter types exactly. Results of a
///          void type are discarded; otherwise the target must produce exactly
///          one value of the result type.
class TypedFunction final : public Function
{
  public:
    TypedFunction(std::string name, FuncType type, FunctionPtr target);

    const FuncType *type() const noexcept override
    {
        return &type_;
    }

    /// @brief Function every call is forwarded to.
    const FunctionPtr &target() const noexcept
    {
        return target_;
    }

    support::Expected<std::vector<Value>> call(std::span<const Value> args) const override;

  private:
    FuncType type_;
    FunctionPtr target_;
};

/// @brief Create an untyped host function.
FunctionPtr makeHostFunction(std::string name, HostCallback callback);

/// @brief Create a typed function whose body is @p callback.
/// @details Models a function defined natively by the execution environment:
///          the result can be stored in a table without conversion.
FunctionPtr makeNativeFunction(std::string name, FuncType type, HostCallback callback);

} // namespace funtab::wasm
