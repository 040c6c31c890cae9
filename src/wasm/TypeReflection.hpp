// File: src/wasm/TypeReflection.hpp
// Purpose: Optional host capability that builds a typed table entry directly
//          from a function type and an arbitrary callable.
// Key invariants: buildFunction never synthesizes module bytes.
// Ownership/Lifetime: Implementations are owned by the embedder.
// Links: docs/table-manager.md
#pragma once

#include "wasm/Function.hpp"

namespace funtab::wasm
{

/// @brief Reflection-based constructor of typed functions.
class TypeReflection
{
  public:
    virtual ~TypeReflection() = default;

    /// @brief Wrap @p callable as a typed function of type @p type.
    virtual FunctionPtr buildFunction(const FuncType &type, const FunctionPtr &callable) const = 0;
};

/// @brief In-process reflection: wraps the callable in a TypedFunction.
class DirectTypeReflection final : public TypeReflection
{
  public:
    FunctionPtr buildFunction(const FuncType &type, const FunctionPtr &callable) const override;
};

} // namespace funtab::wasm
