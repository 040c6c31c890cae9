//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/table/TrampolineSynthesizer.hpp
// Purpose: Converts an untyped host callable into a value the function table
//          accepts.
// Key invariants: The reflection path and the module path are separate
//                 branches selected by whether a TypeReflection is present.
//                 No retries on failure.
// Ownership/Lifetime: Borrows the module host and the optional reflection
//                     capability; both must outlive the synthesizer.
// Links: docs/table-manager.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "wasm/Function.hpp"
#include "wasm/ModuleHost.hpp"
#include "wasm/TypeReflection.hpp"

#include <string_view>

namespace funtab::table
{

class TrampolineSynthesizer
{
  public:
    /// @param host Module host used when no reflection capability exists.
    /// @param reflection Optional reflection capability; preferred when set.
    explicit TrampolineSynthesizer(const wasm::ModuleHost &host,
                                   const wasm::TypeReflection *reflection = nullptr)
        : host_(host), reflection_(reflection)
    {
    }

    /// @brief Whether convert() takes the reflection path.
    bool hasReflection() const noexcept
    {
        return reflection_ != nullptr;
    }

    /// @brief Build a typed table entry for @p callable with signature @p sig.
    /// @return The wrapper, a ContractViolation for an invalid signature, or
    ///         the module host's HostFailure unchanged.
    support::Expected<wasm::FunctionPtr> convert(const wasm::FunctionPtr &callable,
                                                 std::string_view sig) const;

  private:
    support::Expected<wasm::FunctionPtr> synthesizeModule(const wasm::FunctionPtr &callable,
                                                          const wasm::FuncType &type) const;

    const wasm::ModuleHost &host_;
    const wasm::TypeReflection *reflection_;
};

} // namespace funtab::table
