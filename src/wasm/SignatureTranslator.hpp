// File: src/wasm/SignatureTranslator.hpp
// Purpose: Declares helpers translating compact signature strings ("vii",
//          "ifd") into structured function types.
// Key invariants: The first character is the result tag ('v' for void); every
//                 remaining character is a parameter tag. The 'p' tag follows
//                 FUNTAB_MEMORY64.
// Ownership/Lifetime: Stateless free functions operating on provided string views.
// Links: docs/table-manager.md
#pragma once

#include "support/diag_expected.hpp"
#include "wasm/ValType.hpp"

#include <optional>
#include <string_view>

namespace funtab::wasm
{

/// @brief Result tag denoting a function without results.
inline constexpr char kVoidTag = 'v';

/// @brief Integer type used for the address-width 'p' tag in this build.
ValType addressValType() noexcept;

/// @brief Map a value tag ('i', 'j', 'f', 'd', 'p') to its wire type.
/// @return Empty for any other character, including the void tag.
std::optional<ValType> valTypeForTag(char tag) noexcept;

/// @brief Translate a signature string into parameter and result types.
/// @return Function type, or a ContractViolation naming the offending
///         character and its position.
support::Expected<FuncType> sigToWasmTypes(std::string_view sig);

} // namespace funtab::wasm
